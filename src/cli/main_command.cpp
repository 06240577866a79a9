#include "main_command.hpp"

namespace humio_exporter {
namespace cli {

MainCommand::MainCommand() = default;
MainCommand::~MainCommand() = default;

}}
