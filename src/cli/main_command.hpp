#pragma once

#include <CLI/CLI.hpp>

namespace humio_exporter {
namespace cli {

class MainCommand {
public:
    MainCommand();
    virtual ~MainCommand();

protected:
    CLI::App* subcommand_ = nullptr;
};

}}
