#include "humio_exporter/config/exporter_config.hpp"
#include "humio_exporter/common/constants.hpp"

namespace humio_exporter {
namespace config {

ExporterConfig createDefaultConfig() {
    using namespace constants::config_defaults;
    
    ExporterConfig config;
    
    config.http.endpoint = "";
    config.http.timeout_seconds = HTTP_TIMEOUT_SECONDS;
    
    config.queue.enabled = QUEUE_ENABLED;
    config.queue.num_consumers = QUEUE_NUM_CONSUMERS;
    config.queue.queue_size = QUEUE_SIZE;
    
    config.retry.enabled = RETRY_ENABLED;
    config.retry.initial_interval_seconds = RETRY_INITIAL_INTERVAL_SECONDS;
    config.retry.max_interval_seconds = RETRY_MAX_INTERVAL_SECONDS;
    config.retry.max_elapsed_time_seconds = RETRY_MAX_ELAPSED_TIME_SECONDS;
    
    config.ingest_token = "";
    config.disable_compression = false;
    config.disable_service_tag = false;
    
    return config;
}

}}
