#include "concurq/config.hpp"

namespace concurq {

namespace {

bool fail(std::string* error, const char* message) {
    if (error) {
        *error = message;
    }
    return false;
}

} // namespace

bool validate_config(const PipelineConfig& config, std::string* error) {
    if (config.producer_count == 0) {
        return fail(error, "producer_count must be greater than 0");
    }
    if (config.worker_count == 0) {
        return fail(error, "worker_count must be greater than 0");
    }
    if (config.tasks_per_producer == 0) {
        return fail(error, "tasks_per_producer must be greater than 0");
    }
    if (config.production_interval_ms < 0) {
        return fail(error, "production_interval_ms must not be negative");
    }
    if (config.monitor.interval_ms <= 0) {
        return fail(error, "monitor.interval_ms must be greater than 0");
    }
    if (config.monitor.stall_threshold_ms < 0) {
        return fail(error, "monitor.stall_threshold_ms must not be negative");
    }

    const WorkerConfig& w = config.worker;
    if (w.max_retries < 0) {
        return fail(error, "worker.max_retries must not be negative");
    }
    if (w.failure_rate < 0.0 || w.failure_rate > 1.0) {
        return fail(error, "worker.failure_rate must be within [0, 1]");
    }
    if (w.min_processing_ms < 0 || w.min_processing_ms > w.max_processing_ms) {
        return fail(error, "worker processing time bounds are invalid");
    }

    const ShutdownConfig& s = config.shutdown;
    if (s.monitor_timeout_ms < 0 || s.producer_timeout_ms < 0 || s.worker_timeout_ms < 0) {
        return fail(error, "shutdown timeouts must not be negative");
    }
    if (s.drain_poll_interval_ms <= 0) {
        return fail(error, "shutdown.drain_poll_interval_ms must be greater than 0");
    }
    if (s.drain_timeout_ms < 0) {
        return fail(error, "shutdown.drain_timeout_ms must not be negative");
    }
    return true;
}

} // namespace concurq
