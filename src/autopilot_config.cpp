#include "xplane_autopilot_cpp/autopilot_config.hpp"
#include <stdexcept>

namespace {

void requirePositive(std::chrono::milliseconds value, const char* name) {
    if (value.count() <= 0) {
        throw std::invalid_argument(std::string(name) + " must be positive");
    }
}

}  // namespace

void validateConfig(const AutopilotConfig& config) {
    requirePositive(config.tick_period, "tick_period_ms");
    requirePositive(config.discovery_period, "discovery_period_ms");
    requirePositive(config.monitor_period, "monitor_period_ms");
    requirePositive(config.instance_timeout, "instance_timeout_s");
    requirePositive(config.restart.window, "restart_window_s");
    if (config.feedback_rate_hz <= 0) {
        throw std::invalid_argument("feedback_rate_hz must be positive");
    }
    if (config.restart.max_restarts < 0) {
        throw std::invalid_argument("max_restarts must not be negative");
    }
    if (config.topic_prefix.empty() || config.topic_prefix.front() != '/') {
        throw std::invalid_argument("topic_prefix must be an absolute topic name");
    }
    for (const auto& stage : headingCascade(config.heading_gains).stages) {
        validateGains(stage.gains);
    }
}
