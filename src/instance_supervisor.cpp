#include "xplane_autopilot_cpp/instance_supervisor.hpp"
#include <utility>

InstanceSupervisor::InstanceSupervisor(InstanceDirectory& directory, WorkerFactory factory,
                                       const RestartPolicy& policy)
    : directory_(directory), pool_(std::move(factory), policy), unit_restarts_(0),
      logger_(rclcpp::get_logger("instance_supervisor")) {
}

std::size_t InstanceSupervisor::poll() {
    const auto instances = directory_.listLiveInstances();

    std::size_t started = 0;
    for (const auto& instance : instances) {
        if (!isControllable(instance) || isRegistered(instance.address)) {
            continue;
        }

        RCLCPP_INFO(logger_, "Found %s %s at %s (version %d)", toString(instance.host),
                    toString(instance.role), instance.address.c_str(),
                    instance.version_number);
        try {
            if (pool_.startIfAbsent(instance)) {
                ++started;
            } else if (!pool_.isRunning(instance.address)) {
                // Restart pending in the pool, register once it runs
                continue;
            }
            registry_.emplace(instance.address, instance);
        } catch (const std::exception& e) {
            // Not registered, so the next poll tries again
            RCLCPP_ERROR(logger_, "Could not start autopilot for %s: %s",
                         instance.address.c_str(), e.what());
        }
    }
    return started;
}

void InstanceSupervisor::monitor(WorkerPool::Clock::time_point now) {
    if (pool_.supervise(now) == WorkerPool::SuperviseResult::Escalate) {
        restartAll();
    }
}

void InstanceSupervisor::restartPoller() {
    registry_.clear();
    for (auto& instance : pool_.liveInstances()) {
        registry_.emplace(instance.address, std::move(instance));
    }
    RCLCPP_WARN(logger_, "Discovery restarted with %zu running workers", registry_.size());
}

void InstanceSupervisor::restartAll() {
    ++unit_restarts_;
    RCLCPP_WARN(logger_, "Restarting discovery and all %zu autopilot workers", pool_.size());
    pool_.clear();
    registry_.clear();
}

bool InstanceSupervisor::isRegistered(const std::string& address) const {
    return registry_.count(address) > 0;
}
