#include "xplane_autopilot_cpp/worker_pool.hpp"
#include <stdexcept>
#include <utility>

WorkerPool::WorkerPool(WorkerFactory factory, const RestartPolicy& policy)
    : factory_(std::move(factory)), policy_(policy), exits_(std::make_shared<ExitQueue>()),
      next_generation_(0), total_restarts_(0), logger_(rclcpp::get_logger("worker_pool")) {
    if (!factory_) {
        throw std::invalid_argument("worker pool needs a worker factory");
    }
}

WorkerPool::~WorkerPool() {
    clear();
}

std::unique_ptr<Worker> WorkerPool::spawn(const InstanceDescriptor& instance,
                                          std::uint64_t generation) {
    std::weak_ptr<ExitQueue> queue = exits_;
    const std::string address = instance.address;
    ExitCallback on_exit = [queue, address, generation](const std::string& reason) {
        if (auto exits = queue.lock()) {
            std::lock_guard<std::mutex> lock(exits->mutex);
            exits->reports.push_back(ExitReport{address, generation, reason});
        }
    };
    auto worker = factory_(instance, std::move(on_exit));
    if (!worker) {
        throw std::runtime_error("worker factory returned nothing for " + address);
    }
    return worker;
}

bool WorkerPool::startIfAbsent(const InstanceDescriptor& instance) {
    if (contains(instance.address)) {
        return false;
    }
    const std::uint64_t generation = next_generation_++;
    auto worker = spawn(instance, generation);
    workers_.emplace(instance.address, Entry{instance, std::move(worker), generation});
    RCLCPP_INFO(logger_, "Started autopilot worker for %s", instance.address.c_str());
    return true;
}

bool WorkerPool::contains(const std::string& address) const {
    return workers_.count(address) > 0;
}

bool WorkerPool::isRunning(const std::string& address) const {
    auto it = workers_.find(address);
    return it != workers_.end() && it->second.worker != nullptr;
}

std::vector<InstanceDescriptor> WorkerPool::liveInstances() const {
    std::vector<InstanceDescriptor> instances;
    instances.reserve(workers_.size());
    for (const auto& entry : workers_) {
        if (entry.second.worker) {
            instances.push_back(entry.second.instance);
        }
    }
    return instances;
}

std::optional<ControlState> WorkerPool::snapshot(const std::string& address) const {
    auto it = workers_.find(address);
    if (it == workers_.end() || !it->second.worker) {
        return std::nullopt;
    }
    return it->second.worker->snapshot();
}

std::vector<WorkerPool::ExitReport> WorkerPool::takeExits() {
    std::lock_guard<std::mutex> lock(exits_->mutex);
    std::vector<ExitReport> reports;
    reports.swap(exits_->reports);
    return reports;
}

bool WorkerPool::allowRestart(Clock::time_point now) {
    while (!restarts_.empty() && now - restarts_.front() > policy_.window) {
        restarts_.pop_front();
    }
    if (static_cast<int>(restarts_.size()) >= policy_.max_restarts) {
        return false;
    }
    restarts_.push_back(now);
    return true;
}

WorkerPool::SuperviseResult WorkerPool::supervise(Clock::time_point now) {
    for (auto& report : takeExits()) {
        auto it = workers_.find(report.address);
        if (it == workers_.end() || it->second.generation != report.generation) {
            // Exit of a worker that was already replaced or removed
            continue;
        }

        RCLCPP_ERROR(logger_, "Autopilot worker for %s exited: %s", report.address.c_str(),
                     report.reason.c_str());

        InstanceDescriptor instance = it->second.instance;
        workers_.erase(it);

        if (!allowRestart(now)) {
            RCLCPP_ERROR(logger_, "More than %d restarts within %lld ms, giving up on the pool",
                         policy_.max_restarts,
                         static_cast<long long>(policy_.window.count()));
            return SuperviseResult::Escalate;
        }

        const std::uint64_t generation = next_generation_++;
        try {
            auto worker = spawn(instance, generation);
            workers_.emplace(instance.address, Entry{instance, std::move(worker), generation});
            ++total_restarts_;
            RCLCPP_WARN(logger_, "Restarted autopilot worker for %s", instance.address.c_str());
        } catch (const std::exception& e) {
            // Keep the instance so the failed start counts against the restart limit
            workers_.emplace(instance.address, Entry{instance, nullptr, generation});
            std::lock_guard<std::mutex> lock(exits_->mutex);
            exits_->reports.push_back(ExitReport{instance.address, generation, e.what()});
        }
    }
    return SuperviseResult::Ok;
}

void WorkerPool::clear() {
    workers_.clear();
    restarts_.clear();
    std::lock_guard<std::mutex> lock(exits_->mutex);
    exits_->reports.clear();
}
