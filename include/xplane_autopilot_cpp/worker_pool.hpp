#ifndef WORKER_POOL_HPP
#define WORKER_POOL_HPP

#include <rclcpp/rclcpp.hpp>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "xplane_autopilot_cpp/autopilot_config.hpp"
#include "xplane_autopilot_cpp/control_state.hpp"
#include "xplane_autopilot_cpp/instance.hpp"

/**
 * @brief Running control loop for one instance; destroying it stops it
 */
class Worker {
public:
    virtual ~Worker() = default;

    /**
     * @brief Copy of the control state as of the last finished tick
     *
     * Safe to call from any thread while the worker keeps ticking.
     */
    virtual ControlState snapshot() const = 0;
};

/// Called by a worker, from any thread, when it stops on its own
using ExitCallback = std::function<void(const std::string& reason)>;

/// Builds and starts a worker; may throw if the worker cannot start
using WorkerFactory =
    std::function<std::unique_ptr<Worker>(const InstanceDescriptor&, ExitCallback)>;

/**
 * @brief One worker per instance address, restarted from scratch when it exits
 *
 * Workers report their exit through the callback they were built with. The
 * reports are queued and handled by supervise(), which replaces each exited
 * worker with a fresh one until the restart limit is hit.
 */
class WorkerPool {
public:
    using Clock = std::chrono::steady_clock;

    enum class SuperviseResult {
        Ok,        ///< Every exited worker was handled
        Escalate   ///< Restart limit exceeded, the owner must restart everything
    };

    WorkerPool(WorkerFactory factory, const RestartPolicy& policy);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief Start a worker unless one already runs for the address
     * @return True if a worker was started
     * @throws whatever the factory throws; nothing is recorded in that case
     */
    bool startIfAbsent(const InstanceDescriptor& instance);

    /// True while the address has a worker or a restart pending
    bool contains(const std::string& address) const;
    /// True only if a worker is actually running for the address
    bool isRunning(const std::string& address) const;
    std::size_t size() const { return workers_.size(); }
    /// Instances with a running worker, pending restarts left out
    std::vector<InstanceDescriptor> liveInstances() const;

    /**
     * @brief Control state of the worker flying the given instance
     * @return Nothing if no worker runs for the address
     */
    std::optional<ControlState> snapshot(const std::string& address) const;

    /**
     * @brief Handle queued worker exits
     * @param now Current time, for the restart window
     * @return Escalate if more restarts than allowed happened within the window
     */
    SuperviseResult supervise(Clock::time_point now);

    /**
     * @brief Stop every worker and forget pending exits and restart history
     */
    void clear();

    std::size_t totalRestarts() const { return total_restarts_; }

private:
    struct Entry {
        InstanceDescriptor instance;
        std::unique_ptr<Worker> worker;
        std::uint64_t generation;
    };

    struct ExitReport {
        std::string address;
        std::uint64_t generation;
        std::string reason;
    };

    struct ExitQueue {
        std::mutex mutex;
        std::vector<ExitReport> reports;
    };

    WorkerFactory factory_;
    RestartPolicy policy_;
    std::map<std::string, Entry> workers_;
    std::shared_ptr<ExitQueue> exits_;      ///< Shared with the exit callbacks
    std::deque<Clock::time_point> restarts_;
    std::uint64_t next_generation_;
    std::size_t total_restarts_;
    rclcpp::Logger logger_;

    std::unique_ptr<Worker> spawn(const InstanceDescriptor& instance, std::uint64_t generation);
    std::vector<ExitReport> takeExits();
    bool allowRestart(Clock::time_point now);
};

#endif // WORKER_POOL_HPP
