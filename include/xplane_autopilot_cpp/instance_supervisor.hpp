#ifndef INSTANCE_SUPERVISOR_HPP
#define INSTANCE_SUPERVISOR_HPP

#include <rclcpp/rclcpp.hpp>
#include <cstddef>
#include <map>
#include <optional>
#include <string>

#include "xplane_autopilot_cpp/autopilot_config.hpp"
#include "xplane_autopilot_cpp/instance.hpp"
#include "xplane_autopilot_cpp/vehicle_link.hpp"
#include "xplane_autopilot_cpp/worker_pool.hpp"

/**
 * @brief Keeps exactly one autopilot worker per X-Plane master on the network
 *
 * The registry of started instances and the worker pool live in this one
 * object and are always restarted together, so the registry can never claim
 * an instance the pool does not run (or miss one it does).
 *
 * Instances that stop announcing themselves keep their worker; nothing here
 * tears workers down except a full restart.
 */
class InstanceSupervisor {
public:
    /**
     * @brief Constructor
     * @param directory Discovery source, must outlive the supervisor
     * @param factory Builds one worker per new instance
     * @param policy Worker restart limit
     */
    InstanceSupervisor(InstanceDirectory& directory, WorkerFactory factory,
                       const RestartPolicy& policy);

    /**
     * @brief Start workers for controllable instances not seen before
     * @return Number of workers started
     * @throws whatever the directory throws; the registry is unchanged then
     */
    std::size_t poll();

    /**
     * @brief Restart exited workers, restarting everything if they crash too often
     */
    void monitor(WorkerPool::Clock::time_point now);

    /**
     * @brief Recover the poller: rebuild the registry from the workers actually running
     */
    void restartPoller();

    /**
     * @brief Stop every worker and forget every instance
     */
    void restartAll();

    /**
     * @brief Control state of the loop flying the given instance
     * @return Nothing if no worker runs for the address
     */
    std::optional<ControlState> snapshot(const std::string& address) const {
        return pool_.snapshot(address);
    }

    bool isRegistered(const std::string& address) const;
    std::size_t registeredCount() const { return registry_.size(); }
    const WorkerPool& pool() const { return pool_; }
    std::size_t unitRestarts() const { return unit_restarts_; }

private:
    InstanceDirectory& directory_;
    std::map<std::string, InstanceDescriptor> registry_;  ///< Instances given a worker, by address
    WorkerPool pool_;
    std::size_t unit_restarts_;
    rclcpp::Logger logger_;
};

#endif // INSTANCE_SUPERVISOR_HPP
