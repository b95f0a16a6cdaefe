#ifndef AUTOPILOT_NODE_HPP
#define AUTOPILOT_NODE_HPP

#include <rclcpp/rclcpp.hpp>
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "xplane_autopilot_cpp/autopilot_config.hpp"
#include "xplane_autopilot_cpp/control_loop.hpp"
#include "xplane_autopilot_cpp/instance_supervisor.hpp"
#include "xplane_autopilot_cpp/ros_vehicle_link.hpp"
#include "xplane_autopilot_cpp/worker_pool.hpp"

/**
 * @brief Control loop of one aircraft, ticking on its own timer
 *
 * The timer and the feedback subscriptions share a mutually exclusive
 * callback group, so feedback never changes in the middle of a tick and a
 * slow aircraft never holds up the others. The next tick is scheduled one
 * period after the previous one finished.
 */
class ControlLoopWorker : public Worker {
public:
    /**
     * @brief Constructor, builds the control loop over ROS topics and arms the tick timer
     * @param node Node owning the timer and topics
     * @param config Autopilot settings
     * @param instance Aircraft to fly
     * @param on_exit Called once if a tick fails; the worker stops ticking first
     */
    ControlLoopWorker(rclcpp::Node& node, const AutopilotConfig& config,
                      const InstanceDescriptor& instance, ExitCallback on_exit);

    /**
     * @brief Constructor over an existing link
     * @param link Data exchange with the aircraft, owned by the worker from now on
     */
    ControlLoopWorker(rclcpp::Node& node, const AutopilotConfig& config,
                      const InstanceDescriptor& instance, std::unique_ptr<VehicleLink> link,
                      ExitCallback on_exit);
    ~ControlLoopWorker() override;

    ControlState snapshot() const override;

    /// Timer callbacks handled so far, including those with the autopilot off
    std::uint64_t ticksHandled() const { return context_->ticks_handled.load(); }

private:
    // Shared with the timer callback so it stays valid while a tick is in flight
    struct TickContext {
        TickContext(std::unique_ptr<VehicleLink> link_in, ExitCallback on_exit_in,
                    rclcpp::Logger logger_in)
            : link(std::move(link_in)), on_exit(std::move(on_exit_in)),
              logger(std::move(logger_in)), ticks_handled(0) {}

        std::unique_ptr<VehicleLink> link;
        std::unique_ptr<ControlLoop> loop;
        ExitCallback on_exit;
        rclcpp::Logger logger;
        std::atomic<std::uint64_t> ticks_handled;

        std::mutex published_mutex;   ///< Guards published
        ControlState published;        ///< State after the last finished tick
    };

    rclcpp::CallbackGroup::SharedPtr group_;
    std::shared_ptr<TickContext> context_;
    rclcpp::TimerBase::SharedPtr timer_;

    void start(rclcpp::Node& node, const AutopilotConfig& config,
               const InstanceDescriptor& instance, std::unique_ptr<VehicleLink> link,
               ExitCallback on_exit);

    static void onTick(const std::shared_ptr<TickContext>& context, rclcpp::TimerBase& timer);
};

/**
 * @brief Autopilot node: discovers X-Plane masters and flies each one
 */
class AutopilotNode : public rclcpp::Node {
public:
    /**
     * @brief Constructor for Autopilot Node
     * @param options Node options, parameters override the default configuration
     * @throws std::invalid_argument on invalid parameters
     */
    explicit AutopilotNode(const rclcpp::NodeOptions& options = rclcpp::NodeOptions());
    ~AutopilotNode() override;

    const AutopilotConfig& config() const { return config_; }

private:
    AutopilotConfig config_;

    // Discovery and monitor timers run one at a time in this group
    rclcpp::CallbackGroup::SharedPtr supervisor_group_;
    std::unique_ptr<RosInstanceDirectory> directory_;
    std::unique_ptr<InstanceSupervisor> supervisor_;
    rclcpp::TimerBase::SharedPtr discovery_timer_;
    rclcpp::TimerBase::SharedPtr monitor_timer_;

    /**
     * @brief Declare parameters and read them over the defaults
     */
    AutopilotConfig loadConfig();

    PIDGains loadGains(const std::string& prefix, const PIDGains& defaults);

    std::unique_ptr<Worker> createWorker(const InstanceDescriptor& instance,
                                         ExitCallback on_exit);

    void discoveryCallback();
    void monitorCallback();
};

#endif // AUTOPILOT_NODE_HPP
