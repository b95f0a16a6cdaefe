#include <rclcpp/rclcpp.hpp>
#include <memory>

#include "xplane_autopilot_cpp/autopilot_node.hpp"

/**
 * @brief Main function - entry point for the X-Plane autopilot
 * @param argc Argument count
 * @param argv Argument values
 * @return Exit status
 */
int main(int argc, char* argv[]) {
    // Initialize ROS2, installs the SIGINT/SIGTERM handlers that stop spinning
    rclcpp::init(argc, argv);

    std::shared_ptr<AutopilotNode> node;
    try {
        node = std::make_shared<AutopilotNode>();

        // One thread per busy aircraft, each worker has its own callback group
        rclcpp::executors::MultiThreadedExecutor executor;
        executor.add_node(node);

        RCLCPP_INFO(node->get_logger(), "Press Ctrl+C to stop the autopilot");
        executor.spin();

    } catch (const std::exception& e) {
        RCLCPP_ERROR(rclcpp::get_logger("xplane_autopilot_main"),
                     "Exception in autopilot: %s", e.what());
        node.reset();
        rclcpp::shutdown();
        return 1;
    }

    // Clean shutdown
    if (node) {
        RCLCPP_INFO(node->get_logger(), "Autopilot shutting down");
        node.reset();
    }

    rclcpp::shutdown();
    return 0;
}
