#ifndef ROS_VEHICLE_LINK_HPP
#define ROS_VEHICLE_LINK_HPP

#include <rclcpp/rclcpp.hpp>
#include <std_msgs/msg/float64.hpp>
#include <diagnostic_msgs/msg/diagnostic_array.hpp>
#include <diagnostic_msgs/msg/diagnostic_status.hpp>
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "xplane_autopilot_cpp/instance.hpp"
#include "xplane_autopilot_cpp/vehicle_link.hpp"

/**
 * @brief Turn an instance address into a valid ROS name token
 * @param address e.g. "192.168.1.20:49000"
 * @return e.g. "i192_168_1_20_49000"
 */
std::string instanceToken(const std::string& address);

/**
 * @brief VehicleLink over ROS topics, one Float64 topic per dataref
 *
 * Feedback arrives on <prefix>/<instance>/<dataref>, commands go out on
 * <prefix>/<instance>/command/<dataref>. Subscription callbacks run in the
 * given callback group, which must be mutually exclusive with whatever calls
 * fetchFeedback().
 */
class RosVehicleLink : public VehicleLink {
public:
    /**
     * @brief Constructor
     * @param node Node that owns the topics, must outlive the link
     * @param topic_prefix Absolute topic prefix, e.g. "/xplane"
     * @param instance Instance the topics belong to
     * @param group Callback group for the feedback subscriptions
     */
    RosVehicleLink(rclcpp::Node& node, const std::string& topic_prefix,
                   const InstanceDescriptor& instance,
                   rclcpp::CallbackGroup::SharedPtr group);

    void requestFeedback(const std::vector<std::string>& datarefs, int rate_hz) override;
    DatarefValues fetchFeedback(const std::vector<std::string>& datarefs) override;
    void writeOutputs(const DatarefWrites& values) override;

private:
    using FeedbackCache = std::map<std::string, std::optional<double>>;

    rclcpp::Node& node_;
    std::string base_topic_;                 ///< <prefix>/<instance>
    InstanceDescriptor instance_;
    rclcpp::CallbackGroup::SharedPtr group_;

    rclcpp::Publisher<diagnostic_msgs::msg::DiagnosticStatus>::SharedPtr request_pub_;
    std::map<std::string, rclcpp::Subscription<std_msgs::msg::Float64>::SharedPtr> feedback_subs_;
    std::shared_ptr<FeedbackCache> latest_;   ///< Last value per dataref, shared with the callbacks
    std::map<std::string, rclcpp::Publisher<std_msgs::msg::Float64>::SharedPtr> command_pubs_;

    void ensureConnected() const;
    rclcpp::Publisher<std_msgs::msg::Float64>::SharedPtr commandPublisher(const std::string& dataref);
};

/**
 * @brief InstanceDirectory fed by simulator announcements on a ROS topic
 *
 * Each DiagnosticStatus in an announcement describes one instance: name is
 * the address, hardware_id the host kind, and the "role" and "version" values
 * its role and version number. An instance is live while its last
 * announcement is younger than the timeout.
 */
class RosInstanceDirectory : public InstanceDirectory {
public:
    RosInstanceDirectory(rclcpp::Node& node, const std::string& topic,
                         rclcpp::Duration timeout, rclcpp::CallbackGroup::SharedPtr group);

    /**
     * @brief Instances announced within the timeout; older sightings are dropped
     */
    std::vector<InstanceDescriptor> listLiveInstances() override;

    std::size_t sightingCount() const { return sightings_.size(); }

private:
    struct Sighting {
        InstanceDescriptor instance;
        rclcpp::Time last_seen;
    };

    rclcpp::Node& node_;
    rclcpp::Duration timeout_;
    rclcpp::Subscription<diagnostic_msgs::msg::DiagnosticArray>::SharedPtr announcements_sub_;
    std::map<std::string, Sighting> sightings_;   ///< By address

    void announcementsCallback(const diagnostic_msgs::msg::DiagnosticArray::SharedPtr msg);
};

#endif // ROS_VEHICLE_LINK_HPP
