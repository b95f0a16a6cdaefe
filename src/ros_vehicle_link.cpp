#include "xplane_autopilot_cpp/ros_vehicle_link.hpp"
#include <cctype>
#include <utility>

std::string instanceToken(const std::string& address) {
    std::string token = "i";
    token.reserve(address.size() + 1);
    for (char c : address) {
        token.push_back(std::isalnum(static_cast<unsigned char>(c)) ? c : '_');
    }
    return token;
}

RosVehicleLink::RosVehicleLink(rclcpp::Node& node, const std::string& topic_prefix,
                               const InstanceDescriptor& instance,
                               rclcpp::CallbackGroup::SharedPtr group)
    : node_(node), base_topic_(topic_prefix + "/" + instanceToken(instance.address)),
      instance_(instance), group_(std::move(group)),
      latest_(std::make_shared<FeedbackCache>()) {
    request_pub_ = node_.create_publisher<diagnostic_msgs::msg::DiagnosticStatus>(
        base_topic_ + "/feedback_request", rclcpp::QoS(1).reliable().transient_local());
}

void RosVehicleLink::ensureConnected() const {
    if (!rclcpp::ok()) {
        throw VehicleLinkError("ROS is shut down, no link to " + instance_.address);
    }
}

void RosVehicleLink::requestFeedback(const std::vector<std::string>& datarefs, int rate_hz) {
    ensureConnected();

    rclcpp::SubscriptionOptions options;
    options.callback_group = group_;

    diagnostic_msgs::msg::DiagnosticStatus request;
    request.level = diagnostic_msgs::msg::DiagnosticStatus::OK;
    request.name = instance_.address;
    request.message = "feedback request";

    for (const auto& dataref : datarefs) {
        if (feedback_subs_.count(dataref) == 0) {
            latest_->emplace(dataref, std::nullopt);
            // The executor may still run this after the link is gone
            std::shared_ptr<FeedbackCache> cache = latest_;
            feedback_subs_[dataref] = node_.create_subscription<std_msgs::msg::Float64>(
                base_topic_ + "/" + dataref, rclcpp::SensorDataQoS(),
                [cache, dataref](const std_msgs::msg::Float64::SharedPtr msg) {
                    (*cache)[dataref] = msg->data;
                },
                options);
        }
        diagnostic_msgs::msg::KeyValue entry;
        entry.key = dataref;
        entry.value = std::to_string(rate_hz);
        request.values.push_back(entry);
    }

    request_pub_->publish(request);
}

DatarefValues RosVehicleLink::fetchFeedback(const std::vector<std::string>& datarefs) {
    ensureConnected();

    DatarefValues values;
    for (const auto& dataref : datarefs) {
        auto it = latest_->find(dataref);
        values[dataref] = it == latest_->end() ? std::nullopt : it->second;
    }
    return values;
}

rclcpp::Publisher<std_msgs::msg::Float64>::SharedPtr
RosVehicleLink::commandPublisher(const std::string& dataref) {
    auto it = command_pubs_.find(dataref);
    if (it != command_pubs_.end()) {
        return it->second;
    }
    auto publisher = node_.create_publisher<std_msgs::msg::Float64>(
        base_topic_ + "/command/" + dataref, 10);
    command_pubs_.emplace(dataref, publisher);
    return publisher;
}

void RosVehicleLink::writeOutputs(const DatarefWrites& values) {
    ensureConnected();

    for (const auto& value : values) {
        std_msgs::msg::Float64 msg;
        msg.data = value.second;
        try {
            commandPublisher(value.first)->publish(msg);
        } catch (const rclcpp::exceptions::RCLError& e) {
            throw VehicleLinkError("writing " + value.first + " to " + instance_.address +
                                   " failed: " + e.what());
        }
    }
}

RosInstanceDirectory::RosInstanceDirectory(rclcpp::Node& node, const std::string& topic,
                                           rclcpp::Duration timeout,
                                           rclcpp::CallbackGroup::SharedPtr group)
    : node_(node), timeout_(timeout) {
    rclcpp::SubscriptionOptions options;
    options.callback_group = std::move(group);
    announcements_sub_ = node_.create_subscription<diagnostic_msgs::msg::DiagnosticArray>(
        topic, 10,
        std::bind(&RosInstanceDirectory::announcementsCallback, this, std::placeholders::_1),
        options);
}

void RosInstanceDirectory::announcementsCallback(
    const diagnostic_msgs::msg::DiagnosticArray::SharedPtr msg) {
    const rclcpp::Time now = node_.now();

    for (const auto& status : msg->status) {
        if (status.name.empty()) {
            RCLCPP_WARN(node_.get_logger(), "Ignoring instance announcement without address");
            continue;
        }

        InstanceDescriptor instance;
        instance.address = status.name;
        instance.host = parseHostKind(status.hardware_id);
        try {
            for (const auto& value : status.values) {
                if (value.key == "role") {
                    instance.role = parseInstanceRole(value.value);
                } else if (value.key == "version") {
                    instance.version_number = std::stoi(value.value);
                }
            }
        } catch (const std::exception& e) {
            RCLCPP_WARN(node_.get_logger(), "Ignoring malformed announcement from %s: %s",
                        status.name.c_str(), e.what());
            continue;
        }

        auto it = sightings_.find(instance.address);
        if (it == sightings_.end()) {
            sightings_.emplace(instance.address, Sighting{instance, now});
        } else {
            it->second = Sighting{instance, now};
        }
    }
}

std::vector<InstanceDescriptor> RosInstanceDirectory::listLiveInstances() {
    const rclcpp::Time now = node_.now();

    std::vector<InstanceDescriptor> live;
    for (auto it = sightings_.begin(); it != sightings_.end();) {
        if (now - it->second.last_seen <= timeout_) {
            live.push_back(it->second.instance);
            ++it;
        } else {
            it = sightings_.erase(it);
        }
    }
    return live;
}
