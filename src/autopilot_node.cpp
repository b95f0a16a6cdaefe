#include "xplane_autopilot_cpp/autopilot_node.hpp"
#include <stdexcept>
#include <utility>

ControlLoopWorker::ControlLoopWorker(rclcpp::Node& node, const AutopilotConfig& config,
                                     const InstanceDescriptor& instance, ExitCallback on_exit)
    : group_(node.create_callback_group(rclcpp::CallbackGroupType::MutuallyExclusive)) {
    start(node, config, instance,
          std::make_unique<RosVehicleLink>(node, config.topic_prefix, instance, group_),
          std::move(on_exit));
}

ControlLoopWorker::ControlLoopWorker(rclcpp::Node& node, const AutopilotConfig& config,
                                     const InstanceDescriptor& instance,
                                     std::unique_ptr<VehicleLink> link, ExitCallback on_exit)
    : group_(node.create_callback_group(rclcpp::CallbackGroupType::MutuallyExclusive)) {
    if (!link) {
        throw std::invalid_argument("control loop worker needs a vehicle link");
    }
    start(node, config, instance, std::move(link), std::move(on_exit));
}

void ControlLoopWorker::start(rclcpp::Node& node, const AutopilotConfig& config,
                              const InstanceDescriptor& instance,
                              std::unique_ptr<VehicleLink> link, ExitCallback on_exit) {
    context_ = std::make_shared<TickContext>(std::move(link), std::move(on_exit),
                                             node.get_logger().get_child("autopilot"));
    context_->loop = std::make_unique<ControlLoop>(instance, config, *context_->link);
    context_->published = context_->loop->state();

    auto context = context_;
    timer_ = node.create_wall_timer(
        config.tick_period,
        [context](rclcpp::TimerBase& timer) { onTick(context, timer); },
        group_);
}

ControlLoopWorker::~ControlLoopWorker() {
    if (timer_) {
        timer_->cancel();
    }
}

ControlState ControlLoopWorker::snapshot() const {
    std::lock_guard<std::mutex> lock(context_->published_mutex);
    return context_->published;
}

void ControlLoopWorker::onTick(const std::shared_ptr<TickContext>& context,
                               rclcpp::TimerBase& timer) {
    ++context->ticks_handled;
    try {
        context->loop->tick();
    } catch (const std::exception& e) {
        RCLCPP_ERROR(context->logger, "Control tick for %s failed: %s",
                     context->loop->instance().address.c_str(), e.what());
        timer.cancel();
        ExitCallback on_exit = context->on_exit;
        on_exit(e.what());
        return;
    }
    {
        std::lock_guard<std::mutex> lock(context->published_mutex);
        context->published = context->loop->state();
    }
    // Next tick one period after this one finished
    timer.reset();
}

AutopilotNode::AutopilotNode(const rclcpp::NodeOptions& options)
    : Node("xplane_autopilot", options) {

    config_ = loadConfig();
    validateConfig(config_);

    supervisor_group_ = this->create_callback_group(rclcpp::CallbackGroupType::MutuallyExclusive);

    directory_ = std::make_unique<RosInstanceDirectory>(
        *this, config_.topic_prefix + "/instances",
        rclcpp::Duration(std::chrono::duration_cast<std::chrono::nanoseconds>(
            config_.instance_timeout)),
        supervisor_group_);

    supervisor_ = std::make_unique<InstanceSupervisor>(
        *directory_,
        std::bind(&AutopilotNode::createWorker, this, std::placeholders::_1,
                  std::placeholders::_2),
        config_.restart);

    discovery_timer_ = this->create_wall_timer(
        config_.discovery_period, std::bind(&AutopilotNode::discoveryCallback, this),
        supervisor_group_);
    monitor_timer_ = this->create_wall_timer(
        config_.monitor_period, std::bind(&AutopilotNode::monitorCallback, this),
        supervisor_group_);

    RCLCPP_INFO(this->get_logger(),
                "X-Plane autopilot started, watching %s/instances every %lld ms, tick %lld ms",
                config_.topic_prefix.c_str(),
                static_cast<long long>(config_.discovery_period.count()),
                static_cast<long long>(config_.tick_period.count()));
}

AutopilotNode::~AutopilotNode() {
    if (discovery_timer_) discovery_timer_->cancel();
    if (monitor_timer_) monitor_timer_->cancel();
    // Workers go before the topics they use
    supervisor_.reset();
    directory_.reset();
}

PIDGains AutopilotNode::loadGains(const std::string& prefix, const PIDGains& defaults) {
    PIDGains gains;
    gains.p = this->declare_parameter<double>(prefix + ".p", defaults.p);
    gains.i = this->declare_parameter<double>(prefix + ".i", defaults.i);
    gains.d = this->declare_parameter<double>(prefix + ".d", defaults.d);
    gains.output_min = this->declare_parameter<double>(prefix + ".output_min", defaults.output_min);
    gains.output_max = this->declare_parameter<double>(prefix + ".output_max", defaults.output_max);
    // 0 turns wraparound off
    const double modulo =
        this->declare_parameter<double>(prefix + ".modulo", defaults.modulo.value_or(0.0));
    if (modulo != 0.0) {
        gains.modulo = modulo;
    }
    return gains;
}

AutopilotConfig AutopilotNode::loadConfig() {
    AutopilotConfig config;

    config.tick_period = std::chrono::milliseconds(
        this->declare_parameter<int>("tick_period_ms", config.tick_period.count()));
    config.discovery_period = std::chrono::milliseconds(
        this->declare_parameter<int>("discovery_period_ms", config.discovery_period.count()));
    config.monitor_period = std::chrono::milliseconds(
        this->declare_parameter<int>("monitor_period_ms", config.monitor_period.count()));
    config.instance_timeout = std::chrono::milliseconds(static_cast<int64_t>(
        1000.0 * this->declare_parameter<double>(
                     "instance_timeout_s", config.instance_timeout.count() / 1000.0)));
    config.feedback_rate_hz =
        this->declare_parameter<int>("feedback_rate_hz", config.feedback_rate_hz);

    config.restart.max_restarts =
        this->declare_parameter<int>("max_restarts", config.restart.max_restarts);
    config.restart.window = std::chrono::milliseconds(static_cast<int64_t>(
        1000.0 * this->declare_parameter<double>(
                     "restart_window_s", config.restart.window.count() / 1000.0)));

    config.topic_prefix = this->declare_parameter<std::string>("topic_prefix", config.topic_prefix);

    config.ap_enabled = this->declare_parameter<bool>("ap_enabled", config.ap_enabled);
    config.heading_mode = this->declare_parameter<bool>("heading_mode", config.heading_mode);
    config.airspeed_mode = this->declare_parameter<bool>("airspeed_mode", config.airspeed_mode);
    config.altitude_mode = this->declare_parameter<bool>("altitude_mode", config.altitude_mode);

    config.heading_gains.heading = loadGains("heading", config.heading_gains.heading);
    config.heading_gains.roll = loadGains("roll", config.heading_gains.roll);
    config.heading_gains.yaw = loadGains("yaw", config.heading_gains.yaw);

    return config;
}

std::unique_ptr<Worker> AutopilotNode::createWorker(const InstanceDescriptor& instance,
                                                    ExitCallback on_exit) {
    return std::make_unique<ControlLoopWorker>(*this, config_, instance, std::move(on_exit));
}

void AutopilotNode::discoveryCallback() {
    try {
        const auto started = supervisor_->poll();
        if (started > 0) {
            RCLCPP_INFO(this->get_logger(), "Flying %zu aircraft", supervisor_->registeredCount());
        }
    } catch (const std::exception& e) {
        RCLCPP_ERROR(this->get_logger(), "Instance discovery failed: %s", e.what());
        supervisor_->restartPoller();
    }
}

void AutopilotNode::monitorCallback() {
    supervisor_->monitor(std::chrono::steady_clock::now());
}
