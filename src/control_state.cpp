#include "xplane_autopilot_cpp/control_state.hpp"
#include <stdexcept>
#include <tuple>

namespace {

const char* const kFieldNames[kFieldCount] = {
    "phi_setpoint",
    "psi_setpoint",
    "theta_setpoint",
    "mag_psi_setpoint",
    "altitude_setpoint",
    "vs_setpoint",
    "alpha_setpoint",
    "beta_setpoint",
    "airspeed_setpoint",
    "phi",
    "psi",
    "theta",
    "vpath",
    "alpha",
    "hpath",
    "beta",
    "mag_psi",
    "groundspeed",
    "height_msl",
    "height_agl",
    "latitude",
    "longitude",
    "true_airspeed",
    "indicated_airspeed",
    "mass_total",
    "aileron_trim",
    "elevator_trim",
    "rudder_trim",
};

std::size_t indexOf(Field field) {
    const auto index = static_cast<std::size_t>(field);
    if (index >= kFieldCount) {
        throw std::out_of_range("invalid field index " + std::to_string(index));
    }
    return index;
}

}  // namespace

const char* fieldName(Field field) {
    return kFieldNames[indexOf(field)];
}

bool operator<(const PIDKey& lhs, const PIDKey& rhs) {
    return std::tie(lhs.feedback, lhs.setpoint, lhs.output) <
           std::tie(rhs.feedback, rhs.setpoint, rhs.output);
}

bool operator==(const PIDKey& lhs, const PIDKey& rhs) {
    return lhs.feedback == rhs.feedback && lhs.setpoint == rhs.setpoint &&
           lhs.output == rhs.output;
}

std::string toString(const PIDKey& key) {
    return std::string("(") + fieldName(key.feedback) + ", " + fieldName(key.setpoint) +
           " -> " + fieldName(key.output) + ")";
}

ControlState::ControlState()
    : time_(), autopilot_on_(false), airspeed_on_(false), heading_on_(false),
      altitude_on_(false) {
    values_.fill(0.0);
}

std::optional<double> ControlState::get(Field field) const {
    return values_[indexOf(field)];
}

void ControlState::set(Field field, std::optional<double> value) {
    values_[indexOf(field)] = value;
}

bool ControlState::isOn(Mode mode) const {
    switch (mode) {
        case Mode::Autopilot: return autopilot_on_;
        case Mode::Airspeed: return airspeed_on_;
        case Mode::Heading: return heading_on_;
        case Mode::Altitude: return altitude_on_;
    }
    return false;
}

void ControlState::setMode(Mode mode, bool on) {
    switch (mode) {
        case Mode::Autopilot: autopilot_on_ = on; break;
        case Mode::Airspeed: airspeed_on_ = on; break;
        case Mode::Heading: heading_on_ = on; break;
        case Mode::Altitude: altitude_on_ = on; break;
    }
}

bool ControlState::addPid(const PIDKey& key, const PIDGains& gains) {
    if (pids_.count(key) > 0) {
        return false;
    }
    pids_.emplace(key, PIDController(gains));
    return true;
}

bool ControlState::hasPid(const PIDKey& key) const {
    return pids_.count(key) > 0;
}

const PIDController& ControlState::pid(const PIDKey& key) const {
    auto it = pids_.find(key);
    if (it == pids_.end()) {
        throw std::logic_error("no PID controller registered for " + toString(key));
    }
    return it->second;
}

PIDController& ControlState::findPid(const PIDKey& key) {
    auto it = pids_.find(key);
    if (it == pids_.end()) {
        throw std::logic_error("no PID controller registered for " + toString(key));
    }
    return it->second;
}

void ControlState::setOutput(const PIDKey& key) {
    PIDController& controller = findPid(key);
    if (!time_) {
        return;
    }

    auto output = controller.update(*time_, get(key.feedback), get(key.setpoint));
    if (output) {
        set(key.output, *output);
    }
}
