#include "xplane_autopilot_cpp/pid_controller.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

void validateGains(const PIDGains& gains) {
    if (gains.output_min > gains.output_max) {
        throw std::invalid_argument(
            "PID output_min " + std::to_string(gains.output_min) +
            " is greater than output_max " + std::to_string(gains.output_max));
    }
    if (gains.modulo && !(*gains.modulo > 0.0)) {
        throw std::invalid_argument("PID modulo must be positive");
    }
}

PIDController::PIDController(const PIDGains& gains)
    : gains_(gains), err_sum_(0.0), err_prev_(0.0), time_prev_() {
    validateGains(gains_);
}

std::optional<double> PIDController::update(double time, std::optional<double> feedback,
                                            std::optional<double> setpoint) {
    if (!feedback || !setpoint) {
        return std::nullopt;
    }

    double fb = *feedback;
    double sp = *setpoint;

    // Take the shorter way around the circle
    if (gains_.modulo) {
        const double m = *gains_.modulo;
        if (fb - sp > m / 2.0) {
            sp += m;
        } else if (sp - fb > m / 2.0) {
            fb += m;
        }
    }

    const double error = sp - fb;

    // Integrate and emit only once per advancing timestamp
    if (!time_prev_ || time <= *time_prev_) {
        err_prev_ = error;
        time_prev_ = time;
        return std::nullopt;
    }

    const double err_sum = err_sum_ + error;
    const double dt = time - *time_prev_;
    const double err_dt = (error - err_prev_) / dt;

    double output = gains_.p * error + gains_.i * err_sum + gains_.d * err_dt;
    output = std::max(gains_.output_min, std::min(gains_.output_max, output));

    err_sum_ = err_sum;
    err_prev_ = error;
    time_prev_ = time;

    return output;
}
