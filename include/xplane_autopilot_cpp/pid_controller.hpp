#ifndef PID_CONTROLLER_HPP
#define PID_CONTROLLER_HPP

#include <optional>

/**
 * @brief Gains, output limits and optional wraparound for one PID controller
 */
struct PIDGains {
    double p = 0.0;                  ///< Proportional gain
    double i = 0.0;                  ///< Integral gain
    double d = 0.0;                  ///< Derivative gain
    double output_min = -1.0;        ///< Lower output clamp
    double output_max = 1.0;         ///< Upper output clamp
    std::optional<double> modulo;    ///< Wraparound period (e.g. 360 for headings)
};

/**
 * @brief Check that the output limits are ordered and the wraparound is positive
 * @throws std::invalid_argument otherwise
 */
void validateGains(const PIDGains& gains);

/**
 * @brief Time-gated PID controller
 *
 * Drives a feedback value towards a setpoint by producing a clamped output.
 * The controller integrates and emits at most once per advancing timestamp;
 * a step whose time does not advance only records the current error.
 */
class PIDController {
public:
    /**
     * @brief Constructor for PID Controller
     * @param gains Gains and output limits, fixed for the controller lifetime
     * @throws std::invalid_argument if output_min > output_max or modulo <= 0
     */
    explicit PIDController(const PIDGains& gains = PIDGains());

    /**
     * @brief Step the controller at the given time
     * @param time Timestamp of this step (seconds)
     * @param feedback Current measured value, absent if unknown
     * @param setpoint Target value, absent if unknown
     * @return Control output, or absent if nothing was produced this step
     */
    std::optional<double> update(double time, std::optional<double> feedback,
                                 std::optional<double> setpoint);

    const PIDGains& gains() const { return gains_; }
    double errorSum() const { return err_sum_; }
    double previousError() const { return err_prev_; }
    std::optional<double> previousTime() const { return time_prev_; }

private:
    PIDGains gains_;                    ///< Fixed after construction
    double err_sum_;                    ///< Integral term accumulator
    double err_prev_;                   ///< Error at the previous step
    std::optional<double> time_prev_;   ///< Time of the previous step, absent before the first
};

#endif // PID_CONTROLLER_HPP
