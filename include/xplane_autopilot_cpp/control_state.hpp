#ifndef CONTROL_STATE_HPP
#define CONTROL_STATE_HPP

#include <array>
#include <cstddef>
#include <map>
#include <optional>
#include <string>

#include "xplane_autopilot_cpp/pid_controller.hpp"

/**
 * @brief Every scalar the autopilot tracks for one aircraft
 *
 * Angles in degrees, heights in metres, speeds in knots unless noted.
 */
enum class Field : std::size_t {
    // Setpoints
    PhiSetpoint,          ///< Roll setpoint
    PsiSetpoint,          ///< True heading setpoint
    ThetaSetpoint,        ///< Pitch setpoint
    MagPsiSetpoint,       ///< Selected magnetic heading
    AltitudeSetpoint,     ///< Selected altitude
    VsSetpoint,           ///< Vertical speed setpoint
    AlphaSetpoint,        ///< Pitch angle of attack setpoint
    BetaSetpoint,         ///< Sideslip setpoint
    AirspeedSetpoint,     ///< Selected airspeed
    // Feedback
    Phi,                  ///< Roll
    Psi,                  ///< True heading, hpath + beta
    Theta,                ///< Pitch
    Vpath,                ///< Flight path pitch, vpath + alpha = theta
    Alpha,                ///< Angle of attack
    Hpath,                ///< Track, degrees true
    Beta,                 ///< Sideslip
    MagPsi,               ///< Magnetic heading
    Groundspeed,          ///< m/s
    HeightMsl,            ///< Above sea level
    HeightAgl,            ///< Above ground level
    Latitude,
    Longitude,
    TrueAirspeed,         ///< TAS, do not fly to this
    IndicatedAirspeed,    ///< IAS
    MassTotal,            ///< kg
    // Outputs, -1.0 ... 1.0
    AileronTrim,
    ElevatorTrim,
    RudderTrim,
    Count
};

constexpr std::size_t kFieldCount = static_cast<std::size_t>(Field::Count);

/**
 * @brief Stable snake_case name of a field, for logs and errors
 */
const char* fieldName(Field field);

/**
 * @brief Identity of a PID controller: the fields it reads and writes
 */
struct PIDKey {
    Field feedback;
    Field setpoint;
    Field output;
};

bool operator<(const PIDKey& lhs, const PIDKey& rhs);
bool operator==(const PIDKey& lhs, const PIDKey& rhs);
std::string toString(const PIDKey& key);

/**
 * @brief Autopilot switches; each gates one cascade, Autopilot gates the whole tick
 */
enum class Mode { Autopilot, Airspeed, Heading, Altitude };

/**
 * @brief Values, PID controllers and mode switches of one aircraft
 *
 * Owned by exactly one control loop. Time only moves when feedback is
 * refreshed; PID steps never advance it.
 */
class ControlState {
public:
    /**
     * @brief Constructor, every field starts at 0.0, every mode off, no time yet
     */
    ControlState();

    std::optional<double> get(Field field) const;
    void set(Field field, std::optional<double> value);

    std::optional<double> time() const { return time_; }
    void setTime(double time) { time_ = time; }

    bool isOn(Mode mode) const;
    void setMode(Mode mode, bool on);

    /**
     * @brief Register a PID controller under its field triple
     * @param key Feedback, setpoint and output fields
     * @param gains Controller gains
     * @return False if the triple was already registered (the first one is kept)
     * @throws std::invalid_argument on malformed gains
     */
    bool addPid(const PIDKey& key, const PIDGains& gains = PIDGains());

    bool hasPid(const PIDKey& key) const;

    /**
     * @brief Registered controller for a triple
     * @throws std::logic_error if the triple was never registered
     */
    const PIDController& pid(const PIDKey& key) const;

    /**
     * @brief Step the controller for a triple at the current time
     *
     * Reads feedback and setpoint from their fields and writes the output
     * field only if the controller produced one. Does nothing before the
     * first time is known.
     *
     * @throws std::logic_error if the triple was never registered
     */
    void setOutput(const PIDKey& key);

private:
    std::array<std::optional<double>, kFieldCount> values_;  ///< Indexed by Field
    std::map<PIDKey, PIDController> pids_;                    ///< Controllers by identity
    std::optional<double> time_;                             ///< Simulator time (s)
    bool autopilot_on_;
    bool airspeed_on_;
    bool heading_on_;
    bool altitude_on_;

    PIDController& findPid(const PIDKey& key);
};

#endif // CONTROL_STATE_HPP
