#ifndef DATAREFS_HPP
#define DATAREFS_HPP

#include <stdexcept>
#include <string>
#include <vector>

#include "xplane_autopilot_cpp/control_state.hpp"

/**
 * @brief Simulator version has no known dataref for an output
 */
class UnsupportedVersionError : public std::runtime_error {
public:
    explicit UnsupportedVersionError(const std::string& what) : std::runtime_error(what) {}
};

/// Simulator clock, drives every PID step
extern const char* const kFlightTimeDataref;

/**
 * @brief Dataref read into a ControlState field on every tick
 */
struct FeedbackBinding {
    const char* dataref;
    Field field;
};

const std::vector<FeedbackBinding>& feedbackBindings();

/**
 * @brief Every dataref the autopilot subscribes to, the flight time first
 */
std::vector<std::string> feedbackDatarefs();

/**
 * @brief Dataref an output field is written to
 * @param field Output field
 * @param version_number Simulator version, e.g. 110502
 * @throws UnsupportedVersionError for versions before 11
 * @throws std::invalid_argument if the field is not an output
 */
std::string outputDataref(Field field, int version_number);

#endif // DATAREFS_HPP
