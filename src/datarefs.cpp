#include "xplane_autopilot_cpp/datarefs.hpp"

namespace {

constexpr int kFirstSupportedVersion = 110000;

}  // namespace

const char* const kFlightTimeDataref = "sim/time/total_flight_time_sec";

const std::vector<FeedbackBinding>& feedbackBindings() {
    static const std::vector<FeedbackBinding> bindings = {
        {"sim/cockpit/autopilot/heading_mag", Field::MagPsiSetpoint},
        {"sim/flightmodel/position/true_phi", Field::Phi},
        {"sim/flightmodel/position/true_psi", Field::Psi},
        {"sim/flightmodel/position/true_theta", Field::Theta},
        {"sim/flightmodel/position/vpath", Field::Vpath},
        {"sim/flightmodel/position/alpha", Field::Alpha},
        {"sim/flightmodel/position/hpath", Field::Hpath},
        {"sim/flightmodel/position/beta", Field::Beta},
        {"sim/flightmodel/position/mag_psi", Field::MagPsi},
        {"sim/flightmodel/position/groundspeed", Field::Groundspeed},
        {"sim/flightmodel/position/elevation", Field::HeightMsl},
        {"sim/flightmodel/position/y_agl", Field::HeightAgl},
        {"sim/flightmodel/position/latitude", Field::Latitude},
        {"sim/flightmodel/position/longitude", Field::Longitude},
        {"sim/flightmodel/position/true_airspeed", Field::TrueAirspeed},
        {"sim/flightmodel/position/indicated_airspeed", Field::IndicatedAirspeed},
        {"sim/flightmodel/weight/m_total", Field::MassTotal},
    };
    return bindings;
}

std::vector<std::string> feedbackDatarefs() {
    std::vector<std::string> datarefs;
    datarefs.reserve(feedbackBindings().size() + 1);
    datarefs.emplace_back(kFlightTimeDataref);
    for (const auto& binding : feedbackBindings()) {
        datarefs.emplace_back(binding.dataref);
    }
    return datarefs;
}

std::string outputDataref(Field field, int version_number) {
    if (version_number < kFirstSupportedVersion) {
        throw UnsupportedVersionError(
            "no output datarefs known for X-Plane version " + std::to_string(version_number));
    }
    switch (field) {
        case Field::AileronTrim: return "sim/flightmodel/controls/ail_trim";
        case Field::ElevatorTrim: return "sim/flightmodel/controls/elv_trim";
        case Field::RudderTrim: return "sim/flightmodel/controls/rud_trim";
        default: break;
    }
    throw std::invalid_argument(std::string(fieldName(field)) + " is not an output field");
}
