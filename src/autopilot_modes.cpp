#include "xplane_autopilot_cpp/autopilot_modes.hpp"

// No airspeed control law yet
Cascade airspeedCascade() {
    return Cascade{"airspeed", Mode::Airspeed, {}, {}};
}

Cascade headingCascade(const HeadingModeGains& gains) {
    Cascade cascade{"heading", Mode::Heading, {}, {Field::AileronTrim, Field::RudderTrim}};
    cascade.stages = {
        {{Field::MagPsi, Field::MagPsiSetpoint, Field::PhiSetpoint}, gains.heading},
        {{Field::Phi, Field::PhiSetpoint, Field::AileronTrim}, gains.roll},
        {{Field::Beta, Field::BetaSetpoint, Field::RudderTrim}, gains.yaw},
    };
    return cascade;
}

// No altitude control law yet
Cascade altitudeCascade() {
    return Cascade{"altitude", Mode::Altitude, {}, {}};
}

void registerCascade(ControlState& state, const Cascade& cascade) {
    for (const auto& stage : cascade.stages) {
        state.addPid(stage.key, stage.gains);
    }
}

bool runCascade(ControlState& state, const Cascade& cascade) {
    if (!state.isOn(cascade.mode)) {
        return false;
    }
    for (const auto& stage : cascade.stages) {
        state.setOutput(stage.key);
    }
    return true;
}
