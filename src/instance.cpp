#include "xplane_autopilot_cpp/instance.hpp"

bool isControllable(const InstanceDescriptor& instance) {
    return instance.host == HostKind::XPlane && instance.role == InstanceRole::Master;
}

HostKind parseHostKind(const std::string& text) {
    if (text == "xplane") return HostKind::XPlane;
    if (text == "planemaker") return HostKind::PlaneMaker;
    return HostKind::Unknown;
}

InstanceRole parseInstanceRole(const std::string& text) {
    if (text == "master") return InstanceRole::Master;
    if (text == "extern_visual") return InstanceRole::ExternalVisual;
    if (text == "ios") return InstanceRole::Ios;
    return InstanceRole::Unknown;
}

const char* toString(HostKind host) {
    switch (host) {
        case HostKind::XPlane: return "xplane";
        case HostKind::PlaneMaker: return "planemaker";
        case HostKind::Unknown: break;
    }
    return "unknown";
}

const char* toString(InstanceRole role) {
    switch (role) {
        case InstanceRole::Master: return "master";
        case InstanceRole::ExternalVisual: return "extern_visual";
        case InstanceRole::Ios: return "ios";
        case InstanceRole::Unknown: break;
    }
    return "unknown";
}
