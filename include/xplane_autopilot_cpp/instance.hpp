#ifndef INSTANCE_HPP
#define INSTANCE_HPP

#include <string>

/**
 * @brief Kind of program that announced itself on the network
 */
enum class HostKind { XPlane, PlaneMaker, Unknown };

/**
 * @brief Role of a simulator instance in a multi-machine setup
 */
enum class InstanceRole { Master, ExternalVisual, Ios, Unknown };

/**
 * @brief One simulator instance seen by discovery
 */
struct InstanceDescriptor {
    std::string address;                   ///< host:port, unique per instance
    HostKind host = HostKind::Unknown;
    InstanceRole role = InstanceRole::Unknown;
    int version_number = 0;                ///< e.g. 110502 for 11.50r2
};

/**
 * @brief True if the instance can be flown by the autopilot (an X-Plane master)
 */
bool isControllable(const InstanceDescriptor& instance);

HostKind parseHostKind(const std::string& text);
InstanceRole parseInstanceRole(const std::string& text);
const char* toString(HostKind host);
const char* toString(InstanceRole role);

#endif // INSTANCE_HPP
