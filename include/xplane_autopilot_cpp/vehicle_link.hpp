#ifndef VEHICLE_LINK_HPP
#define VEHICLE_LINK_HPP

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "xplane_autopilot_cpp/instance.hpp"

/**
 * @brief Failure talking to a simulator instance
 */
class VehicleLinkError : public std::runtime_error {
public:
    explicit VehicleLinkError(const std::string& what) : std::runtime_error(what) {}
};

using DatarefValues = std::map<std::string, std::optional<double>>;
using DatarefWrites = std::vector<std::pair<std::string, double>>;

/**
 * @brief Data exchange with one simulator instance
 *
 * Implementations throw VehicleLinkError when the instance cannot be reached.
 */
class VehicleLink {
public:
    virtual ~VehicleLink() = default;

    /**
     * @brief Ask the simulator to stream datarefs at a fixed rate
     * @param datarefs Dataref names
     * @param rate_hz Updates per second
     */
    virtual void requestFeedback(const std::vector<std::string>& datarefs, int rate_hz) = 0;

    /**
     * @brief Most recently received value of each dataref
     * @param datarefs Dataref names
     * @return One entry per requested dataref, absent if nothing was received yet
     */
    virtual DatarefValues fetchFeedback(const std::vector<std::string>& datarefs) = 0;

    /**
     * @brief Write dataref values once, without retrying
     * @param values Dataref name and value pairs
     */
    virtual void writeOutputs(const DatarefWrites& values) = 0;
};

/**
 * @brief Source of the simulator instances currently visible on the network
 */
class InstanceDirectory {
public:
    virtual ~InstanceDirectory() = default;

    virtual std::vector<InstanceDescriptor> listLiveInstances() = 0;
};

#endif // VEHICLE_LINK_HPP
