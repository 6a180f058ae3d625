#pragma once

#include "shyradar/types.hpp"
#include <string>
#include <unordered_set>

namespace shyradar {
namespace discovery {

enum class FilterVerdict {
    Accepted,
    RejectedPrefix,     // Not one of our application's broadcasts
    RejectedSelf,       // Our own device or our own advertisement
    RejectedDuplicate,  // Device already reported this cycle
};

const char* filterVerdictToString(FilterVerdict verdict);

// Per-cycle admission filter for raw sightings.
//
// Stages, in order:
//   0. optional advertise-prefix gate
//   1. self-filter: device id or advertised name contains a local token
//   2. dedup: device id already admitted this cycle
//
// Not thread-safe; DiscoverySession serializes access under its lock.
class SightingFilter {
public:
    SightingFilter() = default;

    // Empty tokens are ignored so an unset identity never rejects everything
    void setSelfTokens(const std::string& device_id, const std::string& user_id);
    void setPrefixGate(bool enabled, const std::string& prefix);

    // Records the device in the cycle's dedup set when accepted
    FilterVerdict admit(const Sighting& sighting);

    void clearCycle() { seen_this_cycle_.clear(); }
    size_t cycleSize() const { return seen_this_cycle_.size(); }
    bool seenThisCycle(const DeviceId& device_id) const {
        return seen_this_cycle_.count(device_id) > 0;
    }

    // Raw substring match, case-sensitive
    static bool containsToken(const std::string& haystack, const std::string& token);

private:
    std::string self_device_id_;
    std::string self_user_id_;
    bool prefix_gate_ = false;
    std::string prefix_;
    std::unordered_set<DeviceId> seen_this_cycle_;

    bool isSelf(const Sighting& sighting) const;
};

} // namespace discovery
} // namespace shyradar
