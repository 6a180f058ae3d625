#include "sighting_filter.hpp"

namespace shyradar {
namespace discovery {

const char* filterVerdictToString(FilterVerdict verdict) {
    switch (verdict) {
        case FilterVerdict::Accepted:          return "accepted";
        case FilterVerdict::RejectedPrefix:    return "rejected-prefix";
        case FilterVerdict::RejectedSelf:      return "rejected-self";
        case FilterVerdict::RejectedDuplicate: return "rejected-duplicate";
        default:                               return "unknown";
    }
}

void SightingFilter::setSelfTokens(const std::string& device_id, const std::string& user_id) {
    self_device_id_ = device_id;
    self_user_id_ = user_id;
}

void SightingFilter::setPrefixGate(bool enabled, const std::string& prefix) {
    prefix_gate_ = enabled;
    prefix_ = prefix;
}

bool SightingFilter::containsToken(const std::string& haystack, const std::string& token) {
    if (token.empty() || haystack.empty()) {
        return false;
    }
    return haystack.find(token) != std::string::npos;
}

bool SightingFilter::isSelf(const Sighting& sighting) const {
    for (const std::string* token : {&self_device_id_, &self_user_id_}) {
        if (containsToken(sighting.device_id, *token) ||
            containsToken(sighting.advertised_name, *token)) {
            return true;
        }
    }
    return false;
}

FilterVerdict SightingFilter::admit(const Sighting& sighting) {
    if (prefix_gate_ && !prefix_.empty() &&
        sighting.advertised_name.compare(0, prefix_.size(), prefix_) != 0) {
        return FilterVerdict::RejectedPrefix;
    }

    if (isSelf(sighting)) {
        return FilterVerdict::RejectedSelf;
    }

    if (!seen_this_cycle_.insert(sighting.device_id).second) {
        return FilterVerdict::RejectedDuplicate;
    }

    return FilterVerdict::Accepted;
}

} // namespace discovery
} // namespace shyradar
