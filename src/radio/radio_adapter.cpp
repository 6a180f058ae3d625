#include "radio_adapter.hpp"

namespace shyradar {
namespace radio {

const char* powerStateToString(PowerState state) {
    switch (state) {
        case PowerState::PoweredOff:   return "PoweredOff";
        case PowerState::PoweredOn:    return "PoweredOn";
        case PowerState::Unauthorized: return "Unauthorized";
        case PowerState::Unsupported:  return "Unsupported";
        case PowerState::Unknown:
        default:                       return "Unknown";
    }
}

} // namespace radio
} // namespace shyradar
