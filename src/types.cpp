#include "shyradar/types.hpp"
#include <algorithm>
#include <cctype>

namespace shyradar {

namespace {

bool startsWith(const std::string& str, const char* prefix) {
    size_t len = std::char_traits<char>::length(prefix);
    return str.size() >= len && str.compare(0, len, prefix) == 0;
}

// Host part of an absolute URL must be non-empty and free of whitespace
bool hasValidHost(const std::string& url, size_t scheme_len) {
    size_t end = url.find_first_of("/?#", scheme_len);
    std::string host = url.substr(scheme_len, end == std::string::npos ? std::string::npos
                                                                     : end - scheme_len);
    if (host.empty()) return false;
    return std::none_of(host.begin(), host.end(),
                        [](unsigned char c) { return std::isspace(c); });
}

} // namespace

char DiscoveredUser::displayInitial() const {
    const std::string name = display_name.empty() ? std::string("User") : display_name;
    return static_cast<char>(std::toupper(static_cast<unsigned char>(name[0])));
}

bool DiscoveredUser::hasDisplayablePhoto() const {
    if (!photo_ref || photo_ref->empty()) return false;

    const std::string& ref = *photo_ref;
    if (startsWith(ref, "data:image/")) return true;
    if (startsWith(ref, "https://")) return hasValidHost(ref, 8);
    if (startsWith(ref, "http://")) return hasValidHost(ref, 7);
    return false;
}

std::optional<LayoutPolicyType> stringToLayoutPolicy(const std::string& str) {
    std::string lower = toLowerCopy(trimCopy(str));

    if (lower == "distance" || lower == "continuous")
        return LayoutPolicyType::DISTANCE;
    if (lower == "slots" || lower == "slot" || lower == "fixed" || lower == "fixed_slot")
        return LayoutPolicyType::FIXED_SLOT;

    return std::nullopt;
}

std::string trimCopy(const std::string& str) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    auto begin = std::find_if(str.begin(), str.end(), not_space);
    auto end = std::find_if(str.rbegin(), str.rend(), not_space).base();
    if (begin >= end) return {};
    return std::string(begin, end);
}

std::string toLowerCopy(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

} // namespace shyradar
