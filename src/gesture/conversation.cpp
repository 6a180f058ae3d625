#include "conversation.hpp"

namespace shyradar {
namespace gesture {

std::optional<std::string> normalizeFirstMessage(const std::optional<std::string>& message) {
    if (!message) {
        return std::nullopt;
    }
    std::string trimmed = trimCopy(*message);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    return trimmed;
}

std::optional<ConversationRequest> makeConversationRequest(const UserId& user_id,
                                                           const std::string& composed_text) {
    if (trimCopy(user_id).empty()) {
        return std::nullopt;
    }
    std::optional<std::string> message = normalizeFirstMessage(composed_text);
    if (!message) {
        return std::nullopt;
    }
    return ConversationRequest{user_id, std::move(message)};
}

} // namespace gesture
} // namespace shyradar
