#pragma once

#include "shyradar/types.hpp"
#include <functional>
#include <optional>
#include <string>

namespace shyradar {
namespace gesture {

// Handed to the conversation collaborator after a successful selection
struct ConversationRequest {
    UserId user_id;
    std::optional<std::string> first_message;
};

using ConversationHandler = std::function<void(const ConversationRequest&)>;

// Trimmed message, or nullopt when blank
std::optional<std::string> normalizeFirstMessage(const std::optional<std::string>& message);

// Profile-sheet composer: a chat started from the profile view needs a
// non-blank message. Returns nullopt when the user id or the message is blank.
std::optional<ConversationRequest> makeConversationRequest(const UserId& user_id,
                                                           const std::string& composed_text);

} // namespace gesture
} // namespace shyradar
