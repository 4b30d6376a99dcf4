#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace veilguard::pipeline {

struct ChatMessage {
  std::string role;
  std::string content;
};

using TurnBody = std::variant<std::string, std::vector<ChatMessage>>;

/// Gateway-style payload: {input, session_id?}.
struct TurnPayload {
  TurnBody input;
  std::optional<std::string> session_id;
};

using TurnInput = std::variant<std::string, std::vector<ChatMessage>, TurnPayload>;

struct NormalizedTurn {
  /// Last user message; what the scanner sees.
  std::string text;
  std::string session_id;
  std::vector<ChatMessage> messages;
};

[[nodiscard]] bool is_user_role(const std::string &role);

/// Plain text becomes a single user message. A missing or empty session id
/// is replaced by a fresh random UUID.
[[nodiscard]] NormalizedTurn normalize_turn(const TurnInput &input);

} // namespace veilguard::pipeline
