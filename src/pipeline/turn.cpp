#include "veilguard/pipeline/turn.hpp"

#include "veilguard/common/fs.hpp"
#include "veilguard/common/random.hpp"

#include <type_traits>

namespace veilguard::pipeline {

namespace {

void absorb_body(const TurnBody &body, NormalizedTurn &turn) {
  std::visit(
      [&turn](auto &&value) {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, std::string>) {
          turn.text = value;
          turn.messages = {ChatMessage{.role = "user", .content = value}};
        } else {
          turn.messages = value;
          for (auto it = value.rbegin(); it != value.rend(); ++it) {
            if (is_user_role(it->role)) {
              turn.text = it->content;
              break;
            }
          }
        }
      },
      body);
}

} // namespace

bool is_user_role(const std::string &role) {
  const std::string lower = common::to_lower(common::trim(role));
  return lower == "user" || lower == "human";
}

NormalizedTurn normalize_turn(const TurnInput &input) {
  NormalizedTurn turn;
  std::visit(
      [&turn](auto &&value) {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, TurnPayload>) {
          absorb_body(value.input, turn);
          if (value.session_id.has_value()) {
            turn.session_id = common::trim(*value.session_id);
          }
        } else {
          absorb_body(TurnBody(value), turn);
        }
      },
      input);

  if (turn.session_id.empty()) {
    turn.session_id = common::random_uuid_v4();
  }
  return turn;
}

} // namespace veilguard::pipeline
