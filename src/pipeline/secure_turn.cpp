#include "veilguard/pipeline/secure_turn.hpp"

#include "veilguard/observability/global.hpp"

#include <stdexcept>

namespace veilguard::pipeline {

SecureTurn::SecureTurn(std::shared_ptr<scanner::SecurityScanner> scanner,
                       std::shared_ptr<vault::AnonymizationEngine> engine)
    : scanner_(std::move(scanner)), engine_(std::move(engine)) {}

common::Result<TurnOutcome> SecureTurn::run(const TurnInput &input,
                                            const ModelCall &model_call) const {
  using Outcome = common::Result<TurnOutcome>;
  NormalizedTurn turn;
  try {
    turn = normalize_turn(input);
  } catch (const std::runtime_error &ex) {
    observability::record_error("pipeline", std::string("cannot start turn: ") + ex.what());
    return Outcome::failure(std::string("cannot start turn: ") + ex.what());
  }

  TurnOutcome outcome;
  outcome.session_id = turn.session_id;

  if (!turn.text.empty()) {
    const auto verdict = scanner_->scan(turn.text);
    if (!verdict.safe) {
      outcome.status = TurnStatus::Blocked;
      outcome.reason = verdict.reason;
      return Outcome::success(std::move(outcome));
    }
  }

  outcome.sent_messages.reserve(turn.messages.size());
  for (const auto &message : turn.messages) {
    if (!is_user_role(message.role)) {
      outcome.sent_messages.push_back(message);
      continue;
    }
    auto redacted = engine_->anonymize(message.content, turn.session_id);
    if (!redacted.ok()) {
      return Outcome::failure(redacted.status());
    }
    outcome.sent_messages.push_back(
        ChatMessage{.role = message.role, .content = std::move(redacted.value())});
  }

  if (!model_call) {
    return Outcome::failure(common::ErrorKind::InvalidArgument, "no model call supplied");
  }
  auto reply = model_call(outcome.sent_messages);
  if (!reply.ok()) {
    observability::record_error("pipeline", "model call failed: " + reply.error());
    return Outcome::failure(reply.status());
  }

  outcome.response = engine_->deanonymize(reply.value(), turn.session_id);
  return Outcome::success(std::move(outcome));
}

} // namespace veilguard::pipeline
