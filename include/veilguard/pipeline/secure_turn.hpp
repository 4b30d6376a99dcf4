#pragma once

#include "veilguard/common/result.hpp"
#include "veilguard/pipeline/turn.hpp"
#include "veilguard/scanner/scanner.hpp"
#include "veilguard/vault/engine.hpp"

#include <functional>
#include <memory>

namespace veilguard::pipeline {

/// The downstream model: sees only redacted messages, returns its reply.
using ModelCall = std::function<common::Result<std::string>(const std::vector<ChatMessage> &)>;

enum class TurnStatus {
  Completed,
  Blocked,
};

struct TurnOutcome {
  TurnStatus status = TurnStatus::Completed;
  std::string session_id;
  /// Restored model reply; empty when blocked.
  std::string response;
  /// Scanner reason when blocked.
  std::optional<std::string> reason;
  /// Exactly what was handed to the model.
  std::vector<ChatMessage> sent_messages;
};

/// scan -> anonymize user messages -> model -> deanonymize.
class SecureTurn {
public:
  SecureTurn(std::shared_ptr<scanner::SecurityScanner> scanner,
             std::shared_ptr<vault::AnonymizationEngine> engine);

  /// Redaction and model failures propagate; a rejected scan is a Blocked outcome.
  [[nodiscard]] common::Result<TurnOutcome> run(const TurnInput &input,
                                                const ModelCall &model_call) const;

private:
  std::shared_ptr<scanner::SecurityScanner> scanner_;
  std::shared_ptr<vault::AnonymizationEngine> engine_;
};

} // namespace veilguard::pipeline
