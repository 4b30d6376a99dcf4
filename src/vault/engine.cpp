#include "veilguard/vault/engine.hpp"

#include "veilguard/common/fs.hpp"
#include "veilguard/observability/global.hpp"

#include <algorithm>
#include <map>
#include <stdexcept>
#include <utility>

namespace veilguard::vault {

namespace {

bool contains(const std::vector<std::string> &values, const std::string &value) {
  return std::find(values.begin(), values.end(), value) != values.end();
}

} // namespace

EngineOptions engine_options_from_config(const config::VaultConfig &config) {
  return EngineOptions{.ttl = std::chrono::seconds(config.ttl_seconds),
                       .supported_kinds = config.supported_entity_kinds,
                       .placeholder_attempts = config.placeholder_attempts};
}

AnonymizationEngine::AnonymizationEngine(std::shared_ptr<IEntityDetector> detector,
                                         std::shared_ptr<IPlaceholderGenerator> generator,
                                         std::shared_ptr<IMappingStore> store,
                                         EngineOptions options)
    : detector_(std::move(detector)), generator_(std::move(generator)), store_(std::move(store)),
      options_(std::move(options)) {
  if (options_.placeholder_attempts == 0) {
    options_.placeholder_attempts = 1;
  }
}

std::string AnonymizationEngine::unique_placeholder(const EntityMatch &match,
                                                    const std::string &text,
                                                    const std::vector<std::string> &issued,
                                                    const std::vector<std::string> &existing) {
  std::string candidate;
  for (std::uint32_t attempt = 0; attempt < options_.placeholder_attempts; ++attempt) {
    candidate = generator_->generate(match.kind, match.label);
    if (text.find(candidate) == std::string::npos && !contains(issued, candidate) &&
        !contains(existing, candidate)) {
      return candidate;
    }
  }
  // Out of attempts: the last candidate wins and overwrites any older mapping.
  return candidate;
}

common::Result<std::string> AnonymizationEngine::anonymize(const std::string &text,
                                                           const std::string &session_id) {
  using Redacted = common::Result<std::string>;
  if (session_id.empty()) {
    return Redacted::failure(common::ErrorKind::InvalidArgument, "session id must not be empty");
  }
  if (text.empty()) {
    return Redacted::success(text);
  }

  const auto started = std::chrono::steady_clock::now();

  auto detected = detector_->detect(text, options_.supported_kinds);
  if (!detected.ok()) {
    const auto kind = detected.kind() == common::ErrorKind::Timeout
                          ? common::ErrorKind::Timeout
                          : common::ErrorKind::DetectionFailure;
    observability::record_error("vault", "entity detection failed: " + detected.error());
    return Redacted::failure(kind, detected.error());
  }

  std::vector<EntityMatch> matches;
  for (auto &match : detected.value()) {
    if (match.start > match.end || match.end > text.size()) {
      const std::string message = "detector returned span [" + std::to_string(match.start) + ", " +
                                  std::to_string(match.end) + ") outside text of " +
                                  std::to_string(text.size()) + " bytes";
      observability::record_error("vault", message);
      return Redacted::failure(common::ErrorKind::DetectionFailure, message);
    }
    if (match.start == match.end || !contains(options_.supported_kinds, match.label)) {
      continue;
    }
    matches.push_back(std::move(match));
  }
  if (matches.empty()) {
    return Redacted::success(text);
  }

  // Back to front: a replacement never shifts the offsets of a lower-offset match.
  std::stable_sort(matches.begin(), matches.end(),
                   [](const EntityMatch &a, const EntityMatch &b) { return a.start > b.start; });

  const auto existing = store_->get_session_set(session_id);
  if (!existing.ok()) {
    observability::record_storage_error("get_session_set", existing.error());
    return Redacted::failure(common::ErrorKind::StorageUnavailable, existing.error());
  }

  std::string working = text;
  std::vector<std::string> issued;
  std::vector<std::string> kinds;
  std::map<std::pair<std::string, std::string>, std::string> reused;

  for (const auto &match : matches) {
    const std::string original = text.substr(match.start, match.end - match.start);

    std::string placeholder;
    if (const auto it = reused.find({match.label, original}); it != reused.end()) {
      placeholder = it->second;
    } else {
      try {
        placeholder = unique_placeholder(match, text, issued, existing.value());
      } catch (const std::runtime_error &ex) {
        observability::record_error("vault", std::string("placeholder generation failed: ") +
                                                 ex.what());
        return Redacted::failure(std::string("placeholder generation failed: ") + ex.what());
      }
      const auto status = store_->set(session_id, placeholder, original, options_.ttl);
      if (!status.ok()) {
        observability::record_storage_error("set", status.error());
        return Redacted::failure(common::ErrorKind::StorageUnavailable, status.error());
      }
      reused.emplace(std::make_pair(match.label, original), placeholder);
      issued.push_back(placeholder);
      kinds.push_back(match.label);
    }

    const std::size_t start = std::min(match.start, working.size());
    const std::size_t end = std::min(match.end, working.size());
    working.replace(start, end - start, placeholder);
  }

  const auto merged = store_->merge_session_set(session_id, issued, options_.ttl);
  if (!merged.ok()) {
    observability::record_storage_error("merge_session_set", merged.error());
    return Redacted::failure(common::ErrorKind::StorageUnavailable, merged.error());
  }

  observability::record_redaction(session_id, matches.size(), std::move(kinds));
  observability::record_metric(observability::AnonymizeLatencyMetric{
      .latency = std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - started)});
  return Redacted::success(std::move(working));
}

std::string AnonymizationEngine::deanonymize(const std::string &text,
                                             const std::string &session_id) {
  if (text.empty() || session_id.empty()) {
    return text;
  }

  const auto members = store_->get_session_set(session_id);
  if (!members.ok()) {
    observability::record_storage_error("get_session_set", members.error());
    return text;
  }

  // Longest first, so a placeholder that contains a shorter one is restored whole.
  auto placeholders = members.value();
  std::stable_sort(placeholders.begin(), placeholders.end(),
                   [](const std::string &a, const std::string &b) { return a.size() > b.size(); });

  std::string restored = text;
  std::size_t replaced = 0;
  std::size_t unresolved = 0;
  for (const auto &placeholder : placeholders) {
    if (restored.find(placeholder) == std::string::npos) {
      continue;
    }
    const auto value = store_->get(session_id, placeholder);
    if (!value.ok()) {
      observability::record_storage_error("get", value.error());
      ++unresolved;
      continue;
    }
    if (!value.value().has_value()) {
      ++unresolved;
      continue;
    }
    common::replace_all(restored, placeholder, *value.value());
    ++replaced;
  }

  if (replaced > 0 || unresolved > 0) {
    observability::record_restoration(session_id, replaced, unresolved);
  }
  return restored;
}

common::Status AnonymizationEngine::clear_storage() {
  auto status = store_->clear();
  if (!status.ok()) {
    observability::record_storage_error("clear", status.error());
  }
  return status;
}

} // namespace veilguard::vault
