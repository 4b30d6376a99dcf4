#include "veilguard/vault/detector_presidio.hpp"

#include "veilguard/common/fs.hpp"
#include "veilguard/common/json_util.hpp"

#include <optional>
#include <sstream>

namespace veilguard::vault {

namespace {

using Matches = common::Result<std::vector<EntityMatch>>;

/// offsets[i] is the byte offset of code point i; the last entry is text.size().
std::vector<std::size_t> codepoint_offsets(const std::string &text) {
  std::vector<std::size_t> offsets;
  offsets.reserve(text.size() + 1);
  for (std::size_t i = 0; i < text.size(); ++i) {
    const auto byte = static_cast<unsigned char>(text[i]);
    if ((byte & 0xC0U) != 0x80U) {
      offsets.push_back(i);
    }
  }
  offsets.push_back(text.size());
  return offsets;
}

} // namespace

PresidioEntityDetector::PresidioEntityDetector(std::string endpoint, std::string language,
                                               const double min_score,
                                               const std::uint64_t timeout_ms,
                                               std::shared_ptr<net::HttpClient> http_client)
    : endpoint_(std::move(endpoint)), language_(std::move(language)), min_score_(min_score),
      timeout_ms_(timeout_ms), http_client_(std::move(http_client)) {}

common::Result<std::vector<EntityMatch>>
PresidioEntityDetector::detect(const std::string &text, const std::vector<std::string> &labels) {
  if (text.empty()) {
    return Matches::success({});
  }

  std::ostringstream body;
  body << "{";
  body << "\"text\":\"" << common::json_escape(text) << "\",";
  body << "\"language\":\"" << common::json_escape(language_) << "\",";
  body << "\"entities\":" << common::json_string_array(labels);
  body << "}";

  const auto response = http_client_->post_json(endpoint_, {}, body.str(), timeout_ms_);
  if (response.timeout) {
    return Matches::failure(common::ErrorKind::Timeout, "presidio: request timed out");
  }
  if (!response.success()) {
    return Matches::failure(common::ErrorKind::DetectionFailure,
                            "presidio: " + net::describe_failure(response));
  }
  return parse_presidio_response(text, response.body, min_score_);
}

common::Result<std::vector<EntityMatch>>
parse_presidio_response(const std::string &text, const std::string &body, const double min_score) {
  const std::string trimmed = common::trim(body);
  if (trimmed.size() < 2 || trimmed.front() != '[' || trimmed.back() != ']') {
    return Matches::failure(common::ErrorKind::DetectionFailure,
                            "presidio: response is not a JSON array");
  }

  const auto offsets = codepoint_offsets(text);
  const std::size_t codepoints = offsets.size() - 1;

  std::vector<EntityMatch> matches;
  for (const auto &object : common::json_array_objects(trimmed)) {
    const std::string label = common::json_get_string(object, "entity_type");
    const auto start = common::json_get_index(object, "start");
    const auto end = common::json_get_index(object, "end");
    if (label.empty() || !start.has_value() || !end.has_value()) {
      return Matches::failure(common::ErrorKind::DetectionFailure,
                              "presidio: malformed result entry");
    }
    if (*start > *end || *end > codepoints) {
      return Matches::failure(common::ErrorKind::DetectionFailure,
                              "presidio: span [" + std::to_string(*start) + ", " +
                                  std::to_string(*end) + ") outside text");
    }

    double score = 1.0;
    if (object.find("\"score\"") != std::string::npos) {
      const auto parsed = common::json_get_double(object, "score");
      if (!parsed.has_value()) {
        return Matches::failure(common::ErrorKind::DetectionFailure,
                                "presidio: invalid score for " + label);
      }
      score = *parsed;
    }
    if (score < min_score) {
      continue;
    }

    matches.push_back(EntityMatch{.kind = parse_entity_kind(label).value_or(EntityKind::Other),
                                  .label = label,
                                  .start = offsets[*start],
                                  .end = offsets[*end],
                                  .score = score});
  }
  return Matches::success(std::move(matches));
}

} // namespace veilguard::vault
