#include "veilguard/config/config.hpp"

#include "veilguard/common/fs.hpp"
#include "veilguard/common/toml.hpp"
#include "veilguard/vault/entity.hpp"

#include <cmath>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <regex>
#include <sstream>

namespace veilguard::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".veilguard";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("VEILGUARD_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

const char *env_value(const char *name) {
  const char *value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return nullptr;
  }
  return value;
}

/// Digits only; a sign, blank or trailing junk is rejected rather than wrapped.
std::optional<std::uint64_t> parse_env_u64(const std::string &raw) {
  const std::string text = common::trim(raw);
  if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
    return std::nullopt;
  }
  try {
    return std::stoull(text);
  } catch (const std::out_of_range &) {
    return std::nullopt;
  }
}

std::string string_array_to_toml(const std::vector<std::string> &values) {
  std::ostringstream out;
  out << "[";
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out << ", ";
    }
    // Literal strings keep regex backslashes readable.
    if (values[i].find('\'') == std::string::npos && values[i].find('\n') == std::string::npos) {
      out << "'" << values[i] << "'";
    } else {
      out << common::quote_toml_string(values[i]);
    }
  }
  out << "]";
  return out.str();
}

bool is_http_url(const std::string &value) {
  return common::starts_with(value, "http://") || common::starts_with(value, "https://");
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    std::filesystem::path candidate = *override_path;
    if (std::filesystem::is_directory(candidate, ec) || candidate.filename().empty()) {
      return common::ensure_dir(candidate);
    }

    auto parent = candidate.parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure("unable to resolve current directory");
      }
    }
    return common::ensure_dir(parent);
  }

  auto home = common::home_dir();
  if (!home.ok()) {
    return home;
  }
  return common::ensure_dir(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  return path.ok() && std::filesystem::exists(path.value());
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

std::string expand_config_path(const std::string &path) { return common::expand_path(path); }

void apply_env_overrides(Config &config) {
  if (const char *dir = env_value("VEILGUARD_CACHE_DIR"); dir != nullptr) {
    config.vault.cache_directory = expand_config_path(dir);
  }

  if (const char *ttl = env_value("VEILGUARD_TTL_SECONDS"); ttl != nullptr) {
    // Unparseable values keep the file setting.
    if (const auto parsed = parse_env_u64(ttl); parsed.has_value()) {
      config.vault.ttl_seconds = *parsed;
    }
  }

  if (const char *threshold = env_value("VEILGUARD_CLASSIFIER_THRESHOLD"); threshold != nullptr) {
    try {
      config.scanner.classifier_threshold = std::stod(threshold);
    } catch (const std::exception &) {
    }
  }

  if (const char *endpoint = env_value("VEILGUARD_DETECTOR_ENDPOINT"); endpoint != nullptr) {
    config.detector.endpoint = endpoint;
  }

  if (const char *endpoint = env_value("VEILGUARD_CLASSIFIER_ENDPOINT"); endpoint != nullptr) {
    config.scanner.classifier_endpoint = endpoint;
  }

  if (const char *key = env_value("VEILGUARD_CLASSIFIER_API_KEY"); key != nullptr) {
    config.scanner.classifier_api_key = key;
  }
  if (const char *level = env_value("VEILGUARD_LOG_LEVEL"); level != nullptr) {
    config.observability.log_level = level;
  }
}

common::Result<Config> parse_config(const std::string &toml_text) {
  const auto parsed = common::parse_toml(toml_text);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.status());
  }

  const auto &doc = parsed.value();
  Config config;

  config.vault.cache_directory =
      expand_config_value(doc.get_string("vault.cache_directory", config.vault.cache_directory));
  config.vault.ttl_seconds = doc.get_u64("vault.ttl_seconds", config.vault.ttl_seconds);
  config.vault.size_limit_bytes =
      doc.get_u64("vault.size_limit_bytes", config.vault.size_limit_bytes);
  config.vault.supported_entity_kinds =
      doc.get_string_array("vault.supported_entity_kinds", config.vault.supported_entity_kinds);
  config.vault.placeholder_attempts = static_cast<std::uint32_t>(
      doc.get_u64("vault.placeholder_attempts", config.vault.placeholder_attempts));

  config.detector.backend = doc.get_string("detector.backend", config.detector.backend);
  config.detector.endpoint =
      expand_config_value(doc.get_string("detector.endpoint", config.detector.endpoint));
  config.detector.language = doc.get_string("detector.language", config.detector.language);
  config.detector.min_score = doc.get_double("detector.min_score", config.detector.min_score);
  config.detector.timeout_ms = doc.get_u64("detector.timeout_ms", config.detector.timeout_ms);

  config.scanner.scan_patterns =
      doc.get_string_array("scanner.scan_patterns", config.scanner.scan_patterns);
  config.scanner.classifier_backend =
      doc.get_string("scanner.classifier_backend", config.scanner.classifier_backend);
  config.scanner.classifier_endpoint = expand_config_value(
      doc.get_string("scanner.classifier_endpoint", config.scanner.classifier_endpoint));
  config.scanner.classifier_api_key = expand_config_value(
      doc.get_string("scanner.classifier_api_key", config.scanner.classifier_api_key));
  config.scanner.hostile_labels =
      doc.get_string_array("scanner.hostile_labels", config.scanner.hostile_labels);
  config.scanner.classifier_threshold =
      doc.get_double("scanner.classifier_threshold", config.scanner.classifier_threshold);
  config.scanner.failure_policy =
      doc.get_string("scanner.failure_policy", config.scanner.failure_policy);
  config.scanner.classifier_timeout_ms =
      doc.get_u64("scanner.classifier_timeout_ms", config.scanner.classifier_timeout_ms);

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);
  config.observability.log_level =
      doc.get_string("observability.log_level", config.observability.log_level);

  if (!doc.mismatched_keys.empty()) {
    return common::Result<Config>::failure(common::ErrorKind::InvalidArgument,
                                           "config key '" + doc.mismatched_keys.front() +
                                               "' has a value of the wrong type");
  }
  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  if (!std::filesystem::exists(path)) {
    Config config;
    config.vault.cache_directory = expand_config_path(config.vault.cache_directory);
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  std::ifstream file(path);
  if (!file) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  auto parsed = parse_config(buffer.str());
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.kind(),
                                           path.string() + ": " + parsed.error());
  }

  apply_env_overrides(parsed.value());
  return parsed;
}

std::string render_config(const Config &config) {
  std::ostringstream out;
  out << "[vault]\n";
  out << "cache_directory = " << common::quote_toml_string(config.vault.cache_directory) << "\n";
  out << "ttl_seconds = " << config.vault.ttl_seconds << "\n";
  out << "size_limit_bytes = " << config.vault.size_limit_bytes << "\n";
  out << "supported_entity_kinds = " << string_array_to_toml(config.vault.supported_entity_kinds)
      << "\n";
  out << "placeholder_attempts = " << config.vault.placeholder_attempts << "\n";

  out << "\n[detector]\n";
  out << "backend = " << common::quote_toml_string(config.detector.backend) << "\n";
  out << "endpoint = " << common::quote_toml_string(config.detector.endpoint) << "\n";
  out << "language = " << common::quote_toml_string(config.detector.language) << "\n";
  out << "min_score = " << config.detector.min_score << "\n";
  out << "timeout_ms = " << config.detector.timeout_ms << "\n";

  out << "\n[scanner]\n";
  out << "scan_patterns = " << string_array_to_toml(config.scanner.scan_patterns) << "\n";
  out << "classifier_backend = " << common::quote_toml_string(config.scanner.classifier_backend)
      << "\n";
  out << "classifier_endpoint = "
      << common::quote_toml_string(config.scanner.classifier_endpoint) << "\n";
  if (!config.scanner.classifier_api_key.empty()) {
    out << "classifier_api_key = \"***\"\n";
  }
  out << "hostile_labels = " << string_array_to_toml(config.scanner.hostile_labels) << "\n";
  out << "classifier_threshold = " << config.scanner.classifier_threshold << "\n";
  out << "failure_policy = " << common::quote_toml_string(config.scanner.failure_policy) << "\n";
  out << "classifier_timeout_ms = " << config.scanner.classifier_timeout_ms << "\n";

  out << "\n[observability]\n";
  out << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";
  out << "log_level = " << common::quote_toml_string(config.observability.log_level) << "\n";
  return out.str();
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using Warnings = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;

  if (common::trim(config.vault.cache_directory).empty()) {
    return Warnings::failure(common::ErrorKind::InvalidArgument,
                             "vault.cache_directory must not be empty");
  }
  if (config.vault.ttl_seconds == 0) {
    return Warnings::failure(common::ErrorKind::InvalidArgument, "vault.ttl_seconds must be > 0");
  }
  if (config.vault.ttl_seconds > MAX_TTL_SECONDS) {
    return Warnings::failure(common::ErrorKind::InvalidArgument,
                             "vault.ttl_seconds must be at most " +
                                 std::to_string(MAX_TTL_SECONDS));
  }
  if (config.vault.size_limit_bytes == 0) {
    return Warnings::failure(common::ErrorKind::InvalidArgument,
                             "vault.size_limit_bytes must be > 0");
  }
  if (config.vault.supported_entity_kinds.empty()) {
    warnings.push_back("vault.supported_entity_kinds is empty; nothing will be redacted");
  }
  for (const auto &kind : config.vault.supported_entity_kinds) {
    if (!vault::parse_entity_kind(kind).has_value()) {
      return Warnings::failure(common::ErrorKind::InvalidArgument,
                               "Unknown entity kind in vault.supported_entity_kinds: " + kind);
    }
  }
  if (config.vault.placeholder_attempts == 0) {
    return Warnings::failure(common::ErrorKind::InvalidArgument,
                             "vault.placeholder_attempts must be > 0");
  }

  const std::string detector_backend = common::to_lower(config.detector.backend);
  if (detector_backend != "local" && detector_backend != "presidio") {
    return Warnings::failure(common::ErrorKind::InvalidArgument,
                             "Invalid detector.backend: " + config.detector.backend);
  }
  if (detector_backend == "presidio" && !is_http_url(config.detector.endpoint)) {
    return Warnings::failure(common::ErrorKind::InvalidArgument,
                             "detector.endpoint must be an http(s) URL for the presidio backend");
  }
  if (config.detector.min_score < 0.0 || config.detector.min_score > 1.0) {
    return Warnings::failure(common::ErrorKind::InvalidArgument,
                             "detector.min_score must be between 0.0 and 1.0");
  }
  if (config.detector.timeout_ms == 0) {
    warnings.push_back("detector.timeout_ms is 0; entity detection runs without a deadline");
  }

  for (const auto &pattern : config.scanner.scan_patterns) {
    try {
      std::regex compiled(pattern, std::regex::icase);
      (void)compiled;
    } catch (const std::regex_error &ex) {
      return Warnings::failure(common::ErrorKind::InvalidArgument,
                               "Invalid scanner.scan_patterns entry '" + pattern +
                                   "': " + ex.what());
    }
  }
  if (config.scanner.scan_patterns.empty()) {
    warnings.push_back("scanner.scan_patterns is empty; only the classifier stage will run");
  }

  const std::string classifier = common::to_lower(config.scanner.classifier_backend);
  if (classifier != "lexicon" && classifier != "http" && classifier != "none") {
    return Warnings::failure(common::ErrorKind::InvalidArgument,
                             "Invalid scanner.classifier_backend: " +
                                 config.scanner.classifier_backend);
  }
  if (classifier == "http" && !is_http_url(config.scanner.classifier_endpoint)) {
    return Warnings::failure(common::ErrorKind::InvalidArgument,
                             "scanner.classifier_endpoint must be an http(s) URL for the http "
                             "classifier backend");
  }
  if (std::isnan(config.scanner.classifier_threshold) ||
      config.scanner.classifier_threshold < 0.0 || config.scanner.classifier_threshold > 1.0) {
    return Warnings::failure(common::ErrorKind::InvalidArgument,
                             "scanner.classifier_threshold must be between 0.0 and 1.0");
  }
  if (config.scanner.classifier_threshold < 0.5) {
    warnings.push_back("scanner.classifier_threshold below 0.5 will reject most hostile-leaning "
                       "text");
  }
  if (config.scanner.hostile_labels.empty() && classifier != "none") {
    warnings.push_back("scanner.hostile_labels is empty; the classifier stage never rejects");
  }

  const std::string policy = common::to_lower(config.scanner.failure_policy);
  if (policy != "open" && policy != "closed") {
    return Warnings::failure(common::ErrorKind::InvalidArgument,
                             "Invalid scanner.failure_policy: " + config.scanner.failure_policy);
  }
  if (policy == "open" && classifier != "none") {
    warnings.push_back("scanner.failure_policy is 'open': classifier faults let text through");
  }

  std::stringstream backends(common::to_lower(config.observability.backend));
  std::string backend;
  while (std::getline(backends, backend, ',')) {
    backend = common::trim(backend);
    if (!backend.empty() && backend != "log" && backend != "noop" && backend != "none") {
      return Warnings::failure(common::ErrorKind::InvalidArgument,
                               "Invalid observability.backend: " + backend);
    }
  }
  const std::string level = common::to_lower(common::trim(config.observability.log_level));
  if (level != "debug" && level != "info" && level != "warn" && level != "error") {
    return Warnings::failure(common::ErrorKind::InvalidArgument,
                             "Invalid observability.log_level: " + config.observability.log_level);
  }

  return Warnings::success(std::move(warnings));
}

} // namespace veilguard::config
