#include "veilguard/cli/commands.hpp"

#include "veilguard/common/fs.hpp"
#include "veilguard/config/config.hpp"
#include "veilguard/runtime/app.hpp"

#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace veilguard::cli {

namespace {

constexpr int EXIT_UNSAFE = 2;

std::string version_string() {
#ifdef VEILGUARD_VERSION
  return std::string("veilguard ") + VEILGUARD_VERSION;
#else
  return "veilguard 0.1.0";
#endif
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::string join_tokens(const std::vector<std::string> &args) {
  std::ostringstream out;
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (i > 0) {
      out << ' ';
    }
    out << args[i];
  }
  return out.str();
}

std::string read_stdin_all() {
  std::ostringstream out;
  out << std::cin.rdbuf();
  return out.str();
}

/// Positional text, or stdin when it is absent or "-".
std::string input_text(const std::vector<std::string> &args) {
  if (args.empty() || (args.size() == 1 && args[0] == "-")) {
    return read_stdin_all();
  }
  return join_tokens(args);
}

common::Result<runtime::RuntimeContext> load_context() {
  auto context = runtime::RuntimeContext::from_disk();
  if (context.ok()) {
    context.value().install_observer();
  }
  return context;
}

void print_help() {
  std::cout << "veilguard - reversible PII vault and prompt security scanner\n\n";
  std::cout << "Usage: veilguard [--config PATH] <command> [options]\n\n";
  std::cout << "Commands:\n";
  std::cout << "  anonymize --session ID [TEXT|-]    Redact PII, print the redacted text\n";
  std::cout << "  deanonymize --session ID [TEXT|-]  Restore placeholders issued to a session\n";
  std::cout << "  scan [TEXT|-]                      Screen text; exit 2 when unsafe\n";
  std::cout << "  chat [--session ID] [TEXT|-]       Run one turn against an echo model\n";
  std::cout << "  clear [--session ID]               Drop every mapping, or one session's\n";
  std::cout << "  purge                              Remove expired mappings\n";
  std::cout << "  stats                              Show vault usage\n";
  std::cout << "  config show|validate|path          Inspect configuration\n";
  std::cout << "  version                            Print version\n";
  std::cout << "  help                               Show this help\n";
}

int run_anonymize(std::vector<std::string> args) {
  std::string session;
  if (!take_option(args, "--session", "-s", session) || common::trim(session).empty()) {
    std::cerr << "anonymize requires --session ID\n";
    return 1;
  }
  auto context = load_context();
  if (!context.ok()) {
    std::cerr << context.error() << "\n";
    return 1;
  }
  auto engine = context.value().create_engine();
  if (!engine.ok()) {
    std::cerr << engine.error() << "\n";
    return 1;
  }

  const auto redacted = engine.value()->anonymize(input_text(args), session);
  if (!redacted.ok()) {
    std::cerr << "anonymize failed [" << common::error_kind_name(redacted.kind())
              << "]: " << redacted.error() << "\n";
    return 1;
  }
  std::cout << redacted.value() << "\n";
  return 0;
}

int run_deanonymize(std::vector<std::string> args) {
  std::string session;
  if (!take_option(args, "--session", "-s", session) || common::trim(session).empty()) {
    std::cerr << "deanonymize requires --session ID\n";
    return 1;
  }
  auto context = load_context();
  if (!context.ok()) {
    std::cerr << context.error() << "\n";
    return 1;
  }
  auto engine = context.value().create_engine();
  if (!engine.ok()) {
    std::cerr << engine.error() << "\n";
    return 1;
  }

  std::cout << engine.value()->deanonymize(input_text(args), session) << "\n";
  return 0;
}

int run_scan(const std::vector<std::string> &args) {
  auto context = load_context();
  if (!context.ok()) {
    std::cerr << context.error() << "\n";
    return 1;
  }
  auto security = context.value().create_scanner();
  if (!security.ok()) {
    std::cerr << security.error() << "\n";
    return 1;
  }

  const auto verdict = security.value()->scan(input_text(args));
  if (verdict.safe) {
    std::cout << "safe\n";
    return 0;
  }
  std::cout << "unsafe: " << verdict.reason.value_or("rejected") << "\n";
  return EXIT_UNSAFE;
}

int run_chat(std::vector<std::string> args) {
  std::optional<std::string> session;
  if (std::string value; take_option(args, "--session", "-s", value)) {
    session = value;
  }
  auto context = load_context();
  if (!context.ok()) {
    std::cerr << context.error() << "\n";
    return 1;
  }
  auto turn = context.value().create_secure_turn();
  if (!turn.ok()) {
    std::cerr << turn.error() << "\n";
    return 1;
  }

  const pipeline::ModelCall echo = [](const std::vector<pipeline::ChatMessage> &messages) {
    const std::string last = messages.empty() ? "" : messages.back().content;
    return common::Result<std::string>::success("Echoing your sanitized prompt: " + last);
  };
  const auto outcome = turn.value()->run(
      pipeline::TurnPayload{.input = input_text(args), .session_id = session}, echo);
  if (!outcome.ok()) {
    std::cerr << "turn failed [" << common::error_kind_name(outcome.kind())
              << "]: " << outcome.error() << "\n";
    return 1;
  }
  if (outcome.value().status == pipeline::TurnStatus::Blocked) {
    std::cout << "blocked: " << outcome.value().reason.value_or("rejected") << "\n";
    return EXIT_UNSAFE;
  }
  std::cout << "session: " << outcome.value().session_id << "\n";
  std::cout << "model saw: " << outcome.value().sent_messages.back().content << "\n";
  std::cout << outcome.value().response << "\n";
  return 0;
}

int run_clear(std::vector<std::string> args) {
  std::string session;
  const bool scoped = take_option(args, "--session", "-s", session);
  auto context = load_context();
  if (!context.ok()) {
    std::cerr << context.error() << "\n";
    return 1;
  }
  auto store = context.value().store();
  if (!store.ok()) {
    std::cerr << store.error() << "\n";
    return 1;
  }

  const auto status = scoped ? store.value()->clear_session(session) : store.value()->clear();
  if (!status.ok()) {
    std::cerr << "clear failed: " << status.error() << "\n";
    return 1;
  }
  std::cout << (scoped ? "cleared session " + session : std::string("cleared vault")) << "\n";
  return 0;
}

int run_purge() {
  auto context = load_context();
  if (!context.ok()) {
    std::cerr << context.error() << "\n";
    return 1;
  }
  auto store = context.value().store();
  if (!store.ok()) {
    std::cerr << store.error() << "\n";
    return 1;
  }
  const auto purged = store.value()->purge_expired();
  if (!purged.ok()) {
    std::cerr << "purge failed: " << purged.error() << "\n";
    return 1;
  }
  std::cout << "purged " << purged.value() << " expired mappings\n";
  return 0;
}

int run_stats() {
  auto context = load_context();
  if (!context.ok()) {
    std::cerr << context.error() << "\n";
    return 1;
  }
  auto store = context.value().store();
  if (!store.ok()) {
    std::cerr << store.error() << "\n";
    return 1;
  }
  const auto stats = store.value()->stats();
  std::cout << "database: " << context.value().vault_db_path().string() << "\n";
  std::cout << "records: " << stats.records << "\n";
  std::cout << "live sessions: " << stats.live_sessions << "\n";
  std::cout << "bytes: " << stats.bytes << " / " << stats.size_limit_bytes << "\n";
  std::cout << "evictions (this process): " << stats.evictions << "\n";
  return 0;
}

int run_config(const std::vector<std::string> &args) {
  const std::string action = args.empty() ? "show" : args[0];
  if (action == "path") {
    auto path = config::config_path();
    if (!path.ok()) {
      std::cerr << path.error() << "\n";
      return 1;
    }
    std::cout << path.value().string() << "\n";
    return 0;
  }

  auto loaded = config::load_config();
  if (!loaded.ok()) {
    std::cerr << loaded.error() << "\n";
    return 1;
  }
  if (action == "show") {
    std::cout << config::render_config(loaded.value());
    return 0;
  }
  if (action == "validate") {
    const auto validated = config::validate_config(loaded.value());
    if (!validated.ok()) {
      std::cerr << "invalid: " << validated.error() << "\n";
      return 1;
    }
    for (const auto &warning : validated.value()) {
      std::cout << "warning: " << warning << "\n";
    }
    std::cout << "config ok\n";
    return 0;
  }

  std::cerr << "unknown config action: " << action << "\n";
  return 1;
}

} // namespace

int run_cli(int argc, char **argv) {
  if (argc <= 1) {
    print_help();
    return 0;
  }

  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }
  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "anonymize") {
    return run_anonymize(std::move(args));
  }
  if (subcommand == "deanonymize") {
    return run_deanonymize(std::move(args));
  }
  if (subcommand == "scan") {
    return run_scan(args);
  }
  if (subcommand == "chat") {
    return run_chat(std::move(args));
  }
  if (subcommand == "clear") {
    return run_clear(std::move(args));
  }
  if (subcommand == "purge") {
    return run_purge();
  }
  if (subcommand == "stats") {
    return run_stats();
  }
  if (subcommand == "config") {
    return run_config(args);
  }

  std::cerr << "unknown command: " << subcommand << "\n\n";
  print_help();
  return 1;
}

} // namespace veilguard::cli
