#pragma once

#include "veilguard/common/result.hpp"
#include "veilguard/config/schema.hpp"
#include "veilguard/net/http_client.hpp"
#include "veilguard/pipeline/secure_turn.hpp"
#include "veilguard/scanner/scanner.hpp"
#include "veilguard/vault/engine.hpp"
#include "veilguard/vault/mapping_store.hpp"

#include <filesystem>
#include <memory>

namespace veilguard::runtime {

/// Wires the vault and scanner from a Config. Everything is constructed
/// explicitly; the logging observer is the only process-wide state.
class RuntimeContext {
public:
  explicit RuntimeContext(config::Config config,
                          std::shared_ptr<net::HttpClient> http_client = nullptr);

  /// load_config + validate_config; hard validation errors fail.
  [[nodiscard]] static common::Result<RuntimeContext> from_disk();

  [[nodiscard]] const config::Config &config() const;
  [[nodiscard]] config::Config &mutable_config();

  void install_observer() const;

  [[nodiscard]] std::filesystem::path vault_db_path() const;

  /// The store is opened once and shared by everything this context builds.
  [[nodiscard]] common::Result<std::shared_ptr<vault::IMappingStore>> store();
  [[nodiscard]] common::Result<std::shared_ptr<vault::AnonymizationEngine>> create_engine();
  [[nodiscard]] common::Result<std::shared_ptr<scanner::SecurityScanner>> create_scanner();
  [[nodiscard]] common::Result<std::shared_ptr<pipeline::SecureTurn>> create_secure_turn();

private:
  config::Config config_;
  std::shared_ptr<net::HttpClient> http_client_;
  std::shared_ptr<vault::IMappingStore> store_;
};

} // namespace veilguard::runtime
