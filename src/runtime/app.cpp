#include "veilguard/runtime/app.hpp"

#include "veilguard/config/config.hpp"
#include "veilguard/observability/factory.hpp"
#include "veilguard/observability/global.hpp"
#include "veilguard/vault/detector.hpp"
#include "veilguard/vault/sqlite_store.hpp"

namespace veilguard::runtime {

RuntimeContext::RuntimeContext(config::Config config, std::shared_ptr<net::HttpClient> http_client)
    : config_(std::move(config)), http_client_(std::move(http_client)) {}

common::Result<RuntimeContext> RuntimeContext::from_disk() {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    return common::Result<RuntimeContext>::failure(loaded.status());
  }
  const auto validated = config::validate_config(loaded.value());
  if (!validated.ok()) {
    return common::Result<RuntimeContext>::failure(validated.status());
  }
  return common::Result<RuntimeContext>::success(RuntimeContext(std::move(loaded.value())));
}

const config::Config &RuntimeContext::config() const { return config_; }

config::Config &RuntimeContext::mutable_config() { return config_; }

void RuntimeContext::install_observer() const {
  observability::set_global_observer(observability::create_observer(config_));
}

std::filesystem::path RuntimeContext::vault_db_path() const {
  return std::filesystem::path(config::expand_config_path(config_.vault.cache_directory)) /
         "vault.db";
}

common::Result<std::shared_ptr<vault::IMappingStore>> RuntimeContext::store() {
  using StoreResult = common::Result<std::shared_ptr<vault::IMappingStore>>;
  if (store_ != nullptr) {
    return StoreResult::success(store_);
  }

  auto store = std::make_shared<vault::SqliteMappingStore>(vault_db_path(),
                                                           config_.vault.size_limit_bytes);
  if (!store->health_check()) {
    return StoreResult::failure(common::ErrorKind::StorageUnavailable,
                                "cannot open vault database at " + store->path().string());
  }
  store_ = std::move(store);
  return StoreResult::success(store_);
}

common::Result<std::shared_ptr<vault::AnonymizationEngine>> RuntimeContext::create_engine() {
  using EngineResult = common::Result<std::shared_ptr<vault::AnonymizationEngine>>;

  auto store_result = store();
  if (!store_result.ok()) {
    return EngineResult::failure(store_result.status());
  }
  auto detector = vault::create_detector(config_, http_client_);
  if (!detector.ok()) {
    return EngineResult::failure(detector.status());
  }

  return EngineResult::success(std::make_shared<vault::AnonymizationEngine>(
      std::move(detector.value()), std::make_shared<vault::SyntheticPlaceholderGenerator>(),
      store_result.value(), vault::engine_options_from_config(config_.vault)));
}

common::Result<std::shared_ptr<scanner::SecurityScanner>> RuntimeContext::create_scanner() {
  return scanner::create_scanner(config_, http_client_);
}

common::Result<std::shared_ptr<pipeline::SecureTurn>> RuntimeContext::create_secure_turn() {
  using TurnResult = common::Result<std::shared_ptr<pipeline::SecureTurn>>;

  auto security = create_scanner();
  if (!security.ok()) {
    return TurnResult::failure(security.status());
  }
  auto engine = create_engine();
  if (!engine.ok()) {
    return TurnResult::failure(engine.status());
  }
  return TurnResult::success(
      std::make_shared<pipeline::SecureTurn>(security.value(), engine.value()));
}

} // namespace veilguard::runtime
