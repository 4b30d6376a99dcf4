#include "bench_common.hpp"

#include "veilguard/config/config.hpp"

void run_config_benchmark() {
  const std::string text = "[vault]\nttl_seconds = 600\nsize_limit_bytes = 1048576\n\n"
                           "[scanner]\nfailure_policy = \"closed\"\n"
                           "patterns = [\"ignore\\\\s+previous\", \"dan\\\\s+mode\"]\n";

  veilguard::bench::run_bench("config_parse", 2000,
                              [&] { (void)veilguard::config::parse_config(text); });

  veilguard::bench::run_bench("config_validate", 2000, [] {
    veilguard::config::Config config;
    (void)veilguard::config::validate_config(config);
  });
}
