#pragma once

namespace veilguard::cli {

int run_cli(int argc, char **argv);

} // namespace veilguard::cli
