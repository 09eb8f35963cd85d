#pragma once

#include <boost/program_options.hpp>
#include <string>
#include <vector>

#include "result_monad.hpp"
#include "setup/migration_types.hpp"

namespace po = boost::program_options;

namespace speakerctrl {

// Subcommand options parsed out of CliCtx::unrecognized. `args` receives the
// positional tokens, subcommand first ("migrate", "<addr>").
monad::MyVoidResult parse_handler_options(
    const std::vector<std::string> &tokens,
    const po::options_description &desc, po::variables_map &vm,
    std::vector<std::string> &args);

// --target-url / --proxy-url / --upstream, shared by the migration commands.
struct TargetOptions {
  std::string target_url;
  std::string proxy_url;
  std::string upstream; // "marge,stats"

  void add_to(po::options_description &desc, bool with_proxy);

  // Subsystems named in --upstream mapped to "upstream". Err for an unknown
  // subsystem name.
  monad::MyResult<setup::ProxyOptions> proxy_options() const;
};

} // namespace speakerctrl
