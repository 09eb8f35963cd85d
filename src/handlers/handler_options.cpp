#include "handlers/handler_options.hpp"

#include <fmt/format.h>

#include <algorithm>

#include "my_error_codes.hpp"
#include "util/string_util.hpp"

namespace speakerctrl {

monad::MyVoidResult parse_handler_options(
    const std::vector<std::string> &tokens,
    const po::options_description &desc, po::variables_map &vm,
    std::vector<std::string> &args) {
  po::options_description all;
  all.add(desc);
  all.add_options()("args", po::value<std::vector<std::string>>(&args),
                    "positional arguments");
  po::positional_options_description pos;
  pos.add("args", -1);
  try {
    po::parsed_options parsed = po::command_line_parser(tokens)
                                    .options(all)
                                    .positional(pos)
                                    .allow_unregistered()
                                    .run();
    po::store(parsed, vm);
    po::notify(vm);
  } catch (const po::error &ex) {
    return monad::MyVoidResult::Err(
        monad::make_error(my_errors::GENERAL::INVALID_ARGUMENT, ex.what()));
  }
  return monad::MyVoidResult::Ok();
}

void TargetOptions::add_to(po::options_description &desc, bool with_proxy) {
  desc.add_options() //
      ("target-url", po::value<std::string>(&target_url),
       "URL of the local service the speaker is pointed at (default: "
       "base_url).");
  if (with_proxy) {
    desc.add_options() //
        ("proxy-url", po::value<std::string>(&proxy_url),
         "proxy prefix for --upstream subsystems (default: target URL).") //
        ("upstream", po::value<std::string>(&upstream),
         "comma separated subsystems kept on their current endpoint through "
         "the proxy: marge,stats,sw_update,bmx.");
  }
}

monad::MyResult<setup::ProxyOptions> TargetOptions::proxy_options() const {
  setup::ProxyOptions options;
  if (upstream.empty()) {
    return monad::MyResult<setup::ProxyOptions>::Ok(std::move(options));
  }
  std::string list = upstream;
  std::replace(list.begin(), list.end(), ',', ' ');
  for (const auto &name : stringutil::split_fields(list)) {
    if (name != "marge" && name != "stats" && name != "sw_update" &&
        name != "bmx") {
      return monad::MyResult<setup::ProxyOptions>::Err(monad::make_error(
          my_errors::GENERAL::INVALID_ARGUMENT,
          fmt::format("unknown subsystem '{}' in --upstream, expected "
                      "marge, stats, sw_update or bmx",
                      name)));
    }
    options[name] = "upstream";
  }
  return monad::MyResult<setup::ProxyOptions>::Ok(std::move(options));
}

} // namespace speakerctrl
