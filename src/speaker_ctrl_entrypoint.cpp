#include <boost/json.hpp>
#include <boost/program_options.hpp>

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>

#include "speaker_ctrl_entry.hpp"
#include "speakerctrl_common.hpp"
#include "util/my_logging.hpp"

#ifndef SPEAKERCTRL_VERSION
#define SPEAKERCTRL_VERSION "0.0.0"
#endif

namespace po = boost::program_options;

namespace {

namespace js = boost::json;

struct DefaultPaths {
  fs::path config_dir;
  fs::path runtime_dir;
};

fs::path get_env_path(const char *name) {
  if (const char *value = std::getenv(name); value && *value) {
    return fs::path(value);
  }
  return {};
}

// Default configuration and runtime directories.
//
// Environment variable precedence (highest to lowest):
// 1. SPEAKERCTRL_CONFIG_DIR + SPEAKERCTRL_RUNTIME_DIR
// 2. SPEAKERCTRL_BASE_DIR (appends /config and /runtime)
// 3. /etc/speakerctrl and /var/lib/speakerctrl, each individually
//    overridable by the variables of 1.
DefaultPaths resolve_default_paths() {
  fs::path config_override = get_env_path("SPEAKERCTRL_CONFIG_DIR");
  fs::path runtime_override = get_env_path("SPEAKERCTRL_RUNTIME_DIR");

  if (!config_override.empty() && !runtime_override.empty()) {
    return {config_override, runtime_override};
  }

  fs::path base_override = get_env_path("SPEAKERCTRL_BASE_DIR");
  if (!base_override.empty()) {
    fs::path config_dir =
        config_override.empty() ? (base_override / "config") : config_override;
    fs::path runtime_dir = runtime_override.empty()
                               ? (base_override / "runtime")
                               : runtime_override;
    return {config_dir, runtime_dir};
  }

  fs::path config_dir =
      config_override.empty() ? fs::path("/etc/speakerctrl") : config_override;
  fs::path runtime_dir = runtime_override.empty()
                             ? fs::path("/var/lib/speakerctrl")
                             : runtime_override;
  return {config_dir, runtime_dir};
}

void ensure_directory_exists(const fs::path &dir) {
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec && !fs::exists(dir)) {
    throw std::runtime_error(std::string("Failed to create directory '") +
                             dir.string() + "': " + ec.message());
  }
}

void write_json_if_missing(const fs::path &file_path,
                           const js::value &content) {
  if (fs::exists(file_path)) {
    return;
  }
  ensure_directory_exists(file_path.parent_path());
  std::ofstream ofs(file_path);
  if (!ofs) {
    throw std::runtime_error("Unable to write default config file: " +
                             file_path.string());
  }
  ofs << js::serialize(content) << std::endl;
}

bool bootstrap_default_config_dir(const fs::path &config_dir,
                                  const fs::path &runtime_dir) {
  std::error_code ec;
  fs::create_directories(config_dir, ec);
  if (ec && !fs::exists(config_dir)) {
    std::cerr << "Warning: unable to create default config directory '"
              << config_dir << "': " << ec.message() << std::endl;
    return false;
  }

  try {
    js::object application{
        {"base_url", "http://localhost:8000"},
        {"https_port", 8443},
        {"runtime_dir", runtime_dir.string()},
        {"ssh", js::object{{"user", "root"},
                           {"port", 22},
                           {"binary", "ssh"},
                           {"connect_timeout_seconds", 10},
                           {"command_timeout_seconds", 60},
                           {"reuse_connection", false},
                           {"extra_options", js::array{}}}}};
    write_json_if_missing(config_dir / "application.json", application);

    js::object log{{"level", "info"},
                   {"log_dir", (runtime_dir / "logs").string()},
                   {"log_file", "speakerctrl.log"},
                   {"rotation_size", 10 * 1024 * 1024}};
    write_json_if_missing(config_dir / "log_config.json", log);
  } catch (const std::exception &ex) {
    std::cerr << "Warning: failed to write default configuration files: "
              << ex.what() << std::endl;
    return false;
  }

  return true;
}

// First runtime_dir found in application*.json of the config dirs.
std::optional<fs::path>
find_runtime_dir_override(const std::vector<fs::path> &config_dirs,
                          const std::vector<std::string> &profiles) {
  std::optional<fs::path> runtime_dir;
  auto apply_file = [&](const fs::path &file) {
    if (!fs::exists(file)) {
      return;
    }
    std::ifstream ifs(file);
    if (!ifs) {
      return;
    }
    std::string content((std::istreambuf_iterator<char>(ifs)),
                        std::istreambuf_iterator<char>());
    boost::system::error_code ec;
    auto value = js::parse(content, ec);
    if (ec || !value.is_object()) {
      return;
    }
    if (auto *rd = value.as_object().if_contains("runtime_dir")) {
      if (rd->is_string()) {
        runtime_dir = fs::path(std::string(rd->as_string()));
      }
    }
  };

  for (const auto &dir : config_dirs) {
    apply_file(dir / "application.json");
    for (const auto &profile : profiles) {
      apply_file(dir / ("application." + profile + ".json"));
    }
    apply_file(dir / "application.override.json");
  }
  return runtime_dir;
}

void add_unique_path(std::vector<fs::path> &paths, const fs::path &candidate) {
  if (candidate.empty()) {
    return;
  }
  if (std::find(paths.begin(), paths.end(), candidate) == paths.end()) {
    paths.push_back(candidate);
  }
}

} // namespace

int RunSpeakerCtrlApplication(int argc, char *argv[]) {
  for (int i = 1; i < argc; ++i) {
    std::string arg(argv[i]);
    if (arg == "--version" || arg == "version") {
      std::cout << SPEAKERCTRL_VERSION << std::endl;
      return EXIT_SUCCESS;
    }
  }

  // Fail fast on a common flag typo; subcommand flags are unregistered here
  // so it would otherwise be ignored.
  for (int i = 1; i < argc; ++i) {
    const std::string_view arg = argv[i] ? std::string_view(argv[i])
                                         : std::string_view{};
    if (arg == "--base-url" || arg.rfind("--base-url=", 0) == 0) {
      std::cerr << "Unknown option '--base-url'. Did you mean '--url-base'?"
                << std::endl;
      return EXIT_FAILURE;
    }
  }

  try {
    po::variables_map vm;
    po::options_description generic_desc("speaker-ctrl: speaker migration tool");

    speakerctrl::CliParams cli_params;
    std::vector<std::string> config_dirs_args;

    generic_desc.add_options() //
        ("config-dirs,c",
         po::value<std::vector<std::string>>(&config_dirs_args)
             ->multitoken()
             ->composing(),
         "paths of the configuration directories.") //
        ("profiles",
         po::value<std::vector<std::string>>(&cli_params.profiles)
             ->default_value(std::vector<std::string>{}, "")
             ->notifier([&](const std::vector<std::string> &profiles) mutable {
               if (profiles.empty()) {
                 cli_params.profiles.push_back("default");
               }
             }),
         "profiles to use from the configuration file.") //
        ("verbose",
         po::value<std::string>(&cli_params.verbose)->default_value("info"),
         "verbosity level, like info, trace, vvvv.") //
        ("silent", po::bool_switch(&cli_params.silent)->default_value(false),
         "suppress all output.") //
        ("url-base",
         po::value<std::string>()->value_name("URL")->notifier(
             [&](const std::string &value) {
               cli_params.url_base_override = value;
             }),
         "override base_url for this run without persisting") //
        ("help,h", "Print help");

    po::options_description hidden_desc("Hidden options");
    hidden_desc.add_options() //
        ("positionals",
         po::value<std::vector<std::string>>()->default_value({}, ""),
         "all positional arguments");

    po::options_description cmdline_options("Allowed options");
    cmdline_options.add(generic_desc).add(hidden_desc);

    po::positional_options_description p;
    p.add("positionals", -1);

    po::parsed_options parsed = po::command_line_parser(argc, argv)
                                    .options(cmdline_options)
                                    .positional(p)
                                    .allow_unregistered()
                                    .run();
    po::store(parsed, vm);
    po::notify(vm);

    if (!config_dirs_args.empty()) {
      cli_params.config_dirs.clear();
      for (const auto &dir_str : config_dirs_args) {
        fs::path config_dir(dir_str);
        if (!fs::exists(config_dir)) {
          throw std::runtime_error("Config directory does not exist: " +
                                   config_dir.string());
        }
        cli_params.config_dirs.push_back(std::move(config_dir));
      }
    }

    std::vector<std::string> positionals =
        vm["positionals"].as<std::vector<std::string>>();
    if (!positionals.empty()) {
      cli_params.subcmd = positionals[0];
    }

    std::vector<std::string> unrecognized = po::collect_unrecognized(
        parsed.options, po::collect_unrecognized_mode::include_positional);

    speakerctrl::normalize_cli_subcommand(cli_params.subcmd, positionals,
                                          unrecognized);

    auto showUsage = [&]() {
      std::cerr << generic_desc << std::endl;
      std::cerr
          << "Subcommands:\n"
             "  summary <addr>          Preview the migration of a speaker.\n"
             "  migrate <addr>          Redirect a speaker (--method "
             "xml|hosts|resolv).\n"
             "  revert <addr>           Undo a migration from on-device "
             "backups.\n"
             "  backup <addr>           Back up the speaker config "
             "(--off-device for a local copy).\n"
             "  trust-ca <addr>         Add the local CA to the speaker trust "
             "bundle.\n"
             "  reboot <addr>           Reboot the speaker.\n"
             "  remote-services enable|disable <addr>\n"
             "  test hosts|dns|connection <addr>\n"
             "  resolve <host>          Resolve a hostname locally.\n"
             "  devices list|add|remove Manage stored speakers.\n"
             "  dns get|set             DNS discovery server settings.\n"
             "  ca ensure|show          Local certificate authority.\n"
             "  conf get|set <key>      Persisted configuration.\n"
          << std::endl;
    };

    if (vm.count("help")) {
      showUsage();
      return 0;
    }

    const DefaultPaths defaults = resolve_default_paths();
    const bool default_config_available =
        bootstrap_default_config_dir(defaults.config_dir, defaults.runtime_dir);

    std::vector<fs::path> ordered_config_dirs;
    if (default_config_available && fs::exists(defaults.config_dir)) {
      add_unique_path(ordered_config_dirs, defaults.config_dir);
    }
    for (const auto &dir : cli_params.config_dirs) {
      add_unique_path(ordered_config_dirs, dir);
    }
    if (ordered_config_dirs.empty()) {
      std::cerr << "No configuration directories found. Provide --config-dirs"
                << " or ensure the default directory '" << defaults.config_dir
                << "' is accessible." << std::endl;
      return EXIT_FAILURE;
    }

    auto runtime_override =
        find_runtime_dir_override(ordered_config_dirs, cli_params.profiles);
    fs::path resolved_runtime_dir =
        runtime_override.value_or(defaults.runtime_dir);

    try {
      ensure_directory_exists(resolved_runtime_dir);
      ensure_directory_exists(resolved_runtime_dir / "logs");
    } catch (const std::exception &ex) {
      std::cerr << "Failed to prepare runtime directory '"
                << resolved_runtime_dir << "': " << ex.what() << std::endl;
      return EXIT_FAILURE;
    }

    add_unique_path(ordered_config_dirs, resolved_runtime_dir);
    cli_params.config_dirs = ordered_config_dirs;
    cli_params.runtime_dir = resolved_runtime_dir;

    static speakerctrl::ConfigSources config_sources(cli_params.config_dirs,
                                                     cli_params.profiles);
    {
      auto logging_config = config_sources.logging_config();
      if (logging_config.is_err()) {
        std::cerr << "Failed to load log_config: "
                  << logging_config.error().what << std::endl;
        return EXIT_FAILURE;
      }
      init_my_log(logging_config.value());
    }

    static speakerctrl::CliCtx cli_ctx(std::move(vm), std::move(positionals),
                                       std::move(unrecognized),
                                       std::move(cli_params));

    return speakerctrl::launch(config_sources, cli_ctx);
  } catch (const std::exception &e) {
    std::cerr << "error caught in main: " << e.what() << std::endl;
    return EXIT_FAILURE;
  }
}

int main(int argc, char *argv[]) {
  return RunSpeakerCtrlApplication(argc, argv);
}
