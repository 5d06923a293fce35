#include "test_framework.hpp"

#include "domshield/cli/commands.hpp"
#include "domshield/config/config.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace {

struct EnvGuard {
  std::string key;
  std::optional<std::string> old_value;

  EnvGuard(std::string key_, std::optional<std::string> value) : key(std::move(key_)) {
    if (const char *existing = std::getenv(key.c_str()); existing != nullptr) {
      old_value = existing;
    }
    if (value.has_value()) {
      setenv(key.c_str(), value->c_str(), 1);
    } else {
      unsetenv(key.c_str());
    }
  }

  ~EnvGuard() {
    if (old_value.has_value()) {
      setenv(key.c_str(), old_value->c_str(), 1);
    } else {
      unsetenv(key.c_str());
    }
  }
};

// --config sets a process-wide override; put the previous one back after each test.
struct ConfigOverrideGuard {
  std::optional<std::filesystem::path> old_override;

  ConfigOverrideGuard() {
    old_override = domshield::config::config_path_override();
    domshield::config::clear_config_path_override();
  }

  ~ConfigOverrideGuard() {
    if (old_override.has_value()) {
      domshield::config::set_config_path_override(*old_override);
    } else {
      domshield::config::clear_config_path_override();
    }
  }
};

std::filesystem::path make_temp_home() {
  static std::mt19937_64 rng{std::random_device{}()};
  const auto path =
      std::filesystem::temp_directory_path() / ("domshield-cli-home-" + std::to_string(rng()));
  std::filesystem::create_directories(path);
  return path;
}

void write_file(const std::filesystem::path &path, const std::string &content) {
  std::ofstream out(path, std::ios::trunc);
  out << content;
}

int run_cli(const std::vector<std::string> &args) {
  std::vector<std::string> owned = args;
  std::vector<char *> argv;
  argv.reserve(owned.size());
  for (auto &arg : owned) {
    argv.push_back(arg.data());
  }
  return domshield::cli::run_cli(static_cast<int>(argv.size()), argv.data());
}

} // namespace

void register_cli_tests(std::vector<domshield::tests::TestCase> &tests) {
  using domshield::tests::require;

  tests.push_back({"cli_dispatch_and_usage_errors", [] {
                     const auto home = make_temp_home();
                     const EnvGuard env_home("HOME", home.string());
                     const EnvGuard env_path("DOMSHIELD_CONFIG_PATH", std::nullopt);
                     const ConfigOverrideGuard guard;

                     require(run_cli({"domshield"}) == 0, "bare invocation prints help");
                     require(run_cli({"domshield", "help"}) == 0, "help");
                     require(run_cli({"domshield", "version"}) == 0, "version");
                     require(run_cli({"domshield", "frobnicate"}) == 1, "unknown command fails");
                     require(run_cli({"domshield", "check-url"}) == 1, "check-url needs a url");
                     require(run_cli({"domshield", "--config"}) == 1,
                             "--config without a value fails");
                     std::filesystem::remove_all(home);
                   }});

  tests.push_back({"cli_inspect_commands", [] {
                     const auto home = make_temp_home();
                     const EnvGuard env_home("HOME", home.string());
                     const EnvGuard env_path("DOMSHIELD_CONFIG_PATH", std::nullopt);
                     const ConfigOverrideGuard guard;

                     require(run_cli({"domshield", "check-url", "https://ads.exoclick.com/x"}) ==
                                 0,
                             "check-url succeeds");

                     const auto fragment = home / "fragment.html";
                     write_file(fragment, "<div data-izone=\"1\">" + std::string(300, 'x'));
                     require(run_cli({"domshield", "check-markup", fragment.string()}) == 0,
                             "check-markup reads a file");
                     require(run_cli({"domshield", "check-markup",
                                      (home / "missing.html").string()}) == 1,
                             "missing markup file fails");

                     require(run_cli({"domshield", "rules", "example.com", "--mode", "advanced",
                                      "--css"}) == 0,
                             "rules with a mode override");
                     require(run_cli({"domshield", "rules", "example.com", "--mode", "loud"}) == 1,
                             "unknown mode rejected");
                     require(run_cli({"domshield", "site", "https://Example.com/page"}) == 0,
                             "site resolves a url");
                     require(run_cli({"domshield", "site", "https:///"}) == 1,
                             "empty host rejected");
                     std::filesystem::remove_all(home);
                   }});

  tests.push_back({"cli_simulate_runs_the_engine", [] {
                     const auto home = make_temp_home();
                     const EnvGuard env_home("HOME", home.string());
                     const EnvGuard env_path("DOMSHIELD_CONFIG_PATH", std::nullopt);
                     const ConfigOverrideGuard guard;

                     require(run_cli({"domshield", "simulate", "https://news.test/a", "--mode",
                                      "advanced", "--duration", "3000"}) == 0,
                             "simulate in advanced mode");
                     require(run_cli({"domshield", "simulate", "https://news.test/a",
                                      "--duration", "soon"}) == 1,
                             "non-numeric duration rejected");
                     require(run_cli({"domshield", "simulate", "https://news.test/a",
                                      "--duration", "0"}) == 1,
                             "zero duration rejected");
                     std::filesystem::remove_all(home);
                   }});

  tests.push_back({"cli_config_commands_honor_global_override", [] {
                     const auto home = make_temp_home();
                     const EnvGuard env_home("HOME", home.string());
                     const EnvGuard env_path("DOMSHIELD_CONFIG_PATH", std::nullopt);
                     const ConfigOverrideGuard guard;

                     const auto good = home / "good.toml";
                     write_file(good, "[settings]\nmode = \"standard\"\n\n[engine]\nbudget_ms = 6\n");
                     require(run_cli({"domshield", "--config", good.string(), "config",
                                      "validate"}) == 0,
                             "valid config accepted");
                     require(domshield::config::config_path_override().has_value(),
                             "--config installs the override");
                     require(run_cli({"domshield", "--config=" + good.string(), "config",
                                      "show"}) == 0,
                             "config show");

                     const auto bad = home / "bad.toml";
                     write_file(bad, "[engine]\nbudget_ms = 0\n");
                     require(run_cli({"domshield", "--config", bad.string(), "config",
                                      "validate"}) == 1,
                             "zero budget rejected");
                     require(run_cli({"domshield", "config", "path"}) == 0, "config path");
                     require(run_cli({"domshield", "config", "reset"}) == 1,
                             "unknown config action");
                     std::filesystem::remove_all(home);
                   }});
}
