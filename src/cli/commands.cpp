#include "domshield/cli/commands.hpp"

#include "domshield/common/string_util.hpp"
#include "domshield/config/config.hpp"
#include "domshield/dom/document.hpp"
#include "domshield/observability/factory.hpp"
#include "domshield/observability/global.hpp"
#include "domshield/runtime/clock.hpp"
#include "domshield/runtime/page.hpp"
#include "domshield/settings/site_settings.hpp"
#include "domshield/shield/capability_interceptor.hpp"
#include "domshield/shield/engine.hpp"
#include "domshield/shield/markers.hpp"
#include "domshield/shield/rule_config.hpp"
#include "domshield/shield/suppression_style.hpp"

#include <chrono>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace domshield::cli {

namespace {

std::string version_string() {
#ifdef DOMSHIELD_VERSION
  std::string version = DOMSHIELD_VERSION;
#else
  std::string version = "0.1.0";
#endif
  return "domshield " + version;
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
    if (args[i] == long_name || args[i] == short_name) {
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

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
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

std::int64_t now_epoch_ms() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

const char *yes_no(const bool value) { return value ? "yes" : "no"; }

// Loads the config and installs the observer it selects.
common::Result<config::Config> load_and_observe() {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    return cfg;
  }
  observability::set_global_observer(observability::create_observer(cfg.value()));
  for (const auto &warning : cfg.value().load_warnings) {
    observability::record_debug("config", warning);
  }
  return cfg;
}

// Mode from --mode when given, otherwise the mode the stored settings resolve to.
common::Result<settings::ResolvedSite> resolve_with_override(const config::Config &cfg,
                                                             const std::string &target,
                                                             const std::string &mode_override) {
  auto resolved = settings::resolve_site(cfg.settings, target, now_epoch_ms());
  if (!resolved.ok()) {
    return resolved;
  }
  if (!mode_override.empty()) {
    const auto mode = settings::parse_mode(mode_override);
    if (!mode.has_value()) {
      return common::Result<settings::ResolvedSite>::failure("unknown mode: " + mode_override +
                                                             " (expected lite|standard|advanced)");
    }
    resolved.value().mode = *mode;
    resolved.value().downgraded = false;
  }
  return resolved;
}

int run_check_url(std::vector<std::string> args) {
  if (args.empty()) {
    std::cerr << "usage: domshield check-url <url>\n";
    return 1;
  }
  const std::string &url = args[0];
  const bool navigation = shield::CapabilityInterceptor::should_block_navigation(url);
  const bool frame = shield::matches_network(url, shield::frame_networks());
  std::cout << "url:         " << url << "\n";
  std::cout << "navigation:  " << (navigation ? "blocked" : "allowed") << "\n";
  std::cout << "iframe src:  " << (frame ? "ad network" : "clean") << "\n";
  return 0;
}

int run_check_markup(std::vector<std::string> args) {
  if (args.empty()) {
    std::cerr << "usage: domshield check-markup <file|->\n";
    return 1;
  }
  std::string markup;
  if (args[0] == "-") {
    markup.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
  } else {
    std::ifstream in(args[0], std::ios::binary);
    if (!in) {
      std::cerr << "failed to read " << args[0] << "\n";
      return 1;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    markup = buffer.str();
  }
  const bool blocked = shield::CapabilityInterceptor::should_block_markup(markup);
  std::cout << "length:  " << markup.size() << "\n";
  std::cout << "markup:  " << (blocked ? "blocked" : "allowed") << "\n";
  return 0;
}

int run_rules(std::vector<std::string> args) {
  std::string mode_override;
  (void)take_option(args, "--mode", "-m", mode_override);
  const bool show_css = take_flag(args, "--css");
  if (args.empty()) {
    std::cerr << "usage: domshield rules <domain> [--mode lite|standard|advanced] [--css]\n";
    return 1;
  }

  auto cfg = load_and_observe();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  auto site = resolve_with_override(cfg.value(), args[0], mode_override);
  if (!site.ok()) {
    std::cerr << site.error() << "\n";
    return 1;
  }

  const auto rules = shield::build_rule_config(site.value().domain, site.value().mode);
  const auto all = rules.all_rules();
  std::cout << "domain:  " << rules.domain << "\n";
  std::cout << "mode:    " << settings::mode_name(rules.mode) << "\n";
  std::cout << "fast rules (" << rules.fast_rules.size() << "):\n";
  for (const auto &rule : rules.fast_rules) {
    std::cout << "  " << rule << "\n";
  }
  std::cout << "slow rules (" << rules.slow_rules.size() << "):\n";
  for (const auto &rule : rules.slow_rules) {
    std::cout << "  " << rule << "\n";
  }
  std::cout << "fingerprint: " << shield::SuppressionStyle::fingerprint_of(all) << "\n";
  if (show_css) {
    std::cout << "\n" << shield::SuppressionStyle::render(all) << "\n";
  }
  return 0;
}

int run_site(std::vector<std::string> args) {
  if (args.empty()) {
    std::cerr << "usage: domshield site <domain>\n";
    return 1;
  }
  auto cfg = load_and_observe();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  const std::int64_t now = now_epoch_ms();
  auto resolved = settings::resolve_site(cfg.value().settings, args[0], now);
  if (!resolved.ok()) {
    std::cerr << resolved.error() << "\n";
    return 1;
  }
  const auto &site = resolved.value();
  std::cout << "domain:          " << site.domain << "\n";
  std::cout << "mode:            " << settings::mode_name(site.mode)
            << (site.downgraded ? " (downgraded after breakage reports)" : "") << "\n";
  std::cout << "breakage count:  " << site.site.breakage_count << "\n";
  std::cout << "main world off:  " << yes_no(site.site.main_world_off) << "\n";
  std::cout << "cosmetics off:   " << yes_no(site.site.cosmetics_off) << "\n";
  std::cout << "site fixes off:  " << yes_no(site.site.site_fixes_off) << "\n";
  if (site.relaxed && site.site.relax_until_ms.has_value()) {
    const auto minutes = (*site.site.relax_until_ms - now + 59'999) / 60'000;
    std::cout << "relaxed:         yes (" << minutes << " min left)\n";
  } else {
    std::cout << "relaxed:         no\n";
  }
  return 0;
}

void add_text_block(dom::Document &document, const dom::ElementPtr &parent,
                    const std::string &text) {
  auto paragraph = document.create_element("p");
  paragraph->set_text(text);
  parent->append_child(paragraph);
}

// Builds a small page with the usual ad shapes: a marked zone, an ad-network frame and a
// full-viewport overlay over the article.
void build_sample_page(dom::Document &document) {
  const auto &viewport = document.viewport();
  auto body = document.body();

  auto article = document.create_element("article");
  article->set_attribute("id", "content");
  body->append_child(article);
  add_text_block(document, article, "Regular article text.");
  add_text_block(document, article, "More article text.");

  auto zone = document.create_element("div");
  zone->set_attribute("data-izone", "top");
  add_text_block(document, zone, "Sponsored");
  body->append_child(zone);

  auto frame = document.create_element("iframe");
  frame->set_attribute("src", "https://ads.exoclick.com/frame?id=7");
  body->append_child(frame);

  auto overlay = document.create_element("div");
  overlay->set_attribute("style", "position: fixed; z-index: 9999; top: 0; left: 0");
  dom::LayoutBox box;
  box.position = dom::Position::Fixed;
  box.z_index = "9999";
  box.rect = {0.0, 0.0, viewport.width, viewport.height};
  overlay->set_layout(box);
  body->append_child(overlay);
}

int run_simulate(std::vector<std::string> args) {
  std::string mode_override;
  std::string duration_text = "5000";
  (void)take_option(args, "--mode", "-m", mode_override);
  (void)take_option(args, "--duration", "-d", duration_text);
  if (args.empty()) {
    std::cerr << "usage: domshield simulate <url> [--mode M] [--duration MS]\n";
    return 1;
  }

  std::int64_t duration_ms = 0;
  try {
    duration_ms = std::stoll(duration_text);
  } catch (const std::exception &) {
    std::cerr << "invalid --duration: " << duration_text << "\n";
    return 1;
  }
  if (duration_ms <= 0) {
    std::cerr << "invalid --duration: " << duration_text << "\n";
    return 1;
  }

  auto cfg = load_and_observe();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  auto site = resolve_with_override(cfg.value(), args[0], mode_override);
  if (!site.ok()) {
    std::cerr << site.error() << "\n";
    return 1;
  }

  runtime::ManualClock clock;
  runtime::PageOptions options;
  options.url = args[0];
  runtime::Page page(dom::Document::create(), clock, options);
  auto &document = page.document();
  build_sample_page(document);

  const auto install = shield::install_capability_interceptor(page, site.value(),
                                                              cfg.value().engine);
  shield::ShieldEngine engine(page, cfg.value().engine);
  const auto outcome = engine.start(site.value());

  // A late insertion the watcher has to catch.
  auto late = document.create_element("div");
  late->set_attribute("data-element", "banner");
  document.body()->append_child(late);

  page.pump();
  page.loop().run_until(clock.now_ms() + duration_ms,
                        [&clock](const runtime::Millis at) { clock.set(at); });
  (void)page.loop().run_idle_slice(static_cast<runtime::Millis>(cfg.value().engine.budget_ms));

  const auto &stats = engine.stats();
  std::cout << "site:                " << site.value().domain << " ("
            << settings::mode_name(site.value().mode) << ")\n";
  std::cout << "interceptor:         " << shield::install_outcome_name(install) << "\n";
  std::cout << "engine:              " << shield::start_outcome_name(outcome) << "\n";
  std::cout << "hides:               " << stats.hides << "\n";
  std::cout << "heuristic removals:  " << stats.heuristic_removals << "\n";
  std::cout << "watcher batches:     " << stats.batches << "\n";
  std::cout << "detached:            " << engine.removal_queue().detached_total() << "\n";
  engine.stop();
  return 0;
}

int run_config(std::vector<std::string> args) {
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

  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }

  if (action == "show") {
    std::cout << config::render_config(cfg.value());
    return 0;
  }
  if (action == "validate") {
    auto warnings = config::validate_config(cfg.value());
    if (!warnings.ok()) {
      std::cerr << "invalid config: " << warnings.error() << "\n";
      return 1;
    }
    for (const auto &warning : warnings.value()) {
      std::cout << "warning: " << warning << "\n";
    }
    std::cout << "config ok\n";
    return 0;
  }

  std::cerr << "usage: domshield config show|validate|path\n";
  return 1;
}

void print_help() {
  constexpr const char *RESET   = "\033[0m";
  constexpr const char *BOLD    = "\033[1m";
  constexpr const char *DIM     = "\033[2m";
  constexpr const char *CYAN    = "\033[36m";
  constexpr const char *GREEN   = "\033[32m";

  std::cout << "\n";
  std::cout << BOLD << CYAN << "   DomShield" << RESET << DIM
            << "  Ad content defense for live documents." << RESET << "\n";
  std::cout << DIM << "  " << version_string() << RESET << "\n\n";

  std::cout << BOLD << "  USAGE" << RESET << "\n";
  std::cout << DIM << "  $ " << RESET << "domshield [--config PATH] <command> [options]\n\n";

  std::cout << BOLD << "  INSPECT" << RESET << "\n";
  std::cout << "  " << GREEN << "check-url" << RESET << " URL" << DIM << "      Would a navigation or frame be blocked" << RESET << "\n";
  std::cout << "  " << GREEN << "check-markup" << RESET << " FILE" << DIM << "  Would an injected fragment be blocked" << RESET << "\n";
  std::cout << "  " << GREEN << "rules" << RESET << " DOMAIN" << DIM << "       Selector rules and suppression style" << RESET << "\n";
  std::cout << "  " << GREEN << "site" << RESET << " DOMAIN" << DIM << "        Resolved per-site settings" << RESET << "\n";
  std::cout << "  " << GREEN << "simulate" << RESET << " URL" << DIM << "       Run the engine over a sample page" << RESET << "\n\n";

  std::cout << BOLD << "  CONFIG" << RESET << "\n";
  std::cout << "  " << GREEN << "config show" << RESET << DIM << "        Print the effective config" << RESET << "\n";
  std::cout << "  " << GREEN << "config validate" << RESET << DIM << "    Check the config file" << RESET << "\n";
  std::cout << "  " << GREEN << "config path" << RESET << DIM << "        Print the config location" << RESET << "\n\n";

  std::cout << BOLD << "  OTHER" << RESET << "\n";
  std::cout << "  " << GREEN << "version" << RESET << DIM << "            Print version" << RESET << "\n";
  std::cout << "  " << GREEN << "help" << RESET << DIM << "               Show this help" << RESET << "\n\n";
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

  if (subcommand == "help" || subcommand == "-h" || subcommand == "--help") {
    print_help();
    return 0;
  }
  if (subcommand == "version" || subcommand == "-V" || subcommand == "--version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "check-url") {
    return run_check_url(std::move(args));
  }
  if (subcommand == "check-markup") {
    return run_check_markup(std::move(args));
  }
  if (subcommand == "rules") {
    return run_rules(std::move(args));
  }
  if (subcommand == "site") {
    return run_site(std::move(args));
  }
  if (subcommand == "simulate") {
    return run_simulate(std::move(args));
  }
  if (subcommand == "config") {
    return run_config(std::move(args));
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace domshield::cli
