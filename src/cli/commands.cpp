#include "devpulse/cli/commands.hpp"

#include "devpulse/bus/event_channel.hpp"
#include "devpulse/common/context.hpp"
#include "devpulse/common/fs.hpp"
#include "devpulse/config/config.hpp"
#include "devpulse/devices/store.hpp"
#include "devpulse/events/detection.hpp"
#include "devpulse/events/publisher.hpp"
#include "devpulse/events/subjects.hpp"
#include "devpulse/health/retry.hpp"
#include "devpulse/http/client.hpp"
#include "devpulse/observability/factory.hpp"
#include "devpulse/runtime/service.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace devpulse::cli {

namespace {

volatile std::sig_atomic_t g_stop_signal = 0;

void handle_stop_signal(int signal) { g_stop_signal = signal; }

struct GlobalOptions {
  std::optional<std::filesystem::path> config_path;
};

std::string version_string() {
#ifdef DEVPULSE_VERSION
  std::string version = DEVPULSE_VERSION;
#else
  std::string version = "0.1.0";
#endif
#ifdef DEVPULSE_GIT_COMMIT
  const std::string commit = DEVPULSE_GIT_COMMIT;
  if (!commit.empty() && commit != "unknown") {
    version += " (" + commit + ")";
  }
#endif
  return "devpulse " + version;
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

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, GlobalOptions &options,
                          std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      options.config_path = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      options.config_path = value;
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::optional<std::size_t> parse_count(const std::string &raw) {
  try {
    std::size_t consumed = 0;
    const unsigned long long value = std::stoull(raw, &consumed);
    if (consumed != raw.size()) {
      return std::nullopt;
    }
    return static_cast<std::size_t>(value);
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

std::optional<config::Config> load_or_report(const GlobalOptions &global) {
  auto cfg = config::load_config(global.config_path);
  if (!cfg.ok()) {
    std::cerr << "[cli][config] error=" << cfg.error() << "\n";
    return std::nullopt;
  }
  return cfg.value();
}

std::unique_ptr<devices::IDeviceStore> open_store_or_report(const config::Config &cfg) {
  auto store = devices::create_device_store(cfg.storage);
  if (!store.ok()) {
    std::cerr << "[cli][store] backend=" << cfg.storage.backend << " error=" << store.error()
              << "\n";
    return nullptr;
  }
  return std::move(store.value());
}

void print_device(const devices::Device &device) {
  std::cout << device.identifier << "  " << devices::status_to_string(device.status) << "  "
            << device.address;
  if (!device.name.empty()) {
    std::cout << "  name=" << device.name;
  }
  if (!device.location.empty()) {
    std::cout << "  location=" << device.location;
  }
  std::cout << "  last_seen=" << common::format_rfc3339(device.last_seen) << "\n";
}

int run_service(const GlobalOptions &global, std::vector<std::string> args) {
  auto cfg = load_or_report(global);
  if (!cfg.has_value()) {
    return 1;
  }

  std::string duration_raw;
  (void)take_option(args, "--duration-secs", "", duration_raw);
  std::optional<std::size_t> duration;
  if (!duration_raw.empty()) {
    duration = parse_count(duration_raw);
    if (!duration.has_value()) {
      std::cerr << "invalid --duration-secs: " << duration_raw << "\n";
      return 1;
    }
  }

  auto observer = observability::create_observer(cfg->observability);
  runtime::Service service(*cfg, *observer);
  auto started = service.start();
  if (!started.ok()) {
    std::cerr << "[cli][run] error=" << started.error() << "\n";
    return 1;
  }

  std::cout << "devpulse listening on " << events::detected_subject(cfg->bus.subject_prefix)
            << "\n";

  g_stop_signal = 0;
  std::signal(SIGINT, handle_stop_signal);
  std::signal(SIGTERM, handle_stop_signal);

  const auto started_at = std::chrono::steady_clock::now();
  while (g_stop_signal == 0) {
    if (duration.has_value() && *duration > 0 &&
        std::chrono::steady_clock::now() - started_at >= std::chrono::seconds(*duration)) {
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  std::signal(SIGINT, SIG_DFL);
  std::signal(SIGTERM, SIG_DFL);

  auto stopped = service.stop();
  observer->flush();
  if (!stopped.ok()) {
    std::cerr << "[cli][run] stop_error=" << stopped.error() << "\n";
    return 1;
  }
  return 0;
}

int run_check(const GlobalOptions &global, std::vector<std::string> args) {
  if (args.empty()) {
    std::cerr << "usage: devpulse check <address>\n";
    return 1;
  }
  const std::string address = args[0];
  if (auto valid = devices::validate_address(address); !valid.ok()) {
    std::cerr << valid.error() << "\n";
    return 1;
  }

  auto cfg = load_or_report(global);
  if (!cfg.has_value()) {
    return 1;
  }

  auto observer = observability::create_observer(cfg->observability);
  health::RetryingHealthProbe checker(
      health::HealthProbe(std::make_shared<http::CurlHttpClient>(),
                          runtime::make_probe_options(cfg->health)),
      runtime::make_retry_policy(cfg->health), *observer);

  const auto outcome = checker.check_health(common::Context::background(), address);
  observer->flush();

  std::cout << "URL: " << health::probe_url(address) << "\n";
  std::cout << "Result: " << (outcome.success ? "online" : "offline") << "\n";
  std::cout << "Attempts: " << outcome.attempts << "\n";
  if (outcome.status_code != 0) {
    std::cout << "Status: " << outcome.status_code << "\n";
  }
  if (outcome.last_error.has_value()) {
    std::cout << "Error: " << *outcome.last_error << "\n";
  }
  return outcome.success ? 0 : 2;
}

int run_device(const GlobalOptions &global, std::vector<std::string> args) {
  if (args.empty()) {
    std::cerr << "usage: devpulse device <add|list|show|remove> ...\n";
    return 1;
  }
  const std::string action = args[0];
  args.erase(args.begin());

  auto cfg = load_or_report(global);
  if (!cfg.has_value()) {
    return 1;
  }
  auto store = open_store_or_report(*cfg);
  if (store == nullptr) {
    return 1;
  }
  const auto ctx = common::Context::background();

  if (action == "add") {
    std::string name;
    std::string location;
    (void)take_option(args, "--name", "-n", name);
    (void)take_option(args, "--location", "-l", location);
    if (args.size() < 2) {
      std::cerr << "usage: devpulse device add <mac> <address> [--name N] [--location L]\n";
      return 1;
    }
    auto device = devices::make_device(args[0], name, args[1], location);
    if (!device.ok()) {
      std::cerr << device.error() << "\n";
      return 1;
    }
    if (auto saved = store->save(ctx, device.value()); !saved.ok()) {
      std::cerr << saved.error() << "\n";
      return 1;
    }
    std::cout << "Registered " << device.value().identifier << "\n";
    return 0;
  }

  if (action == "list") {
    std::string raw;
    std::size_t offset = 0;
    std::size_t limit = 100;
    if (take_option(args, "--offset", "", raw)) {
      const auto parsed = parse_count(raw);
      if (!parsed.has_value()) {
        std::cerr << "invalid --offset: " << raw << "\n";
        return 1;
      }
      offset = *parsed;
    }
    if (take_option(args, "--limit", "", raw)) {
      const auto parsed = parse_count(raw);
      if (!parsed.has_value()) {
        std::cerr << "invalid --limit: " << raw << "\n";
        return 1;
      }
      limit = *parsed;
    }
    auto listed = store->list(ctx, offset, limit);
    if (!listed.ok()) {
      std::cerr << listed.error() << "\n";
      return 1;
    }
    if (listed.value().empty()) {
      std::cout << "No devices registered.\n";
      return 0;
    }
    for (const auto &device : listed.value()) {
      print_device(device);
    }
    return 0;
  }

  if (action == "show" || action == "remove") {
    if (args.empty()) {
      std::cerr << "usage: devpulse device " << action << " <mac>\n";
      return 1;
    }
    if (action == "remove") {
      auto removed = store->remove(ctx, args[0]);
      if (!removed.ok()) {
        std::cerr << removed.error() << "\n";
        return 1;
      }
      if (!removed.value()) {
        std::cerr << "device not found: " << devices::normalize_identifier(args[0]) << "\n";
        return 1;
      }
      std::cout << "Removed " << devices::normalize_identifier(args[0]) << "\n";
      return 0;
    }
    auto found = store->find_by_identifier(ctx, args[0]);
    if (!found.ok()) {
      std::cerr << found.error() << "\n";
      return 1;
    }
    if (!found.value().has_value()) {
      std::cerr << "device not found: " << devices::normalize_identifier(args[0]) << "\n";
      return 1;
    }
    const auto &device = *found.value();
    std::cout << "Identifier: " << device.identifier << "\n";
    std::cout << "Name: " << device.name << "\n";
    std::cout << "Address: " << device.address << "\n";
    std::cout << "Location: " << device.location << "\n";
    std::cout << "Status: " << devices::status_to_string(device.status) << "\n";
    std::cout << "Registered: " << common::format_rfc3339(device.registered_at) << "\n";
    std::cout << "Last seen: " << common::format_rfc3339(device.last_seen) << "\n";
    return 0;
  }

  std::cerr << "unknown device command: " << action << "\n";
  return 1;
}

int run_publish_detected(const GlobalOptions &global, std::vector<std::string> args) {
  if (args.size() < 2) {
    std::cerr << "usage: devpulse publish-detected <mac> <address>\n";
    return 1;
  }
  auto cfg = load_or_report(global);
  if (!cfg.has_value()) {
    return 1;
  }

  auto event = events::make_detection_event(args[0], args[1]);
  if (!event.ok()) {
    std::cerr << event.error() << "\n";
    return 1;
  }

  auto observer = observability::create_observer(cfg->observability);
  bus::EventChannel channel(bus::make_channel_options(cfg->bus), *observer);
  if (auto connected = channel.connect(); !connected.ok()) {
    std::cerr << "[cli][publish] error=" << connected.error() << "\n";
    return 1;
  }

  const auto root = common::Context::background();
  const std::string subject = events::detected_subject(cfg->bus.subject_prefix);
  auto published = events::publish_event(
      channel, common::Context::with_timeout(root, std::chrono::milliseconds(cfg->bus.publish_timeout_ms)),
      subject, event.value());
  auto closed = channel.close(
      common::Context::with_timeout(root, std::chrono::milliseconds(cfg->bus.close_timeout_ms)));
  observer->flush();
  if (!published.ok()) {
    std::cerr << "[cli][publish] subject=" << subject << " error=" << published.error() << "\n";
    return 1;
  }
  if (!closed.ok()) {
    std::cerr << "[cli][publish] close_error=" << closed.error() << "\n";
    return 1;
  }
  std::cout << "Published " << event.value().event_id << " to " << subject << "\n";
  return 0;
}

int run_config(const GlobalOptions &global, std::vector<std::string> args) {
  const std::string action = args.empty() ? "show" : args[0];

  if (action == "path") {
    auto path = config::config_path(global.config_path);
    if (!path.ok()) {
      std::cerr << path.error() << "\n";
      return 1;
    }
    std::cout << path.value().string() << "\n";
    return 0;
  }

  if (action == "init") {
    const bool force = take_flag(args, "--force");
    auto path = config::config_path(global.config_path);
    if (!path.ok()) {
      std::cerr << path.error() << "\n";
      return 1;
    }
    std::error_code ec;
    if (!force && std::filesystem::exists(path.value(), ec)) {
      std::cerr << "config already exists: " << path.value().string()
                << " (use --force to overwrite)\n";
      return 1;
    }
    if (auto saved = config::save_config(config::Config{}, global.config_path); !saved.ok()) {
      std::cerr << saved.error() << "\n";
      return 1;
    }
    std::cout << "Wrote " << path.value().string() << "\n";
    return 0;
  }

  auto cfg = load_or_report(global);
  if (!cfg.has_value()) {
    return 1;
  }

  if (action == "show") {
    std::cout << config::render_config(*cfg);
    return 0;
  }

  if (action == "validate") {
    auto checked = config::validate_config(*cfg);
    if (!checked.ok()) {
      std::cerr << "[FAIL] " << checked.error() << "\n";
      return 1;
    }
    for (const auto &warning : checked.value()) {
      std::cout << "[WARN] " << warning << "\n";
    }
    std::cout << "[OK] configuration is valid\n";
    return 0;
  }

  std::cerr << "unknown config command: " << action << "\n";
  return 1;
}

} // namespace

void print_help() {
  constexpr const char *RESET = "\033[0m";
  constexpr const char *BOLD = "\033[1m";
  constexpr const char *DIM = "\033[2m";
  constexpr const char *CYAN = "\033[36m";
  constexpr const char *GREEN = "\033[32m";

  std::cout << "\n";
  std::cout << BOLD << CYAN << "  devpulse" << RESET << DIM
            << "  device health verification" << RESET << "\n";
  std::cout << DIM << "  " << version_string() << RESET << "\n\n";

  std::cout << BOLD << "  USAGE" << RESET << "\n";
  std::cout << DIM << "  $ " << RESET << "devpulse [--config PATH] <command> [options]\n\n";

  std::cout << BOLD << "  SERVICE" << RESET << "\n";
  std::cout << "  " << GREEN << "run" << RESET << DIM
            << "              Consume detections and verify devices (Ctrl-C to stop)" << RESET
            << "\n";
  std::cout << "  " << GREEN << "check" << RESET << " ADDR" << DIM
            << "       Probe one address with the configured retry policy" << RESET << "\n";
  std::cout << "  " << GREEN << "publish-detected" << RESET << DIM
            << " Publish a detection event for MAC and ADDR" << RESET << "\n\n";

  std::cout << BOLD << "  DEVICES" << RESET << "\n";
  std::cout << "  " << GREEN << "device add" << RESET << DIM << "       Register a device" << RESET
            << "\n";
  std::cout << "  " << GREEN << "device list" << RESET << DIM << "      List devices" << RESET
            << "\n";
  std::cout << "  " << GREEN << "device show" << RESET << DIM << "      Show one device" << RESET
            << "\n";
  std::cout << "  " << GREEN << "device remove" << RESET << DIM << "    Remove a device" << RESET
            << "\n\n";

  std::cout << BOLD << "  CONFIGURATION" << RESET << "\n";
  std::cout << "  " << GREEN << "config init" << RESET << DIM << "      Write a default config"
            << RESET << "\n";
  std::cout << "  " << GREEN << "config path" << RESET << DIM << "      Print the config location"
            << RESET << "\n";
  std::cout << "  " << GREEN << "config show" << RESET << DIM
            << "      Display the effective configuration" << RESET << "\n";
  std::cout << "  " << GREEN << "config validate" << RESET << DIM << "  Check the configuration"
            << RESET << "\n\n";

  std::cout << BOLD << "  OTHER" << RESET << "\n";
  std::cout << "  " << GREEN << "version" << RESET << DIM << "          Show version" << RESET
            << "\n";
  std::cout << "  " << GREEN << "help" << RESET << DIM << "             Show this help" << RESET
            << "\n\n";
}

int run_cli(int argc, char **argv) {
  if (argc <= 1) {
    print_help();
    return 0;
  }

  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  GlobalOptions global;
  std::string global_error;
  if (!apply_global_options(args, global, global_error)) {
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
  if (subcommand == "run") {
    return run_service(global, std::move(args));
  }
  if (subcommand == "check") {
    return run_check(global, std::move(args));
  }
  if (subcommand == "device") {
    return run_device(global, std::move(args));
  }
  if (subcommand == "publish-detected") {
    return run_publish_detected(global, std::move(args));
  }
  if (subcommand == "config") {
    return run_config(global, std::move(args));
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace devpulse::cli
