#include "almanac/cli/commands.hpp"

#include "almanac/common/fs.hpp"
#include "almanac/config/config.hpp"
#include "almanac/gateway/websocket.hpp"
#include "almanac/runtime/app.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <memory>
#include <optional>
#include <poll.h>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

namespace almanac::cli {

namespace {

volatile std::sig_atomic_t g_stop_requested = 0;

void handle_stop_signal(int) { g_stop_requested = 1; }

std::string version_string() {
#ifdef ALMANAC_VERSION
  std::string version = ALMANAC_VERSION;
#else
  std::string version = "0.1.0";
#endif
  return "almanac " + version;
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

std::optional<std::uint16_t> parse_port(const std::string &raw) {
  try {
    const unsigned long value = std::stoul(raw);
    if (value == 0 || value > 65535) {
      return std::nullopt;
    }
    return static_cast<std::uint16_t>(value);
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

common::Result<runtime::RuntimeContext> load_context() {
  auto context = runtime::RuntimeContext::from_disk();
  if (!context.ok()) {
    return context;
  }
  context.value().install_observer();
  for (const auto &warning : context.value().warnings()) {
    std::cerr << "warning: " << warning << "\n";
  }
  return context;
}

/// Blocks until Enter on stdin, SIGINT or SIGTERM.
void wait_for_signal_or_enter(const std::string &prompt) {
  g_stop_requested = 0;
  std::signal(SIGINT, handle_stop_signal);
  std::signal(SIGTERM, handle_stop_signal);

  std::cout << prompt << std::endl;
  wait_for_stop(STDIN_FILENO, [] { return g_stop_requested != 0; });

  std::signal(SIGINT, SIG_DFL);
  std::signal(SIGTERM, SIG_DFL);
}

int run_serve(std::vector<std::string> args) {
  auto context = load_context();
  if (!context.ok()) {
    std::cerr << context.error() << "\n";
    return 1;
  }
  const auto &cfg = context.value().config();

  gateway::WebSocketOptions options;
  options.host = cfg.gateway.host;
  options.port = cfg.gateway.port;
  options.max_clients = cfg.gateway.max_clients;
  options.tls_enabled = cfg.gateway.tls_enabled;
  options.tls_cert_file = cfg.gateway.tls_cert_file;
  options.tls_key_file = cfg.gateway.tls_key_file;

  std::string host;
  std::string port_raw;
  const bool no_notifier = take_flag(args, "--no-notifier");
  (void)take_option(args, "--host", "", host);
  (void)take_option(args, "--port", "-p", port_raw);
  if (!host.empty()) {
    options.host = host;
  }
  if (!port_raw.empty()) {
    const auto port = parse_port(port_raw);
    if (!port.has_value()) {
      std::cerr << "invalid port: " << port_raw << "\n";
      return 1;
    }
    options.port = *port;
  }

  auto store = context.value().create_schedule_store();
  if (!store.ok()) {
    std::cerr << store.error() << "\n";
    return 1;
  }
  auto tools = context.value().create_tool_registry(store.value());
  if (!tools.ok()) {
    std::cerr << tools.error() << "\n";
    return 1;
  }
  auto sessions = context.value().create_session_registry(tools.value());
  if (!sessions.ok()) {
    std::cerr << sessions.error() << "\n";
    return 1;
  }

  std::unique_ptr<heartbeat::ReminderNotifier> notifier;
  if (cfg.notifier.enabled && !no_notifier) {
    auto created = context.value().create_notifier(store.value());
    if (!created.ok()) {
      std::cerr << created.error() << "\n";
      return 1;
    }
    notifier = std::move(created.value());
  }

  gateway::WebSocketServer server(sessions.value());
  auto started = server.start(options);
  if (!started.ok()) {
    std::cerr << started.error() << "\n";
    return 1;
  }
  if (notifier) {
    notifier->start();
  }

  std::cout << "Almanac listening on " << (options.tls_enabled ? "wss://" : "ws://")
            << options.host << ":" << server.port() << "\n";
  std::cout << "Schedules: " << store.value()->path().string() << "\n";
  if (notifier) {
    std::cout << "Reminder notifier every " << cfg.notifier.interval_secs << "s ("
              << cfg.notifier.sink << ")\n";
  }

  wait_for_signal_or_enter("Press Enter to stop...");
  if (notifier) {
    notifier->stop();
  }
  server.stop();
  return 0;
}

int run_notifier(std::vector<std::string> args) {
  auto context = load_context();
  if (!context.ok()) {
    std::cerr << context.error() << "\n";
    return 1;
  }
  auto store = context.value().create_schedule_store();
  if (!store.ok()) {
    std::cerr << store.error() << "\n";
    return 1;
  }
  auto notifier = context.value().create_notifier(store.value());
  if (!notifier.ok()) {
    std::cerr << notifier.error() << "\n";
    return 1;
  }

  if (take_flag(args, "--once")) {
    auto report = notifier.value()->tick();
    if (!report.ok()) {
      std::cerr << report.error() << "\n";
      return 1;
    }
    std::cout << "Scanned " << report.value().scanned << " schedule(s), notified "
              << report.value().notified << "\n";
    return 0;
  }

  notifier.value()->start();
  std::cout << "Watching " << store.value()->path().string() << " every "
            << context.value().config().notifier.interval_secs << "s\n";
  wait_for_signal_or_enter("Press Enter to stop notifier...");
  notifier.value()->stop();
  return 0;
}

int run_schedules() {
  auto context = load_context();
  if (!context.ok()) {
    std::cerr << context.error() << "\n";
    return 1;
  }
  auto store = context.value().create_schedule_store();
  if (!store.ok()) {
    std::cerr << store.error() << "\n";
    return 1;
  }
  auto records = store.value()->list();
  if (!records.ok()) {
    std::cerr << records.error() << "\n";
    return 1;
  }
  if (records.value().empty()) {
    std::cout << "No schedules.\n";
    return 0;
  }
  for (const auto &record : records.value()) {
    std::cout << record.id << " | " << record.start_time << " | "
              << schedule::status_name(record.status) << " | " << record.title;
    if (record.recurrence.has_value()) {
      std::cout << " (" << *record.recurrence << ")";
    }
    std::cout << "\n";
  }
  return 0;
}

void print_help() {
  std::cout << version_string() << " - workday schedule assistant\n\n";
  std::cout << "usage: almanac [--config PATH] <command> [options]\n\n";
  std::cout << "commands:\n";
  std::cout << "  serve [--host H] [--port P] [--no-notifier]   run the websocket agent service\n";
  std::cout << "  notifier [--once]                             run only the reminder notifier\n";
  std::cout << "  schedules                                     list stored schedules\n";
  std::cout << "  config-path                                   print the config file path\n";
  std::cout << "  help                                          show this help\n";
  std::cout << "  version                                       print the version\n";
}

} // namespace

void wait_for_stop(const int input_fd, const std::function<bool()> &stop_requested) {
  bool watching = input_fd >= 0;
  while (!stop_requested()) {
    if (!watching) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
      continue;
    }
    struct pollfd poll_fd = {.fd = input_fd, .events = POLLIN, .revents = 0};
    const int ready = poll(&poll_fd, 1, 100);
    if (ready < 0) {
      if (errno != EINTR) {
        watching = false;
      }
      continue;
    }
    if (ready == 0) {
      continue;
    }
    char buffer[256];
    const ssize_t count = read(input_fd, buffer, sizeof(buffer));
    if (count > 0) {
      if (std::memchr(buffer, '\n', static_cast<std::size_t>(count)) != nullptr) {
        return;
      }
      continue;
    }
    if (count < 0 && errno == EINTR) {
      continue;
    }
    // Closed or redirected from /dev/null.
    watching = false;
  }
}

int run_cli(int argc, char **argv) {
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

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    if (!config::config_exists()) {
      std::cerr << "(no config file yet; built-in defaults apply)\n";
    }
    return 0;
  }
  if (subcommand == "serve") {
    return run_serve(std::move(args));
  }
  if (subcommand == "notifier") {
    return run_notifier(std::move(args));
  }
  if (subcommand == "schedules") {
    return run_schedules();
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace almanac::cli
