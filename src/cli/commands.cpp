#include "hotword/cli/commands.hpp"

#include "hotword/capability/probe.hpp"
#include "hotword/common/fs.hpp"
#include "hotword/config/config.hpp"
#include "hotword/detector/detector.hpp"
#include "hotword/engine/scripted_backend.hpp"
#include "hotword/matcher/phrase_matcher.hpp"
#include "hotword/observability/factory.hpp"
#include "hotword/observability/global.hpp"
#include "hotword/preference/preference.hpp"
#include "hotword/preference/store.hpp"
#include "hotword/scheduler/clock.hpp"
#include "hotword/scheduler/event_loop.hpp"
#include "hotword/scheduler/timer_queue.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <fcntl.h>
#include <unistd.h>
#include <vector>

namespace hotword::cli {

namespace {

std::string version_string() {
#ifdef HOTWORD_VERSION
  std::string version = HOTWORD_VERSION;
#else
  std::string version = "0.1.0";
#endif
  return "hotword " + version;
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

std::string join_tokens(const std::vector<std::string> &args, const std::size_t begin = 0) {
  std::ostringstream out;
  for (std::size_t i = begin; i < args.size(); ++i) {
    if (i > begin) {
      out << ' ';
    }
    out << args[i];
  }
  return out.str();
}

class InputFile {
public:
  explicit InputFile(const std::string &path) : fd_(::open(path.c_str(), O_RDONLY | O_CLOEXEC)) {}
  ~InputFile() {
    if (fd_ >= 0) {
      ::close(fd_);
    }
  }

  InputFile(const InputFile &) = delete;
  InputFile &operator=(const InputFile &) = delete;

  [[nodiscard]] int fd() const { return fd_; }

private:
  int fd_ = -1;
};

common::Result<config::Config> load_and_observe() {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    return cfg;
  }
  observability::set_global_observer(observability::create_observer(cfg.value().observability));
  return cfg;
}

void print_device(const capability::CapabilityProbe &probe) {
  const auto &device = probe.device_info();
  std::cout << "platform: " << capability::to_string(device.platform_class()) << "\n";
  std::cout << "browser: " << capability::to_string(device.browser) << "\n";
  std::cout << "android: " << (device.is_android ? "yes" : "no") << "\n";
  std::cout << "ios: " << (device.is_ios ? "yes" : "no") << "\n";
  std::cout << "mobile: " << (device.is_mobile ? "yes" : "no") << "\n";
}

void print_snapshot(const detector::DetectorSnapshot &snap) {
  std::cout << "state: " << detector::to_string(snap.state) << "\n";
  std::cout << "error: " << snap.error.value_or("-") << "\n";
  std::cout << "has_permission: "
            << (snap.has_permission.has_value() ? (*snap.has_permission ? "true" : "false")
                                                : "unknown")
            << "\n";
  std::cout << "enabled: " << (snap.enabled ? "true" : "false") << "\n";
  std::cout << "dictation_active: " << (snap.dictation_active ? "true" : "false") << "\n";
  std::cout << "page_visible: " << (snap.page_visible ? "true" : "false") << "\n";
  std::cout << "manually_suspended: " << (snap.manually_suspended ? "true" : "false") << "\n";
  std::cout << "sessions_created: " << snap.sessions_created << "\n";
  std::cout << "wake_count: " << snap.wake_count << "\n";
  std::cout << "last_fragment: " << snap.last_fragment << "\n";
}

void print_preference(const preference::PreferenceState &state) {
  std::cout << "consent: " << preference::to_string(state.consent) << "\n";
  std::cout << "enabled: " << (state.enabled ? "true" : "false") << "\n";
  std::cout << "active: " << (state.active() ? "true" : "false") << "\n";
}

int run_config(std::vector<std::string> args) {
  if (!args.empty() && args[0] == "init") {
    if (config::config_exists()) {
      auto path = config::config_path();
      std::cout << "config already exists: " << (path.ok() ? path.value().string() : "") << "\n";
      return 0;
    }
    auto saved = config::save_config(config::Config{});
    if (!saved.ok()) {
      std::cerr << saved.error() << "\n";
      return 1;
    }
    auto path = config::config_path();
    std::cout << "wrote " << (path.ok() ? path.value().string() : "config") << "\n";
    return 0;
  }

  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }

  if (args.empty() || args[0] == "show") {
    std::cout << config::render_config(cfg.value());
    return 0;
  }

  if (args[0] == "validate") {
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

  std::cerr << "unknown config command\n";
  return 1;
}

int run_probe(std::vector<std::string> args) {
  auto cfg = load_and_observe();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  std::string user_agent;
  if (take_option(args, "--user-agent", "-u", user_agent)) {
    cfg.value().probe.user_agent = user_agent;
  }

  engine::ScriptedBackend backend(cfg.value().probe.recognition_available);
  const capability::CapabilityProbe probe(
      capability::detect_environment(cfg.value().probe, backend), cfg.value().wake);
  print_device(probe);
  std::cout << "supported: " << (probe.is_supported() ? "yes" : "no") << "\n";
  if (!probe.is_supported()) {
    std::cout << "reason: " << probe.unsupported_reason() << "\n";
  }
  const auto &profile = probe.engine_profile();
  std::cout << "profile: " << profile.name << "\n";
  if (profile.fixed_restart_delay.has_value()) {
    std::cout << "restart_delay_ms: " << profile.fixed_restart_delay->count() << "\n";
  } else {
    std::cout << "restart_delay_ms: " << cfg.value().wake.restart_delay_min.count() << "-"
              << cfg.value().wake.restart_delay_max.count() << "\n";
  }
  return 0;
}

int run_match(std::vector<std::string> args) {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }

  std::vector<std::string> phrases;
  std::string value;
  while (take_option(args, "--phrase", "-p", value)) {
    phrases.push_back(common::to_lower(common::trim(value)));
  }
  if (phrases.empty()) {
    phrases = cfg.value().wake.phrases;
  }

  std::size_t max_distance = cfg.value().wake.max_distance;
  if (take_option(args, "--max-distance", "-d", value)) {
    try {
      max_distance = static_cast<std::size_t>(std::stoul(value));
    } catch (const std::exception &) {
      std::cerr << "invalid --max-distance: " << value << "\n";
      return 1;
    }
  }

  const std::string text = common::trim(join_tokens(args));
  if (text.empty()) {
    std::cerr << "usage: hotword match [--phrase P ...] [--max-distance N] TEXT\n";
    return 1;
  }

  const auto result = matcher::match_fragment(text, phrases, max_distance);
  std::cout << "window: " << common::join(matcher::window_tokens(text), " ") << "\n";
  if (!result.matched) {
    std::cout << "matched: false\n";
    return 1;
  }
  std::cout << "matched: true\n";
  std::cout << "phrase: " << result.phrase.value_or("") << "\n";
  std::cout << "distance: " << result.distance.value_or(0) << "\n";
  std::cout << "candidate: " << result.candidate << "\n";
  return 0;
}

int run_preference(const std::string &command, std::vector<std::string> args) {
  auto cfg = load_and_observe();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  auto path = config::preferences_path(cfg.value());
  if (!path.ok()) {
    std::cerr << path.error() << "\n";
    return 1;
  }
  preference::SqlitePreferenceStore store(path.value());
  if (!store.open_status().ok()) {
    std::cerr << store.open_status().error() << "\n";
    return 1;
  }
  preference::WakeWordPreference pref(store);
  auto status = pref.load();
  if (!status.ok()) {
    std::cerr << status.error() << "\n";
    return 1;
  }

  if (command == "enable" || command == "disable") {
    status = pref.set_enabled(command == "enable");
  } else {
    const std::string action = args.empty() ? "status" : args[0];
    if (action == "accept") {
      status = pref.accept_consent(!take_flag(args, "--no-enable"));
    } else if (action == "decline") {
      status = pref.decline_consent();
    } else if (action != "status") {
      std::cerr << "usage: hotword consent accept|decline|status\n";
      return 1;
    }
  }
  if (!status.ok()) {
    std::cerr << status.error() << "\n";
    return 1;
  }
  print_preference(pref.state());
  return 0;
}

int run_listen(std::vector<std::string> args) {
  auto cfg = load_and_observe();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  auto valid = config::validate_config(cfg.value());
  if (!valid.ok()) {
    std::cerr << "invalid config: " << valid.error() << "\n";
    return 1;
  }
  for (const auto &warning : valid.value()) {
    std::cerr << "warning: " << warning << "\n";
  }

  const bool force = take_flag(args, "--force");
  std::string user_agent;
  if (take_option(args, "--user-agent", "-u", user_agent)) {
    cfg.value().probe.user_agent = user_agent;
  }

  std::chrono::milliseconds linger{0};
  std::string value;
  if (take_option(args, "--linger", "-l", value)) {
    try {
      linger = std::chrono::milliseconds(std::stoll(value));
    } catch (const std::exception &) {
      std::cerr << "invalid --linger: " << value << "\n";
      return 1;
    }
    if (linger.count() < 0 || linger > config::MAX_DURATION) {
      std::cerr << "invalid --linger: " << value << "\n";
      return 1;
    }
  }

  std::optional<InputFile> input_file;
  std::string input_path;
  if (take_option(args, "--input", "-i", input_path)) {
    input_file.emplace(input_path);
    if (input_file->fd() < 0) {
      std::cerr << "cannot open " << input_path << ": " << std::strerror(errno) << "\n";
      return 1;
    }
  }

  auto path = config::preferences_path(cfg.value());
  if (!path.ok()) {
    std::cerr << path.error() << "\n";
    return 1;
  }
  preference::SqlitePreferenceStore store(path.value());
  if (!store.open_status().ok()) {
    std::cerr << store.open_status().error() << "\n";
    return 1;
  }
  preference::WakeWordPreference pref(store);
  auto status = pref.load();
  if (!status.ok()) {
    std::cerr << status.error() << "\n";
    return 1;
  }
  const bool enabled = force || pref.active();
  if (!enabled) {
    std::cerr << "wake word is not active (consent "
              << preference::to_string(pref.state().consent)
              << "); run 'hotword consent accept' or pass --force\n";
  }

  engine::ScriptedBackend backend(cfg.value().probe.recognition_available);
  const capability::CapabilityProbe probe(
      capability::detect_environment(cfg.value().probe, backend), cfg.value().wake);
  scheduler::SteadyClock clock;
  scheduler::TimerQueue timers(clock);
  scheduler::EventLoop loop(timers, input_file.has_value() ? input_file->fd() : STDIN_FILENO);
  loop.set_linger(linger);

  const detector::WakeWordDetector *observed = nullptr;
  detector::WakeWordDetector wake(
      cfg.value().wake, probe, backend, timers, &store,
      [&observed]() {
        std::cout << "wake";
        if (observed != nullptr) {
          std::cout << " \"" << observed->last_fragment() << "\"";
        }
        std::cout << "\n" << std::flush;
      },
      detector::DetectorOptions{.enabled = enabled});
  observed = &wake;

  pref.on_change([&wake](const preference::PreferenceState &state) {
    if (state.active()) {
      wake.enable();
    } else {
      wake.disable();
    }
  });

  loop.on_line([&](const std::string &raw) {
    const std::string line = common::trim(raw);
    if (line.empty()) {
      return;
    }
    if (line[0] != ':') {
      if (!backend.emit_result(line, true)) {
        std::cerr << "(not listening: " << detector::to_string(wake.state()) << ")\n";
      }
      return;
    }

    std::vector<std::string> parts;
    std::istringstream in(line.substr(1));
    for (std::string part; in >> part;) {
      parts.push_back(part);
    }
    const std::string command = parts.empty() ? "" : parts[0];
    if (command == "enable") {
      wake.enable();
    } else if (command == "disable") {
      wake.disable();
    } else if (command == "suspend") {
      wake.suspend();
    } else if (command == "resume") {
      wake.resume();
    } else if (command == "dictation" && parts.size() == 2) {
      wake.set_dictation_active(parts[1] == "on");
    } else if (command == "hidden") {
      wake.set_page_visible(false);
    } else if (command == "visible") {
      wake.set_page_visible(true);
    } else if (command == "interact") {
      wake.notify_user_interaction();
    } else if (command == "spoken") {
      wake.notify_speech_output_completed();
    } else if (command == "end") {
      if (!backend.emit_end()) {
        std::cerr << "(no running session)\n";
      }
    } else if (command == "error" && parts.size() == 2) {
      if (!backend.emit_error(parts[1])) {
        std::cerr << "(no running session)\n";
      }
    } else if (command == "accept") {
      auto changed = pref.accept_consent();
      if (!changed.ok()) {
        std::cerr << changed.error() << "\n";
      }
    } else if (command == "decline") {
      auto changed = pref.decline_consent();
      if (!changed.ok()) {
        std::cerr << changed.error() << "\n";
      }
    } else if (command == "status") {
      print_snapshot(wake.snapshot());
    } else if (command == "quit") {
      loop.stop();
    } else {
      std::cerr << "unknown command: " << line << "\n";
    }
    std::cout << std::flush;
  });

  std::cerr << "listening on " << (input_file.has_value() ? input_path : "stdin") << " ("
            << probe.engine_profile().name << " profile); "
            << "type text or :status, :quit\n";
  status = loop.run();
  if (auto *observer = observability::get_global_observer(); observer != nullptr) {
    observer->flush();
  }
  if (!status.ok()) {
    std::cerr << status.error() << "\n";
    return 1;
  }
  return 0;
}

} // namespace

void print_help() {
  constexpr const char *RESET = "\033[0m";
  constexpr const char *BOLD = "\033[1m";
  constexpr const char *DIM = "\033[2m";
  constexpr const char *CYAN = "\033[36m";
  constexpr const char *GREEN = "\033[32m";
  constexpr const char *YELLOW = "\033[33m";

  std::cout << "\n";
  std::cout << BOLD << CYAN << "  hotword" << RESET << DIM << "  passive wake-phrase listener"
            << RESET << "\n";
  std::cout << DIM << "  " << version_string() << RESET << "\n\n";

  std::cout << BOLD << "  USAGE" << RESET << "\n";
  std::cout << DIM << "  $ " << RESET << "hotword [--config PATH] <command> [options]\n\n";

  std::cout << BOLD << "  LISTENING" << RESET << "\n";
  std::cout << "  " << GREEN << "listen" << RESET << DIM
            << "         Run the detector; stdin lines are transcript fragments" << RESET << "\n";
  std::cout << DIM << "                 [--force] [--user-agent UA] [--input FILE] [--linger MS]"
            << RESET << "\n";
  std::cout << "  " << GREEN << "match" << RESET << " TEXT" << DIM
            << "     Score one fragment against the wake phrases" << RESET << "\n";
  std::cout << "  " << GREEN << "probe" << RESET << DIM
            << "          Classify a user agent and report support" << RESET << "\n\n";

  std::cout << BOLD << "  PREFERENCES" << RESET << "\n";
  std::cout << "  " << GREEN << "consent" << RESET << " accept|decline|status" << "\n";
  std::cout << "  " << GREEN << "enable" << RESET << DIM << " / " << RESET << GREEN << "disable"
            << RESET << DIM << "   Toggle the stored wake word preference" << RESET << "\n\n";

  std::cout << BOLD << "  CONFIG" << RESET << "\n";
  std::cout << "  " << GREEN << "config show" << RESET << DIM << "    Display current configuration"
            << RESET << "\n";
  std::cout << "  " << GREEN << "config validate" << RESET << DIM << " Check configuration"
            << RESET << "\n";
  std::cout << "  " << GREEN << "config init" << RESET << DIM << "    Write a default config file"
            << RESET << "\n";
  std::cout << "  " << GREEN << "config-path" << RESET << DIM << "    Print the config file path"
            << RESET << "\n";
  std::cout << "  " << GREEN << "version" << RESET << DIM << "        Show version" << RESET
            << "\n\n";

  std::cout << BOLD << "  LISTEN COMMANDS" << RESET << DIM << " (inside 'hotword listen')" << RESET
            << "\n";
  std::cout << "  " << YELLOW << ":enable" << RESET << "  " << YELLOW << ":disable" << RESET
            << "  " << YELLOW << ":suspend" << RESET << "  " << YELLOW << ":resume" << RESET
            << "  " << YELLOW << ":dictation on|off" << RESET << "  " << YELLOW << ":hidden"
            << RESET << "  " << YELLOW << ":visible" << RESET << "\n";
  std::cout << "  " << YELLOW << ":interact" << RESET << "  " << YELLOW << ":spoken" << RESET
            << "  " << YELLOW << ":end" << RESET << "  " << YELLOW << ":error CODE" << RESET
            << "  " << YELLOW << ":accept" << RESET << "  " << YELLOW << ":decline" << RESET
            << "  " << YELLOW << ":status" << RESET << "  " << YELLOW << ":quit" << RESET << "\n";
  std::cout << "\n";
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
    return 0;
  }
  if (subcommand == "config") {
    return run_config(std::move(args));
  }
  if (subcommand == "probe") {
    return run_probe(std::move(args));
  }
  if (subcommand == "match") {
    return run_match(std::move(args));
  }
  if (subcommand == "consent" || subcommand == "enable" || subcommand == "disable") {
    return run_preference(subcommand, std::move(args));
  }
  if (subcommand == "listen") {
    return run_listen(std::move(args));
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace hotword::cli
