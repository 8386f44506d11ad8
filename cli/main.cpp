#include <csignal>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>

#include "sdrboost/context.hpp"
#include "sdrboost/engine.hpp"
#include "sdrboost/hotkey.hpp"
#include "sdrboost/platform.hpp"

namespace {

class ConsoleObserver : public sdrboost::BrightnessObserver {
 public:
  double step_size = sdrboost::DEFAULT_STEP_SIZE;

  void on_brightness_changed(double value, bool exact) override {
    std::cout << "Brightness: "
              << sdrboost::display_percent(value, step_size, exact) << "% ("
              << std::fixed << std::setprecision(2) << value << ")\n"
              << std::defaultfloat;
  }

  void on_error(sdrboost::ErrorKind kind, const std::string& message) override {
    std::cerr << "Error (" << sdrboost::to_string(kind) << "): " << message
              << "\n";
  }
};

struct SetOptions {
  std::optional<std::string> increase;
  std::optional<std::string> decrease;
  std::optional<std::string> custom;
  std::optional<std::string> step;
  std::optional<std::string> custom_brightness;
  std::optional<std::string> brightness;

  bool empty() const {
    return !increase && !decrease && !custom && !step && !custom_brightness &&
           !brightness;
  }
};

}  // namespace

static void signal_handler(int sig) {
  if (sig == SIGTERM || sig == SIGINT) {
    sdrboost::quit_message_loop();
  }
}

static void print_usage(const char* prog) {
  std::cout
      << "Usage: " << prog
      << " <command> [options]\n\n"
         "Commands:\n"
         "  run                     Install the hotkeys and run until Ctrl+C\n"
         "  increase                Raise SDR brightness by one step\n"
         "  decrease                Lower SDR brightness by one step\n"
         "  custom                  Set SDR brightness to the custom level\n"
         "  status                  Show hotkeys and stored brightness\n"
         "  set [options]           Change hotkeys or levels\n"
         "  reset                   Restore default settings\n"
         "  keys                    List accepted modifiers and keys\n\n"
         "Options:\n"
         "  -c, --config <path>     Settings file (default: "
      << sdrboost::ConfigStore::get_config_path()
      << ")\n"
         "  -v, --verbose           Verbose output\n\n"
         "Set options:\n"
         "  --increase <mods+key>   e.g. Control+F2\n"
         "  --decrease <mods+key>   e.g. Control+F1\n"
         "  --custom <mods+key>     e.g. Control+Shift+F3\n"
         "  --step <1-50>           Step size in percent\n"
         "  --custom-brightness <0-100>  Custom level in percent\n"
         "  --brightness <1.2-6.0>  Stored boost value\n";
}

static std::optional<double> parse_number(const std::string& text) {
  if (text.empty()) return std::nullopt;
  char* end = nullptr;
  double value = std::strtod(text.c_str(), &end);
  if (end == nullptr || *end != '\0') return std::nullopt;
  return value;
}

static void print_settings(const sdrboost::EngineContext& ctx) {
  auto settings = ctx.settings();
  std::cout << "Settings: " << ctx.config_path() << "\n"
            << "  Increase: " << sdrboost::to_string(settings.increase) << "\n"
            << "  Decrease: " << sdrboost::to_string(settings.decrease) << "\n"
            << "  Custom: " << sdrboost::to_string(settings.custom) << "\n"
            << "  Step: " << settings.step_size * 100.0 << "%\n"
            << "  Custom brightness: "
            << sdrboost::display_percent(settings.custom_brightness,
                                         settings.step_size, true)
            << "% (" << settings.custom_brightness << ")\n"
            << "  Brightness: " << ctx.display_percent() << "% ("
            << settings.current_brightness << ")\n";
}

static int cmd_run(sdrboost::EngineContext& ctx) {
  if (!ctx.start(true)) {
    std::cerr << "Failed to initialize brightness controller.\n"
                 "Please check if your system supports this feature.\n";
    return 1;
  }

  auto settings = ctx.settings();
  std::cout << "Hotkeys active (Ctrl+C to exit):\n"
            << "  Increase: " << sdrboost::to_string(settings.increase) << "\n"
            << "  Decrease: " << sdrboost::to_string(settings.decrease) << "\n"
            << "  Custom: " << sdrboost::to_string(settings.custom) << "\n";

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  int ret = sdrboost::run_message_loop();
  ctx.stop();

  std::cout << "Stopping.\n";
  return ret;
}

static int cmd_step(sdrboost::EngineContext& ctx, const std::string& command) {
  if (!ctx.start(false)) {
    std::cerr << "Failed to initialize brightness controller.\n";
    return 1;
  }

  bool changed = false;
  if (command == "increase") {
    changed = ctx.increase();
  } else if (command == "decrease") {
    changed = ctx.decrease();
  } else {
    changed = ctx.apply_custom();
  }

  if (!changed) {
    std::cout << "Brightness unchanged at " << ctx.display_percent() << "%\n";
  }
  return 0;
}

static int cmd_set(sdrboost::EngineContext& ctx, ConsoleObserver& observer,
                   const SetOptions& opts) {
  if (opts.empty()) {
    std::cerr << "Usage: sdrboost set [--increase M+K] [--decrease M+K] "
                 "[--custom M+K] [--step PCT] [--custom-brightness PCT] "
                 "[--brightness VALUE]\n";
    return 1;
  }

  auto settings = ctx.settings();

  struct BindingOption {
    const std::optional<std::string>& text;
    sdrboost::HotkeyBinding& target;
    const char* name;
  };
  BindingOption bindings[] = {
      {opts.increase, settings.increase, "Increase"},
      {opts.decrease, settings.decrease, "Decrease"},
      {opts.custom, settings.custom, "Custom"},
  };
  for (auto& b : bindings) {
    if (!b.text) continue;
    auto parsed = sdrboost::parse_binding(*b.text);
    if (!parsed) {
      std::cerr << "Invalid " << b.name << " hotkey: " << *b.text << "\n";
      return 1;
    }
    b.target = *parsed;
  }

  if (opts.step) {
    auto pct = parse_number(*opts.step);
    if (!pct) {
      std::cerr << "Step size must be a number\n";
      return 1;
    }
    settings.step_size = *pct / 100.0;
  }

  if (opts.custom_brightness) {
    auto pct = parse_number(*opts.custom_brightness);
    if (!pct) {
      std::cerr << "Custom brightness must be a number\n";
      return 1;
    }
    settings.custom_brightness = sdrboost::percent_to_brightness(*pct);
  }

  if (opts.brightness) {
    auto value = parse_number(*opts.brightness);
    if (!value) {
      std::cerr << "Brightness must be a number\n";
      return 1;
    }
    settings.current_brightness = *value;
  }

  if (ctx.update_settings(settings)) {
    return 1;
  }

  observer.step_size = ctx.settings().step_size;
  std::cout << "Settings saved successfully!\n";
  print_settings(ctx);
  return 0;
}

static int cmd_keys() {
  std::cout << "Modifiers:\n";
  for (auto combo : sdrboost::bindable_modifiers()) {
    std::cout << "  " << sdrboost::to_string(combo) << "\n";
  }
  std::cout << "Keys:\n ";
  for (auto key : sdrboost::accepted_keys()) {
    std::cout << " " << sdrboost::to_string(key);
  }
  std::cout << "\n(OemPlus and OemMinus may also be written as + and -)\n";
  return 0;
}

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage(argv[0]);
    return 1;
  }

  std::string config_path;
  bool verbose = false;
  SetOptions set_opts;
  std::string command;

  auto take = [&](int& i, std::optional<std::string>& out) {
    if (++i < argc) out = argv[i];
  };

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-c" || arg == "--config") {
      if (++i < argc) config_path = argv[i];
    } else if (arg == "-v" || arg == "--verbose") {
      verbose = true;
    } else if (arg == "--increase") {
      take(i, set_opts.increase);
    } else if (arg == "--decrease") {
      take(i, set_opts.decrease);
    } else if (arg == "--custom") {
      take(i, set_opts.custom);
    } else if (arg == "--step") {
      take(i, set_opts.step);
    } else if (arg == "--custom-brightness") {
      take(i, set_opts.custom_brightness);
    } else if (arg == "--brightness") {
      take(i, set_opts.brightness);
    } else if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      return 0;
    } else if (command.empty()) {
      command = arg;
    } else {
      std::cerr << "Unexpected argument: " << arg << "\n";
      return 1;
    }
  }

  if (command.empty()) {
    print_usage(argv[0]);
    return 1;
  }

  if (command == "keys") {
    return cmd_keys();
  }

  ConsoleObserver observer;
  sdrboost::EngineContext ctx(config_path, observer, verbose);
  auto loaded = ctx.load();
  observer.step_size = ctx.settings().step_size;
  if (verbose && loaded == sdrboost::LoadResult::Created) {
    std::cout << "Created " << ctx.config_path() << " with defaults\n";
  }

  if (command == "run") {
    return cmd_run(ctx);
  } else if (command == "increase" || command == "decrease" ||
             command == "custom") {
    return cmd_step(ctx, command);
  } else if (command == "status") {
    print_settings(ctx);
    return 0;
  } else if (command == "set") {
    return cmd_set(ctx, observer, set_opts);
  } else if (command == "reset") {
    if (ctx.reset_settings()) {
      return 1;
    }
    std::cout << "Settings restored to defaults.\n";
    print_settings(ctx);
    return 0;
  } else {
    std::cerr << "Unknown command: " << command << "\n";
    print_usage(argv[0]);
    return 1;
  }
}
