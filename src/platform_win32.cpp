#include "sdrboost/platform.hpp"

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>

#include <atomic>
#include <cwchar>
#include <vector>

#include "sdrboost/hotkey_listener.hpp"

namespace sdrboost {

namespace {

// dwmapi.dll exports DwmSetSDRToHDRBoost by ordinal only.
constexpr WORD SET_BOOST_ORDINAL = 171;
// SDRWhiteLevel is in thousandths of the 80 nit reference white.
constexpr double SDR_WHITE_LEVEL_SCALE = 1000.0;

using SetBoostFn = void(WINAPI*)(HMONITOR, double);

std::string last_error_text(const char* what) {
  return std::string(what) + " (error " + std::to_string(GetLastError()) + ")";
}

struct DisplayTarget {
  LUID adapter_id{};
  UINT32 target_id = 0;
};

bool find_display_target(HMONITOR monitor, DisplayTarget& out,
                         std::string& error) {
  MONITORINFOEXW info{};
  info.cbSize = sizeof(info);
  if (!GetMonitorInfoW(monitor, &info)) {
    error = last_error_text("GetMonitorInfo failed");
    return false;
  }

  UINT32 path_count = 0;
  UINT32 mode_count = 0;
  LONG rc = GetDisplayConfigBufferSizes(QDC_ONLY_ACTIVE_PATHS, &path_count,
                                        &mode_count);
  if (rc != ERROR_SUCCESS) {
    error = "GetDisplayConfigBufferSizes failed (" + std::to_string(rc) + ")";
    return false;
  }

  std::vector<DISPLAYCONFIG_PATH_INFO> paths(path_count);
  std::vector<DISPLAYCONFIG_MODE_INFO> modes(mode_count);
  rc = QueryDisplayConfig(QDC_ONLY_ACTIVE_PATHS, &path_count, paths.data(),
                          &mode_count, modes.data(), nullptr);
  if (rc != ERROR_SUCCESS) {
    error = "QueryDisplayConfig failed (" + std::to_string(rc) + ")";
    return false;
  }
  paths.resize(path_count);

  for (const auto& path : paths) {
    DISPLAYCONFIG_SOURCE_DEVICE_NAME source{};
    source.header.type = DISPLAYCONFIG_DEVICE_INFO_GET_SOURCE_NAME;
    source.header.size = sizeof(source);
    source.header.adapterId = path.sourceInfo.adapterId;
    source.header.id = path.sourceInfo.id;
    if (DisplayConfigGetDeviceInfo(&source.header) != ERROR_SUCCESS) {
      continue;
    }
    if (std::wcscmp(source.viewGdiDeviceName, info.szDevice) == 0) {
      out.adapter_id = path.targetInfo.adapterId;
      out.target_id = path.targetInfo.id;
      return true;
    }
  }

  error = "No active display path for the primary monitor";
  return false;
}

class DwmBoostApi : public BoostApi {
 public:
  DwmBoostApi(HMODULE module, HMONITOR monitor, SetBoostFn set_boost,
              DisplayTarget target)
      : module_(module),
        monitor_(monitor),
        set_boost_(set_boost),
        target_(target) {}

  ~DwmBoostApi() override {
    if (module_) FreeLibrary(module_);
  }

  DwmBoostApi(const DwmBoostApi&) = delete;
  DwmBoostApi& operator=(const DwmBoostApi&) = delete;

  std::optional<double> get_boost() override {
    DISPLAYCONFIG_SDR_WHITE_LEVEL level{};
    level.header.type = DISPLAYCONFIG_DEVICE_INFO_GET_SDR_WHITE_LEVEL;
    level.header.size = sizeof(level);
    level.header.adapterId = target_.adapter_id;
    level.header.id = target_.target_id;

    LONG status = DisplayConfigGetDeviceInfo(&level.header);
    if (status != ERROR_SUCCESS) {
      return std::nullopt;
    }
    // 1000 is the 80 nit reference, a multiplier of 1.0; the setter takes the
    // same multiplier, so the result lands in the 1.2-6.0 boost range.
    return static_cast<double>(level.SDRWhiteLevel) / SDR_WHITE_LEVEL_SCALE;
  }

  bool set_boost(double value) override {
    set_boost_(monitor_, value);
    return true;
  }

 private:
  HMODULE module_;
  HMONITOR monitor_;
  SetBoostFn set_boost_;
  DisplayTarget target_;
};

class AsyncKeyStateReader : public KeyStateReader {
 public:
  bool is_down(int vk_code) const override {
    return (GetAsyncKeyState(vk_code) & 0x8000) != 0;
  }
};

// The hook procedure must be a free function; it reaches the one installed
// listener through these.
HHOOK g_hook = nullptr;
std::atomic<HotkeyListener*> g_listener{nullptr};
std::atomic<DWORD> g_loop_thread{0};

LRESULT CALLBACK keyboard_proc(int code, WPARAM wparam, LPARAM lparam) {
  if (code == HC_ACTION && (wparam == WM_KEYDOWN || wparam == WM_SYSKEYDOWN)) {
    HotkeyListener* listener = g_listener.load();
    if (listener) {
      const auto* event = reinterpret_cast<const KBDLLHOOKSTRUCT*>(lparam);
      listener->on_key_down(static_cast<int>(event->vkCode));
    }
  }
  return CallNextHookEx(g_hook, code, wparam, lparam);
}

class LowLevelKeyboardHook : public KeyboardHook {
 public:
  ~LowLevelKeyboardHook() override { uninstall(); }

  bool install(HotkeyListener& listener, std::string& error) override {
    if (g_hook) {
      error = "A keyboard hook is already installed";
      return false;
    }

    g_listener.store(&listener);
    g_hook = SetWindowsHookExW(WH_KEYBOARD_LL, keyboard_proc,
                               GetModuleHandleW(nullptr), 0);
    if (!g_hook) {
      g_listener.store(nullptr);
      error = last_error_text("SetWindowsHookEx failed");
      return false;
    }
    installed_ = true;
    return true;
  }

  void uninstall() override {
    if (!installed_) return;
    UnhookWindowsHookEx(g_hook);
    g_hook = nullptr;
    g_listener.store(nullptr);
    installed_ = false;
  }

 private:
  bool installed_ = false;
};

}  // namespace

std::unique_ptr<BoostApi> open_boost_api(std::string& error) {
  HMONITOR monitor = MonitorFromWindow(nullptr, MONITOR_DEFAULTTOPRIMARY);
  if (!monitor) {
    error = "Failed to get primary monitor";
    return nullptr;
  }

  HMODULE module = LoadLibraryW(L"dwmapi.dll");
  if (!module) {
    error = last_error_text("Failed to load dwmapi.dll");
    return nullptr;
  }

  auto set_boost = reinterpret_cast<SetBoostFn>(
      GetProcAddress(module, MAKEINTRESOURCEA(SET_BOOST_ORDINAL)));
  if (!set_boost) {
    error = last_error_text("Failed to get DwmSetSDRToHDRBoost address");
    FreeLibrary(module);
    return nullptr;
  }

  DisplayTarget target;
  if (!find_display_target(monitor, target, error)) {
    FreeLibrary(module);
    return nullptr;
  }

  return std::make_unique<DwmBoostApi>(module, monitor, set_boost, target);
}

std::unique_ptr<KeyStateReader> create_key_state_reader() {
  return std::make_unique<AsyncKeyStateReader>();
}

std::unique_ptr<KeyboardHook> create_keyboard_hook() {
  return std::make_unique<LowLevelKeyboardHook>();
}

int run_message_loop() {
  g_loop_thread.store(GetCurrentThreadId());

  MSG msg;
  BOOL rc;
  while ((rc = GetMessageW(&msg, nullptr, 0, 0)) != 0) {
    if (rc == -1) {
      g_loop_thread.store(0);
      return 1;
    }
    TranslateMessage(&msg);
    DispatchMessageW(&msg);
  }

  g_loop_thread.store(0);
  return static_cast<int>(msg.wParam);
}

void quit_message_loop() {
  DWORD thread = g_loop_thread.load();
  if (thread != 0) {
    PostThreadMessageW(thread, WM_QUIT, 0, 0);
  }
}

}  // namespace sdrboost
