// =============================================================================
// TabFold — Application Entry Point
// wWinMain, message pump, component wiring, lifecycle.
//
// Threading model (4 threads):
//   Main Thread:      Message pump, WinEvent hooks, app lifecycle.
//   Worker Thread:    Fold attempts and open requests, one at a time.
//   Apartment Thread: STA owning IShellWindows; every automation call.
//   Pipe Thread:      Open-request listener.
//
// Command line:
//   tabfold.exe                 run (single instance)
//   tabfold.exe --open <path>   hand <path> to the running instance
//   tabfold.exe --exit          ask the running instance to quit
// =============================================================================

#ifndef UNICODE
#define UNICODE
#endif
#ifndef _UNICODE
#define _UNICODE
#endif

#include <windows.h>
#include <shellapi.h>

#include "tabfold/common/AppMessages.h"
#include "tabfold/common/Clock.h"
#include "tabfold/common/ShellConstants.h"
#include "tabfold/input/OpenRequestServer.h"
#include "tabfold/input/RegistrationWatcher.h"
#include "tabfold/input/WindowEventSource.h"
#include "tabfold/logic/FoldCoordinator.h"
#include "tabfold/output/ShellNavigator.h"
#include "tabfold/output/ShellWindowsAutomation.h"
#include "tabfold/output/Win32WindowBridge.h"
#include "tabfold/support/Log.h"
#include "tabfold/support/SettingsManager.h"
#include "tabfold/support/WorkerThread.h"

#include <filesystem>
#include <memory>
#include <string>

// Components: lifetime = application. Declaration order is construction
// order; the coordinator borrows the ones above it.
static TabFold::SteadyClock g_clock;
static TabFold::WorkerThread g_worker;
static TabFold::Win32WindowBridge g_windows;
static TabFold::ShellWindowsAutomation g_automation;
static TabFold::ShellNavigator g_navigator(g_automation, g_windows);
static TabFold::FoldCoordinator g_coordinator(g_windows, g_navigator, g_clock, g_worker);
static TabFold::RegistrationWatcher g_registration(g_navigator, g_coordinator.classifier(),
                                                   g_coordinator.ledger(), g_clock, g_worker);
static TabFold::WindowEventSource g_windowEvents;
static TabFold::OpenRequestServer g_openRequests;
static TabFold::SettingsManager g_settingsManager;
static std::string g_configPath;

static constexpr const wchar_t* kSingleInstanceMutex = L"Local\\TabFold.SingleInstance";
static constexpr const wchar_t* kMsgWindowClass = L"TabFoldMsgWindow";

// Early-hidden sweep timer ID and interval
static constexpr UINT_PTR kSweepTimerId = 1;
static constexpr UINT kSweepIntervalMs = 1000;

using TabFold::WM_GRACEFUL_EXIT;
// Explorer restart detection
static UINT WM_TASKBAR_CREATED = 0;

// Observer callback: pushes settings to the coordinator and the log.
// Runs on the main thread.
static void onSettingsChanged(const TabFold::SettingsSnapshot& s, void* /*userData*/)
{
    g_coordinator.applySettings(s);
    TabFold::Log::setMinimumLevel(static_cast<TabFold::LogLevel>(s.logLevel));

    if (s.logToFile && !g_configPath.empty())
    {
        auto logPath = std::filesystem::path(g_configPath).parent_path() / "tabfold.log";
        if (!TabFold::Log::enableFileSink(logPath.wstring()))
            TabFold::Log::warn(L"could not open log file %ls", logPath.wstring().c_str());
    }
    else
    {
        TabFold::Log::disableFileSink();
    }
}

// ── Registration channel ────────────────────────────────────────────────────

static bool startRegistrationChannel()
{
    auto snap = g_settingsManager.snapshot();
    if (!snap->autoFoldNewWindows || !snap->useRegistrationNotifications)
    {
        g_coordinator.setRegistrationChannelActive(false);
        return false;
    }

    const bool hooked = g_registration.start(
        [](const TabFold::RegisteredCandidate& c) { g_coordinator.foldRegistered(c); },
        []() { g_coordinator.onRegistrationUnresolved(); });
    g_coordinator.setRegistrationChannelActive(hooked);
    return hooked;
}

// Explorer restarted: its collection server is gone. Rebuild the apartment,
// resubscribe and reseed. Runs on the worker so no fold sees a half-built
// channel.
static void rebuildShellChannel()
{
    TabFold::Log::info(L"shell restarted, rebuilding automation channel");
    g_coordinator.setRegistrationChannelActive(false);
    g_registration.stop();
    g_automation.stop();
    if (!g_automation.start())
    {
        TabFold::Log::error(L"automation channel could not be rebuilt");
        return;
    }
    g_coordinator.seedKnownWindows();
    startRegistrationChannel();
}

// ── Client modes ────────────────────────────────────────────────────────────

static int runOpenClient(const std::wstring& path)
{
    const auto foreground = reinterpret_cast<TabFold::WindowHandle>(GetForegroundWindow());
    if (TabFold::OpenRequestClient::send(path, foreground))
        return 0;

    // Nobody listening: never lose the user's request
    TabFold::Log::info(L"no running instance, launching %ls directly", path.c_str());
    return g_windows.launchShellWindow(path) ? 0 : 1;
}

static int runExitClient()
{
    HWND running = FindWindowW(kMsgWindowClass, nullptr);
    if (!running)
        return 1;
    PostMessageW(running, WM_GRACEFUL_EXIT, 0, 0);
    return 0;
}

// Hidden window for WM_TIMER, WM_ENDSESSION and TaskbarCreated
static HWND g_msgWindow = nullptr;

static void shutdownEngine()
{
    g_openRequests.stop();
    g_windowEvents.uninstall();
    g_registration.stop();
    g_worker.stop();
    g_coordinator.restoreAllEarlyHidden();
    g_automation.stop();
}

static LRESULT CALLBACK msgWndProc(HWND hWnd, UINT msg, WPARAM wParam, LPARAM lParam)
{
    switch (msg)
    {
    case WM_TIMER:
        if (wParam == kSweepTimerId)
            g_worker.post([]() { g_coordinator.sweepEarlyHidden(); });
        return 0;

    case WM_GRACEFUL_EXIT:
        PostQuitMessage(0);
        return 0;

    case WM_ENDSESSION:
        if (wParam)
        {
            // Logoff/shutdown: the pump will not run again. Stop the engine
            // and show any window hidden in anticipation of a fold.
            shutdownEngine();
            if (!g_configPath.empty())
                g_settingsManager.saveToFile(g_configPath.c_str());
        }
        return 0;

    default:
        if (WM_TASKBAR_CREATED && msg == WM_TASKBAR_CREATED)
        {
            g_worker.post(rebuildShellChannel);
            return 0;
        }
        return DefWindowProcW(hWnd, msg, wParam, lParam);
    }
}

static HWND createMessageWindow(HINSTANCE hInstance)
{
    WNDCLASSEXW wc = {};
    wc.cbSize = sizeof(WNDCLASSEXW);
    wc.lpfnWndProc = msgWndProc;
    wc.hInstance = hInstance;
    wc.lpszClassName = kMsgWindowClass;

    RegisterClassExW(&wc);

    // Hidden top-level window (not HWND_MESSAGE) so it receives broadcast
    // messages like WM_ENDSESSION and TaskbarCreated.
    return CreateWindowExW(0, kMsgWindowClass, nullptr, 0, 0, 0, 0, 0,
                           nullptr, nullptr, hInstance, nullptr);
}

int WINAPI wWinMain(
    _In_ HINSTANCE hInstance,
    _In_opt_ HINSTANCE /*hPrevInstance*/,
    _In_ LPWSTR /*lpCmdLine*/,
    _In_ int /*nCmdShow*/)
{
    TabFold::Log::initialize();

    // ── 0. Command line ─────────────────────────────────────────────────────
    int argc = 0;
    LPWSTR* argv = CommandLineToArgvW(GetCommandLineW(), &argc);
    if (argv)
    {
        std::wstring verb = argc > 1 ? argv[1] : L"";
        std::wstring arg = argc > 2 ? argv[2] : L"";
        LocalFree(argv);

        if (verb == L"--open")
            return arg.empty() ? 1 : runOpenClient(arg);
        if (verb == L"--exit")
            return runExitClient();
    }

    // ── 0a. Single instance ─────────────────────────────────────────────────
    HANDLE instanceMutex = CreateMutexW(nullptr, TRUE, kSingleInstanceMutex);
    if (!instanceMutex)
        return 1;
    if (GetLastError() == ERROR_ALREADY_EXISTS)
    {
        CloseHandle(instanceMutex);
        return 0;
    }

    // ── 0b. Load settings ───────────────────────────────────────────────────
    // Register observers BEFORE loading so the initial load triggers them.
    g_settingsManager.addObserver(onSettingsChanged, nullptr);
    g_configPath = TabFold::SettingsManager::getDefaultConfigPath();
    if (g_configPath.empty() || !g_settingsManager.loadFromFile(g_configPath.c_str()))
        onSettingsChanged(*g_settingsManager.snapshot(), nullptr); // defaults apply
    auto settings = g_settingsManager.snapshot();

    TabFold::Log::info(L"starting (auto-fold %ls)", settings->autoFoldNewWindows ? L"on" : L"off");

    // ── 1. Apartment + worker ───────────────────────────────────────────────
    if (!g_automation.start())
    {
        MessageBoxW(nullptr,
                    L"Failed to connect to the shell window collection.\n\n"
                    L"TabFold cannot function without it.",
                    L"TabFold — Startup Error",
                    MB_OK | MB_ICONERROR);
        CloseHandle(instanceMutex);
        return 1;
    }
    g_worker.start();

    // ── 2. Seed known windows, then hooks (must be on a pumping thread) ─────
    g_coordinator.seedKnownWindows();

    if (settings->autoFoldNewWindows)
    {
        const bool registered = startRegistrationChannel();
        const bool earlyHide = registered && settings->earlyHideOnCreate;
        if (!g_windowEvents.install(g_coordinator, earlyHide))
            TabFold::Log::error(L"window event hooks unavailable, automatic folding disabled");
    }
    else
    {
        TabFold::Log::info(L"on-demand mode, creation hooks not installed");
    }

    // ── 3. Open requests ────────────────────────────────────────────────────
    g_openRequests.start([](const TabFold::OpenRequest& request) {
        g_worker.post([request]() {
            g_coordinator.openLocationAsTab(request.path, request.foreground);
        });
    });

    // ── 4. Message window for sweep timer + WM_ENDSESSION ───────────────────
    g_msgWindow = createMessageWindow(hInstance);
    if (!g_msgWindow)
    {
        MessageBoxW(nullptr, L"Failed to create the TabFold message window.",
                    L"TabFold — Startup Error", MB_OK | MB_ICONERROR);
        shutdownEngine();
        CloseHandle(instanceMutex);
        return 1;
    }
    SetTimer(g_msgWindow, kSweepTimerId, kSweepIntervalMs, nullptr);
    WM_TASKBAR_CREATED = RegisterWindowMessageW(L"TaskbarCreated");

    // ── 5. Run Win32 message pump ───────────────────────────────────────────
    // WinEvent hooks are delivered through this pump.
    MSG msg;
    while (GetMessageW(&msg, nullptr, 0, 0) > 0)
    {
        TranslateMessage(&msg);
        DispatchMessageW(&msg);
    }

    // ── 6. Shutdown sequence ────────────────────────────────────────────────
    KillTimer(g_msgWindow, kSweepTimerId);
    DestroyWindow(g_msgWindow);
    g_msgWindow = nullptr;

    shutdownEngine();

    // Save settings on clean exit
    if (!g_configPath.empty())
        g_settingsManager.saveToFile(g_configPath.c_str());

    TabFold::Log::info(L"stopped");
    TabFold::Log::disableFileSink();
    CloseHandle(instanceMutex);
    return 0;
}
