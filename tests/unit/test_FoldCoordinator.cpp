// =============================================================================
// Unit tests for FoldCoordinator
// End-to-end fold scenarios against the in-memory shell: conversion, reuse of
// existing tabs, rollback on every failure step, early hiding and the
// on-demand open path.
// =============================================================================

#include <catch2/catch.hpp>
#include "tabfold/logic/FoldCoordinator.h"
#include "tabfold/output/ShellNavigator.h"
#include "tabfold/support/WorkerThread.h"
#include "FakeShell.h"

#include <algorithm>

using namespace TabFold;
using namespace TabFold::Testing;

namespace
{

struct Rig
{
    FakeShell shell;
    ManualClock clock;
    ManualQueue worker;
    ShellNavigator navigator{shell, shell};
    FoldCoordinator coordinator{shell, navigator, clock, worker};

    // Mark `source` pending the way the hook path does, then fold it
    FoldOutcome fold(WindowHandle source, bool hideFirst = false)
    {
        REQUIRE(coordinator.ledger().tryBeginConversion(source, clock.nowMs()));
        return coordinator.foldWindow(source, kNullWindow, std::nullopt, hideFirst);
    }

    bool wasHidden(WindowHandle h) const
    {
        return std::find(shell.hidden.begin(), shell.hidden.end(), h) != shell.hidden.end();
    }

    bool wasShown(WindowHandle h) const
    {
        return std::find(shell.shown.begin(), shell.shown.end(), h) != shell.shown.end();
    }

    void configure(void (*edit)(SettingsSnapshot&))
    {
        SettingsSnapshot s = *coordinator.settings();
        edit(s);
        coordinator.applySettings(s);
    }
};

} // namespace

// ─── Conversion ─────────────────────────────────────────────────────────────

TEST_CASE("New window becomes a tab of the foreground window", "[FoldCoordinator]")
{
    Rig rig;
    WindowHandle target = rig.shell.addShellWindow({L"C:\\Docs"});
    rig.shell.setForeground(target);
    WindowHandle source = rig.shell.addShellWindow({L"C:\\Temp"});

    REQUIRE(rig.fold(source) == FoldOutcome::Converted);

    REQUIRE_FALSE(rig.shell.alive(source));
    REQUIRE(rig.wasHidden(source));
    REQUIRE(rig.shell.shown.empty());
    REQUIRE(rig.shell.tabs(target).size() == 2);
    REQUIRE(rig.shell.locationOf(rig.shell.activeTab(target)) == std::wstring(L"C:\\Temp"));
    REQUIRE(rig.shell.foregroundWindow() == target);
    REQUIRE(rig.shell.countCommands(kCmdOpenNewTab) == 1);
    REQUIRE(rig.coordinator.ledger().pendingCount() == 0);
}

TEST_CASE("Source location is waited for while it is virtual", "[FoldCoordinator]")
{
    Rig rig;
    WindowHandle target = rig.shell.addShellWindow({L"C:\\Docs"});
    rig.shell.setForeground(target);
    WindowHandle source = rig.shell.addShellWindow({std::wstring(kThisPc)});
    WindowHandle sourceTab = rig.shell.activeTab(source);
    rig.clock.onSleep = [&](int64_t) {
        if (rig.clock.sleptMs >= 200)
            rig.shell.setLocation(sourceTab, std::wstring(L"E:\\Media"));
    };

    REQUIRE(rig.fold(source) == FoldOutcome::Converted);
    REQUIRE(rig.shell.locationOf(rig.shell.activeTab(target)) == std::wstring(L"E:\\Media"));
}

TEST_CASE("Navigation is retried before falling back", "[FoldCoordinator]")
{
    Rig rig;
    WindowHandle target = rig.shell.addShellWindow({L"C:\\Docs"});
    rig.shell.setForeground(target);
    WindowHandle source = rig.shell.addShellWindow({L"C:\\Temp"});
    rig.shell.navigateFailures = 2;

    REQUIRE(rig.fold(source) == FoldOutcome::Converted);
    REQUIRE(rig.shell.navigations.size() == 3);
    REQUIRE(rig.shell.pasted.empty());
}

TEST_CASE("Address bar fallback completes the fold", "[FoldCoordinator]")
{
    Rig rig;
    WindowHandle target = rig.shell.addShellWindow({L"C:\\Docs"});
    rig.shell.setForeground(target);
    WindowHandle source = rig.shell.addShellWindow({L"C:\\Temp"});
    rig.shell.navigateAlwaysFails = true;

    REQUIRE(rig.fold(source) == FoldOutcome::Converted);
    REQUIRE(rig.shell.pasted.size() == 1);
    REQUIRE(rig.shell.locationOf(rig.shell.activeTab(target)) == std::wstring(L"C:\\Temp"));
    REQUIRE(rig.shell.clipboardRestores == 1);
}

TEST_CASE("Clipboard is kept while a pasted location has not landed", "[FoldCoordinator]")
{
    Rig rig;
    WindowHandle target = rig.shell.addShellWindow({L"C:\\Docs"});
    rig.shell.setForeground(target);
    WindowHandle source = rig.shell.addShellWindow({L"C:\\Temp"});
    rig.shell.navigateAlwaysFails = true;
    rig.shell.pasteNavigates = false;

    rig.fold(source);

    REQUIRE(rig.shell.pasted.size() == 1);
    REQUIRE(rig.shell.clipboardRestores == 0);
}

TEST_CASE("Existing tab is reused instead of opening a duplicate", "[FoldCoordinator]")
{
    Rig rig;
    WindowHandle target = rig.shell.addShellWindow({L"C:\\Docs", L"C:\\Temp"});
    rig.shell.setForeground(target);
    WindowHandle tempTab = rig.shell.tabs(target)[1];

    WindowHandle first = rig.shell.addShellWindow({L"C:\\Temp"});
    REQUIRE(rig.fold(first) == FoldOutcome::ConvertedToExisting);
    REQUIRE(rig.shell.activeTab(target) == tempTab);

    // Switch away, then fold a second window at the same place
    rig.shell.postCommand(target, kCmdSelectTabByIndex, 1);
    WindowHandle second = rig.shell.addShellWindow({L"c:/temp/"});
    REQUIRE(rig.fold(second) == FoldOutcome::ConvertedToExisting);

    REQUIRE(rig.shell.activeTab(target) == tempTab);
    REQUIRE(rig.shell.countCommands(kCmdOpenNewTab) == 0);
    REQUIRE(rig.shell.tabs(target).size() == 2);
    REQUIRE_FALSE(rig.shell.alive(first));
    REQUIRE_FALSE(rig.shell.alive(second));
}

// ─── Guards ─────────────────────────────────────────────────────────────────

TEST_CASE("Only single-tab windows are folded", "[FoldCoordinator]")
{
    Rig rig;
    WindowHandle target = rig.shell.addShellWindow({L"C:\\Docs"});
    rig.shell.setForeground(target);

    SECTION("two tabs")
    {
        WindowHandle source = rig.shell.addShellWindow({L"C:\\A", L"C:\\B"});
        REQUIRE(rig.fold(source) == FoldOutcome::NotSingleTab);
        REQUIRE_FALSE(rig.wasHidden(source));
        REQUIRE(rig.shell.alive(source));
    }

    SECTION("no tab child ever appears")
    {
        WindowHandle source = rig.shell.addWindow(kShellTopLevelClass, L"explorer.exe");
        REQUIRE(rig.fold(source) == FoldOutcome::NoTabChild);
        REQUIRE_FALSE(rig.wasHidden(source));
        REQUIRE(rig.clock.sleptMs >= FoldCoordinator::kTabChildWaitMs);
    }
}

TEST_CASE("Without another window there is nothing to fold into", "[FoldCoordinator]")
{
    Rig rig;
    WindowHandle source = rig.shell.addShellWindow({L"C:\\Temp"});
    rig.shell.setForeground(source);

    REQUIRE(rig.fold(source) == FoldOutcome::NoTarget);
    REQUIRE_FALSE(rig.wasHidden(source));
    REQUIRE(rig.shell.alive(source));
}

// ─── Rollback ───────────────────────────────────────────────────────────────

TEST_CASE("Failed folds show the source again", "[FoldCoordinator]")
{
    Rig rig;
    WindowHandle target = rig.shell.addShellWindow({L"C:\\Docs"});
    rig.shell.setForeground(target);

    SECTION("location never resolves")
    {
        WindowHandle source = rig.shell.addShellWindow({std::wstring(kThisPc)});
        REQUIRE(rig.fold(source) == FoldOutcome::LocationUnresolved);
        REQUIRE(rig.wasHidden(source));
        REQUIRE(rig.shell.visible(source));
        REQUIRE(rig.shell.tabs(target).size() == 1);
    }

    SECTION("new tab never appears")
    {
        rig.shell.newTabResponds = false;
        WindowHandle source = rig.shell.addShellWindow({L"C:\\Temp"});
        REQUIRE(rig.fold(source) == FoldOutcome::NewTabFailed);
        REQUIRE(rig.shell.visible(source));
        REQUIRE(rig.shell.alive(source));
    }

    SECTION("navigation and address bar both fail")
    {
        rig.shell.navigateAlwaysFails = true;
        rig.shell.pasteFails = true;
        WindowHandle source = rig.shell.addShellWindow({L"C:\\Temp"});
        REQUIRE(rig.fold(source) == FoldOutcome::NewTabFailed);
        REQUIRE(rig.shell.countCommands(kCmdCloseTab) == 1);
        REQUIRE(rig.shell.commands.back().lParam == 1);
        REQUIRE(rig.shell.tabs(target).size() == 1);
        REQUIRE(rig.shell.visible(source));
    }

    SECTION("source refuses to close")
    {
        rig.shell.closeFails = true;
        WindowHandle source = rig.shell.addShellWindow({L"C:\\Temp"});
        REQUIRE(rig.fold(source) == FoldOutcome::CloseFailed);
        REQUIRE(rig.shell.visible(source));
    }

    SECTION("automation throws")
    {
        rig.shell.throwOnEnumerate = true;
        WindowHandle source = rig.shell.addShellWindow({L"C:\\Temp"});
        REQUIRE(rig.fold(source) == FoldOutcome::Faulted);
        REQUIRE(rig.shell.visible(source));
        REQUIRE(rig.coordinator.ledger().pendingCount() == 0);
    }

    SECTION("source destroyed mid-fold is not shown")
    {
        WindowHandle source = rig.shell.addShellWindow({std::wstring(kThisPc)});
        rig.clock.onSleep = [&](int64_t) { rig.shell.destroy(source); };
        REQUIRE(rig.fold(source) == FoldOutcome::LocationUnresolved);
        REQUIRE_FALSE(rig.wasShown(source));
    }
}

// ─── Hook path ──────────────────────────────────────────────────────────────

TEST_CASE("Show events post one fold per new window", "[FoldCoordinator]")
{
    Rig rig;
    WindowHandle target = rig.shell.addShellWindow({L"C:\\Docs"});
    rig.shell.setForeground(target);
    rig.coordinator.seedKnownWindows();

    WindowHandle source = rig.shell.addShellWindow({L"C:\\Temp"});
    rig.coordinator.onWindowShown(source);
    rig.coordinator.onWindowShown(source);
    REQUIRE(rig.worker.tasks.size() == 1);

    rig.worker.runAll();
    REQUIRE_FALSE(rig.shell.alive(source));
    REQUIRE(rig.shell.tabs(target).size() == 2);

    // Existing windows are not new
    rig.coordinator.onWindowShown(target);
    REQUIRE(rig.worker.tasks.empty());
}

TEST_CASE("Show events are ignored when auto-fold is off", "[FoldCoordinator]")
{
    Rig rig;
    rig.configure([](SettingsSnapshot& s) { s.autoFoldNewWindows = false; });
    rig.shell.addShellWindow({L"C:\\Docs"});
    WindowHandle source = rig.shell.addShellWindow({L"C:\\Temp"});

    rig.coordinator.onWindowShown(source);
    REQUIRE(rig.worker.tasks.empty());
}

TEST_CASE("Non-shell windows are ignored", "[FoldCoordinator]")
{
    Rig rig;
    WindowHandle dialog = rig.shell.addWindow(kShellTopLevelClass, L"setup.exe");
    WindowHandle notepad = rig.shell.addWindow(L"Notepad", L"notepad.exe");

    rig.coordinator.onWindowShown(dialog);
    rig.coordinator.onWindowShown(notepad);

    REQUIRE(rig.worker.tasks.empty());
    REQUIRE_FALSE(rig.coordinator.ledger().isKnown(dialog));
}

TEST_CASE("Without the registration channel windows are not hidden early", "[FoldCoordinator]")
{
    Rig rig;
    WindowHandle target = rig.shell.addShellWindow({L"C:\\Docs"});
    rig.shell.setForeground(target);
    rig.coordinator.setRegistrationChannelActive(false);

    WindowHandle source = rig.shell.addShellWindow({L"C:\\Temp"});
    rig.coordinator.onObjectCreated(source);
    REQUIRE(rig.shell.hidden.empty());

    rig.coordinator.onWindowShown(source);
    rig.worker.runAll();
    REQUIRE_FALSE(rig.shell.alive(source));
}

TEST_CASE("Registered window hidden early is folded with a single hide", "[FoldCoordinator]")
{
    Rig rig;
    WindowHandle target = rig.shell.addShellWindow({L"C:\\Docs"});
    rig.shell.setForeground(target);
    rig.coordinator.seedKnownWindows();
    rig.coordinator.setRegistrationChannelActive(true);

    WindowHandle source = rig.shell.addShellWindow({L"C:\\Temp"});
    rig.coordinator.onObjectCreated(source);
    REQUIRE(rig.coordinator.ledger().isEarlyHidden(source));
    REQUIRE_FALSE(rig.shell.visible(source));

    RegisteredCandidate candidate;
    candidate.topLevel = source;
    candidate.tab = rig.shell.activeTab(source);
    candidate.location = std::wstring(L"C:\\Temp");
    rig.coordinator.foldRegistered(candidate);

    REQUIRE_FALSE(rig.shell.alive(source));
    REQUIRE(rig.shell.hidden.size() == 1);
    REQUIRE(rig.shell.shown.empty());
    REQUIRE_FALSE(rig.coordinator.ledger().isEarlyHidden(source));
}

TEST_CASE("Registered multi-tab window is hidden then restored", "[FoldCoordinator]")
{
    Rig rig;
    WindowHandle target = rig.shell.addShellWindow({L"C:\\Docs"});
    rig.shell.setForeground(target);

    WindowHandle source = rig.shell.addShellWindow({L"C:\\A", L"C:\\B"});
    RegisteredCandidate candidate;
    candidate.topLevel = source;
    rig.coordinator.foldRegistered(candidate);

    REQUIRE(rig.wasHidden(source));
    REQUIRE(rig.shell.visible(source));
    REQUIRE(rig.shell.alive(source));
}

TEST_CASE("Early hiding can be turned off", "[FoldCoordinator]")
{
    Rig rig;
    rig.configure([](SettingsSnapshot& s) { s.earlyHideOnCreate = false; });
    rig.coordinator.setRegistrationChannelActive(true);

    WindowHandle source = rig.shell.addShellWindow({L"C:\\Temp"});
    rig.coordinator.onObjectCreated(source);
    REQUIRE(rig.shell.hidden.empty());
}

TEST_CASE("Unclaimed early-hidden windows are restored by the sweep", "[FoldCoordinator]")
{
    Rig rig;
    rig.coordinator.setRegistrationChannelActive(true);
    WindowHandle source = rig.shell.addShellWindow({L"C:\\Temp"});
    rig.coordinator.onObjectCreated(source);
    REQUIRE_FALSE(rig.shell.visible(source));

    rig.clock.advance(FoldCoordinator::kEarlyHideClaimMs - 1);
    rig.coordinator.sweepEarlyHidden();
    REQUIRE_FALSE(rig.shell.visible(source));

    rig.clock.advance(1);
    rig.coordinator.sweepEarlyHidden();
    REQUIRE(rig.shell.visible(source));
    REQUIRE(rig.wasShown(source));
    REQUIRE_FALSE(rig.coordinator.ledger().isEarlyHidden(source));
}

TEST_CASE("Unresolved registration restores stale early hides", "[FoldCoordinator]")
{
    Rig rig;
    rig.coordinator.setRegistrationChannelActive(true);
    WindowHandle source = rig.shell.addShellWindow({L"C:\\Temp"});
    rig.coordinator.onObjectCreated(source);

    rig.clock.advance(FoldCoordinator::kEarlyHideClaimMs);
    rig.coordinator.onRegistrationUnresolved();
    REQUIRE(rig.shell.visible(source));
}

TEST_CASE("Early-hidden windows are shown again on exit", "[FoldCoordinator]")
{
    Rig rig;
    rig.coordinator.setRegistrationChannelActive(true);
    WindowHandle fresh = rig.shell.addShellWindow({L"C:\\Temp"});
    WindowHandle gone = rig.shell.addShellWindow({L"C:\\Docs"});
    rig.coordinator.onObjectCreated(fresh);
    rig.coordinator.onObjectCreated(gone);
    REQUIRE_FALSE(rig.shell.visible(fresh));

    // Nothing claims them: the worker is stopped with its queue dropped
    rig.shell.destroy(gone);
    rig.worker.tasks.clear();
    rig.coordinator.restoreAllEarlyHidden();

    REQUIRE(rig.shell.visible(fresh));
    REQUIRE(rig.wasShown(fresh));
    REQUIRE_FALSE(rig.wasShown(gone));
    REQUIRE_FALSE(rig.coordinator.ledger().isEarlyHidden(fresh));
}

TEST_CASE("Stopping a real worker leaves no window hidden", "[FoldCoordinator]")
{
    FakeShell shell;
    ManualClock clock;
    WorkerThread worker;
    ShellNavigator navigator{shell, shell};
    FoldCoordinator coordinator{shell, navigator, clock, worker};
    worker.start();

    coordinator.setRegistrationChannelActive(true);
    WindowHandle source = shell.addShellWindow({L"C:\\Temp"});
    coordinator.onObjectCreated(source);
    REQUIRE(coordinator.ledger().isEarlyHidden(source));

    worker.stop();
    coordinator.restoreAllEarlyHidden();

    REQUIRE(shell.alive(source));
    REQUIRE(shell.visible(source));
}

TEST_CASE("Seeding remembers the shell window already in the foreground", "[FoldCoordinator]")
{
    Rig rig;
    rig.shell.addShellWindow({L"C:\\Temp"});
    WindowHandle current = rig.shell.addShellWindow({L"C:\\Docs"});
    rig.shell.setForeground(current);

    rig.coordinator.seedKnownWindows();
    REQUIRE(rig.coordinator.targets().lastForeground() == current);

    // Focus moving to a non-shell window keeps the remembered target
    WindowHandle notepad = rig.shell.addWindow(L"Notepad", L"notepad.exe");
    rig.shell.setForeground(notepad);
    WindowHandle source = rig.shell.addShellWindow({L"C:\\Work"});
    REQUIRE(rig.coordinator.targets().pickTarget(source) == current);
}

TEST_CASE("Destroyed windows are pruned from every table", "[FoldCoordinator]")
{
    Rig rig;
    WindowHandle w = rig.shell.addShellWindow({L"C:\\A", L"C:\\B"});
    rig.coordinator.seedKnownWindows();
    rig.coordinator.onForegroundChanged(w);
    const WindowHandle second = rig.shell.tabs(w)[1];
    rig.coordinator.prober().rememberIndex(w, second, 1);
    REQUIRE(rig.coordinator.targets().lastForeground() == w);

    rig.shell.destroy(w);
    rig.coordinator.onWindowDestroyed(w);

    REQUIRE_FALSE(rig.coordinator.ledger().isKnown(w));
    REQUIRE(rig.coordinator.targets().lastForeground() == kNullWindow);
    REQUIRE(rig.coordinator.prober().cachedIndex(w, second) == -1);
}

// ─── On-demand open ─────────────────────────────────────────────────────────

TEST_CASE("Related folders navigate the foreground tab", "[FoldCoordinator]")
{
    Rig rig;

    SECTION("descendant")
    {
        WindowHandle w = rig.shell.addShellWindow({L"C:\\Projects"});
        rig.shell.setForeground(w);
        REQUIRE(rig.coordinator.openLocationAsTab(L"C:\\Projects\\Sub", kNullWindow));
        REQUIRE(rig.shell.locationOf(rig.shell.activeTab(w)) == std::wstring(L"C:\\Projects\\Sub"));
        REQUIRE(rig.shell.tabs(w).size() == 1);
    }

    SECTION("ancestor")
    {
        WindowHandle w = rig.shell.addShellWindow({L"C:\\Projects\\Sub"});
        rig.shell.setForeground(w);
        REQUIRE(rig.coordinator.openLocationAsTab(L"C:\\Projects", kNullWindow));
        REQUIRE(rig.shell.locationOf(rig.shell.activeTab(w)) == std::wstring(L"C:\\Projects"));
        REQUIRE(rig.shell.tabs(w).size() == 1);
    }

    REQUIRE(rig.shell.countCommands(kCmdOpenNewTab) == 0);
}

TEST_CASE("Related folder opens a tab when in-place navigation is off", "[FoldCoordinator]")
{
    Rig rig;
    rig.configure([](SettingsSnapshot& s) { s.openChildFolderInActiveTab = false; });
    WindowHandle w = rig.shell.addShellWindow({L"C:\\Projects"});
    rig.shell.setForeground(w);

    REQUIRE(rig.coordinator.openLocationAsTab(L"C:\\Projects\\Sub", kNullWindow));
    REQUIRE(rig.shell.tabs(w).size() == 2);
}

TEST_CASE("Unrelated folder opens a new tab with input handoff", "[FoldCoordinator]")
{
    Rig rig;
    WindowHandle w = rig.shell.addShellWindow({L"C:\\Projects"});
    rig.shell.setForeground(w);
    const WindowHandle requester = 0x777;

    REQUIRE(rig.coordinator.openLocationAsTab(L"D:\\Other", requester));
    REQUIRE(rig.shell.tabs(w).size() == 2);
    REQUIRE(rig.shell.locationOf(rig.shell.activeTab(w)) == std::wstring(L"D:\\Other"));
    REQUIRE(rig.shell.handoffs.back() == requester);
    REQUIRE(rig.shell.foregroundWindow() == w);
}

TEST_CASE("Requested folder already open is activated", "[FoldCoordinator]")
{
    Rig rig;
    WindowHandle a = rig.shell.addShellWindow({L"C:\\X"});
    WindowHandle b = rig.shell.addShellWindow({L"C:\\Y", L"D:\\Z"});
    rig.shell.setForeground(a);

    REQUIRE(rig.coordinator.openLocationAsTab(L"d:\\z\\", kNullWindow));
    REQUIRE(rig.shell.foregroundWindow() == b);
    REQUIRE(rig.shell.locationOf(rig.shell.activeTab(b)) == std::wstring(L"D:\\Z"));
    REQUIRE(rig.shell.countCommands(kCmdOpenNewTab) == 0);
}

TEST_CASE("Existing tab search prefers the foreground window", "[FoldCoordinator]")
{
    Rig rig;
    WindowHandle a = rig.shell.addShellWindow({L"C:\\Same"});
    WindowHandle b = rig.shell.addShellWindow({L"C:\\Same"});
    WindowHandle c = rig.shell.addShellWindow({L"C:\\Same"});

    rig.shell.setForeground(b);
    auto found = rig.coordinator.findExistingTab(L"C:\\Same", kNullWindow);
    REQUIRE(found.has_value());
    REQUIRE(found->topLevel == b);

    rig.shell.setForeground(kNullWindow);
    rig.coordinator.onForegroundChanged(c);
    found = rig.coordinator.findExistingTab(L"C:\\Same", kNullWindow);
    REQUIRE(found->topLevel == c);

    found = rig.coordinator.findExistingTab(L"C:\\Same", c);
    REQUIRE(found->topLevel == a);

    REQUIRE_FALSE(rig.coordinator.findExistingTab(L"C:\\Nowhere", kNullWindow).has_value());
}

TEST_CASE("No shell window launches a plain window", "[FoldCoordinator]")
{
    Rig rig;

    REQUIRE(rig.coordinator.openLocationAsTab(L"C:\\Temp", kNullWindow));
    REQUIRE(rig.shell.launched.size() == 1);
    REQUIRE(rig.shell.launched.front() == L"C:\\Temp");
}

TEST_CASE("Launching can be disabled", "[FoldCoordinator]")
{
    Rig rig;
    rig.configure([](SettingsSnapshot& s) { s.launchWindowWhenNoTarget = false; });

    REQUIRE_FALSE(rig.coordinator.openLocationAsTab(L"C:\\Temp", kNullWindow));
    REQUIRE(rig.shell.launched.empty());
}

TEST_CASE("Failed new tab falls back to a plain window", "[FoldCoordinator]")
{
    Rig rig;
    WindowHandle w = rig.shell.addShellWindow({L"C:\\Projects"});
    rig.shell.setForeground(w);
    rig.shell.newTabResponds = false;

    REQUIRE(rig.coordinator.openLocationAsTab(L"D:\\Other", kNullWindow));
    REQUIRE(rig.shell.launched.size() == 1);
}

TEST_CASE("Open request failures are contained", "[FoldCoordinator]")
{
    Rig rig;
    WindowHandle w = rig.shell.addShellWindow({L"C:\\Projects"});
    rig.shell.setForeground(w);

    REQUIRE_FALSE(rig.coordinator.openLocationAsTab(L"", kNullWindow));

    rig.shell.throwOnEnumerate = true;
    REQUIRE_FALSE(rig.coordinator.openLocationAsTab(L"C:\\Projects\\Sub", kNullWindow));
}
