// =============================================================================
// TabFold — FoldCoordinator
// =============================================================================

#include "tabfold/logic/FoldCoordinator.h"
#include "tabfold/logic/PathRules.h"
#include "tabfold/common/Clock.h"
#include "tabfold/common/PollUntil.h"
#include "tabfold/common/ShellConstants.h"
#include "tabfold/common/TaskQueue.h"
#include "tabfold/output/ShellNavigator.h"
#include "tabfold/output/WindowBridge.h"
#include "tabfold/support/Log.h"

#include <algorithm>
#include <exception>
#include <vector>

namespace TabFold
{

const wchar_t* toString(FoldOutcome o)
{
    switch (o)
    {
    case FoldOutcome::Converted:           return L"converted";
    case FoldOutcome::ConvertedToExisting: return L"converted (existing tab)";
    case FoldOutcome::NoTabChild:          return L"no tab child";
    case FoldOutcome::NotSingleTab:        return L"not a single-tab window";
    case FoldOutcome::NoTarget:            return L"no target window";
    case FoldOutcome::LocationUnresolved:  return L"location unresolved";
    case FoldOutcome::NewTabFailed:        return L"new tab failed";
    case FoldOutcome::CloseFailed:         return L"close failed";
    case FoldOutcome::Faulted:             return L"faulted";
    }
    return L"unknown";
}

namespace
{

unsigned long long hex(WindowHandle h)
{
    return static_cast<unsigned long long>(h);
}

} // namespace

FoldCoordinator::FoldCoordinator(WindowBridge& windows, ShellNavigator& navigator, Clock& clock,
                                 TaskQueue& worker)
    : windows_(windows)
    , navigator_(navigator)
    , clock_(clock)
    , worker_(worker)
    , classifier_(windows)
    , selector_(windows, classifier_)
    , resolver_(navigator, clock)
    , prober_(windows, navigator, classifier_, clock)
{
}

void FoldCoordinator::applySettings(const SettingsSnapshot& settings)
{
    std::atomic_store(&settings_, std::shared_ptr<const SettingsSnapshot>(
                                      std::make_shared<SettingsSnapshot>(settings)));
}

std::shared_ptr<const SettingsSnapshot> FoldCoordinator::settings() const
{
    return std::atomic_load(&settings_);
}

void FoldCoordinator::setRegistrationChannelActive(bool active)
{
    registrationActive_.store(active, std::memory_order_release);
}

void FoldCoordinator::seedKnownWindows()
{
    const auto existing = classifier_.topLevelTargets(true);
    for (WindowHandle h : existing)
        ledger_.addKnown(h);
    // The user may already be in a shell window; no foreground event says so
    selector_.noteForeground(windows_.foregroundWindow());
    Log::info(L"seeded %u existing shell windows", static_cast<unsigned>(existing.size()));
}

// ─── Hook callbacks ─────────────────────────────────────────────────────────

void FoldCoordinator::onObjectCreated(WindowHandle h)
{
    const auto s = settings();
    if (!s->autoFoldNewWindows || !s->earlyHideOnCreate)
        return;
    if (!registrationActive_.load(std::memory_order_acquire))
        return;
    if (ledger_.isPendingOrKnown(h) || !classifier_.hasTopLevelClass(h))
        return;

    if (windows_.hide(h))
    {
        ledger_.markEarlyHidden(h, clock_.nowMs());
        Log::verbose(L"early-hid 0x%llx", hex(h));
    }
}

void FoldCoordinator::onWindowShown(WindowHandle h)
{
    if (!settings()->autoFoldNewWindows)
        return;
    if (ledger_.isPending(h) || !windows_.isVisible(h))
        return;
    if (!classifier_.isTopLevelTarget(h))
        return;

    // First sighting only; anything already known is a redraw or restore
    if (!ledger_.addKnown(h))
        return;
    if (!ledger_.tryBeginConversion(h, clock_.nowMs()))
        return;

    // Shown means the window is visible again; any early hide is moot
    ledger_.takeEarlyHidden(h);

    Log::verbose(L"new window 0x%llx via show event", hex(h));
    worker_.post([this, h]() { foldWindow(h, kNullWindow, std::nullopt, false); });
}

void FoldCoordinator::onWindowDestroyed(WindowHandle h)
{
    ledger_.forget(h);
    selector_.forget(h);
    prober_.forget(h);
}

void FoldCoordinator::onForegroundChanged(WindowHandle h)
{
    selector_.noteForeground(h);
}

// ─── Registration channel ───────────────────────────────────────────────────

void FoldCoordinator::foldRegistered(const RegisteredCandidate& candidate)
{
    if (settings()->autoFoldNewWindows
        && ledger_.tryBeginConversion(candidate.topLevel, clock_.nowMs()))
    {
        Log::verbose(L"new window 0x%llx via registration", hex(candidate.topLevel));
        foldWindow(candidate.topLevel, candidate.tab, candidate.location, true);
    }
    restoreStaleEarlyHidden();
}

void FoldCoordinator::onRegistrationUnresolved()
{
    restoreStaleEarlyHidden();
}

void FoldCoordinator::sweepEarlyHidden()
{
    restoreStaleEarlyHidden();
}

void FoldCoordinator::restoreAllEarlyHidden()
{
    for (WindowHandle h : ledger_.takeAllEarlyHidden())
    {
        if (windows_.isWindow(h))
        {
            windows_.show(h);
            Log::info(L"restored early-hidden window 0x%llx on exit", hex(h));
        }
    }
}

void FoldCoordinator::restoreStaleEarlyHidden()
{
    for (WindowHandle h : ledger_.takeStaleEarlyHidden(clock_.nowMs(), kEarlyHideClaimMs))
    {
        if (windows_.isWindow(h))
        {
            windows_.show(h);
            Log::info(L"restored unclaimed window 0x%llx", hex(h));
        }
    }
}

// ─── Fold attempt ───────────────────────────────────────────────────────────

FoldOutcome FoldCoordinator::foldWindow(WindowHandle source, WindowHandle tab,
                                        std::optional<std::wstring> location, bool hideFirst)
{
    FoldAttempt attempt;
    attempt.source = source;
    attempt.tab = tab;
    attempt.location = std::move(location);
    attempt.state = FoldState::PendingConversion;

    // Early hide on object-create counts as this attempt's hide
    if (ledger_.takeEarlyHidden(source) && !windows_.isVisible(source))
        attempt.hidden = true;

    FoldOutcome outcome = FoldOutcome::Faulted;
    try
    {
        outcome = convert(attempt, hideFirst);
    }
    catch (const std::exception& ex)
    {
        Log::error(L"fold of 0x%llx threw: %ls", hex(source), Log::widen(ex.what()).c_str());
        outcome = FoldOutcome::Faulted;
    }

    if (isConverted(outcome))
    {
        attempt.state = FoldState::Converted;
    }
    else
    {
        // Rollback: the user must never be left with a hidden, lost window
        if (attempt.hidden && windows_.isWindow(source))
            windows_.show(source);
        attempt.state = FoldState::RolledBack;
    }

    ledger_.endConversion(source);

    if (attempt.state == FoldState::Converted)
        Log::info(L"folded 0x%llx: %ls", hex(source), toString(outcome));
    else
        Log::verbose(L"left 0x%llx alone: %ls", hex(source), toString(outcome));
    return outcome;
}

FoldOutcome FoldCoordinator::convert(FoldAttempt& attempt, bool hideFirst)
{
    const WindowHandle source = attempt.source;

    if (hideFirst && !attempt.hidden)
        attempt.hidden = windows_.hide(source);

    const bool locationReady = PathRules::isRealFileSystemLocation(attempt.location);
    if (!locationReady)
    {
        auto tabs = pollFor(clock_, {kTabChildPollMs, kTabChildWaitMs},
                            [&]() -> std::optional<std::vector<WindowHandle>> {
                                auto children = classifier_.tabsOf(source);
                                if (children.empty())
                                    return std::nullopt;
                                return children;
                            });
        if (!tabs)
            return FoldOutcome::NoTabChild;
        // Folding a multi-tab window would lose its other tabs
        if (tabs->size() != 1)
            return FoldOutcome::NotSingleTab;
        if (attempt.tab == kNullWindow)
            attempt.tab = tabs->front();
    }

    const WindowHandle target = selector_.pickTarget(source);
    if (target == kNullWindow || target == source)
        return FoldOutcome::NoTarget;

    if (!attempt.hidden)
        attempt.hidden = windows_.hide(source);

    std::optional<std::wstring> location = attempt.location;
    if (!locationReady)
        location = resolver_.waitForRealLocation(attempt.tab, source, settings()->locationTimeoutMs);
    if (!PathRules::isRealFileSystemLocation(location))
        return FoldOutcome::LocationUnresolved;

    if (tryActivateExistingTab(*location, source))
        return closeSource(source) ? FoldOutcome::ConvertedToExisting : FoldOutcome::CloseFailed;

    if (!openInNewTab(target, *location, kNullWindow))
        return FoldOutcome::NewTabFailed;

    return closeSource(source) ? FoldOutcome::Converted : FoldOutcome::CloseFailed;
}

bool FoldCoordinator::closeSource(WindowHandle source)
{
    if (windows_.postClose(source))
        return true;
    // A window that vanished on its own is as good as closed
    return !windows_.isWindow(source);
}

// ─── Tab creation ───────────────────────────────────────────────────────────

bool FoldCoordinator::openInNewTab(WindowHandle target, const std::wstring& location,
                                   WindowHandle handoffFrom)
{
    windows_.bringToForeground(target, handoffFrom);

    const WindowHandle previousActive = classifier_.activeTabOf(target);
    if (previousActive == kNullWindow)
    {
        Log::warn(L"target 0x%llx has no active tab", hex(target));
        return false;
    }
    const std::vector<WindowHandle> before = classifier_.tabsOf(target);

    if (!windows_.postCommand(previousActive, kCmdOpenNewTab, 0))
        return false;

    // Either the active tab changes, or a child not present before appears
    auto newTab = pollFor(clock_, {kNewTabPollMs, kNewTabWaitMs},
                          [&]() -> std::optional<WindowHandle> {
                              const auto tabs = classifier_.tabsOf(target);
                              if (!tabs.empty() && tabs.front() != previousActive)
                                  return tabs.front();
                              for (WindowHandle t : tabs)
                              {
                                  if (std::find(before.begin(), before.end(), t) == before.end())
                                      return t;
                              }
                              return std::nullopt;
                          });
    if (!newTab)
    {
        Log::warn(L"new tab did not appear on 0x%llx", hex(target));
        return false;
    }

    if (!navigateWithRetry(*newTab, location))
    {
        Log::warn(L"automation navigate failed, using address bar for %ls", location.c_str());
        windows_.bringToForeground(target);
        if (!windows_.pasteIntoAddressBar(location))
        {
            windows_.postCommand(*newTab, kCmdCloseTab, 1);
            return false;
        }

        // Clipboard goes back only once the pasted location has landed
        if (resolver_.waitUntilLocationMatches(*newTab, location, kConfirmLocationMs))
            windows_.restoreClipboard();
        else
            Log::warn(L"address bar paste unconfirmed, clipboard left holding %ls",
                        location.c_str());
    }

    windows_.bringToForeground(target, handoffFrom);
    return true;
}

bool FoldCoordinator::navigateWithRetry(WindowHandle tab, const std::wstring& location)
{
    return pollUntil(clock_, {kNavigateRetryPollMs, kNavigateRetryMs},
                     [&]() { return navigator_.navigateByTabHandle(tab, location); });
}

// ─── Duplicate avoidance ────────────────────────────────────────────────────

std::optional<ExistingTabCandidate> FoldCoordinator::findExistingTab(const std::wstring& location,
                                                                     WindowHandle excludeTopLevel)
{
    const WindowHandle foreground = windows_.foregroundWindow();
    const WindowHandle last = selector_.lastForeground();

    return navigator_.onApartment([&]() -> std::optional<ExistingTabCandidate> {
        std::optional<ExistingTabCandidate> first;
        std::optional<ExistingTabCandidate> inLast;

        for (const auto& obj : navigator_.snapshot())
        {
            auto current = navigator_.resolveLocation(*obj);
            if (!PathRules::isRealFileSystemLocation(current)
                || !PathRules::equivalent(*current, location))
                continue;

            const WindowHandle tab = navigator_.resolveWindowHandle(*obj);
            if (tab == kNullWindow || !windows_.isWindow(tab))
                continue;
            const WindowHandle top = windows_.rootOf(tab);
            if (top == kNullWindow || top == excludeTopLevel || !classifier_.isTopLevelTarget(top))
                continue;

            ExistingTabCandidate candidate{top, tab, *current};
            if (top == foreground)
                return candidate;
            if (top == last && !inLast)
                inLast = candidate;
            if (!first)
                first = std::move(candidate);
        }
        return inLast ? inLast : first;
    });
}

bool FoldCoordinator::tryActivateExistingTab(const std::wstring& location,
                                             WindowHandle excludeTopLevel)
{
    auto existing = findExistingTab(location, excludeTopLevel);
    if (!existing)
        return false;

    if (!prober_.activate(existing->topLevel, existing->tab))
    {
        // Still never open a duplicate; raising the window is enough
        Log::warn(L"could not select existing tab in 0x%llx", hex(existing->topLevel));
        windows_.bringToForeground(existing->topLevel);
    }
    return true;
}

// ─── On-demand path ─────────────────────────────────────────────────────────

bool FoldCoordinator::openLocationAsTab(const std::wstring& location, WindowHandle handoffFrom)
{
    try
    {
        return openLocationAsTabImpl(location, handoffFrom);
    }
    catch (const std::exception& ex)
    {
        Log::error(L"open request for %ls threw: %ls", location.c_str(),
                     Log::widen(ex.what()).c_str());
        return false;
    }
}

bool FoldCoordinator::openLocationAsTabImpl(const std::wstring& location, WindowHandle handoffFrom)
{
    if (location.empty())
        return false;

    if (tryNavigateForegroundTab(location))
    {
        Log::info(L"navigated foreground tab to %ls", location.c_str());
        return true;
    }

    if (tryActivateExistingTab(location, kNullWindow))
    {
        Log::info(L"activated existing tab for %ls", location.c_str());
        return true;
    }

    const WindowHandle target = selector_.pickTarget(kNullWindow);
    if (target == kNullWindow)
    {
        if (!settings()->launchWindowWhenNoTarget)
            return false;
        Log::info(L"no target window, launching %ls", location.c_str());
        return windows_.launchShellWindow(location);
    }

    if (!openInNewTab(target, location, handoffFrom))
    {
        Log::warn(L"new tab failed, launching %ls", location.c_str());
        return windows_.launchShellWindow(location);
    }

    windows_.bringToForeground(target, handoffFrom);
    return true;
}

bool FoldCoordinator::tryNavigateForegroundTab(const std::wstring& location)
{
    if (!settings()->openChildFolderInActiveTab || !PathRules::isRealFileSystemLocation(location))
        return false;

    const WindowHandle foreground = windows_.foregroundWindow();
    if (!classifier_.isTopLevelTarget(foreground))
        return false;

    const WindowHandle active = classifier_.activeTabOf(foreground);
    if (active == kNullWindow || !windows_.isWindow(active))
        return false;

    const auto current = navigator_.locationByTabHandle(active);
    if (!PathRules::isRealFileSystemLocation(current))
        return false;

    // Same folder lineage only: a descendant or an ancestor of the tab's folder
    if (!PathRules::isChildPathOf(*current, location) && !PathRules::isChildPathOf(location, *current))
        return false;

    if (!navigateWithRetry(active, location))
        return false;
    if (!resolver_.waitUntilLocationMatches(active, location, kConfirmLocationMs))
        return false;

    windows_.bringToForeground(foreground);
    return true;
}

} // namespace TabFold
