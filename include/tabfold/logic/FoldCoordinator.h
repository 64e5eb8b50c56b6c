#pragma once
// =============================================================================
// TabFold — FoldCoordinator
// The fold state machine. For every new shell window it decides whether to
// hide it and merge it as a tab into another shell window, performs the
// merge (reuse an existing tab or open a new one), and guarantees the source
// window is shown again if any step fails.
//
// Entry points and their threads:
//   onObjectCreated / onWindowShown / onWindowDestroyed / onForegroundChanged
//       hook thread; classify, update the ledger, post work, return
//   foldRegistered / onRegistrationUnresolved / sweepEarlyHidden
//       worker thread
//   openLocationAsTab
//       worker thread (inbound open requests)
// No exception escapes any entry point.
// =============================================================================

#include "tabfold/common/Types.h"
#include "tabfold/common/WindowEventSink.h"
#include "tabfold/logic/CandidateClassifier.h"
#include "tabfold/logic/LocationResolver.h"
#include "tabfold/logic/TabActivationProber.h"
#include "tabfold/logic/TargetSelector.h"
#include "tabfold/logic/WindowLedger.h"
#include "tabfold/support/SettingsManager.h"

#include <atomic>
#include <memory>
#include <optional>
#include <string>

namespace TabFold
{

class Clock;
class ShellNavigator;
class TaskQueue;
class WindowBridge;

class FoldCoordinator : public WindowEventSink
{
public:
    // Bounded waits (interval / budget, ms)
    static constexpr int kTabChildPollMs      = 20;
    static constexpr int kTabChildWaitMs      = 250;
    static constexpr int kNewTabPollMs        = 30;
    static constexpr int kNewTabWaitMs        = 240;
    static constexpr int kNavigateRetryPollMs = 80;
    static constexpr int kNavigateRetryMs     = 420;
    static constexpr int kConfirmLocationMs   = 420;
    // An early-hidden window nobody claims within this long is shown again
    static constexpr int kEarlyHideClaimMs    = 2000;

    FoldCoordinator(WindowBridge& windows, ShellNavigator& navigator, Clock& clock,
                    TaskQueue& worker);

    void applySettings(const SettingsSnapshot& settings);
    std::shared_ptr<const SettingsSnapshot> settings() const;

    // Speculative hiding on object-create is only safe while the
    // registration channel is live to claim the window.
    void setRegistrationChannelActive(bool active);

    // Record every existing shell window (visible or not) as known so that
    // later show events for them are not mistaken for new windows.
    void seedKnownWindows();

    // ── WindowEventSink ──
    void onObjectCreated(WindowHandle h) override;
    void onWindowShown(WindowHandle h) override;
    void onWindowDestroyed(WindowHandle h) override;
    void onForegroundChanged(WindowHandle h) override;

    // ── Registration channel (worker thread) ──
    void foldRegistered(const RegisteredCandidate& candidate);
    void onRegistrationUnresolved();

    // Show again any early-hidden window that no fold claimed in time.
    void sweepEarlyHidden();

    // Shutdown: show every early-hidden window still alive. Call once the
    // worker has stopped, since the tasks that would have claimed them are
    // gone.
    void restoreAllEarlyHidden();

    // ── Fold attempt ──
    // `source` must already be marked pending; the mark is cleared here.
    // `hideFirst` hides the source before the single-tab check (registration
    // path); otherwise the hide happens once a target is known.
    FoldOutcome foldWindow(WindowHandle source, WindowHandle tab,
                           std::optional<std::wstring> location, bool hideFirst);

    // ── On-demand path ──
    // Open `location` as a tab somewhere sensible. `handoffFrom` is the
    // window that was in the foreground when the request was made.
    bool openLocationAsTab(const std::wstring& location, WindowHandle handoffFrom);

    // A live tab showing `location`, outside `excludeTopLevel`. Prefers the
    // foreground window, then the last foreground window, then the first
    // match.
    std::optional<ExistingTabCandidate> findExistingTab(const std::wstring& location,
                                                        WindowHandle excludeTopLevel);

    WindowLedger& ledger() { return ledger_; }
    const CandidateClassifier& classifier() const { return classifier_; }
    TargetSelector& targets() { return selector_; }
    TabActivationProber& prober() { return prober_; }

private:
    struct FoldAttempt
    {
        WindowHandle source = kNullWindow;
        WindowHandle tab = kNullWindow;
        std::optional<std::wstring> location;
        bool hidden = false;
        FoldState state = FoldState::Idle;
    };

    FoldOutcome convert(FoldAttempt& attempt, bool hideFirst);
    bool openInNewTab(WindowHandle target, const std::wstring& location, WindowHandle handoffFrom);
    bool tryActivateExistingTab(const std::wstring& location, WindowHandle excludeTopLevel);
    bool tryNavigateForegroundTab(const std::wstring& location);
    bool navigateWithRetry(WindowHandle tab, const std::wstring& location);
    bool closeSource(WindowHandle source);
    bool openLocationAsTabImpl(const std::wstring& location, WindowHandle handoffFrom);
    void restoreStaleEarlyHidden();

    WindowBridge& windows_;
    ShellNavigator& navigator_;
    Clock& clock_;
    TaskQueue& worker_;

    WindowLedger ledger_;
    CandidateClassifier classifier_;
    TargetSelector selector_;
    LocationResolver resolver_;
    TabActivationProber prober_;

    std::shared_ptr<const SettingsSnapshot> settings_ = std::make_shared<SettingsSnapshot>();
    std::atomic<bool> registrationActive_{false};
};

} // namespace TabFold
