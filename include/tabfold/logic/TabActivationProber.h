#pragma once
// =============================================================================
// TabFold — TabActivationProber
// Brings a specific tab of a shell window to the front. The only selection
// command the shell accepts is "select tab by visual index", and neither the
// z-order nor the automation collection order is guaranteed to match the
// visual order. Strategy:
//   1. tab already active            -> raise window, done
//   2. cached index for (window,tab) -> select, wait ~220 ms
//   3. automation-reported index     -> select, wait ~220 ms
//   4. brute-force every other index -> select, wait ~120 ms each
// Step 4 runs under a redraw lock when the window is in the foreground.
// =============================================================================

#include "tabfold/common/Types.h"

#include <mutex>
#include <unordered_map>

namespace TabFold
{

class CandidateClassifier;
class Clock;
class ShellNavigator;
class WindowBridge;

class TabActivationProber
{
public:
    static constexpr int kPollIntervalMs  = 25;
    static constexpr int kIndexSettleMs   = 220;
    static constexpr int kProbeSettleMs   = 120;

    TabActivationProber(WindowBridge& windows, ShellNavigator& navigator,
                        const CandidateClassifier& classifier, Clock& clock);

    // True once `tab` is the active tab of `topLevel` and the window has
    // been raised.
    bool activate(WindowHandle topLevel, WindowHandle tab);

    // -1 if nothing cached.
    int cachedIndex(WindowHandle topLevel, WindowHandle tab) const;
    void rememberIndex(WindowHandle topLevel, WindowHandle tab, int index);

    // Drop every cached index for `topLevel` (window destroyed).
    void forget(WindowHandle topLevel);

private:
    bool selectAndWait(WindowHandle topLevel, WindowHandle tab, int index, int timeoutMs);
    bool probe(WindowHandle topLevel, WindowHandle tab, int tabCount, int skipA, int skipB);

    WindowBridge& windows_;
    ShellNavigator& navigator_;
    const CandidateClassifier& classifier_;
    Clock& clock_;

    mutable std::mutex cacheLock_;
    std::unordered_map<WindowHandle, std::unordered_map<WindowHandle, int>> cache_;
};

} // namespace TabFold
