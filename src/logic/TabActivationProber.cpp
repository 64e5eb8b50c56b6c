// =============================================================================
// TabFold — TabActivationProber
// =============================================================================

#include "tabfold/logic/TabActivationProber.h"
#include "tabfold/logic/CandidateClassifier.h"
#include "tabfold/common/PollUntil.h"
#include "tabfold/common/ShellConstants.h"
#include "tabfold/output/ShellNavigator.h"
#include "tabfold/output/WindowBridge.h"
#include "tabfold/support/Log.h"

#include <cstdint>

namespace TabFold
{

namespace
{

// Holds the redraw lock for the duration of a probe; released on every exit.
class RedrawLock
{
public:
    RedrawLock(WindowBridge& windows, WindowHandle h) : windows_(windows), h_(h) {}
    ~RedrawLock()
    {
        if (held_)
            windows_.unlockRedraw(h_);
    }

    bool acquire()
    {
        held_ = windows_.lockRedraw(h_);
        return held_;
    }

    RedrawLock(const RedrawLock&) = delete;
    RedrawLock& operator=(const RedrawLock&) = delete;

private:
    WindowBridge& windows_;
    WindowHandle h_;
    bool held_ = false;
};

} // namespace

TabActivationProber::TabActivationProber(WindowBridge& windows, ShellNavigator& navigator,
                                         const CandidateClassifier& classifier, Clock& clock)
    : windows_(windows), navigator_(navigator), classifier_(classifier), clock_(clock)
{
}

bool TabActivationProber::activate(WindowHandle topLevel, WindowHandle tab)
{
    if (!windows_.isWindow(topLevel) || !windows_.isWindow(tab))
        return false;

    // Tab selection is ignored on hidden/minimised frames
    if (windows_.foregroundWindow() != topLevel)
        windows_.showNoActivate(topLevel);

    if (classifier_.activeTabOf(topLevel) == tab)
    {
        windows_.bringToForeground(topLevel);
        return true;
    }

    const int tabCount = static_cast<int>(classifier_.tabsOf(topLevel).size());
    if (tabCount == 0)
        return false;

    const int cached = cachedIndex(topLevel, tab);
    if (cached >= 0 && cached < tabCount)
    {
        if (selectAndWait(topLevel, tab, cached, kIndexSettleMs))
        {
            windows_.bringToForeground(topLevel);
            return true;
        }
        Log::verbose(L"cached tab index %d is stale", cached);
    }

    const int reported = navigator_.automationTabIndex(topLevel, tab);
    if (reported >= 0 && reported < tabCount && reported != cached)
    {
        if (selectAndWait(topLevel, tab, reported, kIndexSettleMs))
        {
            rememberIndex(topLevel, tab, reported);
            windows_.bringToForeground(topLevel);
            return true;
        }
        Log::verbose(L"automation tab index %d did not select the tab", reported);
    }

    if (!probe(topLevel, tab, tabCount, cached, reported))
        return false;

    windows_.bringToForeground(topLevel);
    return true;
}

bool TabActivationProber::probe(WindowHandle topLevel, WindowHandle tab, int tabCount,
                                int skipA, int skipB)
{
    RedrawLock lock(windows_, topLevel);
    if (windows_.foregroundWindow() == topLevel && !lock.acquire())
    {
        Log::warn(L"redraw lock unavailable, skipping tab probe for 0x%llx",
                    static_cast<unsigned long long>(topLevel));
        return false;
    }

    for (int index = 0; index < tabCount; ++index)
    {
        if (index == skipA || index == skipB)
            continue;

        if (selectAndWait(topLevel, tab, index, kProbeSettleMs))
        {
            rememberIndex(topLevel, tab, index);
            Log::verbose(L"tab probe found index %d of %d", index, tabCount);
            return true;
        }
    }

    Log::warn(L"tab probe exhausted %d indices", tabCount);
    return false;
}

bool TabActivationProber::selectAndWait(WindowHandle topLevel, WindowHandle tab, int index,
                                        int timeoutMs)
{
    if (!windows_.postCommand(topLevel, kCmdSelectTabByIndex, static_cast<std::intptr_t>(index) + 1))
        return false;

    return pollUntil(clock_, {kPollIntervalMs, timeoutMs}, [&]() {
        return classifier_.activeTabOf(topLevel) == tab;
    });
}

// ─── Index cache ────────────────────────────────────────────────────────────

int TabActivationProber::cachedIndex(WindowHandle topLevel, WindowHandle tab) const
{
    std::lock_guard<std::mutex> guard(cacheLock_);
    auto window = cache_.find(topLevel);
    if (window == cache_.end())
        return -1;
    auto entry = window->second.find(tab);
    return entry == window->second.end() ? -1 : entry->second;
}

void TabActivationProber::rememberIndex(WindowHandle topLevel, WindowHandle tab, int index)
{
    std::lock_guard<std::mutex> guard(cacheLock_);
    cache_[topLevel][tab] = index;
}

void TabActivationProber::forget(WindowHandle topLevel)
{
    std::lock_guard<std::mutex> guard(cacheLock_);
    cache_.erase(topLevel);
}

} // namespace TabFold
