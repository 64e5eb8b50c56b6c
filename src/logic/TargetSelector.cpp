// =============================================================================
// TabFold — TargetSelector
// =============================================================================

#include "tabfold/logic/TargetSelector.h"
#include "tabfold/logic/CandidateClassifier.h"
#include "tabfold/output/WindowBridge.h"

namespace TabFold
{

TargetSelector::TargetSelector(const WindowBridge& windows, const CandidateClassifier& classifier)
    : windows_(windows), classifier_(classifier)
{
}

bool TargetSelector::usable(WindowHandle h, WindowHandle exclude) const
{
    return h != kNullWindow && h != exclude && classifier_.isUsableTarget(h);
}

WindowHandle TargetSelector::pickTarget(WindowHandle exclude) const
{
    const WindowHandle foreground = windows_.foregroundWindow();
    if (usable(foreground, exclude))
        return foreground;

    const WindowHandle last = lastForeground();
    if (usable(last, exclude))
        return last;

    // Fallback: the visible window with the most tabs. Ties keep the first
    // in enumeration (z-order) order.
    WindowHandle best = kNullWindow;
    size_t bestTabs = 0;
    for (WindowHandle h : classifier_.topLevelTargets(false))
    {
        if (!usable(h, exclude))
            continue;

        const size_t tabs = classifier_.tabsOf(h).size();
        if (best == kNullWindow || tabs > bestTabs)
        {
            best = h;
            bestTabs = tabs;
        }
    }
    return best;
}

void TargetSelector::noteForeground(WindowHandle h)
{
    if (classifier_.isTopLevelTarget(h))
        lastForeground_.store(h, std::memory_order_release);
}

void TargetSelector::forget(WindowHandle h)
{
    WindowHandle expected = h;
    lastForeground_.compare_exchange_strong(expected, kNullWindow, std::memory_order_acq_rel);
}

} // namespace TabFold
