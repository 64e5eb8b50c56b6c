#pragma once
// =============================================================================
// TabFold — TargetSelector
// Chooses the destination window for a fold. Preference order:
//   1. the current foreground window
//   2. the shell window that most recently held the foreground
//   3. the visible window with the most tabs
// Candidates must be alive, visible, not minimised and classified.
// =============================================================================

#include "tabfold/common/Types.h"

#include <atomic>

namespace TabFold
{

class CandidateClassifier;
class WindowBridge;

class TargetSelector
{
public:
    TargetSelector(const WindowBridge& windows, const CandidateClassifier& classifier);

    // Null if no usable window other than `exclude` exists.
    WindowHandle pickTarget(WindowHandle exclude) const;

    // Foreground-change feed. Non-shell windows are ignored, so the last
    // shell window survives focus moving elsewhere.
    void noteForeground(WindowHandle h);
    WindowHandle lastForeground() const { return lastForeground_.load(std::memory_order_acquire); }

    void forget(WindowHandle h);

private:
    bool usable(WindowHandle h, WindowHandle exclude) const;

    const WindowBridge& windows_;
    const CandidateClassifier& classifier_;
    std::atomic<WindowHandle> lastForeground_{kNullWindow};
};

} // namespace TabFold
