#pragma once
// =============================================================================
// TabFold — WindowLedger
// Process-lifetime bookkeeping for the fold engine, under one lock:
//   pending    : handles with a fold attempt in flight (re-entry gate)
//   known      : top-level shell windows that are not "new"
//   earlyHidden: handles hidden speculatively by the object-create callback
// All three are pruned when a window is destroyed.
// =============================================================================

#include "tabfold/common/Types.h"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace TabFold
{

class WindowLedger
{
public:
    // False if a fold for `h` is already in flight. A second attempt is
    // dropped, not queued.
    bool tryBeginConversion(WindowHandle h, int64_t nowMs);
    void endConversion(WindowHandle h);
    bool isPending(WindowHandle h) const;

    // True if `h` was not known before.
    bool addKnown(WindowHandle h);
    bool isKnown(WindowHandle h) const;
    bool isPendingOrKnown(WindowHandle h) const;

    void markEarlyHidden(WindowHandle h, int64_t nowMs);
    // Removes `h` from the early-hidden set; true if it was there.
    bool takeEarlyHidden(WindowHandle h);
    bool isEarlyHidden(WindowHandle h) const;

    // Early-hidden handles older than `maxAgeMs` that no fold has claimed.
    // They are removed from the set; the caller restores them.
    std::vector<WindowHandle> takeStaleEarlyHidden(int64_t nowMs, int64_t maxAgeMs);
    // Empties the early-hidden set regardless of age or pending folds.
    std::vector<WindowHandle> takeAllEarlyHidden();

    // Window destroyed: drop every trace of it.
    void forget(WindowHandle h);

    size_t pendingCount() const;
    size_t knownCount() const;

private:
    mutable std::mutex lock_;
    std::unordered_map<WindowHandle, int64_t> pending_;
    std::unordered_set<WindowHandle> known_;
    std::unordered_map<WindowHandle, int64_t> earlyHidden_;
};

} // namespace TabFold
