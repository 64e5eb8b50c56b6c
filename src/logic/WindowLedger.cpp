// =============================================================================
// TabFold — WindowLedger
// =============================================================================

#include "tabfold/logic/WindowLedger.h"

namespace TabFold
{

bool WindowLedger::tryBeginConversion(WindowHandle h, int64_t nowMs)
{
    std::lock_guard<std::mutex> guard(lock_);
    return pending_.emplace(h, nowMs).second;
}

void WindowLedger::endConversion(WindowHandle h)
{
    std::lock_guard<std::mutex> guard(lock_);
    pending_.erase(h);
}

bool WindowLedger::isPending(WindowHandle h) const
{
    std::lock_guard<std::mutex> guard(lock_);
    return pending_.count(h) != 0;
}

bool WindowLedger::addKnown(WindowHandle h)
{
    std::lock_guard<std::mutex> guard(lock_);
    return known_.insert(h).second;
}

bool WindowLedger::isKnown(WindowHandle h) const
{
    std::lock_guard<std::mutex> guard(lock_);
    return known_.count(h) != 0;
}

bool WindowLedger::isPendingOrKnown(WindowHandle h) const
{
    std::lock_guard<std::mutex> guard(lock_);
    return pending_.count(h) != 0 || known_.count(h) != 0;
}

void WindowLedger::markEarlyHidden(WindowHandle h, int64_t nowMs)
{
    std::lock_guard<std::mutex> guard(lock_);
    earlyHidden_.emplace(h, nowMs);
}

bool WindowLedger::takeEarlyHidden(WindowHandle h)
{
    std::lock_guard<std::mutex> guard(lock_);
    return earlyHidden_.erase(h) != 0;
}

bool WindowLedger::isEarlyHidden(WindowHandle h) const
{
    std::lock_guard<std::mutex> guard(lock_);
    return earlyHidden_.count(h) != 0;
}

std::vector<WindowHandle> WindowLedger::takeStaleEarlyHidden(int64_t nowMs, int64_t maxAgeMs)
{
    std::lock_guard<std::mutex> guard(lock_);
    std::vector<WindowHandle> stale;
    for (auto it = earlyHidden_.begin(); it != earlyHidden_.end();)
    {
        if (nowMs - it->second >= maxAgeMs && pending_.count(it->first) == 0)
        {
            stale.push_back(it->first);
            it = earlyHidden_.erase(it);
        }
        else
        {
            ++it;
        }
    }
    return stale;
}

std::vector<WindowHandle> WindowLedger::takeAllEarlyHidden()
{
    std::lock_guard<std::mutex> guard(lock_);
    std::vector<WindowHandle> all;
    all.reserve(earlyHidden_.size());
    for (const auto& entry : earlyHidden_)
        all.push_back(entry.first);
    earlyHidden_.clear();
    return all;
}

void WindowLedger::forget(WindowHandle h)
{
    std::lock_guard<std::mutex> guard(lock_);
    pending_.erase(h);
    known_.erase(h);
    earlyHidden_.erase(h);
}

size_t WindowLedger::pendingCount() const
{
    std::lock_guard<std::mutex> guard(lock_);
    return pending_.size();
}

size_t WindowLedger::knownCount() const
{
    std::lock_guard<std::mutex> guard(lock_);
    return known_.size();
}

} // namespace TabFold
