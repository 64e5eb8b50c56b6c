// =============================================================================
// TabFold — RegistrationWatcher
// =============================================================================

#include "tabfold/input/RegistrationWatcher.h"
#include "tabfold/logic/CandidateClassifier.h"
#include "tabfold/logic/WindowLedger.h"
#include "tabfold/common/PollUntil.h"
#include "tabfold/common/TaskQueue.h"
#include "tabfold/output/ShellNavigator.h"
#include "tabfold/support/Log.h"

#include <utility>

namespace TabFold
{

RegistrationWatcher::RegistrationWatcher(ShellNavigator& navigator,
                                         const CandidateClassifier& classifier,
                                         WindowLedger& ledger, Clock& clock, TaskQueue& worker)
    : navigator_(navigator), classifier_(classifier), ledger_(ledger), clock_(clock), worker_(worker)
{
}

bool RegistrationWatcher::start(CandidateCallback onCandidate, UnresolvedCallback onUnresolved)
{
    onCandidate_ = std::move(onCandidate);
    onUnresolved_ = std::move(onUnresolved);

    const bool hooked = navigator_.automation().subscribeRegistrations(
        [this](long cookie) { onRegistered(cookie); });
    hooked_.store(hooked, std::memory_order_release);

    if (hooked)
        Log::info(L"window registration channel active");
    else
        Log::warn(L"window registration channel unavailable, using show events only");
    return hooked;
}

void RegistrationWatcher::stop()
{
    if (hooked_.exchange(false, std::memory_order_acq_rel))
        navigator_.automation().unsubscribeRegistrations();
}

void RegistrationWatcher::onRegistered(long cookie)
{
    if (!isHooked())
        return;

    worker_.post([this, cookie]() {
        auto candidate = resolveCookie(cookie);
        if (candidate)
        {
            if (onCandidate_)
                onCandidate_(*candidate);
        }
        else
        {
            Log::verbose(L"registration cookie %ld did not resolve", cookie);
            if (onUnresolved_)
                onUnresolved_();
        }
    });
}

std::optional<RegisteredCandidate> RegistrationWatcher::resolveCookie(long cookie)
{
    return pollFor(clock_, {kResolvePollMs, kResolveWaitMs},
                   [&]() -> std::optional<RegisteredCandidate> {
                       if (auto byCookie = tryTakeByCookie(cookie))
                           return byCookie;
                       return tryTakeFirstUnknown();
                   });
}

bool RegistrationWatcher::claim(WindowHandle topLevel)
{
    if (topLevel == kNullWindow || ledger_.isKnown(topLevel))
        return false;
    if (!classifier_.isTopLevelTarget(topLevel))
        return false;
    return ledger_.addKnown(topLevel);
}

std::optional<RegisteredCandidate> RegistrationWatcher::tryTakeByCookie(long cookie)
{
    return navigator_.onApartment([&]() -> std::optional<RegisteredCandidate> {
        AutomationObjectPtr obj = navigator_.automation().item(cookie);
        if (!obj)
            return std::nullopt;

        const WindowHandle topLevel = navigator_.automation().topLevelWindow(*obj);
        if (!claim(topLevel))
            return std::nullopt;

        RegisteredCandidate candidate;
        candidate.topLevel = topLevel;
        candidate.tab = navigator_.resolveWindowHandle(*obj);
        candidate.location = navigator_.resolveLocation(*obj);
        return candidate;
    });
}

std::optional<RegisteredCandidate> RegistrationWatcher::tryTakeFirstUnknown()
{
    return navigator_.onApartment([&]() -> std::optional<RegisteredCandidate> {
        for (const auto& obj : navigator_.snapshot())
        {
            const WindowHandle topLevel = navigator_.automation().topLevelWindow(*obj);
            if (!claim(topLevel))
                continue;

            RegisteredCandidate candidate;
            candidate.topLevel = topLevel;
            candidate.tab = navigator_.resolveWindowHandle(*obj);
            candidate.location = navigator_.resolveLocation(*obj);
            return candidate;
        }
        return std::nullopt;
    });
}

} // namespace TabFold
