// =============================================================================
// Unit tests for RegistrationWatcher
// =============================================================================

#include <catch2/catch.hpp>
#include "tabfold/input/RegistrationWatcher.h"
#include "tabfold/logic/CandidateClassifier.h"
#include "tabfold/logic/WindowLedger.h"
#include "tabfold/output/ShellNavigator.h"
#include "FakeShell.h"

#include <vector>

using namespace TabFold;
using namespace TabFold::Testing;

namespace
{

struct Rig
{
    FakeShell shell;
    ManualClock clock;
    ManualQueue worker;
    WindowLedger ledger;
    ShellNavigator navigator{shell, shell};
    CandidateClassifier classifier{shell};
    RegistrationWatcher watcher{navigator, classifier, ledger, clock, worker};

    std::vector<RegisteredCandidate> candidates;
    int unresolved = 0;

    bool start()
    {
        return watcher.start([this](const RegisteredCandidate& c) { candidates.push_back(c); },
                             [this]() { ++unresolved; });
    }
};

} // namespace

TEST_CASE("Unsupported channel reports false", "[RegistrationWatcher]")
{
    Rig rig;
    rig.shell.registrationSupported = false;

    REQUIRE_FALSE(rig.start());
    REQUIRE_FALSE(rig.watcher.isHooked());
}

TEST_CASE("Cookie resolves to the new window", "[RegistrationWatcher]")
{
    Rig rig;
    WindowHandle old = rig.shell.addShellWindow({L"C:\\Old"});
    rig.ledger.addKnown(old);
    WindowHandle fresh = rig.shell.addShellWindow({L"C:\\Fresh"});

    auto candidate = rig.watcher.tryTakeByCookie(1);
    REQUIRE(candidate.has_value());
    REQUIRE(candidate->topLevel == fresh);
    REQUIRE(candidate->tab == rig.shell.activeTab(fresh));
    REQUIRE(candidate->location == std::wstring(L"C:\\Fresh"));
    REQUIRE(rig.ledger.isKnown(fresh));

    // Claimed once only
    REQUIRE_FALSE(rig.watcher.tryTakeByCookie(1).has_value());
}

TEST_CASE("Cookie naming a known window falls back to the first unknown", "[RegistrationWatcher]")
{
    Rig rig;
    WindowHandle old = rig.shell.addShellWindow({L"C:\\Old"});
    rig.ledger.addKnown(old);
    WindowHandle fresh = rig.shell.addShellWindow({std::wstring(kThisPc)});

    auto candidate = rig.watcher.resolveCookie(0);
    REQUIRE(candidate.has_value());
    REQUIRE(candidate->topLevel == fresh);
    REQUIRE(candidate->location == std::wstring(kThisPc));
}

TEST_CASE("Foreign windows are never claimed", "[RegistrationWatcher]")
{
    Rig rig;
    WindowHandle impostor = rig.shell.addWindow(kShellTopLevelClass, L"other.exe");
    WindowHandle tab = rig.shell.addTab(impostor, std::wstring(L"C:\\Temp"));
    (void)tab;

    REQUIRE_FALSE(rig.watcher.tryTakeFirstUnknown().has_value());
    REQUIRE_FALSE(rig.ledger.isKnown(impostor));
}

TEST_CASE("Unresolved cookie gives up after the budget", "[RegistrationWatcher]")
{
    Rig rig;
    WindowHandle old = rig.shell.addShellWindow({L"C:\\Old"});
    rig.ledger.addKnown(old);

    REQUIRE_FALSE(rig.watcher.resolveCookie(7).has_value());
    REQUIRE(rig.clock.sleptMs >= RegistrationWatcher::kResolveWaitMs);
}

TEST_CASE("Window appearing during the wait is picked up", "[RegistrationWatcher]")
{
    Rig rig;
    WindowHandle late = kNullWindow;
    rig.clock.onSleep = [&](int64_t) {
        if (late == kNullWindow && rig.clock.sleptMs >= 100)
            late = rig.shell.addShellWindow({L"C:\\Late"});
    };

    auto candidate = rig.watcher.resolveCookie(0);
    REQUIRE(candidate.has_value());
    REQUIRE(candidate->topLevel == late);
}

TEST_CASE("Notifications resolve on the worker and reach the callbacks", "[RegistrationWatcher]")
{
    Rig rig;
    REQUIRE(rig.start());

    WindowHandle fresh = rig.shell.addShellWindow({L"C:\\Fresh"});
    rig.shell.fireRegistered(0);
    REQUIRE(rig.candidates.empty());
    REQUIRE(rig.worker.tasks.size() == 1);

    rig.worker.runAll();
    REQUIRE(rig.candidates.size() == 1);
    REQUIRE(rig.candidates.front().topLevel == fresh);

    // Same window again: already known, nothing to resolve
    rig.shell.fireRegistered(0);
    rig.worker.runAll();
    REQUIRE(rig.candidates.size() == 1);
    REQUIRE(rig.unresolved == 1);
}

TEST_CASE("Stopped watcher ignores notifications", "[RegistrationWatcher]")
{
    Rig rig;
    REQUIRE(rig.start());
    rig.watcher.stop();
    rig.watcher.stop();

    REQUIRE_FALSE(rig.watcher.isHooked());
    rig.watcher.onRegistered(0);
    REQUIRE(rig.worker.tasks.empty());
}
