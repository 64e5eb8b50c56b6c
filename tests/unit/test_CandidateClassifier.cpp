// =============================================================================
// Unit tests for CandidateClassifier
// Runs against the in-memory shell.
// =============================================================================

#include <catch2/catch.hpp>
#include "tabfold/logic/CandidateClassifier.h"
#include "FakeShell.h"

using namespace TabFold;
using namespace TabFold::Testing;

TEST_CASE("Shell top-level windows are targets", "[CandidateClassifier]")
{
    FakeShell shell;
    CandidateClassifier classifier(shell);

    WindowHandle w = shell.addShellWindow({L"C:\\Temp"});
    REQUIRE(classifier.hasTopLevelClass(w));
    REQUIRE(classifier.isTopLevelTarget(w));
    REQUIRE(classifier.isUsableTarget(w));
}

TEST_CASE("Process image is matched without extension and case", "[CandidateClassifier]")
{
    FakeShell shell;
    CandidateClassifier classifier(shell);

    WindowHandle upper = shell.addWindow(kShellTopLevelClass, L"EXPLORER.EXE");
    WindowHandle bare = shell.addWindow(kShellTopLevelClass, L"explorer");
    WindowHandle impostor = shell.addWindow(kShellTopLevelClass, L"notexplorer.exe");

    REQUIRE(classifier.isTopLevelTarget(upper));
    REQUIRE(classifier.isTopLevelTarget(bare));
    REQUIRE(classifier.hasTopLevelClass(impostor));
    REQUIRE_FALSE(classifier.isTopLevelTarget(impostor));
}

TEST_CASE("Other window classes are not targets", "[CandidateClassifier]")
{
    FakeShell shell;
    CandidateClassifier classifier(shell);

    WindowHandle dialog = shell.addWindow(L"#32770", L"explorer.exe");
    REQUIRE_FALSE(classifier.hasTopLevelClass(dialog));
    REQUIRE_FALSE(classifier.isTopLevelTarget(dialog));
    REQUIRE_FALSE(classifier.isTopLevelTarget(kNullWindow));
}

TEST_CASE("Hidden, minimised and destroyed windows are not usable", "[CandidateClassifier]")
{
    FakeShell shell;
    CandidateClassifier classifier(shell);

    WindowHandle hidden = shell.addShellWindow({L"C:\\A"}, false);
    WindowHandle minimised = shell.addShellWindow({L"C:\\B"});
    WindowHandle gone = shell.addShellWindow({L"C:\\C"});
    shell.setMinimized(minimised, true);
    shell.destroy(gone);

    REQUIRE(classifier.isTopLevelTarget(hidden));
    REQUIRE_FALSE(classifier.isUsableTarget(hidden));
    REQUIRE_FALSE(classifier.isUsableTarget(minimised));
    REQUIRE_FALSE(classifier.isTopLevelTarget(gone));

    REQUIRE(classifier.topLevelTargets(true).size() == 2);
    REQUIRE(classifier.topLevelTargets(false).size() == 1);
}

TEST_CASE("Tab children come back in z-order", "[CandidateClassifier]")
{
    FakeShell shell;
    CandidateClassifier classifier(shell);

    WindowHandle w = shell.addShellWindow({L"C:\\A", L"C:\\B"});
    auto tabs = classifier.tabsOf(w);
    REQUIRE(tabs.size() == 2);
    REQUIRE(classifier.activeTabOf(w) == tabs.front());
    REQUIRE(shell.locationOf(tabs.front()) == std::wstring(L"C:\\A"));

    WindowHandle added = shell.addTab(w, L"C:\\C");
    REQUIRE(classifier.activeTabOf(w) == added);
    REQUIRE(classifier.tabsOf(kNullWindow).empty());
}
