// =============================================================================
// Unit tests for WindowEventSource
// Event filtering only; hook installation needs a live desktop.
// =============================================================================

#include <catch2/catch.hpp>
#include "tabfold/input/WindowEventSource.h"

using namespace TabFold;

// winuser.h object ids
static constexpr long kObjWindow = 0;
static constexpr long kObjClient = -4;
static constexpr long kObjCaret  = -8;
static constexpr long kObjCursor = -9;
static constexpr long kChildSelf = 0;

TEST_CASE("Whole-window events pass the filter", "[WindowEventSource]")
{
    REQUIRE(WindowEventSource::isWholeWindowEvent(kObjWindow, kChildSelf));
}

TEST_CASE("Events about parts of a window are dropped", "[WindowEventSource]")
{
    REQUIRE_FALSE(WindowEventSource::isWholeWindowEvent(kObjCaret, kChildSelf));
    REQUIRE_FALSE(WindowEventSource::isWholeWindowEvent(kObjCursor, kChildSelf));
    REQUIRE_FALSE(WindowEventSource::isWholeWindowEvent(kObjClient, kChildSelf));
}

TEST_CASE("Child elements of a window are dropped", "[WindowEventSource]")
{
    REQUIRE_FALSE(WindowEventSource::isWholeWindowEvent(kObjWindow, 1));
    REQUIRE_FALSE(WindowEventSource::isWholeWindowEvent(kObjWindow, 42));
    REQUIRE_FALSE(WindowEventSource::isWholeWindowEvent(kObjClient, 3));
}
