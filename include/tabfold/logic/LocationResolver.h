#pragma once
// =============================================================================
// TabFold — LocationResolver
// Bounded waits for a window's location to settle on a real filesystem path.
// Fresh windows briefly report a virtual identifier ("This PC") or nothing.
// =============================================================================

#include "tabfold/common/Types.h"

#include <optional>
#include <string>

namespace TabFold
{

class Clock;
class ShellNavigator;

class LocationResolver
{
public:
    static constexpr int kPollIntervalMs = 40;

    LocationResolver(ShellNavigator& navigator, Clock& clock);

    // Tab handle first, then the top-level handle. Either may be null.
    std::optional<std::wstring> waitForRealLocation(WindowHandle tab, WindowHandle topLevel,
                                                    int timeoutMs);

    // True once `tab` reports a location equivalent to `location`.
    bool waitUntilLocationMatches(WindowHandle tab, const std::wstring& location, int timeoutMs);

private:
    ShellNavigator& navigator_;
    Clock& clock_;
};

} // namespace TabFold
