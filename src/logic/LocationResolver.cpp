// =============================================================================
// TabFold — LocationResolver
// =============================================================================

#include "tabfold/logic/LocationResolver.h"
#include "tabfold/logic/PathRules.h"
#include "tabfold/common/PollUntil.h"
#include "tabfold/output/ShellNavigator.h"

namespace TabFold
{

LocationResolver::LocationResolver(ShellNavigator& navigator, Clock& clock)
    : navigator_(navigator), clock_(clock)
{
}

std::optional<std::wstring> LocationResolver::waitForRealLocation(WindowHandle tab,
                                                                  WindowHandle topLevel,
                                                                  int timeoutMs)
{
    return pollFor(clock_, {kPollIntervalMs, timeoutMs}, [&]() -> std::optional<std::wstring> {
        if (tab != kNullWindow)
        {
            auto location = navigator_.locationByTabHandle(tab);
            if (PathRules::isRealFileSystemLocation(location))
                return location;
        }

        if (topLevel != kNullWindow)
        {
            auto location = navigator_.locationByTopLevel(topLevel);
            if (PathRules::isRealFileSystemLocation(location))
                return location;
        }

        return std::nullopt;
    });
}

bool LocationResolver::waitUntilLocationMatches(WindowHandle tab, const std::wstring& location,
                                                int timeoutMs)
{
    if (tab == kNullWindow)
        return false;

    return pollUntil(clock_, {kPollIntervalMs, timeoutMs}, [&]() {
        auto current = navigator_.locationByTabHandle(tab);
        return current && PathRules::equivalent(*current, location);
    });
}

} // namespace TabFold
