// =============================================================================
// TabFold — ShellNavigator
// Typed navigator over ShellAutomation. Composite lookups run wholly inside a
// single apartment hop so automation objects are acquired and released on
// the thread that owns them.
// =============================================================================

#include "tabfold/output/ShellNavigator.h"
#include "tabfold/output/WindowBridge.h"
#include "tabfold/logic/PathRules.h"

namespace TabFold
{

ShellNavigator::ShellNavigator(ShellAutomation& automation, WindowBridge& windows)
    : automation_(automation), windows_(windows)
{
}

// ─── Primitives ─────────────────────────────────────────────────────────────

std::vector<AutomationObjectPtr> ShellNavigator::snapshot()
{
    return automation_.enumerate();
}

std::optional<std::wstring> ShellNavigator::resolveLocation(const AutomationObject& obj)
{
    // LocationURL first: only file: URLs map to a filesystem path
    if (auto url = automation_.locationUrl(obj))
    {
        if (!url->empty())
        {
            if (auto path = PathRules::decodeFileUrl(*url))
                return path;
        }
    }

    // Document.Folder.Self.Path: also covers virtual folders
    if (auto path = automation_.folderSelfPath(obj))
    {
        if (!path->empty())
            return path;
    }

    return std::nullopt;
}

WindowHandle ShellNavigator::resolveWindowHandle(const AutomationObject& obj)
{
    return automation_.hostWindow(obj);
}

bool ShellNavigator::navigate(const AutomationObject& obj, const std::wstring& location)
{
    if (location.find(L'#') != std::wstring::npos)
        return automation_.navigateViaNamespace(obj, location);
    return automation_.navigate(obj, location);
}

// ─── Composites ─────────────────────────────────────────────────────────────

std::optional<std::wstring> ShellNavigator::locationByTabHandle(WindowHandle tab)
{
    if (tab == kNullWindow)
        return std::nullopt;

    return onApartment([&]() -> std::optional<std::wstring> {
        for (auto& obj : snapshot())
        {
            if (resolveWindowHandle(*obj) == tab)
                return resolveLocation(*obj);
        }
        return std::nullopt;
    });
}

std::optional<std::wstring> ShellNavigator::locationByTopLevel(WindowHandle topLevel)
{
    if (topLevel == kNullWindow)
        return std::nullopt;

    return onApartment([&]() -> std::optional<std::wstring> {
        for (auto& obj : snapshot())
        {
            if (automation_.topLevelWindow(*obj) == topLevel)
                return resolveLocation(*obj);
        }
        return std::nullopt;
    });
}

bool ShellNavigator::navigateByTabHandle(WindowHandle tab, const std::wstring& location)
{
    if (tab == kNullWindow || location.empty())
        return false;

    return onApartment([&]() {
        for (auto& obj : snapshot())
        {
            if (resolveWindowHandle(*obj) == tab)
                return navigate(*obj, location);
        }
        return false;
    });
}

int ShellNavigator::automationTabIndex(WindowHandle topLevel, WindowHandle tab)
{
    if (topLevel == kNullWindow || tab == kNullWindow)
        return -1;

    return onApartment([&]() {
        int index = 0;
        for (auto& obj : snapshot())
        {
            WindowHandle handle = resolveWindowHandle(*obj);
            if (handle == kNullWindow || windows_.rootOf(handle) != topLevel)
                continue;
            if (handle == tab)
                return index;
            ++index;
        }
        return -1;
    });
}

} // namespace TabFold
