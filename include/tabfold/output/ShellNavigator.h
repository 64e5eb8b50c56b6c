#pragma once
// =============================================================================
// TabFold — ShellNavigator
// Typed operations over the shell's automation collection. Every public call
// marshals itself onto the apartment thread; automation objects never leave
// it. All lookups report "nothing" rather than failing: transient windows
// often have no location for tens of milliseconds after creation.
// =============================================================================

#include "tabfold/common/Types.h"
#include "tabfold/output/ShellAutomation.h"

#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace TabFold
{

class WindowBridge;

class ShellNavigator
{
public:
    ShellNavigator(ShellAutomation& automation, WindowBridge& windows);

    // Run `fn` on the apartment thread and return its result.
    template <typename Fn>
    auto onApartment(Fn&& fn) -> decltype(fn())
    {
        using R = decltype(fn());
        if constexpr (std::is_void_v<R>)
        {
            automation_.invokeOnApartment([&]() { fn(); });
        }
        else
        {
            std::optional<R> result;
            automation_.invokeOnApartment([&]() { result.emplace(fn()); });
            return result ? std::move(*result) : R{};
        }
    }

    // ── Primitives (call from inside onApartment) ──
    std::vector<AutomationObjectPtr> snapshot();
    std::optional<std::wstring> resolveLocation(const AutomationObject& obj);
    WindowHandle resolveWindowHandle(const AutomationObject& obj);
    bool navigate(const AutomationObject& obj, const std::wstring& location);

    // ── Composite lookups (marshal themselves) ──
    std::optional<std::wstring> locationByTabHandle(WindowHandle tab);
    std::optional<std::wstring> locationByTopLevel(WindowHandle topLevel);
    bool navigateByTabHandle(WindowHandle tab, const std::wstring& location);

    // Position of `tab` among the automation objects whose root is
    // `topLevel`, in collection order. -1 if not found.
    int automationTabIndex(WindowHandle topLevel, WindowHandle tab);

    ShellAutomation& automation() { return automation_; }

private:
    ShellAutomation& automation_;
    WindowBridge& windows_;
};

} // namespace TabFold
