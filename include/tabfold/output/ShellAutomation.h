#pragma once
// =============================================================================
// TabFold — ShellAutomation
// Primitive access to the shell's out-of-process window collection
// (IShellWindows). Every primitive except invokeOnApartment() and the
// registration subscription must run on the apartment thread; ShellNavigator
// is responsible for hopping there.
// =============================================================================

#include "tabfold/common/Types.h"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace TabFold
{

// One live automation object (one shell tab). Destruction releases the
// underlying reference; destroy only on the apartment thread.
class AutomationObject
{
public:
    virtual ~AutomationObject() = default;
};

using AutomationObjectPtr = std::unique_ptr<AutomationObject>;

class ShellAutomation
{
public:
    virtual ~ShellAutomation() = default;

    // Run `fn` on the apartment thread and wait for it. Runs inline when
    // already on that thread.
    virtual void invokeOnApartment(const std::function<void()>& fn) = 0;

    // Objects currently in the collection that belong to the target shell
    // process. Caller owns (and releases) every entry.
    virtual std::vector<AutomationObjectPtr> enumerate() = 0;

    // Collection lookup by index / registration cookie. Null if absent.
    virtual AutomationObjectPtr item(long index) = 0;

    virtual std::optional<std::wstring> locationUrl(const AutomationObject& obj) = 0;
    virtual std::optional<std::wstring> folderSelfPath(const AutomationObject& obj) = 0;

    // Window the object renders into (IServiceProvider -> IShellBrowser::GetWindow).
    virtual WindowHandle hostWindow(const AutomationObject& obj) = 0;
    // Top-level frame reported by the object itself.
    virtual WindowHandle topLevelWindow(const AutomationObject& obj) = 0;

    virtual bool navigate(const AutomationObject& obj, const std::wstring& location) = 0;
    // Resolve through a namespace folder first (locations with a fragment).
    virtual bool navigateViaNamespace(const AutomationObject& obj, const std::wstring& location) = 0;

    // Window-registered push channel. Returns false when the collection does
    // not expose the connection point or the advise fails.
    using RegisteredCallback = std::function<void(long cookie)>;
    virtual bool subscribeRegistrations(RegisteredCallback onRegistered) = 0;
    virtual void unsubscribeRegistrations() = 0;
};

} // namespace TabFold
