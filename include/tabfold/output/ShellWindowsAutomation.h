#pragma once
// =============================================================================
// TabFold — ShellWindowsAutomation
// ShellAutomation over the shell's IShellWindows collection. Owns a
// dedicated single-threaded apartment: a thread with a message-only window
// and a pump. invokeOnApartment() posts work to that window and waits, so
// COM modal loops keep dispatching it. The IShellWindows pointer is bound to
// the thread that created it and recreated if touched from any other.
// Product build only.
// =============================================================================

#include "tabfold/output/ShellAutomation.h"

#include <atomic>

namespace TabFold
{

class ShellWindowsAutomation : public ShellAutomation
{
public:
    ~ShellWindowsAutomation() override;

    // Spawns the apartment thread and creates the collection on it.
    // False if COM or the collection cannot be initialised.
    bool start();
    void stop();

    void invokeOnApartment(const std::function<void()>& fn) override;

    std::vector<AutomationObjectPtr> enumerate() override;
    AutomationObjectPtr item(long index) override;

    std::optional<std::wstring> locationUrl(const AutomationObject& obj) override;
    std::optional<std::wstring> folderSelfPath(const AutomationObject& obj) override;
    WindowHandle hostWindow(const AutomationObject& obj) override;
    WindowHandle topLevelWindow(const AutomationObject& obj) override;

    bool navigate(const AutomationObject& obj, const std::wstring& location) override;
    bool navigateViaNamespace(const AutomationObject& obj, const std::wstring& location) override;

    bool subscribeRegistrations(RegisteredCallback onRegistered) override;
    void unsubscribeRegistrations() override;

private:
    struct Impl;
    Impl* impl_ = nullptr;
    std::atomic<bool> running_{false};
};

} // namespace TabFold
