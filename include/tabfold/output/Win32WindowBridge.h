#pragma once
// =============================================================================
// TabFold — Win32WindowBridge
// WindowBridge over user32 / kernel32. Product build only.
// =============================================================================

#include "tabfold/output/WindowBridge.h"

#include <optional>
#include <string>

namespace TabFold
{

class Win32WindowBridge : public WindowBridge
{
public:
    bool isWindow(WindowHandle h) const override;
    bool isVisible(WindowHandle h) const override;
    bool isMinimized(WindowHandle h) const override;
    std::wstring className(WindowHandle h) const override;
    std::wstring processImageName(WindowHandle h) const override;
    WindowHandle rootOf(WindowHandle h) const override;
    WindowHandle foregroundWindow() const override;
    std::vector<WindowHandle> topLevelWindows(bool includeInvisible) const override;
    std::vector<WindowHandle> childrenOfClass(WindowHandle parent, const wchar_t* cls) const override;

    bool hide(WindowHandle h) override;
    bool show(WindowHandle h) override;
    bool showNoActivate(WindowHandle h) override;
    void bringToForeground(WindowHandle h, WindowHandle handoffFrom) override;

    bool postClose(WindowHandle h) override;
    bool postCommand(WindowHandle h, unsigned commandId, std::intptr_t lParam) override;

    bool lockRedraw(WindowHandle h) override;
    void unlockRedraw(WindowHandle h) override;

    bool pasteIntoAddressBar(const std::wstring& location) override;
    void restoreClipboard() override;
    bool launchShellWindow(const std::wstring& location) override;

private:
    std::optional<std::wstring> displacedClipboard_;
};

} // namespace TabFold
