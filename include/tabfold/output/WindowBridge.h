#pragma once
// =============================================================================
// TabFold — WindowBridge
// Sole abstraction over user32 window calls. No other component calls
// window-management APIs directly, which keeps the fold engine testable
// against an in-memory shell.
// =============================================================================

#include "tabfold/common/Types.h"

#include <cstdint>
#include <string>
#include <vector>

namespace TabFold
{

class WindowBridge
{
public:
    virtual ~WindowBridge() = default;

    // ── Queries ──
    virtual bool isWindow(WindowHandle h) const = 0;
    virtual bool isVisible(WindowHandle h) const = 0;
    virtual bool isMinimized(WindowHandle h) const = 0;
    virtual std::wstring className(WindowHandle h) const = 0;

    // Image name of the owning process, e.g. L"explorer.exe". Empty on failure.
    virtual std::wstring processImageName(WindowHandle h) const = 0;

    virtual WindowHandle rootOf(WindowHandle h) const = 0;
    virtual WindowHandle foregroundWindow() const = 0;
    virtual std::vector<WindowHandle> topLevelWindows(bool includeInvisible) const = 0;

    // Direct children of `parent` with the given class, in z-order.
    // For the shell's tab children the first entry is the active tab.
    virtual std::vector<WindowHandle> childrenOfClass(WindowHandle parent,
                                                      const wchar_t* cls) const = 0;

    // ── Visibility ──
    virtual bool hide(WindowHandle h) = 0;
    virtual bool show(WindowHandle h) = 0;
    virtual bool showNoActivate(WindowHandle h) = 0;

    // Raise and activate. `handoffFrom` names the window whose input queue is
    // attached when the plain SetForegroundWindow is refused; null means the
    // current foreground window.
    virtual void bringToForeground(WindowHandle h, WindowHandle handoffFrom = kNullWindow) = 0;

    // ── Commands (posted, never sent) ──
    virtual bool postClose(WindowHandle h) = 0;
    virtual bool postCommand(WindowHandle h, unsigned commandId, std::intptr_t lParam) = 0;

    // ── Anti-flicker ──
    // LockWindowUpdate + WM_SETREDRAW(FALSE). Returns false if the update
    // lock could not be taken (another window holds it).
    virtual bool lockRedraw(WindowHandle h) = 0;
    // Releases the lock, re-enables redraw and forces a full repaint.
    virtual void unlockRedraw(WindowHandle h) = 0;

    // ── Last-resort fallbacks ──
    // Clipboard + keystroke address-bar injection into the foreground window.
    // The keystrokes are only queued: `location` stays on the clipboard until
    // restoreClipboard() is called.
    virtual bool pasteIntoAddressBar(const std::wstring& location) = 0;
    // Puts back the text the last paste displaced. Nothing happens if the
    // clipboard held no text before the paste.
    virtual void restoreClipboard() = 0;
    // Plain `explorer.exe "<location>"`.
    virtual bool launchShellWindow(const std::wstring& location) = 0;
};

} // namespace TabFold
