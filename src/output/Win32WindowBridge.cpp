// =============================================================================
// TabFold — Win32WindowBridge
// Every call tolerates stale handles: the shell destroys windows at will.
// =============================================================================

#ifndef UNICODE
#define UNICODE
#endif
#ifndef _UNICODE
#define _UNICODE
#endif

#include <windows.h>
#include <shellapi.h>

#pragma comment(lib, "User32.lib")
#pragma comment(lib, "Shell32.lib")

#include <cstring>

#include "tabfold/output/Win32WindowBridge.h"
#include "tabfold/common/ShellConstants.h"
#include "tabfold/support/Log.h"

namespace TabFold
{

static HWND toHwnd(WindowHandle h)
{
    return reinterpret_cast<HWND>(h);
}

static WindowHandle toHandle(HWND hwnd)
{
    return reinterpret_cast<WindowHandle>(hwnd);
}

// WM_SETREDRAW goes to another process; never wait on a hung one
static constexpr UINT kRedrawSendTimeoutMs = 200;

// ─── Queries ────────────────────────────────────────────────────────────────

bool Win32WindowBridge::isWindow(WindowHandle h) const
{
    return h != kNullWindow && IsWindow(toHwnd(h)) != FALSE;
}

bool Win32WindowBridge::isVisible(WindowHandle h) const
{
    return h != kNullWindow && IsWindowVisible(toHwnd(h)) != FALSE;
}

bool Win32WindowBridge::isMinimized(WindowHandle h) const
{
    return h != kNullWindow && IsIconic(toHwnd(h)) != FALSE;
}

std::wstring Win32WindowBridge::className(WindowHandle h) const
{
    wchar_t buffer[256] = {};
    int len = GetClassNameW(toHwnd(h), buffer, static_cast<int>(sizeof(buffer) / sizeof(buffer[0])));
    return len > 0 ? std::wstring(buffer, static_cast<size_t>(len)) : std::wstring();
}

std::wstring Win32WindowBridge::processImageName(WindowHandle h) const
{
    DWORD pid = 0;
    GetWindowThreadProcessId(toHwnd(h), &pid);
    if (pid == 0)
        return {};

    HANDLE process = OpenProcess(PROCESS_QUERY_LIMITED_INFORMATION, FALSE, pid);
    if (!process)
        return {};

    wchar_t path[MAX_PATH] = {};
    DWORD size = MAX_PATH;
    const BOOL ok = QueryFullProcessImageNameW(process, 0, path, &size);
    CloseHandle(process);
    if (!ok)
        return {};

    std::wstring full(path, size);
    const size_t slash = full.find_last_of(L"\\/");
    return slash == std::wstring::npos ? full : full.substr(slash + 1);
}

WindowHandle Win32WindowBridge::rootOf(WindowHandle h) const
{
    return toHandle(GetAncestor(toHwnd(h), GA_ROOT));
}

WindowHandle Win32WindowBridge::foregroundWindow() const
{
    return toHandle(GetForegroundWindow());
}

struct EnumContext
{
    std::vector<WindowHandle>* out;
    bool includeInvisible;
};

static BOOL CALLBACK collectTopLevel(HWND hwnd, LPARAM lParam)
{
    auto* ctx = reinterpret_cast<EnumContext*>(lParam);
    if (ctx->includeInvisible || IsWindowVisible(hwnd))
        ctx->out->push_back(toHandle(hwnd));
    return TRUE;
}

std::vector<WindowHandle> Win32WindowBridge::topLevelWindows(bool includeInvisible) const
{
    std::vector<WindowHandle> result;
    EnumContext ctx{&result, includeInvisible};
    EnumWindows(collectTopLevel, reinterpret_cast<LPARAM>(&ctx));
    return result;
}

std::vector<WindowHandle> Win32WindowBridge::childrenOfClass(WindowHandle parent,
                                                             const wchar_t* cls) const
{
    std::vector<WindowHandle> result;
    HWND child = nullptr;
    while ((child = FindWindowExW(toHwnd(parent), child, cls, nullptr)) != nullptr)
        result.push_back(toHandle(child));
    return result;
}

// ─── Visibility ─────────────────────────────────────────────────────────────

bool Win32WindowBridge::hide(WindowHandle h)
{
    if (!isWindow(h))
        return false;
    ShowWindow(toHwnd(h), SW_HIDE);
    return !isVisible(h);
}

bool Win32WindowBridge::show(WindowHandle h)
{
    if (!isWindow(h))
        return false;
    ShowWindow(toHwnd(h), SW_SHOW);
    return isVisible(h);
}

bool Win32WindowBridge::showNoActivate(WindowHandle h)
{
    if (!isWindow(h))
        return false;
    ShowWindow(toHwnd(h), isMinimized(h) ? SW_SHOWNOACTIVATE : SW_SHOWNA);
    return isVisible(h);
}

void Win32WindowBridge::bringToForeground(WindowHandle h, WindowHandle handoffFrom)
{
    if (!isWindow(h))
        return;

    HWND target = toHwnd(h);
    if (IsIconic(target))
        ShowWindow(target, SW_RESTORE);
    BringWindowToTop(target);

    if (SetForegroundWindow(target))
        return;

    // Foreground lock: borrow the input queue of the current foreground
    // window (or the requester's window) for the duration of the switch
    HWND foreground = handoffFrom != kNullWindow && isWindow(handoffFrom)
        ? toHwnd(handoffFrom) : GetForegroundWindow();
    if (!foreground)
        return;

    const DWORD foregroundThread = GetWindowThreadProcessId(foreground, nullptr);
    const DWORD targetThread = GetWindowThreadProcessId(target, nullptr);
    const DWORD currentThread = GetCurrentThreadId();

    bool currentAttached = false;
    bool targetAttached = false;
    if (foregroundThread != 0 && foregroundThread != currentThread)
        currentAttached = AttachThreadInput(currentThread, foregroundThread, TRUE) != FALSE;
    if (foregroundThread != 0 && targetThread != 0 && targetThread != foregroundThread)
        targetAttached = AttachThreadInput(targetThread, foregroundThread, TRUE) != FALSE;

    BringWindowToTop(target);
    SetForegroundWindow(target);

    if (targetAttached)
        AttachThreadInput(targetThread, foregroundThread, FALSE);
    if (currentAttached)
        AttachThreadInput(currentThread, foregroundThread, FALSE);
}

// ─── Commands ───────────────────────────────────────────────────────────────

bool Win32WindowBridge::postClose(WindowHandle h)
{
    return isWindow(h) && PostMessageW(toHwnd(h), WM_CLOSE, 0, 0) != FALSE;
}

bool Win32WindowBridge::postCommand(WindowHandle h, unsigned commandId, std::intptr_t lParam)
{
    return isWindow(h)
        && PostMessageW(toHwnd(h), WM_COMMAND, static_cast<WPARAM>(commandId),
                        static_cast<LPARAM>(lParam)) != FALSE;
}

// ─── Anti-flicker ───────────────────────────────────────────────────────────

bool Win32WindowBridge::lockRedraw(WindowHandle h)
{
    if (!LockWindowUpdate(toHwnd(h)))
        return false;

    DWORD_PTR ignored = 0;
    SendMessageTimeoutW(toHwnd(h), WM_SETREDRAW, FALSE, 0, SMTO_ABORTIFHUNG,
                        kRedrawSendTimeoutMs, &ignored);
    return true;
}

void Win32WindowBridge::unlockRedraw(WindowHandle h)
{
    LockWindowUpdate(nullptr);

    DWORD_PTR ignored = 0;
    SendMessageTimeoutW(toHwnd(h), WM_SETREDRAW, TRUE, 0, SMTO_ABORTIFHUNG,
                        kRedrawSendTimeoutMs, &ignored);
    RedrawWindow(toHwnd(h), nullptr, nullptr,
                 RDW_INVALIDATE | RDW_ERASE | RDW_FRAME | RDW_ALLCHILDREN | RDW_UPDATENOW);
}

// ─── Fallbacks ──────────────────────────────────────────────────────────────

// True only if the clipboard currently holds text; anything else (an image,
// a file list) is left untouched by the fallback.
static bool readClipboardText(std::wstring& text)
{
    text.clear();
    if (!OpenClipboard(nullptr))
        return false;

    bool captured = false;
    if (HANDLE data = GetClipboardData(CF_UNICODETEXT))
    {
        if (auto* locked = static_cast<const wchar_t*>(GlobalLock(data)))
        {
            text = locked;
            GlobalUnlock(data);
            captured = true;
        }
    }
    CloseClipboard();
    return captured;
}

static bool writeClipboardText(const std::wstring& text)
{
    if (!OpenClipboard(nullptr))
        return false;

    EmptyClipboard();
    const size_t bytes = (text.size() + 1) * sizeof(wchar_t);
    HGLOBAL mem = GlobalAlloc(GMEM_MOVEABLE | GMEM_ZEROINIT, bytes);
    bool ok = false;
    if (mem)
    {
        if (void* dst = GlobalLock(mem))
        {
            memcpy(dst, text.c_str(), bytes);
            GlobalUnlock(mem);
            ok = SetClipboardData(CF_UNICODETEXT, mem) != nullptr;
        }
        if (!ok)
            GlobalFree(mem); // ownership passes to the clipboard only on success
    }
    CloseClipboard();
    return ok;
}

static void sendChord(WORD modifier, WORD key)
{
    INPUT inputs[4] = {};
    int count = 0;
    if (modifier)
    {
        inputs[count].type = INPUT_KEYBOARD;
        inputs[count].ki.wVk = modifier;
        ++count;
    }
    inputs[count].type = INPUT_KEYBOARD;
    inputs[count].ki.wVk = key;
    ++count;
    inputs[count].type = INPUT_KEYBOARD;
    inputs[count].ki.wVk = key;
    inputs[count].ki.dwFlags = KEYEVENTF_KEYUP;
    ++count;
    if (modifier)
    {
        inputs[count].type = INPUT_KEYBOARD;
        inputs[count].ki.wVk = modifier;
        inputs[count].ki.dwFlags = KEYEVENTF_KEYUP;
        ++count;
    }
    SendInput(static_cast<UINT>(count), inputs, sizeof(INPUT));
}

bool Win32WindowBridge::pasteIntoAddressBar(const std::wstring& location)
{
    std::wstring original;
    if (readClipboardText(original))
        displacedClipboard_ = std::move(original);
    else
        displacedClipboard_.reset();

    if (!writeClipboardText(location))
    {
        Log::warn(L"clipboard unavailable for address-bar fallback");
        displacedClipboard_.reset();
        return false;
    }

    sendChord(VK_CONTROL, 'L');
    Sleep(40);
    sendChord(VK_CONTROL, 'V');
    sendChord(0, VK_RETURN);
    return true;
}

void Win32WindowBridge::restoreClipboard()
{
    if (!displacedClipboard_)
        return;
    if (!writeClipboardText(*displacedClipboard_))
        Log::verbose(L"clipboard restore failed");
    displacedClipboard_.reset();
}

bool Win32WindowBridge::launchShellWindow(const std::wstring& location)
{
    const std::wstring args = L"\"" + location + L"\"";
    HINSTANCE result = ShellExecuteW(nullptr, L"open", kShellExecutable, args.c_str(), nullptr,
                                     SW_SHOWNORMAL);
    if (reinterpret_cast<INT_PTR>(result) <= 32)
    {
        Log::error(L"could not launch %ls for %ls", kShellExecutable, location.c_str());
        return false;
    }
    return true;
}

} // namespace TabFold
