// =============================================================================
// TabFold — WindowEventSource
// SetWinEventHook with WINEVENT_OUTOFCONTEXT. Callbacks are static C
// functions: filter, forward to the sink, return. The sink posts anything
// slow to the worker.
// =============================================================================

#include "tabfold/input/WindowEventSource.h"
#include "tabfold/support/Log.h"

#ifndef TABFOLD_TESTING

#ifndef UNICODE
#define UNICODE
#endif
#ifndef _UNICODE
#define _UNICODE
#endif

#include <windows.h>

#include <initializer_list>

namespace TabFold
{

// Static state: hook callbacks can't use `this`.
static WindowEventSink* s_sink = nullptr;
static HWINEVENTHOOK s_shownHook = nullptr;
static HWINEVENTHOOK s_destroyedHook = nullptr;
static HWINEVENTHOOK s_foregroundHook = nullptr;
static HWINEVENTHOOK s_createHook = nullptr;

static WindowHandle toHandle(HWND hwnd)
{
    return reinterpret_cast<WindowHandle>(hwnd);
}

// ─── Hook Callback ──────────────────────────────────────────────────────────

static void CALLBACK winEventProc(HWINEVENTHOOK /*hook*/, DWORD event, HWND hwnd,
                                  LONG idObject, LONG idChild,
                                  DWORD /*eventThread*/, DWORD /*eventTime*/)
{
    if (s_sink == nullptr || hwnd == nullptr)
        return;
    if (!WindowEventSource::isWholeWindowEvent(idObject, idChild))
        return;

    switch (event)
    {
    case EVENT_OBJECT_CREATE:
        s_sink->onObjectCreated(toHandle(hwnd));
        break;
    case EVENT_OBJECT_SHOW:
        // Top-level only; child controls show constantly
        if (GetAncestor(hwnd, GA_ROOT) == hwnd)
            s_sink->onWindowShown(toHandle(hwnd));
        break;
    case EVENT_OBJECT_DESTROY:
        s_sink->onWindowDestroyed(toHandle(hwnd));
        break;
    case EVENT_SYSTEM_FOREGROUND:
        s_sink->onForegroundChanged(toHandle(hwnd));
        break;
    default:
        break;
    }
}

static HWINEVENTHOOK hookOne(DWORD event, const wchar_t* name)
{
    HWINEVENTHOOK hook = SetWinEventHook(event, event, nullptr, winEventProc, 0, 0,
                                         WINEVENT_OUTOFCONTEXT | WINEVENT_SKIPOWNPROCESS);
    if (!hook)
        Log::warn(L"SetWinEventHook(%ls) failed: %lu", name, GetLastError());
    return hook;
}

// ─── Public API ─────────────────────────────────────────────────────────────

bool WindowEventSource::install(WindowEventSink& sink, bool includeObjectCreate)
{
    s_sink = &sink;

    s_shownHook = hookOne(EVENT_OBJECT_SHOW, L"show");
    s_destroyedHook = hookOne(EVENT_OBJECT_DESTROY, L"destroy");
    s_foregroundHook = hookOne(EVENT_SYSTEM_FOREGROUND, L"foreground");
    if (includeObjectCreate)
        s_createHook = hookOne(EVENT_OBJECT_CREATE, L"create");

    return s_shownHook != nullptr;
}

void WindowEventSource::uninstall()
{
    for (HWINEVENTHOOK* hook : {&s_shownHook, &s_destroyedHook, &s_foregroundHook, &s_createHook})
    {
        if (*hook)
        {
            UnhookWinEvent(*hook);
            *hook = nullptr;
        }
    }
    s_sink = nullptr;
}

bool WindowEventSource::isInstalled() const
{
    return s_shownHook != nullptr;
}

} // namespace TabFold

#else // TABFOLD_TESTING — stub for non-Win32 test builds

namespace TabFold
{

bool WindowEventSource::install(WindowEventSink&, bool) { return false; }
void WindowEventSource::uninstall() {}
bool WindowEventSource::isInstalled() const { return false; }

} // namespace TabFold

#endif // TABFOLD_TESTING
