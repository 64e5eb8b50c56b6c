#pragma once
// =============================================================================
// TabFold — WindowEventSource
// Out-of-context WinEvent hooks for window shown / destroyed / foreground /
// object-create, routed to a WindowEventSink. Hooks are delivered on the
// installing thread, which must pump messages.
// =============================================================================

#include "tabfold/common/WindowEventSink.h"

namespace TabFold
{

class WindowEventSource
{
public:
    // Installs shown, destroyed and foreground hooks, plus object-create when
    // `includeObjectCreate`. Returns false if the shown hook (the one the
    // fold depends on) could not be installed; other failures are logged.
    bool install(WindowEventSink& sink, bool includeObjectCreate);
    void uninstall();
    bool isInstalled() const;

    // Only whole-window notifications are forwarded, not those about a
    // window's child objects.
    static bool isWholeWindowEvent(long idObject, long idChild)
    {
        return idObject == 0 /* OBJID_WINDOW */ && idChild == 0 /* CHILDID_SELF */;
    }
};

} // namespace TabFold
