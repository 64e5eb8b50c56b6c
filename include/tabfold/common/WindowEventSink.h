#pragma once
// =============================================================================
// TabFold — WindowEventSink
// Receiver for the four window-lifecycle streams. Called on the thread that
// installed the hooks; implementations must return quickly.
// =============================================================================

#include "tabfold/common/Types.h"

namespace TabFold
{

class WindowEventSink
{
public:
    virtual ~WindowEventSink() = default;

    virtual void onObjectCreated(WindowHandle h) = 0;
    virtual void onWindowShown(WindowHandle h) = 0;
    virtual void onWindowDestroyed(WindowHandle h) = 0;
    virtual void onForegroundChanged(WindowHandle h) = 0;
};

} // namespace TabFold
