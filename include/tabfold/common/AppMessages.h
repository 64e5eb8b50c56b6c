#pragma once
// =============================================================================
// TabFold — Application-Defined Messages
// Shared between main.cpp and the apartment thread. Single source of truth.
// =============================================================================

#ifndef UNICODE
#define UNICODE
#endif
#ifndef _UNICODE
#define _UNICODE
#endif

#include <windows.h>

namespace TabFold
{

// Application-defined window messages
static constexpr UINT WM_APARTMENT_INVOKE = WM_APP + 1; // lParam = queued call
static constexpr UINT WM_GRACEFUL_EXIT    = WM_APP + 2;

} // namespace TabFold
