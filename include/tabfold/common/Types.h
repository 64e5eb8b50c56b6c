#pragma once
// =============================================================================
// TabFold — Common Types
// Window handles, fold payloads and state enums shared by every layer.
// =============================================================================

#include <cstdint>
#include <optional>
#include <string>

namespace TabFold
{

// Opaque OS window identifier. Borrowed, compared by value, may go stale at
// any time: re-check validity before every use.
using WindowHandle = std::uintptr_t;
static constexpr WindowHandle kNullWindow = 0;

// Payload produced once a registration cookie resolves to a concrete window.
struct RegisteredCandidate
{
    WindowHandle topLevel = kNullWindow;
    WindowHandle tab = kNullWindow;          // may be null
    std::optional<std::wstring> location;    // may be unresolved
};

// A live tab whose location matches a requested path.
struct ExistingTabCandidate
{
    WindowHandle topLevel = kNullWindow;
    WindowHandle tab = kNullWindow;
    std::wstring location;
};

// Fold attempt lifecycle: Idle -> PendingConversion -> {Converted | RolledBack}
enum class FoldState : uint8_t
{
    Idle,
    PendingConversion,
    Converted,
    RolledBack,
};

// Why a fold attempt ended. Logged and returned to tests.
enum class FoldOutcome : uint8_t
{
    Converted,          // new tab opened on target, source closed
    ConvertedToExisting,// existing matching tab activated, source closed
    NoTabChild,         // source never grew a tab child
    NotSingleTab,       // source has more than one tab
    NoTarget,           // no usable destination window
    LocationUnresolved, // source never reported a real location
    NewTabFailed,       // tab creation / navigation failed
    CloseFailed,        // source could not be closed
    Faulted,            // an exception escaped a step
};

inline bool isConverted(FoldOutcome o)
{
    return o == FoldOutcome::Converted || o == FoldOutcome::ConvertedToExisting;
}

const wchar_t* toString(FoldOutcome o);

} // namespace TabFold
