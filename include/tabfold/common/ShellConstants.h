#pragma once
// =============================================================================
// TabFold — Shell Constants
// Classification strings and the shell's internal WM_COMMAND identifiers.
// Single source of truth for everything that identifies the target shell.
// =============================================================================

namespace TabFold
{

// Exact-match, case-insensitive
static constexpr const wchar_t* kShellTopLevelClass = L"CabinetWClass";
static constexpr const wchar_t* kShellTabClass      = L"ShellTabWindowClass";
static constexpr const wchar_t* kShellProcessName   = L"explorer";
static constexpr const wchar_t* kShellExecutable    = L"explorer.exe";

// Undocumented shell commands, posted as WM_COMMAND wParam
static constexpr unsigned kCmdOpenNewTab        = 0xA21B; // to active tab
static constexpr unsigned kCmdCloseTab          = 0xA021; // to tab, lParam = 1
static constexpr unsigned kCmdSelectTabByIndex  = 0xA221; // to top-level, lParam = index + 1

// Named pipe carrying open requests from the verb handler
static constexpr const wchar_t* kOpenRequestPipeName = L"\\\\.\\pipe\\TabFold_OpenRequest";

} // namespace TabFold
