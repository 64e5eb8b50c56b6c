#pragma once
// =============================================================================
// TabFold — OpenRequest
// Line protocol spoken over the open-request pipe:
//   OPEN <path>
//   OPEN_EX <foreground-hwnd> <path>     (hwnd decimal or 0x-prefixed hex)
// Parsing is pure so the rules are testable without a pipe.
// =============================================================================

#include "tabfold/common/Types.h"

#include <optional>
#include <string>

namespace TabFold
{

struct OpenRequest
{
    std::wstring path;
    WindowHandle foreground = kNullWindow;   // OPEN_EX only
};

namespace OpenRequestParser
{

// "OPEN <path>". False for other verbs or an empty path.
bool tryParseOpen(const std::wstring& line, std::wstring& path);

// "OPEN_EX <hwnd> <path>". On a malformed line returns false and sets
// `invalidReason` to "invalid hwnd" or "missing path"; for other verbs
// returns false with `invalidReason` left empty.
bool tryParseOpenEx(const std::wstring& line, std::wstring& path, WindowHandle& foreground,
                    std::wstring& invalidReason);

// Either form. Unknown verbs and blank lines yield nullopt.
std::optional<OpenRequest> parse(const std::wstring& line);

std::optional<WindowHandle> parseWindowId(const std::wstring& token);

// Frames one request out of the raw bytes a connection delivered: up to the
// first newline (or everything, if the client closed without one), minus a
// trailing CR. A read interrupted by shutdown yields nothing, however many
// bytes arrived.
std::optional<std::string> takeRequestLine(const std::string& bytes, bool interrupted);

// Client side: "OPEN_EX <hwnd> <path>\n"
std::wstring formatOpenEx(WindowHandle foreground, const std::wstring& path);

} // namespace OpenRequestParser

} // namespace TabFold
