#pragma once
// =============================================================================
// TabFold — PathRules
// Pure string predicates over shell locations. No Win32 dependencies.
// =============================================================================

#include <optional>
#include <string>

namespace TabFold
{

namespace PathRules
{

// True iff `location` is a drive path (X:\ or X:/) or a UNC path (\\).
// Virtual identifiers ("shell::...", "::{GUID}") are rejected.
bool isRealFileSystemLocation(const std::wstring& location);
bool isRealFileSystemLocation(const std::optional<std::wstring>& location);
bool isRealFileSystemLocation(const wchar_t* location);

// Separators folded to '\', trailing separators trimmed.
std::wstring normalizeForCompare(const std::wstring& path);

// Case-insensitive comparison after normalizeForCompare().
bool equivalent(const std::wstring& a, const std::wstring& b);

// True iff `child` lies strictly below `parent`.
bool isChildPathOf(const std::wstring& parent, const std::wstring& child);

// "explorer.exe" -> "explorer"; surrounding whitespace trimmed.
std::wstring normalizeExeName(const std::wstring& imageName);

// Case-insensitive equality, no normalisation.
bool equalsIgnoreCase(const std::wstring& a, const std::wstring& b);

// Decode a file: URL to a local or UNC path. Percent escapes are decoded
// as UTF-8. Returns nullopt for any non-file URL.
//   file:///C:/Temp/a%20b  -> C:\Temp\a b
//   file://server/share/x  -> \\server\share\x
std::optional<std::wstring> decodeFileUrl(const std::wstring& url);

} // namespace PathRules

} // namespace TabFold
