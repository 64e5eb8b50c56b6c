// =============================================================================
// TabFold — OpenRequest parsing
// =============================================================================

#include "tabfold/input/OpenRequest.h"
#include "tabfold/support/Log.h"

#include <climits>
#include <cwchar>
#include <cwctype>

namespace TabFold
{

namespace OpenRequestParser
{

static constexpr const wchar_t* kOpenVerb   = L"OPEN ";
static constexpr const wchar_t* kOpenExVerb = L"OPEN_EX ";

static std::wstring trim(const std::wstring& s)
{
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::iswspace(s[begin]))
        ++begin;
    while (end > begin && std::iswspace(s[end - 1]))
        --end;
    return s.substr(begin, end - begin);
}

static bool startsWith(const std::wstring& s, const wchar_t* prefix)
{
    return s.compare(0, std::wcslen(prefix), prefix) == 0;
}

bool tryParseOpen(const std::wstring& line, std::wstring& path)
{
    if (!startsWith(line, kOpenVerb))
        return false;

    std::wstring rest = trim(line.substr(std::wcslen(kOpenVerb)));
    if (rest.empty())
        return false;

    path = std::move(rest);
    return true;
}

std::optional<WindowHandle> parseWindowId(const std::wstring& token)
{
    if (token.empty())
        return std::nullopt;

    int base = 10;
    size_t pos = 0;
    if (token.size() > 2 && token[0] == L'0' && (token[1] == L'x' || token[1] == L'X'))
    {
        base = 16;
        pos = 2;
    }

    unsigned long long value = 0;
    for (; pos < token.size(); ++pos)
    {
        const wchar_t c = token[pos];
        int digit = -1;
        if (c >= L'0' && c <= L'9')
            digit = c - L'0';
        else if (base == 16 && c >= L'a' && c <= L'f')
            digit = c - L'a' + 10;
        else if (base == 16 && c >= L'A' && c <= L'F')
            digit = c - L'A' + 10;
        if (digit < 0)
            return std::nullopt;

        if (value > (ULLONG_MAX - static_cast<unsigned long long>(digit)) / base)
            return std::nullopt; // overflow
        value = value * base + static_cast<unsigned long long>(digit);
    }
    return static_cast<WindowHandle>(value);
}

bool tryParseOpenEx(const std::wstring& line, std::wstring& path, WindowHandle& foreground,
                    std::wstring& invalidReason)
{
    invalidReason.clear();
    if (!startsWith(line, kOpenExVerb))
        return false;

    const std::wstring rest = trim(line.substr(std::wcslen(kOpenExVerb)));

    size_t split = 0;
    while (split < rest.size() && !std::iswspace(rest[split]))
        ++split;

    auto hwnd = parseWindowId(rest.substr(0, split));
    if (!hwnd)
    {
        invalidReason = L"invalid hwnd";
        return false;
    }

    std::wstring target = trim(rest.substr(split));
    if (target.empty())
    {
        invalidReason = L"missing path";
        return false;
    }

    path = std::move(target);
    foreground = *hwnd;
    return true;
}

std::optional<OpenRequest> parse(const std::wstring& line)
{
    if (trim(line).empty())
        return std::nullopt;

    OpenRequest request;
    std::wstring reason;
    if (tryParseOpenEx(line, request.path, request.foreground, reason))
        return request;
    if (!reason.empty())
    {
        Log::warn(L"rejected open request: %ls", reason.c_str());
        return std::nullopt;
    }

    if (tryParseOpen(line, request.path))
        return request;

    Log::verbose(L"ignored pipe line: %ls", line.c_str());
    return std::nullopt;
}

std::optional<std::string> takeRequestLine(const std::string& bytes, bool interrupted)
{
    if (interrupted || bytes.empty())
        return std::nullopt;

    std::string line = bytes.substr(0, bytes.find('\n'));
    if (!line.empty() && line.back() == '\r')
        line.pop_back();
    return line;
}

std::wstring formatOpenEx(WindowHandle foreground, const std::wstring& path)
{
    return L"OPEN_EX " + std::to_wstring(static_cast<unsigned long long>(foreground)) + L" "
        + path + L"\n";
}

} // namespace OpenRequestParser

} // namespace TabFold
