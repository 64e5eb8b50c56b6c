// =============================================================================
// TabFold — PathRules
// Location predicates and file: URL decoding.
// =============================================================================

#include "tabfold/logic/PathRules.h"

#include <cstdint>
#include <cwctype>
#include <string>

namespace TabFold
{

namespace PathRules
{

static bool startsWithIgnoreCase(const std::wstring& s, const wchar_t* prefix)
{
    size_t i = 0;
    for (; prefix[i] != L'\0'; ++i)
    {
        if (i >= s.size())
            return false;
        if (std::towlower(s[i]) != std::towlower(prefix[i]))
            return false;
    }
    return true;
}

static std::wstring trimmed(const std::wstring& s)
{
    size_t first = 0;
    size_t last = s.size();
    while (first < last && std::iswspace(s[first]))
        ++first;
    while (last > first && std::iswspace(s[last - 1]))
        --last;
    return s.substr(first, last - first);
}

// ─── Predicates ─────────────────────────────────────────────────────────────

bool isRealFileSystemLocation(const std::wstring& location)
{
    const std::wstring s = trimmed(location);
    if (s.empty())
        return false;

    if (startsWithIgnoreCase(s, L"shell::") || startsWithIgnoreCase(s, L"::"))
        return false;

    if (s.size() >= 2 && s[0] == L'\\' && s[1] == L'\\')
        return true;

    return s.size() >= 3 && std::iswalpha(s[0]) && s[1] == L':' &&
           (s[2] == L'\\' || s[2] == L'/');
}

bool isRealFileSystemLocation(const std::optional<std::wstring>& location)
{
    return location && isRealFileSystemLocation(*location);
}

bool isRealFileSystemLocation(const wchar_t* location)
{
    return location && isRealFileSystemLocation(std::wstring(location));
}

std::wstring normalizeForCompare(const std::wstring& path)
{
    std::wstring out = trimmed(path);
    for (auto& ch : out)
    {
        if (ch == L'/')
            ch = L'\\';
    }
    while (!out.empty() && out.back() == L'\\')
        out.pop_back();
    return out;
}

bool equalsIgnoreCase(const std::wstring& a, const std::wstring& b)
{
    if (a.size() != b.size())
        return false;
    for (size_t i = 0; i < a.size(); ++i)
    {
        if (std::towlower(a[i]) != std::towlower(b[i]))
            return false;
    }
    return true;
}

bool equivalent(const std::wstring& a, const std::wstring& b)
{
    return equalsIgnoreCase(normalizeForCompare(a), normalizeForCompare(b));
}

bool isChildPathOf(const std::wstring& parent, const std::wstring& child)
{
    const std::wstring p = normalizeForCompare(parent);
    const std::wstring c = normalizeForCompare(child);

    if (p.empty() || c.size() <= p.size())
        return false;
    if (!equalsIgnoreCase(c.substr(0, p.size()), p))
        return false;
    return c[p.size()] == L'\\';
}

std::wstring normalizeExeName(const std::wstring& imageName)
{
    std::wstring name = trimmed(imageName);
    if (name.size() >= 4 && equalsIgnoreCase(name.substr(name.size() - 4), L".exe"))
        name.resize(name.size() - 4);
    return name;
}

// ─── file: URL decoding ─────────────────────────────────────────────────────

static int hexValue(wchar_t c)
{
    if (c >= L'0' && c <= L'9') return c - L'0';
    if (c >= L'a' && c <= L'f') return c - L'a' + 10;
    if (c >= L'A' && c <= L'F') return c - L'A' + 10;
    return -1;
}

// Append one code point as UTF-16 (surrogate pair when wchar_t is 16-bit).
static void appendCodePoint(std::wstring& out, uint32_t cp)
{
    if (sizeof(wchar_t) == 2 && cp > 0xFFFF)
    {
        cp -= 0x10000;
        out.push_back(static_cast<wchar_t>(0xD800 + (cp >> 10)));
        out.push_back(static_cast<wchar_t>(0xDC00 + (cp & 0x3FF)));
    }
    else
    {
        out.push_back(static_cast<wchar_t>(cp));
    }
}

// Percent escapes form UTF-8 byte runs; everything else passes through.
static std::optional<std::wstring> unescape(const std::wstring& in)
{
    std::wstring out;
    out.reserve(in.size());

    uint32_t cp = 0;
    int pending = 0; // continuation bytes still expected

    for (size_t i = 0; i < in.size(); ++i)
    {
        if (in[i] != L'%')
        {
            if (pending != 0)
                return std::nullopt;
            out.push_back(in[i]);
            continue;
        }

        if (i + 2 >= in.size())
            return std::nullopt;
        int hi = hexValue(in[i + 1]);
        int lo = hexValue(in[i + 2]);
        if (hi < 0 || lo < 0)
            return std::nullopt;
        i += 2;

        const uint32_t byte = static_cast<uint32_t>(hi * 16 + lo);
        if (pending == 0)
        {
            if (byte < 0x80)
            {
                out.push_back(static_cast<wchar_t>(byte));
            }
            else if ((byte & 0xE0) == 0xC0) { cp = byte & 0x1F; pending = 1; }
            else if ((byte & 0xF0) == 0xE0) { cp = byte & 0x0F; pending = 2; }
            else if ((byte & 0xF8) == 0xF0) { cp = byte & 0x07; pending = 3; }
            else return std::nullopt;
        }
        else
        {
            if ((byte & 0xC0) != 0x80)
                return std::nullopt;
            cp = (cp << 6) | (byte & 0x3F);
            if (--pending == 0)
                appendCodePoint(out, cp);
        }
    }

    if (pending != 0)
        return std::nullopt;
    return out;
}

std::optional<std::wstring> decodeFileUrl(const std::wstring& url)
{
    const std::wstring s = trimmed(url);
    if (!startsWithIgnoreCase(s, L"file:"))
        return std::nullopt;

    std::wstring rest = s.substr(5);
    for (auto& ch : rest)
    {
        if (ch == L'\\')
            ch = L'/';
    }

    // Strip the authority marker; remember whether a host is present.
    std::wstring host;
    std::wstring path;
    if (rest.compare(0, 2, L"//") == 0)
    {
        rest = rest.substr(2);
        const size_t slash = rest.find(L'/');
        host = rest.substr(0, slash);
        path = (slash == std::wstring::npos) ? std::wstring() : rest.substr(slash);
    }
    else
    {
        path = rest;
    }

    if (equalsIgnoreCase(host, L"localhost"))
        host.clear();

    auto decoded = unescape(path);
    if (!decoded)
        return std::nullopt;
    std::wstring p = *decoded;

    // "/C:/Temp" -> "C:/Temp"
    if (p.size() >= 3 && p[0] == L'/' && std::iswalpha(p[1]) && (p[2] == L':' || p[2] == L'|'))
        p = p.substr(1);
    if (p.size() >= 2 && p[1] == L'|')
        p[1] = L':';

    for (auto& ch : p)
    {
        if (ch == L'/')
            ch = L'\\';
    }

    if (!host.empty())
    {
        auto decodedHost = unescape(host);
        if (!decodedHost)
            return std::nullopt;
        return L"\\\\" + *decodedHost + p;
    }

    // Bare drive root: "C:" -> "C:\"
    if (p.size() == 2 && p[1] == L':')
        p.push_back(L'\\');

    if (p.empty())
        return std::nullopt;
    return p;
}

} // namespace PathRules

} // namespace TabFold
