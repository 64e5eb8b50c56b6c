// =============================================================================
// TabFold — Log
// Sink registry, level filter, formatting. Default sink writes to the
// debugger (OutputDebugStringW) in the product build and to stderr in test
// builds. File sink appends UTF-8 lines.
// =============================================================================

#include "tabfold/support/Log.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <cwchar>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <vector>

#ifndef TABFOLD_TESTING
#ifndef UNICODE
#define UNICODE
#endif
#ifndef _UNICODE
#define _UNICODE
#endif
#include <windows.h>
#endif

namespace TabFold
{

namespace Log
{

struct SinkEntry { Sink sink; void* userData; };

static std::mutex s_lock;
static std::vector<SinkEntry> s_sinks;
static std::atomic<LogLevel> s_minLevel{LogLevel::Info};
static bool s_initialized = false;
static std::ofstream s_file;

static constexpr size_t kMaxLineChars = 2048;

// ─── Built-in sinks ─────────────────────────────────────────────────────────

static void debuggerSink(LogLevel /*level*/, const std::wstring& line, void* /*userData*/)
{
#ifndef TABFOLD_TESTING
    std::wstring out = L"TabFold: " + line + L"\n";
    OutputDebugStringW(out.c_str());
#else
    std::fwprintf(stderr, L"TabFold: %ls\n", line.c_str());
#endif
}

static std::string toUtf8(const std::wstring& s)
{
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i)
    {
        uint32_t cp = static_cast<uint32_t>(s[i]);
        // Join UTF-16 surrogate pairs (Windows wchar_t)
        if (cp >= 0xD800 && cp <= 0xDBFF && i + 1 < s.size())
        {
            uint32_t lo = static_cast<uint32_t>(s[i + 1]);
            if (lo >= 0xDC00 && lo <= 0xDFFF)
            {
                cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                ++i;
            }
        }

        if (cp < 0x80)
        {
            out.push_back(static_cast<char>(cp));
        }
        else if (cp < 0x800)
        {
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
        else if (cp < 0x10000)
        {
            out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
        else
        {
            out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }
    return out;
}

static std::string timestamp()
{
    using namespace std::chrono;
    const auto now = system_clock::now();
    const std::time_t t = system_clock::to_time_t(now);
    const int ms = static_cast<int>(duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000);

    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d.%03d",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec, ms);
    return buf;
}

// Called with s_lock held.
static void fileSink(LogLevel level, const std::wstring& line, void* /*userData*/)
{
    if (!s_file.is_open())
        return;
    s_file << timestamp() << ' ' << toUtf8(levelName(level)) << ' ' << toUtf8(line) << '\n';
    s_file.flush();
}

// ─── Registry ───────────────────────────────────────────────────────────────

void initialize()
{
    std::lock_guard<std::mutex> guard(s_lock);
    if (s_initialized)
        return;
    s_sinks.push_back({debuggerSink, nullptr});
    s_initialized = true;
}

void setMinimumLevel(LogLevel level)
{
    s_minLevel.store(level, std::memory_order_relaxed);
}

LogLevel minimumLevel()
{
    return s_minLevel.load(std::memory_order_relaxed);
}

void addSink(Sink sink, void* userData)
{
    std::lock_guard<std::mutex> guard(s_lock);
    s_sinks.push_back({sink, userData});
}

void removeSink(Sink sink, void* userData)
{
    std::lock_guard<std::mutex> guard(s_lock);
    s_sinks.erase(std::remove_if(s_sinks.begin(), s_sinks.end(),
                                 [&](const SinkEntry& e) { return e.sink == sink && e.userData == userData; }),
                  s_sinks.end());
}

bool enableFileSink(const std::wstring& path)
{
    std::lock_guard<std::mutex> guard(s_lock);
    if (s_file.is_open())
        return true;

    std::error_code ec;
    std::filesystem::path p(path);
    std::filesystem::create_directories(p.parent_path(), ec);
    // Ignore ec: directory may already exist

    s_file.open(p, std::ios::app);
    if (!s_file.is_open())
        return false;

    s_sinks.push_back({fileSink, nullptr});
    return true;
}

void disableFileSink()
{
    std::lock_guard<std::mutex> guard(s_lock);
    s_sinks.erase(std::remove_if(s_sinks.begin(), s_sinks.end(),
                                 [](const SinkEntry& e) { return e.sink == fileSink; }),
                  s_sinks.end());
    if (s_file.is_open())
        s_file.close();
}

// ─── Write ──────────────────────────────────────────────────────────────────

void write(LogLevel level, const wchar_t* format, ...)
{
    if (static_cast<uint8_t>(level) < static_cast<uint8_t>(minimumLevel()) || !format)
        return;

    wchar_t buffer[kMaxLineChars];
    va_list args;
    va_start(args, format);
    int n = std::vswprintf(buffer, kMaxLineChars, format, args);
    va_end(args);
    if (n < 0)
    {
        // Truncated or malformed; log what fits
        buffer[kMaxLineChars - 1] = L'\0';
    }

    const std::wstring line(buffer);

    std::lock_guard<std::mutex> guard(s_lock);
    for (auto& entry : s_sinks)
        entry.sink(level, line, entry.userData);
}

const wchar_t* levelName(LogLevel level)
{
    switch (level)
    {
    case LogLevel::Verbose: return L"VERBOSE";
    case LogLevel::Info:    return L"INFO";
    case LogLevel::Warn:    return L"WARN";
    case LogLevel::Error:   return L"ERROR";
    }
    return L"ERROR";
}

std::wstring widen(const char* text)
{
    std::wstring out;
    if (!text)
        return out;
    for (const char* c = text; *c; ++c)
        out.push_back(static_cast<wchar_t>(static_cast<unsigned char>(*c)));
    return out;
}

} // namespace Log

} // namespace TabFold
