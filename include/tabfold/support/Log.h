#pragma once
// =============================================================================
// TabFold — Log
// Level-filtered, printf-style wide logging. Default sink is the debugger
// output stream (OutputDebugStringW); a file sink is added when enabled in
// settings. Use %ls for wide strings: portable across MSVC and glibc.
// =============================================================================

#include <cstdint>
#include <string>

namespace TabFold
{

enum class LogLevel : uint8_t
{
    Verbose = 0,
    Info    = 1,
    Warn    = 2,
    Error   = 3,
};

namespace Log
{

using Sink = void(*)(LogLevel level, const std::wstring& line, void* userData);

// Registers the default sink. Safe to call more than once.
void initialize();

void setMinimumLevel(LogLevel level);
LogLevel minimumLevel();

void addSink(Sink sink, void* userData);
void removeSink(Sink sink, void* userData);

// Appends timestamped lines to `path` (UTF-8). Returns false if the file
// cannot be opened.
bool enableFileSink(const std::wstring& path);
void disableFileSink();

void write(LogLevel level, const wchar_t* format, ...);

template <typename... Args>
inline void verbose(const wchar_t* format, Args... args)
{
    write(LogLevel::Verbose, format, args...);
}

template <typename... Args>
inline void info(const wchar_t* format, Args... args)
{
    write(LogLevel::Info, format, args...);
}

template <typename... Args>
inline void warn(const wchar_t* format, Args... args)
{
    write(LogLevel::Warn, format, args...);
}

template <typename... Args>
inline void error(const wchar_t* format, Args... args)
{
    write(LogLevel::Error, format, args...);
}

const wchar_t* levelName(LogLevel level);

// Byte-wise widening for exception messages and other ASCII text.
std::wstring widen(const char* text);

} // namespace Log

} // namespace TabFold
