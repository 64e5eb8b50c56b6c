// =============================================================================
// TabFold — OpenRequestServer
// Overlapped named-pipe server on its own thread. Every blocking wait also
// waits on the stop event so stop() never hangs on an idle pipe.
// =============================================================================

#include "tabfold/input/OpenRequestServer.h"
#include "tabfold/common/ShellConstants.h"
#include "tabfold/support/Log.h"

#ifndef TABFOLD_TESTING

#ifndef UNICODE
#define UNICODE
#endif
#ifndef _UNICODE
#define _UNICODE
#endif

#include <windows.h>

#include <exception>
#include <string>
#include <thread>

namespace TabFold
{

static constexpr DWORD kPipeBufferBytes = 4096;
static constexpr size_t kMaxRequestBytes = 64 * 1024;
static constexpr DWORD kErrorBackoffMs = 250;

static std::wstring fromUtf8(const std::string& bytes)
{
    std::string text = bytes;
    // Strip a UTF-8 BOM
    if (text.size() >= 3 && static_cast<unsigned char>(text[0]) == 0xEF
        && static_cast<unsigned char>(text[1]) == 0xBB && static_cast<unsigned char>(text[2]) == 0xBF)
        text.erase(0, 3);
    if (text.empty())
        return {};

    int len = MultiByteToWideChar(CP_UTF8, 0, text.data(), static_cast<int>(text.size()), nullptr, 0);
    if (len <= 0)
        return {};
    std::wstring wide(static_cast<size_t>(len), L'\0');
    MultiByteToWideChar(CP_UTF8, 0, text.data(), static_cast<int>(text.size()), &wide[0], len);
    return wide;
}

static std::string toUtf8(const std::wstring& text)
{
    if (text.empty())
        return {};
    int len = WideCharToMultiByte(CP_UTF8, 0, text.data(), static_cast<int>(text.size()),
                                  nullptr, 0, nullptr, nullptr);
    if (len <= 0)
        return {};
    std::string bytes(static_cast<size_t>(len), '\0');
    WideCharToMultiByte(CP_UTF8, 0, text.data(), static_cast<int>(text.size()), &bytes[0], len,
                        nullptr, nullptr);
    return bytes;
}

// ─── Impl ───────────────────────────────────────────────────────────────────

struct OpenRequestServer::Impl
{
    Handler onRequest;
    HANDLE stopEvent = nullptr;
    std::thread listener;

    // Waits for `io` or the stop event. False if stopping or the wait failed;
    // the cancelled operation has completed by then, so `io` may go out of
    // scope.
    bool waitFor(HANDLE pipe, OVERLAPPED& io)
    {
        HANDLE handles[2] = {io.hEvent, stopEvent};
        DWORD which = WaitForMultipleObjects(2, handles, FALSE, INFINITE);
        if (which != WAIT_OBJECT_0)
        {
            CancelIo(pipe);
            DWORD ignored = 0;
            GetOverlappedResult(pipe, &io, &ignored, TRUE);
            return false;
        }
        return true;
    }

    bool stopping() const
    {
        return WaitForSingleObject(stopEvent, 0) == WAIT_OBJECT_0;
    }

    // One connection. Returns false on a pipe error (caller backs off).
    bool serveOne(HANDLE pipe, HANDLE ioEvent)
    {
        OVERLAPPED io = {};
        io.hEvent = ioEvent;

        if (!ConnectNamedPipe(pipe, &io))
        {
            DWORD err = GetLastError();
            if (err == ERROR_IO_PENDING)
            {
                if (!waitFor(pipe, io))
                    return true;
                DWORD ignored = 0;
                if (!GetOverlappedResult(pipe, &io, &ignored, FALSE))
                {
                    Log::warn(L"pipe connect failed: %lu", GetLastError());
                    return false;
                }
            }
            else if (err != ERROR_PIPE_CONNECTED)
            {
                Log::warn(L"ConnectNamedPipe failed: %lu", err);
                return false;
            }
        }

        std::string bytes;
        bool interrupted = false;
        char buffer[kPipeBufferBytes];
        while (bytes.find('\n') == std::string::npos && bytes.size() < kMaxRequestBytes)
        {
            io = {};
            io.hEvent = ioEvent;
            DWORD read = 0;
            if (!ReadFile(pipe, buffer, sizeof(buffer), &read, &io))
            {
                DWORD err = GetLastError();
                if (err == ERROR_IO_PENDING)
                {
                    if (!waitFor(pipe, io))
                    {
                        interrupted = true;
                        break;
                    }
                    if (!GetOverlappedResult(pipe, &io, &read, FALSE))
                        break; // client closed
                }
                else
                {
                    break; // ERROR_BROKEN_PIPE: client done writing
                }
            }
            if (read == 0)
                break;
            bytes.append(buffer, read);
        }
        DisconnectNamedPipe(pipe);

        const auto raw = OpenRequestParser::takeRequestLine(bytes, interrupted || stopping());
        if (!raw)
        {
            if (interrupted && !bytes.empty())
                Log::verbose(L"dropped partial open request on shutdown");
            return true;
        }

        if (auto request = OpenRequestParser::parse(fromUtf8(*raw)))
        {
            Log::info(L"open request: %ls", request->path.c_str());
            onRequest(*request);
        }
        return true;
    }

    void threadMain()
    {
        HANDLE ioEvent = CreateEventW(nullptr, TRUE, FALSE, nullptr);
        if (!ioEvent)
        {
            Log::error(L"open-request server: CreateEvent failed: %lu", GetLastError());
            return;
        }

        while (!stopping())
        {
            HANDLE pipe = CreateNamedPipeW(kOpenRequestPipeName,
                                           PIPE_ACCESS_INBOUND | FILE_FLAG_OVERLAPPED,
                                           PIPE_TYPE_BYTE | PIPE_READMODE_BYTE | PIPE_WAIT,
                                           1, 0, kPipeBufferBytes, 0, nullptr);
            if (pipe == INVALID_HANDLE_VALUE)
            {
                Log::warn(L"CreateNamedPipe failed: %lu", GetLastError());
                WaitForSingleObject(stopEvent, kErrorBackoffMs);
                continue;
            }

            bool ok = false;
            try
            {
                ResetEvent(ioEvent);
                ok = serveOne(pipe, ioEvent);
            }
            catch (const std::exception& ex)
            {
                Log::error(L"open-request server error: %ls", Log::widen(ex.what()).c_str());
            }
            CloseHandle(pipe);

            if (!ok)
                WaitForSingleObject(stopEvent, kErrorBackoffMs);
        }

        CloseHandle(ioEvent);
    }
};

// ─── OpenRequestServer public interface ─────────────────────────────────────

OpenRequestServer::~OpenRequestServer()
{
    stop();
}

bool OpenRequestServer::start(Handler onRequest)
{
    if (running_.load(std::memory_order_relaxed))
        return true;

    impl_ = new Impl();
    impl_->onRequest = std::move(onRequest);
    impl_->stopEvent = CreateEventW(nullptr, TRUE, FALSE, nullptr);
    if (!impl_->stopEvent)
    {
        Log::error(L"open-request server: CreateEvent failed: %lu", GetLastError());
        delete impl_;
        impl_ = nullptr;
        return false;
    }

    impl_->listener = std::thread([this]() { impl_->threadMain(); });
    running_.store(true, std::memory_order_release);
    return true;
}

void OpenRequestServer::stop()
{
    if (!running_.load(std::memory_order_acquire))
        return;

    if (impl_)
    {
        SetEvent(impl_->stopEvent);
        if (impl_->listener.joinable())
            impl_->listener.join();
        CloseHandle(impl_->stopEvent);
        delete impl_;
        impl_ = nullptr;
    }

    running_.store(false, std::memory_order_release);
}

// ─── Client ─────────────────────────────────────────────────────────────────

namespace OpenRequestClient
{

bool send(const std::wstring& path, WindowHandle foreground, int timeoutMs)
{
    if (!WaitNamedPipeW(kOpenRequestPipeName, static_cast<DWORD>(timeoutMs)))
        return false;

    HANDLE pipe = CreateFileW(kOpenRequestPipeName, GENERIC_WRITE, 0, nullptr, OPEN_EXISTING, 0,
                              nullptr);
    if (pipe == INVALID_HANDLE_VALUE)
        return false;

    const std::string bytes = toUtf8(OpenRequestParser::formatOpenEx(foreground, path));
    DWORD written = 0;
    const BOOL ok = WriteFile(pipe, bytes.data(), static_cast<DWORD>(bytes.size()), &written, nullptr);
    FlushFileBuffers(pipe);
    CloseHandle(pipe);
    return ok && written == bytes.size();
}

} // namespace OpenRequestClient

} // namespace TabFold

#else // TABFOLD_TESTING — stub for non-Win32 test builds

namespace TabFold
{

OpenRequestServer::~OpenRequestServer() { stop(); }

bool OpenRequestServer::start(Handler /*onRequest*/)
{
    return true; // No-op in test builds
}

void OpenRequestServer::stop()
{
    // No-op in test builds
}

namespace OpenRequestClient
{

bool send(const std::wstring& /*path*/, WindowHandle /*foreground*/, int /*timeoutMs*/)
{
    return false;
}

} // namespace OpenRequestClient

} // namespace TabFold

#endif // TABFOLD_TESTING
