#pragma once
// =============================================================================
// TabFold — OpenRequestServer
// Named-pipe listener for open requests from the shell verb handler. One
// request per connection; each parsed request is handed to the callback on
// the listener thread (which should post it to the worker).
// =============================================================================

#include "tabfold/input/OpenRequest.h"

#include <atomic>
#include <functional>
#include <string>

namespace TabFold
{

class OpenRequestServer
{
public:
    using Handler = std::function<void(const OpenRequest&)>;

    ~OpenRequestServer();

    bool start(Handler onRequest);

    // Unblocks a pending connect/read and joins the listener thread.
    void stop();

private:
    struct Impl;
    Impl* impl_ = nullptr;
    std::atomic<bool> running_{false};
};

namespace OpenRequestClient
{

// Sends OPEN_EX to a running instance. False if nothing is listening
// within `timeoutMs` or the write fails.
bool send(const std::wstring& path, WindowHandle foreground, int timeoutMs = 250);

} // namespace OpenRequestClient

} // namespace TabFold
