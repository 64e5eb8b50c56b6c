#pragma once
// =============================================================================
// TabFold — TaskQueue
// Seam between native callbacks and background work. Hook callbacks must
// return quickly; anything heavier than a set lookup is posted here.
// =============================================================================

#include <functional>

namespace TabFold
{

class TaskQueue
{
public:
    using Task = std::function<void()>;

    virtual ~TaskQueue() = default;
    virtual void post(Task task) = 0;
};

} // namespace TabFold
