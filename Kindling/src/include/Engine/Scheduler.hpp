#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace Kindling {

// Shared stop flag. Copies observe the same flag.
class CancellationToken {
public:
    CancellationToken() : m_flag(std::make_shared<bool>(false)) {}

    void Cancel() { *m_flag = true; }
    bool IsCancellationRequested() const { return *m_flag; }

private:
    std::shared_ptr<bool> m_flag;
};

enum class TaskStatus {
    Continue,   // run again next frame
    Finished,
};

// Cooperative per-frame task runner. Each task is called once per Tick()
// until it returns Finished or its token is cancelled. Tasks added while a
// tick is running start on the following tick.
class FrameScheduler {
public:
    using Task = std::function<TaskStatus()>;

    CancellationToken Add(Task task, std::string name = {});
    void              Add(Task task, CancellationToken token, std::string name = {});

    void Tick();

    // Cancel every task; they are dropped on the next tick.
    void CancelAll();

    std::size_t TaskCount() const { return m_tasks.size() + m_pending.size(); }
    std::size_t TicksRun()  const { return m_ticks; }

private:
    struct Entry {
        std::string       name;
        Task              task;
        CancellationToken token;
        bool              done = false;
    };

    std::vector<Entry> m_tasks;
    std::vector<Entry> m_pending;
    std::size_t        m_ticks = 0;
};

} // namespace Kindling
