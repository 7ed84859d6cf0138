#include <Engine/Scheduler.hpp>
#include <raylib.h>
#include <algorithm>

namespace Kindling {

CancellationToken FrameScheduler::Add(Task task, std::string name)
{
    CancellationToken token;
    Add(std::move(task), token, std::move(name));
    return token;
}

void FrameScheduler::Add(Task task, CancellationToken token, std::string name)
{
    if (!task) return;
    m_pending.push_back({ std::move(name), std::move(task), std::move(token), false });
}

void FrameScheduler::Tick()
{
    ++m_ticks;
    for (auto& e : m_pending) m_tasks.push_back(std::move(e));
    m_pending.clear();

    for (auto& e : m_tasks) {
        if (e.done || e.token.IsCancellationRequested()) continue;
        if (e.task() == TaskStatus::Finished) {
            TraceLog(LOG_DEBUG, "[Scheduler] Task '%s' finished", e.name.c_str());
            e.done = true;
        }
    }

    m_tasks.erase(std::remove_if(m_tasks.begin(), m_tasks.end(),
                                 [](const Entry& e) { return e.done || e.token.IsCancellationRequested(); }),
                  m_tasks.end());
}

void FrameScheduler::CancelAll()
{
    for (auto& e : m_tasks)   e.token.Cancel();
    for (auto& e : m_pending) e.token.Cancel();
}

} // namespace Kindling
