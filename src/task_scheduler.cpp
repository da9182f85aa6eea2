#include "holdem/task_scheduler.h"
#include "spdlog/spdlog.h"
#include <chrono>
#include <thread>

namespace holdem {

TaskId ManualScheduler::schedule_after(int delay_ms, HandId hand_id, Task task) {
    const TaskId id = next_id_++;
    const int64_t due = now_ms_ + (delay_ms > 0 ? delay_ms : 0);
    queue_.emplace(Key{due, id}, Entry{hand_id, std::move(task)});
    spdlog::trace("Scheduler: tâche {} (main {}) à t={}ms", id, hand_id, due);
    return id;
}

void ManualScheduler::cancel_hand(HandId hand_id) {
    size_t cancelled = 0;
    for (auto it = queue_.begin(); it != queue_.end();) {
        if (it->second.hand_id == hand_id) {
            it = queue_.erase(it);
            ++cancelled;
        } else {
            ++it;
        }
    }
    if (cancelled > 0) {
        spdlog::trace("Scheduler: {} tâche(s) annulée(s) pour la main {}", cancelled, hand_id);
    }
}

bool ManualScheduler::run_next(int64_t deadline) {
    if (queue_.empty()) return false;
    auto it = queue_.begin();
    const int64_t due = it->first.first;
    if (due > deadline) return false;

    if (real_time_pacing_ && due > now_ms_) {
        std::this_thread::sleep_for(std::chrono::milliseconds(due - now_ms_));
    }
    if (due > now_ms_) now_ms_ = due;

    // Retirée avant exécution : la tâche peut replanifier ou annuler librement
    Task task = std::move(it->second.task);
    queue_.erase(it);
    if (task) task();
    return true;
}

size_t ManualScheduler::advance(int64_t ms) {
    const int64_t deadline = now_ms_ + (ms > 0 ? ms : 0);
    size_t executed = 0;
    while (run_next(deadline)) ++executed;
    now_ms_ = deadline;
    return executed;
}

size_t ManualScheduler::run_until_idle(size_t max_tasks) {
    size_t executed = 0;
    while (executed < max_tasks && run_next(INT64_MAX)) ++executed;
    if (!queue_.empty()) {
        spdlog::warn("Scheduler: arrêt après {} tâches, {} en attente", executed, queue_.size());
    }
    return executed;
}

} // namespace holdem
