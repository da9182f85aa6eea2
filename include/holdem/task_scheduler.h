#ifndef HOLDEM_TASK_SCHEDULER_H
#define HOLDEM_TASK_SCHEDULER_H

#include <cstdint>
#include <functional>
#include <map>
#include <set>
#include <utility>

namespace holdem {

using HandId = uint64_t;
using TaskId = uint64_t;
using Task   = std::function<void()>;

/**
 * @brief Travail différé et annulable, rattaché à l'identité d'une main.
 * Le moteur ne dépend que de cette interface.
 */
class TaskScheduler {
public:
    virtual ~TaskScheduler() = default;

    virtual TaskId schedule_after(int delay_ms, HandId hand_id, Task task) = 0;
    // Annule toutes les tâches encore en attente pour cette main
    virtual void cancel_hand(HandId hand_id) = 0;
};

/**
 * @brief Boucle d'événements mono-thread à horloge virtuelle.
 *
 * Les tâches à échéance égale partent dans l'ordre d'insertion. Une tâche
 * peut en programmer d'autres. Avec real_time_pacing, run_until_idle()
 * dort jusqu'à l'échéance de chaque tâche.
 */
class ManualScheduler : public TaskScheduler {
public:
    explicit ManualScheduler(bool real_time_pacing = false) : real_time_pacing_(real_time_pacing) {}

    TaskId schedule_after(int delay_ms, HandId hand_id, Task task) override;
    void cancel_hand(HandId hand_id) override;

    // Avance l'horloge de ms et exécute tout ce qui arrive à échéance
    size_t advance(int64_t ms);
    // Exécute jusqu'à épuisement (max_tasks pour borner une boucle infinie)
    size_t run_until_idle(size_t max_tasks = 100000);

    int64_t now_ms() const { return now_ms_; }
    size_t pending() const { return queue_.size(); }

private:
    struct Entry {
        HandId hand_id;
        Task   task;
    };
    // (échéance, id) -> tâche ; l'id croissant garantit l'ordre d'insertion
    using Key = std::pair<int64_t, TaskId>;

    bool run_next(int64_t deadline);

    std::map<Key, Entry> queue_;
    int64_t now_ms_ = 0;
    TaskId  next_id_ = 1;
    bool    real_time_pacing_;
};

} // namespace holdem

#endif // HOLDEM_TASK_SCHEDULER_H
