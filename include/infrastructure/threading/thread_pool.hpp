#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace LRP {

// EN: Task priority levels for the thread pool queue.
// FR: Niveaux de priorité des tâches pour la queue du pool de threads.
enum class TaskPriority {
    LOW = 0,
    NORMAL = 1,
    HIGH = 2,
    URGENT = 3
};

// EN: Thread pool statistics for monitoring.
// FR: Statistiques du pool de threads pour le monitoring.
struct ThreadPoolStats {
    size_t total_threads = 0;
    size_t active_threads = 0;
    size_t idle_threads = 0;
    size_t queued_tasks = 0;
    size_t completed_tasks = 0;
    size_t failed_tasks = 0;
    size_t peak_queue_size = 0;
    std::chrono::system_clock::time_point created_at;
    std::chrono::milliseconds total_runtime{0};
};

// EN: Configuration for thread pool size and limits.
// FR: Configuration de la taille et des limites du pool de threads.
struct ThreadPoolConfig {
    // EN: Number of worker threads (at least 1).
    // FR: Nombre de threads workers (au moins 1).
    size_t thread_count = std::max(1u, std::thread::hardware_concurrency());

    // EN: Maximum number of queued tasks, 0 means unbounded.
    // FR: Nombre maximum de tâches en queue, 0 pour illimité.
    size_t max_queue_size = 1000;

    // EN: Name used in log lines.
    // FR: Nom utilisé dans les logs.
    std::string name = "threadpool";
};

// EN: Raised when a task cannot be queued (pool stopping or queue full).
// FR: Levée quand une tâche ne peut pas être mise en queue (arrêt ou queue pleine).
class TaskRejectedError : public std::runtime_error {
public:
    explicit TaskRejectedError(const std::string& message) : std::runtime_error(message) {}
};

namespace detail {
    // EN: Internal task wrapper with priority and submission order.
    // FR: Wrapper interne de tâche avec priorité et ordre de soumission.
    struct Task {
        std::function<void()> function;
        TaskPriority priority = TaskPriority::NORMAL;
        uint64_t sequence = 0;
        std::string name;

        // EN: Higher priority first, then FIFO within a priority.
        // FR: Priorité la plus haute d'abord, puis FIFO à priorité égale.
        bool operator<(const Task& other) const {
            if (priority != other.priority) {
                return static_cast<int>(priority) < static_cast<int>(other.priority);
            }
            return sequence > other.sequence;
        }
    };
}

// EN: Fixed-size thread pool with a priority queue. Results and exceptions travel through futures.
// FR: Pool de threads de taille fixe avec queue prioritaire. Résultats et exceptions passent par les futures.
class ThreadPool {
public:
    explicit ThreadPool(const ThreadPoolConfig& config = ThreadPoolConfig{});

    // EN: Destructor - drains the queue and joins all workers.
    // FR: Destructeur - vide la queue et joint tous les workers.
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    template<typename F, typename... Args>
    auto submit(TaskPriority priority, F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type>;

    template<typename F, typename... Args>
    auto submit(F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type>;

    // EN: Submit a named task; throws TaskRejectedError if the pool is stopping or the queue is full.
    // FR: Soumet une tâche nommée ; lance TaskRejectedError si le pool s'arrête ou si la queue est pleine.
    template<typename F, typename... Args>
    auto submitNamed(const std::string& name, TaskPriority priority, F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type>;

    // EN: Wait for all currently queued and running tasks to complete.
    // FR: Attend que toutes les tâches en queue ou en cours se terminent.
    void waitForAll();

    // EN: Graceful shutdown: queued tasks still run, new ones are rejected.
    // FR: Arrêt gracieux : les tâches en queue s'exécutent, les nouvelles sont refusées.
    void shutdown();

    bool isShutdown() const { return shutdown_requested_.load(); }

    ThreadPoolStats getStats() const;

    const ThreadPoolConfig& getConfig() const { return config_; }

    // EN: Callback invoked after each task with (name, success, duration).
    // FR: Callback appelé après chaque tâche avec (nom, succès, durée).
    void setTaskCallback(std::function<void(const std::string&, bool, std::chrono::milliseconds)> callback);

private:
    void workerLoop();
    void enqueue(detail::Task task);

    ThreadPoolConfig config_;

    std::vector<std::thread> workers_;
    std::mutex threads_mutex_;

    std::priority_queue<detail::Task> task_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable queue_condition_;
    std::condition_variable idle_condition_;
    uint64_t next_sequence_ = 0;

    std::atomic<bool> shutdown_requested_{false};
    std::atomic<size_t> active_threads_{0};
    std::atomic<size_t> completed_tasks_{0};
    std::atomic<size_t> failed_tasks_{0};
    std::atomic<size_t> peak_queue_size_{0};
    std::chrono::system_clock::time_point start_time_;

    std::function<void(const std::string&, bool, std::chrono::milliseconds)> task_callback_;
    std::mutex callback_mutex_;
};

template<typename F, typename... Args>
auto ThreadPool::submit(TaskPriority priority, F&& f, Args&&... args)
    -> std::future<typename std::invoke_result<F, Args...>::type> {
    return submitNamed("", priority, std::forward<F>(f), std::forward<Args>(args)...);
}

template<typename F, typename... Args>
auto ThreadPool::submit(F&& f, Args&&... args)
    -> std::future<typename std::invoke_result<F, Args...>::type> {
    return submit(TaskPriority::NORMAL, std::forward<F>(f), std::forward<Args>(args)...);
}

template<typename F, typename... Args>
auto ThreadPool::submitNamed(const std::string& name, TaskPriority priority, F&& f, Args&&... args)
    -> std::future<typename std::invoke_result<F, Args...>::type> {
    using return_type = typename std::invoke_result<F, Args...>::type;

    // EN: The future keeps the exception; the error slot lets the worker count the failure too.
    // FR: Le future garde l'exception ; le slot d'erreur permet au worker de compter l'échec aussi.
    auto error = std::make_shared<std::optional<std::string>>();
    auto task = std::make_shared<std::packaged_task<return_type()>>(
        [bound = std::bind(std::forward<F>(f), std::forward<Args>(args)...), error]() mutable -> return_type {
            try {
                return bound();
            } catch (const std::exception& e) {
                *error = e.what();
                throw;
            } catch (...) {
                *error = "unknown exception";
                throw;
            }
        }
    );
    std::future<return_type> result = task->get_future();

    detail::Task wrapper;
    wrapper.function = [task, error]() {
        (*task)();
        if (*error) {
            throw std::runtime_error(**error);
        }
    };
    wrapper.priority = priority;
    wrapper.name = name;
    enqueue(std::move(wrapper));

    return result;
}

} // namespace LRP
