// EN: Implementation of the ThreadPool class. Fixed worker set draining a priority queue.
// FR: Implémentation de la classe ThreadPool. Ensemble fixe de workers vidant une queue prioritaire.

#include "infrastructure/threading/thread_pool.hpp"
#include "infrastructure/logging/logger.hpp"

namespace LRP {

ThreadPool::ThreadPool(const ThreadPoolConfig& config)
    : config_(config), start_time_(std::chrono::system_clock::now()) {

    // EN: Validate configuration.
    // FR: Valide la configuration.
    if (config_.thread_count == 0) {
        throw std::invalid_argument("thread_count must be at least 1");
    }

    {
        std::lock_guard<std::mutex> lock(threads_mutex_);
        workers_.reserve(config_.thread_count);
        for (size_t i = 0; i < config_.thread_count; ++i) {
            workers_.emplace_back(&ThreadPool::workerLoop, this);
        }
    }

    LOG_DEBUG(config_.name, "Thread pool started with " + std::to_string(config_.thread_count) + " threads");
}

ThreadPool::~ThreadPool() {
    shutdown();
}

void ThreadPool::enqueue(detail::Task task) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);

        if (shutdown_requested_.load()) {
            throw TaskRejectedError("ThreadPool is shutting down, cannot accept new tasks");
        }
        if (config_.max_queue_size > 0 && task_queue_.size() >= config_.max_queue_size) {
            throw TaskRejectedError("Task queue is full, cannot accept new tasks");
        }

        task.sequence = next_sequence_++;
        task_queue_.push(std::move(task));

        size_t current_size = task_queue_.size();
        size_t current_peak = peak_queue_size_.load();
        while (current_size > current_peak &&
               !peak_queue_size_.compare_exchange_weak(current_peak, current_size)) {
        }
    }
    queue_condition_.notify_one();
}

void ThreadPool::waitForAll() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    idle_condition_.wait(lock, [this] {
        return task_queue_.empty() && active_threads_.load() == 0;
    });
}

// EN: Shutdown the thread pool gracefully.
// FR: Arrête le pool de threads de manière gracieuse.
void ThreadPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (shutdown_requested_.exchange(true)) {
            return; // EN: Already shutting down. FR: Déjà en cours d'arrêt.
        }
    }
    queue_condition_.notify_all();

    std::lock_guard<std::mutex> lock(threads_mutex_);
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();

    LOG_DEBUG(config_.name, "Thread pool shutdown completed - Processed " +
              std::to_string(completed_tasks_.load()) + " tasks");
}

ThreadPoolStats ThreadPool::getStats() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);

    ThreadPoolStats stats;
    stats.created_at = start_time_;
    stats.total_threads = shutdown_requested_.load() ? 0 : config_.thread_count;
    stats.active_threads = active_threads_.load();
    stats.idle_threads = stats.total_threads > stats.active_threads
                             ? stats.total_threads - stats.active_threads : 0;
    stats.queued_tasks = task_queue_.size();
    stats.completed_tasks = completed_tasks_.load();
    stats.failed_tasks = failed_tasks_.load();
    stats.peak_queue_size = peak_queue_size_.load();
    stats.total_runtime = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now() - start_time_);
    return stats;
}

void ThreadPool::setTaskCallback(std::function<void(const std::string&, bool, std::chrono::milliseconds)> callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    task_callback_ = std::move(callback);
}

// EN: Worker thread function. Exits once shutdown is requested and the queue is drained.
// FR: Fonction du thread worker. Sort quand l'arrêt est demandé et la queue vidée.
void ThreadPool::workerLoop() {
    while (true) {
        detail::Task task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_condition_.wait(lock, [this] {
                return !task_queue_.empty() || shutdown_requested_.load();
            });

            if (task_queue_.empty()) {
                break;
            }

            task = task_queue_.top();
            task_queue_.pop();
            active_threads_++;
        }

        auto start = std::chrono::steady_clock::now();
        bool success = true;

        // EN: A failed task rethrows here after its future already holds the exception.
        // FR: Une tâche en échec relance ici après que son future a reçu l'exception.
        try {
            task.function();
        } catch (const std::exception& e) {
            success = false;
            LOG_ERROR(config_.name, "Task execution failed: " + std::string(e.what()));
        }

        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);

        if (success) {
            completed_tasks_++;
        } else {
            failed_tasks_++;
        }

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (task_callback_) {
                task_callback_(task.name, success, duration);
            }
        }

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            active_threads_--;
        }
        idle_condition_.notify_all();
    }
}

} // namespace LRP
