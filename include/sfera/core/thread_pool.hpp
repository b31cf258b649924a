/*
 * Sfera - Worker pool for concurrent collaborator calls
 */
#ifndef SFERA_CORE_THREAD_POOL_HPP
#define SFERA_CORE_THREAD_POOL_HPP

#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <type_traits>
#include <atomic>

namespace sfera {

class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads = 4);
    ~ThreadPool();
    
    // Add a fire-and-forget task to the queue. Returns false once stopped.
    bool enqueue(std::function<void()> task);
    
    // Queue a callable and get its result (or exception) through a future.
    // Throws std::runtime_error once the pool is stopped.
    template<typename F>
    std::future<typename std::result_of<F()>::type> submit(F fn) {
        typedef typename std::result_of<F()>::type Result;
        std::shared_ptr<std::packaged_task<Result()> > task =
            std::make_shared<std::packaged_task<Result()> >(fn);
        std::future<Result> result = task->get_future();
        if (!enqueue([task]() { (*task)(); })) {
            throw std::runtime_error("thread pool is stopped");
        }
        return result;
    }
    
    // Get number of threads
    size_t size() const { return threads_.size(); }
    
    // Get number of pending tasks
    size_t pending() const;
    
    // True when called from one of this pool's workers
    bool owns_current_thread() const;
    
    // Run queued tasks to completion and join the workers
    void shutdown();

private:
    void worker();
    
    std::vector<std::thread> threads_;
    std::queue<std::function<void()>> tasks_;
    
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::atomic<bool> stop_;
};

} // namespace sfera

#endif // SFERA_CORE_THREAD_POOL_HPP
