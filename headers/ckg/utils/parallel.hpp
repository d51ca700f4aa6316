#ifndef CKG_PARALLEL_HPP
#define CKG_PARALLEL_HPP

/**
 * @file parallel.hpp
 * @brief Bounded worker pool and parallel map.
 *
 * The engine owns one ThreadPool sized from the performance config. Build
 * phases submit independent work (per-file extraction, similarity rows)
 * and join it before the next phase starts.
 */

#include <algorithm>
#include <vector>
#include <future>
#include <thread>
#include <queue>
#include <functional>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <stdexcept>
#include <type_traits>

namespace ckg::parallel {

    /**
     * Returns the number of hardware threads available, or 1 if unknown.
     */
    inline unsigned int hardware_concurrency() noexcept {
        unsigned int n = std::thread::hardware_concurrency();
        return n > 0 ? n : 1;
    }

    class ThreadPool {
    public:
        /**
         * @param num_threads Number of worker threads (0 = auto-detect).
         */
        explicit ThreadPool(unsigned int num_threads = 0)
            : stop_(false) {
            if (num_threads == 0) {
                num_threads = hardware_concurrency();
            }

            workers_.reserve(num_threads);
            for (unsigned int i = 0; i < num_threads; ++i) {
                workers_.emplace_back([this] {
                    worker_loop();
                });
            }
        }

        ~ThreadPool() {
            {
                std::unique_lock lock(queue_mutex_);
                stop_ = true;
            }
            condition_.notify_all();

            for (auto& worker : workers_) {
                if (worker.joinable()) {
                    worker.join();
                }
            }
        }

        ThreadPool(const ThreadPool&) = delete;
        ThreadPool& operator=(const ThreadPool&) = delete;

        /**
         * Submits a task. Exceptions thrown by the task surface from the
         * returned future's get().
         */
        template<typename F>
        auto submit(F&& f) -> std::future<std::invoke_result_t<F>> {
            using return_type = std::invoke_result_t<F>;

            auto task = std::make_shared<std::packaged_task<return_type()>>(std::forward<F>(f));
            std::future<return_type> result = task->get_future();

            {
                std::unique_lock lock(queue_mutex_);
                if (stop_) {
                    throw std::runtime_error("Cannot submit to stopped thread pool");
                }
                tasks_.emplace([task]() { (*task)(); });
            }

            condition_.notify_one();
            return result;
        }

        [[nodiscard]] std::size_t size() const noexcept {
            return workers_.size();
        }

    private:
        void worker_loop() {
            while (true) {
                std::function<void()> task;

                {
                    std::unique_lock lock(queue_mutex_);
                    condition_.wait(lock, [this] {
                        return stop_ || !tasks_.empty();
                    });

                    if (stop_ && tasks_.empty()) {
                        return;
                    }

                    task = std::move(tasks_.front());
                    tasks_.pop();
                }

                task();
            }
        }

        std::vector<std::thread> workers_;
        std::queue<std::function<void()>> tasks_;
        std::mutex queue_mutex_;
        std::condition_variable condition_;
        bool stop_;
    };

    /**
     * Maps a function over a collection in parallel. Results keep the
     * input order, whatever order the workers finish in.
     */
    template<typename T, typename F>
    auto map(const std::vector<T>& items, F&& f, ThreadPool& pool)
        -> std::vector<std::invoke_result_t<F, const T&>> {
        using ResultType = std::invoke_result_t<F, const T&>;

        std::vector<std::future<ResultType>> futures;
        futures.reserve(items.size());

        for (const auto& item : items) {
            futures.push_back(pool.submit([&f, &item]() {
                return f(item);
            }));
        }

        // every task borrows f and item, so all of them finish before any
        // exception is rethrown
        for (auto& future : futures) {
            future.wait();
        }

        std::vector<ResultType> results;
        results.reserve(items.size());

        for (auto& future : futures) {
            results.push_back(future.get());
        }

        return results;
    }

    /**
     * Runs f(begin, end) over [0, count) split into a few chunks per worker
     * and returns the per-chunk results in chunk order.
     */
    template<typename F>
    auto map_chunks(const std::size_t count, F&& f, ThreadPool& pool)
        -> std::vector<std::invoke_result_t<F, std::size_t, std::size_t>> {
        using ResultType = std::invoke_result_t<F, std::size_t, std::size_t>;

        std::vector<ResultType> results;
        if (count == 0) {
            return results;
        }

        const std::size_t num_chunks = std::min<std::size_t>(pool.size() * 4, count);
        const std::size_t chunk_size = (count + num_chunks - 1) / num_chunks;

        std::vector<std::future<ResultType>> futures;
        for (std::size_t begin = 0; begin < count; begin += chunk_size) {
            const std::size_t end = std::min(begin + chunk_size, count);
            futures.push_back(pool.submit([&f, begin, end]() {
                return f(begin, end);
            }));
        }

        for (auto& future : futures) {
            future.wait();
        }

        results.reserve(futures.size());
        for (auto& future : futures) {
            results.push_back(future.get());
        }
        return results;
    }

}  // namespace ckg::parallel

#endif //CKG_PARALLEL_HPP
