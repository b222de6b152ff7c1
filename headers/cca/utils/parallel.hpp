//
// Created by gregorian-rayne on 2/10/26.
//

#ifndef CCA_PARALLEL_HPP
#define CCA_PARALLEL_HPP

/**
 * @file parallel.hpp
 * @brief Worker pool and wait-for-all barrier used by forked submissions.
 *
 * A forked submission builds one pool with a worker per analyzer, queues the
 * four analyzer runs and blocks in collect_all() until all of them are done.
 * Nothing is cancelled and nothing times out.
 */

#include "cca/result.hpp"

#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace cca::parallel {

    class ThreadPool {
    public:
        /// Starts @p workers threads; zero is raised to one.
        explicit ThreadPool(const unsigned int workers) {
            const unsigned int count = workers == 0 ? 1 : workers;
            threads_.reserve(count);
            for (unsigned int i = 0; i < count; ++i) {
                threads_.emplace_back(&ThreadPool::drain, this);
            }
        }

        /// Runs whatever is still queued, then joins.
        ~ThreadPool() {
            {
                std::scoped_lock lock(mutex_);
                closing_ = true;
            }
            wake_.notify_all();
            for (auto& thread : threads_) {
                thread.join();
            }
        }

        ThreadPool(const ThreadPool&) = delete;
        ThreadPool& operator=(const ThreadPool&) = delete;

        /**
         * Queues a nullary task. Whatever it returns or throws is delivered
         * through the future.
         */
        template<typename F>
        auto submit(F&& task) -> std::future<std::invoke_result_t<F>> {
            using R = std::invoke_result_t<F>;
            auto packaged = std::make_shared<std::packaged_task<R()>>(std::forward<F>(task));
            auto future = packaged->get_future();
            {
                std::scoped_lock lock(mutex_);
                if (closing_) {
                    throw std::logic_error("ThreadPool is shutting down");
                }
                queue_.emplace_back([packaged] { (*packaged)(); });
            }
            wake_.notify_one();
            return future;
        }

        [[nodiscard]] std::size_t size() const noexcept { return threads_.size(); }

    private:
        void drain() {
            for (;;) {
                std::function<void()> next;
                {
                    std::unique_lock lock(mutex_);
                    wake_.wait(lock, [this] { return closing_ || !queue_.empty(); });
                    if (queue_.empty()) {
                        return;
                    }
                    next = std::move(queue_.front());
                    queue_.pop_front();
                }
                next();
            }
        }

        std::vector<std::thread> threads_;
        std::deque<std::function<void()>> queue_;
        std::mutex mutex_;
        std::condition_variable wake_;
        bool closing_ = false;
    };

    /**
     * Barrier over analyzer futures. Returns one Result per future, in the
     * order the futures were submitted. A task that threw yields an
     * InternalError in its slot.
     */
    template<typename T>
    std::vector<Result<T>> collect_all(std::vector<std::future<Result<T>>> futures) {
        std::vector<Result<T>> results;
        results.reserve(futures.size());
        for (auto& future : futures) {
            try {
                results.push_back(future.get());
            } catch (const std::exception& e) {
                results.push_back(Result<T>::failure(
                    Error::internal_error(std::string("Worker threw: ") + e.what())));
            } catch (...) {
                results.push_back(Result<T>::failure(
                    Error::internal_error("Worker threw a non-standard exception")));
            }
        }
        return results;
    }

}  // namespace cca::parallel

#endif //CCA_PARALLEL_HPP
