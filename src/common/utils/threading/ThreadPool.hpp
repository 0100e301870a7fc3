// src/common/utils/threading/ThreadPool.hpp
#pragma once

#include "common/utils/logger/Logger.hpp"
#include "common/utils/queue/ThreadSafeQueue.hpp"
#include <atomic>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

namespace multisig_engine::utils
{
    /**
     * @brief 고정 크기 작업자 풀
     *
     * 작업은 (함수 포인터, 컨텍스트) 쌍입니다. 컨텍스트는 SubmitOwned로 넘기면
     * 작업 종료 후 풀이 해제하고, SubmitBorrowed는 호출자가 수명을 관리합니다.
     * 작업 함수에서 새어 나온 std::exception은 ERROR 로그 후 다음 작업으로 넘어갑니다.
     */
    template<typename TContext>
    class ThreadPool
    {
    private:
        struct Task
        {
            void (*func)(TContext*) = nullptr;
            std::unique_ptr<TContext> owned_context;
            TContext* context = nullptr;

            Task() = default;

            Task(void (*f)(TContext*), std::unique_ptr<TContext> owned)
                : func(f), owned_context(std::move(owned)), context(owned_context.get()) {}

            Task(void (*f)(TContext*), TContext* borrowed)
                : func(f), context(borrowed) {}

            Task(Task&&) noexcept = default;
            Task& operator=(Task&&) noexcept = default;
            Task(const Task&) = delete;
            Task& operator=(const Task&) = delete;
        };

    public:
        explicit ThreadPool(size_t num_threads, size_t queue_capacity_per_thread = 100)
            : task_queue(num_threads == 0 ? 1 : num_threads * queue_capacity_per_thread), num_threads(num_threads)
        {
            if (num_threads == 0) {
                throw std::invalid_argument("ThreadPool must have at least 1 thread");
            }

            workers.reserve(num_threads);
            for (size_t i = 0; i < num_threads; ++i) {
                workers.emplace_back([this, i]() { WorkerLoop(i); });
            }
        }

        ~ThreadPool()
        {
            Shutdown();
        }

        ThreadPool(const ThreadPool&) = delete;
        ThreadPool& operator=(const ThreadPool&) = delete;

        /**
         * @brief 작업 제출 (컨텍스트 소유권 이전)
         * @throws std::runtime_error 풀이 종료된 경우
         */
        void SubmitOwned(void (*func)(TContext*), std::unique_ptr<TContext> context)
        {
            if (stop) {
                throw std::runtime_error("ThreadPool is stopped");
            }

            QueueResult result = task_queue.Emplace(func, std::move(context));
            if (result != QueueResult::SUCCESS) {
                throw std::runtime_error(std::string("Failed to push task: ") + QueueResultToString(result));
            }
        }

        void SubmitBorrowed(void (*func)(TContext*), TContext* context)
        {
            if (stop) {
                throw std::runtime_error("ThreadPool is stopped");
            }

            QueueResult result = task_queue.Emplace(func, context);
            if (result != QueueResult::SUCCESS) {
                throw std::runtime_error(std::string("Failed to push task: ") + QueueResultToString(result));
            }
        }

        // 대기 중인 작업은 모두 처리한 뒤 작업자를 종료합니다.
        void Shutdown()
        {
            if (stop.exchange(true)) {
                return;
            }

            task_queue.Shutdown();

            for (auto& worker : workers) {
                if (worker.joinable()) {
                    worker.join();
                }
            }
        }

        size_t GetActiveTaskCount() const { return active_tasks.load(); }
        size_t GetPendingTaskCount() const { return task_queue.Size(); }
        size_t GetThreadCount() const { return num_threads; }
        bool IsStopped() const { return stop.load(); }

    private:
        void WorkerLoop(size_t worker_id)
        {
            for (;;) {
                Task task;

                QueueResult result = task_queue.Pop(task);
                if (result == QueueResult::SHUTDOWN) {
                    break;
                }

                if (result != QueueResult::SUCCESS) {
                    MSIG_LOG_ERRORF("ThreadPool", "Worker %zu: unexpected pop result %s", worker_id, QueueResultToString(result));
                    break;
                }

                active_tasks++;
                try {
                    task.func(task.context);
                } catch (const std::exception& e) {
                    MSIG_LOG_ERRORF("ThreadPool", "Worker %zu: task failed: %s", worker_id, e.what());
                }
                active_tasks--;
            }
        }

        ThreadSafeQueue<Task> task_queue;
        std::vector<std::thread> workers;
        std::atomic<bool> stop{false};
        std::atomic<size_t> active_tasks{0};
        const size_t num_threads;
    };

} // namespace multisig_engine::utils
