// src/common/utils/queue/ThreadSafeQueue.hpp
#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <utility>

namespace multisig_engine::utils
{
    enum class QueueResult
    {
        SUCCESS = 0,
        SHUTDOWN = 1,     // 종료됨
        TIMEOUT = 2,
        FULL = 3          // TryPush 전용
    };

    inline const char* QueueResultToString(QueueResult result)
    {
        switch (result) {
            case QueueResult::SUCCESS: return "SUCCESS";
            case QueueResult::SHUTDOWN: return "SHUTDOWN";
            case QueueResult::TIMEOUT: return "TIMEOUT";
            case QueueResult::FULL: return "FULL";
            default: return "UNKNOWN";
        }
    }

    /**
     * @brief 용량 제한이 있는 블로킹 큐 (다중 생산자/다중 소비자)
     *
     * Shutdown 이후 Push는 SHUTDOWN을 반환하고, Pop은 남은 항목을 모두 꺼낸 뒤 SHUTDOWN을 반환합니다.
     */
    template<typename TElement>
    class ThreadSafeQueue
    {
    public:
        explicit ThreadSafeQueue(size_t max_size = 10000) : max_size(max_size)
        {
            if (max_size == 0) {
                throw std::invalid_argument("Queue max_size must be greater than 0");
            }
        }

        ~ThreadSafeQueue()
        {
            Shutdown();
        }

        ThreadSafeQueue(const ThreadSafeQueue&) = delete;
        ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;

        QueueResult Push(TElement item)
        {
            std::unique_lock<std::mutex> lock(mutex);
            cv_not_full.wait(lock, [this]() { return items.size() < max_size || shutdown_flag; });

            if (shutdown_flag) {
                return QueueResult::SHUTDOWN;
            }

            items.push(std::move(item));
            cv_not_empty.notify_one();
            return QueueResult::SUCCESS;
        }

        // 가득 차 있으면 대기 없이 FULL
        QueueResult TryPush(TElement item)
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (shutdown_flag) {
                return QueueResult::SHUTDOWN;
            }
            if (items.size() >= max_size) {
                return QueueResult::FULL;
            }

            items.push(std::move(item));
            cv_not_empty.notify_one();
            return QueueResult::SUCCESS;
        }

        template<typename... Args>
        QueueResult Emplace(Args&&... args)
        {
            std::unique_lock<std::mutex> lock(mutex);
            cv_not_full.wait(lock, [this]() { return items.size() < max_size || shutdown_flag; });

            if (shutdown_flag) {
                return QueueResult::SHUTDOWN;
            }

            items.emplace(std::forward<Args>(args)...);
            cv_not_empty.notify_one();
            return QueueResult::SUCCESS;
        }

        QueueResult Pop(TElement& item)
        {
            std::unique_lock<std::mutex> lock(mutex);
            cv_not_empty.wait(lock, [this]() { return !items.empty() || shutdown_flag; });
            return TakeFront(item);
        }

        QueueResult TryPop(TElement& item, std::chrono::milliseconds timeout)
        {
            std::unique_lock<std::mutex> lock(mutex);
            if (!cv_not_empty.wait_for(lock, timeout, [this]() { return !items.empty() || shutdown_flag; })) {
                return QueueResult::TIMEOUT;
            }
            return TakeFront(item);
        }

        void Shutdown()
        {
            {
                std::lock_guard<std::mutex> lock(mutex);
                shutdown_flag = true;
            }
            cv_not_empty.notify_all();
            cv_not_full.notify_all();
        }

        size_t Size() const
        {
            std::lock_guard<std::mutex> lock(mutex);
            return items.size();
        }

        bool IsShutdown() const
        {
            std::lock_guard<std::mutex> lock(mutex);
            return shutdown_flag;
        }

        size_t MaxSize() const { return max_size; }

    private:
        // mutex 보유 상태에서 호출
        QueueResult TakeFront(TElement& item)
        {
            if (items.empty()) {
                return QueueResult::SHUTDOWN;
            }

            item = std::move(items.front());
            items.pop();
            cv_not_full.notify_one();
            return QueueResult::SUCCESS;
        }

        std::queue<TElement> items;
        mutable std::mutex mutex;
        std::condition_variable cv_not_empty;
        std::condition_variable cv_not_full;
        const size_t max_size;
        bool shutdown_flag = false;
    };

} // namespace multisig_engine::utils
