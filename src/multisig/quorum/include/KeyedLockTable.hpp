// src/multisig/quorum/include/KeyedLockTable.hpp
#pragma once
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace multisig_engine::multisig
{
    /**
     * @brief 키(트랜잭션/지갑 ID)별 배타 잠금
     *
     * 서로 다른 키는 잠금을 공유하지 않습니다. 엔트리는 참조 카운트가 0이 되면 제거됩니다.
     *
     * 사용 예:
     *   auto guard = locks.Acquire(tx_id);
     *   // tx_id 레코드 read-modify-write
     */
    class KeyedLockTable
    {
    private:
        struct Entry
        {
            std::mutex mutex;
            size_t refs = 0;
        };

    public:
        class Guard
        {
        public:
            Guard(KeyedLockTable& table, const std::string& key, Entry* entry);
            ~Guard();

            Guard(Guard&& other) noexcept;
            Guard(const Guard&) = delete;
            Guard& operator=(const Guard&) = delete;
            Guard& operator=(Guard&&) = delete;

        private:
            KeyedLockTable* table;
            std::string key;
            Entry* entry;
        };

        KeyedLockTable() = default;
        KeyedLockTable(const KeyedLockTable&) = delete;
        KeyedLockTable& operator=(const KeyedLockTable&) = delete;

        Guard Acquire(const std::string& key);

        // 현재 잠금 보유/대기 중인 키 수
        size_t ActiveKeys() const;

    private:
        void Release(const std::string& key, Entry* entry);

        mutable std::mutex table_mutex;
        std::unordered_map<std::string, std::unique_ptr<Entry>> entries;
    };
}
