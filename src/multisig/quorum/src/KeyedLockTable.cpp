// src/multisig/quorum/src/KeyedLockTable.cpp
#include "multisig/quorum/include/KeyedLockTable.hpp"

namespace multisig_engine::multisig
{
    KeyedLockTable::Guard::Guard(KeyedLockTable& owner, const std::string& lock_key, Entry* lock_entry)
        : table(&owner)
        , key(lock_key)
        , entry(lock_entry)
    {
    }

    KeyedLockTable::Guard::Guard(Guard&& other) noexcept
        : table(other.table)
        , key(std::move(other.key))
        , entry(other.entry)
    {
        other.table = nullptr;
        other.entry = nullptr;
    }

    KeyedLockTable::Guard::~Guard()
    {
        if (table != nullptr && entry != nullptr) {
            table->Release(key, entry);
        }
    }

    KeyedLockTable::Guard KeyedLockTable::Acquire(const std::string& key)
    {
        Entry* entry = nullptr;
        {
            std::lock_guard<std::mutex> lock(table_mutex);
            auto& slot = entries[key];
            if (!slot) {
                slot = std::make_unique<Entry>();
            }
            slot->refs++;
            entry = slot.get();
        }

        // table_mutex 밖에서 대기 (다른 키는 계속 진행)
        entry->mutex.lock();
        return Guard(*this, key, entry);
    }

    void KeyedLockTable::Release(const std::string& key, Entry* entry)
    {
        entry->mutex.unlock();

        std::lock_guard<std::mutex> lock(table_mutex);
        if (--entry->refs == 0) {
            entries.erase(key);
        }
    }

    size_t KeyedLockTable::ActiveKeys() const
    {
        std::lock_guard<std::mutex> lock(table_mutex);
        return entries.size();
    }
}
