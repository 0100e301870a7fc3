// src/multisig/storage/src/InMemoryMultiSigStore.cpp
#include "multisig/storage/include/InMemoryMultiSigStore.hpp"

namespace multisig_engine::multisig
{
    bool InMemoryMultiSigStore::Initialize()
    {
        std::lock_guard<std::mutex> lock(store_mutex);
        is_initialized = true;
        return true;
    }

    bool InMemoryMultiSigStore::IsInitialized() const
    {
        std::lock_guard<std::mutex> lock(store_mutex);
        return is_initialized;
    }

    bool InMemoryMultiSigStore::InsertWallet(const MultiSigWallet& wallet)
    {
        std::lock_guard<std::mutex> lock(store_mutex);
        return wallets.emplace(wallet.id, wallet).second;
    }

    bool InMemoryMultiSigStore::UpdateWallet(const MultiSigWallet& wallet)
    {
        std::lock_guard<std::mutex> lock(store_mutex);
        auto it = wallets.find(wallet.id);
        if (it == wallets.end()) {
            return false;
        }
        it->second = wallet;
        return true;
    }

    bool InMemoryMultiSigStore::FindWallet(const std::string& wallet_id, MultiSigWallet& out) const
    {
        std::lock_guard<std::mutex> lock(store_mutex);
        auto it = wallets.find(wallet_id);
        if (it == wallets.end()) {
            return false;
        }
        out = it->second;
        return true;
    }

    bool InMemoryMultiSigStore::InsertSigner(const Signer& signer)
    {
        std::lock_guard<std::mutex> lock(store_mutex);
        return signers[signer.wallet_id].emplace(signer.address, signer).second;
    }

    bool InMemoryMultiSigStore::DeleteSigner(const std::string& wallet_id, const std::string& address)
    {
        std::lock_guard<std::mutex> lock(store_mutex);
        auto it = signers.find(wallet_id);
        if (it == signers.end()) {
            return false;
        }
        return it->second.erase(address) > 0;
    }

    std::vector<Signer> InMemoryMultiSigStore::ListSigners(const std::string& wallet_id) const
    {
        std::lock_guard<std::mutex> lock(store_mutex);
        std::vector<Signer> result;

        auto it = signers.find(wallet_id);
        if (it != signers.end()) {
            for (const auto& [address, signer] : it->second) {
                result.push_back(signer);
            }
        }
        return result;
    }

    bool InMemoryMultiSigStore::InsertTransaction(const PendingTransaction& tx)
    {
        std::lock_guard<std::mutex> lock(store_mutex);
        return transactions.emplace(tx.id, tx).second;
    }

    bool InMemoryMultiSigStore::FindTransaction(const std::string& tx_id, PendingTransaction& out) const
    {
        std::lock_guard<std::mutex> lock(store_mutex);
        auto it = transactions.find(tx_id);
        if (it == transactions.end()) {
            return false;
        }
        out = it->second;
        return true;
    }

    bool InMemoryMultiSigStore::CompareAndSwapTransaction(PendingTransaction& record, uint64_t expected_version)
    {
        std::lock_guard<std::mutex> lock(store_mutex);
        auto it = transactions.find(record.id);
        if (it == transactions.end() || it->second.version != expected_version) {
            return false;
        }

        record.version = expected_version + 1;
        it->second = record;
        return true;
    }

    std::vector<PendingTransaction> InMemoryMultiSigStore::ListTransactions(const std::string& wallet_id) const
    {
        std::lock_guard<std::mutex> lock(store_mutex);
        std::vector<PendingTransaction> result;
        for (const auto& [id, tx] : transactions) {
            if (tx.wallet_id == wallet_id) {
                result.push_back(tx);
            }
        }
        return result;
    }
}
