// src/multisig/storage/include/InMemoryMultiSigStore.hpp
#pragma once
#include "multisig/storage/include/IMultiSigStore.hpp"
#include <map>
#include <mutex>
#include <unordered_map>

namespace multisig_engine::multisig
{
    /**
     * @brief 프로세스 메모리 저장소 (테스트/단일 인스턴스 개발용)
     */
    class InMemoryMultiSigStore : public IMultiSigStore
    {
    public:
        InMemoryMultiSigStore() = default;
        ~InMemoryMultiSigStore() override = default;

        bool Initialize() override;
        bool IsInitialized() const override;

        bool InsertWallet(const MultiSigWallet& wallet) override;
        bool UpdateWallet(const MultiSigWallet& wallet) override;
        bool FindWallet(const std::string& wallet_id, MultiSigWallet& out) const override;

        bool InsertSigner(const Signer& signer) override;
        bool DeleteSigner(const std::string& wallet_id, const std::string& address) override;
        std::vector<Signer> ListSigners(const std::string& wallet_id) const override;

        bool InsertTransaction(const PendingTransaction& tx) override;
        bool FindTransaction(const std::string& tx_id, PendingTransaction& out) const override;
        bool CompareAndSwapTransaction(PendingTransaction& record, uint64_t expected_version) override;
        std::vector<PendingTransaction> ListTransactions(const std::string& wallet_id) const override;

    protected:
        mutable std::mutex store_mutex;
        std::unordered_map<std::string, MultiSigWallet> wallets;
        // wallet_id → (address → signer), 주소 순 정렬
        std::unordered_map<std::string, std::map<std::string, Signer>> signers;
        std::unordered_map<std::string, PendingTransaction> transactions;
        bool is_initialized = false;
    };
}
