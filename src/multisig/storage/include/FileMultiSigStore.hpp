// src/multisig/storage/include/FileMultiSigStore.hpp
#pragma once
#include "multisig/storage/include/InMemoryMultiSigStore.hpp"
#include <filesystem>

namespace multisig_engine::multisig
{
    namespace fs = std::filesystem;

    /**
     * @brief 디렉토리 기반 JSON 저장소
     *
     * 레코드 하나당 JSON 파일 하나:
     *   {path}/wallets/{wallet_id}.json
     *   {path}/signers/{wallet_id}_{address}.json
     *   {path}/transactions/{tx_id}.json
     *
     * Initialize() 시 전체를 메모리로 읽어오고, 이후 변경은 파일 기록이 끝난 뒤 메모리에 반영합니다.
     * 파일 기록은 임시 파일 작성 후 rename으로 교체합니다.
     * 기록 실패 시 StorageException이며 메모리와 디스크는 변경 전 상태로 남습니다.
     */
    class FileMultiSigStore : public InMemoryMultiSigStore
    {
    public:
        explicit FileMultiSigStore(const std::string& path);
        ~FileMultiSigStore() override = default;

        bool Initialize() override;

        bool InsertWallet(const MultiSigWallet& wallet) override;
        bool UpdateWallet(const MultiSigWallet& wallet) override;

        bool InsertSigner(const Signer& signer) override;
        bool DeleteSigner(const std::string& wallet_id, const std::string& address) override;

        bool InsertTransaction(const PendingTransaction& tx) override;
        bool CompareAndSwapTransaction(PendingTransaction& record, uint64_t expected_version) override;

        const fs::path& GetStoragePath() const { return storage_path; }

    private:
        fs::path WalletFile(const std::string& wallet_id) const;
        fs::path SignerFile(const std::string& wallet_id, const std::string& address) const;
        fs::path TransactionFile(const std::string& tx_id) const;

        /**
         * @throws StorageException 임시 파일 기록 또는 rename 실패
         */
        void WriteRecord(const fs::path& file, const std::string& content) const;
        bool HasSigner(const std::string& wallet_id, const std::string& address) const;
        size_t LoadDirectory(const fs::path& dir, const char* kind);

        fs::path storage_path;
        std::mutex persist_mutex;
    };
}
