// src/multisig/storage/src/FileMultiSigStore.cpp
#include "multisig/storage/include/FileMultiSigStore.hpp"
#include "multisig/errors/include/MultiSigException.hpp"
#include "common/utils/logger/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace multisig_engine::multisig
{
    namespace
    {
        constexpr const char* WALLET_DIR = "wallets";
        constexpr const char* SIGNER_DIR = "signers";
        constexpr const char* TRANSACTION_DIR = "transactions";

        std::string ToLower(const std::string& s)
        {
            std::string out = s;
            std::transform(out.begin(), out.end(), out.begin(),
                [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return out;
        }

        bool ReadAll(const fs::path& file, std::string& out)
        {
            std::ifstream in(file, std::ios::binary);
            if (!in.is_open()) {
                return false;
            }
            std::stringstream ss;
            ss << in.rdbuf();
            out = ss.str();
            return true;
        }
    }

    FileMultiSigStore::FileMultiSigStore(const std::string& path)
        : storage_path(path)
    {
    }

    bool FileMultiSigStore::Initialize()
    {
        std::lock_guard<std::mutex> persist_lock(persist_mutex);

        try {
            for (const char* dir : {WALLET_DIR, SIGNER_DIR, TRANSACTION_DIR}) {
                fs::path sub = storage_path / dir;
                if (!fs::exists(sub) && !fs::create_directories(sub)) {
                    MSIG_LOG_ERRORF("FileStore", "Failed to create storage directory: %s", sub.string().c_str());
                    return false;
                }
            }

            size_t wallet_count = LoadDirectory(storage_path / WALLET_DIR, WALLET_DIR);
            size_t signer_count = LoadDirectory(storage_path / SIGNER_DIR, SIGNER_DIR);
            size_t tx_count = LoadDirectory(storage_path / TRANSACTION_DIR, TRANSACTION_DIR);

            {
                std::lock_guard<std::mutex> lock(store_mutex);
                is_initialized = true;
            }

            MSIG_LOG_INFOF("FileStore", "Loaded %zu wallets, %zu signers, %zu transactions from %s",
                wallet_count, signer_count, tx_count, fs::absolute(storage_path).string().c_str());
            return true;

        } catch (const fs::filesystem_error& e) {
            MSIG_LOG_ERRORF("FileStore", "Filesystem error during initialization: %s", e.what());
            return false;
        }
    }

    size_t FileMultiSigStore::LoadDirectory(const fs::path& dir, const char* kind)
    {
        size_t loaded = 0;
        const std::string kind_str(kind);

        for (const auto& entry : fs::directory_iterator(dir)) {
            if (!entry.is_regular_file() || entry.path().extension() != ".json") {
                continue;
            }

            std::string content;
            if (!ReadAll(entry.path(), content)) {
                MSIG_LOG_WARNF("FileStore", "Cannot read %s", entry.path().string().c_str());
                continue;
            }

            std::lock_guard<std::mutex> lock(store_mutex);
            bool ok = false;

            if (kind_str == WALLET_DIR) {
                MultiSigWallet wallet;
                ok = wallet.FromJson(content);
                if (ok) wallets[wallet.id] = wallet;
            } else if (kind_str == SIGNER_DIR) {
                Signer signer;
                ok = signer.FromJson(content);
                if (ok) signers[signer.wallet_id][signer.address] = signer;
            } else {
                PendingTransaction tx;
                ok = tx.FromJson(content);
                if (ok) transactions[tx.id] = tx;
            }

            if (ok) {
                ++loaded;
            } else {
                MSIG_LOG_WARNF("FileStore", "Skipping malformed record %s", entry.path().string().c_str());
            }
        }
        return loaded;
    }

    fs::path FileMultiSigStore::WalletFile(const std::string& wallet_id) const
    {
        return storage_path / WALLET_DIR / (wallet_id + ".json");
    }

    fs::path FileMultiSigStore::SignerFile(const std::string& wallet_id, const std::string& address) const
    {
        return storage_path / SIGNER_DIR / (wallet_id + "_" + ToLower(address) + ".json");
    }

    fs::path FileMultiSigStore::TransactionFile(const std::string& tx_id) const
    {
        return storage_path / TRANSACTION_DIR / (tx_id + ".json");
    }

    void FileMultiSigStore::WriteRecord(const fs::path& file, const std::string& content) const
    {
        fs::path tmp = file;
        tmp += ".tmp";

        {
            std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
            if (!out.is_open()) {
                MSIG_LOG_ERRORF("FileStore", "Failed to open record file: %s", tmp.string().c_str());
                throw StorageException("cannot open " + tmp.string());
            }
            out.write(content.data(), static_cast<std::streamsize>(content.size()));
            out.flush();
            if (!out.good()) {
                MSIG_LOG_ERRORF("FileStore", "Failed to write record file: %s", tmp.string().c_str());
                std::error_code ignored;
                fs::remove(tmp, ignored);
                throw StorageException("cannot write " + tmp.string());
            }
        }

        std::error_code ec;
        fs::rename(tmp, file, ec);
        if (ec) {
            MSIG_LOG_ERRORF("FileStore", "Failed to replace %s: %s", file.string().c_str(), ec.message().c_str());
            std::error_code ignored;
            fs::remove(tmp, ignored);
            throw StorageException("cannot replace " + file.string() + ": " + ec.message());
        }
    }

    // 변경은 모두 persist_mutex 아래에서 "사전 검사 → 파일 기록 → 메모리 반영" 순서.
    // 기록이 실패하면 메모리는 손대지 않은 채 StorageException 전파

    bool FileMultiSigStore::InsertWallet(const MultiSigWallet& wallet)
    {
        std::lock_guard<std::mutex> persist_lock(persist_mutex);
        MultiSigWallet existing;
        if (FindWallet(wallet.id, existing)) {
            return false;
        }
        WriteRecord(WalletFile(wallet.id), wallet.ToJson());
        return InMemoryMultiSigStore::InsertWallet(wallet);
    }

    bool FileMultiSigStore::UpdateWallet(const MultiSigWallet& wallet)
    {
        std::lock_guard<std::mutex> persist_lock(persist_mutex);
        MultiSigWallet existing;
        if (!FindWallet(wallet.id, existing)) {
            return false;
        }
        WriteRecord(WalletFile(wallet.id), wallet.ToJson());
        return InMemoryMultiSigStore::UpdateWallet(wallet);
    }

    bool FileMultiSigStore::HasSigner(const std::string& wallet_id, const std::string& address) const
    {
        std::lock_guard<std::mutex> lock(store_mutex);
        auto it = signers.find(wallet_id);
        return it != signers.end() && it->second.count(address) > 0;
    }

    bool FileMultiSigStore::InsertSigner(const Signer& signer)
    {
        std::lock_guard<std::mutex> persist_lock(persist_mutex);
        if (HasSigner(signer.wallet_id, signer.address)) {
            return false;
        }
        WriteRecord(SignerFile(signer.wallet_id, signer.address), signer.ToJson());
        return InMemoryMultiSigStore::InsertSigner(signer);
    }

    bool FileMultiSigStore::DeleteSigner(const std::string& wallet_id, const std::string& address)
    {
        std::lock_guard<std::mutex> persist_lock(persist_mutex);
        if (!HasSigner(wallet_id, address)) {
            return false;
        }

        std::error_code ec;
        fs::remove(SignerFile(wallet_id, address), ec);
        if (ec) {
            MSIG_LOG_ERRORF("FileStore", "Failed to remove signer file: %s", ec.message().c_str());
            throw StorageException("cannot remove signer " + address + ": " + ec.message());
        }
        return InMemoryMultiSigStore::DeleteSigner(wallet_id, address);
    }

    bool FileMultiSigStore::InsertTransaction(const PendingTransaction& tx)
    {
        std::lock_guard<std::mutex> persist_lock(persist_mutex);
        PendingTransaction existing;
        if (FindTransaction(tx.id, existing)) {
            return false;
        }
        WriteRecord(TransactionFile(tx.id), tx.ToJson());
        return InMemoryMultiSigStore::InsertTransaction(tx);
    }

    bool FileMultiSigStore::CompareAndSwapTransaction(PendingTransaction& record, uint64_t expected_version)
    {
        std::lock_guard<std::mutex> persist_lock(persist_mutex);
        PendingTransaction current;
        if (!FindTransaction(record.id, current) || current.version != expected_version) {
            return false;
        }

        PendingTransaction next = record;
        next.version = expected_version + 1;
        WriteRecord(TransactionFile(next.id), next.ToJson());

        // persist_mutex가 다른 변경을 막으므로 여기서는 실패하지 않음
        return InMemoryMultiSigStore::CompareAndSwapTransaction(record, expected_version);
    }
}
