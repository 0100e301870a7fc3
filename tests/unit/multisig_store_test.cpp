// tests/unit/multisig_store_test.cpp
#include <gtest/gtest.h>
#include "multisig/storage/include/MultiSigStoreFactory.hpp"
#include "multisig/storage/include/FileMultiSigStore.hpp"
#include "multisig/storage/include/InMemoryMultiSigStore.hpp"
#include "multisig/errors/include/MultiSigException.hpp"
#include "common/utils/id/IdGenerator.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace multisig_engine;
using namespace multisig_engine::multisig;
namespace fs = std::filesystem;

namespace
{
    MultiSigWallet MakeWallet(const std::string& id)
    {
        MultiSigWallet wallet;
        wallet.id = id;
        wallet.user_id = "user-1";
        wallet.chain = "ethereum";
        wallet.address = "0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed";
        wallet.address_kind = AddressKind::PLACEHOLDER;
        wallet.threshold = 2;
        wallet.total_signers = 3;
        wallet.label = "MultiSig 2/3";
        wallet.created_at_ms = 1000;
        return wallet;
    }

    Signer MakeSigner(const std::string& wallet_id, const std::string& address)
    {
        Signer signer;
        signer.wallet_id = wallet_id;
        signer.address = address;
        signer.name = "alice";
        signer.contact = "alice@example.com";
        signer.added_at_ms = 1000;
        return signer;
    }

    PendingTransaction MakeTransaction(const std::string& id, const std::string& wallet_id)
    {
        PendingTransaction tx;
        tx.id = id;
        tx.wallet_id = wallet_id;
        tx.chain = "ethereum";
        tx.to_address = "0xD1220A0cf47c7B9Be7A2E6BA89F429762e7b9aDb";
        tx.amount = "1.5";
        tx.memo = "payroll";
        tx.required_signatures = 2;
        tx.current_signatures = 1;
        tx.signed_by = {"0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed"};
        tx.eligible_signers = {"0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed",
                               "0xfB6916095ca1df60bB79Ce92cE3Ea74c37c5d359"};
        tx.proposer = "0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed";
        tx.status = TransactionStatus::PENDING;
        tx.created_at_ms = 1000;
        tx.expires_at_ms = 2000;
        return tx;
    }
}

// ========== 저장소 공통 동작 (memory / file) ==========

class MultiSigStoreTest : public ::testing::TestWithParam<std::string> {
protected:
    void SetUp() override {
        dir = fs::temp_directory_path() / ("multisig_store_test_" + utils::IdGenerator::NewUuid());
        store = MultiSigStoreFactory::Create(GetParam(), dir.string());
        ASSERT_TRUE(store->Initialize());
    }

    void TearDown() override {
        store.reset();
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    fs::path dir;
    std::unique_ptr<IMultiSigStore> store;
};

TEST_P(MultiSigStoreTest, WalletInsertFindUpdate) {
    MultiSigWallet wallet = MakeWallet("w1");
    EXPECT_TRUE(store->InsertWallet(wallet));
    EXPECT_FALSE(store->InsertWallet(wallet));

    MultiSigWallet found;
    ASSERT_TRUE(store->FindWallet("w1", found));
    EXPECT_EQ(found.address, wallet.address);
    EXPECT_EQ(found.threshold, 2u);

    found.total_signers = 4;
    EXPECT_TRUE(store->UpdateWallet(found));
    ASSERT_TRUE(store->FindWallet("w1", found));
    EXPECT_EQ(found.total_signers, 4u);

    EXPECT_FALSE(store->UpdateWallet(MakeWallet("missing")));
    EXPECT_FALSE(store->FindWallet("missing", found));
}

TEST_P(MultiSigStoreTest, SignerUniquenessPerWallet) {
    const std::string address = "0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed";
    EXPECT_TRUE(store->InsertSigner(MakeSigner("w1", address)));
    EXPECT_FALSE(store->InsertSigner(MakeSigner("w1", address)));
    EXPECT_TRUE(store->InsertSigner(MakeSigner("w2", address)));

    EXPECT_EQ(store->ListSigners("w1").size(), 1u);
    EXPECT_TRUE(store->DeleteSigner("w1", address));
    EXPECT_FALSE(store->DeleteSigner("w1", address));
    EXPECT_TRUE(store->ListSigners("w1").empty());
    EXPECT_EQ(store->ListSigners("w2").size(), 1u);
}

TEST_P(MultiSigStoreTest, CompareAndSwapBumpsVersion) {
    PendingTransaction tx = MakeTransaction("t1", "w1");
    ASSERT_TRUE(store->InsertTransaction(tx));

    PendingTransaction loaded;
    ASSERT_TRUE(store->FindTransaction("t1", loaded));
    const uint64_t v0 = loaded.version;

    loaded.current_signatures = 2;
    ASSERT_TRUE(store->CompareAndSwapTransaction(loaded, v0));
    EXPECT_EQ(loaded.version, v0 + 1);

    // 오래된 버전으로 쓰기 시도
    PendingTransaction stale = MakeTransaction("t1", "w1");
    stale.status = TransactionStatus::CANCELLED;
    EXPECT_FALSE(store->CompareAndSwapTransaction(stale, v0));

    PendingTransaction current;
    ASSERT_TRUE(store->FindTransaction("t1", current));
    EXPECT_EQ(current.status, TransactionStatus::PENDING);
    EXPECT_EQ(current.current_signatures, 2u);
}

TEST_P(MultiSigStoreTest, CompareAndSwapOnMissingRecordFails) {
    PendingTransaction tx = MakeTransaction("ghost", "w1");
    EXPECT_FALSE(store->CompareAndSwapTransaction(tx, 0));
}

TEST_P(MultiSigStoreTest, ListTransactionsFiltersByWallet) {
    ASSERT_TRUE(store->InsertTransaction(MakeTransaction("t1", "w1")));
    ASSERT_TRUE(store->InsertTransaction(MakeTransaction("t2", "w1")));
    ASSERT_TRUE(store->InsertTransaction(MakeTransaction("t3", "w2")));
    EXPECT_FALSE(store->InsertTransaction(MakeTransaction("t1", "w1")));

    EXPECT_EQ(store->ListTransactions("w1").size(), 2u);
    EXPECT_EQ(store->ListTransactions("w2").size(), 1u);
    EXPECT_TRUE(store->ListTransactions("w3").empty());
}

INSTANTIATE_TEST_SUITE_P(Backends, MultiSigStoreTest, ::testing::Values("memory", "file"));

// ========== 파일 저장소 재시작 ==========

class FileMultiSigStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = fs::temp_directory_path() / ("multisig_file_store_" + utils::IdGenerator::NewUuid());
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    fs::path dir;
};

TEST_F(FileMultiSigStoreTest, RecordsSurviveReload) {
    {
        FileMultiSigStore store(dir.string());
        ASSERT_TRUE(store.Initialize());
        ASSERT_TRUE(store.InsertWallet(MakeWallet("w1")));
        ASSERT_TRUE(store.InsertSigner(MakeSigner("w1", "0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed")));
        ASSERT_TRUE(store.InsertSigner(MakeSigner("w1", "0xfB6916095ca1df60bB79Ce92cE3Ea74c37c5d359")));
        ASSERT_TRUE(store.DeleteSigner("w1", "0xfB6916095ca1df60bB79Ce92cE3Ea74c37c5d359"));

        PendingTransaction tx = MakeTransaction("t1", "w1");
        tx.signatures[tx.proposer] = "0x" + std::string(130, 'a');
        ASSERT_TRUE(store.InsertTransaction(tx));

        PendingTransaction loaded;
        ASSERT_TRUE(store.FindTransaction("t1", loaded));
        loaded.status = TransactionStatus::EXECUTED;
        loaded.execution_tx_hash = "0x" + std::string(64, 'e');
        ASSERT_TRUE(store.CompareAndSwapTransaction(loaded, loaded.version));
    }

    FileMultiSigStore reopened(dir.string());
    ASSERT_TRUE(reopened.Initialize());

    MultiSigWallet wallet;
    ASSERT_TRUE(reopened.FindWallet("w1", wallet));
    EXPECT_EQ(wallet.label, "MultiSig 2/3");
    EXPECT_EQ(wallet.address_kind, AddressKind::PLACEHOLDER);

    auto signers = reopened.ListSigners("w1");
    ASSERT_EQ(signers.size(), 1u);
    EXPECT_EQ(signers[0].address, "0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed");
    EXPECT_EQ(signers[0].contact, "alice@example.com");

    PendingTransaction tx;
    ASSERT_TRUE(reopened.FindTransaction("t1", tx));
    EXPECT_EQ(tx.status, TransactionStatus::EXECUTED);
    EXPECT_EQ(tx.execution_tx_hash, "0x" + std::string(64, 'e'));
    EXPECT_EQ(tx.eligible_signers.size(), 2u);
    EXPECT_EQ(tx.signatures.size(), 1u);
    EXPECT_EQ(tx.version, 1u);
}

TEST_F(FileMultiSigStoreTest, FailedTransactionWriteLeavesMemoryUnchanged) {
    FileMultiSigStore store(dir.string());
    ASSERT_TRUE(store.Initialize());
    ASSERT_TRUE(store.InsertTransaction(MakeTransaction("t1", "w1")));

    PendingTransaction update;
    ASSERT_TRUE(store.FindTransaction("t1", update));
    update.signed_by.push_back("0xfB6916095ca1df60bB79Ce92cE3Ea74c37c5d359");
    update.current_signatures = 2;

    fs::remove_all(dir / "transactions");
    EXPECT_THROW(store.CompareAndSwapTransaction(update, 0), StorageException);

    PendingTransaction current;
    ASSERT_TRUE(store.FindTransaction("t1", current));
    EXPECT_EQ(current.version, 0u);
    EXPECT_EQ(current.signed_by.size(), 1u);
    EXPECT_EQ(update.version, 0u);

    // 디렉토리 복구 후 같은 버전으로 재시도 가능
    fs::create_directories(dir / "transactions");
    ASSERT_TRUE(store.CompareAndSwapTransaction(update, 0));
    EXPECT_EQ(update.version, 1u);

    FileMultiSigStore reopened(dir.string());
    ASSERT_TRUE(reopened.Initialize());
    ASSERT_TRUE(reopened.FindTransaction("t1", current));
    EXPECT_EQ(current.version, 1u);
    EXPECT_EQ(current.signed_by.size(), 2u);
}

TEST_F(FileMultiSigStoreTest, FailedWalletAndSignerWritesLeaveMemoryUnchanged) {
    FileMultiSigStore store(dir.string());
    ASSERT_TRUE(store.Initialize());
    ASSERT_TRUE(store.InsertWallet(MakeWallet("w1")));

    fs::remove_all(dir / "wallets");
    fs::remove_all(dir / "signers");

    MultiSigWallet changed = MakeWallet("w1");
    changed.total_signers = 4;
    EXPECT_THROW(store.UpdateWallet(changed), StorageException);
    EXPECT_THROW(store.InsertWallet(MakeWallet("w2")), StorageException);
    EXPECT_THROW(store.InsertSigner(MakeSigner("w1", "0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed")),
                 StorageException);

    MultiSigWallet wallet;
    ASSERT_TRUE(store.FindWallet("w1", wallet));
    EXPECT_EQ(wallet.total_signers, 3u);
    EXPECT_FALSE(store.FindWallet("w2", wallet));
    EXPECT_TRUE(store.ListSigners("w1").empty());
}

TEST_F(FileMultiSigStoreTest, SkipsMalformedRecords) {
    fs::create_directories(dir / "wallets");
    {
        std::ofstream out(dir / "wallets" / "broken.json");
        out << "{ not json";
    }

    FileMultiSigStore store(dir.string());
    ASSERT_TRUE(store.Initialize());

    MultiSigWallet wallet;
    EXPECT_FALSE(store.FindWallet("broken", wallet));
}

// ========== 팩토리 ==========

TEST(MultiSigStoreFactoryTest, TypeValidation) {
    EXPECT_TRUE(MultiSigStoreFactory::IsValidType("memory"));
    EXPECT_TRUE(MultiSigStoreFactory::IsValidType(" FILE "));
    EXPECT_FALSE(MultiSigStoreFactory::IsValidType("postgres"));
    EXPECT_THROW(MultiSigStoreFactory::Create("postgres", ""), std::invalid_argument);
}
