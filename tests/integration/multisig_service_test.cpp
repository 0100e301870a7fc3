// tests/integration/multisig_service_test.cpp
#include <gtest/gtest.h>
#include "multisig/service/include/MultiSigService.hpp"
#include "multisig/storage/include/InMemoryMultiSigStore.hpp"
#include "multisig/address/include/AddressNormalizer.hpp"
#include "multisig/errors/include/MultiSigException.hpp"
#include "multisig/model/include/Amount.hpp"
#include "multisig/chain/include/JsonRpcChainClient.hpp"
#include "multisig/execution/include/SafeExecutionAdapter.hpp"
#include "multisig/storage/include/FileMultiSigStore.hpp"
#include "common/utils/id/IdGenerator.hpp"
#include "support/LoopbackRpcServer.hpp"
#include "support/TestDoubles.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

using namespace multisig_engine;
using namespace multisig_engine::multisig;
using multisig_engine::test::FakeExecutionAdapter;
using multisig_engine::test::LoopbackRpcServer;
using multisig_engine::test::MakeSignature;
using multisig_engine::test::MakeSignatureHex;
using multisig_engine::test::ManualClock;
using multisig_engine::test::RecordingAuditSink;
using multisig_engine::test::ScriptedSigningCollaborator;

namespace
{
    const std::string ALICE = "0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed";
    const std::string BOB = "0xfB6916095ca1df60bB79Ce92cE3Ea74c37c5d359";
    const std::string CAROL = "0xdbF03B407c01E7cD3CBea99509d93f8DDDC8C6FB";
    const std::string DAVE = "0xD1220A0cf47c7B9Be7A2E6BA89F429762e7b9aDb";
    const std::string RECIPIENT = "0x90F8bf6A479f320ead074411a4B0e7944Ea8c9C1";
    const std::string SAFE_ADDRESS = "0xa6B71E26C5e0845f74c812102Ca7114b6a896AB2";
    const int64_t ONE_HOUR_MS = 60 * 60 * 1000;
}

// ========== 테스트 Fixture ==========

class MultiSigServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        store.Initialize();
        settings.proposal_ttl_hours = 1;

        adapter = std::make_shared<FakeExecutionAdapter>();
        adapter->deployed_address = SAFE_ADDRESS;
        registry.Register("ethereum", adapter);

        Rebuild(nullptr);
    }

    void Rebuild(ISigningCollaborator* signing) {
        service = std::make_unique<MultiSigService>(store, registry, audit, clock, settings, signing);
    }

    void EnableOnChain() {
        registry.SetOnChainEnabled(true);
    }

    WalletDetails CreateTwoOfThree() {
        return service->CreateWallet("user-1", "ethereum", 2, {
            {ALICE, "alice", "alice@example.com"},
            {BOB, "bob", ""},
            {CAROL, "carol", ""}
        });
    }

    ProposalRequest Request(const std::string& proposer, const std::string& signature = "") {
        ProposalRequest request;
        request.proposer = proposer;
        request.to_address = RECIPIENT;
        request.amount = "1.5";
        request.memo = "payroll";
        request.signature = signature;
        return request;
    }

    InMemoryMultiSigStore store;
    ChainRegistry registry;
    RecordingAuditSink audit;
    ManualClock clock;
    MultiSigSettings settings;
    std::shared_ptr<FakeExecutionAdapter> adapter;
    std::unique_ptr<MultiSigService> service;
};

// ========== 지갑 생성 ==========

TEST_F(MultiSigServiceTest, CreateWalletWithoutOnChainUsesPlaceholder) {
    WalletDetails details = CreateTwoOfThree();

    EXPECT_EQ(details.wallet.address_kind, AddressKind::PLACEHOLDER);
    EXPECT_EQ(details.wallet.address, DeriveFallbackAddress(details.wallet.id));
    EXPECT_EQ(details.wallet.label, "MultiSig 2/3");
    EXPECT_EQ(details.wallet.total_signers, 3u);
    EXPECT_EQ(details.wallet.created_at_ms, clock.NowMs());
    ASSERT_EQ(details.signers.size(), 3u);
    EXPECT_EQ(details.signers[0].name, "alice");
    EXPECT_EQ(adapter->deploy_calls.load(), 0);

    WalletDetails loaded = service->GetWallet(details.wallet.id);
    EXPECT_EQ(loaded.wallet.address, details.wallet.address);
    EXPECT_EQ(loaded.signers.size(), 3u);
    EXPECT_EQ(audit.Count(audit_event::WALLET_CREATED), 1u);
}

TEST_F(MultiSigServiceTest, CreateWalletDeploysWhenOnChainEnabled) {
    EnableOnChain();
    WalletDetails details = CreateTwoOfThree();

    EXPECT_EQ(details.wallet.address_kind, AddressKind::DEPLOYED);
    EXPECT_EQ(details.wallet.address, SAFE_ADDRESS);
    EXPECT_EQ(details.wallet.deployment_tx_hash, "0x" + std::string(64, 'd'));
    EXPECT_EQ(adapter->last_threshold, 2u);
    EXPECT_EQ(adapter->last_owners, (std::vector<std::string>{ALICE, BOB, CAROL}));
}

TEST_F(MultiSigServiceTest, DeploymentFailureFallsBackToPlaceholder) {
    EnableOnChain();
    adapter->fail_deploy = true;

    WalletDetails details = CreateTwoOfThree();
    EXPECT_EQ(adapter->deploy_calls.load(), 1);
    EXPECT_EQ(details.wallet.address_kind, AddressKind::PLACEHOLDER);
    EXPECT_EQ(details.wallet.address, DeriveFallbackAddress(details.wallet.id));
}

TEST_F(MultiSigServiceTest, CreateWalletValidation) {
    EXPECT_THROW(service->CreateWallet("", "ethereum", 1, {{ALICE, "", ""}}), InvalidArgumentException);
    EXPECT_THROW(service->CreateWallet("user-1", " ", 1, {{ALICE, "", ""}}), InvalidArgumentException);
    EXPECT_THROW(service->CreateWallet("user-1", "ethereum", 0, {{ALICE, "", ""}}), ThresholdInvariantException);
    EXPECT_THROW(service->CreateWallet("user-1", "ethereum", 3, {{ALICE, "", ""}, {BOB, "", ""}}),
                 ThresholdInvariantException);
    EXPECT_THROW(service->CreateWallet("user-1", "ethereum", 1, {}), ThresholdInvariantException);
    EXPECT_THROW(service->CreateWallet("user-1", "ethereum", 1, {{"0x1234", "", ""}}), InvalidAddressException);

    // 대소문자만 다른 주소는 같은 서명자
    std::string lower = ALICE;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    EXPECT_THROW(service->CreateWallet("user-1", "ethereum", 1, {{ALICE, "", ""}, {lower, "", ""}}),
                 DuplicateSignerException);

    EXPECT_EQ(audit.Count(audit_event::WALLET_CREATED), 0u);
    EXPECT_THROW(service->GetWallet("missing"), NotFoundException);
}

// ========== 서명자 관리 ==========

TEST_F(MultiSigServiceTest, AddAndRemoveSignersKeepThresholdInvariant) {
    WalletDetails details = CreateTwoOfThree();
    const std::string wallet_id = details.wallet.id;

    Signer added = service->AddSigner(wallet_id, {"0xd1220a0cf47c7b9be7a2e6ba89f429762e7b9adb", "dave", ""}, "user-1");
    EXPECT_EQ(added.address, DAVE);
    EXPECT_EQ(service->GetWallet(wallet_id).wallet.total_signers, 4u);
    EXPECT_THROW(service->AddSigner(wallet_id, {DAVE, "", ""}, "user-1"), DuplicateSignerException);

    service->RemoveSigner(wallet_id, DAVE, "user-1");
    MultiSigWallet wallet = service->RemoveSigner(wallet_id, CAROL, "user-1");
    EXPECT_EQ(wallet.total_signers, 2u);
    EXPECT_EQ(wallet.threshold, 2u);
    EXPECT_EQ(wallet.label, "MultiSig 2/3");

    EXPECT_THROW(service->RemoveSigner(wallet_id, BOB, "user-1"), ThresholdInvariantException);
    EXPECT_THROW(service->RemoveSigner(wallet_id, CAROL, "user-1"), NotFoundException);
    EXPECT_EQ(service->GetWallet(wallet_id).signers.size(), 2u);

    EXPECT_EQ(audit.Count(audit_event::SIGNER_ADDED), 1u);
    EXPECT_EQ(audit.Count(audit_event::SIGNER_REMOVED), 2u);
}

// ========== 배포 ==========

TEST_F(MultiSigServiceTest, DeployWalletPromotesPlaceholder) {
    WalletDetails details = CreateTwoOfThree();
    EXPECT_THROW(service->DeployWallet(details.wallet.id, "user-1"), OnChainUnsupportedException);

    EnableOnChain();
    MultiSigWallet deployed = service->DeployWallet(details.wallet.id, "user-1");
    EXPECT_EQ(deployed.address, SAFE_ADDRESS);
    EXPECT_EQ(deployed.address_kind, AddressKind::DEPLOYED);
    EXPECT_EQ(service->GetWallet(details.wallet.id).wallet.address, SAFE_ADDRESS);
    EXPECT_EQ(audit.Count(audit_event::WALLET_DEPLOYED), 1u);

    EXPECT_THROW(service->DeployWallet(details.wallet.id, "user-1"), AlreadyDeployedException);
}

// ========== 오프체인 실행 ==========

TEST_F(MultiSigServiceTest, TwoOfThreeCompletesOffChain) {
    WalletDetails details = CreateTwoOfThree();

    PendingTransaction tx = service->Propose(details.wallet.id, Request(ALICE));
    EXPECT_EQ(tx.status, TransactionStatus::PENDING);
    EXPECT_EQ(tx.current_signatures, 1u);
    EXPECT_EQ(tx.required_signatures, 2u);
    EXPECT_EQ(tx.expires_at_ms, clock.NowMs() + ONE_HOUR_MS);

    clock.Advance(5000);
    tx = service->Sign(tx.id, BOB);
    EXPECT_EQ(tx.status, TransactionStatus::EXECUTED);
    EXPECT_EQ(tx.current_signatures, 2u);
    EXPECT_EQ(tx.executed_at_ms, clock.NowMs());
    EXPECT_EQ(tx.execution_tx_hash, MultiSigService::OffChainTransactionHash(tx.id, tx.executed_at_ms));
    EXPECT_EQ(tx.execution_tx_hash.size(), 66u);

    EXPECT_THROW(service->Sign(tx.id, CAROL), NotPendingException);
    EXPECT_TRUE(service->ListPending(details.wallet.id).empty());
    EXPECT_EQ(adapter->execute_calls.load(), 0);

    EXPECT_EQ(audit.Count(audit_event::TRANSACTION_PROPOSED), 1u);
    EXPECT_EQ(audit.Count(audit_event::TRANSACTION_SIGNED), 1u);
    EXPECT_EQ(audit.Count(audit_event::TRANSACTION_EXECUTED), 1u);
}

TEST_F(MultiSigServiceTest, PlaceholderWalletStaysOffChainWhenEnabledLater) {
    WalletDetails details = CreateTwoOfThree();
    EnableOnChain();

    PendingTransaction tx = service->Propose(details.wallet.id, Request(ALICE));
    tx = service->Sign(tx.id, BOB);
    EXPECT_EQ(tx.status, TransactionStatus::EXECUTED);
    EXPECT_EQ(adapter->execute_calls.load(), 0);
    EXPECT_THROW(service->GetSigningPayload(tx.id), OnChainUnsupportedException);
}

TEST_F(MultiSigServiceTest, ProposalExpires) {
    WalletDetails details = CreateTwoOfThree();
    PendingTransaction tx = service->Propose(details.wallet.id, Request(ALICE));

    clock.Advance(ONE_HOUR_MS);
    EXPECT_EQ(service->ListPending(details.wallet.id).size(), 1u);

    clock.Advance(1);
    EXPECT_THROW(service->Sign(tx.id, BOB), ExpiredException);
    EXPECT_EQ(service->GetTransaction(tx.id).status, TransactionStatus::EXPIRED);
    EXPECT_TRUE(service->ListPending(details.wallet.id).empty());
    EXPECT_EQ(audit.Count(audit_event::TRANSACTION_EXPIRED), 1u);
}

TEST_F(MultiSigServiceTest, CancelledProposalRejectsSignatures) {
    WalletDetails details = CreateTwoOfThree();
    PendingTransaction tx = service->Propose(details.wallet.id, Request(ALICE));

    EXPECT_THROW(service->Cancel(tx.id, DAVE), UnauthorizedException);
    tx = service->Cancel(tx.id, CAROL);
    EXPECT_EQ(tx.status, TransactionStatus::CANCELLED);
    EXPECT_THROW(service->Sign(tx.id, BOB), NotPendingException);
    EXPECT_EQ(audit.Count(audit_event::TRANSACTION_CANCELLED), 1u);
}

TEST_F(MultiSigServiceTest, ListPendingRequiresWallet) {
    EXPECT_THROW(service->ListPending("missing"), NotFoundException);
    EXPECT_THROW(service->Propose("missing", Request(ALICE)), NotFoundException);
}

// ========== 온체인 실행 ==========

TEST_F(MultiSigServiceTest, DeployedWalletExecutesThroughAdapter) {
    EnableOnChain();
    adapter->nonce = 4;
    WalletDetails details = CreateTwoOfThree();

    PendingTransaction tx = service->Propose(details.wallet.id, Request(BOB, MakeSignatureHex(0x22)));
    tx = service->Sign(tx.id, ALICE, MakeSignatureHex(0x11));

    EXPECT_EQ(tx.status, TransactionStatus::EXECUTED);
    EXPECT_EQ(tx.execution_tx_hash, adapter->execution_hash);
    EXPECT_EQ(adapter->execute_calls.load(), 1);
    EXPECT_EQ(adapter->last_wallet, SAFE_ADDRESS);
    EXPECT_EQ(adapter->last_tx.to, RECIPIENT);
    EXPECT_EQ(adapter->last_tx.value, ParseAmount("1.5"));
    EXPECT_EQ(adapter->last_tx.nonce, 4);

    // 서명자 주소 오름차순: ALICE(0x5a..) 다음 BOB(0xfb..)
    Bytes expected = MakeSignature(0x11);
    Bytes bob = MakeSignature(0x22);
    expected.insert(expected.end(), bob.begin(), bob.end());
    EXPECT_EQ(adapter->last_packed, expected);
}

TEST_F(MultiSigServiceTest, SigningPayloadUsesCurrentNonce) {
    EnableOnChain();
    WalletDetails details = CreateTwoOfThree();
    PendingTransaction tx = service->Propose(details.wallet.id, Request(ALICE));

    adapter->nonce = 9;
    SafeTransaction payload = service->GetSigningPayload(tx.id);
    EXPECT_EQ(payload.chain_id, 1u);
    EXPECT_EQ(payload.safe_address, SAFE_ADDRESS);
    EXPECT_EQ(payload.nonce, 9);
    EXPECT_EQ(payload.safe_tx_hash,
        SafeTransactionBuilder::Build(1, SAFE_ADDRESS, RECIPIENT, ParseAmount("1.5"),
            SafeTransactionBuilder::CallDataFromMemo("payroll"), 9).safe_tx_hash);
}

TEST_F(MultiSigServiceTest, ExecutionFailureKeepsSignatureThenRetry) {
    EnableOnChain();
    WalletDetails details = CreateTwoOfThree();
    PendingTransaction tx = service->Propose(details.wallet.id, Request(ALICE, MakeSignatureHex(0x11)));

    adapter->fail_execute = true;
    adapter->failure_reason = ExecutionFailureReason::RPC_UNAVAILABLE;
    try {
        service->Sign(tx.id, BOB, MakeSignatureHex(0x22));
        FAIL() << "expected ExecutionFailedException";
    } catch (const ExecutionFailedException& e) {
        EXPECT_EQ(e.reason(), ExecutionFailureReason::RPC_UNAVAILABLE);
    }

    tx = service->GetTransaction(tx.id);
    EXPECT_EQ(tx.status, TransactionStatus::PENDING);
    EXPECT_EQ(tx.current_signatures, 2u);
    EXPECT_FALSE(tx.last_error.empty());
    EXPECT_EQ(audit.Count(audit_event::TRANSACTION_EXECUTION_FAILED), 1u);

    adapter->fail_execute = false;
    tx = service->RetryExecution(tx.id, CAROL);
    EXPECT_EQ(tx.status, TransactionStatus::EXECUTED);
    EXPECT_TRUE(tx.last_error.empty());
    EXPECT_EQ(adapter->execute_calls.load(), 2);
}

TEST_F(MultiSigServiceTest, MissingSignatureWithoutCollaborator) {
    EnableOnChain();
    WalletDetails details = CreateTwoOfThree();
    PendingTransaction tx = service->Propose(details.wallet.id, Request(ALICE));

    try {
        service->Sign(tx.id, BOB, MakeSignatureHex(0x22));
        FAIL() << "expected ExecutionFailedException";
    } catch (const ExecutionFailedException& e) {
        EXPECT_EQ(e.reason(), ExecutionFailureReason::MISSING_SIGNATURE);
    }
    EXPECT_EQ(adapter->execute_calls.load(), 0);
    EXPECT_EQ(service->GetTransaction(tx.id).status, TransactionStatus::PENDING);
}

TEST_F(MultiSigServiceTest, CollaboratorSuppliesMissingSignatures) {
    ScriptedSigningCollaborator signing;
    signing.Provide(ALICE, MakeSignature(0x11, 1));
    Rebuild(&signing);

    EnableOnChain();
    WalletDetails details = CreateTwoOfThree();
    PendingTransaction tx = service->Propose(details.wallet.id, Request(ALICE));
    tx = service->Sign(tx.id, BOB, MakeSignatureHex(0x22));

    EXPECT_EQ(tx.status, TransactionStatus::EXECUTED);
    EXPECT_EQ(signing.requests.load(), 1);

    // 협력자 서명의 v=1 은 28로 정규화
    ASSERT_EQ(adapter->last_packed.size(), 130u);
    EXPECT_EQ(adapter->last_packed[64], 28);
}

TEST_F(MultiSigServiceTest, CrashingCollaboratorKeepsTransactionPending) {
    ScriptedSigningCollaborator signing;
    signing.crash = true;
    Rebuild(&signing);

    EnableOnChain();
    WalletDetails details = CreateTwoOfThree();
    PendingTransaction tx = service->Propose(details.wallet.id, Request(ALICE));

    try {
        service->Sign(tx.id, BOB, MakeSignatureHex(0x22));
        FAIL() << "expected ExecutionFailedException";
    } catch (const ExecutionFailedException& e) {
        EXPECT_EQ(e.reason(), ExecutionFailureReason::UNKNOWN);
    }

    PendingTransaction stored = service->GetTransaction(tx.id);
    EXPECT_EQ(stored.status, TransactionStatus::PENDING);
    EXPECT_EQ(stored.current_signatures, 2u);
    EXPECT_NE(stored.last_error.find("signing backend unreachable"), std::string::npos);
    EXPECT_EQ(audit.Count(audit_event::TRANSACTION_EXECUTION_FAILED), 1u);

    // 협력자 복구 후 재시도
    signing.crash = false;
    signing.Provide(ALICE, MakeSignature(0x11, 27));
    EXPECT_EQ(service->RetryExecution(tx.id, CAROL).status, TransactionStatus::EXECUTED);
}

// ========== 감사 ==========

TEST_F(MultiSigServiceTest, AuditFailureDoesNotAbortOperations) {
    audit.fail = true;
    WalletDetails details = CreateTwoOfThree();
    PendingTransaction tx = service->Propose(details.wallet.id, Request(ALICE));
    tx = service->Sign(tx.id, BOB);

    EXPECT_EQ(tx.status, TransactionStatus::EXECUTED);
    EXPECT_TRUE(audit.Entries().empty());
}

TEST_F(MultiSigServiceTest, AuditEntriesCarryActorAndResource) {
    WalletDetails details = CreateTwoOfThree();
    PendingTransaction tx = service->Propose(details.wallet.id, Request(ALICE));
    service->Sign(tx.id, BOB);

    auto entries = audit.Entries();
    ASSERT_EQ(entries.size(), 4u);
    EXPECT_EQ(entries[0].kind, audit_event::WALLET_CREATED);
    EXPECT_EQ(entries[0].actor, "user-1");
    EXPECT_EQ(entries[0].resource_id, details.wallet.id);
    EXPECT_EQ(entries[0].metadata.at("address_kind"), "placeholder");

    EXPECT_EQ(entries[2].kind, audit_event::TRANSACTION_SIGNED);
    EXPECT_EQ(entries[2].actor, BOB);
    EXPECT_EQ(entries[2].resource_id, tx.id);
    EXPECT_EQ(entries[3].metadata.at("signatures"), "2/2");
}

// ========== 체인 노드 장애 ==========

namespace
{
    struct NodeFailure
    {
        std::string name;
        LoopbackRpcServer::Reply reply;
    };

    std::vector<NodeFailure> NodeFailures()
    {
        return {
            {"ErrorObject", LoopbackRpcServer::Json(
                R"({"jsonrpc":"2.0","id":1,"error":{"code":-32000,"message":"header not found"}})")},
            {"StringError", LoopbackRpcServer::Json(R"({"jsonrpc":"2.0","id":1,"error":"rate limited"})")},
            {"MalformedErrorCode", LoopbackRpcServer::Json(
                R"({"jsonrpc":"2.0","id":1,"error":{"code":"busy","message":null}})")},
            {"Http500", LoopbackRpcServer::Status(boost::beast::http::status::internal_server_error, "down")},
            {"NotJson", LoopbackRpcServer::Json("<html>502</html>")},
            {"NoResponse", LoopbackRpcServer::Silent()}
        };
    }
}

class MultiSigNodeFailureTest : public ::testing::TestWithParam<NodeFailure> {
protected:
    void SetUp() override {
        const LoopbackRpcServer::Reply reply = GetParam().reply;
        server = std::make_unique<LoopbackRpcServer>([reply](const std::string&) { return reply; });

        SafeChainConfig chain;
        chain.chain = "ethereum";
        chain.chain_id = 1;
        chain.rpc_url = server->Url();
        chain.relayer_address = RECIPIENT;
        chain.factory_address = SAFE_ADDRESS;
        chain.singleton_address = "0xd9Db270c1B5E3Bd161E8c8503c55cEABeE709552";
        chain.fallback_handler = AddressNormalizer::ZERO_ADDRESS;
        chain.rpc_timeout_ms = 300;
        chain.confirmation_timeout_ms = 300;

        ChainRpcConfig rpc;
        rpc.rpc_url = chain.rpc_url;
        rpc.timeout_ms = chain.rpc_timeout_ms;

        store.Initialize();
        registry.Register("ethereum",
            std::make_shared<SafeExecutionAdapter>(chain, std::make_shared<JsonRpcChainClient>(rpc)));
        registry.SetOnChainEnabled(true);
        service = std::make_unique<MultiSigService>(store, registry, audit, clock, settings);
    }

    // 이미 배포된 지갑 (실행 단계에서 노드 호출)
    MultiSigWallet InsertDeployedWallet() {
        MultiSigWallet wallet;
        wallet.id = "deployed-wallet";
        wallet.user_id = "user-1";
        wallet.chain = "ethereum";
        wallet.address = SAFE_ADDRESS;
        wallet.address_kind = AddressKind::DEPLOYED;
        wallet.threshold = 2;
        wallet.total_signers = 2;
        wallet.label = "MultiSig 2/2";
        EXPECT_TRUE(store.InsertWallet(wallet));

        for (const auto& address : {ALICE, BOB}) {
            Signer signer;
            signer.wallet_id = wallet.id;
            signer.address = address;
            EXPECT_TRUE(store.InsertSigner(signer));
        }
        return wallet;
    }

    std::unique_ptr<LoopbackRpcServer> server;
    InMemoryMultiSigStore store;
    ChainRegistry registry;
    RecordingAuditSink audit;
    ManualClock clock;
    MultiSigSettings settings;
    std::unique_ptr<MultiSigService> service;
};

TEST_P(MultiSigNodeFailureTest, CreateWalletFallsBackToPlaceholder) {
    WalletDetails details = service->CreateWallet("user-1", "ethereum", 2, {
        {ALICE, "alice", ""},
        {BOB, "bob", ""}
    });

    EXPECT_EQ(details.wallet.address_kind, AddressKind::PLACEHOLDER);
    EXPECT_EQ(details.wallet.address, DeriveFallbackAddress(details.wallet.id));
    EXPECT_GE(server->RequestCount(), 1u);
    EXPECT_EQ(audit.Count(audit_event::WALLET_CREATED), 1u);
}

TEST_P(MultiSigNodeFailureTest, SignKeepsTransactionPending) {
    MultiSigWallet wallet = InsertDeployedWallet();

    ProposalRequest request;
    request.proposer = ALICE;
    request.to_address = RECIPIENT;
    request.amount = "0.1";
    request.signature = MakeSignatureHex(0x11);
    PendingTransaction tx = service->Propose(wallet.id, request);

    EXPECT_THROW(service->Sign(tx.id, BOB, MakeSignatureHex(0x22)), ExecutionFailedException);

    PendingTransaction stored = service->GetTransaction(tx.id);
    EXPECT_EQ(stored.status, TransactionStatus::PENDING);
    EXPECT_EQ(stored.current_signatures, 2u);
    EXPECT_FALSE(stored.last_error.empty());
    EXPECT_EQ(stored.signatures.size(), 2u);
    EXPECT_EQ(audit.Count(audit_event::TRANSACTION_EXECUTION_FAILED), 1u);
}

INSTANTIATE_TEST_SUITE_P(ChainNode, MultiSigNodeFailureTest, ::testing::ValuesIn(NodeFailures()),
    [](const ::testing::TestParamInfo<NodeFailure>& info) { return info.param.name; });

// ========== 파일 저장소 기록 실패 ==========

TEST(MultiSigFileStoreServiceTest, FailedSignWriteCanBeRetried) {
    namespace fs = std::filesystem;
    const fs::path dir = fs::temp_directory_path() / ("multisig_service_" + utils::IdGenerator::NewUuid());
    std::string tx_id;

    {
        FileMultiSigStore store(dir.string());
        ASSERT_TRUE(store.Initialize());
        ChainRegistry registry;
        RecordingAuditSink audit;
        ManualClock clock;
        MultiSigSettings settings;
        MultiSigService service(store, registry, audit, clock, settings);

        WalletDetails details = service.CreateWallet("user-1", "ethereum", 3, {
            {ALICE, "", ""}, {BOB, "", ""}, {CAROL, "", ""}
        });
        ProposalRequest request;
        request.proposer = ALICE;
        request.to_address = RECIPIENT;
        request.amount = "2";
        PendingTransaction tx = service.Propose(details.wallet.id, request);
        tx_id = tx.id;

        fs::remove_all(dir / "transactions");
        EXPECT_THROW(service.Sign(tx.id, BOB), StorageException);

        PendingTransaction after = service.GetTransaction(tx.id);
        EXPECT_EQ(after.current_signatures, 1u);
        EXPECT_EQ(after.version, tx.version);

        fs::create_directories(dir / "transactions");
        PendingTransaction retried = service.Sign(tx.id, BOB);
        EXPECT_EQ(retried.current_signatures, 2u);
    }

    {
        FileMultiSigStore reopened(dir.string());
        ASSERT_TRUE(reopened.Initialize());
        PendingTransaction persisted;
        ASSERT_TRUE(reopened.FindTransaction(tx_id, persisted));
        EXPECT_EQ(persisted.current_signatures, 2u);
        EXPECT_EQ(persisted.signatures.size(), 2u);
    }

    std::error_code ec;
    fs::remove_all(dir, ec);
}
