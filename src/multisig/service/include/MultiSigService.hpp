// src/multisig/service/include/MultiSigService.hpp
#pragma once
#include "multisig/audit/include/IAuditSink.hpp"
#include "multisig/execution/include/ChainRegistry.hpp"
#include "multisig/quorum/include/KeyedLockTable.hpp"
#include "multisig/quorum/include/QuorumStateMachine.hpp"
#include "multisig/service/include/MultiSigSettings.hpp"
#include "multisig/signing/include/ISigningCollaborator.hpp"
#include "multisig/storage/include/IMultiSigStore.hpp"
#include "common/utils/clock/Clock.hpp"
#include <string>
#include <vector>

namespace multisig_engine::multisig
{
    /**
     * @brief 멀티시그 지갑 오케스트레이터 (공개 API)
     *
     * 모든 메서드는 여러 요청 스레드에서 동시에 호출될 수 있습니다.
     * 지갑 메타데이터 변경은 지갑 ID 잠금, 트랜잭션 변경은 QuorumStateMachine의 트랜잭션 잠금으로 직렬화됩니다.
     * 상태를 바꾸는 작업마다 감사 이벤트를 1건 기록하며, 감사 실패는 로그만 남깁니다.
     */
    class MultiSigService
    {
    public:
        /**
         * @param signing 서명 협력자 (없으면 레코드에 제출된 서명만 사용)
         */
        MultiSigService(
            IMultiSigStore& store,
            const ChainRegistry& chains,
            IAuditSink& audit,
            const utils::IClock& clock,
            const MultiSigSettings& settings,
            ISigningCollaborator* signing = nullptr
        );

        MultiSigService(const MultiSigService&) = delete;
        MultiSigService& operator=(const MultiSigService&) = delete;

        // ---- 지갑 ----

        /**
         * @brief 지갑 생성
         *
         * 온체인이 활성화된 체인이면 배포를 시도하고, 실패하면 결정적 대체 주소를 사용합니다.
         * 검증을 통과하면 항상 성공합니다.
         *
         * @throws InvalidArgumentException user_id/chain 누락
         * @throws InvalidAddressException
         * @throws DuplicateSignerException
         * @throws ThresholdInvariantException 1 <= t <= n 위반
         */
        WalletDetails CreateWallet(
            const std::string& user_id,
            const std::string& chain,
            uint32_t threshold,
            const std::vector<SignerInput>& signers
        );

        WalletDetails GetWallet(const std::string& wallet_id);

        /**
         * @throws NotFoundException, InvalidAddressException, DuplicateSignerException
         */
        Signer AddSigner(const std::string& wallet_id, const SignerInput& signer, const std::string& actor);

        /**
         * @throws ThresholdInvariantException 제거 후 n < t
         */
        MultiSigWallet RemoveSigner(const std::string& wallet_id, const std::string& address, const std::string& actor);

        /**
         * @brief 대체 주소 지갑의 실제 배포
         * @throws AlreadyDeployedException, OnChainUnsupportedException, DeploymentFailedException
         */
        MultiSigWallet DeployWallet(const std::string& wallet_id, const std::string& actor);

        // ---- 트랜잭션 ----

        PendingTransaction Propose(const std::string& wallet_id, const ProposalRequest& request);
        PendingTransaction Sign(const std::string& tx_id, const std::string& signer, const std::string& signature = "");
        PendingTransaction RetryExecution(const std::string& tx_id, const std::string& requester);
        PendingTransaction Cancel(const std::string& tx_id, const std::string& canceller);
        PendingTransaction GetTransaction(const std::string& tx_id);
        std::vector<PendingTransaction> ListPending(const std::string& wallet_id);

        /**
         * @brief 서명자가 서명할 EIP-712 트랜잭션 (현재 Safe nonce 기준)
         * @throws OnChainUnsupportedException 대체 주소 지갑 또는 온체인 비활성 체인
         */
        SafeTransaction GetSigningPayload(const std::string& tx_id);

        // 온체인 실행 대신 기록하는 해시: 0x + keccak256("offchain:" + tx_id + ":" + executed_ms)
        static std::string OffChainTransactionHash(const std::string& tx_id, int64_t executed_at_ms);

    private:
        MultiSigWallet LoadWallet(const std::string& wallet_id) const;

        std::string ExecuteTransaction(const PendingTransaction& tx);
        std::string ExecuteOnChain(const MultiSigWallet& wallet, const PendingTransaction& tx);
        SafeTransaction BuildSafeTransaction(
            IExecutionAdapter& adapter,
            const MultiSigWallet& wallet,
            const PendingTransaction& tx
        );

        void Audit(
            const std::string& event_kind,
            const std::string& actor,
            const std::string& resource_id,
            const AuditMetadata& metadata
        );
        void OnTransition(const char* event_kind, const PendingTransaction& tx, const std::string& actor);

        IMultiSigStore& store;
        const ChainRegistry& chains;
        IAuditSink& audit;
        const utils::IClock& clock;
        ISigningCollaborator* signing;

        KeyedLockTable wallet_locks;
        QuorumStateMachine quorum;
    };
}
