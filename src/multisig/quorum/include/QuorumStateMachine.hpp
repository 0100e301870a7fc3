// src/multisig/quorum/include/QuorumStateMachine.hpp
#pragma once
#include "multisig/quorum/include/KeyedLockTable.hpp"
#include "multisig/storage/include/IMultiSigStore.hpp"
#include "common/utils/clock/Clock.hpp"
#include <functional>
#include <string>
#include <vector>

namespace multisig_engine::multisig
{
    struct ProposalRequest
    {
        std::string proposer;
        std::string to_address;
        std::string amount;
        std::string memo;
        std::string signature;      // 선택: 제안자 서명 (0x 16진)
    };

    /**
     * @brief 대기 트랜잭션 상태 머신
     *
     * Pending → {Executed, Cancelled, Expired}. 종료 상태에서 나가는 전이는 없습니다.
     *
     * 트랜잭션 변경은 모두 트랜잭션 ID 잠금 안에서 수행되고 저장소 CAS로 기록됩니다.
     * 임계치 도달 시 실행은 같은 임계 구역 안에서 정확히 한 번 시도되며,
     * executed 상태 기록이 임계 구역의 마지막 쓰기입니다.
     */
    class QuorumStateMachine
    {
    public:
        /**
         * @brief 실행 콜백
         *
         * 인자의 executed_at_ms에는 실행 시각이 채워져 있으며, 성공 시 그대로 기록됩니다.
         * @return 실행 트랜잭션 해시
         * @throws ExecutionFailedException
         */
        using ExecuteCallback = std::function<std::string(const PendingTransaction&)>;

        /**
         * @brief 상태 전이 통지 (audit_event 이름, 변경 후 레코드, 행위자)
         */
        using TransitionListener =
            std::function<void(const char* event_kind, const PendingTransaction& tx, const std::string& actor)>;

        QuorumStateMachine(
            IMultiSigStore& store,
            const utils::IClock& clock,
            int64_t proposal_ttl_ms,
            ExecuteCallback execute
        );

        void SetTransitionListener(TransitionListener listener) { on_transition = std::move(listener); }

        /**
         * @brief 트랜잭션 제안 (제안자 서명 1개 포함)
         *
         * threshold가 1이면 즉시 실행을 시도합니다. 실행 실패 시 pending 레코드를 그대로 반환합니다.
         *
         * @throws InvalidAddressException 제안자/수신자 주소 오류
         * @throws UnauthorizedException 제안자가 지갑 서명자가 아님
         * @throws InvalidAmountException
         * @throws InvalidSignatureException
         */
        PendingTransaction Propose(
            const MultiSigWallet& wallet,
            const std::vector<Signer>& signers,
            const ProposalRequest& request
        );

        /**
         * @brief 서명 추가
         *
         * 검사 순서: NotFound → NotPending → Expired(전이) → AlreadySigned → Unauthorized
         * @throws ExecutionFailedException 임계치 도달 후 실행 실패 (서명은 기록된 상태로 유지)
         */
        PendingTransaction Sign(
            const std::string& tx_id,
            const std::string& signer,
            const std::string& signature = ""
        );

        /**
         * @brief 임계치에 도달했지만 실행에 실패한 트랜잭션 재실행
         * @throws ThresholdNotReachedException
         */
        PendingTransaction RetryExecution(const std::string& tx_id, const std::string& requester);

        /**
         * @brief 취소 (서명자 1명으로 충분)
         *
         * 검사 순서: NotFound → Unauthorized → NotPending → Expired(전이)
         */
        PendingTransaction Cancel(const std::string& tx_id, const std::string& canceller);

        /**
         * @throws NotFoundException
         */
        PendingTransaction Get(const std::string& tx_id);

        // status=pending 이고 만료 전인 트랜잭션, 최신순
        std::vector<PendingTransaction> ListPending(const std::string& wallet_id);

    private:
        bool IsCurrentSigner(const std::string& wallet_id, const std::string& address) const;

        PendingTransaction LoadLocked(const std::string& tx_id) const;
        void Persist(PendingTransaction& record);

        // 만료 전이 (잠금 보유 상태에서 호출)
        bool ExpireIfNeeded(PendingTransaction& record);

        void ExecuteLocked(PendingTransaction& record, const std::string& actor);

        void Notify(const char* event_kind, const PendingTransaction& record, const std::string& actor);

        IMultiSigStore& store;
        const utils::IClock& clock;
        int64_t proposal_ttl_ms;
        ExecuteCallback execute;
        TransitionListener on_transition;

        KeyedLockTable tx_locks;
    };
}
