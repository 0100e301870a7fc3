// src/multisig/quorum/src/QuorumStateMachine.cpp
#include "multisig/quorum/include/QuorumStateMachine.hpp"
#include "multisig/address/include/AddressNormalizer.hpp"
#include "multisig/audit/include/IAuditSink.hpp"
#include "multisig/errors/include/MultiSigException.hpp"
#include "multisig/model/include/Amount.hpp"
#include "multisig/signature/include/SignaturePacker.hpp"
#include "common/crypto/include/HexUtils.hpp"
#include "common/utils/id/IdGenerator.hpp"
#include "common/utils/logger/Logger.hpp"
#include <algorithm>

namespace multisig_engine::multisig
{
    namespace
    {
        std::string ParseOptionalSignature(const std::string& signature)
        {
            if (signature.empty()) {
                return "";
            }
            return crypto::ToHex(SignaturePacker::ParseSignature(signature), true);
        }
    }

    QuorumStateMachine::QuorumStateMachine(
        IMultiSigStore& record_store,
        const utils::IClock& time_source,
        int64_t ttl_ms,
        ExecuteCallback execute_callback)
        : store(record_store)
        , clock(time_source)
        , proposal_ttl_ms(ttl_ms)
        , execute(std::move(execute_callback))
    {
        if (!execute) {
            throw std::invalid_argument("QuorumStateMachine requires an execute callback");
        }
        if (proposal_ttl_ms <= 0) {
            throw std::invalid_argument("Proposal TTL must be positive");
        }
    }

    // ========================================
    // 내부 헬퍼
    // ========================================

    bool QuorumStateMachine::IsCurrentSigner(const std::string& wallet_id, const std::string& address) const
    {
        auto signers = store.ListSigners(wallet_id);
        return std::any_of(signers.begin(), signers.end(),
            [&address](const Signer& s) { return s.address == address; });
    }

    PendingTransaction QuorumStateMachine::LoadLocked(const std::string& tx_id) const
    {
        PendingTransaction record;
        if (!store.FindTransaction(tx_id, record)) {
            throw NotFoundException("Transaction", tx_id);
        }
        return record;
    }

    void QuorumStateMachine::Persist(PendingTransaction& record)
    {
        if (!store.CompareAndSwapTransaction(record, record.version)) {
            MSIG_LOG_ERRORF("Quorum", "Version conflict on transaction %s (version=%llu)",
                record.id.c_str(), static_cast<unsigned long long>(record.version));
            throw ConcurrentModificationException(record.id);
        }
    }

    bool QuorumStateMachine::ExpireIfNeeded(PendingTransaction& record)
    {
        if (!record.IsPending() || !record.IsExpiredAt(clock.NowMs())) {
            return false;
        }

        record.status = TransactionStatus::EXPIRED;
        Persist(record);

        MSIG_LOG_INFOF("Quorum", "Transaction %s expired (%u/%u signatures)",
            record.id.c_str(), record.current_signatures, record.required_signatures);
        Notify(audit_event::TRANSACTION_EXPIRED, record, "");
        return true;
    }

    void QuorumStateMachine::ExecuteLocked(PendingTransaction& record, const std::string& actor)
    {
        PendingTransaction attempt = record;
        attempt.executed_at_ms = clock.NowMs();

        std::string tx_hash;
        try {
            tx_hash = execute(attempt);
        } catch (const ExecutionFailedException& e) {
            record.last_error = e.what();
            Persist(record);
            MSIG_LOG_ERRORF("Quorum", "Execution of %s failed, kept pending: %s", record.id.c_str(), e.what());
            Notify(audit_event::TRANSACTION_EXECUTION_FAILED, record, actor);
            throw;
        } catch (const MultiSigException& e) {
            record.last_error = e.what();
            Persist(record);
            MSIG_LOG_ERRORF("Quorum", "Execution of %s failed, kept pending: %s", record.id.c_str(), e.what());
            Notify(audit_event::TRANSACTION_EXECUTION_FAILED, record, actor);
            throw ExecutionFailedException(ExecutionFailureReason::UNKNOWN, e.what());
        } catch (const std::exception& e) {
            // 체인 클라이언트/서명 협력자의 비도메인 오류
            record.last_error = e.what();
            Persist(record);
            MSIG_LOG_ERRORF("Quorum", "Execution of %s aborted, kept pending: %s", record.id.c_str(), e.what());
            Notify(audit_event::TRANSACTION_EXECUTION_FAILED, record, actor);
            throw ExecutionFailedException(ExecutionFailureReason::UNKNOWN, e.what());
        }

        if (tx_hash.empty()) {
            record.last_error = "execution returned no transaction hash";
            Persist(record);
            Notify(audit_event::TRANSACTION_EXECUTION_FAILED, record, actor);
            throw ExecutionFailedException(ExecutionFailureReason::UNKNOWN, record.last_error);
        }

        record.status = TransactionStatus::EXECUTED;
        record.execution_tx_hash = tx_hash;
        record.executed_at_ms = attempt.executed_at_ms;
        record.last_error.clear();
        Persist(record);

        MSIG_LOG_INFOF("Quorum", "Transaction %s executed (%u/%u) hash=%s",
            record.id.c_str(), record.current_signatures, record.required_signatures, tx_hash.c_str());
        Notify(audit_event::TRANSACTION_EXECUTED, record, actor);
    }

    void QuorumStateMachine::Notify(const char* event_kind, const PendingTransaction& record, const std::string& actor)
    {
        if (on_transition) {
            on_transition(event_kind, record, actor);
        }
    }

    // ========================================
    // 제안
    // ========================================

    PendingTransaction QuorumStateMachine::Propose(
        const MultiSigWallet& wallet,
        const std::vector<Signer>& signers,
        const ProposalRequest& request)
    {
        const std::string proposer = AddressNormalizer::Normalize(request.proposer);

        bool is_signer = std::any_of(signers.begin(), signers.end(),
            [&proposer](const Signer& s) { return s.address == proposer; });
        if (!is_signer) {
            MSIG_LOG_WARNF("Quorum", "Proposer %s is not a signer of wallet %s", proposer.c_str(), wallet.id.c_str());
            throw UnauthorizedException(proposer + " is not a signer of wallet " + wallet.id);
        }

        const std::string to = AddressNormalizer::Normalize(request.to_address);
        ParseAmount(request.amount);
        const std::string signature = ParseOptionalSignature(request.signature);

        const int64_t now = clock.NowMs();

        PendingTransaction record;
        record.id = utils::IdGenerator::NewUuid();
        record.wallet_id = wallet.id;
        record.chain = wallet.chain;
        record.to_address = to;
        record.amount = request.amount;
        record.memo = request.memo;
        record.required_signatures = wallet.threshold;
        record.signed_by.push_back(proposer);
        record.current_signatures = 1;
        for (const auto& s : signers) {
            record.eligible_signers.push_back(s.address);
        }
        if (!signature.empty()) {
            record.signatures[proposer] = signature;
        }
        record.proposer = proposer;
        record.status = TransactionStatus::PENDING;
        record.created_at_ms = now;
        record.expires_at_ms = now + proposal_ttl_ms;

        auto guard = tx_locks.Acquire(record.id);

        if (!store.InsertTransaction(record)) {
            throw ConcurrentModificationException(record.id);
        }

        MSIG_LOG_INFOF("Quorum", "Transaction %s proposed on wallet %s by %s (1/%u)",
            record.id.c_str(), wallet.id.c_str(), proposer.c_str(), record.required_signatures);
        Notify(audit_event::TRANSACTION_PROPOSED, record, proposer);

        if (record.ThresholdReached()) {
            try {
                ExecuteLocked(record, proposer);
            } catch (const ExecutionFailedException& e) {
                MSIG_LOG_WARNF("Quorum", "Proposal %s stays pending: %s", record.id.c_str(), e.what());
            }
        }

        return record;
    }

    // ========================================
    // 서명
    // ========================================

    PendingTransaction QuorumStateMachine::Sign(
        const std::string& tx_id,
        const std::string& signer,
        const std::string& signature)
    {
        auto guard = tx_locks.Acquire(tx_id);
        PendingTransaction record = LoadLocked(tx_id);

        if (!record.IsPending()) {
            throw NotPendingException(tx_id, ToString(record.status));
        }

        if (ExpireIfNeeded(record)) {
            throw ExpiredException(tx_id);
        }

        const std::string address = AddressNormalizer::Normalize(signer);
        if (record.HasSigned(address)) {
            MSIG_LOG_WARNF("Quorum", "%s already signed %s", address.c_str(), tx_id.c_str());
            throw AlreadySignedException(tx_id, address);
        }

        if (!record.WasEligible(address) || !IsCurrentSigner(record.wallet_id, address)) {
            MSIG_LOG_WARNF("Quorum", "%s is not allowed to sign %s", address.c_str(), tx_id.c_str());
            throw UnauthorizedException(address + " cannot sign transaction " + tx_id);
        }

        const std::string normalized_signature = ParseOptionalSignature(signature);

        record.signed_by.push_back(address);
        record.current_signatures = static_cast<uint32_t>(record.signed_by.size());
        if (!normalized_signature.empty()) {
            record.signatures[address] = normalized_signature;
        }
        Persist(record);

        MSIG_LOG_INFOF("Quorum", "Transaction %s signed by %s (%u/%u)",
            tx_id.c_str(), address.c_str(), record.current_signatures, record.required_signatures);
        Notify(audit_event::TRANSACTION_SIGNED, record, address);

        if (record.ThresholdReached()) {
            ExecuteLocked(record, address);
        }

        return record;
    }

    PendingTransaction QuorumStateMachine::RetryExecution(const std::string& tx_id, const std::string& requester)
    {
        auto guard = tx_locks.Acquire(tx_id);
        PendingTransaction record = LoadLocked(tx_id);

        if (!record.IsPending()) {
            throw NotPendingException(tx_id, ToString(record.status));
        }

        if (ExpireIfNeeded(record)) {
            throw ExpiredException(tx_id);
        }

        const std::string address = AddressNormalizer::Normalize(requester);

        if (!IsCurrentSigner(record.wallet_id, address)) {
            throw UnauthorizedException(address + " is not a signer of wallet " + record.wallet_id);
        }

        if (!record.ThresholdReached()) {
            throw ThresholdNotReachedException(tx_id, record.current_signatures, record.required_signatures);
        }

        MSIG_LOG_INFOF("Quorum", "Retrying execution of %s (requested by %s)", tx_id.c_str(), address.c_str());
        ExecuteLocked(record, address);
        return record;
    }

    // ========================================
    // 취소 / 조회
    // ========================================

    PendingTransaction QuorumStateMachine::Cancel(const std::string& tx_id, const std::string& canceller)
    {
        auto guard = tx_locks.Acquire(tx_id);
        PendingTransaction record = LoadLocked(tx_id);
        const std::string address = AddressNormalizer::Normalize(canceller);

        if (!IsCurrentSigner(record.wallet_id, address)) {
            MSIG_LOG_WARNF("Quorum", "%s is not allowed to cancel %s", address.c_str(), tx_id.c_str());
            throw UnauthorizedException(address + " is not a signer of wallet " + record.wallet_id);
        }

        if (!record.IsPending()) {
            throw NotPendingException(tx_id, ToString(record.status));
        }

        if (ExpireIfNeeded(record)) {
            throw ExpiredException(tx_id);
        }

        record.status = TransactionStatus::CANCELLED;
        Persist(record);

        MSIG_LOG_INFOF("Quorum", "Transaction %s cancelled by %s", tx_id.c_str(), address.c_str());
        Notify(audit_event::TRANSACTION_CANCELLED, record, address);
        return record;
    }

    PendingTransaction QuorumStateMachine::Get(const std::string& tx_id)
    {
        auto guard = tx_locks.Acquire(tx_id);
        PendingTransaction record = LoadLocked(tx_id);
        ExpireIfNeeded(record);
        return record;
    }

    std::vector<PendingTransaction> QuorumStateMachine::ListPending(const std::string& wallet_id)
    {
        std::vector<PendingTransaction> result;
        const int64_t now = clock.NowMs();

        for (auto& record : store.ListTransactions(wallet_id)) {
            if (!record.IsPending()) {
                continue;
            }

            if (record.IsExpiredAt(now)) {
                auto guard = tx_locks.Acquire(record.id);
                PendingTransaction current;
                if (store.FindTransaction(record.id, current)) {
                    ExpireIfNeeded(current);
                }
                continue;
            }

            result.push_back(std::move(record));
        }

        std::sort(result.begin(), result.end(),
            [](const PendingTransaction& a, const PendingTransaction& b) {
                if (a.created_at_ms != b.created_at_ms) {
                    return a.created_at_ms > b.created_at_ms;
                }
                return a.id > b.id;
            });
        return result;
    }
}
