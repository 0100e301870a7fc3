// src/multisig/service/src/MultiSigService.cpp
#include "multisig/service/include/MultiSigService.hpp"
#include "multisig/address/include/AddressNormalizer.hpp"
#include "multisig/errors/include/MultiSigException.hpp"
#include "multisig/model/include/Amount.hpp"
#include "multisig/signature/include/SignaturePacker.hpp"
#include "common/crypto/include/HexUtils.hpp"
#include "common/crypto/include/Keccak256.hpp"
#include "common/utils/id/IdGenerator.hpp"
#include "common/utils/logger/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <set>

namespace multisig_engine::multisig
{
    namespace
    {
        std::string Trim(const std::string& value)
        {
            size_t start = value.find_first_not_of(" \t\r\n");
            if (start == std::string::npos) {
                return "";
            }
            size_t end = value.find_last_not_of(" \t\r\n");
            return value.substr(start, end - start + 1);
        }

        std::string ToLower(std::string value)
        {
            std::transform(value.begin(), value.end(), value.begin(),
                [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return value;
        }
    }

    MultiSigService::MultiSigService(
        IMultiSigStore& record_store,
        const ChainRegistry& chain_registry,
        IAuditSink& audit_sink,
        const utils::IClock& time_source,
        const MultiSigSettings& settings,
        ISigningCollaborator* signing_collaborator)
        : store(record_store)
        , chains(chain_registry)
        , audit(audit_sink)
        , clock(time_source)
        , signing(signing_collaborator)
        , quorum(record_store, time_source, utils::HoursToMs(settings.proposal_ttl_hours),
                 [this](const PendingTransaction& tx) { return ExecuteTransaction(tx); })
    {
        quorum.SetTransitionListener(
            [this](const char* event_kind, const PendingTransaction& tx, const std::string& actor) {
                OnTransition(event_kind, tx, actor);
            });
    }

    // ========================================
    // 감사 로그
    // ========================================

    void MultiSigService::Audit(
        const std::string& event_kind,
        const std::string& actor,
        const std::string& resource_id,
        const AuditMetadata& metadata)
    {
        try {
            audit.Record(event_kind, actor, resource_id, metadata);
        } catch (const std::exception& e) {
            MSIG_LOG_WARNF("MultiSigService", "Audit event %s for %s dropped: %s",
                event_kind.c_str(), resource_id.c_str(), e.what());
        }
    }

    void MultiSigService::OnTransition(const char* event_kind, const PendingTransaction& tx, const std::string& actor)
    {
        AuditMetadata metadata{
            {"wallet_id", tx.wallet_id},
            {"status", ToString(tx.status)},
            {"signatures", std::to_string(tx.current_signatures) + "/" + std::to_string(tx.required_signatures)}
        };
        if (!tx.execution_tx_hash.empty()) {
            metadata["execution_tx_hash"] = tx.execution_tx_hash;
        }
        if (!tx.last_error.empty() && tx.IsPending()) {
            metadata["error"] = tx.last_error;
        }
        Audit(event_kind, actor, tx.id, metadata);
    }

    // ========================================
    // 지갑
    // ========================================

    MultiSigWallet MultiSigService::LoadWallet(const std::string& wallet_id) const
    {
        MultiSigWallet wallet;
        if (!store.FindWallet(wallet_id, wallet)) {
            throw NotFoundException("Wallet", wallet_id);
        }
        return wallet;
    }

    WalletDetails MultiSigService::CreateWallet(
        const std::string& user_id,
        const std::string& chain,
        uint32_t threshold,
        const std::vector<SignerInput>& signers)
    {
        const std::string owner = Trim(user_id);
        const std::string chain_name = ToLower(Trim(chain));
        if (owner.empty()) {
            throw InvalidArgumentException("user_id is required");
        }
        if (chain_name.empty()) {
            throw InvalidArgumentException("chain is required");
        }

        std::vector<SignerInput> normalized;
        std::set<std::string> seen;
        for (const auto& input : signers) {
            SignerInput entry = input;
            entry.address = AddressNormalizer::Normalize(input.address);
            if (!seen.insert(entry.address).second) {
                MSIG_LOG_WARNF("MultiSigService", "Duplicate signer %s in wallet request", entry.address.c_str());
                throw DuplicateSignerException(entry.address);
            }
            normalized.push_back(entry);
        }

        const uint32_t signer_count = static_cast<uint32_t>(normalized.size());
        if (threshold < 1 || threshold > signer_count) {
            MSIG_LOG_WARNF("MultiSigService", "Rejected wallet request: threshold=%u signers=%u",
                threshold, signer_count);
            throw ThresholdInvariantException(threshold, signer_count);
        }

        const int64_t now = clock.NowMs();

        MultiSigWallet wallet;
        wallet.id = utils::IdGenerator::NewUuid();
        wallet.user_id = owner;
        wallet.chain = chain_name;
        wallet.threshold = threshold;
        wallet.total_signers = signer_count;
        wallet.label = "MultiSig " + std::to_string(threshold) + "/" + std::to_string(signer_count);
        wallet.created_at_ms = now;

        bool deployed = false;
        if (chains.IsOnChainEnabled(chain_name)) {
            std::vector<std::string> owners;
            for (const auto& entry : normalized) {
                owners.push_back(entry.address);
            }

            try {
                DeploymentResult result = chains.Adapter(chain_name).Deploy(owners, threshold);
                wallet.address = result.address;
                wallet.deployment_tx_hash = result.tx_hash;
                wallet.address_kind = AddressKind::DEPLOYED;
                deployed = true;
            } catch (const DeploymentFailedException& e) {
                MSIG_LOG_ERRORF("MultiSigService", "Deployment of wallet %s failed, using placeholder: %s",
                    wallet.id.c_str(), e.what());
            } catch (const std::exception& e) {
                // 어댑터가 감싸지 못한 오류도 배포 실패로 취급
                MSIG_LOG_ERRORF("MultiSigService", "Deployment of wallet %s aborted, using placeholder: %s",
                    wallet.id.c_str(), e.what());
            }
        }

        if (!deployed) {
            wallet.address = DeriveFallbackAddress(wallet.id);
            wallet.address_kind = AddressKind::PLACEHOLDER;
        }

        if (!store.InsertWallet(wallet)) {
            throw ConcurrentModificationException(wallet.id);
        }

        WalletDetails details;
        details.wallet = wallet;
        for (const auto& entry : normalized) {
            Signer signer;
            signer.wallet_id = wallet.id;
            signer.address = entry.address;
            signer.name = entry.name;
            signer.contact = entry.contact;
            signer.added_at_ms = now;

            if (!store.InsertSigner(signer)) {
                throw DuplicateSignerException(signer.address);
            }
            details.signers.push_back(signer);
        }

        MSIG_LOG_INFOF("MultiSigService", "Wallet %s created on %s (%u/%u) address=%s (%s)",
            wallet.id.c_str(), wallet.chain.c_str(), threshold, signer_count,
            wallet.address.c_str(), ToString(wallet.address_kind));

        Audit(audit_event::WALLET_CREATED, owner, wallet.id, {
            {"chain", wallet.chain},
            {"address", wallet.address},
            {"address_kind", ToString(wallet.address_kind)},
            {"threshold", std::to_string(threshold)},
            {"signers", std::to_string(signer_count)}
        });

        return details;
    }

    WalletDetails MultiSigService::GetWallet(const std::string& wallet_id)
    {
        WalletDetails details;
        details.wallet = LoadWallet(wallet_id);
        details.signers = store.ListSigners(wallet_id);
        return details;
    }

    Signer MultiSigService::AddSigner(const std::string& wallet_id, const SignerInput& input, const std::string& actor)
    {
        auto guard = wallet_locks.Acquire(wallet_id);
        MultiSigWallet wallet = LoadWallet(wallet_id);

        Signer signer;
        signer.wallet_id = wallet_id;
        signer.address = AddressNormalizer::Normalize(input.address);
        signer.name = input.name;
        signer.contact = input.contact;
        signer.added_at_ms = clock.NowMs();

        if (!store.InsertSigner(signer)) {
            MSIG_LOG_WARNF("MultiSigService", "Signer %s already in wallet %s", signer.address.c_str(), wallet_id.c_str());
            throw DuplicateSignerException(signer.address);
        }

        wallet.total_signers++;
        if (!store.UpdateWallet(wallet)) {
            throw NotFoundException("Wallet", wallet_id);
        }

        MSIG_LOG_INFOF("MultiSigService", "Signer %s added to wallet %s (%u/%u)",
            signer.address.c_str(), wallet_id.c_str(), wallet.threshold, wallet.total_signers);

        Audit(audit_event::SIGNER_ADDED, actor, wallet_id, {
            {"signer", signer.address},
            {"total_signers", std::to_string(wallet.total_signers)}
        });
        return signer;
    }

    MultiSigWallet MultiSigService::RemoveSigner(const std::string& wallet_id, const std::string& address, const std::string& actor)
    {
        auto guard = wallet_locks.Acquire(wallet_id);
        MultiSigWallet wallet = LoadWallet(wallet_id);
        const std::string normalized = AddressNormalizer::Normalize(address);

        auto signers = store.ListSigners(wallet_id);
        bool present = std::any_of(signers.begin(), signers.end(),
            [&normalized](const Signer& s) { return s.address == normalized; });
        if (!present) {
            throw NotFoundException("Signer", normalized);
        }

        if (wallet.total_signers - 1 < wallet.threshold) {
            MSIG_LOG_WARNF("MultiSigService", "Removing %s would leave wallet %s with %u signers for threshold %u",
                normalized.c_str(), wallet_id.c_str(), wallet.total_signers - 1, wallet.threshold);
            throw ThresholdInvariantException(wallet.threshold, wallet.total_signers - 1);
        }

        if (!store.DeleteSigner(wallet_id, normalized)) {
            throw NotFoundException("Signer", normalized);
        }

        wallet.total_signers--;
        if (!store.UpdateWallet(wallet)) {
            throw NotFoundException("Wallet", wallet_id);
        }

        MSIG_LOG_INFOF("MultiSigService", "Signer %s removed from wallet %s (%u/%u)",
            normalized.c_str(), wallet_id.c_str(), wallet.threshold, wallet.total_signers);

        Audit(audit_event::SIGNER_REMOVED, actor, wallet_id, {
            {"signer", normalized},
            {"total_signers", std::to_string(wallet.total_signers)}
        });
        return wallet;
    }

    MultiSigWallet MultiSigService::DeployWallet(const std::string& wallet_id, const std::string& actor)
    {
        auto guard = wallet_locks.Acquire(wallet_id);
        MultiSigWallet wallet = LoadWallet(wallet_id);

        if (wallet.address_kind == AddressKind::DEPLOYED) {
            throw AlreadyDeployedException(wallet_id);
        }

        IExecutionAdapter& adapter = chains.Adapter(wallet.chain);

        std::vector<std::string> owners;
        for (const auto& signer : store.ListSigners(wallet_id)) {
            owners.push_back(signer.address);
        }

        DeploymentResult result;
        try {
            result = adapter.Deploy(owners, wallet.threshold);
        } catch (const MultiSigException&) {
            throw;
        } catch (const std::exception& e) {
            MSIG_LOG_ERRORF("MultiSigService", "Deployment of wallet %s aborted: %s", wallet_id.c_str(), e.what());
            throw DeploymentFailedException(e.what());
        }

        const std::string placeholder = wallet.address;
        wallet.address = result.address;
        wallet.address_kind = AddressKind::DEPLOYED;
        wallet.deployment_tx_hash = result.tx_hash;
        if (!store.UpdateWallet(wallet)) {
            throw NotFoundException("Wallet", wallet_id);
        }

        MSIG_LOG_INFOF("MultiSigService", "Wallet %s deployed at %s (was %s)",
            wallet_id.c_str(), wallet.address.c_str(), placeholder.c_str());

        Audit(audit_event::WALLET_DEPLOYED, actor, wallet_id, {
            {"chain", wallet.chain},
            {"address", wallet.address},
            {"tx_hash", result.tx_hash}
        });
        return wallet;
    }

    // ========================================
    // 트랜잭션
    // ========================================

    PendingTransaction MultiSigService::Propose(const std::string& wallet_id, const ProposalRequest& request)
    {
        MultiSigWallet wallet;
        std::vector<Signer> signers;
        {
            auto guard = wallet_locks.Acquire(wallet_id);
            wallet = LoadWallet(wallet_id);
            signers = store.ListSigners(wallet_id);
        }
        return quorum.Propose(wallet, signers, request);
    }

    PendingTransaction MultiSigService::Sign(const std::string& tx_id, const std::string& signer, const std::string& signature)
    {
        return quorum.Sign(tx_id, signer, signature);
    }

    PendingTransaction MultiSigService::RetryExecution(const std::string& tx_id, const std::string& requester)
    {
        return quorum.RetryExecution(tx_id, requester);
    }

    PendingTransaction MultiSigService::Cancel(const std::string& tx_id, const std::string& canceller)
    {
        return quorum.Cancel(tx_id, canceller);
    }

    PendingTransaction MultiSigService::GetTransaction(const std::string& tx_id)
    {
        return quorum.Get(tx_id);
    }

    std::vector<PendingTransaction> MultiSigService::ListPending(const std::string& wallet_id)
    {
        LoadWallet(wallet_id);
        return quorum.ListPending(wallet_id);
    }

    SafeTransaction MultiSigService::GetSigningPayload(const std::string& tx_id)
    {
        PendingTransaction tx = quorum.Get(tx_id);
        MultiSigWallet wallet = LoadWallet(tx.wallet_id);

        if (wallet.address_kind != AddressKind::DEPLOYED) {
            throw OnChainUnsupportedException(wallet.chain + " (wallet " + wallet.id + " is not deployed)");
        }

        IExecutionAdapter& adapter = chains.Adapter(wallet.chain);
        return BuildSafeTransaction(adapter, wallet, tx);
    }

    // ========================================
    // 실행
    // ========================================

    std::string MultiSigService::OffChainTransactionHash(const std::string& tx_id, int64_t executed_at_ms)
    {
        std::string preimage = "offchain:" + tx_id + ":" + std::to_string(executed_at_ms);
        return crypto::ToHex(crypto::Keccak256::Hash(preimage), true);
    }

    SafeTransaction MultiSigService::BuildSafeTransaction(
        IExecutionAdapter& adapter,
        const MultiSigWallet& wallet,
        const PendingTransaction& tx)
    {
        uint256_t nonce = adapter.GetNonce(wallet.address);
        uint256_t value = ParseAmount(tx.amount);
        Bytes data = SafeTransactionBuilder::CallDataFromMemo(tx.memo);

        return SafeTransactionBuilder::Build(adapter.ChainId(), wallet.address, tx.to_address, value, data, nonce);
    }

    std::string MultiSigService::ExecuteOnChain(const MultiSigWallet& wallet, const PendingTransaction& tx)
    {
        IExecutionAdapter& adapter = chains.Adapter(wallet.chain);
        SafeTransaction safe_tx = BuildSafeTransaction(adapter, wallet, tx);

        std::vector<SignerSignature> collected;
        for (const auto& signer : tx.signed_by) {
            SignerSignature entry;
            entry.signer = signer;

            auto it = tx.signatures.find(signer);
            if (it != tx.signatures.end()) {
                entry.signature = SignaturePacker::ParseSignature(it->second);
            } else if (signing == nullptr || !signing->RequestSignature(signer, safe_tx, entry.signature)) {
                throw ExecutionFailedException(ExecutionFailureReason::MISSING_SIGNATURE,
                    "no signature from " + signer + " for " + tx.id);
            }
            collected.push_back(std::move(entry));
        }

        Bytes packed;
        try {
            packed = SignaturePacker::Pack(collected);
        } catch (const InvalidSignatureException& e) {
            throw ExecutionFailedException(ExecutionFailureReason::MISSING_SIGNATURE, e.what());
        }

        MSIG_LOG_INFOF("MultiSigService", "Executing %s on %s via %s (nonce=%s, %zu signatures)",
            tx.id.c_str(), wallet.chain.c_str(), wallet.address.c_str(),
            ToDecimalString(safe_tx.nonce).c_str(), collected.size());

        return adapter.Execute(wallet.address, safe_tx, packed);
    }

    std::string MultiSigService::ExecuteTransaction(const PendingTransaction& tx)
    {
        MultiSigWallet wallet = LoadWallet(tx.wallet_id);

        if (wallet.address_kind == AddressKind::DEPLOYED && chains.IsOnChainEnabled(wallet.chain)) {
            return ExecuteOnChain(wallet, tx);
        }

        std::string hash = OffChainTransactionHash(tx.id, tx.executed_at_ms);
        MSIG_LOG_INFOF("MultiSigService", "Transaction %s completed off-chain (%s wallet on %s)",
            tx.id.c_str(), ToString(wallet.address_kind), wallet.chain.c_str());
        return hash;
    }
}
