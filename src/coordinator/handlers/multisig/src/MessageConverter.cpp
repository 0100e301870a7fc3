// src/coordinator/handlers/multisig/src/MessageConverter.cpp
#include "coordinator/handlers/multisig/include/MessageConverter.hpp"
#include "common/utils/clock/Clock.hpp"

namespace multisig_engine::coordinator::handlers
{
    void ToProto(const engine::MultiSigWallet& wallet, WalletInfo* out)
    {
        out->set_id(wallet.id);
        out->set_user_id(wallet.user_id);
        out->set_chain(wallet.chain);
        out->set_address(wallet.address);
        out->set_address_kind(engine::ToString(wallet.address_kind));
        out->set_threshold(wallet.threshold);
        out->set_total_signers(wallet.total_signers);
        out->set_label(wallet.label);
        out->set_created_at_ms(wallet.created_at_ms);
        out->set_deployment_tx_hash(wallet.deployment_tx_hash);
    }

    void ToProto(const engine::Signer& signer, SignerInfo* out)
    {
        out->set_address(signer.address);
        out->set_name(signer.name);
        out->set_contact(signer.contact);
        out->set_added_at_ms(signer.added_at_ms);
    }

    void ToProto(const engine::PendingTransaction& tx, TransactionInfo* out)
    {
        out->set_id(tx.id);
        out->set_wallet_id(tx.wallet_id);
        out->set_chain(tx.chain);
        out->set_to_address(tx.to_address);
        out->set_amount(tx.amount);
        out->set_memo(tx.memo);
        out->set_required_signatures(tx.required_signatures);
        out->set_current_signatures(tx.current_signatures);
        for (const auto& signer : tx.signed_by) {
            out->add_signed_by(signer);
        }
        out->set_proposer(tx.proposer);
        out->set_status(engine::ToString(tx.status));
        out->set_created_at_ms(tx.created_at_ms);
        out->set_expires_at_ms(tx.expires_at_ms);
        out->set_executed_at_ms(tx.executed_at_ms);
        out->set_execution_tx_hash(tx.execution_tx_hash);
        out->set_last_error(tx.last_error);
    }

    void ToProto(const engine::WalletDetails& details, WalletResponse* out)
    {
        ToProto(details.wallet, out->mutable_wallet());
        for (const auto& signer : details.signers) {
            ToProto(signer, out->add_signers());
        }
    }

    engine::SignerInput FromProto(const SignerInfo& signer)
    {
        engine::SignerInput input;
        input.address = signer.address();
        input.name = signer.name();
        input.contact = signer.contact();
        return input;
    }

    void InitResponseHeader(const RequestHeader& request, uint32_t message_type, ResponseHeader* out)
    {
        out->set_message_type(message_type);
        out->set_request_id(request.request_id());
        out->set_timestamp(std::to_string(utils::SystemClock().NowMs()));
        out->set_success(false);
    }

    void SetError(ResponseHeader* header, engine::MultiSigErrorCode code, const std::string& message)
    {
        header->set_success(false);
        header->set_error_code(static_cast<int32_t>(code));
        header->set_error_message(message);
    }
}
