// src/coordinator/handlers/multisig/src/TransactionHandlers.cpp
#include "coordinator/handlers/multisig/include/TransactionHandlers.hpp"
#include "multisig/model/include/Amount.hpp"
#include "multisig/typed/include/SafeTransactionBuilder.hpp"
#include "common/crypto/include/HexUtils.hpp"
#include "types/MultiSigMessageType.hpp"

namespace multisig_engine::coordinator::handlers
{
    namespace
    {
        std::unique_ptr<MultiSigMessage> NewTransactionResponse(
            MultiSigMessageType type,
            const RequestHeader& request_header,
            TransactionResponse*& response)
        {
            auto message = std::make_unique<MultiSigMessage>();
            message->set_message_type(static_cast<uint32_t>(type));
            response = message->mutable_transaction_response();
            InitResponseHeader(request_header, static_cast<uint32_t>(type), response->mutable_header());
            return message;
        }

        // 실행 실패 후 레코드 상태를 응답에 포함 (서명은 이미 기록됨)
        void AttachCurrentRecord(engine::MultiSigService& service, const std::string& tx_id, TransactionResponse* response)
        {
            try {
                ToProto(service.GetTransaction(tx_id), response->mutable_transaction());
            } catch (const engine::MultiSigException& e) {
                MSIG_LOG_WARNF("TransactionHandlers", "Could not reload %s: %s", tx_id.c_str(), e.what());
            }
        }
    }

    std::unique_ptr<MultiSigMessage> HandleProposeTransaction(engine::MultiSigService& service, const MultiSigMessage* request)
    {
        if (!request || !request->has_propose_transaction_request()) {
            MSIG_LOG_ERROR("TransactionHandlers", "[Propose] Invalid request");
            return nullptr;
        }

        const ProposeTransactionRequest& req = request->propose_transaction_request();

        TransactionResponse* response = nullptr;
        auto message = NewTransactionResponse(MultiSigMessageType::PROPOSE_TRANSACTION, req.header(), response);

        RunHandler("TransactionHandlers", response->mutable_header(), [&]() {
            engine::ProposalRequest proposal;
            proposal.proposer = req.proposer();
            proposal.to_address = req.to_address();
            proposal.amount = req.amount();
            proposal.memo = req.memo();
            proposal.signature = req.signature();

            ToProto(service.Propose(req.wallet_id(), proposal), response->mutable_transaction());
        });

        return message;
    }

    std::unique_ptr<MultiSigMessage> HandleSignTransaction(engine::MultiSigService& service, const MultiSigMessage* request)
    {
        if (!request || !request->has_sign_transaction_request()) {
            MSIG_LOG_ERROR("TransactionHandlers", "[Sign] Invalid request");
            return nullptr;
        }

        const SignTransactionRequest& req = request->sign_transaction_request();

        TransactionResponse* response = nullptr;
        auto message = NewTransactionResponse(MultiSigMessageType::SIGN_TRANSACTION, req.header(), response);

        bool execution_failed = false;
        RunHandler("TransactionHandlers", response->mutable_header(), [&]() {
            try {
                ToProto(service.Sign(req.transaction_id(), req.signer(), req.signature()), response->mutable_transaction());
            } catch (const engine::ExecutionFailedException&) {
                execution_failed = true;
                throw;
            }
        });

        if (execution_failed) {
            AttachCurrentRecord(service, req.transaction_id(), response);
        }

        return message;
    }

    std::unique_ptr<MultiSigMessage> HandleRetryExecution(engine::MultiSigService& service, const MultiSigMessage* request)
    {
        if (!request || !request->has_retry_execution_request()) {
            MSIG_LOG_ERROR("TransactionHandlers", "[Retry] Invalid request");
            return nullptr;
        }

        const RetryExecutionRequest& req = request->retry_execution_request();

        TransactionResponse* response = nullptr;
        auto message = NewTransactionResponse(MultiSigMessageType::RETRY_EXECUTION, req.header(), response);

        bool execution_failed = false;
        RunHandler("TransactionHandlers", response->mutable_header(), [&]() {
            try {
                ToProto(service.RetryExecution(req.transaction_id(), req.requester()), response->mutable_transaction());
            } catch (const engine::ExecutionFailedException&) {
                execution_failed = true;
                throw;
            }
        });

        if (execution_failed) {
            AttachCurrentRecord(service, req.transaction_id(), response);
        }

        return message;
    }

    std::unique_ptr<MultiSigMessage> HandleCancelTransaction(engine::MultiSigService& service, const MultiSigMessage* request)
    {
        if (!request || !request->has_cancel_transaction_request()) {
            MSIG_LOG_ERROR("TransactionHandlers", "[Cancel] Invalid request");
            return nullptr;
        }

        const CancelTransactionRequest& req = request->cancel_transaction_request();

        TransactionResponse* response = nullptr;
        auto message = NewTransactionResponse(MultiSigMessageType::CANCEL_TRANSACTION, req.header(), response);

        RunHandler("TransactionHandlers", response->mutable_header(), [&]() {
            ToProto(service.Cancel(req.transaction_id(), req.canceller()), response->mutable_transaction());
        });

        return message;
    }

    std::unique_ptr<MultiSigMessage> HandleGetTransaction(engine::MultiSigService& service, const MultiSigMessage* request)
    {
        if (!request || !request->has_get_transaction_request()) {
            MSIG_LOG_ERROR("TransactionHandlers", "[GetTransaction] Invalid request");
            return nullptr;
        }

        const GetTransactionRequest& req = request->get_transaction_request();

        TransactionResponse* response = nullptr;
        auto message = NewTransactionResponse(MultiSigMessageType::GET_TRANSACTION, req.header(), response);

        RunHandler("TransactionHandlers", response->mutable_header(), [&]() {
            ToProto(service.GetTransaction(req.transaction_id()), response->mutable_transaction());
        });

        return message;
    }

    std::unique_ptr<MultiSigMessage> HandleListPending(engine::MultiSigService& service, const MultiSigMessage* request)
    {
        if (!request || !request->has_list_pending_request()) {
            MSIG_LOG_ERROR("TransactionHandlers", "[ListPending] Invalid request");
            return nullptr;
        }

        const ListPendingRequest& req = request->list_pending_request();

        auto message = std::make_unique<MultiSigMessage>();
        message->set_message_type(static_cast<uint32_t>(MultiSigMessageType::LIST_PENDING));
        auto* response = message->mutable_list_pending_response();
        InitResponseHeader(req.header(), message->message_type(), response->mutable_header());

        RunHandler("TransactionHandlers", response->mutable_header(), [&]() {
            for (const auto& tx : service.ListPending(req.wallet_id())) {
                ToProto(tx, response->add_transactions());
            }
        });

        return message;
    }

    std::unique_ptr<MultiSigMessage> HandleGetSigningPayload(engine::MultiSigService& service, const MultiSigMessage* request)
    {
        if (!request || !request->has_get_signing_payload_request()) {
            MSIG_LOG_ERROR("TransactionHandlers", "[GetSigningPayload] Invalid request");
            return nullptr;
        }

        const GetSigningPayloadRequest& req = request->get_signing_payload_request();

        auto message = std::make_unique<MultiSigMessage>();
        message->set_message_type(static_cast<uint32_t>(MultiSigMessageType::GET_SIGNING_PAYLOAD));
        auto* response = message->mutable_get_signing_payload_response();
        InitResponseHeader(req.header(), message->message_type(), response->mutable_header());

        RunHandler("TransactionHandlers", response->mutable_header(), [&]() {
            engine::SafeTransaction tx = service.GetSigningPayload(req.transaction_id());

            response->set_safe_tx_hash(crypto::ToHex(tx.safe_tx_hash, true));
            response->set_typed_data_json(engine::SafeTransactionBuilder::ToTypedDataJson(tx));
            response->set_nonce(engine::ToDecimalString(tx.nonce));
            response->set_chain_id(tx.chain_id);
        });

        return message;
    }

} // namespace multisig_engine::coordinator::handlers
