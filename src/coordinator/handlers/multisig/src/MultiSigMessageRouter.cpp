// src/coordinator/handlers/multisig/src/MultiSigMessageRouter.cpp
#include "coordinator/handlers/multisig/include/MultiSigMessageRouter.hpp"
#include "coordinator/handlers/multisig/include/TransactionHandlers.hpp"
#include "coordinator/handlers/multisig/include/WalletHandlers.hpp"
#include "common/utils/logger/Logger.hpp"

namespace multisig_engine::coordinator::handlers
{
    MultiSigMessageRouter::MultiSigMessageRouter(multisig::MultiSigService& service)
        : service(service)
    {
    }

    void MultiSigMessageRouter::Register(MultiSigMessageType type,
        std::unique_ptr<MultiSigMessage> (*handler)(multisig::MultiSigService&, const MultiSigMessage*))
    {
        handlers_[static_cast<size_t>(type)] = [this, handler](const MultiSigMessage* request) {
            return handler(service, request);
        };
    }

    bool MultiSigMessageRouter::Initialize()
    {
        if (initialized) {
            return true;
        }

        MSIG_LOG_INFO("MultiSigMessageRouter", "Initializing...");

        // 지갑
        Register(MultiSigMessageType::CREATE_WALLET, HandleCreateWallet);
        Register(MultiSigMessageType::GET_WALLET, HandleGetWallet);
        Register(MultiSigMessageType::ADD_SIGNER, HandleAddSigner);
        Register(MultiSigMessageType::REMOVE_SIGNER, HandleRemoveSigner);
        Register(MultiSigMessageType::DEPLOY_WALLET, HandleDeployWallet);

        // 트랜잭션
        Register(MultiSigMessageType::PROPOSE_TRANSACTION, HandleProposeTransaction);
        Register(MultiSigMessageType::SIGN_TRANSACTION, HandleSignTransaction);
        Register(MultiSigMessageType::RETRY_EXECUTION, HandleRetryExecution);
        Register(MultiSigMessageType::CANCEL_TRANSACTION, HandleCancelTransaction);
        Register(MultiSigMessageType::GET_TRANSACTION, HandleGetTransaction);
        Register(MultiSigMessageType::LIST_PENDING, HandleListPending);
        Register(MultiSigMessageType::GET_SIGNING_PAYLOAD, HandleGetSigningPayload);

        initialized = true;
        MSIG_LOG_INFO("MultiSigMessageRouter", "Initialized successfully");

        return true;
    }

    std::unique_ptr<MultiSigMessage> MultiSigMessageRouter::ProcessMessage(const MultiSigMessage* request)
    {
        if (!initialized) {
            MSIG_LOG_ERROR("MultiSigMessageRouter", "Not initialized");
            return nullptr;
        }

        if (!request) {
            MSIG_LOG_ERROR("MultiSigMessageRouter", "Invalid request pointer");
            return nullptr;
        }

        uint32_t message_type = request->message_type();
        auto type = static_cast<MultiSigMessageType>(message_type);
        size_t index = static_cast<size_t>(type);

        // 범위 체크 (0은 미사용)
        if (index == 0 || index >= static_cast<size_t>(MultiSigMessageType::MAX_MESSAGE_TYPE)) {
            MSIG_LOG_ERRORF("MultiSigMessageRouter", "Invalid message type: %u", message_type);
            return nullptr;
        }

        if (!handlers_[index]) {
            MSIG_LOG_ERRORF("MultiSigMessageRouter", "No handler for message type: %s", MultiSigMessageTypeToString(type));
            return nullptr;
        }

        MSIG_LOG_DEBUGF("MultiSigMessageRouter", "Processing message type: %s", MultiSigMessageTypeToString(type));

        return handlers_[index](request);
    }

} // namespace multisig_engine::coordinator::handlers
