// src/types/MultiSigMessageType.hpp
#pragma once
#include <cstdint>

namespace multisig_engine
{
    /**
     * @brief 멀티시그 서비스 프로토콜 타입 (MultiSigMessage.message_type)
     */
    enum class MultiSigMessageType : uint32_t
    {
        CREATE_WALLET = 1,
        GET_WALLET,
        ADD_SIGNER,
        REMOVE_SIGNER,
        DEPLOY_WALLET,
        PROPOSE_TRANSACTION,
        SIGN_TRANSACTION,
        RETRY_EXECUTION,
        CANCEL_TRANSACTION,
        GET_TRANSACTION,
        LIST_PENDING,
        GET_SIGNING_PAYLOAD,
        MAX_MESSAGE_TYPE  // 항상 마지막
    };

    inline const char* MultiSigMessageTypeToString(MultiSigMessageType type)
    {
        switch (type) {
            case MultiSigMessageType::CREATE_WALLET: return "CREATE_WALLET";
            case MultiSigMessageType::GET_WALLET: return "GET_WALLET";
            case MultiSigMessageType::ADD_SIGNER: return "ADD_SIGNER";
            case MultiSigMessageType::REMOVE_SIGNER: return "REMOVE_SIGNER";
            case MultiSigMessageType::DEPLOY_WALLET: return "DEPLOY_WALLET";
            case MultiSigMessageType::PROPOSE_TRANSACTION: return "PROPOSE_TRANSACTION";
            case MultiSigMessageType::SIGN_TRANSACTION: return "SIGN_TRANSACTION";
            case MultiSigMessageType::RETRY_EXECUTION: return "RETRY_EXECUTION";
            case MultiSigMessageType::CANCEL_TRANSACTION: return "CANCEL_TRANSACTION";
            case MultiSigMessageType::GET_TRANSACTION: return "GET_TRANSACTION";
            case MultiSigMessageType::LIST_PENDING: return "LIST_PENDING";
            case MultiSigMessageType::GET_SIGNING_PAYLOAD: return "GET_SIGNING_PAYLOAD";
            default: return "UNKNOWN";
        }
    }
}
