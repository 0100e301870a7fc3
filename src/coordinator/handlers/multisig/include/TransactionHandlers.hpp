// src/coordinator/handlers/multisig/include/TransactionHandlers.hpp
#pragma once
#include "coordinator/handlers/multisig/include/MessageConverter.hpp"
#include "multisig/service/include/MultiSigService.hpp"
#include <memory>

namespace multisig_engine::coordinator::handlers
{
    std::unique_ptr<MultiSigMessage> HandleProposeTransaction(engine::MultiSigService& service, const MultiSigMessage* request);

    /**
     * @brief 서명 추가
     *
     * 임계치 도달 후 실행이 실패하면 header.success=false(EXECUTION_FAILED)와 함께
     * 서명이 기록된 현재 레코드를 채워 반환합니다.
     */
    std::unique_ptr<MultiSigMessage> HandleSignTransaction(engine::MultiSigService& service, const MultiSigMessage* request);
    std::unique_ptr<MultiSigMessage> HandleRetryExecution(engine::MultiSigService& service, const MultiSigMessage* request);
    std::unique_ptr<MultiSigMessage> HandleCancelTransaction(engine::MultiSigService& service, const MultiSigMessage* request);
    std::unique_ptr<MultiSigMessage> HandleGetTransaction(engine::MultiSigService& service, const MultiSigMessage* request);
    std::unique_ptr<MultiSigMessage> HandleListPending(engine::MultiSigService& service, const MultiSigMessage* request);
    std::unique_ptr<MultiSigMessage> HandleGetSigningPayload(engine::MultiSigService& service, const MultiSigMessage* request);

} // namespace multisig_engine::coordinator::handlers
