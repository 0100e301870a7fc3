// src/coordinator/handlers/multisig/include/WalletHandlers.hpp
#pragma once
#include "coordinator/handlers/multisig/include/MessageConverter.hpp"
#include "multisig/service/include/MultiSigService.hpp"
#include <memory>

namespace multisig_engine::coordinator::handlers
{
    // 요청 payload가 없으면 nullptr (세션이 400으로 응답)
    std::unique_ptr<MultiSigMessage> HandleCreateWallet(engine::MultiSigService& service, const MultiSigMessage* request);
    std::unique_ptr<MultiSigMessage> HandleGetWallet(engine::MultiSigService& service, const MultiSigMessage* request);
    std::unique_ptr<MultiSigMessage> HandleAddSigner(engine::MultiSigService& service, const MultiSigMessage* request);
    std::unique_ptr<MultiSigMessage> HandleRemoveSigner(engine::MultiSigService& service, const MultiSigMessage* request);
    std::unique_ptr<MultiSigMessage> HandleDeployWallet(engine::MultiSigService& service, const MultiSigMessage* request);

} // namespace multisig_engine::coordinator::handlers
