// src/coordinator/handlers/multisig/include/MultiSigMessageRouter.hpp
#pragma once
#include "proto/multisig_coordinator/generated/multisig_message.pb.h"
#include "multisig/service/include/MultiSigService.hpp"
#include "types/MultiSigMessageType.hpp"
#include <array>
#include <functional>
#include <memory>

namespace multisig_engine::coordinator::handlers
{
    using namespace multisig_engine::proto::multisig_coordinator;

    /**
     * @brief message_type → 핸들러 디스패치
     *
     * 잘못된 타입/누락된 payload는 nullptr을 반환하며, 호출자가 400으로 응답합니다.
     */
    class MultiSigMessageRouter
    {
    public:
        using HandlerFunction = std::function<std::unique_ptr<MultiSigMessage>(const MultiSigMessage*)>;

        explicit MultiSigMessageRouter(multisig::MultiSigService& service);

        bool Initialize();
        std::unique_ptr<MultiSigMessage> ProcessMessage(const MultiSigMessage* request);

        MultiSigMessageRouter(const MultiSigMessageRouter&) = delete;
        MultiSigMessageRouter& operator=(const MultiSigMessageRouter&) = delete;

    private:
        void Register(MultiSigMessageType type,
            std::unique_ptr<MultiSigMessage> (*handler)(multisig::MultiSigService&, const MultiSigMessage*));

        multisig::MultiSigService& service;
        std::array<HandlerFunction, static_cast<size_t>(MultiSigMessageType::MAX_MESSAGE_TYPE)> handlers_{};

        bool initialized = false;
    };

} // namespace multisig_engine::coordinator::handlers
