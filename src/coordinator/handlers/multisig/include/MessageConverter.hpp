// src/coordinator/handlers/multisig/include/MessageConverter.hpp
#pragma once
#include "proto/multisig_coordinator/generated/multisig_message.pb.h"
#include "multisig/errors/include/MultiSigException.hpp"
#include "multisig/model/include/MultiSigTypes.hpp"
#include "common/utils/logger/Logger.hpp"
#include <string>

namespace multisig_engine::coordinator::handlers
{
    using namespace multisig_engine::proto::multisig_coordinator;
    namespace engine = ::multisig_engine::multisig;

    void ToProto(const engine::MultiSigWallet& wallet, WalletInfo* out);
    void ToProto(const engine::Signer& signer, SignerInfo* out);
    void ToProto(const engine::PendingTransaction& tx, TransactionInfo* out);
    void ToProto(const engine::WalletDetails& details, WalletResponse* out);

    engine::SignerInput FromProto(const SignerInfo& signer);

    /**
     * @brief 요청 헤더 정보를 응답 헤더에 복사 (message_type, request_id, timestamp)
     */
    void InitResponseHeader(const RequestHeader& request, uint32_t message_type, ResponseHeader* out);

    void SetError(ResponseHeader* header, engine::MultiSigErrorCode code, const std::string& message);

    /**
     * @brief 핸들러 본문 실행 + 예외 → 응답 헤더 변환
     *
     * MultiSigException은 error_code로, 그 외 std::exception은 INTERNAL_ERROR로 기록합니다.
     */
    template <typename Body>
    void RunHandler(const char* handler_name, ResponseHeader* header, Body&& body)
    {
        try {
            body();
            header->set_success(true);
            header->set_error_code(static_cast<int32_t>(engine::MultiSigErrorCode::NONE));
        } catch (const engine::MultiSigException& e) {
            SetError(header, e.code(), e.what());
            MSIG_LOG_WARNF(handler_name, "[%s] %s", engine::MultiSigErrorCodeToString(e.code()), e.what());
        } catch (const std::exception& e) {
            SetError(header, engine::MultiSigErrorCode::INTERNAL_ERROR, e.what());
            MSIG_LOG_ERRORF(handler_name, "Unexpected error: %s", e.what());
        }
    }
}
