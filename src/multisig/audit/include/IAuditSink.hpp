// src/multisig/audit/include/IAuditSink.hpp
#pragma once
#include <map>
#include <string>

namespace multisig_engine::multisig
{
    using AuditMetadata = std::map<std::string, std::string>;

    namespace audit_event
    {
        constexpr const char* WALLET_CREATED = "wallet_created";
        constexpr const char* WALLET_DEPLOYED = "wallet_deployed";
        constexpr const char* SIGNER_ADDED = "signer_added";
        constexpr const char* SIGNER_REMOVED = "signer_removed";
        constexpr const char* TRANSACTION_PROPOSED = "transaction_proposed";
        constexpr const char* TRANSACTION_SIGNED = "transaction_signed";
        constexpr const char* TRANSACTION_EXECUTED = "transaction_executed";
        constexpr const char* TRANSACTION_EXECUTION_FAILED = "transaction_execution_failed";
        constexpr const char* TRANSACTION_CANCELLED = "transaction_cancelled";
        constexpr const char* TRANSACTION_EXPIRED = "transaction_expired";
    }

    /**
     * @brief 감사 이벤트 수신자
     *
     * best-effort 전달. 구현체가 예외를 던져도 호출자(서비스)는 로그만 남기고 본 작업을 계속합니다.
     */
    class IAuditSink
    {
    public:
        virtual ~IAuditSink() = default;

        virtual void Record(
            const std::string& event_kind,
            const std::string& actor,
            const std::string& resource_id,
            const AuditMetadata& metadata
        ) = 0;
    };
}
