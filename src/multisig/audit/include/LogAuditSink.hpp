// src/multisig/audit/include/LogAuditSink.hpp
#pragma once
#include "multisig/audit/include/IAuditSink.hpp"

namespace multisig_engine::multisig
{
    // 감사 이벤트를 "Audit" 카테고리 INFO 로그 한 줄(JSON)로 기록
    class LogAuditSink : public IAuditSink
    {
    public:
        void Record(
            const std::string& event_kind,
            const std::string& actor,
            const std::string& resource_id,
            const AuditMetadata& metadata
        ) override;

        static std::string Format(
            const std::string& event_kind,
            const std::string& actor,
            const std::string& resource_id,
            const AuditMetadata& metadata
        );
    };
}
