// src/multisig/audit/src/LogAuditSink.cpp
#include "multisig/audit/include/LogAuditSink.hpp"
#include "common/utils/logger/Logger.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace multisig_engine::multisig
{
    std::string LogAuditSink::Format(
        const std::string& event_kind,
        const std::string& actor,
        const std::string& resource_id,
        const AuditMetadata& metadata)
    {
        json j;
        j["event"] = event_kind;
        j["actor"] = actor;
        j["resourceId"] = resource_id;
        j["metadata"] = metadata;
        return j.dump();
    }

    void LogAuditSink::Record(
        const std::string& event_kind,
        const std::string& actor,
        const std::string& resource_id,
        const AuditMetadata& metadata)
    {
        std::string line = Format(event_kind, actor, resource_id, metadata);
        MSIG_LOG_INFO("Audit", line.c_str());
    }
}
