// src/multisig/service/include/MultiSigSettings.hpp
#pragma once
#include "common/env/EnvConfig.hpp"
#include "common/types/BasicTypes.hpp"
#include <cstdint>
#include <string>

namespace multisig_engine::multisig
{
    struct MultiSigSettings
    {
        uint32_t proposal_ttl_hours = DEFAULT_PROPOSAL_TTL_HOURS;
        std::string store_type = "memory";
        std::string store_path = ".multisig";
    };

    /**
     * @brief MULTISIG_PROPOSAL_TTL_HOURS / MULTISIG_STORE_TYPE / MULTISIG_STORE_PATH (모두 선택)
     * @throws env::ConfigFormatException TTL이 0인 경우
     */
    inline MultiSigSettings LoadMultiSigSettings(const env::EnvConfig& config)
    {
        MultiSigSettings settings;
        if (config.HasKey("MULTISIG_PROPOSAL_TTL_HOURS")) {
            settings.proposal_ttl_hours = config.GetUInt32("MULTISIG_PROPOSAL_TTL_HOURS");
            if (settings.proposal_ttl_hours == 0) {
                throw env::ConfigFormatException("MULTISIG_PROPOSAL_TTL_HOURS", "0");
            }
        }
        if (config.HasKey("MULTISIG_STORE_TYPE")) {
            settings.store_type = config.GetString("MULTISIG_STORE_TYPE");
        }
        if (config.HasKey("MULTISIG_STORE_PATH")) {
            settings.store_path = config.GetString("MULTISIG_STORE_PATH");
        }
        return settings;
    }
}
