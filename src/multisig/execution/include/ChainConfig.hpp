// src/multisig/execution/include/ChainConfig.hpp
#pragma once
#include "common/env/EnvConfig.hpp"
#include "common/types/BasicTypes.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace multisig_engine::multisig
{
    // Safe v1.3.0 canonical 배포 주소
    constexpr const char* DEFAULT_SAFE_SINGLETON = "0xd9db270c1b5e3bd161e8c8503c55ceabee709552";
    constexpr const char* DEFAULT_SAFE_PROXY_FACTORY = "0xa6b71e26c5e0845f74c812102ca7114b6a896ab2";
    constexpr uint64_t DEFAULT_EXECUTION_GAS_LIMIT = 300000;

    struct SafeChainConfig
    {
        std::string chain;                  // 소문자 체인 이름
        uint64_t chain_id = 0;
        std::string rpc_url;
        std::string relayer_address;        // 가스 지불 계정 (노드 관리)
        std::string factory_address;
        std::string singleton_address;
        std::string fallback_handler;
        uint64_t gas_limit = DEFAULT_EXECUTION_GAS_LIMIT;
        uint32_t rpc_timeout_ms = DEFAULT_RPC_TIMEOUT_MS;
        uint32_t confirmation_timeout_ms = DEFAULT_CONFIRMATION_TIMEOUT_MS;
    };

    struct OnChainSettings
    {
        bool enabled = false;
        std::vector<SafeChainConfig> chains;
    };

    /**
     * @brief 온체인 실행 설정 로드
     *
     * MULTISIG_ONCHAIN_ENABLED가 true일 때만 MULTISIG_CHAINS의 각 체인을 읽습니다.
     * 주소 키 조회 순서: <CHAIN>_MULTISIG_* → MULTISIG_* → 기본값
     *
     * @throws env::ConfigMissingException <CHAIN>_RPC_URL / <CHAIN>_RELAYER_ADDRESS 누락
     * @throws env::ConfigFormatException 주소/체인 형식 오류
     */
    OnChainSettings LoadOnChainSettings(const env::EnvConfig& config);

    SafeChainConfig LoadSafeChainConfig(const env::EnvConfig& config, const std::string& chain);
}
