// src/common/types/BasicTypes.hpp
#pragma once
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <string>

namespace multisig_engine
{
    constexpr uint32_t MAX_MESSAGE_SIZE = 1024 * 1024;           // 요청 본문 상한
    constexpr uint32_t DEFAULT_RPC_TIMEOUT_MS = 10000;
    constexpr uint32_t DEFAULT_CONFIRMATION_TIMEOUT_MS = 120000;
    constexpr uint32_t DEFAULT_PROPOSAL_TTL_HOURS = 24 * 7;

    enum class ChainType
    {
        ETHEREUM = 0,
        POLYGON,
        ARBITRUM,
        OPTIMISM,
        CELO,
        UNKNOWN = 99
    };

    inline ChainType ChainTypeFromString(const std::string& str) {
        std::string lower = str;
        std::transform(lower.begin(), lower.end(), lower.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (lower == "ethereum" || lower == "eth") return ChainType::ETHEREUM;
        if (lower == "polygon" || lower == "matic") return ChainType::POLYGON;
        if (lower == "arbitrum") return ChainType::ARBITRUM;
        if (lower == "optimism") return ChainType::OPTIMISM;
        if (lower == "celo") return ChainType::CELO;
        return ChainType::UNKNOWN;
    }

    // EIP-155 체인 ID (UNKNOWN → 0)
    inline uint64_t ChainIdOf(ChainType type) {
        switch (type) {
            case ChainType::ETHEREUM: return 1;
            case ChainType::POLYGON: return 137;
            case ChainType::ARBITRUM: return 42161;
            case ChainType::OPTIMISM: return 10;
            case ChainType::CELO: return 42220;
            default: return 0;
        }
    }

    // 설정 키 접두어 (ETHEREUM_RPC_URL 등)
    inline std::string ChainConfigPrefix(const std::string& chain) {
        std::string upper = chain;
        std::transform(upper.begin(), upper.end(), upper.begin(),
            [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return upper;
    }
}
