// src/multisig/execution/include/ChainRegistry.hpp
#pragma once
#include "multisig/execution/include/IExecutionAdapter.hpp"
#include "multisig/execution/include/ChainConfig.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace multisig_engine::multisig
{
    /**
     * @brief 체인 이름 → 실행 어댑터
     *
     * 구성 단계(main)에서만 등록하고 이후에는 읽기 전용으로 사용합니다.
     */
    class ChainRegistry
    {
    public:
        ChainRegistry() = default;
        ~ChainRegistry() = default;

        ChainRegistry(const ChainRegistry&) = delete;
        ChainRegistry& operator=(const ChainRegistry&) = delete;

        /**
         * @brief OnChainSettings로부터 JSON-RPC 기반 Safe 어댑터 등록
         * @throws std::invalid_argument RPC URL 형식 오류
         */
        static std::unique_ptr<ChainRegistry> FromSettings(const OnChainSettings& settings);

        void SetOnChainEnabled(bool enabled) { onchain_enabled = enabled; }
        bool IsOnChainEnabled() const { return onchain_enabled; }

        /**
         * @brief 체인 이름은 대소문자 무시
         */
        void Register(const std::string& chain, std::shared_ptr<IExecutionAdapter> adapter);

        bool IsOnChainEnabled(const std::string& chain) const;

        /**
         * @throws OnChainUnsupportedException 온체인 비활성 또는 어댑터 미등록 체인
         */
        IExecutionAdapter& Adapter(const std::string& chain) const;

        std::vector<std::string> RegisteredChains() const;

    private:
        static std::string NormalizeChain(const std::string& chain);

        bool onchain_enabled = false;
        std::map<std::string, std::shared_ptr<IExecutionAdapter>> adapters;
    };
}
