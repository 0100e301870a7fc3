// src/multisig/execution/include/SafeExecutionAdapter.hpp
#pragma once
#include "multisig/execution/include/IExecutionAdapter.hpp"
#include "multisig/execution/include/ChainConfig.hpp"
#include "multisig/chain/include/IChainClient.hpp"
#include "multisig/errors/include/MultiSigException.hpp"
#include <memory>

namespace multisig_engine::multisig
{
    /**
     * @brief Safe(Gnosis Safe) 컨트랙트 실행 어댑터
     *
     * 배포: ProxyFactory.createProxyWithNonce(singleton, setup(...), salt)
     * 실행: Safe.execTransaction(..., signatures)
     * 모든 트랜잭션은 relayer 계정으로 제출합니다.
     */
    class SafeExecutionAdapter : public IExecutionAdapter
    {
    public:
        static constexpr const char* SETUP_SIGNATURE =
            "setup(address[],uint256,address,bytes,address,address,uint256,address)";
        static constexpr const char* CREATE_PROXY_SIGNATURE =
            "createProxyWithNonce(address,bytes,uint256)";
        static constexpr const char* EXEC_TRANSACTION_SIGNATURE =
            "execTransaction(address,uint256,bytes,uint8,uint256,uint256,uint256,address,address,bytes)";
        static constexpr const char* NONCE_SIGNATURE = "nonce()";
        static constexpr const char* PROXY_CREATION_EVENT = "ProxyCreation(address,address)";

        SafeExecutionAdapter(const SafeChainConfig& config, std::shared_ptr<IChainClient> client);
        ~SafeExecutionAdapter() override = default;

        std::string ChainName() const override { return config.chain; }
        uint64_t ChainId() const override { return config.chain_id; }

        DeploymentResult Deploy(const std::vector<std::string>& owners, uint32_t threshold) override;
        uint256_t GetNonce(const std::string& wallet_address) override;
        std::string Execute(
            const std::string& wallet_address,
            const SafeTransaction& tx,
            const Bytes& packed_signatures
        ) override;

        const SafeChainConfig& GetConfig() const { return config; }

        Bytes EncodeSetup(const std::vector<std::string>& owners, uint32_t threshold) const;
        static Bytes EncodeExecTransaction(const SafeTransaction& tx, const Bytes& packed_signatures);

        /**
         * @brief 팩토리 ProxyCreation 로그에서 프록시 주소 추출
         *
         * indexed 레이아웃(topics[1])과 non-indexed 레이아웃(data word 0)을 모두 지원
         * @return 로그가 없으면 false
         */
        static bool FindProxyAddress(const ChainReceipt& receipt, const std::string& factory_address,
                                     std::string& proxy_address);

        // RPC 오류 → 실행 실패 원인
        static ExecutionFailureReason ClassifyRpcError(const ChainRpcException& e);

    private:
        uint64_t GasWithMargin(uint64_t estimate) const;

        SafeChainConfig config;
        std::shared_ptr<IChainClient> client;
    };
}
