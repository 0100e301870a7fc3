// src/multisig/execution/include/IExecutionAdapter.hpp
#pragma once
#include "multisig/typed/include/SafeTransactionBuilder.hpp"
#include <string>
#include <vector>

namespace multisig_engine::multisig
{
    struct DeploymentResult
    {
        std::string address;    // 체크섬 형식 프록시 주소
        std::string tx_hash;
    };

    /**
     * @brief 체인별 온체인 실행 어댑터
     *
     * 구현체는 체인 RPC 오류를 그대로 던지지 않고 DeploymentFailedException /
     * ExecutionFailedException 으로 변환합니다.
     */
    class IExecutionAdapter
    {
    public:
        virtual ~IExecutionAdapter() = default;

        virtual std::string ChainName() const = 0;
        virtual uint64_t ChainId() const = 0;

        /**
         * @brief 지갑 컨트랙트 배포 (1 confirmation 대기)
         * @param owners 정규화된 서명자 주소
         * @throws DeploymentFailedException RPC 오류, timeout, revert, 생성 로그 없음
         */
        virtual DeploymentResult Deploy(const std::vector<std::string>& owners, uint32_t threshold) = 0;

        /**
         * @brief 지갑 컨트랙트의 현재 nonce
         * @throws ExecutionFailedException
         */
        virtual uint256_t GetNonce(const std::string& wallet_address) = 0;

        /**
         * @brief 서명 묶음으로 트랜잭션 실행 (1 confirmation 대기)
         * @return 실행 트랜잭션 해시
         * @throws ExecutionFailedException
         */
        virtual std::string Execute(
            const std::string& wallet_address,
            const SafeTransaction& tx,
            const Bytes& packed_signatures
        ) = 0;
    };
}
