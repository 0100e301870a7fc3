// src/multisig/chain/include/IChainClient.hpp
#pragma once
#include "multisig/abi/include/AbiEncoder.hpp"
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace multisig_engine::multisig
{
    /**
     * @brief 체인 RPC 전송/응답 오류
     *
     * rpc_code: JSON-RPC error.code (전송 계층 오류는 0)
     */
    class ChainRpcException : public std::runtime_error
    {
    public:
        explicit ChainRpcException(const std::string& msg, int code = 0)
            : std::runtime_error("Chain RPC error: " + msg), rpc_code(code) {}

        int code() const { return rpc_code; }

    private:
        int rpc_code;
    };

    class ChainTimeoutException : public ChainRpcException
    {
    public:
        explicit ChainTimeoutException(const std::string& msg)
            : ChainRpcException("timeout: " + msg) {}
    };

    struct ChainCall
    {
        std::string from;           // 비어 있으면 생략 (eth_call)
        std::string to;
        Bytes data;
        uint256_t value = 0;
        uint64_t gas_limit = 0;     // 0이면 생략
    };

    struct ChainLog
    {
        std::string address;
        std::vector<Hash256> topics;
        Bytes data;
    };

    struct ChainReceipt
    {
        std::string tx_hash;
        bool success = false;       // status == 0x1
        uint64_t block_number = 0;
        uint64_t gas_used = 0;
        std::vector<ChainLog> logs;
    };

    /**
     * @brief 체인 기능 객체 (체인당 하나)
     *
     * 모든 호출은 blocking + 제한 시간. 실패 시 ChainRpcException / ChainTimeoutException
     */
    class IChainClient
    {
    public:
        virtual ~IChainClient() = default;

        virtual uint64_t ChainId() = 0;

        // 읽기 전용 호출 (eth_call)
        virtual Bytes Call(const ChainCall& call) = 0;

        virtual uint64_t EstimateGas(const ChainCall& call) = 0;

        /**
         * @brief 트랜잭션 제출
         * @return 트랜잭션 해시 (0x...)
         */
        virtual std::string Submit(const ChainCall& call) = 0;

        /**
         * @brief 1 confirmation 대기
         * @throws ChainTimeoutException timeout_ms 내에 receipt가 없는 경우
         */
        virtual ChainReceipt WaitForReceipt(const std::string& tx_hash, uint32_t timeout_ms) = 0;
    };
}
