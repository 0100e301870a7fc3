// src/multisig/chain/include/JsonRpcChainClient.hpp
#pragma once
#include "multisig/chain/include/IChainClient.hpp"
#include "common/types/BasicTypes.hpp"
#include <boost/asio/ssl.hpp>
#include <nlohmann/json.hpp>
#include <atomic>
#include <mutex>
#include <string>

namespace multisig_engine::multisig
{
    /**
     * @brief JSON-RPC 클라이언트 설정
     */
    struct ChainRpcConfig
    {
        std::string rpc_url;                                // http:// 또는 https://
        uint32_t timeout_ms = DEFAULT_RPC_TIMEOUT_MS;       // 요청 1건 제한 시간
        uint32_t poll_interval_ms = 1000;                   // receipt 폴링 간격
    };

    struct RpcEndpoint
    {
        bool tls = false;
        std::string host;
        std::string port;
        std::string target = "/";
    };

    /**
     * @brief EVM JSON-RPC 체인 클라이언트 (Boost.Beast 동기 HTTP/HTTPS)
     *
     * 요청마다 연결을 새로 맺습니다. 트랜잭션은 노드가 관리하는 relayer 계정으로
     * eth_sendTransaction 제출하며, 이 엔진은 개인키를 다루지 않습니다.
     */
    class JsonRpcChainClient : public IChainClient
    {
    public:
        explicit JsonRpcChainClient(const ChainRpcConfig& config);
        ~JsonRpcChainClient() override = default;

        uint64_t ChainId() override;
        Bytes Call(const ChainCall& call) override;
        uint64_t EstimateGas(const ChainCall& call) override;
        std::string Submit(const ChainCall& call) override;
        ChainReceipt WaitForReceipt(const std::string& tx_hash, uint32_t timeout_ms) override;

        /**
         * @brief JSON-RPC 호출
         * @return result 필드
         * @throws ChainRpcException error 응답 또는 전송 실패
         */
        nlohmann::json Request(const std::string& method, const nlohmann::json& params);

        /**
         * @brief JSON-RPC 응답 본문 해석
         * @return result 필드
         * @throws ChainRpcException 파싱 실패, error 응답(형식 무관), result 누락
         */
        static nlohmann::json ParseResponse(const std::string& method, const std::string& raw);

        static bool ParseUrl(const std::string& url, RpcEndpoint& out);
        static nlohmann::json CallToJson(const ChainCall& call);

        /**
         * @brief eth_getTransactionReceipt 결과 파싱
         * @throws ChainRpcException 필드 형식 오류
         */
        static ChainReceipt ParseReceipt(const nlohmann::json& receipt);

    private:
        std::string Post(const std::string& body);

        ChainRpcConfig config;
        RpcEndpoint endpoint;
        boost::asio::ssl::context ssl_ctx;
        std::atomic<uint64_t> next_request_id{1};

        std::mutex chain_id_mutex;
        uint64_t cached_chain_id = 0;
    };
}
