// src/coordinator/network/multisig_server/include/MultiSigHttpsServer.hpp
#pragma once

#include "coordinator/network/multisig_server/include/HttpsSession.hpp"
#include "common/env/EnvConfig.hpp"
#include "common/utils/threading/ThreadPool.hpp"
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace multisig_engine::coordinator::network::multisig_server
{
    namespace asio = boost::asio;

    struct HttpsServerConfig
    {
        std::string bind_address = "0.0.0.0";
        uint16_t bind_port = 9443;
        size_t max_connections = 1000;
        size_t handler_threads = 16;
        size_t io_threads = 0;  // 0 = hardware_concurrency

        int max_requests_per_connection = 1000;
        int keep_alive_timeout_sec = 60;
        size_t max_body_bytes = MAX_MESSAGE_SIZE;

        // mTLS (PEM 파일 경로)
        std::string tls_ca_file;
        std::string tls_cert_file;
        std::string tls_key_file;
    };

    /**
     * @brief MULTISIG_HTTPS_* / TLS_* 키에서 서버 설정 구성
     *
     * TLS_CERT_PATH, TLS_CERT_CA, TLS_CERT_SERVER, TLS_KEY_SERVER는 필수입니다.
     * @throws env::ConfigMissingException
     */
    HttpsServerConfig LoadHttpsServerConfig(const env::EnvConfig& config);

    /**
     * @brief 멀티시그 서비스 HTTPS 서버 (boost.asio)
     *
     * POST /multisig 본문은 직렬화된 MultiSigMessage입니다.
     * 세션 I/O는 io 스레드, 서비스 호출은 핸들러 ThreadPool에서 실행됩니다.
     */
    class MultiSigHttpsServer
    {
    public:
        MultiSigHttpsServer(const HttpsServerConfig& config, handlers::MultiSigMessageRouter& router);
        ~MultiSigHttpsServer();

        MultiSigHttpsServer(const MultiSigHttpsServer&) = delete;
        MultiSigHttpsServer& operator=(const MultiSigHttpsServer&) = delete;

        /**
         * @brief 라우터 / TLS Context / ThreadPool / Acceptor 순서로 초기화
         */
        bool Initialize();

        bool Start();
        void Stop();

        bool IsRunning() const { return running_.load(); }
        bool IsInitialized() const { return initialized_.load(); }
        size_t ActiveSessions() const { return active_sessions_.load(); }

    private:
        void DoAccept();
        bool InitializeTlsContext();
        bool InitializeThreadPool();

        HttpsServerConfig config_;
        handlers::MultiSigMessageRouter& router_;

        asio::io_context io_context_;
        std::unique_ptr<ssl::context> ssl_context_;
        std::unique_ptr<tcp::acceptor> acceptor_;
        std::vector<std::thread> io_threads_;

        std::unique_ptr<utils::ThreadPool<MultiSigHandlerContext>> handler_pool_;

        std::atomic<size_t> active_sessions_{0};
        std::atomic<bool> running_{false};
        std::atomic<bool> initialized_{false};
    };

} // namespace multisig_engine::coordinator::network::multisig_server
