// src/coordinator/network/multisig_server/src/MultiSigHttpsServer.cpp
#include "coordinator/network/multisig_server/include/MultiSigHttpsServer.hpp"
#include "coordinator/handlers/multisig/include/MultiSigMessageRouter.hpp"
#include "common/utils/logger/Logger.hpp"
#include <stdexcept>

namespace multisig_engine::coordinator::network::multisig_server
{
    using handlers::MultiSigMessageRouter;

    HttpsServerConfig LoadHttpsServerConfig(const env::EnvConfig& config)
    {
        HttpsServerConfig server_config;

        if (config.HasKey("MULTISIG_HTTPS_BIND")) {
            server_config.bind_address = config.GetString("MULTISIG_HTTPS_BIND");
        }
        if (config.HasKey("MULTISIG_HTTPS_PORT")) {
            server_config.bind_port = config.GetUInt16("MULTISIG_HTTPS_PORT");
        }
        if (config.HasKey("MULTISIG_HANDLER_THREADS")) {
            server_config.handler_threads = config.GetUInt32("MULTISIG_HANDLER_THREADS");
        }
        if (config.HasKey("MULTISIG_IO_THREADS")) {
            server_config.io_threads = config.GetUInt32("MULTISIG_IO_THREADS");
        }
        if (config.HasKey("MULTISIG_MAX_CONNECTIONS")) {
            server_config.max_connections = config.GetUInt32("MULTISIG_MAX_CONNECTIONS");
        }

        std::string cert_path = config.GetString("TLS_CERT_PATH");
        server_config.tls_ca_file = cert_path + config.GetString("TLS_CERT_CA");
        server_config.tls_cert_file = cert_path + config.GetString("TLS_CERT_SERVER");
        server_config.tls_key_file = cert_path + config.GetString("TLS_KEY_SERVER");

        return server_config;
    }

    MultiSigHttpsServer::MultiSigHttpsServer(const HttpsServerConfig& cfg, MultiSigMessageRouter& router)
        : config_(cfg)
        , router_(router)
    {
        if (config_.handler_threads == 0) {
            throw std::invalid_argument("handler_threads must be at least 1");
        }

        if (config_.max_connections == 0) {
            throw std::invalid_argument("max_connections must be at least 1");
        }
    }

    MultiSigHttpsServer::~MultiSigHttpsServer()
    {
        Stop();
    }

    bool MultiSigHttpsServer::Initialize()
    {
        if (initialized_.load()) {
            return true;
        }

        MSIG_LOG_INFO("MultiSigHttpsServer", "Initializing...");

        if (!router_.Initialize()) {
            MSIG_LOG_ERROR("MultiSigHttpsServer", "Failed to initialize MultiSigMessageRouter");
            return false;
        }

        if (!InitializeTlsContext()) {
            MSIG_LOG_ERROR("MultiSigHttpsServer", "Failed to initialize TLS context");
            return false;
        }

        if (!InitializeThreadPool()) {
            MSIG_LOG_ERROR("MultiSigHttpsServer", "Failed to initialize ThreadPool");
            return false;
        }

        try {
            tcp::endpoint endpoint(asio::ip::make_address(config_.bind_address), config_.bind_port);

            acceptor_ = std::make_unique<tcp::acceptor>(io_context_);
            acceptor_->open(endpoint.protocol());
            acceptor_->set_option(asio::socket_base::reuse_address(true));
            acceptor_->bind(endpoint);
            acceptor_->listen(asio::socket_base::max_listen_connections);

            MSIG_LOG_INFOF("MultiSigHttpsServer", "Listening on %s:%u", config_.bind_address.c_str(), config_.bind_port);
        } catch (const std::exception& e) {
            MSIG_LOG_ERRORF("MultiSigHttpsServer", "Failed to create acceptor: %s", e.what());
            return false;
        }

        initialized_ = true;
        return true;
    }

    bool MultiSigHttpsServer::Start()
    {
        if (!initialized_.load()) {
            MSIG_LOG_ERROR("MultiSigHttpsServer", "Not initialized");
            return false;
        }

        if (running_.exchange(true)) {
            return true;
        }

        DoAccept();

        size_t num_io_threads = config_.io_threads;
        if (num_io_threads == 0) {
            num_io_threads = std::thread::hardware_concurrency();
            if (num_io_threads == 0) {
                num_io_threads = 4;
            }
        }

        MSIG_LOG_INFOF("MultiSigHttpsServer", "Starting %zu I/O threads, %zu handler threads",
            num_io_threads, config_.handler_threads);

        io_threads_.reserve(num_io_threads);
        for (size_t i = 0; i < num_io_threads; ++i) {
            io_threads_.emplace_back([this, i]() {
                try {
                    io_context_.run();
                } catch (const std::exception& e) {
                    MSIG_LOG_ERRORF("MultiSigHttpsServer", "I/O thread %zu exception: %s", i, e.what());
                }
            });
        }

        return true;
    }

    void MultiSigHttpsServer::Stop()
    {
        if (!running_.exchange(false)) {
            return;
        }

        MSIG_LOG_INFO("MultiSigHttpsServer", "Stopping...");

        if (acceptor_ && acceptor_->is_open()) {
            boost::system::error_code ec;
            // NOLINTNEXTLINE(bugprone-unused-return-value)
            acceptor_->close(ec);
            if (ec) {
                MSIG_LOG_WARNF("MultiSigHttpsServer", "Acceptor close error: %s", ec.message().c_str());
            }
        }

        // 진행 중인 핸들러를 먼저 끝낸 뒤 I/O 중지
        if (handler_pool_) {
            handler_pool_->Shutdown();
        }

        io_context_.stop();

        for (auto& thread : io_threads_) {
            if (thread.joinable()) {
                thread.join();
            }
        }
        io_threads_.clear();

        MSIG_LOG_INFO("MultiSigHttpsServer", "Stopped");
    }

    void MultiSigHttpsServer::DoAccept()
    {
        // 세션마다 strand 부여
        acceptor_->async_accept(
            asio::make_strand(io_context_),
            [this](boost::system::error_code ec, tcp::socket socket) {
                if (ec) {
                    if (ec != asio::error::operation_aborted) {
                        MSIG_LOG_ERRORF("MultiSigHttpsServer", "Accept error: %s", ec.message().c_str());
                    }
                } else if (active_sessions_.load() >= config_.max_connections) {
                    MSIG_LOG_WARNF("MultiSigHttpsServer", "Connection limit reached (%zu), rejecting", config_.max_connections);
                    boost::system::error_code close_ec;
                    // NOLINTNEXTLINE(bugprone-unused-return-value)
                    socket.close(close_ec);
                } else {
                    SessionLimits limits;
                    limits.max_requests = config_.max_requests_per_connection;
                    limits.keep_alive_timeout = std::chrono::seconds(config_.keep_alive_timeout_sec);
                    limits.max_body_bytes = config_.max_body_bytes;

                    auto session = std::make_shared<HttpsSession>(
                        std::move(socket),
                        *ssl_context_,
                        *handler_pool_,
                        router_,
                        limits,
                        active_sessions_
                    );
                    session->Start();
                }

                if (running_.load()) {
                    DoAccept();
                }
            }
        );
    }

    bool MultiSigHttpsServer::InitializeTlsContext()
    {
        try {
            ssl_context_ = std::make_unique<ssl::context>(ssl::context::tlsv12_server);

            ssl_context_->set_options(
                ssl::context::default_workarounds |
                ssl::context::no_sslv2 |
                ssl::context::no_sslv3 |
                ssl::context::no_tlsv1 |
                ssl::context::no_tlsv1_1 |
                ssl::context::single_dh_use
            );

            // mTLS: 클라이언트 인증서 필수
            ssl_context_->set_verify_mode(
                ssl::verify_peer |
                ssl::verify_fail_if_no_peer_cert |
                ssl::verify_client_once
            );

            MSIG_LOG_INFOF("MultiSigHttpsServer", "Loading CA certificate: %s", config_.tls_ca_file.c_str());
            ssl_context_->load_verify_file(config_.tls_ca_file);

            MSIG_LOG_INFOF("MultiSigHttpsServer", "Loading server certificate: %s", config_.tls_cert_file.c_str());
            ssl_context_->use_certificate_chain_file(config_.tls_cert_file);

            ssl_context_->use_private_key_file(config_.tls_key_file, ssl::context::pem);

            if (SSL_CTX_set_cipher_list(ssl_context_->native_handle(),
                    "ECDHE-ECDSA-AES256-GCM-SHA384:"
                    "ECDHE-RSA-AES256-GCM-SHA384:"
                    "ECDHE-ECDSA-AES128-GCM-SHA256:"
                    "ECDHE-RSA-AES128-GCM-SHA256") != 1) {
                MSIG_LOG_ERROR("MultiSigHttpsServer", "Failed to set cipher list");
                return false;
            }

            MSIG_LOG_INFO("MultiSigHttpsServer", "TLS context initialized with mTLS");
            return true;
        } catch (const std::exception& e) {
            MSIG_LOG_ERRORF("MultiSigHttpsServer", "TLS context initialization failed: %s", e.what());
            return false;
        }
    }

    bool MultiSigHttpsServer::InitializeThreadPool()
    {
        try {
            handler_pool_ = std::make_unique<utils::ThreadPool<MultiSigHandlerContext>>(config_.handler_threads);
            return true;
        } catch (const std::exception& e) {
            MSIG_LOG_ERRORF("MultiSigHttpsServer", "Failed to create ThreadPool: %s", e.what());
            return false;
        }
    }

} // namespace multisig_engine::coordinator::network::multisig_server
