// src/coordinator/network/multisig_server/src/HttpsSession.cpp
#include "coordinator/network/multisig_server/include/HttpsSession.hpp"
#include "coordinator/handlers/multisig/include/MultiSigMessageRouter.hpp"
#include "common/utils/logger/Logger.hpp"

namespace multisig_engine::coordinator::network::multisig_server
{
    using handlers::MultiSigMessageRouter;
    using std::chrono::steady_clock;

    HttpsSession::HttpsSession(
        tcp::socket socket,
        ssl::context& ssl_context,
        utils::ThreadPool<MultiSigHandlerContext>& thread_pool,
        MultiSigMessageRouter& router,
        const SessionLimits& limits,
        std::atomic<size_t>& active_sessions
    )
        : stream_(std::move(socket), ssl_context)
        , thread_pool_(thread_pool)
        , router_(router)
        , limits_(limits)
        , active_sessions_(active_sessions)
        , last_activity_(steady_clock::now())
    {
        active_sessions_++;
    }

    HttpsSession::~HttpsSession()
    {
        active_sessions_--;
        MSIG_LOG_DEBUG("HttpsSession", "Session released");
    }

    void HttpsSession::Start()
    {
        // 모든 핸들러는 소켓의 strand에서 실행
        boost::asio::dispatch(stream_.get_executor(), [self = shared_from_this()]() {
            self->DoTlsHandshake();
        });
    }

    void HttpsSession::DoTlsHandshake()
    {
        auto self = shared_from_this();

        beast::get_lowest_layer(stream_).expires_after(std::chrono::seconds(30));

        stream_.async_handshake(
            ssl::stream_base::server,
            [self](beast::error_code ec) {
                if (ec) {
                    MSIG_LOG_WARNF("HttpsSession", "TLS handshake failed: %s", ec.message().c_str());
                    return;
                }
                MSIG_LOG_DEBUG("HttpsSession", "TLS handshake success");
                self->DoRead();
            }
        );
    }

    void HttpsSession::DoRead()
    {
        if (closing_.load()) {
            return;
        }

        parser_ = std::make_unique<http::request_parser<http::string_body>>();
        parser_->body_limit(limits_.max_body_bytes);

        beast::get_lowest_layer(stream_).expires_after(limits_.keep_alive_timeout);

        http::async_read(
            stream_,
            buffer_,
            *parser_,
            [self = shared_from_this()](beast::error_code ec, std::size_t bytes) {
                self->OnRead(ec, bytes);
            }
        );
    }

    void HttpsSession::OnRead(beast::error_code ec, std::size_t bytes_transferred)
    {
        (void)bytes_transferred;

        if (ec == http::error::end_of_stream) {
            MSIG_LOG_DEBUG("HttpsSession", "Client closed connection");
            DoClose();
            return;
        }

        if (ec == beast::error::timeout) {
            MSIG_LOG_DEBUG("HttpsSession", "Idle timeout");
            DoClose();
            return;
        }

        if (ec == http::error::body_limit) {
            MSIG_LOG_WARNF("HttpsSession", "Request body exceeds %zu bytes", limits_.max_body_bytes);
            EnqueueImmediate(http::status::payload_too_large, false);
            return;
        }

        if (ec) {
            MSIG_LOG_ERRORF("HttpsSession", "Read error: %s", ec.message().c_str());
            DoClose();
            return;
        }

        last_activity_ = steady_clock::now();
        requests_handled_++;

        http::request<http::string_body> request = parser_->release();
        bool keep_alive = request.keep_alive();

        MSIG_LOG_DEBUGF("HttpsSession", "Received request: %.*s %.*s (%zu bytes)",
            static_cast<int>(request.method_string().size()), request.method_string().data(),
            static_cast<int>(request.target().size()), request.target().data(),
            request.body().size());

        if (request.target() != MULTISIG_TARGET) {
            EnqueueImmediate(http::status::not_found, keep_alive);
        } else if (request.method() != http::verb::post) {
            EnqueueImmediate(http::status::method_not_allowed, keep_alive);
        } else {
            auto message = std::make_unique<MultiSigMessage>();
            if (!message->ParseFromString(request.body())) {
                MSIG_LOG_WARN("HttpsSession", "Proto parse failed");
                EnqueueImmediate(http::status::bad_request, keep_alive);
            } else {
                auto context = std::make_unique<MultiSigHandlerContext>();
                context->request = std::move(message);
                context->router = &router_;
                context->session = shared_from_this();

                PendingResponse pending;
                pending.future = context->promise.get_future();
                pending.keep_alive = keep_alive;

                {
                    std::lock_guard<std::mutex> lock(queue_mutex_);
                    pending_queue_.push(std::move(pending));
                }

                try {
                    thread_pool_.SubmitOwned(ProcessRequest, std::move(context));
                } catch (const std::exception& e) {
                    MSIG_LOG_ERRORF("HttpsSession", "Failed to submit task: %s", e.what());
                    DoClose();
                    return;
                }
            }
        }

        if (keep_alive && requests_handled_ < limits_.max_requests) {
            DoRead();
        }
    }

    void HttpsSession::EnqueueImmediate(http::status status, bool keep_alive)
    {
        std::promise<HttpResponse> promise;
        HttpResponse response;
        response.status = status;
        promise.set_value(std::move(response));

        PendingResponse pending;
        pending.future = promise.get_future();
        pending.keep_alive = keep_alive;

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            pending_queue_.push(std::move(pending));
        }

        DoWrite();
    }

    void HttpsSession::ScheduleWrite()
    {
        boost::asio::post(stream_.get_executor(), [self = shared_from_this()]() {
            self->DoWrite();
        });
    }

    void HttpsSession::DoWrite()
    {
        if (closing_.load()) {
            return;
        }

        PendingResponse pending;
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (write_in_progress_ || pending_queue_.empty()) {
                return;
            }

            // 앞선 요청이 끝나지 않았으면 완료 시 다시 호출됨
            auto& front = pending_queue_.front();
            if (front.future.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
                return;
            }

            pending = std::move(front);
            pending_queue_.pop();
            write_in_progress_ = true;
        }

        HttpResponse http_response;
        try {
            http_response = pending.future.get();
        } catch (const std::future_error& e) {
            MSIG_LOG_ERRORF("HttpsSession", "Handler result unavailable: %s", e.what());
            http_response.status = http::status::internal_server_error;
        }

        std::string body;
        if (http_response.protobuf_message && !http_response.protobuf_message->SerializeToString(&body)) {
            MSIG_LOG_ERROR("HttpsSession", "Proto serialize failed");
            http_response.status = http::status::internal_server_error;
            body.clear();
        }

        auto response = std::make_shared<http::response<http::string_body>>();
        response->version(11);
        response->result(http_response.status);
        response->set(http::field::content_type, PROTOBUF_CONTENT_TYPE);
        response->body() = std::move(body);

        bool keep_alive = pending.keep_alive && ShouldKeepAlive();
        response->keep_alive(keep_alive);
        response->prepare_payload();

        MSIG_LOG_DEBUGF("HttpsSession", "Sending response: %u (Keep-Alive: %s)",
            static_cast<unsigned>(http_response.status), keep_alive ? "yes" : "no");

        http::async_write(
            stream_,
            *response,
            [self = shared_from_this(), response, keep_alive](beast::error_code ec, std::size_t bytes) {
                self->OnWrite(ec, bytes, keep_alive);
            }
        );
    }

    void HttpsSession::OnWrite(beast::error_code ec, std::size_t bytes_transferred, bool keep_alive)
    {
        (void)bytes_transferred;

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            write_in_progress_ = false;
        }

        if (ec) {
            MSIG_LOG_ERRORF("HttpsSession", "Write error: %s", ec.message().c_str());
            DoClose();
            return;
        }

        last_activity_ = steady_clock::now();

        if (!keep_alive) {
            MSIG_LOG_DEBUG("HttpsSession", "Keep-Alive finished, closing connection");
            DoClose();
            return;
        }

        DoWrite();
    }

    void HttpsSession::DoClose()
    {
        if (closing_.exchange(true)) {
            return;
        }

        auto self = shared_from_this();

        beast::get_lowest_layer(stream_).expires_after(std::chrono::seconds(5));

        stream_.async_shutdown(
            [self](beast::error_code ec) {
                // eof / stream_truncated는 정상 종료
                if (ec && ec != boost::asio::error::eof && ec != boost::asio::ssl::error::stream_truncated) {
                    MSIG_LOG_WARNF("HttpsSession", "SSL shutdown error: %s", ec.message().c_str());
                }

                beast::error_code close_ec;
                auto& socket = beast::get_lowest_layer(self->stream_).socket();
                if (socket.is_open()) {
                    // NOLINTNEXTLINE(bugprone-unused-return-value)
                    socket.close(close_ec);
                    if (close_ec) {
                        MSIG_LOG_WARNF("HttpsSession", "Socket close error: %s", close_ec.message().c_str());
                    }
                }
            }
        );
    }

    bool HttpsSession::ShouldKeepAlive() const
    {
        if (requests_handled_ >= limits_.max_requests) {
            return false;
        }
        return steady_clock::now() - last_activity_ <= limits_.keep_alive_timeout;
    }

    HttpResponse HttpsSession::Dispatch(MultiSigMessageRouter& router, const MultiSigMessage& request)
    {
        HttpResponse response;

        try {
            response.protobuf_message = router.ProcessMessage(&request);
            response.status = response.protobuf_message ? http::status::ok : http::status::bad_request;
        } catch (const std::exception& e) {
            MSIG_LOG_ERRORF("HttpsSession", "Handler exception: %s", e.what());
            response.protobuf_message.reset();
            response.status = http::status::internal_server_error;
        }

        return response;
    }

    void HttpsSession::ProcessRequest(MultiSigHandlerContext* context)
    {
        if (!context || !context->request || !context->router) {
            MSIG_LOG_ERROR("HttpsSession", "Invalid context");
            if (context) {
                HttpResponse response;
                response.status = http::status::internal_server_error;
                context->promise.set_value(std::move(response));
            }
            return;
        }

        context->promise.set_value(Dispatch(*context->router, *context->request));

        if (context->session) {
            context->session->ScheduleWrite();
        }
    }

} // namespace multisig_engine::coordinator::network::multisig_server
