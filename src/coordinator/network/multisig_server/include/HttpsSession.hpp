// src/coordinator/network/multisig_server/include/HttpsSession.hpp
#pragma once

#include "proto/multisig_coordinator/generated/multisig_message.pb.h"
#include "common/types/BasicTypes.hpp"
#include "common/utils/threading/ThreadPool.hpp"
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <queue>

namespace multisig_engine::coordinator::handlers {
    class MultiSigMessageRouter;
}

namespace multisig_engine::coordinator::network::multisig_server
{
    namespace beast = boost::beast;
    namespace http = beast::http;
    namespace ssl = boost::asio::ssl;
    using tcp = boost::asio::ip::tcp;

    using namespace multisig_engine::proto::multisig_coordinator;

    constexpr const char* PROTOBUF_CONTENT_TYPE = "application/x-protobuf";
    constexpr const char* MULTISIG_TARGET = "/multisig";

    struct HttpResponse
    {
        http::status status = http::status::ok;
        std::unique_ptr<MultiSigMessage> protobuf_message;

        HttpResponse() = default;
        HttpResponse(HttpResponse&&) = default;
        HttpResponse& operator=(HttpResponse&&) = default;

        HttpResponse(const HttpResponse&) = delete;
        HttpResponse& operator=(const HttpResponse&) = delete;
    };

    class HttpsSession;

    /**
     * @brief 핸들러 ThreadPool 작업 컨텍스트
     *
     * session은 응답이 준비될 때까지 세션을 살려 둡니다.
     */
    struct MultiSigHandlerContext
    {
        std::unique_ptr<MultiSigMessage> request;
        std::promise<HttpResponse> promise;
        handlers::MultiSigMessageRouter* router = nullptr;
        std::shared_ptr<HttpsSession> session;
    };

    struct SessionLimits
    {
        int max_requests = 1000;
        std::chrono::seconds keep_alive_timeout{60};
        size_t max_body_bytes = MAX_MESSAGE_SIZE;
    };

    /**
     * @brief HTTPS 연결 1개 (boost.beast)
     *
     * - 요청은 읽는 즉시 핸들러 풀로 넘기고 다음 요청을 계속 읽습니다.
     * - 응답은 pending_queue 순서대로만 기록합니다 (HTTP/1.1 파이프라이닝 순서).
     * - 핸들러 완료 시 세션 executor로 DoWrite를 다시 예약하므로 I/O 스레드는 블로킹되지 않습니다.
     */
    class HttpsSession : public std::enable_shared_from_this<HttpsSession>
    {
    public:
        HttpsSession(
            tcp::socket socket,
            ssl::context& ssl_context,
            utils::ThreadPool<MultiSigHandlerContext>& thread_pool,
            handlers::MultiSigMessageRouter& router,
            const SessionLimits& limits,
            std::atomic<size_t>& active_sessions
        );

        ~HttpsSession();

        void Start();

        /**
         * @brief 요청 1건 처리 (ThreadPool 작업자에서 실행)
         *
         * 라우터가 nullptr을 반환하면 400 응답입니다.
         */
        static void ProcessRequest(MultiSigHandlerContext* context);

        /**
         * @brief HTTP 요청 본문 → 응답 (라우팅 포함, 네트워크 없이 호출 가능)
         */
        static HttpResponse Dispatch(handlers::MultiSigMessageRouter& router, const MultiSigMessage& request);

    private:
        void DoTlsHandshake();
        void DoRead();
        void OnRead(beast::error_code ec, std::size_t bytes_transferred);

        // 즉시 완료된 응답을 큐에 추가 (파싱 실패, 잘못된 경로)
        void EnqueueImmediate(http::status status, bool keep_alive);

        void ScheduleWrite();
        void DoWrite();
        void OnWrite(beast::error_code ec, std::size_t bytes_transferred, bool keep_alive);
        void DoClose();

        bool ShouldKeepAlive() const;

        beast::ssl_stream<beast::tcp_stream> stream_;
        beast::flat_buffer buffer_;
        std::unique_ptr<http::request_parser<http::string_body>> parser_;

        struct PendingResponse
        {
            std::future<HttpResponse> future;
            bool keep_alive = true;   // 요청 헤더 기준
        };

        std::queue<PendingResponse> pending_queue_;
        std::mutex queue_mutex_;
        bool write_in_progress_ = false;   // queue_mutex_ 보호

        utils::ThreadPool<MultiSigHandlerContext>& thread_pool_;
        handlers::MultiSigMessageRouter& router_;
        SessionLimits limits_;
        std::atomic<size_t>& active_sessions_;

        int requests_handled_ = 0;
        std::chrono::steady_clock::time_point last_activity_;
        std::atomic<bool> closing_{false};
    };

} // namespace multisig_engine::coordinator::network::multisig_server
