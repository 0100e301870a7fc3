// src/multisig/chain/src/JsonRpcChainClient.cpp
#include "multisig/chain/include/JsonRpcChainClient.hpp"
#include "common/crypto/include/HexUtils.hpp"
#include "common/utils/logger/Logger.hpp"
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <algorithm>
#include <chrono>
#include <limits>
#include <thread>

namespace multisig_engine::multisig
{
    namespace beast = boost::beast;
    namespace http = beast::http;
    namespace ssl = boost::asio::ssl;
    using tcp = boost::asio::ip::tcp;
    using json = nlohmann::json;

    namespace
    {
        uint64_t ToUint64(const std::string& hex)
        {
            uint256_t value = ParseHexQuantity(hex);
            if (value > std::numeric_limits<uint64_t>::max()) {
                throw std::invalid_argument("Quantity exceeds 64 bits: " + hex);
            }
            return static_cast<uint64_t>(value);
        }

        [[noreturn]] void ThrowTransport(const beast::error_code& ec, const char* stage)
        {
            if (ec == beast::error::timeout) {
                throw ChainTimeoutException(std::string(stage) + ": " + ec.message());
            }
            throw ChainRpcException(std::string(stage) + ": " + ec.message());
        }

        template <typename Stream>
        std::string Exchange(Stream& stream, const RpcEndpoint& endpoint, const std::string& body,
                             std::chrono::milliseconds timeout)
        {
            http::request<http::string_body> req{http::verb::post, endpoint.target, 11};
            req.set(http::field::host, endpoint.host);
            req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
            req.set(http::field::content_type, "application/json");
            req.body() = body;
            req.prepare_payload();

            beast::error_code ec;
            beast::get_lowest_layer(stream).expires_after(timeout);
            http::write(stream, req, ec);
            if (ec) {
                ThrowTransport(ec, "write");
            }

            beast::flat_buffer buffer;
            http::response<http::string_body> res;
            http::read(stream, buffer, res, ec);
            if (ec) {
                ThrowTransport(ec, "read");
            }

            if (res.result() != http::status::ok) {
                throw ChainRpcException("HTTP status " + std::to_string(res.result_int()));
            }
            return res.body();
        }
    }

    JsonRpcChainClient::JsonRpcChainClient(const ChainRpcConfig& cfg)
        : config(cfg)
        , ssl_ctx(ssl::context::tlsv12_client)
    {
        if (!ParseUrl(config.rpc_url, endpoint)) {
            throw std::invalid_argument("Invalid RPC URL: " + config.rpc_url);
        }

        ssl_ctx.set_default_verify_paths();
        ssl_ctx.set_verify_mode(ssl::verify_peer);

        MSIG_LOG_INFOF("ChainRpc", "JSON-RPC client for %s://%s:%s%s",
            endpoint.tls ? "https" : "http", endpoint.host.c_str(),
            endpoint.port.c_str(), endpoint.target.c_str());
    }

    bool JsonRpcChainClient::ParseUrl(const std::string& url, RpcEndpoint& out)
    {
        RpcEndpoint result;
        std::string rest;

        if (url.rfind("https://", 0) == 0) {
            result.tls = true;
            result.port = "443";
            rest = url.substr(8);
        } else if (url.rfind("http://", 0) == 0) {
            result.tls = false;
            result.port = "80";
            rest = url.substr(7);
        } else {
            return false;
        }

        size_t slash = rest.find('/');
        std::string authority = rest.substr(0, slash);
        if (slash != std::string::npos) {
            result.target = rest.substr(slash);
        }

        size_t colon = authority.rfind(':');
        if (colon != std::string::npos) {
            result.port = authority.substr(colon + 1);
            authority = authority.substr(0, colon);
            if (result.port.empty()) {
                return false;
            }
        }

        if (authority.empty()) {
            return false;
        }
        result.host = authority;

        out = result;
        return true;
    }

    std::string JsonRpcChainClient::Post(const std::string& body)
    {
        const auto timeout = std::chrono::milliseconds(config.timeout_ms);
        boost::asio::io_context ioc;
        beast::error_code ec;

        tcp::resolver resolver(ioc);
        auto results = resolver.resolve(endpoint.host, endpoint.port, ec);
        if (ec) {
            ThrowTransport(ec, "resolve");
        }

        if (!endpoint.tls) {
            beast::tcp_stream stream(ioc);
            stream.expires_after(timeout);
            stream.connect(results, ec);
            if (ec) {
                ThrowTransport(ec, "connect");
            }

            std::string response = Exchange(stream, endpoint, body, timeout);

            // NOLINTNEXTLINE(bugprone-unused-return-value)
            stream.socket().shutdown(tcp::socket::shutdown_both, ec);
            return response;
        }

        beast::ssl_stream<beast::tcp_stream> stream(ioc, ssl_ctx);
        if (!SSL_set_tlsext_host_name(stream.native_handle(), endpoint.host.c_str())) {
            throw ChainRpcException("Failed to set SNI host name");
        }

        beast::get_lowest_layer(stream).expires_after(timeout);
        beast::get_lowest_layer(stream).connect(results, ec);
        if (ec) {
            ThrowTransport(ec, "connect");
        }

        stream.handshake(ssl::stream_base::client, ec);
        if (ec) {
            ThrowTransport(ec, "handshake");
        }

        std::string response = Exchange(stream, endpoint, body, timeout);

        beast::get_lowest_layer(stream).expires_after(std::chrono::seconds(2));
        stream.shutdown(ec);
        // eof/stream_truncated는 정상 종료로 간주
        if (ec && ec != boost::asio::error::eof && ec != ssl::error::stream_truncated) {
            MSIG_LOG_DEBUGF("ChainRpc", "TLS shutdown: %s", ec.message().c_str());
        }
        return response;
    }

    json JsonRpcChainClient::Request(const std::string& method, const json& params)
    {
        const uint64_t id = next_request_id.fetch_add(1);

        json request;
        request["jsonrpc"] = "2.0";
        request["id"] = id;
        request["method"] = method;
        request["params"] = params;

        MSIG_LOG_DEBUGF("ChainRpc", "-> %s (id=%llu)", method.c_str(), static_cast<unsigned long long>(id));

        return ParseResponse(method, Post(request.dump()));
    }

    json JsonRpcChainClient::ParseResponse(const std::string& method, const std::string& raw)
    {
        json response;
        try {
            response = json::parse(raw);
        } catch (const json::exception& e) {
            throw ChainRpcException(method + ": malformed response: " + e.what());
        }

        if (!response.is_object()) {
            throw ChainRpcException(method + ": response is not a JSON object");
        }

        auto error_it = response.find("error");
        if (error_it != response.end() && !error_it->is_null()) {
            const json& error = *error_it;
            int code = 0;
            std::string message = "unknown error";

            // 노드/프록시에 따라 error가 문자열로 오는 경우가 있음
            if (error.is_object()) {
                auto code_it = error.find("code");
                if (code_it != error.end() && code_it->is_number_integer()) {
                    code = code_it->get<int>();
                }
                auto message_it = error.find("message");
                if (message_it != error.end() && message_it->is_string()) {
                    message = message_it->get<std::string>();
                }
            } else if (error.is_string()) {
                message = error.get<std::string>();
            } else {
                message = error.dump();
            }

            MSIG_LOG_WARNF("ChainRpc", "%s failed: %d %s", method.c_str(), code, message.c_str());
            throw ChainRpcException(method + ": " + message, code);
        }

        auto result_it = response.find("result");
        if (result_it == response.end()) {
            throw ChainRpcException(method + ": response has no result");
        }
        return *result_it;
    }

    json JsonRpcChainClient::CallToJson(const ChainCall& call)
    {
        json j;
        if (!call.from.empty()) {
            j["from"] = call.from;
        }
        j["to"] = call.to;
        j["data"] = crypto::ToHex(call.data, true);
        if (call.value > 0) {
            j["value"] = ToHexQuantity(call.value);
        }
        if (call.gas_limit > 0) {
            j["gas"] = ToHexQuantity(call.gas_limit);
        }
        return j;
    }

    uint64_t JsonRpcChainClient::ChainId()
    {
        std::lock_guard<std::mutex> lock(chain_id_mutex);
        if (cached_chain_id == 0) {
            json result = Request("eth_chainId", json::array());
            try {
                cached_chain_id = ToUint64(result.get<std::string>());
            } catch (const std::exception& e) {
                throw ChainRpcException(std::string("eth_chainId: ") + e.what());
            }
        }
        return cached_chain_id;
    }

    Bytes JsonRpcChainClient::Call(const ChainCall& call)
    {
        json result = Request("eth_call", json::array({CallToJson(call), "latest"}));

        Bytes out;
        if (!result.is_string() || !crypto::TryFromHex(result.get<std::string>(), out)) {
            throw ChainRpcException("eth_call: result is not hex data");
        }
        return out;
    }

    uint64_t JsonRpcChainClient::EstimateGas(const ChainCall& call)
    {
        json result = Request("eth_estimateGas", json::array({CallToJson(call)}));
        try {
            return ToUint64(result.get<std::string>());
        } catch (const std::exception& e) {
            throw ChainRpcException(std::string("eth_estimateGas: ") + e.what());
        }
    }

    std::string JsonRpcChainClient::Submit(const ChainCall& call)
    {
        json result = Request("eth_sendTransaction", json::array({CallToJson(call)}));
        if (!result.is_string()) {
            throw ChainRpcException("eth_sendTransaction: result is not a hash");
        }

        std::string tx_hash = result.get<std::string>();
        MSIG_LOG_INFOF("ChainRpc", "Submitted transaction %s to %s", tx_hash.c_str(), call.to.c_str());
        return tx_hash;
    }

    ChainReceipt JsonRpcChainClient::WaitForReceipt(const std::string& tx_hash, uint32_t timeout_ms)
    {
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);

        while (true) {
            json result = Request("eth_getTransactionReceipt", json::array({tx_hash}));
            if (!result.is_null()) {
                return ParseReceipt(result);
            }

            if (std::chrono::steady_clock::now() >= deadline) {
                throw ChainTimeoutException("no receipt for " + tx_hash + " after " +
                    std::to_string(timeout_ms) + "ms");
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(config.poll_interval_ms));
        }
    }

    ChainReceipt JsonRpcChainClient::ParseReceipt(const json& receipt)
    {
        try {
            ChainReceipt out;
            out.tx_hash = receipt.at("transactionHash").get<std::string>();
            out.success = ToUint64(receipt.at("status").get<std::string>()) == 1;
            out.block_number = ToUint64(receipt.at("blockNumber").get<std::string>());
            if (receipt.contains("gasUsed")) {
                out.gas_used = ToUint64(receipt["gasUsed"].get<std::string>());
            }

            for (const auto& log_json : receipt.value("logs", json::array())) {
                ChainLog log;
                log.address = log_json.at("address").get<std::string>();
                log.data = crypto::FromHex(log_json.value("data", std::string("0x")));

                for (const auto& topic_json : log_json.value("topics", json::array())) {
                    Bytes topic = crypto::FromHex(topic_json.get<std::string>());
                    if (topic.size() != 32) {
                        throw std::invalid_argument("topic is not 32 bytes");
                    }
                    Hash256 topic_hash{};
                    std::copy(topic.begin(), topic.end(), topic_hash.begin());
                    log.topics.push_back(topic_hash);
                }
                out.logs.push_back(std::move(log));
            }
            return out;

        } catch (const json::exception& e) {
            throw ChainRpcException(std::string("malformed receipt: ") + e.what());
        } catch (const std::invalid_argument& e) {
            throw ChainRpcException(std::string("malformed receipt: ") + e.what());
        }
    }
}
