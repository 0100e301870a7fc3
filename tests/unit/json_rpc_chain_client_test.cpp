// tests/unit/json_rpc_chain_client_test.cpp
#include <gtest/gtest.h>
#include "multisig/chain/include/JsonRpcChainClient.hpp"
#include "multisig/execution/include/SafeExecutionAdapter.hpp"
#include "common/crypto/include/HexUtils.hpp"
#include "multisig/errors/include/MultiSigException.hpp"
#include "support/LoopbackRpcServer.hpp"

using namespace multisig_engine;
using namespace multisig_engine::multisig;
using json = nlohmann::json;
using multisig_engine::test::LoopbackRpcServer;
namespace http = boost::beast::http;

// ========== URL ==========

TEST(JsonRpcChainClientTest, ParsesHttpsUrlWithDefaults) {
    RpcEndpoint endpoint;
    ASSERT_TRUE(JsonRpcChainClient::ParseUrl("https://mainnet.infura.io/v3/key", endpoint));
    EXPECT_TRUE(endpoint.tls);
    EXPECT_EQ(endpoint.host, "mainnet.infura.io");
    EXPECT_EQ(endpoint.port, "443");
    EXPECT_EQ(endpoint.target, "/v3/key");
}

TEST(JsonRpcChainClientTest, ParsesHttpUrlWithPort) {
    RpcEndpoint endpoint;
    ASSERT_TRUE(JsonRpcChainClient::ParseUrl("http://127.0.0.1:8545", endpoint));
    EXPECT_FALSE(endpoint.tls);
    EXPECT_EQ(endpoint.host, "127.0.0.1");
    EXPECT_EQ(endpoint.port, "8545");
    EXPECT_EQ(endpoint.target, "/");
}

TEST(JsonRpcChainClientTest, RejectsUnsupportedUrls) {
    RpcEndpoint endpoint;
    EXPECT_FALSE(JsonRpcChainClient::ParseUrl("ws://node:8546", endpoint));
    EXPECT_FALSE(JsonRpcChainClient::ParseUrl("http://", endpoint));
    EXPECT_FALSE(JsonRpcChainClient::ParseUrl("http://host:/rpc", endpoint));
    EXPECT_THROW(JsonRpcChainClient(ChainRpcConfig{"node:8545"}), std::invalid_argument);
}

// ========== 요청 인코딩 ==========

TEST(JsonRpcChainClientTest, CallToJsonOmitsEmptyFields) {
    ChainCall call;
    call.to = "0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed";
    call.data = Bytes{0xaf, 0xfe, 0xd0, 0xe0};

    json j = JsonRpcChainClient::CallToJson(call);
    EXPECT_FALSE(j.contains("from"));
    EXPECT_FALSE(j.contains("value"));
    EXPECT_FALSE(j.contains("gas"));
    EXPECT_EQ(j["data"], "0xaffed0e0");

    call.from = "0x90F8bf6A479f320ead074411a4B0e7944Ea8c9C1";
    call.value = 255;
    call.gas_limit = 120000;
    j = JsonRpcChainClient::CallToJson(call);
    EXPECT_EQ(j["from"], call.from);
    EXPECT_EQ(j["value"], "0xff");
    EXPECT_EQ(j["gas"], "0x1d4c0");
}

// ========== receipt 파싱 ==========

TEST(JsonRpcChainClientTest, ParsesReceiptWithLogs) {
    const std::string factory = "0xa6B71E26C5e0845f74c812102Ca7114b6a896AB2";
    const std::string topic0 = crypto::ToHex(
        AbiEncoder::EventTopic(SafeExecutionAdapter::PROXY_CREATION_EVENT), true);
    const std::string topic1 = "0x000000000000000000000000dbf03b407c01e7cd3cbea99509d93f8dddc8c6fb";

    json receipt = {
        {"transactionHash", "0x" + std::string(64, 'b')},
        {"status", "0x1"},
        {"blockNumber", "0x10"},
        {"gasUsed", "0x5208"},
        {"logs", json::array({
            {{"address", factory}, {"topics", json::array({topic0, topic1})}, {"data", "0x"}}
        })}
    };

    ChainReceipt parsed = JsonRpcChainClient::ParseReceipt(receipt);
    EXPECT_TRUE(parsed.success);
    EXPECT_EQ(parsed.block_number, 16u);
    EXPECT_EQ(parsed.gas_used, 21000u);
    ASSERT_EQ(parsed.logs.size(), 1u);
    ASSERT_EQ(parsed.logs[0].topics.size(), 2u);

    std::string proxy;
    ASSERT_TRUE(SafeExecutionAdapter::FindProxyAddress(parsed, factory, proxy));
    EXPECT_EQ(proxy, "0xdbF03B407c01E7cD3CBea99509d93f8DDDC8C6FB");
}

TEST(JsonRpcChainClientTest, FailedStatus) {
    json receipt = {
        {"transactionHash", "0x" + std::string(64, 'b')},
        {"status", "0x0"},
        {"blockNumber", "0x1"}
    };
    ChainReceipt parsed = JsonRpcChainClient::ParseReceipt(receipt);
    EXPECT_FALSE(parsed.success);
    EXPECT_TRUE(parsed.logs.empty());
}

TEST(JsonRpcChainClientTest, MalformedReceiptThrows) {
    EXPECT_THROW(JsonRpcChainClient::ParseReceipt(json{{"status", "0x1"}}), ChainRpcException);

    json bad_topic = {
        {"transactionHash", "0x01"},
        {"status", "0x1"},
        {"blockNumber", "0x1"},
        {"logs", json::array({{{"address", "0x00"}, {"topics", json::array({"0x1234"})}}})}
    };
    EXPECT_THROW(JsonRpcChainClient::ParseReceipt(bad_topic), ChainRpcException);

    json bad_status = {
        {"transactionHash", "0x01"},
        {"status", "yes"},
        {"blockNumber", "0x1"}
    };
    EXPECT_THROW(JsonRpcChainClient::ParseReceipt(bad_status), ChainRpcException);
}

// ========== 응답 해석 ==========

TEST(JsonRpcChainClientTest, ParseResponseReturnsResult) {
    json result = JsonRpcChainClient::ParseResponse("eth_chainId",
        R"({"jsonrpc":"2.0","id":1,"result":"0x89"})");
    EXPECT_EQ(result, "0x89");

    // result: null (receipt 미확정)은 정상 응답
    EXPECT_TRUE(JsonRpcChainClient::ParseResponse("eth_getTransactionReceipt",
        R"({"jsonrpc":"2.0","id":1,"result":null})").is_null());
}

TEST(JsonRpcChainClientTest, ParseResponseMapsErrorShapes) {
    try {
        JsonRpcChainClient::ParseResponse("eth_estimateGas",
            R"({"jsonrpc":"2.0","id":1,"error":{"code":-32000,"message":"insufficient funds for gas"}})");
        FAIL() << "expected ChainRpcException";
    } catch (const ChainRpcException& e) {
        EXPECT_EQ(e.code(), -32000);
        EXPECT_NE(std::string(e.what()).find("insufficient funds"), std::string::npos);
    }

    try {
        JsonRpcChainClient::ParseResponse("eth_call", R"({"jsonrpc":"2.0","id":1,"error":"rate limited"})");
        FAIL() << "expected ChainRpcException";
    } catch (const ChainRpcException& e) {
        EXPECT_EQ(e.code(), 0);
        EXPECT_NE(std::string(e.what()).find("rate limited"), std::string::npos);
    }

    EXPECT_THROW(JsonRpcChainClient::ParseResponse("eth_call",
        R"({"jsonrpc":"2.0","id":1,"error":{"code":"oops","message":42}})"), ChainRpcException);
    EXPECT_THROW(JsonRpcChainClient::ParseResponse("eth_call",
        R"({"jsonrpc":"2.0","id":1,"error":[1,2]})"), ChainRpcException);
}

TEST(JsonRpcChainClientTest, ParseResponseRejectsMalformedBodies) {
    EXPECT_THROW(JsonRpcChainClient::ParseResponse("eth_call", "not json"), ChainRpcException);
    EXPECT_THROW(JsonRpcChainClient::ParseResponse("eth_call", "[1,2,3]"), ChainRpcException);
    EXPECT_THROW(JsonRpcChainClient::ParseResponse("eth_call", "\"0x1\""), ChainRpcException);
    EXPECT_THROW(JsonRpcChainClient::ParseResponse("eth_call", R"({"jsonrpc":"2.0","id":1})"), ChainRpcException);
}

// ========== 로컬 노드 왕복 ==========

namespace
{
    ChainRpcConfig LoopbackConfig(const LoopbackRpcServer& server)
    {
        ChainRpcConfig config;
        config.rpc_url = server.Url();
        config.timeout_ms = 300;
        config.poll_interval_ms = 10;
        return config;
    }
}

TEST(JsonRpcChainClientTest, RequestRoundTripsThroughHttp) {
    LoopbackRpcServer server([](const std::string&) {
        return LoopbackRpcServer::Json(R"({"jsonrpc":"2.0","id":1,"result":"0x89"})");
    });
    JsonRpcChainClient client(LoopbackConfig(server));

    EXPECT_EQ(client.ChainId(), 137u);
    EXPECT_EQ(client.ChainId(), 137u);
    EXPECT_EQ(server.RequestCount(), 1u);

    json sent = json::parse(server.RequestBodies().at(0));
    EXPECT_EQ(sent["method"], "eth_chainId");
    EXPECT_EQ(sent["jsonrpc"], "2.0");
}

TEST(JsonRpcChainClientTest, ErrorObjectFromNode) {
    LoopbackRpcServer server([](const std::string&) {
        return LoopbackRpcServer::Json(
            R"({"jsonrpc":"2.0","id":1,"error":{"code":-32000,"message":"execution reverted"}})");
    });
    JsonRpcChainClient client(LoopbackConfig(server));

    try {
        client.EstimateGas(ChainCall{});
        FAIL() << "expected ChainRpcException";
    } catch (const ChainTimeoutException&) {
        FAIL() << "not a timeout";
    } catch (const ChainRpcException& e) {
        EXPECT_EQ(e.code(), -32000);
    }
}

TEST(JsonRpcChainClientTest, StringErrorFromProxy) {
    LoopbackRpcServer server([](const std::string&) {
        return LoopbackRpcServer::Json(R"({"jsonrpc":"2.0","id":1,"error":"rate limited"})");
    });
    JsonRpcChainClient client(LoopbackConfig(server));

    EXPECT_THROW(client.Call(ChainCall{}), ChainRpcException);
    EXPECT_THROW(client.Submit(ChainCall{}), ChainRpcException);
}

TEST(JsonRpcChainClientTest, HttpErrorStatus) {
    LoopbackRpcServer server([](const std::string&) {
        return LoopbackRpcServer::Status(http::status::internal_server_error, "upstream down");
    });
    JsonRpcChainClient client(LoopbackConfig(server));

    try {
        client.ChainId();
        FAIL() << "expected ChainRpcException";
    } catch (const ChainTimeoutException&) {
        FAIL() << "not a timeout";
    } catch (const ChainRpcException& e) {
        EXPECT_NE(std::string(e.what()).find("500"), std::string::npos);
    }
}

TEST(JsonRpcChainClientTest, MalformedBodyFromNode) {
    LoopbackRpcServer server([](const std::string&) {
        return LoopbackRpcServer::Json("<html>bad gateway</html>");
    });
    JsonRpcChainClient client(LoopbackConfig(server));

    EXPECT_THROW(client.EstimateGas(ChainCall{}), ChainRpcException);
}

TEST(JsonRpcChainClientTest, SilentNodeTimesOut) {
    LoopbackRpcServer server([](const std::string&) { return LoopbackRpcServer::Silent(); });
    JsonRpcChainClient client(LoopbackConfig(server));

    EXPECT_THROW(client.ChainId(), ChainTimeoutException);
}

TEST(JsonRpcChainClientTest, ReceiptPollingGivesUpAtDeadline) {
    LoopbackRpcServer server([](const std::string&) {
        return LoopbackRpcServer::Json(R"({"jsonrpc":"2.0","id":1,"result":null})");
    });
    JsonRpcChainClient client(LoopbackConfig(server));

    EXPECT_THROW(client.WaitForReceipt("0x" + std::string(64, 'a'), 50), ChainTimeoutException);
    EXPECT_GE(server.RequestCount(), 2u);
}

// ========== 어댑터 경유 ==========

TEST(JsonRpcChainClientTest, AdapterWrapsNodeErrorsAsDomainFailures) {
    LoopbackRpcServer server([](const std::string&) {
        return LoopbackRpcServer::Json(R"({"jsonrpc":"2.0","id":1,"error":"rate limited"})");
    });

    SafeChainConfig chain;
    chain.chain = "ethereum";
    chain.chain_id = 1;
    chain.rpc_url = server.Url();
    chain.relayer_address = "0x90F8bf6A479f320ead074411a4B0e7944Ea8c9C1";
    chain.factory_address = "0xa6B71E26C5e0845f74c812102Ca7114b6a896AB2";
    chain.singleton_address = "0xd9Db270c1B5E3Bd161E8c8503c55cEABeE709552";
    chain.fallback_handler = "0x0000000000000000000000000000000000000000";

    SafeExecutionAdapter adapter(chain, std::make_shared<JsonRpcChainClient>(LoopbackConfig(server)));

    EXPECT_THROW(adapter.Deploy({"0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed"}, 1), DeploymentFailedException);
    try {
        adapter.GetNonce("0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed");
        FAIL() << "expected ExecutionFailedException";
    } catch (const ExecutionFailedException& e) {
        EXPECT_EQ(e.reason(), ExecutionFailureReason::RPC_UNAVAILABLE);
    }
}
