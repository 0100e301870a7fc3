// src/multisig/execution/src/SafeExecutionAdapter.cpp
#include "multisig/execution/include/SafeExecutionAdapter.hpp"
#include "multisig/address/include/AddressNormalizer.hpp"
#include "common/utils/id/IdGenerator.hpp"
#include "common/utils/logger/Logger.hpp"
#include <algorithm>
#include <cctype>

namespace multisig_engine::multisig
{
    SafeExecutionAdapter::SafeExecutionAdapter(const SafeChainConfig& cfg, std::shared_ptr<IChainClient> chain_client)
        : config(cfg)
        , client(std::move(chain_client))
    {
        if (!client) {
            throw std::invalid_argument("SafeExecutionAdapter requires a chain client");
        }
    }

    Bytes SafeExecutionAdapter::EncodeSetup(const std::vector<std::string>& owners, uint32_t threshold) const
    {
        AbiEncoder enc;
        enc.AddAddressArray(owners)
           .AddUint(threshold)
           .AddAddress(AddressNormalizer::ZERO_ADDRESS)     // to (delegate call 없음)
           .AddBytes(Bytes{})                               // data
           .AddAddress(config.fallback_handler)
           .AddAddress(AddressNormalizer::ZERO_ADDRESS)     // paymentToken
           .AddUint(0)                                      // payment
           .AddAddress(AddressNormalizer::ZERO_ADDRESS);    // paymentReceiver
        return enc.EncodeCall(SETUP_SIGNATURE);
    }

    Bytes SafeExecutionAdapter::EncodeExecTransaction(const SafeTransaction& tx, const Bytes& packed_signatures)
    {
        AbiEncoder enc;
        enc.AddAddress(tx.to)
           .AddUint(tx.value)
           .AddBytes(tx.data)
           .AddUint(tx.operation)
           .AddUint(tx.safe_tx_gas)
           .AddUint(tx.base_gas)
           .AddUint(tx.gas_price)
           .AddAddress(tx.gas_token)
           .AddAddress(tx.refund_receiver)
           .AddBytes(packed_signatures);
        return enc.EncodeCall(EXEC_TRANSACTION_SIGNATURE);
    }

    bool SafeExecutionAdapter::FindProxyAddress(const ChainReceipt& receipt, const std::string& factory_address,
                                                std::string& proxy_address)
    {
        const Hash256 topic = AbiEncoder::EventTopic(PROXY_CREATION_EVENT);

        for (const auto& log : receipt.logs) {
            if (log.topics.empty() || log.topics[0] != topic) {
                continue;
            }
            if (!AddressNormalizer::Equals(log.address, factory_address)) {
                continue;
            }

            if (log.topics.size() >= 2) {
                proxy_address = AddressNormalizer::FromBytes(log.topics[1].data() + 12);
                return true;
            }
            if (log.data.size() >= 32) {
                proxy_address = AbiEncoder::DecodeAddress(log.data, 0);
                return true;
            }
        }
        return false;
    }

    ExecutionFailureReason SafeExecutionAdapter::ClassifyRpcError(const ChainRpcException& e)
    {
        if (dynamic_cast<const ChainTimeoutException*>(&e) != nullptr) {
            return ExecutionFailureReason::RPC_UNAVAILABLE;
        }

        std::string message = e.what();
        std::transform(message.begin(), message.end(), message.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (message.find("insufficient funds") != std::string::npos) {
            return ExecutionFailureReason::INSUFFICIENT_FUNDS;
        }
        // geth: code 3 = execution reverted
        if (e.code() == 3 || message.find("revert") != std::string::npos) {
            return ExecutionFailureReason::REVERTED;
        }
        return ExecutionFailureReason::RPC_UNAVAILABLE;
    }

    uint64_t SafeExecutionAdapter::GasWithMargin(uint64_t estimate) const
    {
        if (estimate > config.gas_limit) {
            throw ExecutionFailedException(ExecutionFailureReason::UNKNOWN,
                "estimated gas " + std::to_string(estimate) + " exceeds limit " +
                std::to_string(config.gas_limit));
        }
        return std::min<uint64_t>(estimate + estimate / 5, config.gas_limit);
    }

    DeploymentResult SafeExecutionAdapter::Deploy(const std::vector<std::string>& owners, uint32_t threshold)
    {
        if (owners.empty() || threshold == 0 || threshold > owners.size()) {
            throw DeploymentFailedException("invalid owner set for threshold " + std::to_string(threshold));
        }

        Bytes initializer = EncodeSetup(owners, threshold);

        uint256_t salt = 0;
        try {
            auto random = utils::IdGenerator::RandomBytes(32);
            salt = Uint256FromBytes(random.data(), random.size());
        } catch (const std::runtime_error& e) {
            throw DeploymentFailedException(std::string("salt generation: ") + e.what());
        }

        AbiEncoder enc;
        enc.AddAddress(config.singleton_address).AddBytes(initializer).AddUint(salt);

        ChainCall call;
        call.from = config.relayer_address;
        call.to = config.factory_address;
        call.data = enc.EncodeCall(CREATE_PROXY_SIGNATURE);

        MSIG_LOG_INFOF("SafeAdapter", "[%s] Deploying %u-of-%zu wallet via factory %s",
            config.chain.c_str(), threshold, owners.size(), config.factory_address.c_str());

        DeploymentResult result;
        ChainReceipt receipt;
        try {
            uint64_t estimate = client->EstimateGas(call);
            call.gas_limit = estimate + estimate / 5;
            result.tx_hash = client->Submit(call);
            receipt = client->WaitForReceipt(result.tx_hash, config.confirmation_timeout_ms);
        } catch (const ChainRpcException& e) {
            MSIG_LOG_ERRORF("SafeAdapter", "[%s] Deployment RPC failure: %s", config.chain.c_str(), e.what());
            throw DeploymentFailedException(e.what());
        }

        if (!receipt.success) {
            MSIG_LOG_ERRORF("SafeAdapter", "[%s] Deployment reverted: %s", config.chain.c_str(), result.tx_hash.c_str());
            throw DeploymentFailedException("transaction reverted: " + result.tx_hash);
        }

        if (!FindProxyAddress(receipt, config.factory_address, result.address)) {
            MSIG_LOG_ERRORF("SafeAdapter", "[%s] No ProxyCreation log in %s", config.chain.c_str(), result.tx_hash.c_str());
            throw DeploymentFailedException("proxy creation log not found in " + result.tx_hash);
        }

        MSIG_LOG_INFOF("SafeAdapter", "[%s] Wallet deployed at %s (tx=%s, block=%llu)",
            config.chain.c_str(), result.address.c_str(), result.tx_hash.c_str(),
            static_cast<unsigned long long>(receipt.block_number));
        return result;
    }

    uint256_t SafeExecutionAdapter::GetNonce(const std::string& wallet_address)
    {
        ChainCall call;
        call.to = AddressNormalizer::Normalize(wallet_address);
        call.data = AbiEncoder().EncodeCall(NONCE_SIGNATURE);

        try {
            Bytes result = client->Call(call);
            return AbiEncoder::DecodeUint(result, 0);
        } catch (const ChainRpcException& e) {
            throw ExecutionFailedException(ClassifyRpcError(e), std::string("nonce(): ") + e.what());
        } catch (const std::out_of_range&) {
            // 코드가 없는 주소에 대한 eth_call은 빈 결과를 반환
            throw ExecutionFailedException(ExecutionFailureReason::REVERTED,
                "nonce() returned no data for " + wallet_address);
        }
    }

    std::string SafeExecutionAdapter::Execute(
        const std::string& wallet_address,
        const SafeTransaction& tx,
        const Bytes& packed_signatures)
    {
        if (packed_signatures.empty()) {
            throw ExecutionFailedException(ExecutionFailureReason::MISSING_SIGNATURE, "no signatures to submit");
        }

        ChainCall call;
        call.from = config.relayer_address;
        call.to = AddressNormalizer::Normalize(wallet_address);
        call.data = EncodeExecTransaction(tx, packed_signatures);

        std::string tx_hash;
        ChainReceipt receipt;
        try {
            call.gas_limit = GasWithMargin(client->EstimateGas(call));
            tx_hash = client->Submit(call);
            receipt = client->WaitForReceipt(tx_hash, config.confirmation_timeout_ms);
        } catch (const ChainRpcException& e) {
            ExecutionFailureReason reason = ClassifyRpcError(e);
            MSIG_LOG_ERRORF("SafeAdapter", "[%s] execTransaction on %s failed (%s): %s",
                config.chain.c_str(), call.to.c_str(), ExecutionFailureReasonToString(reason), e.what());
            throw ExecutionFailedException(reason, e.what());
        }

        if (!receipt.success) {
            MSIG_LOG_ERRORF("SafeAdapter", "[%s] execTransaction reverted: %s", config.chain.c_str(), tx_hash.c_str());
            throw ExecutionFailedException(ExecutionFailureReason::REVERTED, "transaction reverted: " + tx_hash);
        }

        MSIG_LOG_INFOF("SafeAdapter", "[%s] Executed on %s (tx=%s, gas=%llu)",
            config.chain.c_str(), call.to.c_str(), tx_hash.c_str(),
            static_cast<unsigned long long>(receipt.gas_used));
        return tx_hash;
    }
}
