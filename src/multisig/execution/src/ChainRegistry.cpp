// src/multisig/execution/src/ChainRegistry.cpp
#include "multisig/execution/include/ChainRegistry.hpp"
#include "multisig/execution/include/SafeExecutionAdapter.hpp"
#include "multisig/chain/include/JsonRpcChainClient.hpp"
#include "multisig/errors/include/MultiSigException.hpp"
#include "common/utils/logger/Logger.hpp"
#include <algorithm>
#include <cctype>

namespace multisig_engine::multisig
{
    std::unique_ptr<ChainRegistry> ChainRegistry::FromSettings(const OnChainSettings& settings)
    {
        auto registry = std::make_unique<ChainRegistry>();
        registry->SetOnChainEnabled(settings.enabled);

        if (!settings.enabled) {
            return registry;
        }

        for (const auto& chain : settings.chains) {
            ChainRpcConfig rpc;
            rpc.rpc_url = chain.rpc_url;
            rpc.timeout_ms = chain.rpc_timeout_ms;

            auto client = std::make_shared<JsonRpcChainClient>(rpc);
            registry->Register(chain.chain, std::make_shared<SafeExecutionAdapter>(chain, client));
        }

        MSIG_LOG_INFOF("ChainRegistry", "On-chain execution enabled for %zu chain(s)", settings.chains.size());
        return registry;
    }

    std::string ChainRegistry::NormalizeChain(const std::string& chain)
    {
        std::string normalized = chain;
        std::transform(normalized.begin(), normalized.end(), normalized.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return normalized;
    }

    void ChainRegistry::Register(const std::string& chain, std::shared_ptr<IExecutionAdapter> adapter)
    {
        if (!adapter) {
            throw std::invalid_argument("Null execution adapter for chain " + chain);
        }
        adapters[NormalizeChain(chain)] = std::move(adapter);
        MSIG_LOG_DEBUGF("ChainRegistry", "Registered execution adapter for %s", chain.c_str());
    }

    bool ChainRegistry::IsOnChainEnabled(const std::string& chain) const
    {
        return onchain_enabled && adapters.count(NormalizeChain(chain)) > 0;
    }

    IExecutionAdapter& ChainRegistry::Adapter(const std::string& chain) const
    {
        if (!onchain_enabled) {
            throw OnChainUnsupportedException(chain);
        }

        auto it = adapters.find(NormalizeChain(chain));
        if (it == adapters.end()) {
            throw OnChainUnsupportedException(chain);
        }
        return *it->second;
    }

    std::vector<std::string> ChainRegistry::RegisteredChains() const
    {
        std::vector<std::string> chains;
        for (const auto& entry : adapters) {
            chains.push_back(entry.first);
        }
        return chains;
    }
}
