// src/multisig/execution/src/ChainConfig.cpp
#include "multisig/execution/include/ChainConfig.hpp"
#include "multisig/address/include/AddressNormalizer.hpp"
#include "common/utils/logger/Logger.hpp"
#include <algorithm>
#include <cctype>

namespace multisig_engine::multisig
{
    namespace
    {
        std::string LookupAddress(const env::EnvConfig& config, const std::string& prefix,
                                  const std::string& suffix, const std::string& fallback)
        {
            std::string key;
            if (config.HasKey(prefix + "_MULTISIG_" + suffix)) {
                key = prefix + "_MULTISIG_" + suffix;
            } else if (config.HasKey("MULTISIG_" + suffix)) {
                key = "MULTISIG_" + suffix;
            } else {
                return AddressNormalizer::Normalize(fallback);
            }

            std::string value = config.GetString(key);
            std::string normalized;
            if (!AddressNormalizer::TryNormalize(value, normalized)) {
                throw env::ConfigFormatException(key, value);
            }
            return normalized;
        }

        std::string ToLower(std::string value)
        {
            std::transform(value.begin(), value.end(), value.begin(),
                [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return value;
        }
    }

    SafeChainConfig LoadSafeChainConfig(const env::EnvConfig& config, const std::string& chain)
    {
        SafeChainConfig out;
        out.chain = ToLower(chain);
        out.chain_id = ChainIdOf(ChainTypeFromString(out.chain));
        if (out.chain_id == 0) {
            throw env::ConfigFormatException("MULTISIG_CHAINS", chain);
        }

        const std::string prefix = ChainConfigPrefix(out.chain);

        out.rpc_url = config.GetString(prefix + "_RPC_URL");

        std::string relayer_key = prefix + "_RELAYER_ADDRESS";
        std::string relayer = config.GetString(relayer_key);
        if (!AddressNormalizer::TryNormalize(relayer, out.relayer_address)) {
            throw env::ConfigFormatException(relayer_key, relayer);
        }

        out.factory_address = LookupAddress(config, prefix, "FACTORY_ADDRESS", DEFAULT_SAFE_PROXY_FACTORY);
        out.singleton_address = LookupAddress(config, prefix, "SINGLETON_ADDRESS", DEFAULT_SAFE_SINGLETON);
        out.fallback_handler = LookupAddress(config, prefix, "FALLBACK_HANDLER", AddressNormalizer::ZERO_ADDRESS);

        if (config.HasKey(prefix + "_GAS_LIMIT")) {
            out.gas_limit = config.GetUInt64(prefix + "_GAS_LIMIT");
        }
        if (config.HasKey("MULTISIG_RPC_TIMEOUT_MS")) {
            out.rpc_timeout_ms = config.GetUInt32("MULTISIG_RPC_TIMEOUT_MS");
        }
        if (config.HasKey("MULTISIG_CONFIRMATION_TIMEOUT_MS")) {
            out.confirmation_timeout_ms = config.GetUInt32("MULTISIG_CONFIRMATION_TIMEOUT_MS");
        }

        return out;
    }

    OnChainSettings LoadOnChainSettings(const env::EnvConfig& config)
    {
        OnChainSettings settings;
        settings.enabled = config.HasKey("MULTISIG_ONCHAIN_ENABLED") &&
                           config.GetBool("MULTISIG_ONCHAIN_ENABLED");

        if (!settings.enabled) {
            MSIG_LOG_INFO("ChainConfig", "On-chain execution disabled, all wallets use placeholder addresses");
            return settings;
        }

        for (const auto& chain : config.GetStringArray("MULTISIG_CHAINS")) {
            settings.chains.push_back(LoadSafeChainConfig(config, chain));

            const auto& loaded = settings.chains.back();
            MSIG_LOG_INFOF("ChainConfig", "Chain %s (id=%llu) factory=%s singleton=%s",
                loaded.chain.c_str(), static_cast<unsigned long long>(loaded.chain_id),
                loaded.factory_address.c_str(), loaded.singleton_address.c_str());
        }

        return settings;
    }
}
