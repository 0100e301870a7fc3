// src/multisig/typed/src/SafeTransactionBuilder.cpp
#include "multisig/typed/include/SafeTransactionBuilder.hpp"
#include "common/crypto/include/HexUtils.hpp"
#include "common/utils/logger/Logger.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace multisig_engine::multisig
{
    SafeTransaction SafeTransactionBuilder::Build(
        uint64_t chain_id,
        const std::string& safe_address,
        const std::string& to,
        const uint256_t& value,
        const Bytes& data,
        const uint256_t& nonce)
    {
        SafeTransaction tx;
        tx.chain_id = chain_id;
        tx.safe_address = AddressNormalizer::Normalize(safe_address);
        tx.to = AddressNormalizer::Normalize(to);
        tx.value = value;
        tx.data = data;
        tx.nonce = nonce;

        Finalize(tx);
        return tx;
    }

    void SafeTransactionBuilder::Finalize(SafeTransaction& tx)
    {
        tx.domain_separator = DomainSeparator(tx.chain_id, tx.safe_address);
        tx.struct_hash = StructHash(tx);

        crypto::Keccak256 hasher;
        const uint8_t prefix[2] = {0x19, 0x01};
        hasher.Update(prefix, sizeof(prefix));
        hasher.Update(tx.domain_separator.data(), tx.domain_separator.size());
        hasher.Update(tx.struct_hash.data(), tx.struct_hash.size());
        tx.safe_tx_hash = hasher.Finalize();

        MSIG_LOG_DEBUGF("SafeTxBuilder", "chainId=%llu safe=%s nonce=%s hash=%s",
            static_cast<unsigned long long>(tx.chain_id), tx.safe_address.c_str(),
            tx.nonce.str().c_str(), crypto::ToHex(tx.safe_tx_hash, true).c_str());
    }

    Hash256 SafeTransactionBuilder::DomainSeparator(uint64_t chain_id, const std::string& safe_address)
    {
        AbiEncoder enc;
        enc.AddBytes32(crypto::Keccak256::Hash(std::string(DOMAIN_TYPE)))
           .AddUint(chain_id)
           .AddAddress(safe_address);
        return crypto::Keccak256::Hash(enc.Encode());
    }

    Hash256 SafeTransactionBuilder::StructHash(const SafeTransaction& tx)
    {
        // bytes 필드는 keccak256(data)로 인코딩
        AbiEncoder enc;
        enc.AddBytes32(crypto::Keccak256::Hash(std::string(SAFE_TX_TYPE)))
           .AddAddress(tx.to)
           .AddUint(tx.value)
           .AddBytes32(crypto::Keccak256::Hash(tx.data))
           .AddUint(tx.operation)
           .AddUint(tx.safe_tx_gas)
           .AddUint(tx.base_gas)
           .AddUint(tx.gas_price)
           .AddAddress(tx.gas_token)
           .AddAddress(tx.refund_receiver)
           .AddUint(tx.nonce);
        return crypto::Keccak256::Hash(enc.Encode());
    }

    std::string SafeTransactionBuilder::ToTypedDataJson(const SafeTransaction& tx)
    {
        json j;

        j["types"]["EIP712Domain"] = json::array({
            {{"name", "chainId"}, {"type", "uint256"}},
            {{"name", "verifyingContract"}, {"type", "address"}}
        });
        j["types"]["SafeTx"] = json::array({
            {{"name", "to"}, {"type", "address"}},
            {{"name", "value"}, {"type", "uint256"}},
            {{"name", "data"}, {"type", "bytes"}},
            {{"name", "operation"}, {"type", "uint8"}},
            {{"name", "safeTxGas"}, {"type", "uint256"}},
            {{"name", "baseGas"}, {"type", "uint256"}},
            {{"name", "gasPrice"}, {"type", "uint256"}},
            {{"name", "gasToken"}, {"type", "address"}},
            {{"name", "refundReceiver"}, {"type", "address"}},
            {{"name", "nonce"}, {"type", "uint256"}}
        });
        j["primaryType"] = "SafeTx";

        j["domain"]["chainId"] = tx.chain_id;
        j["domain"]["verifyingContract"] = tx.safe_address;

        // uint256 값은 정밀도 손실을 피하기 위해 10진 문자열
        j["message"]["to"] = tx.to;
        j["message"]["value"] = tx.value.str();
        j["message"]["data"] = crypto::ToHex(tx.data, true);
        j["message"]["operation"] = tx.operation;
        j["message"]["safeTxGas"] = tx.safe_tx_gas.str();
        j["message"]["baseGas"] = tx.base_gas.str();
        j["message"]["gasPrice"] = tx.gas_price.str();
        j["message"]["gasToken"] = tx.gas_token;
        j["message"]["refundReceiver"] = tx.refund_receiver;
        j["message"]["nonce"] = tx.nonce.str();

        return j.dump();
    }

    Bytes SafeTransactionBuilder::CallDataFromMemo(const std::string& memo)
    {
        Bytes data;
        if (crypto::Has0xPrefix(memo) && crypto::TryFromHex(memo, data)) {
            return data;
        }
        return Bytes();
    }
}
