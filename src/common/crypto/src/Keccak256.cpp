// src/common/crypto/src/Keccak256.cpp
#include "common/crypto/include/Keccak256.hpp"
#include <ethash/keccak.hpp>
#include <algorithm>

namespace multisig_engine::crypto
{
    void Keccak256::Update(const uint8_t* data, size_t length)
    {
        pending.insert(pending.end(), data, data + length);
    }

    void Keccak256::Update(const std::string& data)
    {
        Update(reinterpret_cast<const uint8_t*>(data.data()), data.size());
    }

    Hash256 Keccak256::Finalize()
    {
        Hash256 out = Hash(pending.data(), pending.size());
        pending.clear();
        return out;
    }

    Hash256 Keccak256::Hash(const uint8_t* data, size_t length)
    {
        const ethash::hash256 digest = ethash::keccak256(data, length);

        Hash256 out{};
        std::copy(std::begin(digest.bytes), std::end(digest.bytes), out.begin());
        return out;
    }

    Hash256 Keccak256::Hash(const Bytes& data)
    {
        return Hash(data.data(), data.size());
    }

    Hash256 Keccak256::Hash(const std::string& data)
    {
        return Hash(reinterpret_cast<const uint8_t*>(data.data()), data.size());
    }
}
