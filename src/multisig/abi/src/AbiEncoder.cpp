// src/multisig/abi/src/AbiEncoder.cpp
#include "multisig/abi/include/AbiEncoder.hpp"
#include "multisig/address/include/AddressNormalizer.hpp"
#include "common/crypto/include/HexUtils.hpp"
#include <stdexcept>

namespace multisig_engine::multisig
{
    namespace
    {
        constexpr size_t WORD = 32;
    }

    // ========================================
    // 정수 변환
    // ========================================

    uint256_t Uint256FromBytes(const uint8_t* data, size_t length)
    {
        uint256_t value = 0;
        for (size_t i = 0; i < length; ++i) {
            value <<= 8;
            value |= data[i];
        }
        return value;
    }

    Bytes Uint256ToBytes(const uint256_t& value)
    {
        Bytes out(WORD, 0);
        uint256_t v = value;
        for (size_t i = 0; i < WORD; ++i) {
            out[WORD - 1 - i] = static_cast<uint8_t>(v & 0xFF);
            v >>= 8;
        }
        return out;
    }

    uint256_t ParseHexQuantity(const std::string& hex)
    {
        std::string body = crypto::Strip0x(hex);
        if (body.empty() || body.size() > 64) {
            throw std::invalid_argument("Invalid hex quantity: " + hex);
        }

        uint256_t value = 0;
        for (char c : body) {
            int digit = crypto::HexDigitValue(c);
            if (digit < 0) {
                throw std::invalid_argument("Invalid hex quantity: " + hex);
            }
            value <<= 4;
            value |= static_cast<unsigned>(digit);
        }
        return value;
    }

    std::string ToHexQuantity(const uint256_t& value)
    {
        if (value == 0) {
            return "0x0";
        }

        static const char* digits = "0123456789abcdef";
        std::string reversed;
        uint256_t v = value;
        while (v > 0) {
            reversed.push_back(digits[static_cast<unsigned>(v & 0x0F)]);
            v >>= 4;
        }
        return "0x" + std::string(reversed.rbegin(), reversed.rend());
    }

    // ========================================
    // 워드 헬퍼
    // ========================================

    Selector AbiEncoder::FunctionSelector(const std::string& signature)
    {
        Hash256 hash = crypto::Keccak256::Hash(signature);
        Selector selector{};
        std::copy(hash.begin(), hash.begin() + 4, selector.begin());
        return selector;
    }

    Hash256 AbiEncoder::EventTopic(const std::string& signature)
    {
        return crypto::Keccak256::Hash(signature);
    }

    Bytes AbiEncoder::EncodeUint(const uint256_t& value)
    {
        return Uint256ToBytes(value);
    }

    Bytes AbiEncoder::EncodeAddress(const std::string& address)
    {
        AddressBytes raw = AddressNormalizer::ToBytes(address);
        Bytes out(WORD - raw.size(), 0);
        out.insert(out.end(), raw.begin(), raw.end());
        return out;
    }

    Bytes AbiEncoder::PadRight(const Bytes& data)
    {
        Bytes out = data;
        size_t remainder = data.size() % WORD;
        if (remainder != 0) {
            out.resize(data.size() + (WORD - remainder), 0);
        }
        return out;
    }

    uint256_t AbiEncoder::DecodeUint(const Bytes& data, size_t word_index)
    {
        size_t offset = word_index * WORD;
        if (data.size() < offset + WORD) {
            throw std::out_of_range("ABI data too short for word " + std::to_string(word_index));
        }
        return Uint256FromBytes(data.data() + offset, WORD);
    }

    std::string AbiEncoder::DecodeAddress(const Bytes& data, size_t word_index)
    {
        size_t offset = word_index * WORD;
        if (data.size() < offset + WORD) {
            throw std::out_of_range("ABI data too short for word " + std::to_string(word_index));
        }
        return AddressNormalizer::FromBytes(data.data() + offset + 12);
    }

    // ========================================
    // 인자 추가
    // ========================================

    AbiEncoder& AbiEncoder::AddUint(const uint256_t& value)
    {
        args.push_back({false, EncodeUint(value)});
        return *this;
    }

    AbiEncoder& AbiEncoder::AddAddress(const std::string& address)
    {
        args.push_back({false, EncodeAddress(address)});
        return *this;
    }

    AbiEncoder& AbiEncoder::AddBytes32(const Hash256& value)
    {
        args.push_back({false, Bytes(value.begin(), value.end())});
        return *this;
    }

    AbiEncoder& AbiEncoder::AddBytes(const Bytes& value)
    {
        Bytes encoded = EncodeUint(value.size());
        Bytes padded = PadRight(value);
        encoded.insert(encoded.end(), padded.begin(), padded.end());

        args.push_back({true, std::move(encoded)});
        return *this;
    }

    AbiEncoder& AbiEncoder::AddAddressArray(const std::vector<std::string>& addresses)
    {
        Bytes encoded = EncodeUint(addresses.size());
        for (const auto& address : addresses) {
            Bytes word = EncodeAddress(address);
            encoded.insert(encoded.end(), word.begin(), word.end());
        }

        args.push_back({true, std::move(encoded)});
        return *this;
    }

    // ========================================
    // 인코딩
    // ========================================

    Bytes AbiEncoder::Encode() const
    {
        const size_t head_size = args.size() * WORD;

        Bytes head;
        Bytes tail;
        head.reserve(head_size);

        for (const auto& arg : args) {
            if (arg.dynamic) {
                Bytes offset = EncodeUint(head_size + tail.size());
                head.insert(head.end(), offset.begin(), offset.end());
                tail.insert(tail.end(), arg.data.begin(), arg.data.end());
            } else {
                head.insert(head.end(), arg.data.begin(), arg.data.end());
            }
        }

        head.insert(head.end(), tail.begin(), tail.end());
        return head;
    }

    Bytes AbiEncoder::EncodeCall(const std::string& signature) const
    {
        Selector selector = FunctionSelector(signature);
        Bytes out(selector.begin(), selector.end());

        Bytes body = Encode();
        out.insert(out.end(), body.begin(), body.end());
        return out;
    }
}
