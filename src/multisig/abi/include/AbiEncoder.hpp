// src/multisig/abi/include/AbiEncoder.hpp
#pragma once
#include "common/crypto/include/Keccak256.hpp"
#include "multisig/model/include/Amount.hpp"
#include <array>
#include <string>
#include <vector>

namespace multisig_engine::multisig
{
    using crypto::Bytes;
    using crypto::Hash256;

    using Selector = std::array<uint8_t, 4>;

    /**
     * @brief Solidity ABI 인코더 (head/tail)
     *
     * 정적 인자(uint256, address, bytes32)는 head에 32바이트 워드로,
     * 동적 인자(bytes, address[])는 head에 오프셋, tail에 길이+데이터를 둡니다.
     *
     * 사용 예:
     *   AbiEncoder enc;
     *   enc.AddAddress(to).AddUint(value).AddBytes(data);
     *   Bytes call = enc.EncodeCall("foo(address,uint256,bytes)");
     */
    class AbiEncoder
    {
    public:
        AbiEncoder& AddUint(const uint256_t& value);
        AbiEncoder& AddAddress(const std::string& address);
        AbiEncoder& AddBytes32(const Hash256& value);
        AbiEncoder& AddBytes(const Bytes& value);
        AbiEncoder& AddAddressArray(const std::vector<std::string>& addresses);

        Bytes Encode() const;
        Bytes EncodeCall(const std::string& signature) const;

        size_t ArgumentCount() const { return args.size(); }

        // ---- 워드 단위 헬퍼 ----
        static Selector FunctionSelector(const std::string& signature);
        static Hash256 EventTopic(const std::string& signature);

        static Bytes EncodeUint(const uint256_t& value);
        static Bytes EncodeAddress(const std::string& address);
        static Bytes PadRight(const Bytes& data);

        /**
         * @brief 32바이트 워드 디코딩
         * @throws std::out_of_range 데이터가 짧은 경우
         */
        static uint256_t DecodeUint(const Bytes& data, size_t word_index);
        static std::string DecodeAddress(const Bytes& data, size_t word_index);

    private:
        struct Argument
        {
            bool dynamic = false;
            Bytes data;
        };

        std::vector<Argument> args;
    };

    uint256_t Uint256FromBytes(const uint8_t* data, size_t length);
    Bytes Uint256ToBytes(const uint256_t& value);  // 32바이트 big-endian

    /**
     * @brief "0x1a" 형태 JSON-RPC 수량 → 정수
     * @throws std::invalid_argument
     */
    uint256_t ParseHexQuantity(const std::string& hex);
    std::string ToHexQuantity(const uint256_t& value);
}
