// src/common/crypto/include/HexUtils.hpp
#pragma once
#include "common/crypto/include/Keccak256.hpp"
#include <string>

namespace multisig_engine::crypto
{
    /**
     * @brief 16진수 문자열 변환
     *
     * - ToHex: 항상 소문자, prefix=true이면 "0x" 부착
     * - FromHex: "0x"/"0X" 접두어 허용, 홀수 길이/비16진 문자는 std::invalid_argument
     */
    std::string ToHex(const uint8_t* data, size_t length, bool prefix = false);
    std::string ToHex(const Bytes& data, bool prefix = false);
    std::string ToHex(const Hash256& hash, bool prefix = false);

    Bytes FromHex(const std::string& hex);
    bool TryFromHex(const std::string& hex, Bytes& out);

    bool Has0xPrefix(const std::string& value);
    std::string Strip0x(const std::string& value);
    bool IsHexString(const std::string& value);  // 접두어 제외 부분이 모두 16진 문자

    int HexDigitValue(char c);  // 16진 문자가 아니면 -1
}
