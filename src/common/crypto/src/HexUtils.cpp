// src/common/crypto/src/HexUtils.cpp
#include "common/crypto/include/HexUtils.hpp"
#include <stdexcept>

namespace multisig_engine::crypto
{
    namespace
    {
        constexpr char HEX_DIGITS[] = "0123456789abcdef";
    }

    int HexDigitValue(char c)
    {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    std::string ToHex(const uint8_t* data, size_t length, bool prefix)
    {
        std::string out;
        out.reserve(length * 2 + (prefix ? 2 : 0));
        if (prefix) {
            out += "0x";
        }
        for (size_t i = 0; i < length; ++i) {
            out.push_back(HEX_DIGITS[data[i] >> 4]);
            out.push_back(HEX_DIGITS[data[i] & 0x0F]);
        }
        return out;
    }

    std::string ToHex(const Bytes& data, bool prefix)
    {
        return ToHex(data.data(), data.size(), prefix);
    }

    std::string ToHex(const Hash256& hash, bool prefix)
    {
        return ToHex(hash.data(), hash.size(), prefix);
    }

    bool Has0xPrefix(const std::string& value)
    {
        return value.size() >= 2 && value[0] == '0' && (value[1] == 'x' || value[1] == 'X');
    }

    std::string Strip0x(const std::string& value)
    {
        return Has0xPrefix(value) ? value.substr(2) : value;
    }

    bool IsHexString(const std::string& value)
    {
        std::string body = Strip0x(value);
        for (char c : body) {
            if (HexDigitValue(c) < 0) {
                return false;
            }
        }
        return true;
    }

    bool TryFromHex(const std::string& hex, Bytes& out)
    {
        std::string body = Strip0x(hex);
        if (body.size() % 2 != 0) {
            return false;
        }

        Bytes result;
        result.reserve(body.size() / 2);
        for (size_t i = 0; i < body.size(); i += 2) {
            int hi = HexDigitValue(body[i]);
            int lo = HexDigitValue(body[i + 1]);
            if (hi < 0 || lo < 0) {
                return false;
            }
            result.push_back(static_cast<uint8_t>((hi << 4) | lo));
        }

        out = std::move(result);
        return true;
    }

    Bytes FromHex(const std::string& hex)
    {
        Bytes out;
        if (!TryFromHex(hex, out)) {
            throw std::invalid_argument("Invalid hex string: " + hex);
        }
        return out;
    }
}
