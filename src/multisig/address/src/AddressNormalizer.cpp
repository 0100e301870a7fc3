// src/multisig/address/src/AddressNormalizer.cpp
#include "multisig/address/include/AddressNormalizer.hpp"
#include "multisig/errors/include/MultiSigException.hpp"
#include "common/crypto/include/HexUtils.hpp"
#include "common/crypto/include/Keccak256.hpp"
#include <algorithm>
#include <cctype>

namespace multisig_engine::multisig
{
    namespace
    {
        bool ExtractBody(const std::string& address, std::string& body)
        {
            size_t start = address.find_first_not_of(" \t\r\n");
            if (start == std::string::npos) {
                return false;
            }
            size_t end = address.find_last_not_of(" \t\r\n");
            std::string trimmed = crypto::Strip0x(address.substr(start, end - start + 1));

            if (trimmed.size() == 64) {
                // ABI 패딩 워드: 앞 12바이트가 0이어야 함
                if (trimmed.find_first_not_of('0') < 24) {
                    return false;
                }
                trimmed = trimmed.substr(24);
            }

            if (trimmed.size() != 40 || !crypto::IsHexString(trimmed)) {
                return false;
            }

            body = trimmed;
            return true;
        }

        std::string ToLower(const std::string& s)
        {
            std::string out = s;
            std::transform(out.begin(), out.end(), out.begin(),
                [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return out;
        }
    }

    std::string AddressNormalizer::ToChecksum(const std::string& lower_hex40)
    {
        crypto::Hash256 hash = crypto::Keccak256::Hash(lower_hex40);

        std::string out = "0x";
        out.reserve(42);
        for (size_t i = 0; i < lower_hex40.size(); ++i) {
            char c = lower_hex40[i];
            uint8_t nibble = (i % 2 == 0) ? (hash[i / 2] >> 4) : (hash[i / 2] & 0x0F);
            if (c >= 'a' && c <= 'f' && nibble >= 8) {
                c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            }
            out.push_back(c);
        }
        return out;
    }

    bool AddressNormalizer::TryNormalize(const std::string& address, std::string& out)
    {
        std::string body;
        if (!ExtractBody(address, body)) {
            return false;
        }

        bool has_lower = std::any_of(body.begin(), body.end(),
            [](unsigned char c) { return c >= 'a' && c <= 'f'; });
        bool has_upper = std::any_of(body.begin(), body.end(),
            [](unsigned char c) { return c >= 'A' && c <= 'F'; });

        std::string checksummed = ToChecksum(ToLower(body));

        // 대소문자 혼합 입력은 체크섬으로 간주하고 검증
        if (has_lower && has_upper && checksummed.substr(2) != body) {
            return false;
        }

        out = checksummed;
        return true;
    }

    std::string AddressNormalizer::Normalize(const std::string& address)
    {
        std::string out;
        if (!TryNormalize(address, out)) {
            throw InvalidAddressException(address);
        }
        return out;
    }

    bool AddressNormalizer::IsValid(const std::string& address)
    {
        std::string ignored;
        return TryNormalize(address, ignored);
    }

    bool AddressNormalizer::Equals(const std::string& a, const std::string& b)
    {
        std::string na;
        std::string nb;
        if (!TryNormalize(a, na) || !TryNormalize(b, nb)) {
            return false;
        }
        return na == nb;
    }

    int AddressNormalizer::Compare(const std::string& a, const std::string& b)
    {
        return ToLower(Normalize(a)).compare(ToLower(Normalize(b)));
    }

    AddressBytes AddressNormalizer::ToBytes(const std::string& address)
    {
        crypto::Bytes raw = crypto::FromHex(Normalize(address));

        AddressBytes out{};
        std::copy(raw.begin(), raw.end(), out.begin());
        return out;
    }

    std::string AddressNormalizer::FromBytes(const uint8_t* data)
    {
        return ToChecksum(crypto::ToHex(data, 20));
    }

    std::string AddressNormalizer::FromBytes(const AddressBytes& bytes)
    {
        return FromBytes(bytes.data());
    }

    std::vector<std::string> AddressNormalizer::NormalizeAll(const std::vector<std::string>& addresses)
    {
        std::vector<std::string> out;
        out.reserve(addresses.size());
        for (const auto& address : addresses) {
            out.push_back(Normalize(address));
        }
        return out;
    }

    std::string DeriveFallbackAddress(const std::string& wallet_id)
    {
        crypto::Hash256 hash = crypto::Keccak256::Hash("multisig_" + wallet_id);
        return AddressNormalizer::FromBytes(hash.data() + 12);
    }
}
