// src/multisig/signature/src/SignaturePacker.cpp
#include "multisig/signature/include/SignaturePacker.hpp"
#include "multisig/address/include/AddressNormalizer.hpp"
#include "multisig/errors/include/MultiSigException.hpp"
#include "common/crypto/include/HexUtils.hpp"
#include <algorithm>
#include <cctype>

namespace multisig_engine::multisig
{
    Bytes SignaturePacker::NormalizeSignature(const Bytes& signature)
    {
        if (signature.size() != SIGNATURE_LENGTH) {
            throw InvalidSignatureException("expected 65 bytes, got " + std::to_string(signature.size()));
        }

        Bytes out = signature;
        uint8_t& v = out[SIGNATURE_LENGTH - 1];
        if (v == 0 || v == 1) {
            v = static_cast<uint8_t>(v + 27);
        }

        // 27/28: ECDSA, 31/32: eth_sign 방식 (Safe가 v-4로 복원)
        if (v != 27 && v != 28 && v != 31 && v != 32) {
            throw InvalidSignatureException("unsupported v value " + std::to_string(v));
        }
        return out;
    }

    Bytes SignaturePacker::ParseSignature(const std::string& hex)
    {
        Bytes raw;
        if (!crypto::TryFromHex(hex, raw)) {
            throw InvalidSignatureException("not a hex string");
        }
        return NormalizeSignature(raw);
    }

    bool SignaturePacker::IsWellFormed(const std::string& hex)
    {
        try {
            ParseSignature(hex);
            return true;
        } catch (const InvalidSignatureException&) {
            return false;
        }
    }

    Bytes SignaturePacker::Pack(const std::vector<SignerSignature>& signatures)
    {
        if (signatures.empty()) {
            throw InvalidSignatureException("no signatures provided");
        }

        std::vector<std::pair<std::string, Bytes>> sorted;
        sorted.reserve(signatures.size());

        for (const auto& entry : signatures) {
            std::string key = AddressNormalizer::Normalize(entry.signer);
            std::transform(key.begin(), key.end(), key.begin(),
                [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            sorted.emplace_back(std::move(key), NormalizeSignature(entry.signature));
        }

        std::sort(sorted.begin(), sorted.end(),
            [](const auto& a, const auto& b) { return a.first < b.first; });

        for (size_t i = 1; i < sorted.size(); ++i) {
            if (sorted[i].first == sorted[i - 1].first) {
                throw InvalidSignatureException("duplicate signer " + sorted[i].first);
            }
        }

        Bytes packed;
        packed.reserve(sorted.size() * SIGNATURE_LENGTH);
        for (const auto& item : sorted) {
            packed.insert(packed.end(), item.second.begin(), item.second.end());
        }
        return packed;
    }
}
