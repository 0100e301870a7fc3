// src/common/crypto/include/Keccak256.hpp
#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace multisig_engine::crypto
{
    using Bytes = std::vector<uint8_t>;
    using Hash256 = std::array<uint8_t, 32>;

    /**
     * @brief Ethereum Keccak-256 (ethash::keccak256, NIST SHA3-256 아님)
     *
     * 주소 체크섬, 함수 selector, EIP-712 해시가 모두 이 해시를 사용합니다.
     * 여러 조각을 이어 해시할 때: Update() 여러 번 → Finalize() 한 번.
     */
    class Keccak256
    {
    public:
        void Update(const uint8_t* data, size_t length);
        void Update(const Bytes& data) { Update(data.data(), data.size()); }
        void Update(const std::string& data);

        /**
         * @brief 해시 완료. 호출 후 누적 입력은 비워집니다.
         */
        Hash256 Finalize();

        static Hash256 Hash(const uint8_t* data, size_t length);
        static Hash256 Hash(const Bytes& data);
        static Hash256 Hash(const std::string& data);

    private:
        Bytes pending;
    };

    inline Bytes ToBytes(const Hash256& hash)
    {
        return Bytes(hash.begin(), hash.end());
    }
}
