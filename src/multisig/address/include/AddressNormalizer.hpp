// src/multisig/address/include/AddressNormalizer.hpp
#pragma once
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace multisig_engine::multisig
{
    using AddressBytes = std::array<uint8_t, 20>;

    /**
     * @brief EVM 주소 정규화 (EIP-55 체크섬 형식)
     *
     * 허용 입력:
     * - 앞뒤 공백, "0x"/"0X" 접두어 생략 가능
     * - 40자리 16진수, 또는 앞 24자리가 0인 64자리 ABI 패딩 워드
     * - 전부 소문자/전부 대문자는 허용, 대소문자 혼합은 체크섬과 일치해야 함
     *
     * 서명자 비교/포함 여부 판정은 반드시 Normalize() 결과로 수행합니다.
     */
    class AddressNormalizer
    {
    public:
        static constexpr const char* ZERO_ADDRESS = "0x0000000000000000000000000000000000000000";

        /**
         * @throws InvalidAddressException
         */
        static std::string Normalize(const std::string& address);
        static bool TryNormalize(const std::string& address, std::string& out);
        static bool IsValid(const std::string& address);

        // 둘 중 하나라도 유효하지 않으면 false
        static bool Equals(const std::string& a, const std::string& b);

        /**
         * @brief 오름차순 비교 (소문자 16진 기준)
         * @return <0, 0, >0
         */
        static int Compare(const std::string& a, const std::string& b);

        static AddressBytes ToBytes(const std::string& address);
        static std::string FromBytes(const uint8_t* data);
        static std::string FromBytes(const AddressBytes& bytes);

        // 40자리 소문자 16진 → "0x" + 체크섬
        static std::string ToChecksum(const std::string& lower_hex40);

        static std::vector<std::string> NormalizeAll(const std::vector<std::string>& addresses);
    };

    /**
     * @brief 배포 전/온체인 비활성 체인용 결정적 대체 주소
     *
     * checksum(keccak256("multisig_" + wallet_id)[12..32])
     */
    std::string DeriveFallbackAddress(const std::string& wallet_id);
}
