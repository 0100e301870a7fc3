// src/multisig/signature/include/SignaturePacker.hpp
#pragma once
#include "common/crypto/include/Keccak256.hpp"
#include <string>
#include <vector>

namespace multisig_engine::multisig
{
    using crypto::Bytes;

    struct SignerSignature
    {
        std::string signer;     // 서명자 주소 (정규화 전이어도 됨)
        Bytes signature;        // r(32) ‖ s(32) ‖ v(1)
    };

    /**
     * @brief Safe execTransaction용 서명 묶음 생성
     *
     * 정렬 규칙: 서명자 주소(소문자) 오름차순. 컨트랙트가 이 순서를 가정하고 검증하므로
     * 순서가 틀리면 온체인 호출이 revert 됩니다. 입력 순서와 무관하게 같은 결과를 냅니다.
     */
    class SignaturePacker
    {
    public:
        static constexpr size_t SIGNATURE_LENGTH = 65;

        /**
         * @throws InvalidSignatureException 빈 입력, 길이 오류, 중복 서명자, 잘못된 v
         * @throws InvalidAddressException 서명자 주소 오류
         */
        static Bytes Pack(const std::vector<SignerSignature>& signatures);

        // v ∈ {0,1} → {27,28}
        static Bytes NormalizeSignature(const Bytes& signature);

        /**
         * @brief "0x" 16진 서명 파싱 + 정규화
         * @throws InvalidSignatureException
         */
        static Bytes ParseSignature(const std::string& hex);
        static bool IsWellFormed(const std::string& hex);
    };
}
