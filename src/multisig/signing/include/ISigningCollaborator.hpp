// src/multisig/signing/include/ISigningCollaborator.hpp
#pragma once
#include "multisig/typed/include/SafeTransactionBuilder.hpp"
#include <string>

namespace multisig_engine::multisig
{
    /**
     * @brief 외부 서명 협력자
     *
     * 이 엔진은 개인키를 보관하지 않습니다. 서명 시 서명자가 직접 제출하지 않은 서명은
     * 실행 직전에 이 인터페이스로 요청합니다.
     */
    class ISigningCollaborator
    {
    public:
        virtual ~ISigningCollaborator() = default;

        /**
         * @brief 서명 요청
         * @param signer 정규화된 서명자 주소
         * @param tx 서명 대상 (tx.safe_tx_hash)
         * @param signature 성공 시 65바이트 r‖s‖v
         * @return 서명을 얻지 못하면 false
         */
        virtual bool RequestSignature(
            const std::string& signer,
            const SafeTransaction& tx,
            Bytes& signature
        ) = 0;
    };
}
