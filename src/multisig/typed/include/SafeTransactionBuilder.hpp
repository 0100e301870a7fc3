// src/multisig/typed/include/SafeTransactionBuilder.hpp
#pragma once
#include "multisig/abi/include/AbiEncoder.hpp"
#include "multisig/address/include/AddressNormalizer.hpp"
#include <cstdint>
#include <string>

namespace multisig_engine::multisig
{
    /**
     * @brief Safe 컨트랙트가 검증하는 EIP-712 트랜잭션
     *
     * 단순 전송에서는 operation=0(CALL), gas 관련 값 0, gasToken/refundReceiver = 0 주소.
     */
    struct SafeTransaction
    {
        uint64_t chain_id = 0;
        std::string safe_address;           // verifyingContract
        std::string to;
        uint256_t value = 0;
        Bytes data;
        uint8_t operation = 0;
        uint256_t safe_tx_gas = 0;
        uint256_t base_gas = 0;
        uint256_t gas_price = 0;
        std::string gas_token = AddressNormalizer::ZERO_ADDRESS;
        std::string refund_receiver = AddressNormalizer::ZERO_ADDRESS;
        uint256_t nonce = 0;

        Hash256 domain_separator{};
        Hash256 struct_hash{};
        Hash256 safe_tx_hash{};             // 서명 대상 해시
    };

    /**
     * @brief EIP-712 도메인/메시지 구성 및 해시 계산
     *
     * hash = keccak256(0x19 ‖ 0x01 ‖ domainSeparator ‖ structHash)
     * 빌더는 서명하지 않습니다. 서명은 외부 서명 협력자가 safe_tx_hash 위에 생성합니다.
     */
    class SafeTransactionBuilder
    {
    public:
        static constexpr const char* DOMAIN_TYPE =
            "EIP712Domain(uint256 chainId,address verifyingContract)";
        static constexpr const char* SAFE_TX_TYPE =
            "SafeTx(address to,uint256 value,bytes data,uint8 operation,uint256 safeTxGas,"
            "uint256 baseGas,uint256 gasPrice,address gasToken,address refundReceiver,uint256 nonce)";

        /**
         * @brief 단순 전송 트랜잭션 구성 + 해시 계산
         * @throws InvalidAddressException safe/to 주소가 유효하지 않은 경우
         */
        static SafeTransaction Build(
            uint64_t chain_id,
            const std::string& safe_address,
            const std::string& to,
            const uint256_t& value,
            const Bytes& data,
            const uint256_t& nonce
        );

        // 필드를 직접 채운 트랜잭션의 해시 재계산
        static void Finalize(SafeTransaction& tx);

        static Hash256 DomainSeparator(uint64_t chain_id, const std::string& safe_address);
        static Hash256 StructHash(const SafeTransaction& tx);

        /**
         * @brief eth_signTypedData_v4 요청 본문 (domain/types/primaryType/message)
         */
        static std::string ToTypedDataJson(const SafeTransaction& tx);

        /**
         * @brief 메모 → call data ("0x"로 시작하는 16진 문자열만 데이터로 취급)
         */
        static Bytes CallDataFromMemo(const std::string& memo);
    };
}
