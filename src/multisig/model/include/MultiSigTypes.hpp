// src/multisig/model/include/MultiSigTypes.hpp
#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace multisig_engine::multisig
{
    // ========================================
    // 지갑 / 서명자
    // ========================================

    enum class AddressKind
    {
        PLACEHOLDER = 0,  // 결정적 폴백 주소 (온체인 검증 불가)
        DEPLOYED = 1      // 실제 배포된 Safe 프록시 주소
    };

    const char* ToString(AddressKind kind);
    AddressKind AddressKindFromString(const std::string& str);

    struct MultiSigWallet
    {
        std::string id;
        std::string user_id;
        std::string chain;                  // 소문자 체인 이름 (ethereum, polygon ...)
        std::string address;                // 체크섬 형식
        AddressKind address_kind = AddressKind::PLACEHOLDER;
        uint32_t threshold = 0;             // t
        uint32_t total_signers = 0;         // n (1 <= t <= n)
        std::string label;                  // "MultiSig t/n"
        int64_t created_at_ms = 0;
        std::string deployment_tx_hash;

        std::string ToJson() const;
        bool FromJson(const std::string& json_str);
    };

    struct Signer
    {
        std::string wallet_id;
        std::string address;                // 정규화된 주소, 지갑 내 유일
        std::string name;
        std::string contact;
        int64_t added_at_ms = 0;

        std::string ToJson() const;
        bool FromJson(const std::string& json_str);
    };

    /**
     * @brief 지갑 생성/서명자 추가 입력
     */
    struct SignerInput
    {
        std::string address;
        std::string name;
        std::string contact;
    };

    struct WalletDetails
    {
        MultiSigWallet wallet;
        std::vector<Signer> signers;
    };

    // ========================================
    // 대기 트랜잭션
    // ========================================

    enum class TransactionStatus
    {
        PENDING = 0,
        EXECUTED = 1,
        CANCELLED = 2,
        EXPIRED = 3
    };

    const char* ToString(TransactionStatus status);
    TransactionStatus TransactionStatusFromString(const std::string& str);

    /**
     * @brief 서명 수집 중인 트랜잭션 레코드
     *
     * 불변식:
     * - current_signatures == signed_by.size(), signed_by 중복 없음
     * - signed_by ⊆ eligible_signers (제안 시점 서명자 스냅샷)
     * - status != PENDING 이면 signed_by 변경 불가
     * - version은 저장소 CAS 갱신마다 1 증가
     */
    struct PendingTransaction
    {
        std::string id;
        std::string wallet_id;
        std::string chain;
        std::string to_address;
        std::string amount;                 // 10진 문자열, 체인 기본 단위 (ether)
        std::string memo;                   // "0x..." 이면 call data로 사용
        uint32_t required_signatures = 0;   // 제안 시점 threshold 스냅샷
        uint32_t current_signatures = 0;
        std::vector<std::string> signed_by;
        std::vector<std::string> eligible_signers;
        std::map<std::string, std::string> signatures;  // signer → 0x 65바이트 서명
        std::string proposer;
        TransactionStatus status = TransactionStatus::PENDING;
        int64_t created_at_ms = 0;
        int64_t expires_at_ms = 0;
        int64_t executed_at_ms = 0;
        std::string execution_tx_hash;
        std::string last_error;
        uint64_t version = 0;

        bool IsPending() const { return status == TransactionStatus::PENDING; }
        bool IsExpiredAt(int64_t now_ms) const { return now_ms > expires_at_ms; }
        bool ThresholdReached() const { return current_signatures >= required_signatures; }
        bool HasSigned(const std::string& normalized_address) const;
        bool WasEligible(const std::string& normalized_address) const;

        std::string ToJson() const;
        bool FromJson(const std::string& json_str);
    };
}
