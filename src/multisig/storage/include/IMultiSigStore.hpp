// src/multisig/storage/include/IMultiSigStore.hpp
#pragma once
#include "multisig/model/include/MultiSigTypes.hpp"
#include <string>
#include <vector>

namespace multisig_engine::multisig
{
    /**
     * @brief 멀티시그 레코드 저장소 공통 인터페이스
     *
     * - read-your-writes 일관성
     * - PendingTransaction은 version 기반 compare-and-swap 갱신만 허용
     * - Find* 계열은 복사본을 반환 (호출자가 수정해도 저장소에 반영되지 않음)
     */
    class IMultiSigStore
    {
    public:
        virtual ~IMultiSigStore() = default;

        /**
         * @brief 저장소 초기화
         * @return 성공 시 true, 실패 시 false
         */
        virtual bool Initialize() = 0;
        virtual bool IsInitialized() const = 0;

        // ---- 지갑 ----
        /**
         * @return 동일 id가 이미 있으면 false
         */
        virtual bool InsertWallet(const MultiSigWallet& wallet) = 0;
        /**
         * @return 존재하지 않으면 false
         */
        virtual bool UpdateWallet(const MultiSigWallet& wallet) = 0;
        virtual bool FindWallet(const std::string& wallet_id, MultiSigWallet& out) const = 0;

        // ---- 서명자 ----
        /**
         * @return 같은 지갑에 같은 주소가 이미 있으면 false
         */
        virtual bool InsertSigner(const Signer& signer) = 0;
        virtual bool DeleteSigner(const std::string& wallet_id, const std::string& address) = 0;
        virtual std::vector<Signer> ListSigners(const std::string& wallet_id) const = 0;

        // ---- 대기 트랜잭션 ----
        virtual bool InsertTransaction(const PendingTransaction& tx) = 0;
        virtual bool FindTransaction(const std::string& tx_id, PendingTransaction& out) const = 0;

        /**
         * @brief 조건부 갱신
         *
         * 저장된 version이 expected_version과 같을 때만 record를 기록하고
         * record.version을 expected_version + 1로 설정합니다.
         * @return version 불일치 또는 미존재 시 false (저장소 변경 없음)
         */
        virtual bool CompareAndSwapTransaction(PendingTransaction& record, uint64_t expected_version) = 0;

        // 지갑의 모든 트랜잭션 (상태 무관, 순서 보장 없음)
        virtual std::vector<PendingTransaction> ListTransactions(const std::string& wallet_id) const = 0;
    };
}
