// src/multisig/errors/include/MultiSigException.hpp
#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace multisig_engine::multisig
{
    enum class MultiSigErrorCode : int32_t
    {
        NONE = 0,
        INVALID_ADDRESS = 1,
        THRESHOLD_INVARIANT_VIOLATED = 2,
        NOT_FOUND = 3,
        NOT_PENDING = 4,
        EXPIRED = 5,
        ALREADY_SIGNED = 6,
        UNAUTHORIZED = 7,
        DEPLOYMENT_FAILED = 8,
        EXECUTION_FAILED = 9,
        ONCHAIN_UNSUPPORTED_FOR_CHAIN = 10,
        DUPLICATE_SIGNER = 11,
        INVALID_AMOUNT = 12,
        INVALID_SIGNATURE = 13,
        INVALID_ARGUMENT = 14,
        THRESHOLD_NOT_REACHED = 15,
        ALREADY_DEPLOYED = 16,
        CONCURRENT_MODIFICATION = 17,
        STORAGE_FAILURE = 18,
        INTERNAL_ERROR = 99
    };

    inline const char* MultiSigErrorCodeToString(MultiSigErrorCode code)
    {
        switch (code) {
            case MultiSigErrorCode::NONE: return "NONE";
            case MultiSigErrorCode::INVALID_ADDRESS: return "INVALID_ADDRESS";
            case MultiSigErrorCode::THRESHOLD_INVARIANT_VIOLATED: return "THRESHOLD_INVARIANT_VIOLATED";
            case MultiSigErrorCode::NOT_FOUND: return "NOT_FOUND";
            case MultiSigErrorCode::NOT_PENDING: return "NOT_PENDING";
            case MultiSigErrorCode::EXPIRED: return "EXPIRED";
            case MultiSigErrorCode::ALREADY_SIGNED: return "ALREADY_SIGNED";
            case MultiSigErrorCode::UNAUTHORIZED: return "UNAUTHORIZED";
            case MultiSigErrorCode::DEPLOYMENT_FAILED: return "DEPLOYMENT_FAILED";
            case MultiSigErrorCode::EXECUTION_FAILED: return "EXECUTION_FAILED";
            case MultiSigErrorCode::ONCHAIN_UNSUPPORTED_FOR_CHAIN: return "ONCHAIN_UNSUPPORTED_FOR_CHAIN";
            case MultiSigErrorCode::DUPLICATE_SIGNER: return "DUPLICATE_SIGNER";
            case MultiSigErrorCode::INVALID_AMOUNT: return "INVALID_AMOUNT";
            case MultiSigErrorCode::INVALID_SIGNATURE: return "INVALID_SIGNATURE";
            case MultiSigErrorCode::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
            case MultiSigErrorCode::THRESHOLD_NOT_REACHED: return "THRESHOLD_NOT_REACHED";
            case MultiSigErrorCode::ALREADY_DEPLOYED: return "ALREADY_DEPLOYED";
            case MultiSigErrorCode::CONCURRENT_MODIFICATION: return "CONCURRENT_MODIFICATION";
            case MultiSigErrorCode::STORAGE_FAILURE: return "STORAGE_FAILURE";
            default: return "INTERNAL_ERROR";
        }
    }

    /**
     * @brief 실행 실패 원인
     */
    enum class ExecutionFailureReason
    {
        UNKNOWN = 0,
        REVERTED,
        INSUFFICIENT_FUNDS,
        RPC_UNAVAILABLE,
        MISSING_SIGNATURE
    };

    inline const char* ExecutionFailureReasonToString(ExecutionFailureReason reason)
    {
        switch (reason) {
            case ExecutionFailureReason::REVERTED: return "reverted";
            case ExecutionFailureReason::INSUFFICIENT_FUNDS: return "insufficient_funds";
            case ExecutionFailureReason::RPC_UNAVAILABLE: return "rpc_unavailable";
            case ExecutionFailureReason::MISSING_SIGNATURE: return "missing_signature";
            default: return "unknown";
        }
    }

    /**
     * @brief 멀티시그 기본 예외 클래스
     *
     * 모든 하위 예외는 요청 단위로 복구 가능한 결과이며 프로세스를 종료시키지 않습니다.
     * 라우터는 code()를 응답 헤더의 error_code로 그대로 사용합니다.
     */
    class MultiSigException : public std::runtime_error
    {
    public:
        MultiSigException(MultiSigErrorCode code, const std::string& msg)
            : std::runtime_error(msg), error_code(code) {}

        MultiSigErrorCode code() const { return error_code; }

    private:
        MultiSigErrorCode error_code;
    };

    class InvalidAddressException : public MultiSigException
    {
    public:
        explicit InvalidAddressException(const std::string& address)
            : MultiSigException(MultiSigErrorCode::INVALID_ADDRESS, "Invalid address: " + address) {}
    };

    class ThresholdInvariantException : public MultiSigException
    {
    public:
        ThresholdInvariantException(uint32_t threshold, uint32_t signer_count)
            : MultiSigException(MultiSigErrorCode::THRESHOLD_INVARIANT_VIOLATED,
                "Threshold invariant violated: threshold=" + std::to_string(threshold) +
                ", signers=" + std::to_string(signer_count)) {}
    };

    class NotFoundException : public MultiSigException
    {
    public:
        NotFoundException(const std::string& kind, const std::string& id)
            : MultiSigException(MultiSigErrorCode::NOT_FOUND, kind + " not found: " + id) {}
    };

    class NotPendingException : public MultiSigException
    {
    public:
        NotPendingException(const std::string& tx_id, const std::string& status)
            : MultiSigException(MultiSigErrorCode::NOT_PENDING,
                "Transaction " + tx_id + " is not pending (status=" + status + ")") {}
    };

    class ExpiredException : public MultiSigException
    {
    public:
        explicit ExpiredException(const std::string& tx_id)
            : MultiSigException(MultiSigErrorCode::EXPIRED, "Transaction expired: " + tx_id) {}
    };

    class AlreadySignedException : public MultiSigException
    {
    public:
        AlreadySignedException(const std::string& tx_id, const std::string& signer)
            : MultiSigException(MultiSigErrorCode::ALREADY_SIGNED,
                "Signer " + signer + " already signed transaction " + tx_id) {}
    };

    class UnauthorizedException : public MultiSigException
    {
    public:
        explicit UnauthorizedException(const std::string& msg)
            : MultiSigException(MultiSigErrorCode::UNAUTHORIZED, "Unauthorized: " + msg) {}
    };

    class DeploymentFailedException : public MultiSigException
    {
    public:
        explicit DeploymentFailedException(const std::string& msg)
            : MultiSigException(MultiSigErrorCode::DEPLOYMENT_FAILED, "Deployment failed: " + msg) {}
    };

    class ExecutionFailedException : public MultiSigException
    {
    public:
        ExecutionFailedException(ExecutionFailureReason reason, const std::string& msg)
            : MultiSigException(MultiSigErrorCode::EXECUTION_FAILED,
                std::string("Execution failed (") + ExecutionFailureReasonToString(reason) + "): " + msg),
              failure_reason(reason) {}

        ExecutionFailureReason reason() const { return failure_reason; }

    private:
        ExecutionFailureReason failure_reason;
    };

    class OnChainUnsupportedException : public MultiSigException
    {
    public:
        explicit OnChainUnsupportedException(const std::string& chain)
            : MultiSigException(MultiSigErrorCode::ONCHAIN_UNSUPPORTED_FOR_CHAIN,
                "On-chain execution unsupported for chain: " + chain) {}
    };

    class DuplicateSignerException : public MultiSigException
    {
    public:
        explicit DuplicateSignerException(const std::string& address)
            : MultiSigException(MultiSigErrorCode::DUPLICATE_SIGNER, "Duplicate signer: " + address) {}
    };

    class InvalidAmountException : public MultiSigException
    {
    public:
        explicit InvalidAmountException(const std::string& amount)
            : MultiSigException(MultiSigErrorCode::INVALID_AMOUNT, "Invalid amount: " + amount) {}
    };

    class InvalidSignatureException : public MultiSigException
    {
    public:
        explicit InvalidSignatureException(const std::string& msg)
            : MultiSigException(MultiSigErrorCode::INVALID_SIGNATURE, "Invalid signature: " + msg) {}
    };

    class InvalidArgumentException : public MultiSigException
    {
    public:
        explicit InvalidArgumentException(const std::string& msg)
            : MultiSigException(MultiSigErrorCode::INVALID_ARGUMENT, "Invalid argument: " + msg) {}
    };

    class ThresholdNotReachedException : public MultiSigException
    {
    public:
        ThresholdNotReachedException(const std::string& tx_id, uint32_t current, uint32_t required)
            : MultiSigException(MultiSigErrorCode::THRESHOLD_NOT_REACHED,
                "Transaction " + tx_id + " has " + std::to_string(current) + "/" +
                std::to_string(required) + " signatures") {}
    };

    class AlreadyDeployedException : public MultiSigException
    {
    public:
        explicit AlreadyDeployedException(const std::string& wallet_id)
            : MultiSigException(MultiSigErrorCode::ALREADY_DEPLOYED, "Wallet already deployed: " + wallet_id) {}
    };

    class ConcurrentModificationException : public MultiSigException
    {
    public:
        explicit ConcurrentModificationException(const std::string& record_id)
            : MultiSigException(MultiSigErrorCode::CONCURRENT_MODIFICATION,
                "Concurrent modification of record: " + record_id) {}
    };

    /**
     * @brief 영속 저장 실패. 저장소 상태는 호출 전과 같음
     */
    class StorageException : public MultiSigException
    {
    public:
        explicit StorageException(const std::string& msg)
            : MultiSigException(MultiSigErrorCode::STORAGE_FAILURE, "Storage failure: " + msg) {}
    };
}
