// src/multisig/model/src/MultiSigTypes.cpp
#include "multisig/model/include/MultiSigTypes.hpp"
#include <algorithm>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace multisig_engine::multisig
{
    // ========================================
    // 열거형 문자열 변환
    // ========================================

    const char* ToString(AddressKind kind)
    {
        switch (kind) {
            case AddressKind::DEPLOYED:
                return "deployed";
            case AddressKind::PLACEHOLDER:
            default:
                return "placeholder";
        }
    }

    AddressKind AddressKindFromString(const std::string& str)
    {
        return str == "deployed" ? AddressKind::DEPLOYED : AddressKind::PLACEHOLDER;
    }

    const char* ToString(TransactionStatus status)
    {
        switch (status) {
            case TransactionStatus::PENDING: return "pending";
            case TransactionStatus::EXECUTED: return "executed";
            case TransactionStatus::CANCELLED: return "cancelled";
            case TransactionStatus::EXPIRED: return "expired";
            default: return "pending";
        }
    }

    TransactionStatus TransactionStatusFromString(const std::string& str)
    {
        if (str == "executed") return TransactionStatus::EXECUTED;
        if (str == "cancelled") return TransactionStatus::CANCELLED;
        if (str == "expired") return TransactionStatus::EXPIRED;
        return TransactionStatus::PENDING;
    }

    // ========================================
    // MultiSigWallet
    // ========================================

    std::string MultiSigWallet::ToJson() const
    {
        json j;

        j["id"] = id;
        j["userId"] = user_id;
        j["chain"] = chain;
        j["address"] = address;
        j["addressKind"] = ToString(address_kind);
        j["threshold"] = threshold;
        j["totalSigners"] = total_signers;
        j["label"] = label;
        j["createdAt"] = created_at_ms;

        if (!deployment_tx_hash.empty()) {
            j["deploymentTxHash"] = deployment_tx_hash;
        }

        return j.dump();
    }

    bool MultiSigWallet::FromJson(const std::string& json_str)
    {
        try {
            json j = json::parse(json_str);

            id = j.at("id").get<std::string>();
            user_id = j.at("userId").get<std::string>();
            chain = j.at("chain").get<std::string>();
            address = j.at("address").get<std::string>();
            address_kind = AddressKindFromString(j.at("addressKind").get<std::string>());
            threshold = j.at("threshold").get<uint32_t>();
            total_signers = j.at("totalSigners").get<uint32_t>();
            label = j.value("label", std::string());
            created_at_ms = j.at("createdAt").get<int64_t>();
            deployment_tx_hash = j.value("deploymentTxHash", std::string());

            return true;

        } catch (const json::exception&) {
            return false;
        }
    }

    // ========================================
    // Signer
    // ========================================

    std::string Signer::ToJson() const
    {
        json j;

        j["walletId"] = wallet_id;
        j["address"] = address;
        j["addedAt"] = added_at_ms;

        if (!name.empty()) {
            j["name"] = name;
        }
        if (!contact.empty()) {
            j["contact"] = contact;
        }

        return j.dump();
    }

    bool Signer::FromJson(const std::string& json_str)
    {
        try {
            json j = json::parse(json_str);

            wallet_id = j.at("walletId").get<std::string>();
            address = j.at("address").get<std::string>();
            added_at_ms = j.value("addedAt", int64_t{0});
            name = j.value("name", std::string());
            contact = j.value("contact", std::string());

            return true;

        } catch (const json::exception&) {
            return false;
        }
    }

    // ========================================
    // PendingTransaction
    // ========================================

    bool PendingTransaction::HasSigned(const std::string& normalized_address) const
    {
        return std::find(signed_by.begin(), signed_by.end(), normalized_address) != signed_by.end();
    }

    bool PendingTransaction::WasEligible(const std::string& normalized_address) const
    {
        return std::find(eligible_signers.begin(), eligible_signers.end(), normalized_address)
            != eligible_signers.end();
    }

    std::string PendingTransaction::ToJson() const
    {
        json j;

        j["id"] = id;
        j["walletId"] = wallet_id;
        j["chain"] = chain;
        j["toAddress"] = to_address;
        j["amount"] = amount;
        j["memo"] = memo;
        j["requiredSignatures"] = required_signatures;
        j["currentSignatures"] = current_signatures;
        j["signedBy"] = signed_by;
        j["eligibleSigners"] = eligible_signers;
        j["signatures"] = signatures;
        j["proposer"] = proposer;
        j["status"] = ToString(status);
        j["createdAt"] = created_at_ms;
        j["expiresAt"] = expires_at_ms;
        j["version"] = version;

        if (executed_at_ms > 0) {
            j["executedAt"] = executed_at_ms;
        }
        if (!execution_tx_hash.empty()) {
            j["executionTxHash"] = execution_tx_hash;
        }
        if (!last_error.empty()) {
            j["lastError"] = last_error;
        }

        return j.dump();
    }

    bool PendingTransaction::FromJson(const std::string& json_str)
    {
        try {
            json j = json::parse(json_str);

            id = j.at("id").get<std::string>();
            wallet_id = j.at("walletId").get<std::string>();
            chain = j.at("chain").get<std::string>();
            to_address = j.at("toAddress").get<std::string>();
            amount = j.at("amount").get<std::string>();
            memo = j.value("memo", std::string());
            required_signatures = j.at("requiredSignatures").get<uint32_t>();
            current_signatures = j.at("currentSignatures").get<uint32_t>();
            signed_by = j.at("signedBy").get<std::vector<std::string>>();
            eligible_signers = j.value("eligibleSigners", std::vector<std::string>());
            signatures = j.value("signatures", std::map<std::string, std::string>());
            proposer = j.at("proposer").get<std::string>();
            status = TransactionStatusFromString(j.at("status").get<std::string>());
            created_at_ms = j.at("createdAt").get<int64_t>();
            expires_at_ms = j.at("expiresAt").get<int64_t>();
            executed_at_ms = j.value("executedAt", int64_t{0});
            execution_tx_hash = j.value("executionTxHash", std::string());
            last_error = j.value("lastError", std::string());
            version = j.value("version", uint64_t{0});

            return true;

        } catch (const json::exception&) {
            return false;
        }
    }
}
