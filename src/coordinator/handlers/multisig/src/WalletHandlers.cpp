// src/coordinator/handlers/multisig/src/WalletHandlers.cpp
#include "coordinator/handlers/multisig/include/WalletHandlers.hpp"
#include "types/MultiSigMessageType.hpp"

namespace multisig_engine::coordinator::handlers
{
    namespace
    {
        std::unique_ptr<MultiSigMessage> NewWalletResponse(
            MultiSigMessageType type,
            const RequestHeader& request_header,
            WalletResponse*& response)
        {
            auto message = std::make_unique<MultiSigMessage>();
            message->set_message_type(static_cast<uint32_t>(type));
            response = message->mutable_wallet_response();
            InitResponseHeader(request_header, static_cast<uint32_t>(type), response->mutable_header());
            return message;
        }
    }

    std::unique_ptr<MultiSigMessage> HandleCreateWallet(engine::MultiSigService& service, const MultiSigMessage* request)
    {
        if (!request || !request->has_create_wallet_request()) {
            MSIG_LOG_ERROR("WalletHandlers", "[CreateWallet] Invalid request");
            return nullptr;
        }

        const CreateWalletRequest& req = request->create_wallet_request();

        WalletResponse* response = nullptr;
        auto message = NewWalletResponse(MultiSigMessageType::CREATE_WALLET, req.header(), response);

        RunHandler("WalletHandlers", response->mutable_header(), [&]() {
            std::vector<engine::SignerInput> signers;
            for (const auto& signer : req.signers()) {
                signers.push_back(FromProto(signer));
            }

            MSIG_LOG_DEBUGF("WalletHandlers", "[CreateWallet] user=%s chain=%s %u-of-%d",
                req.user_id().c_str(), req.chain().c_str(), req.threshold(), req.signers_size());

            ToProto(service.CreateWallet(req.user_id(), req.chain(), req.threshold(), signers), response);
        });

        return message;
    }

    std::unique_ptr<MultiSigMessage> HandleGetWallet(engine::MultiSigService& service, const MultiSigMessage* request)
    {
        if (!request || !request->has_get_wallet_request()) {
            MSIG_LOG_ERROR("WalletHandlers", "[GetWallet] Invalid request");
            return nullptr;
        }

        const GetWalletRequest& req = request->get_wallet_request();

        WalletResponse* response = nullptr;
        auto message = NewWalletResponse(MultiSigMessageType::GET_WALLET, req.header(), response);

        RunHandler("WalletHandlers", response->mutable_header(), [&]() {
            ToProto(service.GetWallet(req.wallet_id()), response);
        });

        return message;
    }

    std::unique_ptr<MultiSigMessage> HandleAddSigner(engine::MultiSigService& service, const MultiSigMessage* request)
    {
        if (!request || !request->has_add_signer_request()) {
            MSIG_LOG_ERROR("WalletHandlers", "[AddSigner] Invalid request");
            return nullptr;
        }

        const AddSignerRequest& req = request->add_signer_request();

        auto message = std::make_unique<MultiSigMessage>();
        message->set_message_type(static_cast<uint32_t>(MultiSigMessageType::ADD_SIGNER));
        auto* response = message->mutable_add_signer_response();
        InitResponseHeader(req.header(), message->message_type(), response->mutable_header());

        RunHandler("WalletHandlers", response->mutable_header(), [&]() {
            engine::Signer signer = service.AddSigner(req.wallet_id(), FromProto(req.signer()), req.actor());
            ToProto(signer, response->mutable_signer());
        });

        return message;
    }

    std::unique_ptr<MultiSigMessage> HandleRemoveSigner(engine::MultiSigService& service, const MultiSigMessage* request)
    {
        if (!request || !request->has_remove_signer_request()) {
            MSIG_LOG_ERROR("WalletHandlers", "[RemoveSigner] Invalid request");
            return nullptr;
        }

        const RemoveSignerRequest& req = request->remove_signer_request();

        WalletResponse* response = nullptr;
        auto message = NewWalletResponse(MultiSigMessageType::REMOVE_SIGNER, req.header(), response);

        RunHandler("WalletHandlers", response->mutable_header(), [&]() {
            service.RemoveSigner(req.wallet_id(), req.address(), req.actor());
            ToProto(service.GetWallet(req.wallet_id()), response);
        });

        return message;
    }

    std::unique_ptr<MultiSigMessage> HandleDeployWallet(engine::MultiSigService& service, const MultiSigMessage* request)
    {
        if (!request || !request->has_deploy_wallet_request()) {
            MSIG_LOG_ERROR("WalletHandlers", "[DeployWallet] Invalid request");
            return nullptr;
        }

        const DeployWalletRequest& req = request->deploy_wallet_request();

        WalletResponse* response = nullptr;
        auto message = NewWalletResponse(MultiSigMessageType::DEPLOY_WALLET, req.header(), response);

        RunHandler("WalletHandlers", response->mutable_header(), [&]() {
            service.DeployWallet(req.wallet_id(), req.actor());
            ToProto(service.GetWallet(req.wallet_id()), response);
        });

        return message;
    }

} // namespace multisig_engine::coordinator::handlers
