// src/multisig/storage/src/MultiSigStoreFactory.cpp
#include "multisig/storage/include/MultiSigStoreFactory.hpp"
#include "multisig/storage/include/FileMultiSigStore.hpp"
#include "multisig/storage/include/InMemoryMultiSigStore.hpp"
#include "common/utils/logger/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace multisig_engine::multisig
{
    std::unique_ptr<IMultiSigStore> MultiSigStoreFactory::Create(
        const std::string& type,
        const std::string& path
    )
    {
        std::string normalized = NormalizeType(type);

        if (normalized == "memory")
        {
            MSIG_LOG_INFO("StoreFactory", "Creating in-memory store");
            return std::make_unique<InMemoryMultiSigStore>();
        }
        else if (normalized == "file")
        {
            std::string dir = path.empty() ? ".multisig" : path;
            MSIG_LOG_INFOF("StoreFactory", "Creating file store at %s", dir.c_str());
            return std::make_unique<FileMultiSigStore>(dir);
        }

        MSIG_LOG_ERRORF("StoreFactory", "Invalid store type: %s (supported: memory, file)", type.c_str());
        throw std::invalid_argument("Invalid store type: " + type);
    }

    std::vector<std::string> MultiSigStoreFactory::GetSupportedTypes()
    {
        return {"memory", "file"};
    }

    bool MultiSigStoreFactory::IsValidType(const std::string& type)
    {
        std::string normalized = NormalizeType(type);
        auto types = GetSupportedTypes();
        return std::find(types.begin(), types.end(), normalized) != types.end();
    }

    std::string MultiSigStoreFactory::NormalizeType(const std::string& type)
    {
        std::string normalized = type;
        std::transform(normalized.begin(), normalized.end(), normalized.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        size_t start = normalized.find_first_not_of(" \t\r\n");
        if (start == std::string::npos) {
            return "";
        }
        size_t end = normalized.find_last_not_of(" \t\r\n");
        return normalized.substr(start, end - start + 1);
    }
}
