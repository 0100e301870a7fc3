// src/multisig/storage/include/MultiSigStoreFactory.hpp
#pragma once
#include "multisig/storage/include/IMultiSigStore.hpp"
#include <memory>
#include <string>
#include <vector>

namespace multisig_engine::multisig
{
    /**
     * @brief 저장소 인스턴스 생성 (MULTISIG_STORE_TYPE)
     */
    class MultiSigStoreFactory
    {
    public:
        /**
         * @param type "memory" 또는 "file"
         * @param path file 저장소 디렉토리 (비어 있으면 ".multisig")
         * @throws std::invalid_argument 지원하지 않는 type
         */
        static std::unique_ptr<IMultiSigStore> Create(
            const std::string& type,
            const std::string& path = ""
        );

        static std::vector<std::string> GetSupportedTypes();
        static bool IsValidType(const std::string& type);

    private:
        MultiSigStoreFactory() = delete;

        static std::string NormalizeType(const std::string& type);
    };
}
