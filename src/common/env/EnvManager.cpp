// src/common/env/EnvManager.cpp
#include "common/env/EnvManager.hpp"
#include "common/utils/logger/Logger.hpp"
#include <stdexcept>

namespace multisig_engine::env
{
    std::unique_ptr<EnvManager> EnvManager::instance = nullptr;
    std::mutex EnvManager::instance_mutex;

    EnvManager& EnvManager::Instance()
    {
        std::lock_guard<std::mutex> lock(instance_mutex);

        if (!instance) {
            // private 생성자 → make_unique 사용 불가
            instance = std::unique_ptr<EnvManager>(new EnvManager());
        }

        return *instance;
    }

    bool EnvManager::Initialize(const std::string& env_type)
    {
        std::lock_guard<std::mutex> lock(config_mutex);

        if (is_initialized) {
            MSIG_LOG_WARNF("EnvManager", "Already initialized. Current env: %s, requested: %s",
                env_config->GetEnvType().c_str(), env_type.c_str());
            return env_config->GetEnvType() == env_type;
        }

        auto config = std::make_unique<EnvConfig>();
        if (!config->LoadFromEnv(env_type)) {
            MSIG_LOG_ERRORF("EnvManager", "Failed to load environment configuration: %s", env_type.c_str());
            return false;
        }

        env_config = std::move(config);
        is_initialized = true;
        MSIG_LOG_INFOF("EnvManager", "Initialized with environment: %s", env_type.c_str());
        return true;
    }

    bool EnvManager::InitializeFromFile(const std::string& file_path)
    {
        std::lock_guard<std::mutex> lock(config_mutex);

        if (is_initialized) {
            MSIG_LOG_WARN("EnvManager", "Already initialized, ignoring config file");
            return false;
        }

        auto config = std::make_unique<EnvConfig>();
        if (!config->LoadFromFile(file_path)) {
            return false;
        }

        env_config = std::move(config);
        is_initialized = true;
        MSIG_LOG_INFOF("EnvManager", "Initialized from file: %s", file_path.c_str());
        return true;
    }

    const EnvConfig& EnvManager::GetConfig() const
    {
        EnsureInitialized();
        return *env_config;
    }

    void EnvManager::EnsureInitialized() const
    {
        std::lock_guard<std::mutex> lock(config_mutex);
        if (!is_initialized || !env_config) {
            throw std::runtime_error(
                "EnvManager not initialized. Call EnvManager::Instance().Initialize(env_type) first."
            );
        }
    }

} // namespace multisig_engine::env
