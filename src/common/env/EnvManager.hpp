// src/common/env/EnvManager.hpp
#pragma once
#include "common/env/EnvConfig.hpp"
#include <memory>
#include <mutex>
#include <string>

namespace multisig_engine::env
{
    /**
     * @brief 글로벌 설정 관리자 (싱글톤)
     *
     * 프로세스 시작 시 한 번 로드하고, 서비스 구성 단계(main)에서만 조회합니다.
     * 코어 컴포넌트는 EnvManager를 직접 참조하지 않고 로드된 설정 구조체를 주입받습니다.
     */
    class EnvManager
    {
    private:
        static std::unique_ptr<EnvManager> instance;
        static std::mutex instance_mutex;

        std::unique_ptr<EnvConfig> env_config;
        mutable std::mutex config_mutex;

        bool is_initialized = false;

        EnvManager() = default;

    public:
        ~EnvManager() = default;

        EnvManager(const EnvManager&) = delete;
        EnvManager& operator=(const EnvManager&) = delete;
        EnvManager(EnvManager&&) = delete;
        EnvManager& operator=(EnvManager&&) = delete;

        static EnvManager& Instance();

        /**
         * @brief 환경 설정 초기화
         * @param env_type 환경 타입 (local, dev, qa, production) → env/.env.{env_type}
         * @return 초기화 성공 여부
         */
        bool Initialize(const std::string& env_type);

        /**
         * @brief 임의 경로의 설정 파일로 초기화 (--config 옵션)
         */
        bool InitializeFromFile(const std::string& file_path);

        /**
         * @brief 환경 설정 객체 접근
         * @throws std::runtime_error 초기화되지 않은 경우
         */
        const EnvConfig& GetConfig() const;

    private:
        void EnsureInitialized() const;
    };

    // main 전용 단축 접근
    namespace Config
    {
        inline const EnvConfig& Get() {
            return EnvManager::Instance().GetConfig();
        }
    }

} // namespace multisig_engine::env
