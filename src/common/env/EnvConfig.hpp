// src/common/env/EnvConfig.hpp
#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace multisig_engine::env
{
    // 설정 누락 예외
    class ConfigMissingException : public std::runtime_error {
    public:
        explicit ConfigMissingException(const std::string& key)
            : std::runtime_error("Required config missing: " + key) {}
    };

    // 설정 값 형식 오류
    class ConfigFormatException : public std::runtime_error {
    public:
        ConfigFormatException(const std::string& key, const std::string& value)
            : std::runtime_error("Invalid config value for '" + key + "': " + value) {}
    };

    /**
     * @brief env/.env.{env_name} 형식의 key=value 설정 파일
     *
     * - '#' 으로 시작하는 줄은 주석
     * - key/value 앞뒤 공백 제거
     * - Get* 계열은 모두 필수 조회 (없거나 비어 있으면 ConfigMissingException)
     * - 선택 설정은 HasKey()로 먼저 확인
     */
    class EnvConfig
    {
    private:
        std::unordered_map<std::string, std::string> config_map;
        std::string env_type;
        bool is_loaded = false;

    public:
        EnvConfig() = default;
        ~EnvConfig() = default;

        bool LoadFromFile(const std::string& file_path);
        bool LoadFromEnv(const std::string& env_name);  // env/.env.{env_name}
        void LoadFromString(const std::string& content);

        std::string GetString(const std::string& key) const;
        uint16_t GetUInt16(const std::string& key) const;
        uint32_t GetUInt32(const std::string& key) const;
        uint64_t GetUInt64(const std::string& key) const;
        bool GetBool(const std::string& key) const;

        // 콤마 구분 배열 (빈 항목 제거, 결과가 비면 예외)
        std::vector<std::string> GetStringArray(const std::string& key) const;

        bool HasKey(const std::string& key) const;

        std::string GetEnvType() const { return env_type; }
        bool IsLoaded() const { return is_loaded; }
        size_t Size() const { return config_map.size(); }

        void ValidateRequired(const std::vector<std::string>& required_keys) const;

    private:
        bool ParseLine(const std::string& line);
    };
} // namespace multisig_engine::env
