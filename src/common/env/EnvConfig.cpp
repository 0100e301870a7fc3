// src/common/env/EnvConfig.cpp
#include "common/env/EnvConfig.hpp"
#include "common/utils/logger/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace multisig_engine::env
{
    namespace
    {
        std::string Trim(const std::string& s, const char* whitespace = " \t\r\n")
        {
            size_t start = s.find_first_not_of(whitespace);
            if (start == std::string::npos) {
                return "";
            }
            size_t end = s.find_last_not_of(whitespace);
            return s.substr(start, end - start + 1);
        }

        uint64_t ParseUnsigned(const std::string& key, const std::string& value, uint64_t max_value)
        {
            if (value.empty() || !std::all_of(value.begin(), value.end(),
                    [](unsigned char c) { return std::isdigit(c) != 0; })) {
                throw ConfigFormatException(key, value);
            }

            try {
                unsigned long long parsed = std::stoull(value);
                if (parsed > max_value) {
                    throw ConfigFormatException(key, value);
                }
                return parsed;
            } catch (const std::logic_error&) {
                throw ConfigFormatException(key, value);
            }
        }
    }

    bool EnvConfig::LoadFromFile(const std::string& file_path)
    {
        std::ifstream file(file_path);
        if (!file.is_open())
        {
            MSIG_LOG_ERRORF("EnvConfig", "Failed to open config file: %s", file_path.c_str());
            return false;
        }
        config_map.clear();

        std::string line;
        size_t line_no = 0;
        while (std::getline(file, line))
        {
            ++line_no;
            if (!ParseLine(line)) {
                MSIG_LOG_WARNF("EnvConfig", "Ignoring malformed line %zu in %s", line_no, file_path.c_str());
            }
        }

        is_loaded = true;
        MSIG_LOG_INFOF("EnvConfig", "Loaded %zu configuration entries from %s",
            config_map.size(), file_path.c_str());
        return true;
    }

    bool EnvConfig::LoadFromEnv(const std::string& env_name)
    {
        env_type = env_name;
        return LoadFromFile("env/.env." + env_name);
    }

    void EnvConfig::LoadFromString(const std::string& content)
    {
        config_map.clear();

        std::istringstream in(content);
        std::string line;
        while (std::getline(in, line)) {
            ParseLine(line);
        }
        is_loaded = true;
    }

    std::string EnvConfig::GetString(const std::string& key) const
    {
        auto it = config_map.find(key);
        if (it == config_map.end() || it->second.empty()) {
            throw ConfigMissingException(key);
        }
        return it->second;
    }

    uint16_t EnvConfig::GetUInt16(const std::string& key) const
    {
        return static_cast<uint16_t>(ParseUnsigned(key, GetString(key), UINT16_MAX));
    }

    uint32_t EnvConfig::GetUInt32(const std::string& key) const
    {
        return static_cast<uint32_t>(ParseUnsigned(key, GetString(key), UINT32_MAX));
    }

    uint64_t EnvConfig::GetUInt64(const std::string& key) const
    {
        return ParseUnsigned(key, GetString(key), UINT64_MAX);
    }

    bool EnvConfig::GetBool(const std::string& key) const
    {
        std::string value = GetString(key);
        std::transform(value.begin(), value.end(), value.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (value == "true" || value == "1" || value == "yes" || value == "on") {
            return true;
        }
        if (value == "false" || value == "0" || value == "no" || value == "off") {
            return false;
        }
        throw ConfigFormatException(key, value);
    }

    std::vector<std::string> EnvConfig::GetStringArray(const std::string& key) const
    {
        std::string value = GetString(key);

        std::vector<std::string> result;
        std::stringstream ss(value);
        std::string item;

        while (std::getline(ss, item, ','))
        {
            item = Trim(item, " \t");
            if (!item.empty()) {
                result.push_back(item);
            }
        }

        if (result.empty()) {
            throw ConfigMissingException(key + " (array is empty)");
        }

        return result;
    }

    bool EnvConfig::HasKey(const std::string& key) const
    {
        auto it = config_map.find(key);
        return it != config_map.end() && !it->second.empty();
    }

    void EnvConfig::ValidateRequired(const std::vector<std::string>& required_keys) const
    {
        std::vector<std::string> missing_keys;
        for (const std::string& key : required_keys) {
            if (!HasKey(key)) {
                missing_keys.push_back(key);
            }
        }

        if (!missing_keys.empty()) {
            std::stringstream ss;
            for (size_t i = 0; i < missing_keys.size(); ++i) {
                if (i > 0) {
                    ss << ", ";
                }
                ss << missing_keys[i];
            }
            throw ConfigMissingException(ss.str());
        }
    }

    bool EnvConfig::ParseLine(const std::string& line)
    {
        std::string trimmed = Trim(line);

        // 빈 줄이나 주석은 무시
        if (trimmed.empty() || trimmed[0] == '#')
        {
            return true;
        }

        size_t eq_pos = trimmed.find('=');
        if (eq_pos == std::string::npos)
        {
            return false;
        }

        std::string key = Trim(trimmed.substr(0, eq_pos), " \t");
        std::string value = Trim(trimmed.substr(eq_pos + 1), " \t");

        // "value" 형태의 따옴표 제거
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }

        if (key.empty())
        {
            return false;
        }

        config_map[key] = value;
        return true;
    }
} // namespace multisig_engine::env
