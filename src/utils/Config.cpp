#include "utils/Config.h"
#include "utils/Logger.h"
#include <fstream>
#include <sstream>
#include <vector>
#include <typeinfo>
#include <type_traits>

namespace EdgeShare::Utils {

    namespace {
        void trim(std::string& s) {
            s.erase(0, s.find_first_not_of(" \t\n\r"));
            s.erase(s.find_last_not_of(" \t\n\r") + 1);
        }
    }

    const std::string& Config::GetEscapeComboKey() {
        static const std::string key = ConfigKeys::EscapeCombo;
        return key;
    }

    const std::string& Config::GetDefaultConfigFilePath() {
        static const std::string path = "edgeshare.cfg";
        return path;
    }

    Config& Config::GetInstance() {
        static Config instance;
        return instance;
    }

    Config::Config() {
        // A missing file is the normal first-run case; defaults apply.
        std::ifstream existing(GetDefaultConfigFilePath());
        if (existing.is_open()) {
            existing.close();
            LoadFromFile();
        }
    }

    bool Config::LoadFromFile() {
        return LoadFromFile(GetDefaultConfigFilePath());
    }

    bool Config::LoadFromFile(const std::string& configFilePath) {
        std::ifstream configFile(configFilePath);
        if (!configFile.is_open()) {
            Logger::GetInstance().Error("Config::LoadFromFile: FAILED to open config file: " + configFilePath);
            return false;
        }
        Logger::GetInstance().Info("Config::LoadFromFile: Loading " + configFilePath);

        std::lock_guard<std::recursive_mutex> lock(mutex);
        values.clear();

        std::string line;
        int line_num = 0;
        while (std::getline(configFile, line)) {
            line_num++;
            std::string trimmed = line;
            trim(trimmed);
            if (trimmed.empty() || trimmed[0] == '#') {
                continue;
            }
            if (!ApplyOverride(trimmed)) {
                Logger::GetInstance().Warning("Config::LoadFromFile: Skipped malformed line " + std::to_string(line_num) + ": " + line);
            }
        }
        Logger::GetInstance().Info("Config::LoadFromFile: Finished loading. Total keys in map: " + std::to_string(values.size()));
        return true;
    }

    bool Config::ApplyOverride(const std::string& assignment) {
        std::stringstream ss_line(assignment);
        std::string key_str;
        std::string value_str;
        if (!std::getline(ss_line, key_str, '=') || !std::getline(ss_line, value_str)) {
            return false;
        }
        trim(key_str);
        trim(value_str);
        if (key_str.empty()) {
            return false;
        }
        storeParsed(key_str, value_str);
        return true;
    }

    std::vector<uint8_t> Config::parseCombo(const std::string& key, const std::string& value) {
        std::vector<uint8_t> combo;
        std::stringstream ss_value(value);
        int vk_code_int;
        while (ss_value >> vk_code_int) {
            if (vk_code_int > 0 && vk_code_int < 256) {
                combo.push_back(static_cast<uint8_t>(vk_code_int));
            } else {
                Logger::GetInstance().Warning("Config: Invalid VK code " + std::to_string(vk_code_int) + " for " + key);
            }
        }
        if (ss_value.fail() && !ss_value.eof()) {
            Logger::GetInstance().Warning("Config: Error parsing value for " + key + ": '" + value + "'");
        }
        return combo;
    }

    void Config::storeParsed(const std::string& key_str, const std::string& value_str) {
        if (key_str == GetEscapeComboKey()) {
            Set(key_str, parseCombo(key_str, value_str));
            return;
        }
        if (value_str == "true" || value_str == "false") {
            Set(key_str, value_str == "true");
            return;
        }

        try {
            size_t processed_chars_int = 0;
            int int_val = std::stoi(value_str, &processed_chars_int);
            if (processed_chars_int == value_str.length()) {
                Set(key_str, int_val);
                return;
            }
        } catch (const std::invalid_argument&) {
        } catch (const std::out_of_range&) {}

        try {
            size_t processed_chars_float = 0;
            float float_val = std::stof(value_str, &processed_chars_float);
            if (processed_chars_float == value_str.length()) {
                Set(key_str, float_val);
                return;
            }
        } catch (const std::invalid_argument&) {
        } catch (const std::out_of_range&) {}

        Set(key_str, value_str);
    }

    bool Config::SaveToFile() {
        return SaveToFile(GetDefaultConfigFilePath());
    }

    bool Config::SaveToFile(const std::string& configFilePath) {
        std::ofstream configFile(configFilePath);
        if (!configFile.is_open()) {
            Logger::GetInstance().Error("Config::SaveToFile: FAILED to open config file for writing: " + configFilePath);
            return false;
        }

        std::lock_guard<std::recursive_mutex> lock(mutex);
        for (const auto& pair : values) {
            configFile << pair.first << "=";
            if (pair.second.type() == typeid(std::vector<uint8_t>)) {
                const auto& combo = std::any_cast<const std::vector<uint8_t>&>(pair.second);
                for (size_t i = 0; i < combo.size(); ++i) {
                    configFile << static_cast<int>(combo[i]) << (i == combo.size() - 1 ? "" : " ");
                }
            } else if (pair.second.type() == typeid(std::string)) {
                configFile << std::any_cast<const std::string&>(pair.second);
            } else if (pair.second.type() == typeid(int)) {
                configFile << std::any_cast<int>(pair.second);
            } else if (pair.second.type() == typeid(float)) {
                configFile << std::any_cast<float>(pair.second);
            } else if (pair.second.type() == typeid(bool)) {
                configFile << (std::any_cast<bool>(pair.second) ? "true" : "false");
            } else {
                Logger::GetInstance().Warning("Config::SaveToFile: Unsupported type for key '" + pair.first + "'");
            }
            configFile << std::endl;
        }
        Logger::GetInstance().Info("Config::SaveToFile: Saved " + std::to_string(values.size()) + " keys to " + configFilePath);
        return true;
    }

    template<typename T>
    void Config::Set(const std::string& key, const T& value) {
        std::lock_guard<std::recursive_mutex> lock(mutex);
        values[key] = value;
    }

    template<typename T>
    T Config::Get(const std::string& key, const T& defaultValue) {
        std::lock_guard<std::recursive_mutex> lock(mutex);
        auto it = values.find(key);
        if (it == values.end()) {
            return defaultValue;
        }
        try {
            return std::any_cast<T>(it->second);
        } catch (const std::bad_any_cast&) {
            if constexpr (std::is_same_v<T, float>) {
                if (it->second.type() == typeid(int)) {
                    return static_cast<float>(std::any_cast<int>(it->second));
                }
            } else if constexpr (std::is_same_v<T, std::string>) {
                if (it->second.type() == typeid(int)) {
                    return std::to_string(std::any_cast<int>(it->second));
                }
                if (it->second.type() == typeid(float)) {
                    return std::to_string(std::any_cast<float>(it->second));
                }
            } else if constexpr (std::is_same_v<T, std::vector<uint8_t>>) {
                if (it->second.type() == typeid(std::string)) {
                    return parseCombo(key, std::any_cast<const std::string&>(it->second));
                }
                if (it->second.type() == typeid(int)) {
                    return parseCombo(key, std::to_string(std::any_cast<int>(it->second)));
                }
            } else if constexpr (std::is_same_v<T, bool>) {
                if (it->second.type() == typeid(std::string)) {
                    const auto& temp_str = std::any_cast<const std::string&>(it->second);
                    return temp_str == "true" || temp_str == "1";
                }
                if (it->second.type() == typeid(int)) {
                    return std::any_cast<int>(it->second) != 0;
                }
            }
            Logger::GetInstance().Warning("Config::Get: Type mismatch for key '" + key + "'. Returning default value.");
        }
        return defaultValue;
    }

    bool Config::HasKey(const std::string& key) {
        std::lock_guard<std::recursive_mutex> lock(mutex);
        return values.find(key) != values.end();
    }

    void Config::Clear() {
        std::lock_guard<std::recursive_mutex> lock(mutex);
        values.clear();
    }

    template void Config::Set<int>(const std::string&, const int&);
    template void Config::Set<float>(const std::string&, const float&);
    template void Config::Set<bool>(const std::string&, const bool&);
    template void Config::Set<std::string>(const std::string&, const std::string&);
    template void Config::Set<std::vector<uint8_t>>(const std::string&, const std::vector<uint8_t>&);

    template int Config::Get<int>(const std::string&, const int&);
    template float Config::Get<float>(const std::string&, const float&);
    template bool Config::Get<bool>(const std::string&, const bool&);
    template std::string Config::Get<std::string>(const std::string&, const std::string&);
    template std::vector<uint8_t> Config::Get<std::vector<uint8_t>>(const std::string&, const std::vector<uint8_t>&);
}
