#pragma once
#include <string>
#include <unordered_map>
#include <any>
#include <cstdint>
#include <mutex>
#include <vector>

namespace EdgeShare::Utils {

    namespace ConfigKeys {
        inline constexpr const char* Port = "network.port";
        inline constexpr const char* Name = "network.name";
        inline constexpr const char* IdleTimeoutMs = "network.idle_timeout_ms";
        inline constexpr const char* PingIntervalMs = "network.ping_interval_ms";
        inline constexpr const char* ConnectTimeoutMs = "network.connect_timeout_ms";
        inline constexpr const char* HandshakeTimeoutMs = "network.handshake_timeout_ms";
        inline constexpr const char* AutoReconnect = "network.auto_reconnect";
        inline constexpr const char* ReconnectDelayMs = "network.reconnect_delay_ms";
        inline constexpr const char* EdgePosition = "edge.position";
        inline constexpr const char* EdgeThreshold = "edge.threshold";
        inline constexpr const char* EdgePollIntervalMs = "edge.poll_interval_ms";
        inline constexpr const char* SwitchAckTimeoutMs = "mode.switch_ack_timeout_ms";
        inline constexpr const char* EscapeCombo = "input.escape_combo_vk";
        inline constexpr const char* MouseSensitivity = "input.mouse_sensitivity";
        inline constexpr const char* ScrollScale = "input.scroll_scale";
    }

    class Config {
    public:
        static Config& GetInstance();

        bool LoadFromFile(const std::string& path);
        bool LoadFromFile();
        bool SaveToFile(const std::string& path);
        bool SaveToFile();

        // Parses one "key=value" string, the same way a config line is read.
        bool ApplyOverride(const std::string& assignment);

        template<typename T>
        void Set(const std::string& key, const T& value);

        template<typename T>
        T Get(const std::string& key, const T& defaultValue);

        bool HasKey(const std::string& key);
        void Clear();

        static const std::string& GetEscapeComboKey();
        static const std::string& GetDefaultConfigFilePath();

    private:
        Config();
        ~Config() = default;

        Config(const Config&) = delete;
        Config& operator=(const Config&) = delete;

        void storeParsed(const std::string& key, const std::string& value);
        static std::vector<uint8_t> parseCombo(const std::string& key, const std::string& value);

        std::unordered_map<std::string, std::any> values;
        std::recursive_mutex mutex;
    };
}
