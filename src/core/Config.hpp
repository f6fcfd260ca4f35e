#pragma once

/**
 * Config.hpp
 *
 * Configuration management using JSON.
 * Provides type-safe access to configuration values with defaults.
 */

#include <nlohmann/json.hpp>
#include <string>
#include <mutex>
#include <fstream>
#include <filesystem>

namespace collector::core {

using json = nlohmann::json;

/**
 * Configuration manager - Thread-safe singleton
 *
 * Holds the settings the task engine reads at startup (retry policy,
 * reaper threshold, S3 endpoint) with JSON persistence.
 */
class Config {
public:
    static Config& instance() {
        static Config instance;
        return instance;
    }

    /**
     * Load configuration from file
     * Values from the file are merged over the defaults, so a partial
     * file only overrides what it names.
     * @param path Path to config file
     * @return true if loaded successfully
     */
    bool load(const std::string& path) {
        std::lock_guard<std::mutex> lock(m_mutex);

        try {
            if (!std::filesystem::exists(path)) {
                return false;
            }

            std::ifstream file(path);
            if (!file.is_open()) {
                return false;
            }

            m_config = defaults();
            m_config.merge_patch(json::parse(file));
            m_configPath = path;
            return true;

        } catch (const json::exception&) {
            return false;
        } catch (const std::filesystem::filesystem_error&) {
            return false;
        }
    }

    /**
     * Save configuration to file
     * @param path Path to config file (uses loaded path if empty)
     * @return true if saved successfully
     */
    bool save(const std::string& path = "") {
        std::lock_guard<std::mutex> lock(m_mutex);

        std::string savePath = path.empty() ? m_configPath : path;
        if (savePath.empty()) {
            return false;
        }

        try {
            auto parent = std::filesystem::path(savePath).parent_path();
            if (!parent.empty()) {
                std::filesystem::create_directories(parent);
            }

            std::ofstream file(savePath);
            if (!file.is_open()) {
                return false;
            }

            file << m_config.dump(4);
            return true;

        } catch (const std::exception&) {
            return false;
        }
    }

    void setDefaults() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config = defaults();
    }

    /**
     * Get configuration value with dot notation
     * @param key Key path (e.g., "downloads.retryLimit")
     * @param defaultValue Default value if key not found
     */
    template<typename T>
    T get(const std::string& key, const T& defaultValue = T{}) const {
        std::lock_guard<std::mutex> lock(m_mutex);

        try {
            json::json_pointer ptr = toJsonPointer(key);
            if (m_config.contains(ptr)) {
                return m_config.at(ptr).get<T>();
            }
        } catch (const json::exception&) {
            // Wrong type in file, fall through to default
        }

        return defaultValue;
    }

    template<typename T>
    void set(const std::string& key, const T& value) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config[toJsonPointer(key)] = value;
    }

    bool has(const std::string& key) const {
        std::lock_guard<std::mutex> lock(m_mutex);

        try {
            return m_config.contains(toJsonPointer(key));
        } catch (const json::exception&) {
            return false;
        }
    }

    void remove(const std::string& key) {
        std::lock_guard<std::mutex> lock(m_mutex);

        try {
            json::json_pointer ptr = toJsonPointer(key);
            if (!m_config.contains(ptr)) {
                return;
            }

            json::json_pointer parent = ptr.parent_pointer();
            std::string leafKey = ptr.back();

            if (parent.empty()) {
                m_config.erase(leafKey);
            } else if (m_config.contains(parent)) {
                m_config.at(parent).erase(leafKey);
            }
        } catch (const json::exception&) {
            // Invalid path
        }
    }

    json getAll() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_config;
    }

    void merge(const json& other) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config.merge_patch(other);
    }

private:
    Config() {
        m_config = defaults();
    }

    ~Config() = default;

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    static json defaults() {
        return {
            {"version", "1.0.0"},
            {"downloads", {
                {"retryLimit", 3},
                {"backoffBaseMs", 1000},
                {"backoffMaxMs", 30000},
                {"progressIntervalMs", 250},
                {"rateWindowMs", 5000},
                {"verifyChecksum", true}
            }},
            {"reaper", {
                {"orphanThresholdMs", 60 * 60 * 1000},
                {"sweepIntervalMs", 60 * 1000},
                {"graceMs", 5000},
                {"exemptActiveTransfers", true}
            }},
            {"s3", {
                {"endpoint", "https://s3.amazonaws.com"},
                {"region", "us-east-1"},
                {"timeoutMs", 30000},
                {"connectTimeoutMs", 10000}
            }},
            {"log", {
                {"level", "info"}
            }}
        };
    }

    static json::json_pointer toJsonPointer(const std::string& key) {
        std::string pointer = "/";
        for (char c : key) {
            if (c == '.') {
                pointer += '/';
            } else {
                pointer += c;
            }
        }
        return json::json_pointer(pointer);
    }

private:
    mutable std::mutex m_mutex;
    json m_config;
    std::string m_configPath;
};

} // namespace collector::core
