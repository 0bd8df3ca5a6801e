#pragma once

#include <string>
#include <vector>
#include <unordered_map>
#include <functional>
#include <mutex>

namespace SettleFS {

    /**
     * @brief Flat key=value settings store
     *
     * Files hold one "key = value" pair per line; blank lines and lines
     * starting with '#' are ignored. Can be used as the process-wide
     * instance() or as a local object (tests, tools loading a file once).
     */
    class Config {
    public:
        using Validator = std::function<bool(const std::string& key, const std::string& value)>;

        Config() = default;

        static Config& instance();

        bool loadFromFile(const std::string& path, bool overrideExisting = true);
        bool loadLayered(const std::vector<std::string>& paths, bool overrideExisting = true);

        bool hasKey(const std::string& key) const;

        std::string get(const std::string& key, const std::string& defaultValue = "") const;
        void set(const std::string& key, const std::string& value);

        int getInt(const std::string& key, int defaultValue = 0) const;
        void setInt(const std::string& key, int value);

        bool getBool(const std::string& key, bool defaultValue = false) const;
        void setBool(const std::string& key, bool value);

        /**
         * @brief Run each validator against its key, if the key is set
         * @param failedKey receives the first key that fails, may be null
         */
        bool validate(const std::unordered_map<std::string, Validator>& schema,
                      std::string* failedKey = nullptr) const;

    private:
        std::unordered_map<std::string, std::string> settings_;
        mutable std::mutex mutex_;

        static std::string trim(const std::string& value);
        bool storeKV(const std::string& key, const std::string& value, bool overrideExisting);
    };

}
