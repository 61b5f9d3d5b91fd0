#pragma once

#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace ChatCast {

    /**
     * @brief key=value configuration store
     *
     * File format:
     *   # comment
     *   [relay]            -> following keys are stored as "relay.<key>"
     *   port = 5050
     *   log.level = DEBUG  -> dotted keys are also accepted outside a section
     *
     * Keys and values are trimmed. Not a singleton: the relay builds one
     * store from files and command-line overrides.
     */
    class Config {
    public:
        using Validator = std::function<bool(const std::string& key, const std::string& value)>;

        Config() = default;

        bool loadFromFile(const std::string& path, bool overrideExisting = true);

        /**
         * @brief Load every readable file in order; missing files are skipped.
         * @return Number of files loaded
         */
        size_t loadLayered(const std::vector<std::string>& paths, bool overrideExisting = true);

        /**
         * @brief Write the store back out, one [section] block per key prefix.
         */
        bool saveToFile(const std::string& path) const;

        bool hasKey(const std::string& key) const;
        std::vector<std::string> keys() const;

        std::string get(const std::string& key, const std::string& defaultValue = "") const;
        void set(const std::string& key, const std::string& value);

        /**
         * @brief Unsigned value; defaultValue when absent, negative or not a number.
         */
        size_t getSize(const std::string& key, size_t defaultValue = 0) const;
        void setSize(const std::string& key, size_t value);

        /**
         * @brief Check every present key that has a validator in the schema.
         * @param failedKey Receives the first key that failed, if any
         */
        bool validate(const std::unordered_map<std::string, Validator>& schema,
                      std::string* failedKey = nullptr) const;

    private:
        // Ordered so saved files and keys() are stable
        std::map<std::string, std::string> settings_;
        mutable std::mutex mutex_;
    };

}
