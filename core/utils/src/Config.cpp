#include "Config.h"
#include <fstream>
#include <stdexcept>

namespace ChatCast {

    namespace {

        std::string trim(const std::string& value) {
            auto start = value.find_first_not_of(" \t\r\n");
            if (start == std::string::npos) return "";
            auto end = value.find_last_not_of(" \t\r\n");
            return value.substr(start, end - start + 1);
        }

        struct Entry {
            std::string key;
            std::string value;
        };

        // Returns false for blank lines, comments, section headers and junk.
        bool parseLine(const std::string& raw, std::string& section, Entry& entry) {
            std::string line = trim(raw);
            if (line.empty() || line[0] == '#') {
                return false;
            }

            if (line.front() == '[' && line.back() == ']') {
                section = trim(line.substr(1, line.size() - 2));
                return false;
            }

            size_t eq = line.find('=');
            if (eq == std::string::npos) {
                return false;
            }

            std::string key = trim(line.substr(0, eq));
            if (key.empty()) {
                return false;
            }
            entry.key = section.empty() ? key : section + "." + key;
            entry.value = trim(line.substr(eq + 1));
            return true;
        }

    }

    bool Config::loadFromFile(const std::string& path, bool overrideExisting) {
        std::ifstream file(path);
        if (!file.is_open()) {
            return false;
        }

        std::vector<Entry> entries;
        std::string section;
        std::string line;
        Entry entry;
        while (std::getline(file, line)) {
            if (parseLine(line, section, entry)) {
                entries.push_back(entry);
            }
        }

        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& e : entries) {
            if (overrideExisting) {
                settings_[e.key] = std::move(e.value);
            } else {
                settings_.emplace(e.key, std::move(e.value));
            }
        }
        return true;
    }

    size_t Config::loadLayered(const std::vector<std::string>& paths, bool overrideExisting) {
        size_t loaded = 0;
        for (const auto& path : paths) {
            if (loadFromFile(path, overrideExisting)) {
                ++loaded;
            }
        }
        return loaded;
    }

    bool Config::saveToFile(const std::string& path) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::ofstream file(path);
        if (!file.is_open()) {
            return false;
        }

        std::string current;
        for (const auto& [key, value] : settings_) {
            size_t dot = key.find('.');
            std::string section = dot == std::string::npos ? "" : key.substr(0, dot);
            std::string name = dot == std::string::npos ? key : key.substr(dot + 1);

            if (section != current) {
                file << "\n[" << section << "]\n";
                current = section;
            }
            file << name << " = " << value << "\n";
        }
        return static_cast<bool>(file);
    }

    bool Config::hasKey(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return settings_.count(key) != 0;
    }

    std::vector<std::string> Config::keys() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> out;
        out.reserve(settings_.size());
        for (const auto& pair : settings_) {
            out.push_back(pair.first);
        }
        return out;
    }

    std::string Config::get(const std::string& key, const std::string& defaultValue) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = settings_.find(key);
        return it == settings_.end() ? defaultValue : it->second;
    }

    void Config::set(const std::string& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        settings_[key] = value;
    }

    size_t Config::getSize(const std::string& key, size_t defaultValue) const {
        std::string val = get(key);
        if (val.empty() || val[0] == '-' || val[0] == '+') return defaultValue;
        try {
            size_t consumed = 0;
            auto parsed = std::stoull(val, &consumed);
            return consumed == val.size() ? static_cast<size_t>(parsed) : defaultValue;
        } catch (const std::logic_error&) {
            return defaultValue;
        }
    }

    void Config::setSize(const std::string& key, size_t value) {
        set(key, std::to_string(value));
    }

    bool Config::validate(const std::unordered_map<std::string, Validator>& schema,
                          std::string* failedKey) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [key, validator] : schema) {
            auto it = settings_.find(key);
            if (it != settings_.end() && validator && !validator(key, it->second)) {
                if (failedKey) {
                    *failedKey = key;
                }
                return false;
            }
        }
        return true;
    }

}
