#include "preferences.hpp"
#include <iostream>
#include <fstream>
#include <filesystem>
#include <cstdlib>
#include <cerrno>
#include <climits>
#include <utility>

namespace voicetype {

static std::string trim(const std::string& text) {
    size_t start = text.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

PreferenceStore::PreferenceStore(std::string path)
    : path_(std::move(path)) {
}

std::string PreferenceStore::default_path() {
    const char* home = std::getenv("HOME");
    if (!home) return "";
    return std::string(home) + "/.voicetype/preferences";
}

bool PreferenceStore::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    values_.clear();

    if (path_.empty()) return true;

    std::ifstream file(path_);
    if (!file.is_open()) {
        // File doesn't exist - nothing saved yet
        return true;
    }

    std::string line;
    int line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#') continue;

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            std::cerr << "Ignoring malformed preference at " << path_ << ":" << line_no << std::endl;
            continue;
        }

        std::string key = trim(line.substr(0, eq));
        if (key.empty()) continue;
        values_[key] = trim(line.substr(eq + 1));
    }

    std::cout << "Loaded " << values_.size() << " preferences from " << path_ << std::endl;
    return true;
}

bool PreferenceStore::save() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return save_locked();
}

bool PreferenceStore::save_locked() const {
    if (path_.empty()) return true;

    std::error_code ec;
    std::filesystem::path parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            std::cerr << "Failed to create " << parent << ": " << ec.message() << std::endl;
            return false;
        }
    }

    std::ofstream file(path_, std::ios::trunc);
    if (!file.is_open()) {
        std::cerr << "Failed to write preferences: " << path_ << std::endl;
        return false;
    }

    file << "# VoiceType preferences\n";
    for (const auto& entry : values_) {
        file << entry.first << " = " << entry.second << "\n";
    }
    return file.good();
}

bool PreferenceStore::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return values_.count(key) > 0;
}

std::string PreferenceStore::get(const std::string& key, const std::string& fallback) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = values_.find(key);
    return it != values_.end() ? it->second : fallback;
}

int PreferenceStore::get_int(const std::string& key, int fallback) const {
    std::string value = get(key);
    if (value.empty()) return fallback;

    char* end = nullptr;
    errno = 0;
    long parsed = std::strtol(value.c_str(), &end, 10);
    if (end == value.c_str() || *end != '\0') {
        std::cerr << "Preference " << key << " is not a number: " << value << std::endl;
        return fallback;
    }
    if (errno == ERANGE || parsed > INT_MAX || parsed < INT_MIN) {
        std::cerr << "Preference " << key << " is out of range: " << value << std::endl;
        return fallback;
    }
    return static_cast<int>(parsed);
}

bool PreferenceStore::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    values_[key] = value;
    return save_locked();
}

bool PreferenceStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (values_.erase(key) == 0) return true;
    return save_locked();
}

void apply_preferences(const PreferenceStore& preferences, const ConfigOverrides& overrides, Config& config) {
    if (!overrides.model_id) {
        config.model_id = preferences.get(pref::SELECTED_MODEL_ID, config.model_id);
    }
    if (!overrides.hotkey) {
        config.hotkey = preferences.get(pref::HOTKEY, config.hotkey);
    }
    if (!overrides.language) {
        config.language = preferences.get(pref::LANGUAGE, config.language);
    }
    if (!overrides.max_recording_seconds) {
        int seconds = preferences.get_int(pref::MAX_RECORDING_SECONDS, config.max_recording_seconds);
        if (seconds > 0) {
            config.max_recording_seconds = seconds;
        } else {
            std::cerr << "Ignoring stored max recording duration " << seconds << std::endl;
        }
    }
}

} // namespace voicetype
