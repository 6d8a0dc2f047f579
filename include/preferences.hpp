#pragma once

#include "config.hpp"

#include <map>
#include <mutex>
#include <string>

namespace voicetype {

// Keys persisted between runs
namespace pref {
inline const std::string SELECTED_MODEL_ID = "selected_model_id";
inline const std::string HOTKEY = "hotkey";
inline const std::string LANGUAGE = "language";
inline const std::string MAX_RECORDING_SECONDS = "max_recording_seconds";
}

// Flat key = value file. Lines starting with '#' are comments.
// An empty path keeps everything in memory.
class PreferenceStore {
public:
    explicit PreferenceStore(std::string path = "");

    // Default location: ~/.voicetype/preferences
    static std::string default_path();

    bool load();
    bool save() const;

    bool contains(const std::string& key) const;
    std::string get(const std::string& key, const std::string& fallback = "") const;
    int get_int(const std::string& key, int fallback) const;

    // Writes through to disk, false if the file could not be written
    bool set(const std::string& key, const std::string& value);
    bool remove(const std::string& key);

    const std::string& path() const { return path_; }

private:
    bool save_locked() const;

    std::string path_;
    mutable std::mutex mutex_;
    std::map<std::string, std::string> values_;
};

// Flags given on the command line win over stored preferences
struct ConfigOverrides {
    bool model_id = false;
    bool hotkey = false;
    bool language = false;
    bool max_recording_seconds = false;
};

// Fold stored preferences into the config
void apply_preferences(const PreferenceStore& preferences, const ConfigOverrides& overrides, Config& config);

} // namespace voicetype
