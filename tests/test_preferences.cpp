// Tests for PreferenceStore and apply_preferences
// Compile: g++ -std=c++17 -I../include -o test_preferences test_preferences.cpp ../src/preferences.cpp

#include "preferences.hpp"
#include <iostream>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace voicetype;
namespace fs = std::filesystem;

static fs::path make_temp_dir() {
    fs::path dir = fs::temp_directory_path() / ("voicetype_prefs_" + std::to_string(getpid()));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

void test_round_trip_through_file() {
    std::cout << "Testing values survive a reload..." << std::endl;

    fs::path dir = make_temp_dir();
    std::string path = (dir / "nested" / "preferences").string();

    {
        PreferenceStore store(path);
        assert(store.load());
        assert(!store.contains(pref::SELECTED_MODEL_ID));
        assert(store.set(pref::SELECTED_MODEL_ID, "base"));
        assert(store.set(pref::MAX_RECORDING_SECONDS, "45"));
    }

    PreferenceStore reloaded(path);
    assert(reloaded.load());
    assert(reloaded.get(pref::SELECTED_MODEL_ID) == "base");
    assert(reloaded.get_int(pref::MAX_RECORDING_SECONDS, 30) == 45);

    assert(reloaded.remove(pref::SELECTED_MODEL_ID));
    PreferenceStore again(path);
    assert(again.load());
    assert(!again.contains(pref::SELECTED_MODEL_ID));

    fs::remove_all(dir);
    std::cout << "  PASS" << std::endl;
}

void test_parsing() {
    std::cout << "Testing file parsing..." << std::endl;

    fs::path dir = make_temp_dir();
    std::string path = (dir / "preferences").string();
    {
        std::ofstream file(path);
        file << "# comment\n"
             << "\n"
             << "  language =  de  \n"
             << "not a pair\n"
             << "max_recording_seconds = abc\n"
             << "hotkey=ctrl+shift+space\n";
    }

    PreferenceStore store(path);
    assert(store.load());
    assert(store.get(pref::LANGUAGE) == "de");
    assert(store.get(pref::HOTKEY) == "ctrl+shift+space");
    assert(store.get_int(pref::MAX_RECORDING_SECONDS, 30) == 30);
    assert(store.get("missing", "fallback") == "fallback");

    fs::remove_all(dir);
    std::cout << "  PASS" << std::endl;
}

void test_in_memory_store() {
    std::cout << "Testing in-memory store..." << std::endl;

    PreferenceStore store;
    assert(store.load());
    assert(store.set("key", "value"));
    assert(store.get("key") == "value");
    assert(store.save());

    std::cout << "  PASS" << std::endl;
}

void test_out_of_range_integers() {
    std::cout << "Testing out-of-range integers..." << std::endl;

    PreferenceStore store;
    assert(store.set(pref::MAX_RECORDING_SECONDS, "5000000000"));
    assert(store.get_int(pref::MAX_RECORDING_SECONDS, 30) == 30);
    assert(store.set(pref::MAX_RECORDING_SECONDS, "-5000000000"));
    assert(store.get_int(pref::MAX_RECORDING_SECONDS, 30) == 30);
    assert(store.set(pref::MAX_RECORDING_SECONDS, "2147483647"));
    assert(store.get_int(pref::MAX_RECORDING_SECONDS, 30) == 2147483647);

    assert(store.set(pref::MAX_RECORDING_SECONDS, "99999999999999999999"));
    Config config;
    apply_preferences(store, ConfigOverrides{}, config);
    assert(config.max_recording_seconds == 30);

    std::cout << "  PASS" << std::endl;
}

void test_apply_preferences() {
    std::cout << "Testing command line overrides..." << std::endl;

    PreferenceStore store;
    assert(store.set(pref::SELECTED_MODEL_ID, "small"));
    assert(store.set(pref::LANGUAGE, "fr"));
    assert(store.set(pref::HOTKEY, "f9"));
    assert(store.set(pref::MAX_RECORDING_SECONDS, "0"));

    Config config;
    config.language = "es";
    ConfigOverrides overrides;
    overrides.language = true;

    apply_preferences(store, overrides, config);

    assert(config.model_id == "small");
    assert(config.language == "es");
    assert(config.hotkey == "f9");
    assert(config.max_recording_seconds == 30 && "Non-positive duration is ignored");

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "\n=== Preference Tests ===\n" << std::endl;

    test_round_trip_through_file();
    test_parsing();
    test_in_memory_store();
    test_out_of_range_integers();
    test_apply_preferences();

    std::cout << "\n=== All preference tests passed! ===\n" << std::endl;
    return 0;
}
