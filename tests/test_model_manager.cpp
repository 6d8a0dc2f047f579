// Tests for ModelManager file lookup
// Compile: g++ -std=c++17 -I../include -o test_model_manager test_model_manager.cpp ../src/model_manager.cpp

#include "model_manager.hpp"
#include <iostream>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace voicetype;
namespace fs = std::filesystem;

static void write_file(const fs::path& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary);
    file << content;
}

void test_lookup() {
    std::cout << "Testing model lookup..." << std::endl;

    fs::path dir = fs::temp_directory_path() / ("voicetype_models_" + std::to_string(getpid()));
    fs::remove_all(dir);
    fs::create_directories(dir);

    write_file(dir / "ggml-tiny.bin", "model");
    write_file(dir / "ggml-base.en.bin", "model");
    write_file(dir / "ggml-empty.bin", "");
    write_file(dir / "notes.txt", "not a model");
    fs::create_directories(dir / "ggml-dir.bin");

    ModelManager models(dir.string());

    assert(ModelManager::model_filename("small") == "ggml-small.bin");
    assert(models.model_path("tiny") == (dir / "ggml-tiny.bin").string());

    assert(models.is_model_downloaded("tiny"));
    assert(models.is_model_downloaded("base.en"));
    assert(!models.is_model_downloaded("empty") && "Zero-byte file is not a model");
    assert(!models.is_model_downloaded("dir"));
    assert(!models.is_model_downloaded("large"));
    assert(!models.is_model_downloaded(""));

    std::vector<std::string> installed = models.installed_models();
    assert(installed.size() == 3);
    assert(installed[0] == "base.en");
    assert(installed[1] == "empty");
    assert(installed[2] == "tiny");

    fs::remove_all(dir);
    std::cout << "  PASS" << std::endl;
}

void test_missing_directory() {
    std::cout << "Testing missing model directory..." << std::endl;

    ModelManager models("/nonexistent/voicetype/models");
    assert(models.installed_models().empty());
    assert(!models.is_model_downloaded("tiny"));

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "\n=== Model Manager Tests ===\n" << std::endl;

    test_lookup();
    test_missing_directory();

    std::cout << "\n=== All model manager tests passed! ===\n" << std::endl;
    return 0;
}
