#include "clipboard.hpp"
#include <iostream>
#include <cstdio>
#include <array>
#include <memory>

namespace voicetype {

// Helper to run a command and get output
static std::string exec_command(const char* cmd) {
    std::array<char, 128> buffer;
    std::string result;
    std::unique_ptr<FILE, decltype(&pclose)> pipe(popen(cmd, "r"), pclose);
    if (!pipe) return "";
    while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe.get()) != nullptr) {
        result += buffer.data();
    }
    return result;
}

static bool write_command(const char* cmd, const std::string& text) {
    FILE* pipe = popen(cmd, "w");
    if (!pipe) return false;

    size_t written = fwrite(text.data(), 1, text.size(), pipe);
    int ret = pclose(pipe);
    return ret == 0 && written == text.size();
}

bool SystemClipboard::set_text(const std::string& text) {
    if (write_command("xclip -selection clipboard 2>/dev/null", text)) return true;
    if (write_command("xsel --clipboard --input 2>/dev/null", text)) return true;

    std::cerr << "Failed to set clipboard. Install xclip or xsel." << std::endl;
    return false;
}

std::string SystemClipboard::get_text() {
    std::string result = exec_command("xclip -selection clipboard -o 2>/dev/null");
    if (!result.empty()) return result;

    return exec_command("xsel --clipboard --output 2>/dev/null");
}

} // namespace voicetype
