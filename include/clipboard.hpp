#pragma once

#include <string>

namespace voicetype {

class Clipboard {
public:
    virtual ~Clipboard() = default;

    // Set text to clipboard
    virtual bool set_text(const std::string& text) = 0;

    // Get text from clipboard
    virtual std::string get_text() = 0;
};

// X11 clipboard through xclip, falling back to xsel
class SystemClipboard : public Clipboard {
public:
    bool set_text(const std::string& text) override;
    std::string get_text() override;
};

} // namespace voicetype
