#pragma once

#include "text_injector.hpp"
#include "clipboard.hpp"

#include <string>
#include <vector>

namespace voicetype {

// Tries clipboard + Ctrl+V first, then types the text key by key with XTest
class X11TextInjector : public TextInjector {
public:
    enum class Strategy {
        ClipboardPaste,
        TypeKeys
    };

    explicit X11TextInjector(Clipboard& clipboard);

    InjectionResult inject(const std::string& text) override;

    static const char* strategy_name(Strategy strategy);

private:
    Clipboard& clipboard_;
    std::vector<Strategy> strategies_;
};

} // namespace voicetype
