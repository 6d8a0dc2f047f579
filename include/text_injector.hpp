#pragma once

#include <string>

namespace voicetype {

enum class InjectionFailure {
    None,
    NoFocusedElement,
    UnsupportedApplication,
    PermissionDenied,
    Failed
};

struct InjectionResult {
    bool success = false;
    std::string method;         // Strategy that delivered the text
    InjectionFailure failure = InjectionFailure::None;
    std::string detail;

    static InjectionResult succeeded(const std::string& method) {
        InjectionResult result;
        result.success = true;
        result.method = method;
        return result;
    }
    static InjectionResult failed(InjectionFailure failure, const std::string& detail) {
        InjectionResult result;
        result.failure = failure;
        result.detail = detail;
        return result;
    }
};

// Inserts text into the focused application, trying its own strategies in order
class TextInjector {
public:
    virtual ~TextInjector() = default;

    virtual InjectionResult inject(const std::string& text) = 0;
};

} // namespace voicetype
