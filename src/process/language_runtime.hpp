#pragma once

#include <optional>
#include <string>
#include <vector>

namespace relay::process {

// How a declared language maps to an interpreter binary, and how to check
// that the interpreter works.
struct LanguageRuntime {
    std::string language;
    std::string interpreter;
    std::vector<std::string> probe_args = {"--version"};
};

inline std::vector<LanguageRuntime> default_language_runtimes() {
    return {
        LanguageRuntime{"node", "node", {"--version"}},
        LanguageRuntime{"python", "python", {"--version"}},
    };
}

inline std::optional<LanguageRuntime> find_runtime(
    const std::vector<LanguageRuntime>& runtimes, const std::string& language) {
    for (const auto& runtime : runtimes) {
        if (runtime.language == language) {
            return runtime;
        }
    }
    return std::nullopt;
}

}  // namespace relay::process
