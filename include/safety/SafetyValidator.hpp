#pragma once

#include "types/SyncError.hpp"

#include <array>
#include <filesystem>
#include <optional>
#include <string_view>

namespace mg::ui {
class Prompter;
}

namespace mg::safety {

// Top-level directories that need a double confirmation as a destination
inline constexpr std::array<std::string_view, 15> SENSITIVE_DIRS = {
    "etc", "home", "var", "bin", "usr", "lib", "opt", "tmp",
    "srv", "dev", "mnt", "media", "proc", "run", "sys"
};

struct Violation {
    types::ErrorKind kind;
    std::string message;
};

// Segment-wise prefix test: "/data" contains "/data/x" but not "/data2"
[[nodiscard]] bool isPathPrefix(const std::filesystem::path& ancestor, const std::filesystem::path& descendant);

[[nodiscard]] bool isSensitiveArea(const std::filesystem::path& dst);

// Identity, root and nesting rules on symlink-resolved paths, first violation wins
[[nodiscard]] std::optional<Violation> checkStructuralRules(const std::filesystem::path& src,
                                                            const std::filesystem::path& dst);

class SafetyValidator {
public:
    explicit SafetyValidator(ui::Prompter& prompter);

    // Throws SyncError on the first violated rule. A sensitive destination needs two
    // explicit confirmations; declining either throws SensitiveAreaDeclined.
    void validate(const std::filesystem::path& src, const std::filesystem::path& dst) const;

private:
    ui::Prompter& prompter_;
};

}
