#pragma once

#include <compare>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

#include "error.h"

// Precedence of two dot-separated pre-release strings. Numeric identifiers
// sort by value and below alphanumeric ones, alphanumeric identifiers sort
// byte-wise, and a strict prefix sorts first.
std::strong_ordering compare_pre_release(std::string_view lhs,
        std::string_view rhs);

class SemanticVersion {
public:
    static std::expected<SemanticVersion, ParseError> parse(
            std::string_view str);

    uint64_t major() const { return major_; }
    uint64_t minor() const { return minor_; }
    uint64_t patch() const { return patch_; }

    std::optional<std::string> const &pre_release() const {
        return pre_release_;
    }
    std::optional<std::string> const &build_metadata() const {
        return build_metadata_;
    }

    bool is_pre_release() const { return pre_release_.has_value(); }

    // build metadata is ignored by both
    std::strong_ordering operator<=>(SemanticVersion const &other) const;
    bool operator==(SemanticVersion const &other) const;

private:
    SemanticVersion() = default;

    uint64_t major_ = 0;
    uint64_t minor_ = 0;
    uint64_t patch_ = 0;
    std::optional<std::string> pre_release_;
    std::optional<std::string> build_metadata_;
};
