#include <compare>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <absl/strings/numbers.h>
#include <absl/strings/str_split.h>
#include <spdlog/spdlog.h>

#include "semantic_version.h"
#include "version_grammar.h"

namespace {

std::optional<uint64_t> parse_numeric_field(std::string_view field) {
    uint64_t value = 0;
    if (!absl::SimpleAtoi(field, &value)) {
        return std::nullopt;
    }
    return value;
}

// Numeric identifiers carry no leading zeros, so the shorter one is smaller
// and equal lengths compare digit by digit. This also holds past 2^64.
std::strong_ordering compare_numeric_identifiers(std::string_view lhs,
        std::string_view rhs) {
    if (auto cmp = lhs.size() <=> rhs.size(); cmp != 0) {
        return cmp;
    }
    return lhs.compare(rhs) <=> 0;
}

std::strong_ordering compare_identifiers(std::string_view lhs,
        std::string_view rhs) {
    bool lhs_numeric = is_numeric_identifier(lhs);
    bool rhs_numeric = is_numeric_identifier(rhs);

    if (lhs_numeric && rhs_numeric) {
        return compare_numeric_identifiers(lhs, rhs);
    }

    if (lhs_numeric != rhs_numeric) {
        return lhs_numeric ? std::strong_ordering::less
                           : std::strong_ordering::greater;
    }

    return lhs.compare(rhs) <=> 0;
}

} // namespace

std::strong_ordering compare_pre_release(std::string_view lhs,
        std::string_view rhs) {
    std::vector<std::string_view> lhs_ids = absl::StrSplit(lhs, '.');
    std::vector<std::string_view> rhs_ids = absl::StrSplit(rhs, '.');

    for (size_t i = 0; i < lhs_ids.size() && i < rhs_ids.size(); i++) {
        if (auto cmp = compare_identifiers(lhs_ids[i], rhs_ids[i]); cmp != 0) {
            return cmp;
        }
    }

    return lhs_ids.size() <=> rhs_ids.size();
}

std::expected<SemanticVersion, ParseError> SemanticVersion::parse(
        std::string_view str) {
    auto fields = parse_version_fields(str);
    if (!fields.has_value()) {
        spdlog::debug("rejecting version: {}", fields.error());
        return std::unexpected(fields.error());
    }

    ParseError const invalid_numeric{ParseErrorKind::InvalidNumericField,
            std::string{str}};

    SemanticVersion version{};
    version.major_ = try_unwrap_or(
            parse_numeric_field(fields->major), invalid_numeric);
    version.minor_ = try_unwrap_or(
            parse_numeric_field(fields->minor), invalid_numeric);
    version.patch_ = try_unwrap_or(
            parse_numeric_field(fields->patch), invalid_numeric);

    if (fields->pre_release) {
        version.pre_release_ = std::string{*fields->pre_release};
    }
    if (fields->build_metadata) {
        version.build_metadata_ = std::string{*fields->build_metadata};
    }

    return version;
}

std::strong_ordering SemanticVersion::operator<=>(
        SemanticVersion const &other) const {
    if (auto cmp = major_ <=> other.major_; cmp != 0) {
        return cmp;
    }
    if (auto cmp = minor_ <=> other.minor_; cmp != 0) {
        return cmp;
    }
    if (auto cmp = patch_ <=> other.patch_; cmp != 0) {
        return cmp;
    }

    // a pre-release sorts before the release it precedes
    if (pre_release_.has_value() != other.pre_release_.has_value()) {
        return pre_release_.has_value() ? std::strong_ordering::less
                                        : std::strong_ordering::greater;
    }

    if (!pre_release_.has_value()) {
        return std::strong_ordering::equal;
    }

    return compare_pre_release(*pre_release_, *other.pre_release_);
}

bool SemanticVersion::operator==(SemanticVersion const &other) const {
    return major_ == other.major_ && minor_ == other.minor_
            && patch_ == other.patch_ && pre_release_ == other.pre_release_;
}
