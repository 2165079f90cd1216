#include <algorithm>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

#include <absl/strings/ascii.h>
#include <absl/strings/str_split.h>
#include <absl/strings/strip.h>

#include "version_grammar.h"

namespace {

bool is_identifier_char(char c) {
    return absl::ascii_isalnum(static_cast<unsigned char>(c)) || c == '-';
}

// "0" or a digit run without a leading zero.
bool is_numeric_id(std::string_view id) {
    return is_numeric_identifier(id) && (id.size() == 1 || id.front() != '0');
}

bool is_pre_release_identifier(std::string_view id) {
    if (id.empty() || !std::all_of(id.begin(), id.end(), is_identifier_char)) {
        return false;
    }

    return !is_numeric_identifier(id) || is_numeric_id(id);
}

bool is_build_identifier(std::string_view id) {
    return !id.empty() && std::all_of(id.begin(), id.end(), is_identifier_char);
}

template<typename Predicate>
bool all_identifiers(std::string_view dotted, Predicate valid) {
    for (std::string_view id : absl::StrSplit(dotted, '.')) {
        if (!valid(id)) {
            return false;
        }
    }
    return true;
}

// Takes the longest digit run off the front of `rest`.
std::optional<std::string_view> take_numeric_id(std::string_view &rest) {
    size_t end = 0;
    while (end < rest.size()
            && absl::ascii_isdigit(static_cast<unsigned char>(rest[end]))) {
        end++;
    }

    std::string_view id = rest.substr(0, end);
    if (!is_numeric_id(id)) {
        return std::nullopt;
    }

    rest.remove_prefix(end);
    return id;
}

} // namespace

bool is_numeric_identifier(std::string_view identifier) {
    return !identifier.empty()
            && std::all_of(identifier.begin(), identifier.end(), [](char c) {
                   return absl::ascii_isdigit(static_cast<unsigned char>(c));
               });
}

std::expected<VersionFields, ParseError> parse_version_fields(
        std::string_view raw) {
    ParseError const malformed{ParseErrorKind::MalformedVersion,
            std::string{raw}};

    VersionFields fields{};
    std::string_view rest = raw;

    // '+' never occurs before the build metadata
    if (size_t plus = rest.find('+'); plus != std::string_view::npos) {
        std::string_view build = rest.substr(plus + 1);
        if (!all_identifiers(build, is_build_identifier)) {
            return std::unexpected(malformed);
        }

        fields.build_metadata = build;
        rest = rest.substr(0, plus);
    }

    fields.major = try_unwrap_or(take_numeric_id(rest), malformed);
    if (!absl::ConsumePrefix(&rest, ".")) {
        return std::unexpected(malformed);
    }
    fields.minor = try_unwrap_or(take_numeric_id(rest), malformed);
    if (!absl::ConsumePrefix(&rest, ".")) {
        return std::unexpected(malformed);
    }
    fields.patch = try_unwrap_or(take_numeric_id(rest), malformed);

    if (rest.empty()) {
        return fields;
    }

    // A leading '-' is the separator, so "1.0.0-" has an empty pre-release.
    if (rest.front() == '-') {
        rest.remove_prefix(1);
    }
    if (!all_identifiers(rest, is_pre_release_identifier)) {
        return std::unexpected(malformed);
    }

    fields.pre_release = rest;
    return fields;
}
