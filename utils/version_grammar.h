#pragma once

#include <expected>
#include <optional>
#include <string_view>

#include "error.h"

// Raw captures of a version string. Every view points into the string that
// was parsed, which must outlive this struct.
struct VersionFields {
    std::string_view major;
    std::string_view minor;
    std::string_view patch;
    // without the optional leading '-'
    std::optional<std::string_view> pre_release;
    // without the leading '+'
    std::optional<std::string_view> build_metadata;

    bool operator==(VersionFields const &) const = default;
};

// True for a non-empty identifier made only of ASCII digits.
bool is_numeric_identifier(std::string_view identifier);

// Splits a version string along the grammar
//
//   version     := core ( "-"? pre_release )? ( "+" build )?
//   core        := numeric_id "." numeric_id "." numeric_id
//   pre_release := pre_id ( "." pre_id )*
//   build       := build_id ( "." build_id )*
//
// where numeric ids have no leading zeros. The dash before the pre-release
// may be left out, so "1.0.1b" has pre-release "b". The whole input must
// match.
std::expected<VersionFields, ParseError> parse_version_fields(
        std::string_view raw);
