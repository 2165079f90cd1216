#pragma once

#include <string>
#include <string_view>

#include <fmt/core.h>

enum class ParseErrorKind {
    MalformedVersion,
    InvalidNumericField,
};

struct ParseError {
    ParseErrorKind kind;
    // the rejected input, verbatim
    std::string input;

    bool operator==(ParseError const &) const = default;
};

constexpr std::string_view to_string(ParseErrorKind kind) {
    switch (kind) {
    case ParseErrorKind::MalformedVersion:
        return "malformed version";
    case ParseErrorKind::InvalidNumericField:
        return "invalid numeric field";
    }
    return "unknown error";
}

template<>
struct fmt::formatter<ParseError> {
    constexpr auto parse(format_parse_context &ctx) const { return ctx.end(); }

    template<typename FormatContext>
    auto format(ParseError const &error, FormatContext &ctx) const {
        return format_to(
                ctx.out(), "{}: '{}'", ::to_string(error.kind), error.input);
    }
};

#define try_unwrap_or(x, err) \
    ({ \
        auto _x = x; \
        if (!_x.has_value()) { \
            return std::unexpected(err); \
        } \
        _x.value(); \
    })
