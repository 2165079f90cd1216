#include <algorithm>
#include <cstdio>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <absl/flags/flag.h>
#include <absl/flags/parse.h>
#include <absl/flags/usage.h>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "utils/semantic_version.h"

ABSL_FLAG(bool, self_check, false, "verify the built-in precedence table");
ABSL_FLAG(std::string, log_level, "warn",
        "trace, debug, info, warn, error, critical or off");

namespace {

struct ParsedVersion {
    std::string text;
    SemanticVersion version;
};

// Each pair must satisfy first < second.
constexpr std::pair<std::string_view, std::string_view> kPrecedenceChecks[] = {
        {"1.0.0", "2.0.0"},
        {"1.0.0", "1.42.0"},
        {"1.2.0", "1.2.42"},
        {"1.1.0-alpha", "1.2.0-alpha.1"},
        {"1.0.1b", "1.0.10-alpha.beta"},
        {"1.0.0-rc.1", "1.0.0"},
        {"1.0.0-alpha", "1.0.0-alpha.1"},
        {"1.0.0-alpha.1", "1.0.0-alpha.beta"},
        {"1.0.0-beta.2", "1.0.0-beta.11"},
};

bool self_check() {
    size_t failures = 0;

    for (auto const &[lower, higher] : kPrecedenceChecks) {
        auto lhs = SemanticVersion::parse(lower);
        auto rhs = SemanticVersion::parse(higher);
        if (!lhs.has_value() || !rhs.has_value()) {
            spdlog::error("self-check: {}",
                    lhs.has_value() ? rhs.error() : lhs.error());
            failures++;
            continue;
        }

        if (!(*lhs < *rhs)) {
            spdlog::error("self-check: expected {} < {}", lower, higher);
            failures++;
        }
        if (!(*rhs > *lhs)) {
            spdlog::error("self-check: expected {} > {}", higher, lower);
            failures++;
        }
        if (!(*rhs != *lhs)) {
            spdlog::error("self-check: expected {} != {}", higher, lower);
            failures++;
        }
    }

    spdlog::info("self-check: {} pairs, {} failures",
            std::size(kPrecedenceChecks),
            failures);
    return failures == 0;
}

} // namespace

int main(int argc, char **argv) {
    absl::SetProgramUsageMessage(
            "Sorts semantic versions by precedence.\n"
            "usage: semverc [--self_check] [--log_level=LEVEL] VERSION...");
    std::vector<char *> args = absl::ParseCommandLine(argc, argv);

    spdlog::set_level(spdlog::level::from_str(absl::GetFlag(FLAGS_log_level)));

    bool run_self_check = absl::GetFlag(FLAGS_self_check);
    if (args.size() < 2 && !run_self_check) {
        fmt::print(stderr, "{}\n", absl::ProgramUsageMessage());
        return 1;
    }

    int status = 0;
    if (run_self_check && !self_check()) {
        status = 1;
    }

    std::vector<ParsedVersion> versions;
    for (size_t i = 1; i < args.size(); i++) {
        auto version = SemanticVersion::parse(args[i]);
        if (!version.has_value()) {
            spdlog::error("{}", version.error());
            status = 1;
            continue;
        }

        versions.push_back({args[i], std::move(version.value())});
    }

    if (status != 0) {
        return status;
    }

    std::stable_sort(versions.begin(),
            versions.end(),
            [](ParsedVersion const &a, ParsedVersion const &b) {
                return a.version < b.version;
            });

    for (ParsedVersion const &parsed : versions) {
        spdlog::debug("{} -> {}.{}.{}",
                parsed.text,
                parsed.version.major(),
                parsed.version.minor(),
                parsed.version.patch());
        fmt::print("{}\n", parsed.text);
    }

    return 0;
}
