/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <array>
#include <string>
#include <utility>

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "spdlog/fmt/fmt.h"

#include "infquad/parse_verbosity.hpp"

namespace spdlog::level {

/**
 * @brief Short aliases accepted next to the spdlog level names.
 */
static constexpr std::array<std::pair<absl::string_view, level_enum>, 2> aliases = {{
    {"warn", warn},
    {"err", err},
}};

bool AbslParseFlag(absl::string_view text, level_enum *level, std::string *error) {
    const absl::string_view trimmed = absl::StripAsciiWhitespace(text);

    for (int i = trace; i < n_levels; ++i) {
        const auto candidate = static_cast<level_enum>(i);
        const auto name = to_string_view(candidate);
        if (absl::EqualsIgnoreCase(trimmed, absl::string_view(name.data(), name.size()))) {
            *level = candidate;
            return true;
        }
    }
    for (const auto &[alias, candidate] : aliases) {
        if (absl::EqualsIgnoreCase(trimmed, alias)) {
            *level = candidate;
            return true;
        }
    }

    *error = fmt::format("Invalid verbosity {}", std::string(text));
    return false;
}

std::string AbslUnparseFlag(level_enum level) {
    if (level < trace || level >= n_levels) {
        return "unknown";
    }

    const auto name = to_string_view(level);
    return std::string(name.data(), name.size());
}

}; /* namespace spdlog::level */
