#pragma once

#include <reshape/core/error.hpp>

#include <cstdint>
#include <expected>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace reshape::names {

enum class RepairPolicy : std::uint8_t {
    /// Leave names alone; duplicates and empty names are allowed.
    Minimal,
    /// Suffix empty or duplicated names with `...<position>`.
    Unique,
    /// Fail on empty or duplicated names.
    CheckUnique,
    /// Apply a caller-supplied renaming function.
    Custom,
};

using RepairFn = std::function<std::vector<std::string>(const std::vector<std::string>&)>;

struct NameRepair {
    RepairPolicy policy = RepairPolicy::CheckUnique;
    RepairFn fn;

    [[nodiscard]] static auto minimal() -> NameRepair { return {.policy = RepairPolicy::Minimal}; }
    [[nodiscard]] static auto unique() -> NameRepair { return {.policy = RepairPolicy::Unique}; }
    [[nodiscard]] static auto check_unique() -> NameRepair {
        return {.policy = RepairPolicy::CheckUnique};
    }
    [[nodiscard]] static auto custom(RepairFn fn) -> NameRepair {
        return {.policy = RepairPolicy::Custom, .fn = std::move(fn)};
    }
};

/// Repair a sequence of candidate column names under `repair`.
[[nodiscard]] auto repair(std::vector<std::string> names, const NameRepair& repair)
    -> std::expected<std::vector<std::string>, Error>;

/// Pairs of (old, new) names that differ between two equal-length sequences.
[[nodiscard]] auto renamed(const std::vector<std::string>& before,
                           const std::vector<std::string>& after)
    -> std::vector<std::pair<std::string, std::string>>;

/// Parse "minimal", "unique" or "check_unique".
[[nodiscard]] auto parse_policy(std::string_view text) -> std::expected<NameRepair, Error>;

}  // namespace reshape::names
