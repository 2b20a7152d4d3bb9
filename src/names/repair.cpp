#include <reshape/names/repair.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <cctype>
#include <string_view>
#include <unordered_map>

namespace reshape::names {

namespace {

/// Drop a `...<digits>` suffix left by an earlier unique repair.
auto strip_position(std::string name) -> std::string {
    auto dots = name.rfind("...");
    if (dots == std::string::npos || dots + 3 == name.size()) {
        return name;
    }
    bool digits = std::all_of(name.begin() + static_cast<std::ptrdiff_t>(dots + 3), name.end(),
                              [](unsigned char ch) { return std::isdigit(ch) != 0; });
    if (!digits) {
        return name;
    }
    name.resize(dots);
    return name;
}

auto count_names(const std::vector<std::string>& names)
    -> std::unordered_map<std::string_view, std::size_t> {
    std::unordered_map<std::string_view, std::size_t> counts;
    counts.reserve(names.size());
    for (const auto& name : names) {
        ++counts[name];
    }
    return counts;
}

auto make_unique(std::vector<std::string> names) -> std::vector<std::string> {
    for (auto& name : names) {
        name = strip_position(std::move(name));
    }
    auto counts = count_names(names);
    std::vector<bool> needs_suffix(names.size());
    for (std::size_t i = 0; i < names.size(); ++i) {
        needs_suffix[i] = names[i].empty() || counts[names[i]] > 1;
    }
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (needs_suffix[i]) {
            names[i] = fmt::format("{}...{}", names[i], i + 1);
        }
    }
    return names;
}

auto check_unique(const std::vector<std::string>& names) -> std::expected<void, Error> {
    std::vector<std::size_t> empty;
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (names[i].empty()) {
            empty.push_back(i + 1);
        }
    }
    if (!empty.empty()) {
        return std::unexpected(
            Error{.code = ErrorCode::NameCollision,
                  .message = fmt::format("Names can't be empty; empty name found at location {}.",
                                         fmt::join(empty, ", "))});
    }

    std::vector<std::string_view> order;
    std::unordered_map<std::string_view, std::vector<std::size_t>> locations;
    for (std::size_t i = 0; i < names.size(); ++i) {
        auto [it, inserted] = locations.try_emplace(names[i]);
        if (inserted) {
            order.push_back(names[i]);
        }
        it->second.push_back(i + 1);
    }
    std::vector<std::string> duplicated;
    for (auto name : order) {
        const auto& at = locations[name];
        if (at.size() > 1) {
            duplicated.push_back(fmt::format("`{}` at locations {}", name, fmt::join(at, ", ")));
        }
    }
    if (!duplicated.empty()) {
        return std::unexpected(
            Error{.code = ErrorCode::NameCollision,
                  .message = fmt::format("Names must be unique; duplicated: {}",
                                         fmt::join(duplicated, "; "))});
    }
    return {};
}

}  // namespace

auto repair(std::vector<std::string> names, const NameRepair& repair)
    -> std::expected<std::vector<std::string>, Error> {
    switch (repair.policy) {
        case RepairPolicy::Minimal:
            return names;
        case RepairPolicy::Unique:
            return make_unique(std::move(names));
        case RepairPolicy::CheckUnique: {
            auto checked = check_unique(names);
            if (!checked) {
                return std::unexpected(checked.error());
            }
            return names;
        }
        case RepairPolicy::Custom: {
            if (!repair.fn) {
                return std::unexpected(Error{.code = ErrorCode::NameRepair,
                                             .message = "`names_repair` function is empty"});
            }
            auto out = repair.fn(names);
            if (out.size() != names.size()) {
                return std::unexpected(Error{
                    .code = ErrorCode::NameRepair,
                    .message = fmt::format("`names_repair` function must return {} names, not {}",
                                           names.size(), out.size())});
            }
            return out;
        }
    }
    return names;
}

auto renamed(const std::vector<std::string>& before, const std::vector<std::string>& after)
    -> std::vector<std::pair<std::string, std::string>> {
    std::vector<std::pair<std::string, std::string>> out;
    const std::size_t n = std::min(before.size(), after.size());
    for (std::size_t i = 0; i < n; ++i) {
        if (before[i] != after[i]) {
            out.emplace_back(before[i], after[i]);
        }
    }
    return out;
}

auto parse_policy(std::string_view text) -> std::expected<NameRepair, Error> {
    if (text == "minimal") {
        return NameRepair::minimal();
    }
    if (text == "unique") {
        return NameRepair::unique();
    }
    if (text == "check_unique") {
        return NameRepair::check_unique();
    }
    return std::unexpected(
        Error{.code = ErrorCode::NameRepair,
              .message = fmt::format("unknown names_repair policy: {} (expected minimal, unique "
                                     "or check_unique)",
                                     text)});
}

}  // namespace reshape::names
