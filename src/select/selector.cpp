#include <reshape/select/selector.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <unordered_set>

namespace reshape::select {

namespace {

auto is_simple_identifier(std::string_view name) -> bool {
    if (name.empty()) {
        return false;
    }
    unsigned char first = static_cast<unsigned char>(name.front());
    if (std::isalpha(first) == 0 && first != '_' && first != '.') {
        return false;
    }
    for (std::size_t i = 1; i < name.size(); ++i) {
        unsigned char ch = static_cast<unsigned char>(name[i]);
        if (std::isalnum(ch) == 0 && ch != '_' && ch != '.') {
            return false;
        }
    }
    return true;
}

auto not_found(const Table& table, const std::string& name) -> Error {
    return Error{.code = ErrorCode::ColumnNotFound,
                 .message = fmt::format("column not found: {} (available: {})", name,
                                        format_columns(table))};
}

auto position_of(const Table& table, const std::string& name) -> std::expected<std::size_t, Error> {
    if (auto pos = table.position(name)) {
        return *pos;
    }
    return std::unexpected(not_found(table, name));
}

void append_distinct(Positions& out, std::unordered_set<std::size_t>& seen, std::size_t pos) {
    if (seen.insert(pos).second) {
        out.push_back(pos);
    }
}

auto match_names(const Table& table, auto&& accept) -> Positions {
    Positions out;
    for (std::size_t i = 0; i < table.columns.size(); ++i) {
        if (accept(table.columns[i])) {
            out.push_back(i);
        }
    }
    return out;
}

auto resolve_raw(const Table& table, const Selector& selector) -> std::expected<Positions, Error> {
    switch (selector.kind) {
        case SelectorKind::Names: {
            Positions out;
            out.reserve(selector.names.size());
            for (const auto& name : selector.names) {
                auto pos = position_of(table, name);
                if (!pos) {
                    return std::unexpected(pos.error());
                }
                out.push_back(*pos);
            }
            return out;
        }
        case SelectorKind::Positions: {
            for (auto pos : selector.positions) {
                if (pos >= table.columns.size()) {
                    return std::unexpected(
                        Error{.code = ErrorCode::ColumnNotFound,
                              .message = fmt::format("column position {} is out of range; table "
                                                     "has {} columns",
                                                     pos, table.columns.size())});
                }
            }
            return selector.positions;
        }
        case SelectorKind::Range: {
            if (selector.names.size() != 2) {
                return std::unexpected(Error{.code = ErrorCode::ColumnNotFound,
                                             .message = "range selector needs two column names"});
            }
            auto from = position_of(table, selector.names[0]);
            if (!from) {
                return std::unexpected(from.error());
            }
            auto to = position_of(table, selector.names[1]);
            if (!to) {
                return std::unexpected(to.error());
            }
            Positions out;
            if (*from <= *to) {
                for (std::size_t i = *from; i <= *to; ++i) {
                    out.push_back(i);
                }
            } else {
                for (std::size_t i = *from + 1; i-- > *to;) {
                    out.push_back(i);
                }
            }
            return out;
        }
        case SelectorKind::StartsWith:
            return match_names(table, [&](const ColumnEntry& entry) {
                return std::string_view(entry.name).starts_with(selector.pattern);
            });
        case SelectorKind::EndsWith:
            return match_names(table, [&](const ColumnEntry& entry) {
                return std::string_view(entry.name).ends_with(selector.pattern);
            });
        case SelectorKind::Contains:
            return match_names(table, [&](const ColumnEntry& entry) {
                return entry.name.find(selector.pattern) != std::string::npos;
            });
        case SelectorKind::Everything:
            return match_names(table, [](const ColumnEntry&) { return true; });
        case SelectorKind::Where:
            if (!selector.predicate) {
                return std::unexpected(Error{.code = ErrorCode::ColumnNotFound,
                                             .message = "where() selector has no predicate"});
            }
            return match_names(table, selector.predicate);
        case SelectorKind::Union: {
            Positions out;
            for (const auto& child : selector.children) {
                auto resolved = resolve_raw(table, child);
                if (!resolved) {
                    return std::unexpected(resolved.error());
                }
                out.insert(out.end(), resolved->begin(), resolved->end());
            }
            return out;
        }
        case SelectorKind::Except: {
            if (selector.children.size() != 2) {
                return std::unexpected(Error{.code = ErrorCode::ColumnNotFound,
                                             .message = "except selector needs two operands"});
            }
            auto kept = resolve_raw(table, selector.children[0]);
            if (!kept) {
                return std::unexpected(kept.error());
            }
            auto dropped = resolve_raw(table, selector.children[1]);
            if (!dropped) {
                return std::unexpected(dropped.error());
            }
            std::unordered_set<std::size_t> drop(dropped->begin(), dropped->end());
            Positions out;
            std::copy_if(kept->begin(), kept->end(), std::back_inserter(out),
                         [&](std::size_t pos) { return !drop.contains(pos); });
            return out;
        }
    }
    return std::unexpected(
        Error{.code = ErrorCode::ColumnNotFound, .message = "unknown selector kind"});
}

}  // namespace

auto cols(std::vector<std::string> names) -> Selector {
    return Selector{.kind = SelectorKind::Names, .names = std::move(names)};
}

auto positions(std::vector<std::size_t> indices) -> Selector {
    return Selector{.kind = SelectorKind::Positions, .positions = std::move(indices)};
}

auto range(std::string from, std::string to) -> Selector {
    return Selector{.kind = SelectorKind::Range, .names = {std::move(from), std::move(to)}};
}

auto starts_with(std::string prefix) -> Selector {
    return Selector{.kind = SelectorKind::StartsWith, .pattern = std::move(prefix)};
}

auto ends_with(std::string suffix) -> Selector {
    return Selector{.kind = SelectorKind::EndsWith, .pattern = std::move(suffix)};
}

auto contains(std::string needle) -> Selector {
    return Selector{.kind = SelectorKind::Contains, .pattern = std::move(needle)};
}

auto everything() -> Selector { return Selector{.kind = SelectorKind::Everything}; }

auto where(ColumnPredicate predicate) -> Selector {
    return Selector{.kind = SelectorKind::Where, .predicate = std::move(predicate)};
}

auto any_of(std::vector<Selector> selectors) -> Selector {
    return Selector{.kind = SelectorKind::Union, .children = std::move(selectors)};
}

auto all_except(Selector excluded) -> Selector {
    return Selector{.kind = SelectorKind::Except,
                    .children = {everything(), std::move(excluded)}};
}

auto resolve(const Table& table, const Selector& selector) -> std::expected<Positions, Error> {
    auto raw = resolve_raw(table, selector);
    if (!raw) {
        return std::unexpected(raw.error());
    }
    Positions out;
    out.reserve(raw->size());
    std::unordered_set<std::size_t> seen;
    for (auto pos : *raw) {
        append_distinct(out, seen, pos);
    }
    return out;
}

auto resolve_required(const Table& table, const Selector& selector, std::string_view arg)
    -> std::expected<Positions, Error> {
    auto resolved = resolve(table, selector);
    if (!resolved) {
        return resolved;
    }
    if (resolved->empty()) {
        return std::unexpected(
            Error{.code = ErrorCode::EmptySelection,
                  .message = fmt::format("`{}` must select at least one column.", arg)});
    }
    return resolved;
}

auto format_columns(const Table& table) -> std::string {
    if (table.columns.empty()) {
        return "<none>";
    }
    std::string out;
    for (std::size_t i = 0; i < table.columns.size(); ++i) {
        if (i > 0) {
            out.append(", ");
        }
        const auto& name = table.columns[i].name;
        if (is_simple_identifier(name)) {
            out.append(name);
        } else {
            out.push_back('`');
            out.append(name);
            out.push_back('`');
        }
    }
    return out;
}

}  // namespace reshape::select
