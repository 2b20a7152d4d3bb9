#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace reshape {

/// Concept constraining valid column element types.
template <typename T>
concept ColumnElement = std::regular<T> && std::totally_ordered<T>;

/// Tag type for categorical (factor) columns.
struct Categorical {};

/// A typed, owning columnar storage container.
///
/// Column<T> owns a contiguous vector of homogeneously typed values.
/// Copying a column copies its storage; columns never alias each other.
template <typename T>
class Column {
   public:
    using value_type = T;
    using size_type = std::size_t;
    using reference = typename std::vector<T>::reference;
    using const_reference = typename std::vector<T>::const_reference;

    static_assert(ColumnElement<T>,
                  "Column<T> requires T to satisfy ColumnElement (regular + totally ordered).");

    Column() = default;

    explicit Column(std::vector<T> data) : data_(std::move(data)) {}

    Column(std::initializer_list<T> init) : data_(init) {}

    [[nodiscard]] auto size() const noexcept -> size_type { return data_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return data_.empty(); }

    /// Bounds-checked element access.
    [[nodiscard]] auto at(size_type idx) const -> const_reference { return data_.at(idx); }
    [[nodiscard]] auto at(size_type idx) -> reference { return data_.at(idx); }

    /// Unchecked element access.
    [[nodiscard]] auto operator[](size_type idx) const noexcept -> const_reference {
        return data_[idx];
    }
    [[nodiscard]] auto operator[](size_type idx) noexcept -> reference { return data_[idx]; }

    void push_back(const T& value) { data_.push_back(value); }
    void push_back(T&& value) { data_.push_back(std::move(value)); }

    void reserve(size_type capacity) { data_.reserve(capacity); }

    /// Gather the rows at `indices` into a new column.
    [[nodiscard]] auto take(std::span<const std::size_t> indices) const -> Column<T> {
        std::vector<T> out;
        out.reserve(indices.size());
        for (auto idx : indices) {
            out.push_back(data_[idx]);
        }
        return Column<T>{std::move(out)};
    }

    [[nodiscard]] auto values() const noexcept -> const std::vector<T>& { return data_; }

    [[nodiscard]] auto begin() noexcept { return data_.begin(); }
    [[nodiscard]] auto end() noexcept { return data_.end(); }
    [[nodiscard]] auto begin() const noexcept { return data_.cbegin(); }
    [[nodiscard]] auto end() const noexcept { return data_.cend(); }

   private:
    std::vector<T> data_;
};

/// Specialization for categorical columns.
///
/// Rows hold codes into an ordered list of levels.  The level order is the
/// declared order and drives sorting; `ordered` marks an ordinal factor.
template <>
class Column<Categorical> {
   public:
    using value_type = std::string_view;
    using size_type = std::size_t;
    using code_type = std::int32_t;

    Column() = default;

    explicit Column(std::vector<std::string> levels, bool ordered = false)
        : levels_(std::move(levels)), ordered_(ordered) {
        rebuild_index();
    }

    Column(std::vector<std::string> levels, std::vector<code_type> codes, bool ordered = false)
        : levels_(std::move(levels)), codes_(std::move(codes)), ordered_(ordered) {
        rebuild_index();
    }

    /// Build a factor from labels, levels in first-appearance order.
    [[nodiscard]] static auto from_labels(std::span<const std::string> labels, bool ordered = false)
        -> Column<Categorical> {
        Column<Categorical> out({}, ordered);
        out.reserve(labels.size());
        for (const auto& label : labels) {
            out.push_back(label);
        }
        return out;
    }

    [[nodiscard]] auto size() const noexcept -> size_type { return codes_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return codes_.empty(); }

    [[nodiscard]] auto operator[](size_type idx) const noexcept -> value_type {
        return levels_[static_cast<std::size_t>(codes_[idx])];
    }

    [[nodiscard]] auto code_at(size_type idx) const noexcept -> code_type { return codes_[idx]; }

    void push_code(code_type code) { codes_.push_back(code); }

    /// Append a label, adding it as a new trailing level when unseen.
    void push_back(value_type label) { codes_.push_back(add_level(label)); }

    /// Ensure `label` is a level and return its code.
    auto add_level(value_type label) -> code_type {
        if (auto it = index_.find(std::string(label)); it != index_.end()) {
            return it->second;
        }
        auto code = static_cast<code_type>(levels_.size());
        levels_.emplace_back(label);
        index_.emplace(levels_.back(), code);
        return code;
    }

    void reserve(size_type capacity) { codes_.reserve(capacity); }

    [[nodiscard]] auto levels() const noexcept -> const std::vector<std::string>& {
        return levels_;
    }
    [[nodiscard]] auto codes() const noexcept -> const std::vector<code_type>& { return codes_; }
    [[nodiscard]] auto is_ordered() const noexcept -> bool { return ordered_; }

    [[nodiscard]] auto find_code(value_type label) const -> std::optional<code_type> {
        if (auto it = index_.find(std::string(label)); it != index_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    /// Gather rows; the result keeps every level, used or not.
    [[nodiscard]] auto take(std::span<const std::size_t> indices) const -> Column<Categorical> {
        std::vector<code_type> codes;
        codes.reserve(indices.size());
        for (auto idx : indices) {
            codes.push_back(codes_[idx]);
        }
        return Column<Categorical>{levels_, std::move(codes), ordered_};
    }

    /// A zero-row column sharing this column's levels and orderedness.
    [[nodiscard]] auto empty_like() const -> Column<Categorical> {
        return Column<Categorical>{levels_, ordered_};
    }

   private:
    void rebuild_index() {
        index_.clear();
        index_.reserve(levels_.size());
        for (std::size_t i = 0; i < levels_.size(); ++i) {
            index_.emplace(levels_[i], static_cast<code_type>(i));
        }
    }

    std::vector<std::string> levels_;
    std::unordered_map<std::string, code_type> index_;
    std::vector<code_type> codes_;
    bool ordered_ = false;
};

}  // namespace reshape
