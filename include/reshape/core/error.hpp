#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace reshape {

enum class ErrorCode : std::uint8_t {
    ColumnNotFound,
    EmptySelection,
    SpecMissingColumns,
    SpecNameNotText,
    SpecNameMissing,
    SpecNameNotUnique,
    SpecValueNotText,
    SpecKeyNotUnique,
    TypeMismatch,
    InvalidValuesFn,
    InvalidFill,
    InvalidGlue,
    InvalidNames,
    AggregationFailed,
    NameCollision,
    NameRepair,
    LengthMismatch,
    Io,
};

/// Error returned by every fallible reshape operation.
struct Error {
    ErrorCode code = ErrorCode::ColumnNotFound;
    std::string message;
};

[[nodiscard]] auto error_code_name(ErrorCode code) -> std::string_view;

enum class DiagnosticKind : std::uint8_t {
    /// Several input rows fed one output cell and no aggregation was given.
    DuplicateKeys,
    /// Name repair changed one or more output column names.
    NamesRepaired,
};

/// Non-fatal finding reported alongside a successful result.
struct Diagnostic {
    DiagnosticKind kind = DiagnosticKind::DuplicateKeys;
    std::string column;
    std::string message;
};

using Diagnostics = std::vector<Diagnostic>;

}  // namespace reshape
