#include <reshape/core/error.hpp>

namespace reshape {

auto error_code_name(ErrorCode code) -> std::string_view {
    switch (code) {
        case ErrorCode::ColumnNotFound:
            return "column_not_found";
        case ErrorCode::EmptySelection:
            return "empty_selection";
        case ErrorCode::SpecMissingColumns:
            return "spec_missing_columns";
        case ErrorCode::SpecNameNotText:
            return "spec_name_not_text";
        case ErrorCode::SpecNameMissing:
            return "spec_name_missing";
        case ErrorCode::SpecNameNotUnique:
            return "spec_name_not_unique";
        case ErrorCode::SpecValueNotText:
            return "spec_value_not_text";
        case ErrorCode::SpecKeyNotUnique:
            return "spec_key_not_unique";
        case ErrorCode::TypeMismatch:
            return "type_mismatch";
        case ErrorCode::InvalidValuesFn:
            return "invalid_values_fn";
        case ErrorCode::InvalidFill:
            return "invalid_fill";
        case ErrorCode::InvalidGlue:
            return "invalid_glue";
        case ErrorCode::InvalidNames:
            return "invalid_names";
        case ErrorCode::AggregationFailed:
            return "aggregation_failed";
        case ErrorCode::NameCollision:
            return "name_collision";
        case ErrorCode::NameRepair:
            return "name_repair";
        case ErrorCode::LengthMismatch:
            return "length_mismatch";
        case ErrorCode::Io:
            return "io";
    }
    return "unknown";
}

}  // namespace reshape
