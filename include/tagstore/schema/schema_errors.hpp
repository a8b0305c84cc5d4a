#pragma once

#include <string>
#include <string_view>
#include <system_error>

namespace tagstore::schema {

enum class SchemaErrc {
    Success = 0,
    DuplicateTag,
    DuplicateName,
    NullablePrimaryKey,
    MultipleAutoIncrement,
    MissingPrimaryKey,
    CaseInsensitiveNameCollision,
    UnknownTag,
    UnknownColumn,
    DuplicateMappingTarget,
    EmptyMapping,
    IncompleteMapping,
    NonNullableColumnMissing,
    TypeMismatch,
    ValueConversionFailed,
    RowLengthMismatch,
    TagSpaceExhausted,
    TagCountMismatch,
    MalformedTagAnnotation,
    IncompleteWrite,
    WriterClosed,
    StreamWriteFailed
};

// Coarse failure kinds. Every SchemaErrc maps onto exactly one of these.
enum class SchemaErrorKind {
    DuplicateIdentity = 1,
    SchemaInvariantViolation,
    UnmappableColumn,
    NonNullableViolation,
    ValueConversionFailure,
    TagSpaceExhausted,
    IncompleteWriteError
};

const std::error_category& schema_error_category() noexcept;
const std::error_category& schema_error_kind_category() noexcept;

std::error_code make_error_code(SchemaErrc value) noexcept;
std::error_condition make_error_condition(SchemaErrorKind value) noexcept;

class SchemaError final : public std::system_error {
public:
    SchemaError(SchemaErrc code, const std::string& message);
    SchemaError(SchemaErrc code, std::string column_name, const std::string& message);

    [[nodiscard]] const std::string& column_name() const noexcept { return column_name_; }

private:
    std::string column_name_{};
};

}  // namespace tagstore::schema

namespace std {

template <>
struct is_error_code_enum<tagstore::schema::SchemaErrc> : true_type {
};

template <>
struct is_error_condition_enum<tagstore::schema::SchemaErrorKind> : true_type {
};

}  // namespace std
