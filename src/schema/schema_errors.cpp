#include "tagstore/schema/schema_errors.hpp"

#include <utility>

namespace tagstore::schema {

namespace {

[[nodiscard]] SchemaErrorKind kind_of(SchemaErrc value) noexcept
{
    switch (value) {
    case SchemaErrc::DuplicateTag:
    case SchemaErrc::DuplicateName:
    case SchemaErrc::CaseInsensitiveNameCollision:
        return SchemaErrorKind::DuplicateIdentity;
    case SchemaErrc::NullablePrimaryKey:
    case SchemaErrc::MultipleAutoIncrement:
    case SchemaErrc::MissingPrimaryKey:
    case SchemaErrc::TagCountMismatch:
        return SchemaErrorKind::SchemaInvariantViolation;
    case SchemaErrc::UnknownTag:
    case SchemaErrc::UnknownColumn:
    case SchemaErrc::DuplicateMappingTarget:
    case SchemaErrc::EmptyMapping:
    case SchemaErrc::IncompleteMapping:
    case SchemaErrc::MalformedTagAnnotation:
        return SchemaErrorKind::UnmappableColumn;
    case SchemaErrc::NonNullableColumnMissing:
        return SchemaErrorKind::NonNullableViolation;
    case SchemaErrc::TypeMismatch:
    case SchemaErrc::ValueConversionFailed:
    case SchemaErrc::RowLengthMismatch:
        return SchemaErrorKind::ValueConversionFailure;
    case SchemaErrc::TagSpaceExhausted:
        return SchemaErrorKind::TagSpaceExhausted;
    case SchemaErrc::IncompleteWrite:
    case SchemaErrc::WriterClosed:
    case SchemaErrc::StreamWriteFailed:
    default:
        return SchemaErrorKind::IncompleteWriteError;
    }
}

class SchemaErrorCategory final : public std::error_category {
public:
    const char* name() const noexcept override
    {
        return "tagstore.schema";
    }

    std::string message(int condition) const override
    {
        switch (static_cast<SchemaErrc>(condition)) {
        case SchemaErrc::Success:
            return "success";
        case SchemaErrc::DuplicateTag:
            return "duplicate column tag";
        case SchemaErrc::DuplicateName:
            return "duplicate column name";
        case SchemaErrc::NullablePrimaryKey:
            return "primary key column is nullable";
        case SchemaErrc::MultipleAutoIncrement:
            return "more than one auto increment column";
        case SchemaErrc::MissingPrimaryKey:
            return "schema has no primary key column";
        case SchemaErrc::CaseInsensitiveNameCollision:
            return "column names collide ignoring case";
        case SchemaErrc::UnknownTag:
            return "tag is not part of the schema";
        case SchemaErrc::UnknownColumn:
            return "column is not part of the schema";
        case SchemaErrc::DuplicateMappingTarget:
            return "two source tags map to the same destination tag";
        case SchemaErrc::EmptyMapping:
            return "tag mapping is empty";
        case SchemaErrc::IncompleteMapping:
            return "tag mapping does not cover every destination column";
        case SchemaErrc::NonNullableColumnMissing:
            return "non-nullable column has no value";
        case SchemaErrc::TypeMismatch:
            return "column types are incompatible";
        case SchemaErrc::ValueConversionFailed:
            return "value conversion failed";
        case SchemaErrc::RowLengthMismatch:
            return "row length does not match schema";
        case SchemaErrc::TagSpaceExhausted:
            return "tag space exhausted";
        case SchemaErrc::TagCountMismatch:
            return "number of tags does not equal number of columns";
        case SchemaErrc::MalformedTagAnnotation:
            return "malformed tag annotation";
        case SchemaErrc::IncompleteWrite:
            return "output stream was not completed";
        case SchemaErrc::WriterClosed:
            return "writer already closed";
        case SchemaErrc::StreamWriteFailed:
            return "stream write failed";
        default:
            return "unknown schema error";
        }
    }

    std::error_condition default_error_condition(int condition) const noexcept override
    {
        if (static_cast<SchemaErrc>(condition) == SchemaErrc::Success) {
            return {condition, *this};
        }
        return make_error_condition(kind_of(static_cast<SchemaErrc>(condition)));
    }
};

class SchemaErrorKindCategory final : public std::error_category {
public:
    const char* name() const noexcept override
    {
        return "tagstore.schema.kind";
    }

    std::string message(int condition) const override
    {
        switch (static_cast<SchemaErrorKind>(condition)) {
        case SchemaErrorKind::DuplicateIdentity:
            return "duplicate identity";
        case SchemaErrorKind::SchemaInvariantViolation:
            return "schema invariant violation";
        case SchemaErrorKind::UnmappableColumn:
            return "unmappable column";
        case SchemaErrorKind::NonNullableViolation:
            return "non-nullable violation";
        case SchemaErrorKind::ValueConversionFailure:
            return "value conversion failure";
        case SchemaErrorKind::TagSpaceExhausted:
            return "tag space exhausted";
        case SchemaErrorKind::IncompleteWriteError:
            return "incomplete write";
        default:
            return "unknown schema error kind";
        }
    }
};

const SchemaErrorCategory kCategory{};
const SchemaErrorKindCategory kKindCategory{};

}  // namespace

const std::error_category& schema_error_category() noexcept
{
    return kCategory;
}

const std::error_category& schema_error_kind_category() noexcept
{
    return kKindCategory;
}

std::error_code make_error_code(SchemaErrc value) noexcept
{
    return {static_cast<int>(value), schema_error_category()};
}

std::error_condition make_error_condition(SchemaErrorKind value) noexcept
{
    return {static_cast<int>(value), schema_error_kind_category()};
}

SchemaError::SchemaError(SchemaErrc code, const std::string& message)
    : std::system_error{make_error_code(code), message}
{}

SchemaError::SchemaError(SchemaErrc code, std::string column_name, const std::string& message)
    : std::system_error{make_error_code(code), message}
    , column_name_{std::move(column_name)}
{}

}  // namespace tagstore::schema
