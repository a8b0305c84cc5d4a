#include "tagstore/sql/sql_types.hpp"

#include "tagstore/schema/schema_errors.hpp"

#include <charconv>
#include <stdexcept>
#include <system_error>

namespace tagstore::sql {

using schema::TypeInfo;
using schema::TypeKind;

schema::TypeInfo type_info_from_external(const ExternalType& type)
{
    switch (type.id) {
    case SqlTypeId::TinyInt:
        return TypeInfo::int_type(8U);
    case SqlTypeId::SmallInt:
        return TypeInfo::int_type(16U);
    case SqlTypeId::Int:
        return TypeInfo::int_type(32U);
    case SqlTypeId::BigInt:
        return TypeInfo::int_type(64U);
    case SqlTypeId::TinyIntUnsigned:
        return TypeInfo::uint_type(8U);
    case SqlTypeId::SmallIntUnsigned:
        return TypeInfo::uint_type(16U);
    case SqlTypeId::IntUnsigned:
        return TypeInfo::uint_type(32U);
    case SqlTypeId::BigIntUnsigned:
        return TypeInfo::uint_type(64U);
    case SqlTypeId::Float:
        return TypeInfo::float_type(32U);
    case SqlTypeId::Double:
        return TypeInfo::float_type(64U);
    case SqlTypeId::Varchar:
        if (type.length == 0U) {
            throw std::invalid_argument{"VARCHAR requires a positive length"};
        }
        return TypeInfo::string_type(type.length);
    case SqlTypeId::Text:
        return TypeInfo::string_type();
    case SqlTypeId::Boolean:
        return TypeInfo::bool_type();
    default:
        throw std::invalid_argument{"Unknown external type"};
    }
}

ExternalType external_type_from(const schema::TypeInfo& type)
{
    switch (type.kind()) {
    case TypeKind::Int:
        switch (type.bits()) {
        case 8U:
            return {SqlTypeId::TinyInt, 0U};
        case 16U:
            return {SqlTypeId::SmallInt, 0U};
        case 32U:
            return {SqlTypeId::Int, 0U};
        default:
            return {SqlTypeId::BigInt, 0U};
        }
    case TypeKind::Uint:
        switch (type.bits()) {
        case 8U:
            return {SqlTypeId::TinyIntUnsigned, 0U};
        case 16U:
            return {SqlTypeId::SmallIntUnsigned, 0U};
        case 32U:
            return {SqlTypeId::IntUnsigned, 0U};
        default:
            return {SqlTypeId::BigIntUnsigned, 0U};
        }
    case TypeKind::Float:
        return type.bits() == 32U ? ExternalType{SqlTypeId::Float, 0U} : ExternalType{SqlTypeId::Double, 0U};
    case TypeKind::String:
        return type.max_length() == 0U ? ExternalType{SqlTypeId::Text, 0U}
                                       : ExternalType{SqlTypeId::Varchar, type.max_length()};
    case TypeKind::Bool:
    default:
        return {SqlTypeId::Boolean, 0U};
    }
}

std::string external_type_name(const ExternalType& type)
{
    switch (type.id) {
    case SqlTypeId::TinyInt:
        return "TINYINT";
    case SqlTypeId::SmallInt:
        return "SMALLINT";
    case SqlTypeId::Int:
        return "INT";
    case SqlTypeId::BigInt:
        return "BIGINT";
    case SqlTypeId::TinyIntUnsigned:
        return "TINYINT UNSIGNED";
    case SqlTypeId::SmallIntUnsigned:
        return "SMALLINT UNSIGNED";
    case SqlTypeId::IntUnsigned:
        return "INT UNSIGNED";
    case SqlTypeId::BigIntUnsigned:
        return "BIGINT UNSIGNED";
    case SqlTypeId::Float:
        return "FLOAT";
    case SqlTypeId::Double:
        return "DOUBLE";
    case SqlTypeId::Varchar:
        return "VARCHAR(" + std::to_string(type.length) + ")";
    case SqlTypeId::Text:
        return "TEXT";
    case SqlTypeId::Boolean:
        return "BOOLEAN";
    default:
        return "UNKNOWN";
    }
}

std::string format_tag_annotation(schema::ColumnTag tag)
{
    return std::string{kTagAnnotationPrefix} + std::to_string(tag.value);
}

std::optional<schema::ColumnTag> parse_tag_annotation(std::string_view annotation)
{
    if (annotation.empty()) {
        return std::nullopt;
    }

    const auto malformed = [&]() {
        return schema::SchemaError{schema::SchemaErrc::MalformedTagAnnotation,
                                   "malformed tag annotation '" + std::string{annotation} + "'"};
    };

    if (annotation.substr(0U, kTagAnnotationPrefix.size()) != kTagAnnotationPrefix) {
        throw malformed();
    }
    const auto digits = annotation.substr(kTagAnnotationPrefix.size());
    if (digits.empty()) {
        throw malformed();
    }

    std::uint64_t value = 0U;
    const auto* end = digits.data() + digits.size();
    auto [ptr, ec] = std::from_chars(digits.data(), end, value);
    if (ec != std::errc{} || ptr != end) {
        throw malformed();
    }
    return schema::ColumnTag{value};
}

}  // namespace tagstore::sql
