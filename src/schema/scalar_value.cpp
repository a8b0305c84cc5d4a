#include "tagstore/schema/scalar_value.hpp"

#include <sstream>

namespace tagstore::schema {

std::string describe_scalar(const ScalarValue& value)
{
    std::ostringstream stream;
    if (std::holds_alternative<std::monostate>(value)) {
        stream << "NULL";
    } else if (const auto* number = std::get_if<std::int64_t>(&value)) {
        stream << "int " << *number;
    } else if (const auto* unsigned_number = std::get_if<std::uint64_t>(&value)) {
        stream << "uint " << *unsigned_number;
    } else if (const auto* real = std::get_if<double>(&value)) {
        stream << "float " << *real;
    } else if (const auto* text = std::get_if<std::string>(&value)) {
        stream << "string '" << *text << "'";
    } else if (const auto* flag = std::get_if<bool>(&value)) {
        stream << "bool " << (*flag ? "true" : "false");
    }
    return stream.str();
}

}  // namespace tagstore::schema
