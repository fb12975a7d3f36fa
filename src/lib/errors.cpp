#include <jb/errors.hpp>

#include <utility>

namespace jb {

  namespace {

    std::string
    join(const std::vector<std::string>& items) {
      std::string result;
      for (const auto& item : items) {
        if (!result.empty()) result += ", ";
        result += item;
      }
      return result;
    }

  } // namespace

  schema_error::schema_error(schema_error_kind kind, std::string type_name,
                             const std::string& message)
      : std::runtime_error(message), kind_(kind),
        type_name_(std::move(type_name)) {}

  schema_error
  schema_error::unknown_supertype(const std::string& type_name,
                                  const std::string& supertype) {
    return {schema_error_kind::unknown_supertype, type_name,
            "vocabulary: type '" + type_name + "' extends unknown type '" +
                supertype + "'"};
  }

  schema_error
  schema_error::kind_mismatch(const std::string& type_name,
                              const std::string& property_name) {
    return {schema_error_kind::kind_mismatch, type_name,
            "vocabulary: preferred name for '" + type_name + "." +
                property_name + "' does not match the property shape"};
  }

  schema_error
  schema_error::cyclic_inheritance(const std::string& type_name) {
    return {schema_error_kind::cyclic_inheritance, type_name,
            "vocabulary: type '" + type_name + "' inherits from itself"};
  }

  schema_error
  schema_error::malformed(const std::string& type_name,
                          const std::string& detail) {
    std::string message = "vocabulary: ";
    if (!type_name.empty()) message += "type '" + type_name + "': ";
    return {schema_error_kind::malformed_schema, type_name, message + detail};
  }

  decode_error::decode_error(decode_error_kind kind, std::string subject,
                             const std::string& message,
                             std::vector<std::string> expected)
      : std::runtime_error(message), kind_(kind), subject_(std::move(subject)),
        expected_(std::move(expected)) {}

  decode_error
  decode_error::missing_required_field(std::string_view name) {
    return {decode_error_kind::missing_required_field, std::string(name),
            "decode: missing required field '" + std::string(name) + "'"};
  }

  decode_error
  decode_error::duplicate_field(std::string_view name) {
    return {decode_error_kind::duplicate_field, std::string(name),
            "decode: duplicate field '" + std::string(name) + "'"};
  }

  decode_error
  decode_error::type_mismatch(std::string_view expected,
                              std::string_view found) {
    return {decode_error_kind::type_mismatch, std::string(expected),
            "decode: expected " + std::string(expected) + ", found " +
                std::string(found)};
  }

  decode_error
  decode_error::no_alternative(std::string_view first_message,
                               std::string_view second_message) {
    return {decode_error_kind::type_mismatch, {},
            std::string(first_message) + " and " +
                std::string(second_message)};
  }

  decode_error
  decode_error::unknown_discriminant(std::string_view tag,
                                     std::vector<std::string> expected) {
    std::string message = "decode: unknown type '" + std::string(tag) +
                          "', expected one of " + join(expected);
    return {decode_error_kind::unknown_discriminant, std::string(tag), message,
            std::move(expected)};
  }

  decode_error
  decode_error::malformed_scalar(std::string_view scalar_type,
                                 std::string_view text,
                                 std::string_view detail) {
    return {decode_error_kind::malformed_scalar, std::string(scalar_type),
            "decode: malformed " + std::string(scalar_type) + " '" +
                std::string(text) + "': " + std::string(detail)};
  }

  parse_error::parse_error(const std::string& message, std::size_t line,
                           std::size_t column)
      : std::runtime_error("json: " + message + " at line " +
                           std::to_string(line) + ", column " +
                           std::to_string(column)),
        line_(line), column_(column) {}

} // namespace jb
