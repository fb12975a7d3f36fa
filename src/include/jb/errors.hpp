#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace jb {

  enum class schema_error_kind {
    unknown_supertype,
    kind_mismatch,
    cyclic_inheritance,
    malformed_schema
  };

  // Raised while compiling a vocabulary; aborts binding generation.
  class schema_error : public std::runtime_error {
    schema_error_kind kind_;
    std::string type_name_;

  public:
    schema_error(schema_error_kind kind, std::string type_name,
                 const std::string& message);

    static schema_error
    unknown_supertype(const std::string& type_name,
                      const std::string& supertype);

    static schema_error
    kind_mismatch(const std::string& type_name,
                  const std::string& property_name);

    static schema_error
    cyclic_inheritance(const std::string& type_name);

    static schema_error
    malformed(const std::string& type_name, const std::string& detail);

    schema_error_kind
    kind() const noexcept {
      return kind_;
    }

    const std::string&
    type_name() const noexcept {
      return type_name_;
    }
  };

  enum class decode_error_kind {
    missing_required_field,
    duplicate_field,
    type_mismatch,
    unknown_discriminant,
    malformed_scalar
  };

  // Terminal for the decode call that raised it.
  class decode_error : public std::runtime_error {
    decode_error_kind kind_;
    std::string subject_;
    std::vector<std::string> expected_;

  public:
    decode_error(decode_error_kind kind, std::string subject,
                 const std::string& message,
                 std::vector<std::string> expected = {});

    static decode_error
    missing_required_field(std::string_view name);

    static decode_error
    duplicate_field(std::string_view name);

    static decode_error
    type_mismatch(std::string_view expected, std::string_view found);

    // Both branches of an either-of or reference resolution failed.
    static decode_error
    no_alternative(std::string_view first_message,
                   std::string_view second_message);

    static decode_error
    unknown_discriminant(std::string_view tag,
                         std::vector<std::string> expected);

    static decode_error
    malformed_scalar(std::string_view scalar_type, std::string_view text,
                     std::string_view detail);

    decode_error_kind
    kind() const noexcept {
      return kind_;
    }

    // Field name, discriminant value, or scalar type, depending on kind.
    const std::string&
    subject() const noexcept {
      return subject_;
    }

    const std::vector<std::string>&
    expected() const noexcept {
      return expected_;
    }
  };

  // Malformed JSON text.
  class parse_error : public std::runtime_error {
    std::size_t line_;
    std::size_t column_;

  public:
    parse_error(const std::string& message, std::size_t line,
                std::size_t column);

    std::size_t
    line() const noexcept {
      return line_;
    }

    std::size_t
    column() const noexcept {
      return column_;
    }
  };

} // namespace jb
