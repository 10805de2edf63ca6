#pragma once

#include <cstddef>
#include <functional>
#include <ostream>
#include <stdexcept>
#include <string>

namespace restep
{
  // Everything that can stop a generation pass. All of these are fatal to the
  // build: we never emit a partial helper.
  //
  enum class error_kind
  {
    unterminated_placeholder, // Open delimiter never closed.
    nested_placeholder,       // Open delimiter inside a placeholder.
    invalid_placeholder_name, // Empty or not an identifier.
    unmatched_delimiter,      // Close delimiter outside a placeholder.
    unknown_schema_type,      // params names nothing we know about.
    duplicate_field,          // Same field name twice in one schema.
    invalid_schema,           // Malformed schema description.
    missing_schema,           // Placeholders but no params.
    unused_schema,            // params but no placeholders.
    unbound_placeholder,      // Placeholder names no schema field.
    signature_mismatch,       // Declared parameters disagree with params.
    invalid_annotation        // Malformed RESTEP_ENDPOINT (...).
  };

  inline std::ostream&
  operator<< (std::ostream& os, error_kind k)
  {
    switch (k)
    {
      case error_kind::unterminated_placeholder: return os << "unterminated placeholder";
      case error_kind::nested_placeholder:       return os << "nested placeholder";
      case error_kind::invalid_placeholder_name: return os << "invalid placeholder name";
      case error_kind::unmatched_delimiter:      return os << "unmatched delimiter";
      case error_kind::unknown_schema_type:      return os << "unknown schema type";
      case error_kind::duplicate_field:          return os << "duplicate field";
      case error_kind::invalid_schema:           return os << "invalid schema";
      case error_kind::missing_schema:           return os << "missing schema";
      case error_kind::unused_schema:            return os << "unused schema";
      case error_kind::unbound_placeholder:      return os << "unbound placeholder";
      case error_kind::signature_mismatch:       return os << "signature mismatch";
      case error_kind::invalid_annotation:       return os << "invalid annotation";
    }
    return os;
  }

  // Generation failure.
  //
  // Template errors carry the byte offset into the raw template where the
  // problem was detected. Once the adapter knows where the annotation lives in
  // the source file it attaches the line and column as well (1-based, 0 means
  // unknown).
  //
  class generation_error: public std::runtime_error
  {
  public:
    static constexpr std::size_t npos = static_cast<std::size_t> (-1);

    generation_error (error_kind k,
                      const std::string& description,
                      std::size_t offset = npos);

    generation_error (const generation_error& e,
                      std::size_t line,
                      std::size_t column);

    error_kind
    kind () const noexcept { return kind_; }

    // Message without any location prefix.
    //
    const std::string&
    description () const noexcept { return description_; }

    std::size_t
    offset () const noexcept { return offset_; }

    std::size_t
    line () const noexcept { return line_; }

    std::size_t
    column () const noexcept { return column_; }

    bool
    located () const noexcept { return line_ != 0; }

  private:
    error_kind kind_;
    std::string description_;
    std::size_t offset_;
    std::size_t line_;
    std::size_t column_;
  };

  // Sink for non-fatal diagnostics (warnings) produced by the core. The core
  // never writes to the standard streams itself; the driver decides where the
  // messages go.
  //
  using diagnostic_sink = std::function<void (const std::string&)>;
}
