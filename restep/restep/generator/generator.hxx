#pragma once

#include <restep/binder/binder.hxx>
#include <restep/generation-error.hxx>
#include <restep/schema/schema-resolver.hxx>
#include <restep/template/template-types.hxx>

#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace restep
{
  // How the helper is spliced into the annotated definition.
  //
  enum class emission_style
  {
    local, // Local lambda at the top of a function body.
    member // Static member function at the top of a class body.
  };

  inline std::ostream&
  operator<< (std::ostream& os, emission_style s)
  {
    switch (s)
    {
      case emission_style::local:  return os << "local";
      case emission_style::member: return os << "member";
    }
    return os;
  }

  // Generated path helper.
  //
  // The helper takes no parameter if the path has no bindings and exactly one
  // (const reference to the schema type) otherwise. Its body visits the bound
  // segments in order, streaming literals verbatim and fields by their
  // natural string form (operator<<). Nothing is escaped or encoded.
  //
  // A field type without a suitable operator<< surfaces as a compile error
  // in the user's build, which is exactly where it belongs.
  //
  struct generated_function
  {
    std::string name;
    std::optional<std::string> parameter_type;
    emission_style style;
    bound_path path;

    generated_function (): style (emission_style::local) {}

    bool
    parameterized () const noexcept
    {
      return parameter_type.has_value ();
    }

    // Human-readable signature, for example:
    //
    // endpoint (const customer_path&) -> std::string
    //
    std::string
    signature () const;

    // Emit the helper's C++ code, each line prefixed with indent and
    // terminated with a newline. The result depends on nothing but this
    // object so emitting twice gives identical text.
    //
    std::string
    code (const std::string& indent = std::string ()) const;

    // Standard headers the emitted code needs.
    //
    std::vector<std::string>
    headers () const;
  };

  // Turn a bound path into a helper. The parameter type is the schema type
  // as spelled in the annotation and is only used if the path is
  // parameterized. Throws std::invalid_argument if the name is not an
  // identifier.
  //
  generated_function
  render (const bound_path&,
          const std::string& name = "endpoint",
          const std::optional<std::string>& parameter_type = std::nullopt,
          emission_style = emission_style::local);

  // Parameter of the annotated function, as declared. The name may be empty
  // for unnamed parameters.
  //
  struct declared_parameter
  {
    std::string type;
    std::string name;

    declared_parameter () = default;

    explicit
    declared_parameter (std::string t, std::string n = std::string ())
      : type (std::move (t)), name (std::move (n)) {}
  };

  using declared_parameters = std::vector<declared_parameter>;

  // Reduce a declared parameter type to the bare type name: drop cv
  // qualifiers, references, elaborated type specifiers (struct/class), a
  // leading global qualifier and insignificant whitespace. Pointers and
  // template arguments are kept as is.
  //
  std::string
  normalize_parameter_type (const std::string&);

  // Everything the generation pass needs besides the annotation itself.
  //
  struct generation_context
  {
    const schema_registry* schemas = nullptr;

    delimiters delim;
    std::string helper_name = "endpoint";
    emission_style style = emission_style::local;
    unused_schema_policy unused = unused_schema_policy::strict;
    diagnostic_sink diag;
  };

  // Generation entry point: parse the template, resolve the schema named by
  // params (if any), bind, check the declared parameter list, and render.
  //
  // The declared parameter list must be empty or consist of exactly one
  // parameter whose type names the schema; anything else is a
  // signature_mismatch. Pass nullopt for the declared parameters if the
  // annotated entity has no parameter list (a class).
  //
  generated_function
  generate (const std::string& template_arg,
            const std::optional<std::string>& params_arg,
            const std::optional<declared_parameters>&,
            const generation_context&);

  // Return the C++ string literal (quotes included) for the specified text.
  //
  std::string
  cxx_string_literal (const std::string&);
}
