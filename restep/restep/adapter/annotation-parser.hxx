#pragma once

#include <restep/generator/generator.hxx>

#include <cstddef>
#include <optional>
#include <string>

namespace restep
{
  // Annotation arguments:
  //
  // RESTEP_ENDPOINT ("/customers/{customer_id}",
  //                  name = "endpoint",
  //                  params = "customer_path")
  //
  // The path is required and comes first. The named arguments are optional
  // and may appear in any order. Values are string literals (adjacent
  // literals concatenate) or, for convenience, a bare (possibly qualified)
  // name.
  //
  struct annotation
  {
    std::string path;
    std::optional<std::string> name;
    std::optional<std::string> params;
  };

  // What follows an annotation.
  //
  enum class declaration_kind
  {
    function, // Function definition: helper becomes a local lambda.
    type      // Class/struct/union definition: helper becomes a member.
  };

  struct declaration
  {
    declaration_kind kind;

    // Present for functions only.
    //
    std::optional<declared_parameters> parameters;
  };

  // Annotation and declaration header parser.
  //
  // All functions throw generation_error (invalid_annotation) on malformed
  // input. Offsets in the errors are relative to the text passed in.
  //
  class annotation_parser
  {
  public:
    // Parse the text between the annotation's parentheses.
    //
    static annotation
    parse_arguments (const std::string& args);

    // Parse a declaration header, that is, everything between the
    // annotation and the opening brace of the definition body.
    //
    static declaration
    parse_declaration (const std::string& header);

    // Parse a function parameter list (the text between the parentheses).
    // An empty list and (void) both yield no parameters.
    //
    static declared_parameters
    parse_parameters (const std::string& list);

    // Decode the C++ string literal starting at i (which may have a u8 or R
    // prefix), set i to the position past it, and return its value.
    //
    static std::string
    parse_string_literal (const std::string&, std::size_t& i);
  };
}
