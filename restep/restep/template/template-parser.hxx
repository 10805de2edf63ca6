#pragma once

#include <restep/template/template-types.hxx>

#include <cstddef>
#include <string>

namespace restep
{
  // Endpoint path template parser.
  //
  // Tokenizes a template such as "/customers/{customer_id}/orders" into an
  // ordered list of literal and placeholder segments. Throws
  // generation_error on malformed input (unterminated, nested or badly named
  // placeholders, stray close delimiters) and std::invalid_argument if the
  // delimiters themselves are unusable.
  //
  class template_parser
  {
  public:
    static path_template
    parse (const std::string& raw, const delimiters& = delimiters ());

  private:
    enum class scan_mode
    {
      literal,
      in_placeholder
    };

    // Internal parser state.
    //
    struct parser_state
    {
      const std::string& raw;
      const delimiters& delim;

      std::size_t pos;
      scan_mode mode;

      std::string text;  // Accumulated literal text or placeholder name.
      std::size_t start; // Offset of the segment being accumulated.

      path_template::segments_type segments;

      parser_state (const std::string& r, const delimiters& d)
          : raw (r), delim (d), pos (0), mode (scan_mode::literal), start (0)
      {
      }
    };

    // Flush accumulated literal text, if any.
    //
    static void
    flush_literal (parser_state&);

    // Validate and flush the accumulated placeholder name.
    //
    static void
    flush_placeholder (parser_state&);
  };
}
