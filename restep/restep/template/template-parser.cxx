#include <restep/template/template-parser.hxx>

#include <restep/generation-error.hxx>

#include <utility>

using namespace std;

namespace restep
{
  path_template template_parser::
  parse (const string& raw, const delimiters& d)
  {
    d.validate ();

    parser_state s (raw, d);

    // Single left-to-right pass. The only state we carry is whether we are
    // inside a placeholder, so there is no way for this to recurse or
    // backtrack.
    //
    for (; s.pos < raw.size (); ++s.pos)
    {
      char c (raw[s.pos]);

      if (s.mode == scan_mode::literal)
      {
        if (c == d.open)
        {
          flush_literal (s);

          s.mode = scan_mode::in_placeholder;
          s.start = s.pos;
        }
        else if (c == d.close)
        {
          throw generation_error (
            error_kind::unmatched_delimiter,
            string ("'") + c + "' without matching '" + d.open + "'",
            s.pos);
        }
        else
        {
          if (s.text.empty ())
            s.start = s.pos;

          s.text += c;
        }
      }
      else
      {
        if (c == d.close)
        {
          flush_placeholder (s);
          s.mode = scan_mode::literal;
        }
        else if (c == d.open)
        {
          // Nesting is not supported. Report it at the inner delimiter since
          // that is where the user went wrong.
          //
          throw generation_error (error_kind::nested_placeholder,
                                  string ("'") + c + "' inside placeholder",
                                  s.pos);
        }
        else
          s.text += c;
      }
    }

    if (s.mode == scan_mode::in_placeholder)
    {
      throw generation_error (error_kind::unterminated_placeholder,
                              string ("'") + d.open + "' without matching '" +
                              d.close + "'",
                              s.start);
    }

    flush_literal (s);

    return path_template (raw, move (s.segments));
  }

  void template_parser::
  flush_literal (parser_state& s)
  {
    // Empty literals (e.g., between two adjacent placeholders) carry no
    // information so we simply drop them.
    //
    if (!s.text.empty ())
    {
      s.segments.emplace_back (segment_kind::literal, move (s.text), s.start);
      s.text.clear ();
    }
  }

  void template_parser::
  flush_placeholder (parser_state& s)
  {
    if (s.text.empty ())
      throw generation_error (error_kind::invalid_placeholder_name,
                              "empty placeholder name",
                              s.start);

    if (!valid_identifier (s.text))
      throw generation_error (error_kind::invalid_placeholder_name,
                              "placeholder name '" + s.text +
                              "' is not an identifier",
                              s.start);

    s.segments.emplace_back (segment_kind::placeholder, move (s.text), s.start);
    s.text.clear ();
  }
}
