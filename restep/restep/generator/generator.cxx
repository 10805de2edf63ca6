#include <restep/generator/generator.hxx>

#include <restep/template/template-parser.hxx>
#include <restep/utility.hxx>

#include <cctype>
#include <sstream>
#include <stdexcept>

using namespace std;

namespace restep
{
  // generated_function
  //

  string generated_function::
  signature () const
  {
    string r (name);
    r += " (";

    if (parameter_type)
      r += "const " + *parameter_type + "&";

    r += ") -> std::string";
    return r;
  }

  // The body is a single stream insertion chain:
  //
  // std::ostringstream os;
  // os.imbue (std::locale::classic ());
  // const auto v = [] (const auto& x) -> decltype (auto) {...};
  // os << "/customers/"
  //    << v (p.customer_id);
  // return os.str ();
  //
  // We pin the classic locale so that the global locale (thousands
  // separators and such) can't make the same values render differently.
  //
  // Fields go through v() which promotes one-byte integers other than char
  // (std::uint8_t, std::int8_t, signed char) so that they are written as
  // numbers rather than characters. Everything else is passed through as is.
  //
  static const char* const value_conversion[] = {
    "const auto v = [] (const auto& x) -> decltype (auto)",
    "{",
    "  using T = std::decay_t<decltype (x)>;",
    "",
    "  if constexpr (std::is_integral_v<T> && sizeof (T) == 1 &&",
    "                !std::is_same_v<T, char> && !std::is_same_v<T, bool>)",
    "    return +x;",
    "  else",
    "    return (x);",
    "};"
  };

  string generated_function::
  code (const string& ind) const
  {
    ostringstream os;

    string param (parameter_type ? "const " + *parameter_type + "& p" : "");

    switch (style)
    {
      case emission_style::local:
      {
        os << ind << "[[maybe_unused]] const auto " << name << " = [] ("
           << param << ") -> std::string" << '\n'
           << ind << '{' << '\n';
        break;
      }
      case emission_style::member:
      {
        os << ind << "static std::string" << '\n'
           << ind << name << " (" << param << ")" << '\n'
           << ind << '{' << '\n';
        break;
      }
    }

    string b (ind + "  ");

    if (!parameterized ())
    {
      // Nothing to substitute so the whole path is one literal (or nothing
      // at all).
      //
      string t;
      for (const bound_segment& s: path.segments)
        t += s.text;

      if (t.empty ())
        os << b << "return std::string ();" << '\n';
      else
        os << b << "return " << cxx_string_literal (t) << ";" << '\n';
    }
    else
    {
      os << b << "std::ostringstream os;" << '\n'
         << b << "os.imbue (std::locale::classic ());" << '\n'
         << '\n';

      for (const char* l: value_conversion)
      {
        if (*l != '\0')
          os << b << l;

        os << '\n';
      }

      os << '\n';

      for (size_t i (0); i != path.segments.size (); ++i)
      {
        const bound_segment& s (path.segments[i]);

        os << b << (i == 0 ? "os << " : "   << ");

        if (s.literal ())
          os << cxx_string_literal (s.text);
        else
          os << "v (p." << s.text << ')';

        os << (i + 1 == path.segments.size () ? ";" : "") << '\n';
      }

      os << b << "return os.str ();" << '\n';
    }

    os << ind << (style == emission_style::local ? "};" : "}") << '\n';
    return os.str ();
  }

  vector<string> generated_function::
  headers () const
  {
    if (parameterized ())
      return {"locale", "sstream", "string", "type_traits"};

    return {"string"};
  }

  generated_function
  render (const bound_path& b,
          const string& n,
          const optional<string>& t,
          emission_style s)
  {
    if (!valid_identifier (n) || cxx_keyword (n))
      throw invalid_argument ("helper name '" + n + "' is not an identifier");

    generated_function r;
    r.name = n;
    r.style = s;
    r.path = b;

    // Spell the type the way the annotation did, falling back to the
    // schema's own name.
    //
    if (b.parameterized ())
    {
      string pt (t ? trim (*t) : string ());
      r.parameter_type = pt.empty () ? b.schema->name : pt;
    }

    return r;
  }

  // Split a declaration into identifier-ish tokens and punctuation.
  //
  static vector<string>
  tokenize (const string& s)
  {
    vector<string> r;

    for (size_t i (0); i != s.size ();)
    {
      unsigned char c (static_cast<unsigned char> (s[i]));

      if (isspace (c))
      {
        ++i;
        continue;
      }

      if (isalnum (c) || c == '_')
      {
        size_t j (i);
        while (j != s.size () &&
               (isalnum (static_cast<unsigned char> (s[j])) || s[j] == '_'))
          ++j;

        r.push_back (s.substr (i, j - i));
        i = j;
        continue;
      }

      if (c == ':' && i + 1 != s.size () && s[i + 1] == ':')
      {
        r.push_back ("::");
        i += 2;
        continue;
      }

      r.push_back (string (1, s[i]));
      ++i;
    }

    return r;
  }

  string
  normalize_parameter_type (const string& s)
  {
    string r;
    bool word (false); // Last token appended was a word.

    for (const string& t: tokenize (s))
    {
      if (t == "const" || t == "volatile" || t == "&" ||
          t == "struct" || t == "class")
        continue;

      bool w (isalnum (static_cast<unsigned char> (t[0])) || t[0] == '_');

      // Keep words apart (unsigned long), glue everything else.
      //
      if (w && word)
        r += ' ';

      r += t;
      word = w;
    }

    if (r.size () >= 2 && r[0] == ':' && r[1] == ':')
      r.erase (0, 2);

    return r;
  }

  generated_function
  generate (const string& ta,
            const optional<string>& pa,
            const optional<declared_parameters>& dps,
            const generation_context& ctx)
  {
    path_template t (template_parser::parse (ta, ctx.delim));

    const parameter_schema* s (nullptr);
    if (pa)
    {
      if (ctx.schemas == nullptr)
        throw generation_error (error_kind::unknown_schema_type,
                                "no schema description for type '" + *pa +
                                "'");

      s = &ctx.schemas->resolve (*pa);
    }

    bound_path b (bind_placeholders (t, s, ctx.unused, ctx.diag));

    // Check the annotated function's parameter list against the schema. The
    // function may take no parameters (constructing the value itself) or
    // exactly one parameter of the schema type.
    //
    if (dps && !dps->empty ())
    {
      if (dps->size () > 1)
        throw generation_error (error_kind::signature_mismatch,
                                "function declares " +
                                to_string (dps->size ()) + " parameters, "
                                "expected none or one");

      const declared_parameter& d (dps->front ());

      if (s == nullptr)
        throw generation_error (error_kind::signature_mismatch,
                                "function declares parameter of type '" +
                                d.type + "' but no params type is "
                                "specified");

      if (normalize_parameter_type (d.type) !=
          normalize_parameter_type (s->name))
        throw generation_error (error_kind::signature_mismatch,
                                "function parameter type '" + d.type +
                                "' does not match params type '" + *pa + "'");
    }

    return render (b, ctx.helper_name, pa, ctx.style);
  }

  string
  cxx_string_literal (const string& s)
  {
    string r ("\"");

    for (char c: s)
    {
      switch (c)
      {
        case '"':  r += "\\\""; break;
        case '\\': r += "\\\\"; break;
        case '\n': r += "\\n";  break;
        case '\t': r += "\\t";  break;
        case '\r': r += "\\r";  break;
        default:
        {
          unsigned char u (static_cast<unsigned char> (c));

          // Other control characters as three-digit octal escapes, which
          // (unlike \x) can't run into a following hex digit.
          //
          if (u < 0x20 || u == 0x7f)
          {
            r += '\\';
            r += static_cast<char> ('0' + ((u >> 6) & 7));
            r += static_cast<char> ('0' + ((u >> 3) & 7));
            r += static_cast<char> ('0' + (u & 7));
          }
          else
            r += c;
        }
      }
    }

    r += '"';
    return r;
  }
}
