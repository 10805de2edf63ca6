#include <restep/adapter/annotation-parser.hxx>

#include <restep/adapter/source-scanner.hxx>
#include <restep/generation-error.hxx>
#include <restep/utility.hxx>

#include <cctype>
#include <utility>
#include <vector>

using namespace std;

namespace restep
{
  static inline generation_error
  invalid (const string& d, size_t o = generation_error::npos)
  {
    return generation_error (error_kind::invalid_annotation, d, o);
  }

  // Return true if a (narrow) string literal starts at i.
  //
  static bool
  literal_start (const string& s, size_t i)
  {
    return s.compare (i, 1, "\"") == 0   ||
           s.compare (i, 2, "R\"") == 0  ||
           s.compare (i, 3, "u8\"") == 0 ||
           s.compare (i, 4, "u8R\"") == 0;
  }

  static inline bool
  octal (char c)
  {
    return c >= '0' && c <= '7';
  }

  string annotation_parser::
  parse_string_literal (const string& s, size_t& i)
  {
    size_t b (i);

    if (s.compare (i, 2, "u8") == 0)
      i += 2;

    bool raw (false);
    if (i < s.size () && s[i] == 'R')
    {
      raw = true;
      ++i;
    }

    if (i >= s.size () || s[i] != '"')
      throw invalid ("expected string literal", b);

    ++i;

    string r;

    if (raw)
    {
      size_t o (s.find ('(', i));

      if (o == string::npos || o - i > 16)
        throw invalid ("invalid raw string literal delimiter", b);

      string close (")" + s.substr (i, o - i) + "\"");
      size_t e (s.find (close, o + 1));

      if (e == string::npos)
        throw invalid ("unterminated raw string literal", b);

      r.assign (s, o + 1, e - o - 1);
      i = e + close.size ();
      return r;
    }

    for (;; ++i)
    {
      if (i >= s.size () || s[i] == '\n')
        throw invalid ("unterminated string literal", b);

      char c (s[i]);

      if (c == '"')
      {
        ++i;
        break;
      }

      if (c != '\\')
      {
        r += c;
        continue;
      }

      if (++i >= s.size ())
        throw invalid ("unterminated string literal", b);

      c = s[i];

      switch (c)
      {
        case 'n':  r += '\n'; break;
        case 't':  r += '\t'; break;
        case 'r':  r += '\r'; break;
        case 'a':  r += '\a'; break;
        case 'b':  r += '\b'; break;
        case 'f':  r += '\f'; break;
        case 'v':  r += '\v'; break;
        case '\\': r += '\\'; break;
        case '"':  r += '"';  break;
        case '\'': r += '\''; break;
        case '?':  r += '?';  break;
        case 'x':
        {
          unsigned v (0);
          size_t n (0);

          for (; i + 1 < s.size () &&
                 isxdigit (static_cast<unsigned char> (s[i + 1])); ++n)
          {
            char h (s[++i]);
            v = v * 16 + (isdigit (static_cast<unsigned char> (h))
                          ? h - '0'
                          : tolower (static_cast<unsigned char> (h)) - 'a' + 10);

            if (v > 0xff)
              throw invalid ("hex escape sequence out of range", b);
          }

          if (n == 0)
            throw invalid ("\\x used with no following hex digits", b);

          r += static_cast<char> (v);
          break;
        }
        default:
        {
          if (octal (c))
          {
            unsigned v (c - '0');
            for (size_t n (1); n != 3 && i + 1 < s.size () && octal (s[i + 1]);
                 ++n)
              v = v * 8 + (s[++i] - '0');

            if (v > 0xff)
              throw invalid ("octal escape sequence out of range", b);

            r += static_cast<char> (v);
            break;
          }

          throw invalid (string ("unsupported escape sequence '\\") + c + "'",
                         b);
        }
      }
    }

    return r;
  }

  // Parse an argument value: one or more adjacent string literals, or a
  // (possibly qualified) name.
  //
  static string
  parse_value (const source_scanner& sc, size_t& i, bool literal_only)
  {
    const string& s (sc.source ());

    if (i < s.size () && literal_start (s, i))
    {
      string r;
      do
      {
        r += annotation_parser::parse_string_literal (s, i);
        i = sc.skip_space (i);
      }
      while (i < s.size () && literal_start (s, i));

      return r;
    }

    if (literal_only)
      throw invalid ("expected string literal", i);

    size_t b (i);
    for (;;)
    {
      if (s.compare (i, 2, "::") == 0)
        i += 2;

      size_t n (sc.identifier (i));
      if (n == 0)
        throw invalid ("expected string literal or name", i);

      i += n;

      if (s.compare (i, 2, "::") != 0)
        break;
    }

    string r (s, b, i - b);
    i = sc.skip_space (i);
    return r;
  }

  annotation annotation_parser::
  parse_arguments (const string& args)
  {
    source_scanner sc (args);

    annotation r;

    size_t i (sc.skip_space (0));

    if (i == args.size ())
      throw invalid ("missing endpoint path", i);

    r.path = parse_value (sc, i, true);

    while (i != args.size ())
    {
      if (args[i] != ',')
        throw invalid ("expected ',' after argument", i);

      i = sc.skip_space (i + 1);

      size_t n (sc.identifier (i));
      if (n == 0)
        throw invalid ("expected argument name", i);

      size_t ko (i);
      string k (args, i, n);
      i = sc.skip_space (i + n);

      if (i == args.size () || args[i] != '=')
        throw invalid ("expected '=' after '" + k + "'", i);

      i = sc.skip_space (i + 1);

      optional<string>* v (nullptr);

      if (k == "name")
        v = &r.name;
      else if (k == "params")
        v = &r.params;
      else
        throw invalid ("unknown argument '" + k + "'", ko);

      if (*v)
        throw invalid ("argument '" + k + "' specified more than once", ko);

      *v = parse_value (sc, i, false);

      if ((*v)->empty ())
        throw invalid ("argument '" + k + "' is empty", ko);
    }

    return r;
  }

  // Return true if the word is part of a builtin type name rather than a
  // parameter name (unsigned int, long long, etc).
  //
  static bool
  type_keyword (const string& w)
  {
    static const char* const ks[] = {
      "bool", "char", "char8_t", "char16_t", "char32_t", "wchar_t", "short",
      "int", "long", "signed", "unsigned", "float", "double", "void", "auto",
      "const", "volatile"};

    for (const char* k: ks)
    {
      if (w == k)
        return true;
    }

    return false;
  }

  declared_parameters annotation_parser::
  parse_parameters (const string& list)
  {
    source_scanner sc (list);

    // Split on top-level commas. Angle brackets count as nesting here since
    // template argument lists are far more common in parameter types than
    // less-than comparisons in default arguments.
    //
    // Comments are replaced with a space so that they don't end up in the
    // parameter types.
    //
    vector<string> ps;
    {
      string p;
      size_t d (0);
      for (size_t i (0); i < list.size ();)
      {
        size_t j (sc.skip_non_code (i));
        if (j != i)
        {
          if (list[i] == '/')
            p += ' ';
          else
            p.append (list, i, j - i);

          i = j;
          continue;
        }

        char c (list[i++]);

        if (c == '(' || c == '[' || c == '{' || c == '<')
          ++d;
        else if ((c == ')' || c == ']' || c == '}' || c == '>') && d != 0)
          --d;
        else if (c == ',' && d == 0)
        {
          ps.push_back (move (p));
          p.clear ();
          continue;
        }

        p += c;
      }

      ps.push_back (move (p));
    }

    declared_parameters r;

    if (ps.size () == 1)
    {
      string p (trim (ps[0]));
      if (p.empty () || p == "void")
        return r;
    }

    for (const string& p: ps)
    {
      source_scanner psc (p);

      // Cut the default argument, if any. Careful not to mistake ==, <=,
      // etc for it (they could only appear in the default argument itself
      // anyway, but nested in brackets).
      //
      string t (p);
      {
        size_t d (0);
        for (size_t i (0); i < p.size ();)
        {
          size_t j (psc.skip_non_code (i));
          if (j != i)
          {
            i = j;
            continue;
          }

          char c (p[i]);

          if (c == '(' || c == '[' || c == '{' || c == '<')
            ++d;
          else if ((c == ')' || c == ']' || c == '}' || c == '>') && d != 0)
            --d;
          else if (c == '=' && d == 0)
          {
            t = p.substr (0, i);
            break;
          }

          ++i;
        }
      }

      t = trim (t);

      // Drop array bounds (they decay anyway and we only compare types).
      //
      while (!t.empty () && t.back () == ']')
      {
        size_t o (t.rfind ('['));
        if (o == string::npos)
          break;

        t = trim (t.substr (0, o));
      }

      // The name is the trailing identifier, unless it is part of the type.
      //
      size_t e (t.size ()), b (e);
      while (b != 0 && source_scanner::ident_char (t[b - 1]))
        --b;

      string w (t, b, e - b);
      string pre (trim (t.substr (0, b)));

      if (!w.empty () && !pre.empty () &&
          source_scanner::ident_start (w[0]) &&
          !type_keyword (w) &&
          !(pre.size () >= 2 && pre.compare (pre.size () - 2, 2, "::") == 0))
      {
        r.emplace_back (pre, w);
      }
      else
        r.emplace_back (t);
    }

    return r;
  }

  // Given the position of '<', return the position past the matching '>'.
  // Parenthesized and bracketed parts (default arguments) are skipped as a
  // whole.
  //
  static size_t
  skip_template_arguments (const source_scanner& sc, size_t i)
  {
    const string& s (sc.source ());

    size_t b (i), d (0);
    while (i < s.size ())
    {
      size_t j (sc.skip_non_code (i));
      if (j != i)
      {
        i = j;
        continue;
      }

      char c (s[i]);

      if (c == '(' || c == '[' || c == '{')
      {
        size_t e (sc.match (i));
        if (e == source_scanner::npos)
          break;

        i = e + 1;
        continue;
      }

      if (c == '<')
        ++d;
      else if (c == '>' && --d == 0)
        return i + 1;

      ++i;
    }

    throw invalid ("unbalanced template parameter list", b);
  }

  declaration annotation_parser::
  parse_declaration (const string& h)
  {
    source_scanner sc (h);

    // Find the start of the parameter list: the first top-level '(' that is
    // not inside a template argument list and that doesn't belong to
    // decltype() and friends in the return type.
    //
    size_t angle (0);
    size_t pl (string::npos);
    string first;

    for (size_t i (sc.skip_space (0)); i < h.size ();)
    {
      size_t j (sc.skip_non_code (i));
      if (j != i)
      {
        i = j;
        continue;
      }

      char c (h[i]);

      if (size_t n = sc.identifier (i))
      {
        string w (h, i, n);
        i += n;

        if (w == "template")
        {
          i = sc.skip_space (i);
          if (i < h.size () && h[i] == '<')
            i = skip_template_arguments (sc, i);

          continue;
        }

        if (first.empty ())
          first = w;

        if (w == "decltype" || w == "noexcept" || w == "alignas" ||
            w == "__attribute__" || w == "__declspec")
        {
          i = sc.skip_space (i);
          if (i < h.size () && h[i] == '(')
          {
            size_t e (sc.match (i));
            if (e == string::npos)
              throw invalid ("unbalanced parentheses", i);

            i = e + 1;
          }
        }
        else if (w == "operator")
        {
          // Skip the operator symbol so that operator() and operator< don't
          // confuse us.
          //
          i = sc.skip_space (i);
          if (h.compare (i, 2, "()") == 0)
            i += 2;
          else
          {
            while (i < h.size () &&
                   h[i] != '(' &&
                   !isspace (static_cast<unsigned char> (h[i])) &&
                   !source_scanner::ident_start (h[i]))
              ++i;
          }
        }

        continue;
      }

      if (c == '[' && h.compare (i, 2, "[[") == 0)
      {
        size_t e (sc.match (i));
        if (e == string::npos)
          throw invalid ("unbalanced attribute brackets", i);

        i = e + 1;
        continue;
      }

      if (c == '<')
        ++angle;
      else if (c == '>' && angle != 0 && !(i != 0 && h[i - 1] == '-'))
        --angle;
      else if (c == '(' && angle == 0)
      {
        pl = i;
        break;
      }

      ++i;
    }

    declaration r;

    if (pl != string::npos)
    {
      size_t e (sc.match (pl));
      if (e == string::npos)
        throw invalid ("unbalanced parentheses in parameter list", pl);

      r.kind = declaration_kind::function;
      r.parameters = parse_parameters (h.substr (pl + 1, e - pl - 1));
      return r;
    }

    if (first == "class" || first == "struct" || first == "union")
    {
      r.kind = declaration_kind::type;
      return r;
    }

    throw invalid ("annotation must be followed by a function or class "
                   "definition");
  }
}
