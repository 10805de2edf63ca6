#include <restep/adapter/source-scanner.hxx>

#include <cctype>

using namespace std;

namespace restep
{
  bool source_scanner::
  ident_start (char c) noexcept
  {
    return c == '_' || isalpha (static_cast<unsigned char> (c));
  }

  bool source_scanner::
  ident_char (char c) noexcept
  {
    return c == '_' || isalnum (static_cast<unsigned char> (c));
  }

  size_t source_scanner::
  skip_non_code (size_t i) const
  {
    const string& s (src_);
    size_t n (s.size ());

    if (i >= n)
      return i;

    char c (s[i]);

    if (c == '/' && i + 1 < n)
    {
      // Line comment. Note that a backslash-newline continues it, which is
      // a classic way to comment out more than intended.
      //
      if (s[i + 1] == '/')
      {
        for (i += 2; i < n; ++i)
        {
          if (s[i] == '\n' && s[i - 1] != '\\')
            break;
        }
        return i;
      }

      // Block comment. Unterminated runs to the end of input and is the
      // compiler's problem, not ours.
      //
      if (s[i + 1] == '*')
      {
        size_t e (s.find ("*/", i + 2));
        return e == npos ? n : e + 2;
      }

      return i;
    }

    if (c == '"')
      return raw_prefix (i) != 0 ? skip_raw (i) : skip_quoted (i, '"');

    if (c == '\'')
    {
      // A quote inside a number is a digit separator (1'000'000), not the
      // start of a character literal. Walk back over the word before the
      // quote: if it starts with a digit, we are in a number.
      //
      size_t b (i);
      while (b != 0 && ident_char (s[b - 1]))
        --b;

      if (b != i && isdigit (static_cast<unsigned char> (s[b])))
        return i;

      return skip_quoted (i, '\'');
    }

    return i;
  }

  size_t source_scanner::
  skip_quoted (size_t i, char q) const
  {
    const string& s (src_);
    size_t n (s.size ());

    for (++i; i < n; ++i)
    {
      char c (s[i]);

      if (c == '\\')
      {
        ++i;
        continue;
      }

      if (c == q)
        return i + 1;

      // An unescaped newline can't be part of the literal. Stop there and
      // let the compiler complain.
      //
      if (c == '\n')
        return i;
    }

    return n;
  }

  size_t source_scanner::
  raw_prefix (size_t i) const
  {
    const string& s (src_);

    // The prefix is R preceded by an optional encoding prefix (u8, u, U, L)
    // and must be a word on its own.
    //
    if (i == 0 || s[i - 1] != 'R')
      return 0;

    size_t b (i - 1);
    while (b != 0 && ident_char (s[b - 1]))
      --b;

    string p (s, b, i - b);

    if (p == "R" || p == "u8R" || p == "uR" || p == "UR" || p == "LR")
      return p.size ();

    return 0;
  }

  size_t source_scanner::
  skip_raw (size_t i) const
  {
    const string& s (src_);
    size_t n (s.size ());

    // R"delim( ... )delim"
    //
    size_t o (s.find ('(', i + 1));
    if (o == npos)
      return n;

    string close (")" + s.substr (i + 1, o - i - 1) + "\"");

    size_t e (s.find (close, o + 1));
    return e == npos ? n : e + close.size ();
  }

  size_t source_scanner::
  skip_space (size_t i) const
  {
    const string& s (src_);
    size_t n (s.size ());

    while (i < n)
    {
      if (isspace (static_cast<unsigned char> (s[i])))
      {
        ++i;
        continue;
      }

      if (s[i] == '/')
      {
        size_t j (skip_non_code (i));
        if (j != i)
        {
          i = j;
          continue;
        }
      }

      break;
    }

    return i;
  }

  size_t source_scanner::
  skip_directive (size_t i) const
  {
    const string& s (src_);
    size_t n (s.size ());

    while (i < n)
    {
      size_t j (skip_non_code (i));

      if (j != i)
      {
        // A block comment can span lines without ending the directive but
        // a line comment ends it (it ends at the newline).
        //
        i = j;
        continue;
      }

      if (s[i] == '\n')
      {
        if (i != 0 && s[i - 1] == '\\')
        {
          ++i;
          continue;
        }

        return i;
      }

      ++i;
    }

    return n;
  }

  bool source_scanner::
  line_start (size_t i) const
  {
    const string& s (src_);

    while (i != 0)
    {
      char c (s[i - 1]);

      if (c == '\n')
        return true;

      if (c != ' ' && c != '\t')
        return false;

      --i;
    }

    return true;
  }

  size_t source_scanner::
  identifier (size_t i) const
  {
    const string& s (src_);

    if (i >= s.size () || !ident_start (s[i]))
      return 0;

    if (i != 0 && ident_char (s[i - 1]))
      return 0;

    size_t e (i + 1);
    while (e < s.size () && ident_char (s[e]))
      ++e;

    return e - i;
  }

  size_t source_scanner::
  match (size_t i) const
  {
    const string& s (src_);
    size_t n (s.size ());

    char o (s[i]);
    char c (o == '(' ? ')' : o == '[' ? ']' : '}');

    size_t d (0);
    while (i < n)
    {
      size_t j (skip_non_code (i));
      if (j != i)
      {
        i = j;
        continue;
      }

      if (s[i] == o)
        ++d;
      else if (s[i] == c && --d == 0)
        return i;

      ++i;
    }

    return npos;
  }

  source_location source_scanner::
  location (size_t i) const
  {
    const string& s (src_);

    source_location r;
    for (size_t p (0); p != i && p < s.size (); ++p)
    {
      if (s[p] == '\n')
      {
        ++r.line;
        r.column = 1;
      }
      else
        ++r.column;
    }

    return r;
  }

  string source_scanner::
  indentation (size_t i) const
  {
    const string& s (src_);

    size_t b (s.rfind ('\n', i == 0 ? 0 : i - 1));
    b = (b == npos || i == 0) ? 0 : b + 1;

    size_t e (b);
    while (e < s.size () && (s[e] == ' ' || s[e] == '\t'))
      ++e;

    return string (s, b, e - b);
  }
}
