#include <restep/template/template-types.hxx>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <initializer_list>
#include <iterator>
#include <stdexcept>

using namespace std;

namespace restep
{
  static inline bool
  ident_start (char c)
  {
    return c == '_' || isalpha (static_cast<unsigned char> (c));
  }

  static inline bool
  ident_char (char c)
  {
    return c == '_' || isalnum (static_cast<unsigned char> (c));
  }

  bool
  valid_identifier (const string& s) noexcept
  {
    if (s.empty () || !ident_start (s[0]))
      return false;

    for (char c: s)
    {
      if (!ident_char (c))
        return false;
    }

    return true;
  }

  // Sorted.
  //
  static const char* const keywords[] = {
    "alignas", "alignof", "and", "and_eq", "asm", "auto", "bitand", "bitor",
    "bool", "break", "case", "catch", "char", "char16_t", "char32_t",
    "char8_t", "class", "co_await", "co_return", "co_yield", "compl",
    "concept", "const", "const_cast", "consteval", "constexpr", "constinit",
    "continue", "decltype", "default", "delete", "do", "double",
    "dynamic_cast", "else", "enum", "explicit", "export", "extern", "false",
    "float", "for", "friend", "goto", "if", "inline", "int", "long",
    "mutable", "namespace", "new", "noexcept", "not", "not_eq", "nullptr",
    "operator", "or", "or_eq", "private", "protected", "public", "register",
    "reinterpret_cast", "requires", "return", "short", "signed", "sizeof",
    "static", "static_assert", "static_cast", "struct", "switch", "template",
    "this", "thread_local", "throw", "true", "try", "typedef", "typeid",
    "typename", "union", "unsigned", "using", "virtual", "void", "volatile",
    "wchar_t", "while", "xor", "xor_eq"};

  bool
  cxx_keyword (const string& s) noexcept
  {
    return binary_search (begin (keywords), end (keywords),
                          s.c_str (),
                          [] (const char* x, const char* y)
                          {
                            return strcmp (x, y) < 0;
                          });
  }

  void delimiters::
  validate () const
  {
    if (open == close)
      throw invalid_argument ("open and close delimiters must differ");

    for (char c: {open, close})
    {
      unsigned char u (static_cast<unsigned char> (c));

      if (ident_char (c) || !isprint (u) || isspace (u))
        throw invalid_argument (string ("invalid delimiter character '") +
                                c + "'");
    }
  }
}
