#pragma once

#include <cstddef>
#include <string>

namespace restep
{
  // Source position (1-based).
  //
  struct source_location
  {
    std::size_t line = 1;
    std::size_t column = 1;
  };

  // Lexical helpers for scanning C++ source text.
  //
  // We don't tokenize C++ properly (we don't have to): all we need is to
  // walk over the text without being fooled by comments and literals, which
  // can contain anything, including our annotation or unbalanced brackets.
  //
  // All positions are byte offsets into the source. Functions that can run
  // into the end of input return the source size in that case.
  //
  class source_scanner
  {
  public:
    static constexpr std::size_t npos = std::string::npos;

    explicit
    source_scanner (const std::string& s): src_ (s) {}

    const std::string&
    source () const noexcept
    {
      return src_;
    }

    // If a comment, string literal, character literal, or raw string literal
    // starts at i, return the position just past it. Otherwise return i.
    //
    std::size_t
    skip_non_code (std::size_t i) const;

    // Skip whitespace and comments starting at i.
    //
    std::size_t
    skip_space (std::size_t i) const;

    // Skip to the end of the preprocessor directive that starts at i (the
    // '#'), following backslash continuations. Return the position of the
    // terminating newline (or the end of input).
    //
    std::size_t
    skip_directive (std::size_t i) const;

    // Return true if i is at the first non-whitespace character of a line.
    //
    bool
    line_start (std::size_t i) const;

    // Return the length of the identifier starting at i or 0 if none. An
    // identifier that is the tail of a longer word (or of a number) doesn't
    // count.
    //
    std::size_t
    identifier (std::size_t i) const;

    // Given the position of an opening (, [, or {, return the position of
    // the matching closing character or npos if it is unbalanced. Only the
    // same kind of bracket is counted; comments and literals are skipped.
    //
    std::size_t
    match (std::size_t i) const;

    // Convert a position to line and column.
    //
    source_location
    location (std::size_t i) const;

    // Return the whitespace that starts the line containing i.
    //
    std::string
    indentation (std::size_t i) const;

    static bool
    ident_start (char) noexcept;

    static bool
    ident_char (char) noexcept;

  private:
    // Return the raw string prefix length (e.g., 1 for R, 3 for u8R) if the
    // '"' at i opens a raw string literal, 0 otherwise.
    //
    std::size_t
    raw_prefix (std::size_t i) const;

    std::size_t
    skip_quoted (std::size_t i, char q) const;

    std::size_t
    skip_raw (std::size_t i) const;

  private:
    const std::string& src_;
  };
}
