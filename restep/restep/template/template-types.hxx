#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace restep
{
  // Segment kinds.
  //
  enum class segment_kind
  {
    literal,     // Fixed text, copied verbatim.
    placeholder  // Named hole, replaced by a field value.
  };

  inline std::ostream&
  operator<< (std::ostream& os, segment_kind k)
  {
    switch (k)
    {
      case segment_kind::literal:     return os << "literal";
      case segment_kind::placeholder: return os << "placeholder";
    }
    return os;
  }

  // Placeholder delimiter pair.
  //
  // Both characters must be distinct and must not be identifier characters,
  // otherwise a placeholder name could swallow its own delimiter.
  //
  struct delimiters
  {
    char open = '{';
    char close = '}';

    delimiters () = default;

    delimiters (char o, char c): open (o), close (c) {}

    // Throw std::invalid_argument if the pair is unusable.
    //
    void
    validate () const;
  };

  inline bool
  operator== (const delimiters& x, const delimiters& y) noexcept
  {
    return x.open == y.open && x.close == y.close;
  }

  inline bool
  operator!= (const delimiters& x, const delimiters& y) noexcept
  {
    return !(x == y);
  }

  // Template segment.
  //
  // For a literal, text is the literal text. For a placeholder, text is the
  // placeholder name (without delimiters). The offset is the position of the
  // segment's first character in the raw template (for a placeholder, the
  // position of its open delimiter).
  //
  template <typename S = std::string>
  struct basic_segment
  {
    using string_type = S;

    segment_kind kind;
    string_type text;
    std::size_t offset;

    basic_segment (): kind (segment_kind::literal), offset (0) {}

    basic_segment (segment_kind k, string_type t, std::size_t o = 0)
      : kind (k), text (std::move (t)), offset (o) {}

    bool
    literal () const noexcept
    {
      return kind == segment_kind::literal;
    }

    bool
    placeholder () const noexcept
    {
      return kind == segment_kind::placeholder;
    }
  };

  // Parsed path template.
  //
  // Segments appear in the left-to-right order of the raw template, which is
  // also the substitution order. Empty literals are never stored.
  //
  template <typename S = std::string>
  struct basic_path_template
  {
    using string_type = S;
    using segment_type = basic_segment<S>;
    using segments_type = std::vector<segment_type>;

    string_type raw;
    segments_type segments;

    basic_path_template () = default;

    basic_path_template (string_type r, segments_type s)
      : raw (std::move (r)), segments (std::move (s)) {}

    bool
    empty () const noexcept
    {
      return segments.empty ();
    }

    // Number of placeholder segments (duplicates counted).
    //
    std::size_t
    placeholder_count () const noexcept;

    // Placeholder names in occurrence order (duplicates kept).
    //
    std::vector<string_type>
    placeholder_names () const;

    // Reassemble the template using the specified delimiters. With the
    // delimiters it was parsed with this reproduces the raw template.
    //
    string_type
    string (const delimiters& = delimiters ()) const;
  };

  template <typename S>
  inline bool
  operator== (const basic_segment<S>& x, const basic_segment<S>& y) noexcept
  {
    return x.kind == y.kind && x.text == y.text;
  }

  template <typename S>
  inline bool
  operator!= (const basic_segment<S>& x, const basic_segment<S>& y) noexcept
  {
    return !(x == y);
  }

  template <typename S>
  inline bool
  operator== (const basic_path_template<S>& x,
              const basic_path_template<S>& y) noexcept
  {
    return x.segments == y.segments;
  }

  template <typename S>
  inline bool
  operator!= (const basic_path_template<S>& x,
              const basic_path_template<S>& y) noexcept
  {
    return !(x == y);
  }

  template <typename S>
  inline auto
  operator<< (std::basic_ostream<typename S::value_type>& o,
              const basic_segment<S>& s) -> decltype (o)
  {
    return o << s.kind << " '" << s.text << "' @" << s.offset;
  }

  // Common typedefs.
  //
  using segment = basic_segment<std::string>;
  using path_template = basic_path_template<std::string>;

  // Return true if s matches [A-Za-z_][A-Za-z0-9_]*.
  //
  bool
  valid_identifier (const std::string& s) noexcept;

  // Return true if s is a C++ keyword (including the alternative operator
  // spellings), which can't name a field or a function.
  //
  bool
  cxx_keyword (const std::string& s) noexcept;
}

#include <restep/template/template-types.ixx>
