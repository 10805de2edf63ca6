#pragma once

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace restep
{
  // Schema field descriptor.
  //
  // The type is informational only (we never check it against anything); it
  // may be empty if the schema description didn't bother to say.
  //
  struct schema_field
  {
    std::string name;
    std::string type;

    schema_field () = default;

    explicit
    schema_field (std::string n, std::string t = std::string ())
      : name (std::move (n)), type (std::move (t)) {}
  };

  inline bool
  operator== (const schema_field& x, const schema_field& y) noexcept
  {
    return x.name == y.name && x.type == y.type;
  }

  inline bool
  operator!= (const schema_field& x, const schema_field& y) noexcept
  {
    return !(x == y);
  }

  // Parameter schema: the structure type whose fields supply placeholder
  // values. Fields are kept in declaration order and their names are unique.
  //
  struct parameter_schema
  {
    using fields_type = std::vector<schema_field>;

    std::string name;
    fields_type fields;

    parameter_schema () = default;

    parameter_schema (std::string n, fields_type f)
      : name (std::move (n)), fields (std::move (f)) {}

    bool
    empty () const noexcept
    {
      return name.empty ();
    }

    // Return the declaration index of the named field, if any. The match is
    // exact and case-sensitive.
    //
    std::optional<std::size_t>
    find (const std::string& field) const noexcept;

    // Throw generation_error if two fields share a name (duplicate_field) or
    // a field name is not an identifier or is a keyword (invalid_schema).
    //
    void
    validate () const;
  };

  inline bool
  operator== (const parameter_schema& x, const parameter_schema& y) noexcept
  {
    return x.name == y.name && x.fields == y.fields;
  }

  inline bool
  operator!= (const parameter_schema& x, const parameter_schema& y) noexcept
  {
    return !(x == y);
  }

  inline std::ostream&
  operator<< (std::ostream& os, const parameter_schema& s)
  {
    os << s.name << " {";

    for (const schema_field& f: s.fields)
    {
      os << ' ';

      if (!f.type.empty ())
        os << f.type << ' ';

      os << f.name << ';';
    }

    return os << " }";
  }

  // Normalize a type name for lookup: strip surrounding whitespace and a
  // leading global scope qualifier.
  //
  std::string
  normalize_type_name (const std::string&);
}
