#pragma once

#include <restep/generation-error.hxx>
#include <restep/schema/schema-types.hxx>
#include <restep/template/template-types.hxx>

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace restep
{
  // What to do with a schema supplied for a template that has no
  // placeholders.
  //
  enum class unused_schema_policy
  {
    strict,    // Fatal unused_schema error.
    permissive // Warn and drop the schema.
  };

  inline std::ostream&
  operator<< (std::ostream& os, unused_schema_policy p)
  {
    switch (p)
    {
      case unused_schema_policy::strict:     return os << "strict";
      case unused_schema_policy::permissive: return os << "permissive";
    }
    return os;
  }

  // Bound segment: either literal text or a placeholder resolved to a schema
  // field. For a binding, text is the field name and field is its index in
  // the schema's declaration order.
  //
  struct bound_segment
  {
    segment_kind kind;
    std::string text;
    std::size_t field;

    bound_segment (): kind (segment_kind::literal), field (0) {}

    bound_segment (segment_kind k, std::string t, std::size_t f = 0)
      : kind (k), text (std::move (t)), field (f) {}

    bool
    literal () const noexcept
    {
      return kind == segment_kind::literal;
    }

    bool
    binding () const noexcept
    {
      return kind == segment_kind::placeholder;
    }
  };

  inline bool
  operator== (const bound_segment& x, const bound_segment& y) noexcept
  {
    return x.kind == y.kind && x.text == y.text && x.field == y.field;
  }

  inline bool
  operator!= (const bound_segment& x, const bound_segment& y) noexcept
  {
    return !(x == y);
  }

  // Result of binding a template against a schema.
  //
  // The schema is present if and only if there is at least one binding;
  // this is what later decides whether the generated helper takes a
  // parameter.
  //
  struct bound_path
  {
    using segments_type = std::vector<bound_segment>;

    std::string raw;
    std::optional<parameter_schema> schema;
    segments_type segments;

    bool
    parameterized () const noexcept
    {
      return schema.has_value ();
    }

    std::size_t
    binding_count () const noexcept;

    // Evaluate the path in-process. The values map is keyed by field name
    // and must provide a string for every bound field (std::invalid_argument
    // otherwise). Values are inserted verbatim, exactly as the generated code
    // would do with their string form.
    //
    template <typename M>
    std::string
    render (const M& values) const;

    // Evaluate a path without bindings (std::invalid_argument otherwise).
    //
    std::string
    render () const;
  };

  // Bind template placeholders to schema fields.
  //
  // The schema is optional (nullptr if the annotation didn't name one).
  // Either every placeholder binds or we throw generation_error; there is no
  // partial result. Warnings (permissive unused schema) go to the sink, if
  // any.
  //
  // Not called just bind: with std in scope (or found by ADL through
  // path_template's std::string argument) std::bind wins overload
  // resolution.
  //
  bound_path
  bind_placeholders (const path_template&,
                     const parameter_schema*,
                     unused_schema_policy = unused_schema_policy::strict,
                     const diagnostic_sink& = diagnostic_sink ());
}

#include <restep/binder/binder.txx>
