#include <restep/binder/binder.hxx>

#include <stdexcept>

using namespace std;

namespace restep
{
  size_t bound_path::
  binding_count () const noexcept
  {
    size_t n (0);
    for (const bound_segment& s: segments)
    {
      if (s.binding ())
        ++n;
    }
    return n;
  }

  string bound_path::
  render () const
  {
    if (parameterized ())
      throw invalid_argument ("path '" + raw + "' requires parameters");

    string r;
    for (const bound_segment& s: segments)
      r += s.text;
    return r;
  }

  bound_path
  bind_placeholders (const path_template& t,
                     const parameter_schema* s,
                     unused_schema_policy p,
                     const diagnostic_sink& diag)
  {
    bound_path r;
    r.raw = t.raw;

    size_t n (t.placeholder_count ());

    // First make sure placeholder count and schema presence agree.
    //
    if (n == 0)
    {
      if (s != nullptr)
      {
        if (p == unused_schema_policy::strict)
          throw generation_error (error_kind::unused_schema,
                                  "path '" + t.raw + "' has no placeholders "
                                  "but schema " + s->name + " is specified");

        if (diag)
          diag ("path '" + t.raw + "' has no placeholders, ignoring "
                "schema " + s->name);
      }

      for (const segment& g: t.segments)
        r.segments.emplace_back (segment_kind::literal, g.text);

      return r;
    }

    if (s == nullptr)
      throw generation_error (error_kind::missing_schema,
                              "path '" + t.raw + "' has placeholders but no "
                              "schema is specified");

    // Now resolve each placeholder by exact name. Duplicates resolve
    // independently to the same field.
    //
    for (const segment& g: t.segments)
    {
      if (g.literal ())
      {
        r.segments.emplace_back (segment_kind::literal, g.text);
        continue;
      }

      optional<size_t> f (s->find (g.text));

      if (!f)
        throw generation_error (error_kind::unbound_placeholder,
                                "placeholder '" + g.text + "' does not name "
                                "a field of " + s->name,
                                g.offset);

      r.segments.emplace_back (segment_kind::placeholder, g.text, *f);
    }

    r.schema = *s;
    return r;
  }
}
