#include <restep/schema/schema-types.hxx>

#include <restep/generation-error.hxx>
#include <restep/template/template-types.hxx>
#include <restep/utility.hxx>

#include <set>

using namespace std;

namespace restep
{
  optional<size_t> parameter_schema::
  find (const string& n) const noexcept
  {
    for (size_t i (0); i != fields.size (); ++i)
    {
      if (fields[i].name == n)
        return i;
    }
    return nullopt;
  }

  void parameter_schema::
  validate () const
  {
    set<string> seen;

    for (const schema_field& f: fields)
    {
      // A field we could never bind is almost certainly a typo in the schema
      // description, so complain now rather than silently ignoring it.
      //
      if (!valid_identifier (f.name))
        throw generation_error (error_kind::invalid_schema,
                                "schema " + name + ": field name '" + f.name +
                                "' is not an identifier");

      // Nor could the generated p.<name> ever compile.
      //
      if (cxx_keyword (f.name))
        throw generation_error (error_kind::invalid_schema,
                                "schema " + name + ": field name '" + f.name +
                                "' is a C++ keyword");

      if (!seen.insert (f.name).second)
        throw generation_error (error_kind::duplicate_field,
                                "schema " + name + " declares field '" +
                                f.name + "' more than once");
    }
  }

  string
  normalize_type_name (const string& s)
  {
    string r (trim (s));

    if (r.compare (0, 2, "::") == 0)
      r.erase (0, 2);

    return r;
  }
}
