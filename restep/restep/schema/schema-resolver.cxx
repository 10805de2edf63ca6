#include <restep/schema/schema-resolver.hxx>

#include <restep/generation-error.hxx>

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

#include <boost/json/parse.hpp>
#include <boost/json/value_to.hpp>

using namespace std;

namespace restep
{
  void schema_registry::
  add (parameter_schema s)
  {
    s.name = normalize_type_name (s.name);

    if (s.name.empty ())
      throw generation_error (error_kind::invalid_schema,
                              "schema has no name");

    s.validate ();

    string n (s.name);
    if (!schemas_.emplace (n, move (s)).second)
      throw generation_error (error_kind::invalid_schema,
                              "schema " + n + " is described more than once");
  }

  const parameter_schema* schema_registry::
  find (const string& n) const noexcept
  {
    auto i (schemas_.find (normalize_type_name (n)));
    return i != schemas_.end () ? &i->second : nullptr;
  }

  const parameter_schema& schema_registry::
  resolve (const string& n) const
  {
    if (const parameter_schema* s = find (n))
      return *s;

    throw generation_error (error_kind::unknown_schema_type,
                            "no schema description for type '" + n + "'");
  }

  schema_registry::size_type schema_registry::
  load (const string& json_str)
  {
    json::value jv;

    try
    {
      jv = json::parse (json_str);
    }
    catch (const exception& e)
    {
      throw generation_error (error_kind::invalid_schema,
                              string ("unable to parse schema JSON: ") +
                              e.what ());
    }

    return load (jv);
  }

  schema_registry::size_type schema_registry::
  load (const json::value& jv)
  {
    // We accept either the full document or a bare array of schemas. The
    // latter is handy for short, hand-written files.
    //
    const json::array* a (nullptr);

    if (jv.is_object ())
    {
      const json::object& o (jv.as_object ());

      if (!o.contains ("schemas") || !o.at ("schemas").is_array ())
        throw generation_error (error_kind::invalid_schema,
                                "schema JSON object must have a 'schemas' "
                                "array");

      a = &o.at ("schemas").as_array ();
    }
    else if (jv.is_array ())
      a = &jv.as_array ();
    else
      throw generation_error (error_kind::invalid_schema,
                              "schema JSON must be an object or an array");

    // Parse everything first so that a bad entry doesn't leave us with half
    // of the document registered.
    //
    vector<parameter_schema> ss;
    ss.reserve (a->size ());

    for (size_t i (0); i != a->size (); ++i)
      ss.push_back (parse_schema ((*a)[i], i));

    schema_registry r (*this);
    for (parameter_schema& s: ss)
      r.add (move (s));

    size_type n (r.size () - size ());
    schemas_ = move (r.schemas_);
    return n;
  }

  schema_registry::size_type schema_registry::
  load_file (const fs::path& f)
  {
    ifstream ifs (f, ios::binary);

    if (!ifs.is_open ())
      throw runtime_error ("unable to open schema file: " + f.string ());

    ostringstream os;
    os << ifs.rdbuf ();

    if (ifs.bad ())
      throw runtime_error ("unable to read schema file: " + f.string ());

    try
    {
      return load (os.str ());
    }
    catch (const generation_error& e)
    {
      throw generation_error (e.kind (),
                              f.string () + ": " + e.description ());
    }
  }

  parameter_schema schema_registry::
  parse_schema (const json::value& jv, size_t i)
  {
    auto fail = [i] (const string& m)
    {
      return generation_error (error_kind::invalid_schema,
                               "schema #" + to_string (i) + ": " + m);
    };

    if (!jv.is_object ())
      throw fail ("expected an object");

    const json::object& o (jv.as_object ());

    if (!o.contains ("name") || !o.at ("name").is_string ())
      throw fail ("missing 'name' string");

    parameter_schema s;
    s.name = json::value_to<string> (o.at ("name"));

    // A schema with no fields is legal (though only useful with a template
    // that has no placeholders).
    //
    if (o.contains ("fields"))
    {
      if (!o.at ("fields").is_array ())
        throw fail ("'fields' must be an array");

      for (const json::value& jf: o.at ("fields").as_array ())
      {
        if (jf.is_string ())
        {
          s.fields.emplace_back (json::value_to<string> (jf));
          continue;
        }

        if (!jf.is_object ())
          throw fail ("field must be a string or an object");

        const json::object& fo (jf.as_object ());

        if (!fo.contains ("name") || !fo.at ("name").is_string ())
          throw fail ("field is missing 'name' string");

        schema_field f (json::value_to<string> (fo.at ("name")));

        if (fo.contains ("type"))
        {
          if (!fo.at ("type").is_string ())
            throw fail ("field 'type' must be a string");

          f.type = json::value_to<string> (fo.at ("type"));
        }

        s.fields.push_back (move (f));
      }
    }

    return s;
  }
}
