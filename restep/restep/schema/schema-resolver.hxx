#pragma once

#include <restep/schema/schema-types.hxx>

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>

#include <boost/json/value.hpp>

namespace restep
{
  namespace fs = std::filesystem;
  namespace json = boost::json;

  // Parameter schema registry.
  //
  // This is the "surrounding generation context" that placeholder binding
  // resolves schema type names against. Rather than introspecting C++ types
  // (which we can't do from a source transformation tool) schemas are
  // described explicitly, normally in JSON files passed on the command line:
  //
  // {
  //   "schemas": [
  //     {
  //       "name": "path_parameters",
  //       "fields": [{"name": "customer_id", "type": "int"}]
  //     }
  //   ]
  // }
  //
  // A field may also be given as a plain string (its name).
  //
  class schema_registry
  {
  public:
    using schemas_type = std::map<std::string, parameter_schema>;
    using size_type = schemas_type::size_type;

    schema_registry () = default;

    // Register a schema. Throws generation_error if the schema is invalid
    // or a schema with the same (normalized) name is already registered.
    //
    void
    add (parameter_schema);

    // Resolve a schema by type name. Throws generation_error
    // (unknown_schema_type) if nothing by that name is registered.
    //
    const parameter_schema&
    resolve (const std::string& type_name) const;

    // As above but return nullptr instead of throwing.
    //
    const parameter_schema*
    find (const std::string& type_name) const noexcept;

    // Load schema descriptions from JSON text, value, or file. Return the
    // number of schemas added.
    //
    size_type
    load (const std::string& json_str);

    size_type
    load (const json::value&);

    size_type
    load_file (const fs::path&);

    bool
    empty () const noexcept
    {
      return schemas_.empty ();
    }

    size_type
    size () const noexcept
    {
      return schemas_.size ();
    }

    const schemas_type&
    schemas () const noexcept
    {
      return schemas_;
    }

  private:
    static parameter_schema
    parse_schema (const json::value&, std::size_t index);

  private:
    schemas_type schemas_;
  };
}
