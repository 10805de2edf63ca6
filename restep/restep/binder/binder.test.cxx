#include <restep/binder/binder.hxx>

#include <restep/template/template-parser.hxx>

#include <cassert>
#include <map>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

using namespace std;
using namespace restep;

static bound_path
bind_str (const string& t,
          const parameter_schema* s,
          unused_schema_policy p = unused_schema_policy::strict,
          const diagnostic_sink& d = diagnostic_sink ())
{
  return bind_placeholders (template_parser::parse (t), s, p, d);
}

static void
check_fail (const string& t, const parameter_schema* s, error_kind k)
{
  try
  {
    bind_str (t, s);
    assert (false);
  }
  catch (const generation_error& e)
  {
    assert (e.kind () == k);
  }
}

static const parameter_schema customer (
  "customer_path",
  {schema_field ("customer_id", "int"),
   schema_field ("name", "std::string"),
   schema_field ("unused", "bool")});

// Literal-only templates bind without a schema and render unchanged.
//
static void
test_literal ()
{
  bound_path b (bind_str ("/customers", nullptr));

  assert (!b.parameterized ());
  assert (b.binding_count () == 0);
  assert (b.segments.size () == 1);
  assert (b.render () == "/customers");

  // The value map is irrelevant without bindings.
  //
  assert (b.render (map<string, string> {{"x", "1"}}) == "/customers");

  assert (bind_str ("", nullptr).render ().empty ());
}

static void
test_bind ()
{
  bound_path b (bind_str ("/customers/{customer_id}", &customer));

  assert (b.parameterized ());
  assert (b.schema->name == "customer_path");
  assert (b.segments.size () == 2);
  assert (b.segments[0] == bound_segment (segment_kind::literal,
                                          "/customers/"));
  assert (b.segments[1] == bound_segment (segment_kind::placeholder,
                                          "customer_id",
                                          0));

  assert (b.render (map<string, string> {{"customer_id", "1"}}) ==
          "/customers/1");

  // Rendering a parameterized path without values is a caller error.
  //
  try
  {
    b.render ();
    assert (false);
  }
  catch (const invalid_argument&) {}

  // So is an incomplete value map.
  //
  try
  {
    b.render (map<string, string> {{"name", "x"}});
    assert (false);
  }
  catch (const invalid_argument&) {}
}

// Substitution follows the occurrence order in the template, not the field
// declaration order.
//
static void
test_order ()
{
  bound_path b (bind_str ("/{name}/{customer_id}", &customer));

  assert (b.segments[1].text == "name" && b.segments[1].field == 1);
  assert (b.segments[3].text == "customer_id" && b.segments[3].field == 0);

  unordered_map<string, string> v {{"customer_id", "7"}, {"name", "bob"}};
  assert (b.render (v) == "/bob/7");

  // Rendering is deterministic.
  //
  assert (b.render (v) == b.render (v));
}

// Duplicates bind independently to the same field.
//
static void
test_duplicate ()
{
  parameter_schema s ("p", {schema_field ("x", "int")});
  bound_path b (bind_str ("/a/{x}/{x}", &s));

  assert (b.binding_count () == 2);
  assert (b.segments[1].field == b.segments[3].field);
  assert (b.render (map<string, string> {{"x", "5"}}) == "/a/5/5");
}

// Adjacent placeholders concatenate directly.
//
static void
test_adjacent ()
{
  parameter_schema s ("p", {schema_field ("a"), schema_field ("b")});
  map<string, string> v {{"a", "x"}, {"b", "y"}};

  assert (bind_str ("{a}{b}", &s).render (v) == "xy");
  assert (bind_str ("/{a}{b}", &s).render (v) == "/xy");
}

static void
test_fail ()
{
  // Unbound placeholders are reported with the offending name and offset.
  //
  try
  {
    bind_str ("/a/{missing}", &customer);
    assert (false);
  }
  catch (const generation_error& e)
  {
    assert (e.kind () == error_kind::unbound_placeholder);
    assert (e.offset () == 3);
    assert (e.description ().find ("'missing'") != string::npos);
  }

  // Exact, case-sensitive match only.
  //
  check_fail ("/{Customer_id}", &customer, error_kind::unbound_placeholder);

  // All or nothing: one bad placeholder fails the whole template.
  //
  check_fail ("/{customer_id}/{name}/{nope}",
              &customer,
              error_kind::unbound_placeholder);

  check_fail ("/{customer_id}", nullptr, error_kind::missing_schema);
}

// Unused schema: strict by default, a warning when permissive.
//
static void
test_unused ()
{
  check_fail ("/customers", &customer, error_kind::unused_schema);

  vector<string> ws;
  bound_path b (bind_str ("/customers",
                          &customer,
                          unused_schema_policy::permissive,
                          [&ws] (const string& m) {ws.push_back (m);}));

  assert (ws.size () == 1);
  assert (ws[0].find ("customer_path") != string::npos);

  // The schema is dropped so the helper will not take a parameter.
  //
  assert (!b.parameterized ());
  assert (b.render () == "/customers");

  // No sink is fine too.
  //
  bind_str ("/customers", &customer, unused_schema_policy::permissive);
}

int
main ()
{
  test_literal ();
  test_bind ();
  test_order ();
  test_duplicate ();
  test_adjacent ();
  test_fail ();
  test_unused ();
}
