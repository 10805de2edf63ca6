#include <restep/adapter/source-adapter.hxx>

#include <restep/generation-error.hxx>

#include <algorithm>
#include <cassert>
#include <string>
#include <vector>

using namespace std;
using namespace restep;

static schema_registry
registry ()
{
  schema_registry r;

  r.add (parameter_schema ("customer_path",
                           {schema_field ("customer_id", "int")}));

  r.add (parameter_schema ("pair", {schema_field ("a"), schema_field ("b")}));

  return r;
}

static const schema_registry schemas (registry ());

static generation_context
context ()
{
  generation_context c;
  c.schemas = &schemas;
  return c;
}

static size_t
lines (const string& s)
{
  return static_cast<size_t> (count (s.begin (), s.end (), '\n'));
}

static generation_error
check_fail (const string& src, error_kind k)
{
  generation_context c (context ());
  source_adapter a (c);

  try
  {
    a.adapt (src, "test.cxx");
    assert (false);
  }
  catch (const generation_error& e)
  {
    assert (e.kind () == k);
    assert (e.located ());
    return e;
  }

  return generation_error (k, "");
}

static void
test_function ()
{
  const string src (
    "#include <restep/endpoint.hxx>\n"
    "\n"
    "RESTEP_ENDPOINT (\"/customers/{customer_id}\",\n"
    "                 params = \"customer_path\")\n"
    "std::string\n"
    "get (const customer_path& p)\n"
    "{\n"
    "  return endpoint (p);\n"
    "}\n");

  generation_context c (context ());

  // Without #line directives.
  //
  {
    source_adapter a (c, false);
    string r (a.adapt (src, "customers.cxx"));

    assert (r.find ("// Generated by restep from customers.cxx") == 0);
    assert (r.find ("#include <locale>\n"
                    "#include <sstream>\n"
                    "#include <string>\n") != string::npos);
    assert (r.find ("#line") == string::npos);
    assert (r.find ("RESTEP_ENDPOINT") == string::npos);

    // The annotation lines are blank but still there.
    //
    assert (r.find ("#include <restep/endpoint.hxx>\n"
                    "\n" +
                    string (44, ' ') + "\n" +
                    string (42, ' ') + "\n"
                    "std::string\n") != string::npos);

    // The helper goes right after the opening brace.
    //
    assert (r.find ("get (const customer_path& p)\n"
                    "{\n"
                    "  [[maybe_unused]] const auto endpoint = [] "
                    "(const customer_path& p) -> std::string\n"
                    "  {\n") != string::npos);

    assert (r.find ("  };\n\n  return endpoint (p);\n}\n") != string::npos);

    assert (a.endpoints ().size () == 1);

    const adapted_endpoint& e (a.endpoints ().front ());
    assert (e.location.line == 3 && e.location.column == 1);
    assert (e.function.style == emission_style::local);
    assert (*e.function.parameter_type == "customer_path");
  }

  // With #line directives the original numbering is restored after the
  // prologue and after the helper.
  //
  {
    source_adapter a (c);
    string r (a.adapt (src, "customers.cxx"));

    assert (r.find ("#line 1 \"customers.cxx\"\n"
                    "#include <restep/endpoint.hxx>\n") != string::npos);

    assert (r.find ("  };\n"
                    "#line 7 \"customers.cxx\"\n"
                    "\n"
                    "  return endpoint (p);\n") != string::npos);

    // Everything after the last directive is the original text.
    //
    size_t p (r.rfind ("#line 7"));
    assert (lines (r.substr (p)) == 1 + 3);
  }
}

static void
test_member ()
{
  const string src (
    "// RESTEP_ENDPOINT (\"/in/comment\")\n"
    "const char* s = \"RESTEP_ENDPOINT (\\\"/in/string\\\")\";\n"
    "#define RESTEP_ENDPOINT(...)\n"
    "RESTEP_ENDPOINT (\"/repos\", name = \"repos_path\")\n"
    "struct repos: base<void (int)>\n"
    "{\n"
    "  RESTEP_ENDPOINT (\"/pairs/{a}/{b}\", params = pair)\n"
    "  std::string\n"
    "  get (pair x) const\n"
    "  {\n"
    "    return endpoint (x);\n"
    "  }\n"
    "};\n");

  generation_context c (context ());
  source_adapter a (c, false);
  string r (a.adapt (src, "repos.cxx"));

  const vector<adapted_endpoint>& es (a.endpoints ());
  assert (es.size () == 2);

  assert (es[0].function.name == "repos_path");
  assert (es[0].function.style == emission_style::member);
  assert (!es[0].function.parameterized ());
  assert (es[0].location.line == 4);

  assert (es[1].function.name == "endpoint");
  assert (es[1].function.style == emission_style::local);
  assert (es[1].location.line == 7 && es[1].location.column == 3);

  assert (r.find ("struct repos: base<void (int)>\n"
                  "{\n"
                  "  static std::string\n"
                  "  repos_path ()\n"
                  "  {\n"
                  "    return \"/repos\";\n"
                  "  }\n") != string::npos);

  assert (r.find ("  get (pair x) const\n"
                  "  {\n"
                  "    [[maybe_unused]] const auto endpoint = [] "
                  "(const pair& p) -> std::string\n") != string::npos);

  // Comments, strings, and directives are left alone.
  //
  assert (r.find ("// RESTEP_ENDPOINT (\"/in/comment\")\n") != string::npos);
  assert (r.find ("\"RESTEP_ENDPOINT (\\\"/in/string\\\")\"") != string::npos);
  assert (r.find ("#define RESTEP_ENDPOINT(...)\n") != string::npos);

  // Nothing to do is not an error.
  //
  string p (a.adapt ("int main () {}\n", "main.cxx"));
  assert (a.endpoints ().empty ());
  assert (p.find ("#include") == string::npos);
  assert (p.find ("int main () {}\n") != string::npos);
}

// Constructor member initializers may be braced. The helper still goes into
// the constructor body.
//
static void
test_constructor ()
{
  const string src (
    "struct client: base\n"
    "{\n"
    "  RESTEP_ENDPOINT (\"/customers/{customer_id}\", params = customer_path)\n"
    "  client (const customer_path& p): url_ {base (p)}, n_ (1), v_ {{1, 2}}\n"
    "  {\n"
    "    url_ += endpoint (p);\n"
    "  }\n"
    "\n"
    "  RESTEP_ENDPOINT (\"/pairs/{a}\", params = pair)\n"
    "  explicit\n"
    "  client (pair p) noexcept\n"
    "    : base<std::string> {p.a},\n"
    "      m_ {} // {\n"
    "  {\n"
    "  }\n"
    "};\n"
    "\n"
    "RESTEP_ENDPOINT (\"/s\")\n"
    "struct alignas (8) s: base\n"
    "{\n"
    "};\n");

  generation_context c (context ());
  source_adapter a (c, false);
  string r (a.adapt (src, "client.cxx"));

  assert (a.endpoints ().size () == 3);

  assert (r.find ("  client (const customer_path& p): "
                  "url_ {base (p)}, n_ (1), v_ {{1, 2}}\n"
                  "  {\n"
                  "    [[maybe_unused]] const auto endpoint = [] "
                  "(const customer_path& p) -> std::string\n") !=
          string::npos);

  assert (r.find ("      m_ {} // {\n"
                  "  {\n"
                  "    [[maybe_unused]] const auto endpoint = [] "
                  "(const pair& p) -> std::string\n") != string::npos);

  assert (r.find ("struct alignas (8) s: base\n"
                  "{\n"
                  "  static std::string\n"
                  "  endpoint ()\n") != string::npos);

  // An initializer list that runs into the end of the declaration.
  //
  check_fail ("RESTEP_ENDPOINT (\"/a\")\nclient (): a_ (1);\n",
              error_kind::invalid_annotation);
}

static void
test_warning ()
{
  vector<source_location> ls;

  generation_context c (context ());
  c.unused = unused_schema_policy::permissive;

  source_adapter a (c,
                    true,
                    [&ls] (const source_location& l, const string& m)
                    {
                      assert (!m.empty ());
                      ls.push_back (l);
                    });

  a.adapt ("\n  RESTEP_ENDPOINT (\"/a\", params = \"pair\")\n"
           "  void f () {}\n",
           "w.cxx");

  assert (ls.size () == 1);
  assert (ls[0].line == 2 && ls[0].column == 3);
  assert (!a.endpoints ().front ().function.parameterized ());
}

static void
test_fail ()
{
  {
    generation_error e (check_fail ("int x;\n"
                                    "RESTEP_ENDPOINT (\"/a/{b\", params = pair)\n"
                                    "void f () {}\n",
                                    error_kind::unterminated_placeholder));
    assert (e.line () == 2 && e.column () == 1);
  }

  // Argument errors point at the offending argument.
  //
  {
    generation_error e (check_fail ("RESTEP_ENDPOINT (\"/a\", foo = \"b\")\n"
                                    "void f () {}\n",
                                    error_kind::invalid_annotation));
    assert (e.line () == 1 && e.column () == 24);
  }

  check_fail ("RESTEP_ENDPOINT\nvoid f () {}\n",
              error_kind::invalid_annotation);

  check_fail ("RESTEP_ENDPOINT (\"/a\"\nvoid f () {}\n",
              error_kind::invalid_annotation);

  check_fail ("RESTEP_ENDPOINT (\"/a\") void f ();\n",
              error_kind::invalid_annotation);

  check_fail ("RESTEP_ENDPOINT (\"/a\")\n",
              error_kind::invalid_annotation);

  check_fail ("RESTEP_ENDPOINT (\"/a\", name = \"not_a-name\") void f () {}\n",
              error_kind::invalid_annotation);

  check_fail ("RESTEP_ENDPOINT (\"/a\", name = delete) void f () {}\n",
              error_kind::invalid_annotation);

  check_fail ("RESTEP_ENDPOINT (\"/a/{b}\") void f () {}\n",
              error_kind::missing_schema);

  check_fail ("RESTEP_ENDPOINT (\"/a/{c}\", params = pair) void f () {}\n",
              error_kind::unbound_placeholder);

  check_fail ("RESTEP_ENDPOINT (\"/a\", params = pair) void f () {}\n",
              error_kind::unused_schema);

  check_fail ("RESTEP_ENDPOINT (\"/{a}\", params = \"pair\")\n"
              "void f (const customer_path& p) {}\n",
              error_kind::signature_mismatch);

  check_fail ("RESTEP_ENDPOINT (\"/{a}\", params = \"pair\")\n"
              "void f (pair p, int n) {}\n",
              error_kind::signature_mismatch);

  check_fail ("RESTEP_ENDPOINT (\"/{a}\", params = \"nope\") void f () {}\n",
              error_kind::unknown_schema_type);
}

int
main ()
{
  test_function ();
  test_member ();
  test_constructor ();
  test_warning ();
  test_fail ();
}
