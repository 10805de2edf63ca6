#include <restep/template/template-parser.hxx>

#include <restep/generation-error.hxx>

#include <cassert>
#include <stdexcept>
#include <string>
#include <vector>

using namespace std;
using namespace restep;

// Parse and expect failure of the specified kind at the specified offset.
//
static void
check_fail (const string& s,
            error_kind k,
            size_t o,
            const delimiters& d = delimiters ())
{
  try
  {
    template_parser::parse (s, d);
    assert (false);
  }
  catch (const generation_error& e)
  {
    assert (e.kind () == k);
    assert (e.offset () == o);
  }
}

// Literal-only templates. No placeholders means a single literal segment (or
// nothing at all for the empty template).
//
static void
test_literal ()
{
  {
    path_template t (template_parser::parse ("/customers"));

    assert (t.segments.size () == 1);
    assert (t.segments[0].literal ());
    assert (t.segments[0].text == "/customers");
    assert (t.placeholder_count () == 0);
  }

  {
    path_template t (template_parser::parse (""));
    assert (t.empty ());
  }

  // Anything but the delimiters is literal text, including characters we
  // would never want in a URL. We don't judge.
  //
  {
    path_template t (template_parser::parse ("/a b/%20/ü?x=1#frag"));

    assert (t.segments.size () == 1);
    assert (t.segments[0].text == "/a b/%20/ü?x=1#frag");
  }
}

// Placeholders and the segment order.
//
static void
test_placeholder ()
{
  {
    path_template t (template_parser::parse ("/customers/{customer_id}"));

    assert (t.segments.size () == 2);
    assert (t.segments[0] == segment (segment_kind::literal, "/customers/"));
    assert (t.segments[1] == segment (segment_kind::placeholder,
                                      "customer_id"));
    assert (t.segments[1].offset == 11);
  }

  // Order is the left-to-right occurrence order.
  //
  {
    path_template t (
      template_parser::parse ("/repos/{owner}/{repo}/releases/{id}"));

    assert ((t.placeholder_names () ==
             vector<string> {"owner", "repo", "id"}));
    assert (t.segments.back ().placeholder ());
  }

  // Adjacent placeholders produce no empty literal in between.
  //
  {
    path_template t (template_parser::parse ("{a}{b}"));

    assert (t.segments.size () == 2);
    assert (t.segments[0].placeholder () && t.segments[0].text == "a");
    assert (t.segments[1].placeholder () && t.segments[1].text == "b");
  }

  // Duplicates are kept as independent segments.
  //
  {
    path_template t (template_parser::parse ("/a/{x}/{x}"));

    assert (t.placeholder_count () == 2);
    assert ((t.placeholder_names () == vector<string> {"x", "x"}));
  }

  // Identifier character class.
  //
  {
    path_template t (template_parser::parse ("{_}{a1}{_B_2}"));
    assert ((t.placeholder_names () == vector<string> {"_", "a1", "_B_2"}));
  }
}

static void
test_fail ()
{
  // Unterminated is reported at the open delimiter.
  //
  check_fail ("/a/{unterminated", error_kind::unterminated_placeholder, 3);
  check_fail ("{", error_kind::unterminated_placeholder, 0);

  // Nested is reported at the inner open delimiter.
  //
  check_fail ("/{a{b}}", error_kind::nested_placeholder, 3);
  check_fail ("/{{a}}", error_kind::nested_placeholder, 2);

  check_fail ("/{}", error_kind::invalid_placeholder_name, 1);
  check_fail ("/x/{1abc}", error_kind::invalid_placeholder_name, 3);
  check_fail ("/x/{a-b}", error_kind::invalid_placeholder_name, 3);
  check_fail ("/x/{ a}", error_kind::invalid_placeholder_name, 3);

  check_fail ("/a}", error_kind::unmatched_delimiter, 2);
  check_fail ("/{a}}", error_kind::unmatched_delimiter, 4);
}

// Custom delimiters.
//
static void
test_delimiters ()
{
  delimiters d ('<', '>');

  {
    path_template t (template_parser::parse ("/users/<id>/{raw}", d));

    assert (t.segments.size () == 3);
    assert (t.segments[1].placeholder () && t.segments[1].text == "id");
    assert (t.segments[2].literal () && t.segments[2].text == "/{raw}");

    // Reassembling with the same pair gives back the raw template.
    //
    assert (t.string (d) == t.raw);
  }

  check_fail ("/users/<id", error_kind::unterminated_placeholder, 7, d);

  // Unusable pairs.
  //
  auto bad = [] (char o, char c)
  {
    try
    {
      template_parser::parse ("/x", delimiters (o, c));
      assert (false);
    }
    catch (const invalid_argument&) {}
  };

  bad ('{', '{');
  bad ('a', '}');
  bad ('{', '_');
  bad (' ', '}');
  bad ('\0', '}');
}

// Reassembly with the default delimiters reproduces the template.
//
static void
test_string ()
{
  const char* ts[] = {
    "",
    "/customers",
    "/customers/{customer_id}",
    "{a}{b}",
    "/a/{x}/{x}/tail"
  };

  for (const char* s: ts)
    assert (template_parser::parse (s).string () == s);
}

static void
test_identifier ()
{
  assert (valid_identifier ("customer_id"));
  assert (valid_identifier ("_x1"));
  assert (!valid_identifier (""));
  assert (!valid_identifier ("1x"));
  assert (!valid_identifier ("a-b"));

  assert (cxx_keyword ("alignas"));
  assert (cxx_keyword ("class"));
  assert (cxx_keyword ("xor_eq"));
  assert (cxx_keyword ("co_yield"));
  assert (!cxx_keyword (""));
  assert (!cxx_keyword ("Class"));
  assert (!cxx_keyword ("classes"));
  assert (!cxx_keyword ("std"));
  assert (!cxx_keyword ("final")); // Contextual only.
}

int
main ()
{
  test_literal ();
  test_placeholder ();
  test_fail ();
  test_delimiters ();
  test_string ();
  test_identifier ();
}
