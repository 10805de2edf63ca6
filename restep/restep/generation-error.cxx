#include <restep/generation-error.hxx>

#include <sstream>

using namespace std;

namespace restep
{
  static string
  format (error_kind k, const string& d)
  {
    ostringstream os;
    os << k << ": " << d;
    return os.str ();
  }

  generation_error::
  generation_error (error_kind k, const string& d, size_t o)
    : runtime_error (format (k, d)),
      kind_ (k),
      description_ (d),
      offset_ (o),
      line_ (0),
      column_ (0)
  {
  }

  // Re-throw helper for the adapter: same error, now with a source location.
  //
  generation_error::
  generation_error (const generation_error& e, size_t l, size_t c)
    : runtime_error (e),
      kind_ (e.kind_),
      description_ (e.description_),
      offset_ (e.offset_),
      line_ (l),
      column_ (c)
  {
  }
}
