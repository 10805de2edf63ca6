#include <restep/utility.hxx>

#include <cctype>

using namespace std;

namespace restep
{
  string
  trim (const string& s)
  {
    size_t b (0), e (s.size ());

    while (b != e && isspace (static_cast<unsigned char> (s[b])))
      ++b;

    while (e != b && isspace (static_cast<unsigned char> (s[e - 1])))
      --e;

    return string (s, b, e - b);
  }
}
