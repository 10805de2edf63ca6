#include <stdexcept>

namespace restep
{
  template <typename M>
  std::string bound_path::
  render (const M& values) const
  {
    std::string r;

    for (const bound_segment& s: segments)
    {
      if (s.literal ())
      {
        r += s.text;
        continue;
      }

      auto i (values.find (s.text));

      // Unlike the generated code (where the compiler guarantees every field
      // is there) a value map can be incomplete.
      //
      if (i == values.end ())
        throw std::invalid_argument ("no value for field '" + s.text + "'");

      r += i->second;
    }

    return r;
  }
}
