#pragma once

#include <string>

namespace restep
{
  // Return a copy of s without leading and trailing whitespace.
  //
  std::string
  trim (const std::string& s);
}
