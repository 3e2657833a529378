/**
 * test/slower.cpp
 * -----------------------------------------------------------------------------
 * Lowers the last program argument as raw text of an interpolated string
 * literal and writes the parts, or the error.
 *
 *     slower [-b] [-d] [-R] [-s] <raw>
 */

#include "interp/global.hpp"
#include "interp/lowerer.hpp"

int main(int vargsc, char * vargs[]) {
  if (vargsc < 2)
    return 2;

  Convention convention = conv_dollar;
  for (int i = 1; i < vargsc - 1; ++i) {
    if (std::string(vargs[i]) == "-b")
      convention = conv_brace;
  }

  LowerOptions options(convention);
  for (int i = 1; i < vargsc - 1; ++i) {
    std::string arg(vargs[i]);
    if (arg == "-R")
      options.normalize = false;
    else if (arg == "-s")
      options.strictIntroducer = true;
    else if (arg != "-b" && arg != "-d")
      return 2;
  }

  LowerResult result = lower(vargs[vargsc - 1], options);
  if (!result) {
    std::cout << result.getError().getName() << " at "
      << result.getError().getOffset() << ": "
      << result.getError().getMessage() << std::endl;
    return 1;
  }

  std::cout << toString(result.getParts()) << std::endl;
  return 0;
}
