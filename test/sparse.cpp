/**
 * test/sparse.cpp
 * -----------------------------------------------------------------------------
 * Lowers the statements of the last program argument and writes them (errors
 * to std::cerr). Options are the ones of interp.
 *
 *     sparse [-b] [-d] [-R] [-x] [-H] [-s] <source>
 */

#include "interp/interp.hpp"

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
    else if (arg == "-x")
      options.emitHeader = false;
    else if (arg == "-H")
      options.emitHeader = true;
    else if (arg == "-s")
      options.strictIntroducer = true;
    else if (arg != "-b" && arg != "-d")
      return 2;
  }

  std::istringstream input(vargs[vargsc - 1]);
  return interpret(input, options) ? 0 : 1;
}
