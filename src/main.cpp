#include "interp/interp.hpp"

static void printUsage(std::ostream &out) {
  out << "Usage: interp [options] [file]" << std::endl
      << "  -b  brace convention: {expr}, {{ and }}" << std::endl
      << "  -d  dollar convention: $name, $(expr) and $$ (default)" << std::endl
      << "  -N  normalize parts (default)" << std::endl
      << "  -R  don't normalize parts" << std::endl
      << "  -H  prefix lowered literals with a header" << std::endl
      << "  -x  no header" << std::endl
      << "  -s  introducer without identifier or grouping is an error" << std::endl
      << "  -i  interactive, print prompts" << std::endl;
}

int main(int vargsc, char * vargs[]) {
  std::string file;
  bool interactive = false;

  // Convention first, it determines the defaults of the other options
  Convention convention = conv_dollar;
  for (int i = 1; i < vargsc; ++i) {
    std::string arg(vargs[i]);
    if (arg == "-b")
      convention = conv_brace;
    else if (arg == "-d")
      convention = conv_dollar;
  }

  LowerOptions options(convention);
  for (int i = 1; i < vargsc; ++i) {
    std::string arg(vargs[i]);
    if (arg.size() > 1 && arg[0] == '-') {
      if (arg.size() != 2) {
        std::cerr << "Invalid option: " << arg << std::endl;
        printUsage(std::cerr);
        return 2;
      }

      switch (arg[1]) {
      case 'b':
      case 'd':
        break;
      case 'N':
        options.normalize = true;
        break;
      case 'R':
        options.normalize = false;
        break;
      case 'H':
        options.emitHeader = true;
        break;
      case 'x':
        options.emitHeader = false;
        break;
      case 's':
        options.strictIntroducer = true;
        break;
      case 'i':
        interactive = true;
        break;
      case 'h':
        printUsage(std::cout);
        return 0;
      default:
        std::cerr << "Invalid option: " << arg << std::endl;
        printUsage(std::cerr);
        return 2;
      }
    } else if (file.empty())
      file = arg;
    else {
      std::cerr << "Excess argument: " << arg << std::endl;
      return 2;
    }
  }

  if (file.empty() || file == "-")
    return interpret(std::cin, options, interactive) ? 0 : 1;

  std::ifstream input;
  input.open(file);

  if (!input) {
    std::cerr << "Failed opening file \"" << file << "\"." << std::endl;
    return 1;
  }

  return interpret(input, options, interactive) ? 0 : 1;
}
