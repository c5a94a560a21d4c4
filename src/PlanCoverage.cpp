#include "CoverageCli.hpp"

#include <exception>
#include <iostream>

int main(int argc, const char* argv[]) {
  using namespace coverage;
  try {
    const auto opts = cli::ParseArgs(argc, argv, std::cout);
    if (!opts)
      return 0;
    return cli::Run(*opts, std::cout, std::clog);
  }
  catch (const cli::UsageError& x) {
    std::cerr << x.what() << '\n';
    return 2;
  }
  catch (std::exception& x) {
    std::cerr << "Exception: " << x.what() << '\n';
  }
  catch (...) {
    std::cerr << "Unknown exception\n";
  }

  return 1;
} // main
