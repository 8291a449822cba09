// src/main.cpp
#include <iostream>

#include "cli/Cli.hpp"

int main(int argc, char** argv) {
  premis::cli::configureLogging();
  return premis::cli::run(argc, argv, std::cout, std::cerr);
}
