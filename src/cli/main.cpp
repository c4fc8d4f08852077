#include "cli/cli.hpp"
#include "core/logger.hpp"
#include <iostream>

int main(int argc, char* argv[]) {
    macroenv::core::init_logger();
    return macroenv::cli::run(argc, argv, std::cin, std::cout, std::cerr);
}
