#include <iostream>
#include <string>
#include <vector>

#include "jsonschema_conformance/cli.hpp"

int main(int argc, char** argv) {
    const std::vector<std::string> tokens(argv + 1, argv + argc);
    return jsonschema::conformance::cli::run_main(tokens, argv[0], std::cout, std::cerr);
}
