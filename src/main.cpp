#include "cli.hpp"
#include "config.hpp"
#include "http.hpp"
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) try {
    std::vector<std::string> args(argv + 1, argv + argc);

    minim::http_init();
    auto config = minim::Config::load();

    int rc = minim::run_cli(args, config, nullptr, std::cout, std::cerr);

    minim::http_cleanup();
    return rc;
} catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
}
