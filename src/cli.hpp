#pragma once
#include "config.hpp"
#include "auth/token_store.hpp"
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace minim {

void print_usage(std::ostream& out);

// Run one CLI command (arguments after the program name).
// Returns the process exit code. store may be null for commands that do
// not touch tokens; it is created from config when needed.
int run_cli(const std::vector<std::string>& args,
            const Config& config,
            std::shared_ptr<TokenStore> store,
            std::ostream& out,
            std::ostream& err);

} // namespace minim
