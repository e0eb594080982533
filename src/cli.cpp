#include "cli.hpp"
#include "cache/ttl_policy.hpp"
#include "util.hpp"
#include <iomanip>
#include <iostream>

namespace minim {

void print_usage(std::ostream& out) {
    out << "Usage: minim <command> [options]\n"
        << "\n"
        << "Commands:\n"
        << "  tokens list [filters]          List stored credentials (no secrets)\n"
        << "  tokens remove --client N [filters] [--all]\n"
        << "                                 Remove stored credentials of one client\n"
        << "  cache tiers                    Show cache tiers and their TTLs\n"
        << "\n"
        << "Filters (repeatable):\n"
        << "  --client NAME        Client name (qobuz, spotify)\n"
        << "  --flow FLOW          Authorization flow\n"
        << "  --client-id ID       Client or app ID\n"
        << "  --user ID            User identifier\n"
        << "  --all                Allow removing every token of a client\n"
        << "  -h, --help           Show this help\n"
        << "\n"
        << "Environment variables:\n"
        << "  MINIM_TOKEN_STORE    Token store path\n"
        << "  MINIM_TOKEN_BACKEND  Token store backend (sqlite, json)\n"
        << "  MINIM_CACHE_ENABLED  Enable the response cache (true, false)\n";
}

static std::string format_stamp(uint64_t epoch) {
    return epoch == 0 ? "-" : format_timestamp(epoch);
}

static int tokens_command(const std::vector<std::string>& args,
                          const Config& config,
                          std::shared_ptr<TokenStore> store,
                          std::ostream& out,
                          std::ostream& err) {
    if (args.size() < 2) {
        err << "Missing tokens subcommand\n";
        print_usage(err);
        return 1;
    }
    const std::string& sub = args[1];

    TokenFilter filter;
    bool all = false;
    for (size_t i = 2; i < args.size(); ++i) {
        const std::string& a = args[i];
        bool has_value = i + 1 < args.size();
        if (a == "--client" && has_value) {
            filter.client_names.push_back(args[++i]);
        } else if (a == "--flow" && has_value) {
            filter.authorization_flows.push_back(args[++i]);
        } else if (a == "--client-id" && has_value) {
            filter.client_ids.push_back(args[++i]);
        } else if (a == "--user" && has_value) {
            filter.user_identifiers.push_back(args[++i]);
        } else if (a == "--all") {
            all = true;
        } else {
            err << "Unknown option: " << a << "\n";
            print_usage(err);
            return 1;
        }
    }

    if (!store) store = create_token_store(config);

    if (sub == "list") {
        auto rows = store->list(filter);
        if (rows.empty()) {
            out << "No stored tokens.\n";
            return 0;
        }
        out << std::left
            << std::setw(10) << "CLIENT" << std::setw(20) << "FLOW"
            << std::setw(34) << "CLIENT ID" << std::setw(16) << "USER"
            << std::setw(22) << "EXPIRES" << "LAST USED\n";
        for (const auto& r : rows) {
            out << std::setw(10) << r.client_name << std::setw(20) << r.authorization_flow
                << std::setw(34) << r.client_id
                << std::setw(16) << (r.user_identifier.empty() ? "-" : r.user_identifier)
                << std::setw(22) << format_stamp(r.expires_at)
                << format_stamp(r.last_accessed / 1000000) << "\n";
        }
        return 0;
    }

    if (sub == "remove") {
        if (filter.client_names.size() != 1) {
            err << "tokens remove needs exactly one --client\n";
            return 1;
        }
        bool narrowed = !filter.authorization_flows.empty() || !filter.client_ids.empty() ||
                        !filter.user_identifiers.empty();
        if (!narrowed && !all) {
            err << "Refusing to remove every " << filter.client_names[0]
                << " token without --all\n";
            return 1;
        }
        size_t removed = store->remove(filter);
        out << "Removed " << removed << " token(s).\n";
        return 0;
    }

    err << "Unknown tokens subcommand: " << sub << "\n";
    print_usage(err);
    return 1;
}

static int cache_command(const std::vector<std::string>& args,
                         const Config& config,
                         std::ostream& out,
                         std::ostream& err) {
    if (args.size() != 2 || args[1] != "tiers") {
        err << "Usage: minim cache tiers\n";
        return 1;
    }

    TtlPolicy policy = TtlPolicy::with_overrides(config.cache.tiers);
    out << "Cache " << (config.cache.enabled ? "enabled" : "disabled")
        << ", at most " << config.cache.max_entries << " entries\n";
    for (const auto& name : policy.names()) {
        out << "  " << std::left << std::setw(12) << name
            << describe_ttl(policy.resolve(name)) << "\n";
    }
    return 0;
}

int run_cli(const std::vector<std::string>& args,
            const Config& config,
            std::shared_ptr<TokenStore> store,
            std::ostream& out,
            std::ostream& err) {
    if (args.empty() || args[0] == "-h" || args[0] == "--help") {
        print_usage(args.empty() ? err : out);
        return args.empty() ? 1 : 0;
    }

    if (args[0] == "tokens") return tokens_command(args, config, std::move(store), out, err);
    if (args[0] == "cache") return cache_command(args, config, out, err);

    err << "Unknown command: " << args[0] << "\n";
    print_usage(err);
    return 1;
}

} // namespace minim
