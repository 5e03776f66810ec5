#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "lostore/cli/commands.hpp"
#include "lostore/cli/options.hpp"
#include "lostore/core/errors.hpp"
#include "lostore/db/pg_connection.hpp"
#include "lostore/db/sqlite_connection.hpp"
#include "lostore/storage/lo_store.hpp"

using lostore::core::Status;
using lostore::core::is_ok;

// ========================================================================
// Configuration
// ========================================================================

struct CliConfig {
    std::string db_path;
    std::string pg;
    std::string pg_read;
    std::string base_url;
    lostore::cli::RunSettings run{};
};

// Owns whichever backend connections the configuration asked for.
struct Backend {
    std::unique_ptr<lostore::db::SqliteConnection> sqlite;
    std::unique_ptr<lostore::db::PgConnection> pg;
    std::unique_ptr<lostore::db::PgConnection> pg_read;
    lostore::db::Connections conns{};
};

static const char* env_or_null(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? v : nullptr;
}

static std::string default_db_path() {
    const char* home = env_or_null("HOME");
    return std::string(home ? home : "/tmp") + "/lostore/lostore.db";
}

// ========================================================================
// Error Handling
// ========================================================================

static void print_error(const char* msg) {
    std::fprintf(stderr, "error: %s\n", msg);
}

static void print_status_error(const char* context, Status s) {
    std::fprintf(stderr,
                 "error: %s failed (code=%s/%u, domain=%s/%u, aux=%u)\n",
                 context,
                 lostore::core::status_code_name(s.code),
                 static_cast<unsigned>(s.code),
                 lostore::core::status_domain_name(s.domain),
                 static_cast<unsigned>(s.domain),
                 s.aux);
    if (s.code == lostore::core::StatusCode::Io && s.aux != 0) {
        std::fprintf(stderr, "error: %s: %s\n", context, std::strerror(static_cast<int>(s.aux)));
    }
}

static void print_backend_error(const char* context, Status s, const lostore::db::LoConnection* conn) {
    print_status_error(context, s);
    if (conn != nullptr && conn->last_error() != nullptr && *conn->last_error() != '\0') {
        std::fprintf(stderr, "error: %s: %s\n", context, conn->last_error());
    }
}

// ========================================================================
// Setup
// ========================================================================

static void apply_options(const lostore::cli::ParsedOptions& opts, CliConfig* cfg) {
    using lostore::cli::OptionId;
    using lostore::cli::find_option;

    if (const auto* o = find_option(opts, OptionId::Db)) cfg->db_path = o->value.str;
    if (const auto* o = find_option(opts, OptionId::Pg)) cfg->pg = o->value.str;
    if (const auto* o = find_option(opts, OptionId::PgRead)) cfg->pg_read = o->value.str;
    if (const auto* o = find_option(opts, OptionId::BaseUrl)) cfg->base_url = o->value.str;
    if (const auto* o = find_option(opts, OptionId::Output)) cfg->run.output = o->value.str;
    if (const auto* o = find_option(opts, OptionId::Range)) cfg->run.range = o->value.str;
    if (find_option(opts, OptionId::Verbose)) cfg->run.verbose = true;
}

static void apply_env(CliConfig* cfg) {
    const bool has_backend = !cfg->db_path.empty() || !cfg->pg.empty();
    if (!has_backend) {
        if (const char* v = env_or_null("LOSTORE_PG")) {
            cfg->pg = v;
        } else if (const char* v = env_or_null("LOSTORE_DB")) {
            cfg->db_path = v;
        }
    }
    if (cfg->pg_read.empty()) {
        if (const char* v = env_or_null("LOSTORE_PG_READ")) cfg->pg_read = v;
    }
    if (cfg->base_url.empty()) {
        if (const char* v = env_or_null("LOSTORE_BASE_URL")) cfg->base_url = v;
    }
    if (cfg->db_path.empty() && cfg->pg.empty()) {
        cfg->db_path = default_db_path();
    }
}

static Status open_backend(const CliConfig& cfg, Backend* out) {
    if (!cfg.pg.empty()) {
        Status s = lostore::db::PgConnection::open(lostore::db::PgConfig{cfg.pg}, &out->pg);
        if (!is_ok(s)) {
            print_backend_error("postgres connect", s, out->pg.get());
            return s;
        }
        out->conns = lostore::db::single_connection(*out->pg);
        if (!cfg.pg_read.empty()) {
            s = lostore::db::PgConnection::open(lostore::db::PgConfig{cfg.pg_read}, &out->pg_read);
            if (!is_ok(s)) {
                print_backend_error("postgres read connect", s, out->pg_read.get());
                return s;
            }
            out->conns.read = out->pg_read.get();
        }
        if (cfg.run.verbose) {
            std::fprintf(stderr, "info: backend=postgres split_read=%s\n", cfg.pg_read.empty() ? "no" : "yes");
        }
        return lostore::core::ok_status();
    }

    if (cfg.db_path != ":memory:") {
        std::error_code ec;
        const auto parent = std::filesystem::path(cfg.db_path).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent, ec);
        }
    }
    Status s = lostore::db::SqliteConnection::open(lostore::db::SqliteConfig{cfg.db_path}, &out->sqlite);
    if (!is_ok(s)) {
        print_backend_error("sqlite open", s, out->sqlite.get());
        return s;
    }
    out->conns = lostore::db::single_connection(*out->sqlite);
    if (cfg.run.verbose) {
        std::fprintf(stderr, "info: backend=sqlite path=%s\n", cfg.db_path.c_str());
    }
    return lostore::core::ok_status();
}

// ========================================================================
// Entry
// ========================================================================

int main(int argc, char** argv) {
    lostore::cli::CliArgs all{argv + 1, argc > 0 ? static_cast<lostore::core::u32>(argc - 1) : 0};

    lostore::core::u32 option_count = 0;
    const lostore::cli::OptionSpec* option_specs = lostore::cli::default_options(&option_count);
    lostore::cli::ParsedOption option_buf[32];
    lostore::cli::ParsedOptions opts{option_buf, 0, 32};
    lostore::core::u32 consumed = 0;

    Status s = lostore::cli::parse_options(all, option_specs, option_count, &opts, &consumed);
    if (!is_ok(s)) {
        if (s.aux < all.argc) {
            std::fprintf(stderr, "error: bad option '%s'\n", all.argv[s.aux]);
        } else {
            print_error("bad options");
        }
        lostore::cli::print_usage(stderr);
        return EXIT_FAILURE;
    }

    CliConfig cfg;
    apply_options(opts, &cfg);
    if (lostore::cli::find_option(opts, lostore::cli::OptionId::Help)) {
        lostore::cli::print_usage(stdout);
        return EXIT_SUCCESS;
    }
    if (consumed >= all.argc) {
        print_error("missing command");
        lostore::cli::print_usage(stderr);
        return EXIT_FAILURE;
    }

    // Options may also follow the command, e.g. "get 42.txt -o out.txt".
    lostore::cli::CliArgs rest{all.argv + consumed, all.argc - consumed};
    lostore::core::u32 command_count = 0;
    const lostore::cli::CommandSpec* command_specs = lostore::cli::default_commands(&command_count);

    std::string command_name = rest.argv[0];
    std::vector<const char*> positional;
    positional.push_back(rest.argv[0]);
    for (lostore::core::u32 i = 1; i < rest.argc;) {
        if (std::strcmp(rest.argv[i], "--") == 0) {
            positional.insert(positional.end(), rest.argv + i + 1, rest.argv + rest.argc);
            break;
        }
        lostore::cli::CliArgs tail{rest.argv + i, rest.argc - i};
        lostore::core::u32 used = 0;
        lostore::cli::ParsedOption more_buf[16];
        lostore::cli::ParsedOptions more{more_buf, 0, 16};
        s = lostore::cli::parse_options(tail, option_specs, option_count, &more, &used);
        if (!is_ok(s)) {
            std::fprintf(stderr, "error: bad option '%s'\n", s.aux < tail.argc ? tail.argv[s.aux] : "?");
            return EXIT_FAILURE;
        }
        apply_options(more, &cfg);
        i += used;
        if (i < rest.argc) {
            positional.push_back(rest.argv[i]);
            ++i;
        }
    }

    lostore::cli::CommandInvocation cmd;
    lostore::cli::CliArgs cmd_args{positional.data(), static_cast<lostore::core::u32>(positional.size())};
    s = lostore::cli::parse_command(cmd_args, command_specs, command_count, &cmd, &consumed);
    if (!is_ok(s)) {
        if (s.code == lostore::core::StatusCode::NotFound) {
            std::fprintf(stderr, "error: unknown command '%s'\n", command_name.c_str());
        } else {
            std::fprintf(stderr, "error: wrong number of arguments for '%s'\n", command_name.c_str());
        }
        lostore::cli::print_usage(stderr);
        return EXIT_FAILURE;
    }

    if (cmd.id == lostore::cli::CommandId::Help) {
        lostore::cli::print_usage(stdout);
        return EXIT_SUCCESS;
    }

    apply_env(&cfg);
    Backend backend;
    s = open_backend(cfg, &backend);
    if (!is_ok(s)) {
        return EXIT_FAILURE;
    }

    lostore::storage::LoStore store(lostore::storage::StoreConfig{cfg.base_url}, backend.conns);
    if (cfg.run.verbose) {
        std::fprintf(stderr, "info: running %s\n", command_name.c_str());
    }
    s = lostore::cli::run_command(store, cmd, cfg.run, stdout);
    if (!is_ok(s)) {
        print_backend_error(command_name.c_str(), s, backend.conns.write);
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
