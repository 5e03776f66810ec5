#include "lostore/cli/commands.hpp"

#include <cstring>

namespace lostore::cli {

using namespace lostore::core;

namespace {

constexpr CommandSpec kCommands[] = {
    {CommandId::Help, "help", 0, 0, "help                    Show this help"},
    {CommandId::Put, "put", 1, 2, "put <file> [<name>]     Store a file, print its assigned name"},
    {CommandId::Get, "get", 1, 1, "get <name> [-o <path>]  Copy an object to a local file"},
    {CommandId::Cat, "cat", 1, 1, "cat <name>              Write an object to stdout"},
    {CommandId::Rm, "rm", 1, 1, "rm <name>               Delete an object (absent is fine)"},
    {CommandId::Size, "size", 1, 1, "size <name>             Print the size in bytes"},
    {CommandId::Exists, "exists", 1, 1, "exists <name>           Print true or false"},
    {CommandId::Url, "url", 1, 1, "url <name>              Print the public URL"},
    {CommandId::Serve, "serve", 1, 1, "serve <name> [-r <hdr>] Print the HTTP response for a GET"},
};

} // namespace

Status parse_command(const CliArgs& args,
    const CommandSpec* specs,
    u32 spec_count,
    CommandInvocation* out,
    u32* consumed) noexcept {
    if (out == nullptr || consumed == nullptr) {
        return make_status(StatusDomain::Cli, StatusCode::Invalid);
    }
    *consumed = 0;
    *out = CommandInvocation{};

    if (args.argc == 0 || args.argv == nullptr || args.argv[0] == nullptr) {
        return make_status(StatusDomain::Cli, StatusCode::Invalid);
    }
    if (spec_count > 0 && specs == nullptr) {
        return make_status(StatusDomain::Cli, StatusCode::Invalid);
    }

    const char* name = args.argv[0];
    const CommandSpec* match = nullptr;
    for (u32 i = 0; i < spec_count; ++i) {
        if (specs[i].name != nullptr && std::strcmp(specs[i].name, name) == 0) {
            match = &specs[i];
            break;
        }
    }
    if (match == nullptr) {
        return make_status(StatusDomain::Cli, StatusCode::NotFound);
    }

    const u32 nargs = args.argc - 1;
    if (nargs < match->min_args || nargs > match->max_args) {
        return make_status(StatusDomain::Cli, StatusCode::Invalid, nargs);
    }

    out->id = match->id;
    out->args.argv = args.argv + 1;
    out->args.argc = nargs;
    *consumed = args.argc;
    return ok_status();
}

const CommandSpec* default_commands(u32* count) noexcept {
    if (count != nullptr) {
        *count = static_cast<u32>(sizeof(kCommands) / sizeof(kCommands[0]));
    }
    return kCommands;
}

void print_usage(std::FILE* out) noexcept {
    std::fprintf(out, "usage: lostore [options] <command> [args]\n\n");
    std::fprintf(out, "Commands:\n");
    for (const CommandSpec& c : kCommands) {
        std::fprintf(out, "  %s\n", c.usage);
    }
    std::fprintf(out, "\nOptions:\n");
    std::fprintf(out, "  --db <path>          SQLite database (env LOSTORE_DB)\n");
    std::fprintf(out, "  --pg <conninfo>      PostgreSQL connection (env LOSTORE_PG)\n");
    std::fprintf(out, "  --pg-read <conninfo> Separate read connection (env LOSTORE_PG_READ)\n");
    std::fprintf(out, "  --base-url <url>     Public URL prefix (env LOSTORE_BASE_URL)\n");
    std::fprintf(out, "  -o, --output <path>  Destination for get\n");
    std::fprintf(out, "  -r, --range <header> Range header for serve, e.g. bytes=0-99\n");
    std::fprintf(out, "  -v, --verbose        Log each step on stderr\n");
}

} // namespace lostore::cli
