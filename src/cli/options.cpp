#include "lostore/cli/options.hpp"

#include <charconv>
#include <cstring>
#include <string_view>

namespace lostore::cli {

using namespace lostore::core;

namespace {

constexpr OptionSpec kOptions[] = {
    {OptionId::Db, OptionType::String, "db", '\0'},
    {OptionId::Pg, OptionType::String, "pg", '\0'},
    {OptionId::PgRead, OptionType::String, "pg-read", '\0'},
    {OptionId::BaseUrl, OptionType::String, "base-url", '\0'},
    {OptionId::Verbose, OptionType::Flag, "verbose", 'v'},
    {OptionId::Output, OptionType::String, "output", 'o'},
    {OptionId::Range, OptionType::String, "range", 'r'},
    {OptionId::Help, OptionType::Flag, "help", 'h'},
};

Status bad_token(u32 index) {
    return make_status(StatusDomain::Cli, StatusCode::Invalid, index);
}

const OptionSpec* lookup(const OptionSpec* specs, u32 spec_count, std::string_view long_name, char short_name) {
    for (u32 i = 0; i < spec_count; ++i) {
        const OptionSpec& s = specs[i];
        if (short_name != '\0') {
            if (s.short_name == short_name) return &s;
        } else if (s.long_name != nullptr && long_name == s.long_name) {
            return &s;
        }
    }
    return nullptr;
}

bool parse_i64(const char* s, i64* out) {
    const char* end = s + std::strlen(s);
    i64 v{};
    auto r = std::from_chars(s, end, v, 10);
    if (r.ec != std::errc() || r.ptr != end) {
        return false;
    }
    *out = v;
    return true;
}

// Fills opt from `inline_value` or, failing that, the next token.
Status take_value(const OptionSpec& spec, const char* inline_value, const CliArgs& args, u32* i,
                  ParsedOption* opt) {
    opt->id = spec.id;
    opt->type = spec.type;
    const u32 at = *i;

    if (spec.type == OptionType::Flag) {
        if (inline_value != nullptr) return bad_token(at);
        opt->value.boolv = 1;
        *i += 1;
        return ok_status();
    }

    const char* value = inline_value;
    if (value == nullptr) {
        if (at + 1 >= args.argc || args.argv[at + 1] == nullptr) return bad_token(at);
        value = args.argv[at + 1];
        *i += 2;
    } else {
        *i += 1;
    }

    if (spec.type == OptionType::String) {
        opt->value.str = value;
        return ok_status();
    }
    i64 v{};
    if (!parse_i64(value, &v)) return bad_token(at);
    opt->value.i64v = v;
    return ok_status();
}

} // namespace

Status parse_options(const CliArgs& args,
    const OptionSpec* specs,
    u32 spec_count,
    ParsedOptions* out,
    u32* consumed) noexcept {
    if (out == nullptr || consumed == nullptr) {
        return make_status(StatusDomain::Cli, StatusCode::Invalid);
    }
    *consumed = 0;
    out->len = 0;
    if ((args.argc > 0 && args.argv == nullptr) || (spec_count > 0 && specs == nullptr)) {
        return make_status(StatusDomain::Cli, StatusCode::Invalid);
    }

    u32 i = 0;
    while (i < args.argc) {
        const char* tok = args.argv[i];
        if (tok == nullptr || tok[0] != '-' || tok[1] == '\0') {
            break;
        }
        if (std::strcmp(tok, "--") == 0) {
            ++i;
            break;
        }

        const OptionSpec* spec = nullptr;
        const char* inline_value = nullptr;
        if (tok[1] == '-') {
            std::string_view name(tok + 2);
            if (const char* eq = std::strchr(tok + 2, '='); eq != nullptr) {
                name = std::string_view(tok + 2, static_cast<size_t>(eq - (tok + 2)));
                inline_value = eq + 1;
            }
            if (name.empty()) return bad_token(i);
            spec = lookup(specs, spec_count, name, '\0');
        } else {
            spec = lookup(specs, spec_count, {}, tok[1]);
            if (tok[2] != '\0') inline_value = tok + 2;
        }
        if (spec == nullptr) {
            return bad_token(i);
        }

        ParsedOption opt{};
        Status s = take_value(*spec, inline_value, args, &i, &opt);
        if (!is_ok(s)) {
            return s;
        }
        if (out->data == nullptr || out->len >= out->cap) {
            return make_status(StatusDomain::Cli, StatusCode::Invalid);
        }
        out->data[out->len++] = opt;
    }

    *consumed = i;
    return ok_status();
}

const ParsedOption* find_option(const ParsedOptions& opts, OptionId id) noexcept {
    const ParsedOption* found = nullptr;
    for (u32 i = 0; i < opts.len; ++i) {
        if (opts.data[i].id == id) found = &opts.data[i];
    }
    return found;
}

const OptionSpec* default_options(u32* count) noexcept {
    if (count != nullptr) {
        *count = static_cast<u32>(sizeof(kOptions) / sizeof(kOptions[0]));
    }
    return kOptions;
}

} // namespace lostore::cli
