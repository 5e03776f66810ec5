#pragma once

#include <cstdio>
#include <type_traits>

#include "lostore/cli/options.hpp"
#include "lostore/core/errors.hpp"
#include "lostore/storage/lo_store.hpp"

namespace lostore::cli {
    using u32 = lostore::core::u32;

    enum class CommandId : u32 {
        None = 0,
        Help = 1,
        Put = 2,
        Get = 3,
        Cat = 4,
        Rm = 5,
        Size = 6,
        Exists = 7,
        Url = 8,
        Serve = 9,
    };

    struct CommandSpec {
        CommandId id{CommandId::None};
        const char* name{nullptr};
        u32 min_args{0};
        u32 max_args{0};
        const char* usage{nullptr};
    };

    struct CommandInvocation {
        CommandId id{CommandId::None};
        CliArgs args{};
    };

    // Matches argv[0] against the table and checks the argument count.
    // NotFound for an unknown command, Invalid for a wrong argument count.
    [[nodiscard]] lostore::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept;

    [[nodiscard]] const CommandSpec* default_commands(u32* count) noexcept;

    // Options that shape a single command.
    struct RunSettings {
        const char* output{nullptr};  // get: destination file
        const char* range{nullptr};   // serve: Range header
        bool verbose{false};
    };

    // Executes one command against the store, writing results to `out`.
    // Info lines go to stderr when verbose.
    [[nodiscard]] lostore::core::Status run_command(lostore::storage::LoStore& store,
        const CommandInvocation& cmd,
        const RunSettings& settings,
        std::FILE* out) noexcept;

    void print_usage(std::FILE* out) noexcept;

    static_assert(std::is_trivially_copyable_v<CommandSpec>);
    static_assert(std::is_trivially_copyable_v<CommandInvocation>);
    static_assert(std::is_standard_layout_v<CommandSpec>);
    static_assert(std::is_standard_layout_v<CommandInvocation>);

} // namespace lostore::cli
