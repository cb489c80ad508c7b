// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <vodfetch/core/settings.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace vodfetch::cli {

// CLI result
using CliResult = std::expected<int, std::error_code>;

enum class CommandKind : std::uint8_t {
    movie,       // movie <id> <ext> [title]
    series,      // series <seriesId>
    episode,     // episode <id> <ext> [title]
    scan,        // scan
    list,        // list
    mark,        // mark <itemId> <filename> [path]
    unmark,      // unmark <itemId>
    categories,  // categories
    streams,     // streams <movie|series>:<categoryId>
    episodes     // episodes <seriesId>
};

struct Command {
    CommandKind kind{CommandKind::list};
    std::vector<std::string> args;
};

// Command line arguments
struct CliArgs {
    std::vector<Command> commands;
    std::string config_file;
    std::string output_dir;
    std::string error;        // Set when the command line is malformed
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]) noexcept;

// Settings from --config (or defaults) with command line overrides applied
[[nodiscard]] std::expected<core::Settings, std::error_code> load_settings(const CliArgs& args);

// Execute the parsed commands; download commands block until the queue drains
[[nodiscard]] CliResult run(const CliArgs& args);

// Show help message
void print_help(std::string_view program_name) noexcept;

// Show version information
void print_version() noexcept;

} // namespace vodfetch::cli
