// Copyright (c) 2026 changcheng967. All rights reserved.

#include <vodfetch/cli/commands.hpp>
#include <vodfetch/cli/progress_bar.hpp>
#include <vodfetch/core/http_session.hpp>
#include <vodfetch/core/queue_manager.hpp>
#include <vodfetch/core/xtream_catalog.hpp>
#include <vodfetch/version.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <utility>
#include <thread>

using namespace vodfetch::core;

namespace chrono = std::chrono;

namespace vodfetch::cli {

namespace {

struct CommandDef {
    std::string_view name;
    CommandKind kind;
    std::size_t min_args;
    std::size_t max_args;
};

constexpr CommandDef COMMANDS[] = {
    {"movie",      CommandKind::movie,      2, 3},
    {"series",     CommandKind::series,     1, 1},
    {"episode",    CommandKind::episode,    2, 3},
    {"scan",       CommandKind::scan,       0, 0},
    {"list",       CommandKind::list,       0, 0},
    {"mark",       CommandKind::mark,       2, 3},
    {"unmark",     CommandKind::unmark,     1, 1},
    {"categories", CommandKind::categories, 0, 0},
    {"streams",    CommandKind::streams,    1, 1},
    {"episodes",   CommandKind::episodes,   1, 1},
};

const CommandDef* find_command(std::string_view name) noexcept {
    for (const auto& def : COMMANDS) {
        if (def.name == name) return &def;
    }
    return nullptr;
}

volatile std::sig_atomic_t g_interrupted = 0;

void on_sigint(int) {
    g_interrupted = 1;
}

void report_enqueue(std::string_view what, const std::expected<JobId, std::error_code>& result) {
    if (result) {
        std::cout << "Queued " << what << " (job " << *result << ")" << std::endl;
    } else if (result.error() == QueueErrc::already_downloaded) {
        std::cout << "Already downloaded: " << what << std::endl;
    } else if (result.error() == QueueErrc::already_queued) {
        std::cout << "Already queued: " << what << std::endl;
    } else {
        std::cerr << "Error: " << what << ": " << result.error().message() << std::endl;
    }
}

void print_records(const std::vector<DownloadRecord>& records) {
    if (records.empty()) {
        std::cout << "No downloads recorded" << std::endl;
        return;
    }
    for (const auto& r : records) {
        std::cout << std::left << std::setw(24) << r.item_id << ' '
                  << std::right << std::fixed << std::setprecision(2) << std::setw(10) << r.size_mb
                  << " MB  " << r.filename << std::endl;
    }
}

// "[done]", "[queued]" or padding
std::string_view state_mark(bool downloaded, bool queued) noexcept {
    if (downloaded) return "[done]  ";
    if (queued) return "[queued]";
    return "        ";
}

// "movie:12" or "series:7"
std::optional<std::pair<CatalogSection, std::string>> parse_category(std::string_view selection) {
    auto colon = selection.find(':');
    if (colon == std::string_view::npos || colon + 1 == selection.size()) {
        return std::nullopt;
    }
    std::string_view type = selection.substr(0, colon);
    std::string id(selection.substr(colon + 1));
    if (type == "movie") return std::pair(CatalogSection::movies, std::move(id));
    if (type == "series") return std::pair(CatalogSection::series, std::move(id));
    return std::nullopt;
}

bool list_categories(QueueManager& manager) {
    auto categories = manager.list_categories();
    if (!categories) {
        std::cerr << "Error: categories: " << categories.error().message() << std::endl;
        return false;
    }
    for (const auto& c : *categories) {
        std::string selection = std::string(section_prefix(c.section)) + ":" + c.id;
        std::cout << std::left << std::setw(16) << selection << ' '
                  << (c.section == CatalogSection::movies ? "[Movie] " : "[Series] ") << c.name << std::endl;
    }
    return true;
}

bool list_streams(QueueManager& manager, std::string_view selection) {
    auto category = parse_category(selection);
    if (!category) {
        std::cerr << "Error: streams expects movie:<id> or series:<id>, got " << selection << std::endl;
        return false;
    }

    auto streams = manager.list_streams(category->first, category->second);
    if (!streams) {
        std::cerr << "Error: streams " << selection << ": " << streams.error().message() << std::endl;
        return false;
    }
    for (const auto& s : *streams) {
        std::cout << state_mark(s.downloaded, s.queued) << ' ' << std::left << std::setw(10) << s.info.id << ' ';
        if (!s.info.extension.empty()) {
            std::cout << std::setw(5) << s.info.extension << ' ';
        }
        std::cout << s.info.name << std::endl;
    }
    return true;
}

bool list_episodes(QueueManager& manager, std::string_view series_id) {
    auto episodes = manager.list_episodes(series_id);
    if (!episodes) {
        std::cerr << "Error: episodes " << series_id << ": " << episodes.error().message() << std::endl;
        return false;
    }
    for (const auto& e : *episodes) {
        std::cout << state_mark(e.downloaded, e.queued) << ' ' << std::left << std::setw(10) << e.info.id << ' '
                  << std::setw(5) << e.info.extension << ' ' << e.info.title << std::endl;
    }
    return true;
}

// Runs one command; returns false on failure
bool execute(QueueManager& manager, const Command& cmd, bool& queued) {
    const auto& a = cmd.args;
    auto arg = [&a](std::size_t i) -> std::string_view {
        return i < a.size() ? std::string_view(a[i]) : std::string_view{};
    };

    switch (cmd.kind) {
        case CommandKind::movie:
        case CommandKind::episode: {
            MediaKind kind = cmd.kind == CommandKind::movie ? MediaKind::movie : MediaKind::episode;
            auto result = manager.enqueue(kind, arg(0), arg(1), arg(2));
            report_enqueue(arg(2).empty() ? make_item_id(kind, arg(0)) : std::string(arg(2)), result);
            queued = queued || result.has_value();
            return result || result.error() == QueueErrc::already_downloaded
                          || result.error() == QueueErrc::already_queued;
        }
        case CommandKind::series: {
            auto added = manager.enqueue_series(arg(0));
            if (!added) {
                std::cerr << "Error: series " << arg(0) << ": " << added.error().message() << std::endl;
                return false;
            }
            std::cout << "Queued " << *added << " episodes of series " << arg(0) << std::endl;
            queued = queued || *added > 0;
            return true;
        }
        case CommandKind::scan: {
            std::size_t n = manager.scan_files();
            std::cout << "Indexed " << n << " files in " << manager.settings().download_dir.string() << std::endl;
            return true;
        }
        case CommandKind::list:
            print_records(manager.downloaded());
            return true;
        case CommandKind::mark: {
            if (auto ec = manager.mark_downloaded(arg(0), arg(1), std::filesystem::path(std::string(arg(2))))) {
                std::cerr << "Error: mark " << arg(0) << ": " << ec.message() << std::endl;
                return false;
            }
            std::cout << "Marked " << arg(0) << " as downloaded" << std::endl;
            return true;
        }
        case CommandKind::unmark: {
            if (auto ec = manager.unmark_downloaded(arg(0))) {
                std::cerr << "Error: unmark " << arg(0) << ": " << ec.message() << std::endl;
                return false;
            }
            std::cout << "Unmarked " << arg(0) << std::endl;
            return true;
        }
        case CommandKind::categories:
            return list_categories(manager);
        case CommandKind::streams:
            return list_streams(manager, arg(0));
        case CommandKind::episodes:
            return list_episodes(manager, arg(0));
    }
    return false;
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) noexcept {
    CliArgs args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        if (arg == "-v" || arg == "--version") {
            args.version = true;
            return args;
        }
        if (arg == "-V" || arg == "--verbose") {
            args.verbose = true;
            continue;
        }
        if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
            continue;
        }
        if (arg == "-c" || arg == "--config" || arg == "-d" || arg == "--directory") {
            if (i + 1 >= argc) {
                args.error = "missing value for " + arg;
                return args;
            }
            (arg == "-c" || arg == "--config" ? args.config_file : args.output_dir) = argv[++i];
            continue;
        }
        if (arg.starts_with("-")) {
            args.error = "unknown option " + arg;
            return args;
        }

        const CommandDef* def = find_command(arg);
        if (!def) {
            args.error = "unknown command " + arg;
            return args;
        }

        Command cmd{def->kind, {}};
        // Required arguments are taken verbatim, optional ones stop at the next command
        while (cmd.args.size() < def->max_args && i + 1 < argc) {
            std::string_view next = argv[i + 1];
            if (cmd.args.size() >= def->min_args && (find_command(next) || next.starts_with("-"))) {
                break;
            }
            cmd.args.emplace_back(argv[++i]);
        }
        if (cmd.args.size() < def->min_args) {
            args.error = std::string(def->name) + " needs " + std::to_string(def->min_args) + " argument(s)";
            return args;
        }
        args.commands.push_back(std::move(cmd));
    }

    return args;
}

std::expected<Settings, std::error_code> load_settings(const CliArgs& args) {
    Settings settings;
    if (!args.config_file.empty()) {
        auto loaded = Settings::load(args.config_file);
        if (!loaded) {
            return std::unexpected(loaded.error());
        }
        settings = std::move(*loaded);
    }
    if (!args.output_dir.empty()) {
        settings.download_dir = args.output_dir;
    }
    return settings;
}

//=============================================================================
// Commands
//=============================================================================

CliResult run(const CliArgs& args) {
    auto settings = load_settings(args);
    if (!settings) {
        std::cerr << "Error: invalid configuration: " << settings.error().message() << std::endl;
        return std::unexpected(settings.error());
    }

    spdlog::set_level(spdlog::level::from_str(settings->log_level));
    if (args.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (args.quiet) {
        spdlog::set_level(spdlog::level::warn);
    }

    HttpSession::global_init();

    int exit_code = 0;
    {
        auto session = std::make_shared<HttpSession>(settings->user_agent);
        XtreamCatalog catalog({settings->provider_url, settings->username, settings->password}, session);
        QueueManager manager(*settings, catalog, *session);

        if (auto ec = manager.start()) {
            std::cerr << "Error: " << ec.message() << std::endl;
            HttpSession::global_cleanup();
            return std::unexpected(ec);
        }

        bool queued = false;
        for (const auto& cmd : args.commands) {
            if (!execute(manager, cmd, queued)) {
                exit_code = 1;
            }
        }

        if (queued) {
            g_interrupted = 0;
            auto previous = std::signal(SIGINT, on_sigint);

            ProgressBar bar;
            while (manager.busy()) {
                if (g_interrupted) {
                    manager.stop();
                    if (!args.quiet) bar.clear();
                    std::cout << "Stopped, " << manager.list_queue().size() << " job(s) left unfinished" << std::endl;
                    exit_code = 130;
                    break;
                }
                if (!args.quiet) bar.update(manager.current_progress());
                std::this_thread::sleep_for(chrono::milliseconds(100));
            }
            if (!args.quiet) bar.finish();
            std::signal(SIGINT, previous);

            if (std::uint64_t failures = manager.failed_count(); failures > 0 && exit_code == 0) {
                std::cerr << failures << " download(s) failed" << std::endl;
                exit_code = 1;
            }
        }

        manager.shutdown();
    }

    HttpSession::global_cleanup();
    return exit_code;
}

void print_help(std::string_view program_name) noexcept {
    std::cout << "vodfetch " << program_name << " - VOD catalog download queue\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " [OPTIONS] <COMMAND>...\n";
    std::cout << "\n";
    std::cout << "COMMANDS:\n";
    std::cout << "  movie <ID> <EXT> [TITLE]        Queue a movie\n";
    std::cout << "  episode <ID> <EXT> [TITLE]      Queue a single episode\n";
    std::cout << "  series <SERIES_ID>              Queue every episode of a series\n";
    std::cout << "  scan                            Index files already in the download directory\n";
    std::cout << "  list                            Show recorded downloads\n";
    std::cout << "  mark <ITEM_ID> <FILE> [PATH]    Record an item as downloaded\n";
    std::cout << "  unmark <ITEM_ID>                Forget a recorded download\n";
    std::cout << "  categories                      List movie and series categories\n";
    std::cout << "  streams <movie|series>:<ID>     List a category, marking downloaded and queued items\n";
    std::cout << "  episodes <SERIES_ID>            List the episodes of a series\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  -v, --version           Show version information\n";
    std::cout << "  -V, --verbose           Enable debug logging\n";
    std::cout << "  -q, --quiet             Quiet mode (no progress bar)\n";
    std::cout << "  -c, --config <FILE>     Read settings from a JSON file\n";
    std::cout << "  -d, --directory <DIR>   Download directory (default: /downloads)\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " -c vodfetch.json movie 12345 mkv \"Some Movie (2020)\"\n";
    std::cout << "  " << program_name << " -c vodfetch.json streams movie:12\n";
    std::cout << "  " << program_name << " -c vodfetch.json series 678\n";
    std::cout << "  " << program_name << " mark movie:12345 \"Some Movie (2020).mkv\"\n";
    std::cout << "\n";
    std::cout << "Created by changcheng967\n";
}

void print_version() noexcept {
    std::cout << "vodfetch " << vodfetch::version.to_string() << " (built " << vodfetch::BUILD_DATE << ")" << std::endl;
    std::cout << "Created by changcheng967\n";
    std::cout << "\n";
    std::cout << "Built with C++23, libcurl, nlohmann/json, spdlog\n";
}

} // namespace vodfetch::cli
