// Copyright (c) 2026 changcheng967. All rights reserved.

#include <shelf/cli/commands.hpp>
#include <shelf/cli/progress_bar.hpp>
#include <shelf/core/curl_transport.hpp>
#include <shelf/core/event_notifier.hpp>
#include <shelf/core/log.hpp>
#include <shelf/core/queue_controller.hpp>
#include <shelf/core/settings.hpp>
#include <shelf/core/task_store.hpp>
#include <shelf/core/url.hpp>
#include <shelf/version.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <map>
#include <mutex>
#include <set>

using namespace shelf::core;

namespace chrono = std::chrono;

namespace shelf::cli {

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void on_interrupt(int) {
    g_interrupted = 1;
}

std::optional<std::uint64_t> parse_u64(std::string_view text) {
    std::uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

std::filesystem::path task_store_dir() {
    return default_data_dir() / "tasks";
}

// Renders controller events: one line per state change, one aggregate bar
class ProgressView {
public:
    ProgressView(std::ostream& out, bool quiet)
        : out_(out)
        , bar_(out, 0, "Downloading")
        , quiet_(quiet) {}

    void on_event(const Event& event) {
        std::lock_guard lock(mutex_);

        if (const auto* added = std::get_if<TaskAdded>(&event)) {
            auto& row = rows_[added->task.id];
            row.name = added->task.filename;
            row.bytes = added->task.bytes_downloaded;
            row.expected = added->task.expected_size.value_or(0);
            row.state = added->task.state;
        } else if (const auto* changed = std::get_if<StateChanged>(&event)) {
            auto& row = rows_[changed->id];
            row.state = changed->new_state;
            if (changed->new_state != TaskState::active) {
                row.speed = 0;
            }
            report(row, *changed);
        } else if (const auto* progress = std::get_if<ProgressEvent>(&event)) {
            auto& row = rows_[progress->id];
            row.bytes = progress->bytes_downloaded;
            row.expected = progress->expected_size.value_or(row.expected);
            row.speed = progress->speed_bps;
        } else if (const auto* removed = std::get_if<TaskRemoved>(&event)) {
            rows_.erase(removed->id);
        }

        redraw();
    }

    void finish() {
        std::lock_guard lock(mutex_);
        if (!quiet_) {
            bar_.clear();
        }
    }

private:
    struct Row {
        std::string name;
        std::uint64_t bytes{0};
        std::uint64_t expected{0};
        std::uint64_t speed{0};
        TaskState state{TaskState::queued};
    };

    void report(const Row& row, const StateChanged& change) {
        bool loud = change.new_state == TaskState::completed
            || change.new_state == TaskState::failed
            || !change.error.empty();
        if (quiet_ && change.new_state != TaskState::failed) {
            return;
        }
        if (!loud && !spdlog::should_log(spdlog::level::debug)) {
            return;
        }

        bar_.clear();
        out_ << row.name << ": " << to_string(change.new_state);
        if (!change.error.empty()) {
            out_ << " (" << change.error << ")";
        }
        out_ << '\n';
    }

    void redraw() {
        if (quiet_) return;

        std::uint64_t total = 0;
        std::uint64_t current = 0;
        std::uint64_t speed = 0;
        std::size_t active = 0;
        for (const auto& [id, row] : rows_) {
            if (row.state != TaskState::active && row.state != TaskState::queued) {
                continue;
            }
            total += row.expected;
            current += row.bytes;
            speed += row.speed;
            if (row.state == TaskState::active) {
                ++active;
            }
        }
        if (active == 0) {
            bar_.clear();
            return;
        }

        bar_.label(std::to_string(active) + " active");
        bar_.total(total);
        bar_.update(current, speed, true);
    }

    std::ostream& out_;
    ProgressBar bar_;
    bool quiet_;
    std::mutex mutex_;
    std::map<TaskId, Row> rows_;
};

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) {
    CliArgs args;

    auto value_of = [&](int& i, std::string_view name) -> std::optional<std::string> {
        if (i + 1 < argc) {
            return std::string(argv[++i]);
        }
        if (args.error.empty()) {
            args.error = std::string(name) + " needs a value";
        }
        return std::nullopt;
    };

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
        } else if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
        } else if (arg == "-l" || arg == "--list") {
            args.list = true;
        } else if (arg == "--purge") {
            args.purge = true;
        } else if (arg == "-o" || arg == "--output") {
            if (auto v = value_of(i, arg)) args.output_file = *v;
        } else if (arg == "-d" || arg == "--directory") {
            if (auto v = value_of(i, arg)) args.output_dir = *v;
        } else if (arg == "--sha256") {
            if (auto v = value_of(i, arg)) args.sha256 = *v;
        } else if (arg == "--size") {
            if (auto v = value_of(i, arg)) {
                args.expected_size = parse_u64(*v);
                if (!args.expected_size && args.error.empty()) {
                    args.error = "invalid size: " + *v;
                }
            }
        } else if (arg == "-c" || arg == "--concurrency") {
            if (auto v = value_of(i, arg)) {
                auto n = parse_u64(*v);
                if (!n || *n == 0 || *n > 64) {
                    if (args.error.empty()) args.error = "invalid concurrency: " + *v;
                } else {
                    args.concurrency = static_cast<std::uint32_t>(*n);
                }
            }
        } else if (arg.starts_with("-")) {
            if (args.error.empty()) args.error = "unknown option: " + arg;
        } else {
            args.urls.push_back(arg);
        }
    }

    if (args.error.empty() && args.urls.size() > 1 &&
        (!args.output_file.empty() || !args.sha256.empty() || args.expected_size)) {
        args.error = "--output, --sha256 and --size apply to a single URL";
    }

    return args;
}

//=============================================================================
// Commands
//=============================================================================

CliResult download(const CliArgs& args) {
    auto settings = Settings::load(default_config_path());
    if (!settings) {
        std::cerr << "Warning: settings not loaded: " << settings.error().message() << std::endl;
        settings = Settings{};
    }

    std::string level = settings->log_level;
    if (args.verbose) level = "debug";
    if (args.quiet) level = "warn";
    init_logging(level, default_data_dir() / "shelf.log");

    auto config = settings->to_controller_config();
    if (args.concurrency > 0) {
        config.concurrency = args.concurrency;
    }
    if (!args.output_dir.empty()) {
        config.download_dir = args.output_dir;
    }

    TaskStore store(task_store_dir());
    if (auto ec = store.open()) {
        std::cerr << "Error: cannot open task store: " << ec.message() << std::endl;
        return std::unexpected(ec);
    }

    CurlTransport::global_init();

    int exit_code = 0;
    {
        EventNotifier notifier;
        ProgressView view(std::cout, args.quiet);
        notifier.subscribe([&view](const Event& event) { view.on_event(event); });

        CurlTransport transport;
        QueueController controller(store, transport, notifier, config);

        if (auto ec = controller.restore()) {
            std::cerr << "Warning: previous downloads not restored: " << ec.message() << std::endl;
        }

        // Earlier failures stay in the store but do not decide this run's exit code
        std::set<TaskId> session;
        for (const auto& task : controller.list_tasks()) {
            if (!is_terminal(task.state)) {
                session.insert(task.id);
            }
        }

        for (const auto& url : args.urls) {
            EnqueueRequest request;
            request.url = url;

            auto parsed = Url::parse(url);
            if (!parsed) {
                std::cerr << "Error: invalid URL " << url << ": " << parsed.error().message() << std::endl;
                exit_code = 1;
                continue;
            }

            auto name = parsed->filename();
            if (name.empty()) {
                name = "download";
            }
            request.destination_path = args.output_file.empty() ? name : args.output_file;
            request.source_id = parsed->host();
            request.expected_size = args.expected_size;
            if (!args.sha256.empty()) {
                request.expected_checksum = Checksum{"sha256", args.sha256};
            }

            auto id = controller.enqueue(std::move(request));
            if (!id) {
                std::cerr << "Error: " << url << ": " << id.error().message() << std::endl;
                exit_code = 1;
                continue;
            }
            session.insert(*id);
            if (!args.quiet) {
                auto task = controller.task(*id);
                std::cout << "Queued " << *id << " -> "
                          << (task ? task->destination_path : std::string("?")) << std::endl;
            }
        }

        auto previous_handler = std::signal(SIGINT, on_interrupt);
        while (!controller.wait_settled(chrono::milliseconds(200))) {
            if (g_interrupted) {
                break;
            }
        }
        std::signal(SIGINT, previous_handler);

        controller.shutdown();
        notifier.drain();
        view.finish();

        if (g_interrupted) {
            std::cout << "Interrupted; unfinished downloads resume on the next run" << std::endl;
            exit_code = 130;
        } else {
            for (const auto& task : session_failures(controller.list_tasks(), session)) {
                std::cerr << "Failed: " << task.filename << ": " << task.last_error << std::endl;
                exit_code = 1;
            }
        }

        notifier.stop();
    }

    CurlTransport::global_cleanup();
    return exit_code;
}

std::vector<DownloadTask> session_failures(const std::vector<DownloadTask>& tasks,
                                           const std::set<TaskId>& session) {
    std::vector<DownloadTask> failed;
    for (const auto& task : tasks) {
        if (task.state == TaskState::failed && session.contains(task.id)) {
            failed.push_back(task);
        }
    }
    return failed;
}

CliResult list(std::ostream& out) {
    TaskStore store(task_store_dir());
    auto tasks = store.load_all();
    if (!tasks) {
        return std::unexpected(tasks.error());
    }

    if (tasks->empty()) {
        out << "No downloads" << std::endl;
        return 0;
    }

    for (const auto& task : *tasks) {
        out << task.id << "  " << std::left << std::setw(10) << to_string(task.state)
            << std::right << std::setw(10) << core::format_bytes(task.bytes_downloaded);
        if (task.expected_size) {
            out << " / " << core::format_bytes(*task.expected_size);
        }
        out << "  " << task.destination_path;
        if (!task.last_error.empty()) {
            out << "  (" << task.last_error << ")";
        }
        out << '\n';
    }
    out << std::flush;
    return 0;
}

CliResult purge(std::ostream& out) {
    TaskStore store(task_store_dir());
    auto tasks = store.load_all();
    if (!tasks) {
        return std::unexpected(tasks.error());
    }

    std::size_t removed = 0;
    for (const auto& task : *tasks) {
        if (!is_terminal(task.state)) {
            continue;
        }
        if (auto ec = store.remove(task.id)) {
            return std::unexpected(ec);
        }
        ++removed;
    }
    out << "Removed " << removed << " finished download(s)" << std::endl;
    return 0;
}

void print_help(std::string_view program_name) {
    std::cout << "Shelf downloader " << program_name << " - resumable model downloads\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " [OPTIONS] <URL>...\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  -v, --version           Show version information\n";
    std::cout << "  -V, --verbose           Enable verbose output\n";
    std::cout << "  -q, --quiet             Quiet mode (no progress bar)\n";
    std::cout << "  -o, --output <FILE>     Save to specified file\n";
    std::cout << "  -d, --directory <DIR>   Save relative paths under DIR\n";
    std::cout << "  -c, --concurrency <N>   Parallel downloads (default: from settings)\n";
    std::cout << "      --sha256 <HEX>      Expected SHA-256 of the file\n";
    std::cout << "      --size <BYTES>      Expected size of the file\n";
    std::cout << "  -l, --list              List known downloads\n";
    std::cout << "      --purge             Forget finished, failed and cancelled downloads\n";
    std::cout << "\n";
    std::cout << "Unfinished downloads are resumed on every run.\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " https://example.com/model.gguf\n";
    std::cout << "  " << program_name << " -o tiny.gguf --sha256 9f86d0... https://example.com/tiny.gguf\n";
    std::cout << "  " << program_name << " -c 2 https://example.com/a.bin https://example.com/b.bin\n";
}

void print_version() {
    std::cout << "shelfdl " << shelf::version.to_string() << std::endl;
    std::cout << "Built " << shelf::BUILD_DATE << " " << shelf::BUILD_TIME
              << " with libcurl, OpenSSL, nlohmann_json, spdlog\n";
}

} // namespace shelf::cli
