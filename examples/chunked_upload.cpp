/**
 * @file chunked_upload.cpp
 * @brief Command-line uploader for the chunked upload server
 *
 * USAGE:
 *   chunked_upload [--config client.json] [--host h] [--port p]
 *                  [--chunk-size bytes] [--concurrency n]
 *                  [--log-level level] file...
 *
 * EXIT CODES: 0 all files stored, 1 a file failed, 2 usage, 130 cancelled
 */

#include "chunked/client/http_transport.hpp"
#include "chunked/client/orchestrator.hpp"
#include "chunked/core/config.hpp"

#include <boost/asio.hpp>
#include <spdlog/spdlog.h>

#include <csignal>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace asio = boost::asio;
namespace fs = std::filesystem;

using chunked::ClientConfig;
using chunked::client::FileProgress;
using chunked::client::HttpTransport;
using chunked::client::UploadOrchestrator;
using chunked::client::UploadOutcome;
using chunked::client::UploadState;
using chunked::client::upload_state_name;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;
constexpr int kExitCancelled = 130;

void print_usage(const char* program) {
    spdlog::info("Usage: {} [--config file] [--host h] [--port p] [--chunk-size bytes] "
                 "[--concurrency n] [--log-level level] file...", program);
}

/**
 * @brief Throttled progress lines: every state change, then every 10%
 */
class ProgressPrinter {
public:
    void operator()(const FileProgress& progress) {
        std::lock_guard lock(mutex_);
        auto& last = last_[progress.file_index];
        const int bucket = static_cast<int>(progress.percent) / 10;
        if (progress.state == last.state && bucket <= last.bucket) {
            return;
        }
        last.state = progress.state;
        last.bucket = bucket;
        spdlog::info("[{}] {} {:5.1f}% ({}/{} chunks)", upload_state_name(progress.state),
                     progress.file, progress.percent, progress.chunks_done, progress.chunks_total);
    }

private:
    struct Last {
        UploadState state = UploadState::Waiting;
        int bucket = -1;
    };

    std::mutex mutex_;
    std::map<std::size_t, Last> last_;
};

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    ClientConfig config;
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == "--config" && i + 1 < argc) {
            auto loaded = chunked::load_client_config(argv[i + 1]);
            if (loaded.is_error()) {
                spdlog::error("{}", loaded.error().message);
                return kExitUsage;
            }
            config = loaded.value();
        }
    }

    std::vector<fs::path> files;
    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) {
                ++i;
            } else if (arg == "--host" && i + 1 < argc) {
                config.host = argv[++i];
            } else if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
                config.port = static_cast<uint16_t>(std::stoi(argv[++i]));
            } else if (arg == "--chunk-size" && i + 1 < argc) {
                config.chunk_size = std::stoull(argv[++i]);
            } else if (arg == "--concurrency" && i + 1 < argc) {
                config.max_concurrent_uploads = static_cast<std::size_t>(std::stoul(argv[++i]));
            } else if (arg == "--log-level" && i + 1 < argc) {
                config.log_level = argv[++i];
            } else if (arg == "-h" || arg == "--help") {
                print_usage(argv[0]);
                return kExitOk;
            } else if (!arg.empty() && arg[0] == '-') {
                spdlog::error("Unknown argument: {}", arg);
                print_usage(argv[0]);
                return kExitUsage;
            } else {
                files.emplace_back(arg);
            }
        }
    } catch (const std::exception& e) {
        spdlog::error("Invalid numeric argument: {}", e.what());
        return kExitUsage;
    }

    if (files.empty()) {
        print_usage(argv[0]);
        return kExitUsage;
    }
    if (config.chunk_size == 0) {
        spdlog::error("--chunk-size must be positive");
        return kExitUsage;
    }
    if (auto level = chunked::apply_log_level(config.log_level); level.is_error()) {
        spdlog::error("{}", level.error().message);
        return kExitUsage;
    }

    HttpTransport transport(config);
    UploadOrchestrator orchestrator(transport, chunked::client::orchestrator_options(config));
    ProgressPrinter printer;
    orchestrator.set_progress_callback([&printer](const FileProgress& progress) { printer(progress); });

    // Ctrl+C cancels the batch; the watcher runs on its own io_context
    asio::io_context signal_io;
    asio::signal_set signals(signal_io, SIGINT, SIGTERM);
    signals.async_wait([&orchestrator](boost::system::error_code ec, int) {
        if (!ec) {
            spdlog::warn("Interrupted; cancelling uploads");
            orchestrator.cancel();
        }
    });
    std::thread signal_thread([&signal_io]() { signal_io.run(); });

    spdlog::info("Uploading {} file(s) to {}:{}", files.size(), config.host, config.port);
    const auto outcomes = orchestrator.upload_batch(files);

    signal_io.stop();
    signal_thread.join();

    bool failed = false;
    bool cancelled = false;
    for (const UploadOutcome& outcome : outcomes) {
        switch (outcome.state) {
            case UploadState::Success:
            case UploadState::FastSuccess:
                spdlog::info("{}: {} -> {} ({} of {} chunks sent)", outcome.file, upload_state_name(outcome.state),
                             outcome.location, outcome.chunks_uploaded, outcome.chunks_total);
                break;
            case UploadState::Cancelled:
                cancelled = true;
                spdlog::warn("{}: cancelled", outcome.file);
                break;
            default:
                failed = true;
                spdlog::error("{}: {}", outcome.file,
                              outcome.error ? outcome.error->message : std::string("failed"));
                break;
        }
    }

    if (cancelled) {
        return kExitCancelled;
    }
    return failed ? kExitFailed : kExitOk;
}
