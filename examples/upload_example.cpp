/**
 * @file upload_example.cpp
 * @brief Upload a file to S3 with a channel backup, then read a range back
 *
 * This example demonstrates:
 * - Building an engine from an S3 primary and a channel backup
 * - Polling upload progress by session id
 * - Inspecting per-destination results of a finished upload
 * - Serving a byte range of the stored object
 *
 * Credentials are read from the environment:
 *   CHUNK_RELAY_S3_BUCKET, CHUNK_RELAY_S3_REGION, CHUNK_RELAY_S3_ENDPOINT,
 *   CHUNK_RELAY_S3_ACCESS_KEY, CHUNK_RELAY_S3_SECRET_KEY,
 *   CHUNK_RELAY_BOT_TOKEN, CHUNK_RELAY_CHAT_ID
 */

#include <chunk_relay/chunk_relay.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

using namespace chunk_relay;

namespace {

auto env(const char* name) -> std::optional<std::string> {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options] <file>\n"
              << "\n"
              << "Options:\n"
              << "  --chunk-size <MiB>   Chunk size in MiB (default: 16)\n"
              << "  --no-backup          Upload to the primary only\n"
              << "  --range <spec>       Range header to read back (default: bytes=0-1023)\n"
              << "  --help               Show this help message\n";
}

void print_progress(const progress_snapshot& snap) {
    std::cout << "\r[" << std::setw(6) << std::fixed << std::setprecision(2) << snap.percent
              << "%] " << format_size(snap.bytes_transferred);
    if (snap.total_size) {
        std::cout << " / " << format_size(*snap.total_size);
    }
    std::cout << "  " << format_size(static_cast<uint64_t>(snap.current_rate_bytes_per_sec))
              << "/s";
    if (snap.eta_seconds) {
        std::cout << "  ETA " << static_cast<int>(*snap.eta_seconds) << "s";
    }
    std::cout << std::flush;
}

}  // namespace

int main(int argc, char* argv[]) {
    std::size_t chunk_mib = 16;
    bool with_backup = true;
    std::string range = "bytes=0-1023";
    std::filesystem::path file;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--chunk-size") {
            if (++i >= argc) {
                std::cerr << "Error: --chunk-size requires an argument" << std::endl;
                return 1;
            }
            try {
                chunk_mib = static_cast<std::size_t>(std::stoul(argv[i]));
            } catch (const std::exception& e) {
                std::cerr << "Error: invalid chunk size: " << e.what() << std::endl;
                return 1;
            }
        } else if (arg == "--no-backup") {
            with_backup = false;
        } else if (arg == "--range") {
            if (++i >= argc) {
                std::cerr << "Error: --range requires an argument" << std::endl;
                return 1;
            }
            range = argv[i];
        } else if (arg[0] != '-') {
            file = arg;
        } else {
            std::cerr << "Error: unknown option " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    if (file.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    s3_store_config s3_cfg;
    s3_cfg.bucket = env("CHUNK_RELAY_S3_BUCKET").value_or("");
    s3_cfg.region = env("CHUNK_RELAY_S3_REGION").value_or("us-east-1");
    s3_cfg.endpoint = env("CHUNK_RELAY_S3_ENDPOINT");
    s3_cfg.credentials.access_key_id = env("CHUNK_RELAY_S3_ACCESS_KEY").value_or("");
    s3_cfg.credentials.secret_access_key = env("CHUNK_RELAY_S3_SECRET_KEY").value_or("");

    auto primary = s3_object_store::create(s3_cfg);
    if (!primary) {
        std::cerr << "Primary store: " << primary.error().message << std::endl;
        return 1;
    }

    auto engine_builder = transfer_engine::builder();
    engine_builder.with_primary(primary.value()).with_chunk_size(chunk_mib * 1024 * 1024);

    if (with_backup) {
        channel_store_config channel_cfg;
        channel_cfg.bot_token = env("CHUNK_RELAY_BOT_TOKEN").value_or("");
        channel_cfg.chat_id = env("CHUNK_RELAY_CHAT_ID").value_or("");

        auto backup = backup_channel_store::create(channel_cfg);
        if (!backup) {
            std::cerr << "Backup store: " << backup.error().message << std::endl;
            return 1;
        }
        engine_builder.with_backup(backup.value());
    }

    auto engine = engine_builder.build();
    if (!engine) {
        std::cerr << "Engine: " << engine.error().message << std::endl;
        return 1;
    }

    for (const auto& check : engine.value().check_destinations()) {
        std::cout << check.name << (check.mandatory ? " (mandatory)" : " (best-effort)") << ": "
                  << (check.ok() ? "reachable" : check.failure->message) << std::endl;
    }

    auto sid = engine.value().upload_file(file);
    if (!sid) {
        std::cerr << "Upload: " << sid.error().message << std::endl;
        return 1;
    }
    std::cout << "Session " << sid.value().to_string() << std::endl;

    // The tracker drops a terminal snapshot after it is read once
    while (true) {
        auto snap = engine.value().progress(sid.value());
        if (!snap) {
            break;
        }
        print_progress(snap.value());
        if (is_terminal_state(snap.value().state)) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(250));
    }
    std::cout << std::endl;

    auto outcome = engine.value().await_completion(sid.value());
    if (!outcome) {
        std::cerr << "Await: " << outcome.error().message << std::endl;
        return 1;
    }

    const auto& done = outcome.value();
    for (const auto& dest : done.destinations) {
        std::cout << "  " << dest.destination << ": " << to_string(dest.state) << ", "
                  << format_size(dest.bytes_transferred) << ", " << dest.retry_count
                  << " retries";
        if (dest.last_error) {
            std::cout << " (" << dest.last_error->message << ")";
        }
        std::cout << std::endl;
    }

    if (done.state != session_state::completed) {
        std::cerr << "Upload " << to_string(done.state) << ": "
                  << (done.failure ? done.failure->message : std::string("no error recorded"))
                  << std::endl;
        return 1;
    }

    const auto& meta = *done.metadata;
    std::cout << "Stored " << meta.id << " (" << format_size(meta.size) << ", "
              << meta.content_type << ")" << std::endl;

    auto read = engine.value().stream_range(meta.id, range);
    if (!read) {
        std::cerr << "Range read: " << read.error().message << std::endl;
        return 1;
    }
    for (const auto& [name, value] : read.value().response_headers()) {
        std::cout << "  " << name << ": " << value << std::endl;
    }
    std::cout << "Served by " << read.value().served_by << std::endl;

    auto url = engine.value().player_url(meta.id);
    if (url) {
        std::cout << "Player URL: " << url.value() << std::endl;
    } else {
        std::cout << "No player URL: " << url.error().message << std::endl;
    }

    return 0;
}
