/**
 * @file upload_example.cpp
 * @brief Chunked upload example with progress reporting and pause/resume
 *
 * This example demonstrates:
 * - Running an upload server over a local directory
 * - Uploading a file through upload_client and an in-process transport
 * - Using progress callbacks to show percent, speed and ETA
 * - Pausing and resuming a running upload through its scheduler
 * - Verifying the assembled object against its SHA-256
 */

#include <kcenon/chunked_upload/chunked_upload.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace kcenon::chunked_upload;

namespace {

/**
 * @brief Format bytes into human-readable string
 * @param bytes Number of bytes
 * @return Formatted string (e.g., "1.5 MB")
 */
auto format_bytes(uint64_t bytes) -> std::string {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (bytes >= GiB) {
        oss << static_cast<double>(bytes) / static_cast<double>(GiB) << " GB";
    } else if (bytes >= MiB) {
        oss << static_cast<double>(bytes) / static_cast<double>(MiB) << " MB";
    } else if (bytes >= KiB) {
        oss << static_cast<double>(bytes) / static_cast<double>(KiB) << " KB";
    } else {
        oss << bytes << " bytes";
    }
    return oss.str();
}

/**
 * @brief Create a test file with pattern content for demonstration
 */
void create_test_file(const std::filesystem::path& path, size_t size) {
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    std::ofstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to create file: " + path.string());
    }

    std::vector<char> buffer(std::min(size, size_t{65536}));
    for (size_t i = 0; i < buffer.size(); ++i) {
        buffer[i] = static_cast<char>('A' + (i % 26));
    }

    size_t remaining = size;
    while (remaining > 0) {
        size_t to_write = std::min(remaining, buffer.size());
        file.write(buffer.data(), static_cast<std::streamsize>(to_write));
        remaining -= to_write;
    }

    std::cout << "Created test file: " << path << " (" << format_bytes(size) << ")" << std::endl;
}

/**
 * @brief SHA-256 of a local file, streamed in 1 MiB reads
 */
auto hash_file(const std::filesystem::path& path) -> std::optional<std::string> {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }

    sha256_hasher hasher;
    byte_buffer buffer(MiB);
    while (in) {
        in.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
        auto got = static_cast<size_t>(in.gcount());
        if (got == 0) {
            break;
        }
        if (!hasher.update(std::span<const std::byte>(buffer.data(), got))) {
            return std::nullopt;
        }
    }
    auto digest = hasher.finish();
    if (!digest) {
        return std::nullopt;
    }
    return digest.value();
}

void print_progress(const std::string& name, const transfer_progress& progress) {
    constexpr int bar_width = 30;
    int filled = static_cast<int>(progress.percent * bar_width / 100);

    std::cout << "\r" << name << " [";
    for (int i = 0; i < bar_width; ++i) {
        if (i < filled) std::cout << "=";
        else if (i == filled) std::cout << ">";
        else std::cout << " ";
    }
    std::cout << "] " << std::setw(3) << progress.percent << "%"
              << " | " << progress.acknowledged_chunks << "/" << progress.total_chunks << " chunks"
              << " | " << to_string(progress.status);
    if (progress.speed_bps) {
        std::cout << " | " << format_bytes(static_cast<uint64_t>(*progress.speed_bps)) << "/s";
    }
    if (progress.eta_seconds && progress.status == transfer_status::uploading) {
        std::cout << " | ETA " << std::fixed << std::setprecision(1) << *progress.eta_seconds << "s";
    }
    std::cout << "     " << std::flush;

    if (is_terminal(progress.status)) {
        std::cout << std::endl;
    }
}

}  // namespace

void print_usage(const char* program) {
    std::cout << "Upload Example - Chunked Upload System" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <local_file> [object_name]" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -d, --upload-dir <dir>  Server upload directory (default: ./uploads)" << std::endl;
    std::cout << "  -c, --chunk-size <size> Force a chunk size (e.g., 512K, 8M)" << std::endl;
    std::cout << "  --pause-demo            Pause the upload for a second midway" << std::endl;
    std::cout << "  --create-test <size>    Create test file of specified size (e.g., 10M, 1G)" << std::endl;
    std::cout << "  --help                  Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  " << program << " video.mp4" << std::endl;
    std::cout << "  " << program << " -d /srv/uploads -c 4M data.bin backup.bin" << std::endl;
    std::cout << "  " << program << " --create-test 120M test_data.bin" << std::endl;
}

auto parse_size(const std::string& size_str) -> size_t {
    size_t pos = 0;
    double value = std::stod(size_str, &pos);

    if (pos < size_str.size()) {
        char suffix = static_cast<char>(std::toupper(size_str[pos]));
        switch (suffix) {
            case 'K': return static_cast<size_t>(value * 1024);
            case 'M': return static_cast<size_t>(value * 1024 * 1024);
            case 'G': return static_cast<size_t>(value * 1024 * 1024 * 1024);
            default: break;
        }
    }
    return static_cast<size_t>(value);
}

int main(int argc, char* argv[]) {
    std::filesystem::path upload_dir = "uploads";
    std::optional<uint32_t> chunk_size;
    bool pause_demo = false;
    std::string local_path;
    std::string object_name;
    std::optional<size_t> create_test_size;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        try {
            if (arg == "--help") {
                print_usage(argv[0]);
                return 0;
            } else if (arg == "-d" || arg == "--upload-dir") {
                if (++i >= argc) {
                    std::cerr << "Error: --upload-dir requires an argument" << std::endl;
                    return 1;
                }
                upload_dir = argv[i];
            } else if (arg == "-c" || arg == "--chunk-size") {
                if (++i >= argc) {
                    std::cerr << "Error: --chunk-size requires an argument" << std::endl;
                    return 1;
                }
                chunk_size = static_cast<uint32_t>(parse_size(argv[i]));
            } else if (arg == "--pause-demo") {
                pause_demo = true;
            } else if (arg == "--create-test") {
                if (++i >= argc) {
                    std::cerr << "Error: --create-test requires a size argument" << std::endl;
                    return 1;
                }
                create_test_size = parse_size(argv[i]);
            } else if (arg[0] != '-') {
                if (local_path.empty()) {
                    local_path = arg;
                } else if (object_name.empty()) {
                    object_name = arg;
                }
            }
        } catch (const std::exception& e) {
            std::cerr << "Error: invalid value for " << arg << ": " << e.what() << std::endl;
            return 1;
        }
    }

    if (local_path.empty()) {
        std::cerr << "Error: local_file is required" << std::endl;
        print_usage(argv[0]);
        return 1;
    }
    if (object_name.empty()) {
        object_name = std::filesystem::path(local_path).filename().string();
    }

    if (create_test_size) {
        try {
            create_test_file(local_path, *create_test_size);
        } catch (const std::exception& e) {
            std::cerr << "Error creating test file: " << e.what() << std::endl;
            return 1;
        }
    }

    auto source = file_chunk_source::open(local_path);
    if (!source) {
        std::cerr << "Error: " << source.error().message << std::endl;
        std::cerr << "Hint: Use --create-test <size> to create a test file" << std::endl;
        return 1;
    }

    auto plan = plan_transfer(source.value()->size());

    std::cout << "========================================" << std::endl;
    std::cout << "       Chunked Upload Example" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << std::endl;
    std::cout << "Configuration:" << std::endl;
    std::cout << "  Upload directory: " << upload_dir << std::endl;
    std::cout << "  Local file: " << local_path << std::endl;
    std::cout << "  Object name: " << object_name << std::endl;
    std::cout << "  Object size: " << format_bytes(plan.object_size) << std::endl;
    std::cout << "  Planned chunk size: " << format_bytes(plan.chunk_size) << std::endl;
    std::cout << "  Concurrency: " << static_cast<int>(plan.concurrency) << std::endl;
    std::cout << "  Retries per chunk: " << static_cast<int>(plan.max_retries) << std::endl;
    if (chunk_size) {
        std::cout << "  Chunk size override: " << format_bytes(*chunk_size) << std::endl;
    }
    std::cout << std::endl;

    std::cout << "[1/4] Starting server..." << std::endl;
    auto server_result = upload_server::builder()
        .with_upload_directory(upload_dir)
        .with_recommended_chunk_size(0)
        .build();
    if (!server_result) {
        std::cerr << "Failed to create server: " << server_result.error().message << std::endl;
        return 1;
    }
    auto& server = server_result.value();

    std::cout << "[2/4] Creating client..." << std::endl;
    std::mutex output_mutex;
    auto builder = upload_client::builder();
    builder.with_transport(std::make_shared<local_transport>(server))
        .with_progress_callback([&output_mutex](const std::string& name, const transfer_progress& p) {
            std::lock_guard lock(output_mutex);
            print_progress(name, p);
        });
    if (chunk_size) {
        builder.with_chunk_size_override(*chunk_size);
    }
    auto client_result = builder.build();
    if (!client_result) {
        std::cerr << "Failed to create client: " << client_result.error().message << std::endl;
        return 1;
    }
    auto& client = client_result.value();

    std::cout << "[3/4] Uploading..." << std::endl;
    auto started = client.start_upload(source.value(), object_name);
    if (!started) {
        std::cerr << "Failed to start upload: " << started.error().message << std::endl;
        return 1;
    }
    auto scheduler = started.value();
    std::cout << "Session: " << scheduler->session_id() << std::endl;

    if (pause_demo) {
        while (scheduler->progress().percent < 30 && !is_terminal(scheduler->progress().status)) {
            std::this_thread::sleep_for(std::chrono::milliseconds{10});
        }
        if (scheduler->pause()) {
            {
                std::lock_guard lock(output_mutex);
                std::cout << std::endl << "[Paused] resuming in one second" << std::endl;
            }
            std::this_thread::sleep_for(std::chrono::seconds{1});
            if (auto resumed = scheduler->resume(); !resumed) {
                std::cerr << "Failed to resume: " << resumed.error().message << std::endl;
            }
        }
    }

    auto final_state = scheduler->wait();
    if (final_state.status != transfer_status::done) {
        std::cerr << "Upload failed";
        if (final_state.last_error) {
            std::cerr << ": " << final_state.last_error->message;
            if (final_state.last_error->chunk_index) {
                std::cerr << " (chunk " << *final_state.last_error->chunk_index << ")";
            }
            std::cerr << std::endl;
            std::cerr << "Hint: rerun to resume session " << scheduler->session_id();
        }
        std::cerr << std::endl;
        return 1;
    }

    std::cout << "[4/4] Verifying..." << std::endl;
    auto response = scheduler->finalize_result().value_or(finalize_response{});
    auto local_hash = hash_file(local_path);

    std::cout << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "  Stored as: " << response.final_path << std::endl;
    if (response.sanitized_name != response.original_name) {
        std::cout << "  (name sanitized from '" << response.original_name << "')" << std::endl;
    }
    std::cout << "  Size: " << format_bytes(response.size) << std::endl;
    std::cout << "  SHA-256: " << response.sha256 << std::endl;
    if (final_state.speed_bps) {
        std::cout << "  Average speed: "
                  << format_bytes(static_cast<uint64_t>(*final_state.speed_bps)) << "/s" << std::endl;
    }
    bool verified = local_hash && *local_hash == response.sha256;
    std::cout << "  Verification: " << (verified ? "OK" : "MISMATCH") << std::endl;
    std::cout << "========================================" << std::endl;

    return verified ? 0 : 1;
}
