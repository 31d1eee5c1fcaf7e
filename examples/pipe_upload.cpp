/**
 * @file pipe_upload.cpp
 * @brief Stream stdin into an S3-compatible bucket
 *
 * This example demonstrates:
 * - Reading credentials and endpoint settings from the environment
 * - Streaming a pipe of unknown length with file_descriptor_source
 * - Consuming progress, retry, completion and error events
 *
 * Usage:
 *   cat dump.rdb | gzip | pipe_upload -b backups -p dump.rdb.gz
 */

#include <pipedream/pipedream.h>

#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include <unistd.h>

using namespace pipedream;

namespace {

/**
 * @brief Format bytes into human-readable string
 * @param bytes Number of bytes
 * @return Formatted string (e.g., "1.5 MB")
 */
auto format_bytes(uint64_t bytes) -> std::string {
    constexpr uint64_t KB = 1000;
    constexpr uint64_t MB = KB * 1000;
    constexpr uint64_t GB = MB * 1000;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1);

    if (bytes >= GB) {
        oss << static_cast<double>(bytes) / static_cast<double>(GB) << " GB";
    } else if (bytes >= MB) {
        oss << static_cast<double>(bytes) / static_cast<double>(MB) << " MB";
    } else if (bytes >= KB) {
        oss << static_cast<double>(bytes) / static_cast<double>(KB) << " kB";
    } else {
        oss << bytes << " B";
    }
    return oss.str();
}

auto env_or(const char* name, const std::string& fallback = "") -> std::string {
    const char* value = std::getenv(name);
    return (value && *value) ? std::string(value) : fallback;
}

}  // namespace

void print_usage(const char* program) {
    std::cout << "pipe_upload - streaming multipart uploader" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: INPUT | " << program << " [options]" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -e, --endpoint <host>   Endpoint to upload to (default: $ENDPOINT or AWS)" << std::endl;
    std::cout << "  -r, --region <region>   Region to sign for (default: $REGION or us-east-1)" << std::endl;
    std::cout << "  -b, --bucket <bucket>   Bucket to upload to" << std::endl;
    std::cout << "  -p, --path <key>        Remote path of the object" << std::endl;
    std::cout << "  -t, --retries <n>       Attempts per part (default: 3)" << std::endl;
    std::cout << "  -m, --part-size <mb>    Maximum part size in megabytes (default: 5)" << std::endl;
    std::cout << "      --path-style        Address the bucket in the URL path" << std::endl;
    std::cout << "  -s, --silent            Only report errors" << std::endl;
    std::cout << "  -v, --version           Print version information" << std::endl;
    std::cout << "      --help              Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "ACCESS_KEY and SECRET_KEY must be set in the environment. ENDPOINT and" << std::endl;
    std::cout << "REGION may be set there too; the corresponding options take precedence." << std::endl;
}

int main(int argc, char* argv[]) {
    upload_config config;
    config.access_key = env_or("ACCESS_KEY");
    config.secret_key = env_or("SECRET_KEY");
    config.endpoint = env_or("ENDPOINT");
    config.region = env_or("REGION");
    config.max_retries = upload_config::default_max_retries;
    config.max_part_size = upload_config::default_max_part_size;

    std::string key;
    bool silent = false;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto require_value = [&](const char* option) -> const char* {
            if (++i >= argc) {
                std::cerr << "Error: " << option << " requires an argument" << std::endl;
                std::exit(1);
            }
            return argv[i];
        };

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-v" || arg == "--version") {
            std::cout << version::to_string() << std::endl;
            return 0;
        } else if (arg == "-e" || arg == "--endpoint") {
            config.endpoint = require_value("--endpoint");
        } else if (arg == "-r" || arg == "--region") {
            config.region = require_value("--region");
        } else if (arg == "-b" || arg == "--bucket") {
            config.bucket = require_value("--bucket");
        } else if (arg == "-p" || arg == "--path") {
            key = require_value("--path");
        } else if (arg == "-t" || arg == "--retries") {
            try {
                config.max_retries = std::stoi(require_value("--retries"));
            } catch (const std::exception& e) {
                std::cerr << "Error: invalid --retries value: " << e.what() << std::endl;
                return 1;
            }
        } else if (arg == "-m" || arg == "--part-size") {
            try {
                config.max_part_size =
                    static_cast<std::size_t>(std::stoul(require_value("--part-size"))) * megabyte;
            } catch (const std::exception& e) {
                std::cerr << "Error: invalid --part-size value: " << e.what() << std::endl;
                return 1;
            }
        } else if (arg == "--path-style") {
            config.use_path_style = true;
        } else if (arg == "-s" || arg == "--silent") {
            silent = true;
        } else {
            std::cerr << "Error: unknown option " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    if (::isatty(STDIN_FILENO)) {
        std::cerr << "Error: input must be through a pipe" << std::endl;
        return 1;
    }

    auto start = std::chrono::steady_clock::now();
    auto events = send(config, file_descriptor_source::standard_input(), key);

    if (!silent) {
        std::cout << "> Starting upload..." << std::endl;
    }

    int exit_code = 0;
    while (auto event = events.next()) {
        if (auto* progress = std::get_if<progress_event>(&*event)) {
            if (!silent) {
                std::cout << "> Uploaded part #" << progress->part_number << " "
                          << format_bytes(progress->bytes) << std::endl;
            }
        } else if (auto* retry = std::get_if<retry_event>(&*event)) {
            if (!silent) {
                std::cout << "Retrying part #" << retry->part_number << " try "
                          << retry->retry_number << " of " << retry->max_retries << std::endl;
            }
        } else if (auto* complete = std::get_if<complete_event>(&*event)) {
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start);
            if (!silent) {
                std::cout << "Done. Sent " << format_bytes(complete->total_bytes) << " in "
                          << elapsed.count() << "ms." << std::endl;
                std::cout << complete->result.location << std::endl;
            }
        } else if (auto* failure = std::get_if<error_event>(&*event)) {
            std::cerr << "Upload failed:" << std::endl << std::endl
                      << "    " << failure->message() << std::endl << std::endl;
            exit_code = 1;
        }
    }

    return exit_code;
}
