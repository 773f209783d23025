// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splitdl/cli/commands.hpp>
#include <splitdl/core/curl_http_client.hpp>
#include <splitdl/core/range_probe.hpp>
#include <splitdl/core/url.hpp>
#include <splitdl/version.hpp>
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <charconv>
#include <exception>
#include <iostream>
#include <mutex>

using namespace splitdl::core;

namespace splitdl::cli {

namespace {

// Keeps libcurl's global state alive for the duration of one command
struct CurlGlobal {
    CurlGlobal() { CurlHttpClient::global_init(); }
    ~CurlGlobal() { CurlHttpClient::global_cleanup(); }

    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

void print_error_json(const std::error_code& ec) {
    nlohmann::json j;
    j["ok"] = false;
    j["error"] = ec.message();
    j["category"] = ec.category().name();
    j["code"] = ec.value();
    std::cout << j.dump(2) << std::endl;
}

void print_report_json(const DownloadReport& report) {
    nlohmann::json j;
    j["ok"] = true;
    j["url"] = report.url;
    j["output"] = report.output_path;
    j["size"] = report.total_size;
    j["chunk_count"] = report.chunk_count;
    j["elapsed_ms"] = report.elapsed.count();
    j["sha256"] = report.sha256;

    auto chunks = nlohmann::json::array();
    for (const auto& outcome : report.chunks) {
        chunks.push_back({{"index", outcome.index}, {"bytes", outcome.bytes_written}});
    }
    j["chunks"] = std::move(chunks);

    std::cout << j.dump(2) << std::endl;
}

void print_report_text(const DownloadReport& report) {
    std::cout << "Time to download was: "
              << static_cast<double>(report.elapsed.count()) / 1000.0 << "s" << std::endl;
    std::cout << "SHA256 Checksum: " << report.sha256 << std::endl;
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) {
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
        } else if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
        } else if (arg == "-i" || arg == "--info") {
            args.info = true;
        } else if (arg == "--json") {
            args.json = true;
        } else if (arg == "-k" || arg == "--keep-partial") {
            args.keep_partial = true;
        } else if (arg == "--insecure") {
            args.insecure = true;
        } else if (arg == "-o" || arg == "--output") {
            if (i + 1 >= argc) {
                args.error = arg + " requires a file name";
                return args;
            }
            args.output_file = argv[++i];
        } else if (arg == "-n" || arg == "--chunks") {
            if (i + 1 >= argc) {
                args.error = arg + " requires a number";
                return args;
            }
            std::string_view value = argv[++i];
            std::uint32_t chunks = 0;
            auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), chunks);
            if (ec != std::errc{} || ptr != value.data() + value.size() || chunks == 0) {
                args.error = "chunk count must be a positive integer, got '" + std::string(value) + "'";
                return args;
            }
            args.chunks = chunks;
        } else if (arg.starts_with("-")) {
            args.error = "unknown option " + arg;
            return args;
        } else if (args.url.empty()) {
            args.url = arg;
        } else {
            args.error = "only one URL may be given";
            return args;
        }
    }

    return args;
}

std::string resolve_output_path(const CliArgs& args) {
    if (!args.output_file.empty()) {
        return args.output_file;
    }
    auto parsed = Url::parse(args.url);
    if (!parsed) {
        return {};
    }
    return parsed->filename();
}

DownloadConfig make_config(const CliArgs& args) {
    DownloadConfig config;
    config.chunk_count = args.chunks;
    config.keep_partial = args.keep_partial;
    config.verify_tls = !args.insecure;
    return config;
}

//=============================================================================
// Commands
//=============================================================================

CliResult download(const CliArgs& args) noexcept {
    try {
        auto parsed = Url::parse(args.url);
        if (!parsed) {
            std::cerr << "Error: Invalid URL: " << args.url << std::endl;
            return std::unexpected(parsed.error());
        }

        std::string output = resolve_output_path(args);
        if (output.empty()) {
            std::cerr << "Error: No object to download in " << args.url
                      << " (use -o to name the output file)" << std::endl;
            return std::unexpected(make_error_code(DownloadErrc::invalid_url));
        }

        CurlGlobal curl_global;
        auto config = make_config(args);
        CurlHttpClient client(config);
        DownloadEngine engine(client, config);

        // Workers report concurrently; keep their lines whole
        std::mutex print_mutex;
        if (!args.quiet && !args.json) {
            engine.callback([&](const ChunkEvent& event) {
                std::lock_guard<std::mutex> lock(print_mutex);
                std::cout << "Downloaded chunk " << event.index + 1 << " successfully! ("
                          << event.completed << "/" << event.chunk_count << ")" << std::endl;
            });
        }

        auto report = engine.run(parsed->full(), output);
        if (!report) {
            if (args.json) {
                print_error_json(report.error());
            } else {
                std::cerr << "Error: Download failed: " << report.error().message() << std::endl;
            }
            return std::unexpected(report.error());
        }

        if (args.json) {
            print_report_json(*report);
        } else {
            print_report_text(*report);
        }
        return 0;
    } catch (const std::exception& e) {
        spdlog::critical("download aborted: {}", e.what());
        return std::unexpected(make_error_code(std::errc::not_enough_memory));
    }
}

CliResult info(const CliArgs& args) noexcept {
    try {
        auto parsed = Url::parse(args.url);
        if (!parsed) {
            std::cerr << "Error: Invalid URL: " << args.url << std::endl;
            return std::unexpected(parsed.error());
        }

        CurlGlobal curl_global;
        CurlHttpClient client(make_config(args));
        auto target = RangeProbe(client).probe(parsed->full(), args.chunks);

        if (!target) {
            if (args.json) {
                print_error_json(target.error());
            } else {
                std::cerr << "Error: " << target.error().message() << std::endl;
            }
            return std::unexpected(target.error());
        }

        if (args.json) {
            nlohmann::json j;
            j["ok"] = true;
            j["url"] = target->url;
            j["size"] = target->total_size;
            j["accepts_ranges"] = true;
            j["chunk_count"] = target->chunk_count;
            j["chunk_size"] = target->chunk_size;
            std::cout << j.dump(2) << std::endl;
        } else {
            std::cout << "URL: " << target->url << std::endl;
            std::cout << "Content-Length: " << target->total_size << std::endl;
            std::cout << "Accepts-Ranges: yes" << std::endl;
            std::cout << "Chunk size (" << target->chunk_count << " chunks): "
                      << target->chunk_size << std::endl;
        }
        return 0;
    } catch (const std::exception& e) {
        spdlog::critical("info aborted: {}", e.what());
        return std::unexpected(make_error_code(std::errc::not_enough_memory));
    }
}

void print_help(std::string_view program_name) noexcept {
    std::cout << "splitdl - parallel ranged HTTP downloader\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " [OPTIONS] <URL>\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  -v, --version           Show version information\n";
    std::cout << "  -V, --verbose           Enable debug logging\n";
    std::cout << "  -q, --quiet             Only print warnings and the result\n";
    std::cout << "  -o, --output <FILE>     Save to specified file (default: name from URL)\n";
    std::cout << "  -n, --chunks <N>        Number of parallel chunks (default: "
              << core::DEFAULT_CHUNK_COUNT << ")\n";
    std::cout << "  -i, --info              Probe the server without downloading\n";
    std::cout << "      --json              Print the result as JSON\n";
    std::cout << "  -k, --keep-partial      Keep the output file when the download fails\n";
    std::cout << "      --insecure          Do not verify TLS certificates\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " https://example.com/file.tar.gz\n";
    std::cout << "  " << program_name << " -o myfile.iso -n 16 https://example.com/large.iso\n";
}

void print_version() noexcept {
    std::cout << splitdl::PROJECT_NAME << " " << splitdl::version.to_string() << std::endl;
    std::cout << "Built " << splitdl::BUILD_DATE << " with C++23, " << curl_version() << "\n";
}

} // namespace splitdl::cli
