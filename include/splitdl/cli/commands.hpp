// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <splitdl/core/download_engine.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace splitdl::cli {

// CLI result
using CliResult = std::expected<int, std::error_code>;

// Command line arguments
struct CliArgs {
    std::string url;
    std::string output_file;
    std::uint32_t chunks{core::DEFAULT_CHUNK_COUNT};
    bool info{false};
    bool json{false};
    bool keep_partial{false};
    bool insecure{false};
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
    std::string error;              // Set when the command line is unusable
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]);

// Output path from -o, or else the last segment of the URL path.
// Empty when neither yields a name.
[[nodiscard]] std::string resolve_output_path(const CliArgs& args);

// Map CLI flags onto the engine configuration
[[nodiscard]] core::DownloadConfig make_config(const CliArgs& args);

// Download args.url
[[nodiscard]] CliResult download(const CliArgs& args) noexcept;

// Probe only: print size and range support
[[nodiscard]] CliResult info(const CliArgs& args) noexcept;

// Show help message
void print_help(std::string_view program_name) noexcept;

// Show version information
void print_version() noexcept;

} // namespace splitdl::cli
