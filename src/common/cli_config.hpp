#pragma once

#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

namespace pagekv {

// ── CliConfig ─────────────────────────────────────────────────────────────────
// Configuration for one invocation of the pagekv tool.
// Populated by parse_cli_config() from CLI arguments.

struct CliConfig {
    std::string data_dir;            // Store directory (WAL + page file)
    uint32_t    page_size;           // Bytes per page
    std::string log_level;           // spdlog level string
    std::string command;             // put | get | del | recover
    std::vector<std::string> args;   // Command operands
};

// Environment variable that overrides the default --data-dir.
inline constexpr const char* kDataDirEnv = "PAGEKV_DATA_DIR";

// $PAGEKV_DATA_DIR if set and non-empty, else "./pagekv_data".
[[nodiscard]] std::string default_data_dir();

// ── parse_cli_config ─────────────────────────────────────────────────────────
// Parse CLI arguments into a CliConfig.
//
// On success: returns a fully validated CliConfig.
// On error  : throws std::runtime_error with a human-readable message
//             (--help also throws, carrying the usage text).
//
// Validates:
//   - command is one of put, get, del, recover
//   - operand count matches the command
//   - page size is a power of two in [512, 65536]
//
// Usage: pagekv [options] put <key> <value> | get <key> | del <key> | recover

[[nodiscard]] CliConfig parse_cli_config(int argc, char* argv[]);

// ── add_options ───────────────────────────────────────────────────────────────
// Populate a boost::program_options::options_description with pagekv options.
// Exposed for testing and help-text generation.

void add_options(boost::program_options::options_description& desc);

// ── write_get_reply ───────────────────────────────────────────────────────────
// Print the reply to `get`: "VALUE <bytes>\n" or "NOT_FOUND\n". The value is
// written verbatim, embedded NUL bytes included. Returns false on a short write.

[[nodiscard]] bool write_get_reply(std::FILE* out, const std::optional<std::string>& value);

} // namespace pagekv
