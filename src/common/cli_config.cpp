#include "common/cli_config.hpp"

#include "storage/page.hpp"

#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/program_options.hpp>
#include <spdlog/fmt/fmt.h>

namespace po = boost::program_options;

namespace pagekv {

namespace {

constexpr const char* kUsage =
    "Usage: pagekv [options] <command> [args]\n"
    "Commands:\n"
    "  put <key> <value>   store a value\n"
    "  get <key>           print a value\n"
    "  del <key>           delete a key\n"
    "  recover             replay the WAL and report\n";

// Operands each command takes.
[[nodiscard]] std::size_t expected_args(const std::string& command) {
    if (command == "put")     return 2;
    if (command == "get")     return 1;
    if (command == "del")     return 1;
    if (command == "recover") return 0;
    throw std::runtime_error(
        fmt::format("Unknown command '{}'\n{}", command, kUsage));
}

// Validate the fully populated CliConfig.
void validate(const CliConfig& cfg) {
    if (cfg.data_dir.empty()) {
        throw std::runtime_error("--data-dir must not be empty");
    }

    if (!storage::is_valid_page_size(cfg.page_size)) {
        throw std::runtime_error(
            fmt::format("--page-size must be a power of two in [{}, {}], got {}",
                        storage::kMinPageSize, storage::kMaxPageSize, cfg.page_size));
    }

    const std::size_t want = expected_args(cfg.command);
    if (cfg.args.size() != want) {
        throw std::runtime_error(
            fmt::format("'{}' takes {} argument(s), got {}\n{}",
                        cfg.command, want, cfg.args.size(), kUsage));
    }
}

} // anonymous namespace

std::string default_data_dir() {
    if (const char* env = std::getenv(kDataDirEnv); env != nullptr && *env != '\0') {
        return env;
    }
    return "./pagekv_data";
}

// ── add_options ───────────────────────────────────────────────────────────────

void add_options(po::options_description& desc) {
    desc.add_options()
        ("help,h",
            "Show this help message and exit")
        ("data-dir,d",
            po::value<std::string>()->default_value(default_data_dir()),
            "Store directory (defaults to $PAGEKV_DATA_DIR or ./pagekv_data)")
        ("page-size",
            po::value<uint32_t>()->default_value(storage::kDefaultPageSize),
            "Page size in bytes; must match the size the store was created with")
        ("log-level",
            po::value<std::string>()->default_value("warn"),
            "Log level: trace|debug|info|warn|error|critical|off");
}

// ── parse_cli_config ──────────────────────────────────────────────────────────

CliConfig parse_cli_config(int argc, char* argv[]) {
    po::options_description desc("pagekv options");
    add_options(desc);

    po::options_description hidden;
    hidden.add_options()
        ("command", po::value<std::string>())
        ("args",    po::value<std::vector<std::string>>());

    po::options_description all;
    all.add(desc).add(hidden);

    po::positional_options_description positional;
    positional.add("command", 1).add("args", -1);

    po::variables_map vm;
    try {
        po::store(
            po::command_line_parser(argc, argv)
                .options(all)
                .positional(positional)
                .run(),
            vm);

        // Handle --help before notify() so a missing command doesn't error.
        if (vm.count("help")) {
            std::ostringstream oss;
            oss << kUsage << desc;
            throw std::runtime_error(oss.str());
        }

        po::notify(vm);
    } catch (const po::error& e) {
        throw std::runtime_error(fmt::format("Argument error: {}", e.what()));
    }

    if (!vm.count("command")) {
        throw std::runtime_error(fmt::format("Missing command\n{}", kUsage));
    }

    CliConfig cfg;
    cfg.data_dir  = vm["data-dir"].as<std::string>();
    cfg.page_size = vm["page-size"].as<uint32_t>();
    cfg.log_level = vm["log-level"].as<std::string>();
    cfg.command   = vm["command"].as<std::string>();
    if (vm.count("args")) {
        cfg.args = vm["args"].as<std::vector<std::string>>();
    }

    validate(cfg);
    return cfg;
}

// ── write_get_reply ───────────────────────────────────────────────────────────

bool write_get_reply(std::FILE* out, const std::optional<std::string>& value) {
    if (!value) {
        return std::fputs("NOT_FOUND\n", out) >= 0;
    }
    if (std::fputs("VALUE ", out) < 0) return false;
    if (std::fwrite(value->data(), 1, value->size(), out) != value->size()) return false;
    return std::fputc('\n', out) != EOF;
}

} // namespace pagekv
