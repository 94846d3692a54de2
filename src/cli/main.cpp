#include "common/cli_config.hpp"
#include "common/logger.hpp"
#include "engine/engine.hpp"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <optional>
#include <stdexcept>
#include <string>

namespace {

// Run one command against an open engine. Returns the process exit code.
int run_command(pagekv::Engine& engine, const pagekv::CliConfig& cfg) {
    if (cfg.command == "put") {
        if (auto ec = engine.put(cfg.args[0], cfg.args[1])) {
            fprintf(stderr, "put failed: %s\n", ec.message().c_str());
            return 1;
        }
        fprintf(stdout, "OK\n");
        return 0;
    }

    if (cfg.command == "get") {
        std::optional<std::string> value;
        if (auto ec = engine.get(cfg.args[0], value)) {
            fprintf(stderr, "get failed: %s\n", ec.message().c_str());
            return 1;
        }
        if (!pagekv::write_get_reply(stdout, value)) {
            fprintf(stderr, "get failed: cannot write reply\n");
            return 1;
        }
        return 0;
    }

    if (cfg.command == "del") {
        if (auto ec = engine.del(cfg.args[0])) {
            fprintf(stderr, "del failed: %s\n", ec.message().c_str());
            return 1;
        }
        fprintf(stdout, "OK\n");
        return 0;
    }

    // recover: open() already replayed the WAL.
    const auto& stats = engine.recovery_stats();
    fprintf(stdout,
        "Recovery complete: %llu pages, %llu records (%llu applied, %llu skipped), "
        "%zu live keys, last sequence %llu%s\n",
        static_cast<unsigned long long>(stats.pages_scanned),
        static_cast<unsigned long long>(stats.records_scanned),
        static_cast<unsigned long long>(stats.records_applied),
        static_cast<unsigned long long>(stats.records_skipped),
        stats.live_keys,
        static_cast<unsigned long long>(stats.last_sequence),
        stats.tail_dropped ? ", torn tail dropped" : "");
    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    // ── Parse CLI arguments ──────────────────────────────────────────────────
    pagekv::CliConfig cfg;
    try {
        cfg = pagekv::parse_cli_config(argc, argv);
    } catch (const std::runtime_error& e) {
        fprintf(stderr, "%s\n", e.what());
        return 1;
    }

    // ── Logging ──────────────────────────────────────────────────────────────
    pagekv::init_default_logger(pagekv::parse_log_level(cfg.log_level));

    // ── Engine ───────────────────────────────────────────────────────────────
    pagekv::Engine engine{cfg.data_dir, pagekv::EngineOptions{cfg.page_size}};
    if (auto ec = engine.open()) {
        spdlog::error("Failed to open store at {}: {}", cfg.data_dir, ec.message());
        fprintf(stderr, "open failed: %s\n", ec.message().c_str());
        return 1;
    }

    return run_command(engine, cfg);
}
