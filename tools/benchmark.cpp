// Durability benchmark: measures fsync-bound write and CRC-checked read cost.
//
// Opens a pagekv::Engine in a fresh directory, runs N puts of a fixed value
// size, then N gets of the same keys, then reopens the store to time
// recovery.
//
// Prints: total ops, elapsed time, ops/sec, and latency percentiles (p50,
// p90, p99, p999) for each phase.

#include "common/logger.hpp"
#include "engine/engine.hpp"

#include <boost/program_options.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <numeric>
#include <optional>
#include <string>
#include <vector>

namespace {

namespace po = boost::program_options;
using clock  = std::chrono::steady_clock;
using ns     = std::chrono::nanoseconds;

// ── Stats helpers ────────────────────────────────────────────────────────────

struct BenchResult {
    std::size_t total_ops{};
    double elapsed_sec{};
    double ops_per_sec{};
    double p50_us{};
    double p90_us{};
    double p99_us{};
    double p999_us{};
    double avg_us{};
};

BenchResult compute_stats(std::vector<int64_t>& latencies_ns) {
    BenchResult r;
    r.total_ops = latencies_ns.size();

    if (latencies_ns.empty()) return r;

    std::sort(latencies_ns.begin(), latencies_ns.end());

    auto total_ns = std::accumulate(latencies_ns.begin(), latencies_ns.end(), int64_t{0});
    r.elapsed_sec = static_cast<double>(total_ns) / 1e9;
    r.ops_per_sec = static_cast<double>(r.total_ops) / r.elapsed_sec;
    r.avg_us      = static_cast<double>(total_ns) / static_cast<double>(r.total_ops) / 1000.0;

    auto percentile = [&](double p) -> double {
        auto idx = static_cast<std::size_t>(p * static_cast<double>(latencies_ns.size() - 1));
        return static_cast<double>(latencies_ns[idx]) / 1000.0; // ns → µs
    };

    r.p50_us  = percentile(0.50);
    r.p90_us  = percentile(0.90);
    r.p99_us  = percentile(0.99);
    r.p999_us = percentile(0.999);

    return r;
}

void print_result(const char* label, const BenchResult& r) {
    fprintf(stdout,
        "\n── %s ──\n"
        "  Total ops:    %zu\n"
        "  Elapsed:      %.3f s\n"
        "  Throughput:   %.0f ops/sec\n"
        "  Avg latency:  %.1f µs\n"
        "  p50:          %.1f µs\n"
        "  p90:          %.1f µs\n"
        "  p99:          %.1f µs\n"
        "  p99.9:        %.1f µs\n",
        label, r.total_ops, r.elapsed_sec, r.ops_per_sec,
        r.avg_us, r.p50_us, r.p90_us, r.p99_us, r.p999_us);
}

std::string make_key(std::size_t i) {
    return fmt::format("key{:08}", i);
}

// ── Benchmark runners ────────────────────────────────────────────────────────

// Returns std::nullopt if an operation fails.
std::optional<BenchResult> bench_put(pagekv::Engine& engine, std::size_t ops,
                                     const std::string& value) {
    std::vector<int64_t> latencies;
    latencies.reserve(ops);

    for (std::size_t i = 0; i < ops; ++i) {
        const auto key = make_key(i);
        auto t0 = clock::now();
        auto ec = engine.put(key, value);
        auto t1 = clock::now();
        if (ec) {
            spdlog::error("put {} failed: {}", key, ec.message());
            return std::nullopt;
        }
        latencies.push_back(std::chrono::duration_cast<ns>(t1 - t0).count());

        if ((i + 1) % 1000 == 0) {
            fprintf(stderr, "progress: %zu/%zu\n", i + 1, ops);
        }
    }

    return compute_stats(latencies);
}

std::optional<BenchResult> bench_get(pagekv::Engine& engine, std::size_t ops) {
    std::vector<int64_t> latencies;
    latencies.reserve(ops);

    std::optional<std::string> value;
    for (std::size_t i = 0; i < ops; ++i) {
        const auto key = make_key(i);
        auto t0 = clock::now();
        auto ec = engine.get(key, value);
        auto t1 = clock::now();
        if (ec || !value) {
            spdlog::error("get {} failed: {}", key, ec ? ec.message() : "not found");
            return std::nullopt;
        }
        latencies.push_back(std::chrono::duration_cast<ns>(t1 - t0).count());
    }

    return compute_stats(latencies);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    po::options_description desc("pagekv-bench options");
    desc.add_options()
        ("help,h", "Show this help message and exit")
        ("ops", po::value<std::size_t>()->default_value(10'000), "Number of puts (and gets)")
        ("value-size", po::value<std::size_t>()->default_value(100), "Value size in bytes")
        ("data-dir", po::value<std::string>()->default_value("./pagekv_bench"),
            "Store directory; wiped before the run")
        ("page-size", po::value<uint32_t>()->default_value(pagekv::storage::kDefaultPageSize),
            "Page size in bytes")
        ("keep", po::bool_switch(), "Keep the store directory after the run");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        fprintf(stderr, "Argument error: %s\n", e.what());
        return 1;
    }
    if (vm.count("help")) {
        std::cout << desc << "\n";
        return 0;
    }

    // Suppress engine logs during benchmark.
    pagekv::init_default_logger(spdlog::level::warn);

    const auto ops        = vm["ops"].as<std::size_t>();
    const auto value_size = vm["value-size"].as<std::size_t>();
    const std::filesystem::path dir{vm["data-dir"].as<std::string>()};
    const pagekv::EngineOptions options{vm["page-size"].as<uint32_t>()};

    if (ops == 0) {
        fprintf(stderr, "--ops must be > 0\n");
        return 1;
    }

    fprintf(stdout,
        "pagekv Durability Benchmark\n"
        "===========================\n"
        "Ops:        %zu puts + %zu gets\n"
        "Value size: %zu bytes\n"
        "Page size:  %u bytes\n"
        "Directory:  %s\n",
        ops, ops, value_size, options.page_size, dir.string().c_str());

    std::error_code fs_ec;
    std::filesystem::remove_all(dir, fs_ec);
    if (fs_ec) {
        fprintf(stderr, "cannot clear %s: %s\n", dir.string().c_str(), fs_ec.message().c_str());
        return 1;
    }

    const std::string value(value_size, 'x');
    std::optional<BenchResult> put_result;
    std::optional<BenchResult> get_result;
    {
        pagekv::Engine engine{dir, options};
        if (auto ec = engine.open()) {
            fprintf(stderr, "open failed: %s\n", ec.message().c_str());
            return 1;
        }
        put_result = bench_put(engine, ops, value);
        if (put_result) get_result = bench_get(engine, ops);
    }
    if (!put_result || !get_result) return 1;

    // Time a full recovery of what was just written.
    auto t0 = clock::now();
    pagekv::recovery::RecoveryStats stats;
    if (auto ec = pagekv::recover(dir, options, stats)) {
        fprintf(stderr, "recovery failed: %s\n", ec.message().c_str());
        return 1;
    }
    auto recovery_ms =
        std::chrono::duration_cast<std::chrono::microseconds>(clock::now() - t0).count() / 1000.0;

    print_result("Put (WAL fsync + page fsync)", *put_result);
    print_result("Get (CRC-checked page read)", *get_result);
    fprintf(stdout,
        "\n── Recovery ──\n"
        "  Pages:        %llu\n"
        "  WAL records:  %llu\n"
        "  Elapsed:      %.1f ms\n\n",
        static_cast<unsigned long long>(stats.pages_scanned),
        static_cast<unsigned long long>(stats.records_scanned),
        recovery_ms);

    if (!vm["keep"].as<bool>()) {
        std::filesystem::remove_all(dir, fs_ec);
    }
    return 0;
}
