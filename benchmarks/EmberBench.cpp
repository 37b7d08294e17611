#include <chrono>
#include <functional>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include "../tests/TestHelpers.hpp"

struct BenchmarkResult {
    std::string name;
    size_t operations;
    double duration_ms;
};

// Times `body(i)` for i in [0, iterations); each call counts `ops_per_call`.
BenchmarkResult measure(const std::string& name, size_t iterations, size_t ops_per_call,
                        const std::function<void(size_t)>& body) {
    auto start = std::chrono::steady_clock::now();
    for (size_t i = 0; i < iterations; ++i)
        body(i);
    auto end = std::chrono::steady_clock::now();

    double duration_ms = std::chrono::duration<double, std::milli>(end - start).count();
    return {name, iterations * ops_per_call, duration_ms};
}

BenchmarkResult benchSetGet(size_t iterations) {
    TestServer srv;
    return measure("SET+GET round-trip", iterations, 2, [&](size_t i) {
        std::string key = "key:" + std::to_string(i);
        srv.run({"SET", key, "value:" + std::to_string(i)});
        srv.run({"GET", key});
    });
}

BenchmarkResult benchIncr(size_t iterations) {
    TestServer srv;
    return measure("INCR", iterations, 1, [&](size_t) {
        srv.run({"INCR", "counter"});
    });
}

BenchmarkResult benchStreamXadd(size_t iterations) {
    TestServer srv;
    return measure("Stream XADD", iterations, 1, [&](size_t i) {
        srv.run({"XADD", "telemetry", "*", "sensor", "reading:" + std::to_string(i)});
    });
}

BenchmarkResult benchExec(size_t iterations) {
    TestServer srv;
    return measure("MULTI/3xINCR/EXEC", iterations, 5, [&](size_t) {
        srv.run({"MULTI"});
        srv.run({"INCR", "a"});
        srv.run({"INCR", "b"});
        srv.run({"INCR", "c"});
        srv.run({"EXEC"});
    });
}

BenchmarkResult benchPropagation(size_t iterations) {
    TestServer srv;
    srv.run({"REPLCONF", "listening-port", "6380"}, 9);
    srv.run({"PSYNC", "?", "-1"}, 9);

    return measure("SET with one replica", iterations, 1, [&](size_t i) {
        srv.run({"SET", "key:" + std::to_string(i), "v"});
        srv.pending();
    });
}

int main() {
    const size_t iterations = 5000;
    std::vector<BenchmarkResult> results;
    results.push_back(benchSetGet(iterations));
    results.push_back(benchIncr(iterations));
    results.push_back(benchStreamXadd(iterations));
    results.push_back(benchExec(iterations));
    results.push_back(benchPropagation(iterations));

    std::cout << "emberkv micro-benchmarks (" << iterations << " iterations)" << std::endl;
    std::cout << "------------------------------------------------------------" << std::endl;
    std::cout << std::left << std::setw(30) << "Benchmark"
              << std::right << std::setw(18) << "Throughput"
              << std::setw(20) << "Duration (ms)" << std::endl;

    for (const auto& res : results) {
        double ops_per_sec = res.operations / (res.duration_ms / 1000.0);
        std::cout << std::left << std::setw(30) << res.name
                  << std::right << std::setw(12) << std::fixed << std::setprecision(2)
                  << ops_per_sec << " ops/s"
                  << std::setw(18) << std::setprecision(3) << res.duration_ms
                  << std::endl;
    }

    return 0;
}
