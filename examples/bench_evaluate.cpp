// Minimal benchmark: evaluate a long series repeatedly and report time
#include <iostream>
#include <vector>
#include <chrono>
#include "../cpp/reservealert_core.h"

static std::vector<int> make(size_t n) {
    std::vector<int> x; x.reserve(n);
    unsigned s = 12345;
    for (size_t i = 0; i < n; ++i) {
        s = 1664525u * s + 1013904223u;
        x.push_back(86 + static_cast<int>((s >> 8) % 15));
    }
    return x;
}

int main() {
    auto series = make(100000);
    reservealert::RuleConfig cfg;
    auto t0 = std::chrono::steady_clock::now();
    size_t alerts = 0;
    for (int i = 0; i < 20; ++i) {
        auto rows = reservealert::evaluate(series, cfg);
        alerts = 0;
        for (const auto& r : rows) if (r.alert != reservealert::AlertLevel::OFF) ++alerts;
    }
    auto t1 = std::chrono::steady_clock::now();
    double ms = std::chrono::duration<double, std::milli>(t1 - t0).count();
    std::cout << "bench_evaluate: 20 runs of " << series.size() << " steps in " << ms
              << " ms, alert rows=" << alerts << "\n";
    return 0;
}
