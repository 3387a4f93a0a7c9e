// Minimal concurrency smoke: independent engines on separate threads agree with
// a sequential run of the same series
#include <iostream>
#include <thread>
#include <vector>
#include "../cpp/reservealert_core.h"
#include "../cpp/reservealert_config.h"

static std::vector<int> make_series(size_t n, unsigned seed) {
    std::vector<int> x; x.reserve(n);
    unsigned s = seed;
    auto rnd = [&](){ s = 1664525u * s + 1013904223u; return (s >> 8) & 0xFFFFFF; };
    int v = 95;
    for (size_t i = 0; i < n; ++i) {
        v += static_cast<int>(rnd() % 5) - 2; // random walk, mostly inside 85..100
        if (v < 84) v = 84;
        if (v > 100) v = 100;
        x.push_back(v);
    }
    return x;
}

static bool same(const std::vector<reservealert::Row>& a, const std::vector<reservealert::Row>& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (a[i].index != b[i].index || a[i].raw != b[i].raw || a[i].reserve != b[i].reserve ||
            a[i].hasDelta != b[i].hasDelta || a[i].delta != b[i].delta ||
            a[i].deterioration != b[i].deterioration || a[i].alert != b[i].alert ||
            a[i].reason != b[i].reason || a[i].note != b[i].note) return false;
    }
    return true;
}

int main() {
    const int kThreads = 4;
    reservealert::RuleConfig streak;
    reservealert::RuleConfig window;
    reservealert::applyPresetFloorWindow(window);

    std::vector<std::vector<int>> series;
    std::vector<std::vector<reservealert::Row>> expected;
    for (int t = 0; t < kThreads; ++t) {
        series.push_back(make_series(5000, 1234567u + t));
        expected.push_back(reservealert::evaluate(series.back(), (t % 2) ? window : streak));
    }

    std::vector<std::vector<reservealert::Row>> got(kThreads);
    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([&, t]{
            got[t] = reservealert::evaluate(series[t], (t % 2) ? window : streak);
        });
    }
    for (auto& w : workers) w.join();

    bool ok = true;
    for (int t = 0; t < kThreads; ++t) {
        bool match = same(expected[t], got[t]);
        std::cout << (match ? "OK" : "FAIL") << ": thread " << t << " rows=" << got[t].size() << "\n";
        ok = ok && match;
    }
    return ok ? 0 : 1;
}
