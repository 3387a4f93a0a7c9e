// Minimal example: evaluate a short SpO2 series and print the alert stream
#include <iostream>
#include <vector>
#include "../cpp/reservealert_core.h"

int main() {
    std::vector<int> spo2 = {93, 91, 90, 89, 88, 89, 89, 91, 92, 89, 90, 91, 92, 91, 89, 90};
    auto rows = reservealert::evaluate(spo2, reservealert::RuleConfig{});
    for (const auto& r : rows) {
        std::cout << r.index << " " << r.raw << " " << r.reserve << " "
                  << reservealert::toString(r.alert) << " " << reservealert::toString(r.reason) << "\n";
    }
    return 0;
}
