// Simple smoke test: reference series produce the expected alert stream
#include <iostream>
#include <vector>
#include <cmath>
#include "../cpp/reservealert_core.h"

using reservealert::AlertLevel;
using reservealert::Reason;

static bool check(bool cond, const char* what) {
    std::cout << (cond ? "OK" : "FAIL") << ": " << what << "\n";
    return cond;
}

int main() {
    reservealert::RuleConfig cfg;
    bool ok = true;

    // Floor in the middle of a desaturation
    {
        auto rows = reservealert::evaluate({93, 91, 90, 89, 88, 89, 89, 91, 92}, cfg);
        ok &= check(rows.size() == 9, "one row per sample");
        ok &= check(rows[4].reserve == 0.0 && rows[4].alert == AlertLevel::ON_FLOOR &&
                    rows[4].reason == Reason::FLOOR_LIMIT, "step 5 is ON*/FLOOR_LIMIT");
        ok &= check(rows[5].note.find("counting critical persistence (1/3)") != std::string::npos,
                    "step 6 starts a fresh critical streak");
        bool quiet = true;
        for (size_t i = 5; i < rows.size(); ++i) quiet = quiet && (rows[i].alert == AlertLevel::OFF);
        ok &= check(quiet, "no alert after the floor step");
    }

    // Deterioration at step 4 is computed and compared against the drop threshold
    {
        auto rows = reservealert::evaluate({92, 91, 90, 89}, cfg);
        ok &= check(!rows[0].hasDelta && rows[3].hasDelta, "delta absent only on the first step");
        ok &= check(std::fabs(rows[3].deterioration - 0.1458) < 1e-9, "step 4 deterioration 0.1458");
        ok &= check(rows[3].alert == AlertLevel::OFF && rows[3].reason == Reason::NONE,
                    "step 4 below drop threshold stays OFF");
    }

    // Five steps exactly on the caution bound trigger caution persistence once
    {
        auto rows = reservealert::evaluate({91, 91, 91, 91, 91}, cfg);
        int triggers = 0;
        for (const auto& r : rows) if (r.note.find("hold armed") != std::string::npos) ++triggers;
        ok &= check(triggers == 1 && rows[4].alert == AlertLevel::ON &&
                    rows[4].reason == Reason::CAUTION_PERSIST, "caution persistence fires at step 5");
        ok &= check(rows[3].alert == AlertLevel::OFF, "nothing before step 5");
    }

    std::cout << (ok ? "OK" : "FAIL") << ": smoke_test\n";
    return ok ? 0 : 1;
}
