// Configuration validation: stable error codes, construction-time rejection, C bridge
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include "../cpp/reservealert_config.h"
#include "../cpp/reservealert_engine.h"
#include "test_require.h"

using reservealert::HoldMode;
using reservealert::RuleConfig;

static std::string codeOf(const RuleConfig& cfg) {
    const char* code = nullptr;
    std::string msg;
    if (ra_validate_config(cfg, &code, &msg)) return "OK";
    REQUIRE(!msg.empty(), "message set on failure");
    return code;
}

int main() {
    REQUIRE(codeOf(RuleConfig{}) == "OK", "defaults are valid");
    {
        RuleConfig c;
        reservealert::applyPresetFloorWindow(c);
        REQUIRE(codeOf(c) == "OK", "floor-window preset is valid");
    }
    { RuleConfig c; c.good = 88; c.bad = 100; REQUIRE(codeOf(c) == "RESERVEALERT_E001", "good <= bad"); }
    { RuleConfig c; c.bad = std::numeric_limits<double>::infinity(); REQUIRE(codeOf(c) == "RESERVEALERT_E001", "inf reference"); }
    { RuleConfig c; c.plausibleMin = 101; REQUIRE(codeOf(c) == "RESERVEALERT_E002", "inverted plausible range"); }
    { RuleConfig c; c.criticalMax = 0.5; REQUIRE(codeOf(c) == "RESERVEALERT_E011", "critical above caution"); }
    { RuleConfig c; c.criticalMax = -0.1; REQUIRE(codeOf(c) == "RESERVEALERT_E011", "negative critical"); }
    { RuleConfig c; c.recoveryThreshold = 0.4; REQUIRE(codeOf(c) == "RESERVEALERT_E012", "recovery below caution"); }
    { RuleConfig c; c.recoveryThreshold = 1.5; REQUIRE(codeOf(c) == "RESERVEALERT_E012", "recovery above 1"); }
    { RuleConfig c; c.criticalTriggerLen = 0; REQUIRE(codeOf(c) == "RESERVEALERT_E013", "zero trigger"); }
    { RuleConfig c; c.cautionHoldLen = -1; REQUIRE(codeOf(c) == "RESERVEALERT_E014", "negative hold"); }
    {
        RuleConfig c;
        c.dropThreshold = std::numeric_limits<double>::quiet_NaN();
        REQUIRE(codeOf(c) == "RESERVEALERT_E015", "NaN drop threshold");
    }
    { RuleConfig c; c.mode = HoldMode::FLOOR_WINDOW_REMINDER; REQUIRE(codeOf(c) == "RESERVEALERT_E016", "missing floor window"); }
    { RuleConfig c; c.reminderCooldownLen = -2; REQUIRE(codeOf(c) == "RESERVEALERT_E016", "negative cooldown"); }
    {
        // boundaries that are allowed
        RuleConfig c;
        c.criticalMax = c.cautionMax;
        c.recoveryThreshold = c.cautionMax;
        REQUIRE(codeOf(c) == "OK", "equal bounds accepted");
    }

    // Rejected before any sample is processed
    {
        RuleConfig bad;
        bad.criticalTriggerLen = 0;
        bool threw = false;
        try {
            reservealert::AlertEngine engine(bad);
        } catch (const std::invalid_argument& e) {
            threw = (std::string(e.what()).rfind("RESERVEALERT_E013: ", 0) == 0);
        }
        REQUIRE(threw, "engine constructor throws with the error code");

        threw = false;
        try {
            (void)reservealert::evaluate({}, bad);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        REQUIRE(threw, "evaluate rejects the configuration even for an empty series");
    }

    // C bridge
    {
        RuleConfig bad;
        bad.good = 0;
        REQUIRE(ra_engine_create(&bad) == nullptr, "invalid config yields no handle");

        void* h = ra_engine_create(nullptr);
        REQUIRE(h != nullptr, "default handle");
        reservealert::Row row;
        REQUIRE(ra_engine_step(h, 88, &row) == 1, "step through the bridge");
        REQUIRE(row.alert == reservealert::AlertLevel::ON_FLOOR, "floor through the bridge");
        REQUIRE(ra_engine_step(h, 89, nullptr) == 0, "null output rejected");
        ra_engine_reset(h);
        REQUIRE(ra_engine_step(h, 89, &row) == 1 && row.index == 1, "reset through the bridge");
        ra_engine_destroy(h);
        REQUIRE(ra_engine_step(nullptr, 89, &row) == 0, "null handle rejected");
    }

    std::cout << "OK: validate_config\n";
    return 0;
}
