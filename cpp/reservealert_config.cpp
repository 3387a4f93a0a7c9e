#include "reservealert_config.h"
#include <cmath>
#include <stdexcept>

static inline bool isFinite(double x) {
    return std::isfinite(x) != 0;
}

static inline bool fail(const char* code, const char* msg, const char** err_code, std::string* err_msg) {
    if (err_code) *err_code = code;
    if (err_msg) *err_msg = msg;
    return false;
}

extern "C" bool ra_validate_config(const reservealert::RuleConfig& cfg,
                                   const char** err_code,
                                   std::string* err_msg) {
    using reservealert::HoldMode;

    // reference points: good > bad
    if (!isFinite(cfg.good) || !isFinite(cfg.bad) || !(cfg.good > cfg.bad)) {
        return fail("RESERVEALERT_E001", "Invalid reference points (good>bad)", err_code, err_msg);
    }

    if (cfg.plausibleMin > cfg.plausibleMax) {
        return fail("RESERVEALERT_E002", "Invalid plausible range (min<=max)", err_code, err_msg);
    }

    // bands: 0 <= critical <= caution <= 1
    if (!isFinite(cfg.criticalMax) || !isFinite(cfg.cautionMax) || cfg.criticalMax < 0.0 ||
        cfg.cautionMax > 1.0 || cfg.criticalMax > cfg.cautionMax) {
        return fail("RESERVEALERT_E011", "Invalid band thresholds (0<=critical<=caution<=1)", err_code, err_msg);
    }

    // recovery: caution <= recovery <= 1, and above the floor
    if (!isFinite(cfg.recoveryThreshold) || cfg.recoveryThreshold <= 0.0 || cfg.recoveryThreshold > 1.0 ||
        cfg.recoveryThreshold < cfg.cautionMax) {
        return fail("RESERVEALERT_E012", "Invalid recovery threshold (caution<=recovery<=1)", err_code, err_msg);
    }

    if (cfg.criticalTriggerLen <= 0 || cfg.cautionTriggerLen <= 0) {
        return fail("RESERVEALERT_E013", "Invalid trigger length (>0)", err_code, err_msg);
    }

    if (cfg.criticalHoldLen <= 0 || cfg.cautionHoldLen <= 0) {
        return fail("RESERVEALERT_E014", "Invalid hold length (>0)", err_code, err_msg);
    }

    if (!isFinite(cfg.dropThreshold) || !isFinite(cfg.flatThreshold) || cfg.dropThreshold < 0.0 ||
        cfg.flatThreshold < 0.0) {
        return fail("RESERVEALERT_E015", "Invalid drop/flat threshold (>=0)", err_code, err_msg);
    }

    if (cfg.floorWindowLen < 0 || cfg.reminderCooldownLen < 0 || cfg.dropHoldLen < 0 ||
        (cfg.mode == HoldMode::FLOOR_WINDOW_REMINDER && cfg.floorWindowLen <= 0)) {
        return fail("RESERVEALERT_E016", "Invalid window length (floor window>0 in floor-window mode)", err_code, err_msg);
    }

    return true;
}

namespace reservealert {

void requireValidConfig(const RuleConfig& cfg) {
    const char* code = nullptr;
    std::string msg;
    if (!ra_validate_config(cfg, &code, &msg)) {
        throw std::invalid_argument(std::string(code) + ": " + msg);
    }
}

void applyPresetFloorWindow(RuleConfig& cfg) {
    cfg.mode = HoldMode::FLOOR_WINDOW_REMINDER;
    cfg.floorWindowLen = 3;
    cfg.reminderCooldownLen = 5;
    cfg.dropHoldLen = 2;
    cfg.cautionRuleEnabled = false;
}

} // namespace reservealert
