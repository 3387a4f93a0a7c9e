#include "reservealert_core.h"
#include "reservealert_engine.h"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace reservealert {

namespace {

inline double clamp(double v, double lo, double hi) {
    return std::max(lo, std::min(hi, v));
}

} // namespace

std::string Notes::join() const {
    std::ostringstream os;
    for (size_t i = 0; i < parts_.size(); ++i) {
        if (i) os << "; ";
        os << parts_[i];
    }
    return os.str();
}

int clampSample(int raw, const RuleConfig& cfg) {
    return std::max(cfg.plausibleMin, std::min(cfg.plausibleMax, raw));
}

// t = clip((good - x)/(good - bad), 0, 1), reserve = 1 - t^2
double reserveAt(double sample, const RuleConfig& cfg) {
    const double t = clamp((cfg.good - sample) / (cfg.good - cfg.bad), 0.0, 1.0);
    return 1.0 - t * t;
}

double normalizeReserve(int raw, const RuleConfig& cfg) {
    return reserveAt(static_cast<double>(clampSample(raw, cfg)), cfg);
}

Measure computeMeasure(double reserve, bool hasPrev, double prevReserve, double flatThreshold) {
    Measure m;
    m.reserve = reserve;
    if (!hasPrev) return m;
    m.hasDelta = true;
    m.delta = reserve - prevReserve;
    m.deterioration = std::max(0.0, -m.delta);
    m.flat = lessOrEqual(std::fabs(m.delta), flatThreshold);
    return m;
}

Band classifyBand(double reserve, const RuleConfig& cfg) {
    if (lessOrEqual(reserve, cfg.criticalMax)) return Band::CRITICAL;
    if (lessOrEqual(reserve, cfg.cautionMax)) return Band::CAUTION;
    return Band::CLEAR;
}

bool isRecovered(double reserve, const RuleConfig& cfg) {
    return greaterOrEqual(reserve, cfg.recoveryThreshold);
}

Band updateStreaks(StreakState& streaks, double reserve, const RuleConfig& cfg, Notes& notes) {
    const Band band = classifyBand(reserve, cfg);
    if (isRecovered(reserve, cfg)) {
        streaks = StreakState{};
        notes.add("reset (reserve>=recovery)");
        return band;
    }
    if (atFloor(reserve)) {
        streaks = StreakState{};
        notes.add("reset (floor)");
        return band;
    }
    switch (band) {
        case Band::CRITICAL:
            ++streaks.critical;
            ++streaks.caution;
            if (streaks.critical < cfg.criticalTriggerLen) {
                notes.add("counting critical persistence (" + std::to_string(streaks.critical) + "/" +
                          std::to_string(cfg.criticalTriggerLen) + ")");
            }
            break;
        case Band::CAUTION:
            streaks.critical = 0;
            ++streaks.caution;
            if (streaks.caution < cfg.cautionTriggerLen) {
                notes.add("counting caution persistence (" + std::to_string(streaks.caution) + "/" +
                          std::to_string(cfg.cautionTriggerLen) + ")");
            }
            break;
        case Band::CLEAR:
            streaks = StreakState{};
            break;
    }
    return band;
}

double roundDisplay(double x) {
    const double scale = std::pow(10.0, kDisplayDecimals);
    double r = std::round(x * scale) / scale;
    return (r == 0.0) ? 0.0 : r; // no "-0"
}

Row emitRow(int index, int raw, const Measure& m, AlertLevel alert, Reason reason, const Notes& notes) {
    Row row;
    row.index = index;
    row.raw = raw;
    row.reserve = roundDisplay(m.reserve);
    row.hasDelta = m.hasDelta;
    if (m.hasDelta) {
        row.delta = roundDisplay(m.delta);
        row.deterioration = roundDisplay(m.deterioration);
    }
    row.alert = alert;
    row.reason = reason;
    row.note = notes.join();
    return row;
}

const char* toString(AlertLevel a) {
    switch (a) {
        case AlertLevel::ON: return "ON";
        case AlertLevel::ON_FLOOR: return "ON*";
        case AlertLevel::OFF: break;
    }
    return "OFF";
}

const char* toString(Reason r) {
    switch (r) {
        case Reason::FLOOR_LIMIT: return "FLOOR_LIMIT";
        case Reason::DROP_EVENT: return "DROP_EVENT";
        case Reason::CRITICAL_PERSIST: return "CRITICAL_PERSIST";
        case Reason::CAUTION_PERSIST: return "CAUTION_PERSIST";
        case Reason::NONE: break;
    }
    return "NO_TRIGGER";
}

const char* toString(Band b) {
    switch (b) {
        case Band::CRITICAL: return "critical";
        case Band::CAUTION: return "caution";
        case Band::CLEAR: break;
    }
    return "clear";
}

std::vector<Row> evaluate(const std::vector<int>& series, const RuleConfig& cfg) {
    AlertEngine engine(cfg);
    std::vector<Row> rows;
    engine.push(series, rows);
    return rows;
}

} // namespace reservealert
