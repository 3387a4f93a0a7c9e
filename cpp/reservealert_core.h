#pragma once

#include <array>
#include <string>
#include <vector>

namespace reservealert {

// Fixed tolerance applied at every threshold comparison site
constexpr double kEpsilon = 1e-9;
// Decimal digits kept in Row display values
constexpr int kDisplayDecimals = 4;

enum class HoldMode { STREAK_DUAL_HOLD, FLOOR_WINDOW_REMINDER };

enum class Band { CLEAR, CAUTION, CRITICAL };

enum class AlertLevel { OFF, ON, ON_FLOOR };

// Ordered by priority (higher value wins)
enum class Reason { NONE = 0, CAUTION_PERSIST = 1, CRITICAL_PERSIST = 2, DROP_EVENT = 3, FLOOR_LIMIT = 4 };

// Rule set configuration. Defaults are the SpO2 streak/dual-hold rule set:
// good=100, bad=88, thresholds taken from the reserve at SpO2 89/91/92.
struct RuleConfig {
    // Reference points (reserve 1 at good, 0 at bad)
    double good = 100.0;
    double bad = 88.0;

    // Plausible measurement range, raw samples are clamped into it
    int plausibleMin = 50;
    int plausibleMax = 100;

    // Drop > dropThreshold => DROP_EVENT
    double dropThreshold = 0.30;
    // |delta| <= flatThreshold => "flat" annotation only
    double flatThreshold = 0.01;

    // Band bounds (reserve). critical <= caution <= recovery.
    double criticalMax = 23.0 / 144.0;       // reserve at 89
    double cautionMax = 63.0 / 144.0;        // reserve at 91
    double recoveryThreshold = 80.0 / 144.0; // reserve at 92

    // Persistence triggers (exact-hit streak lengths)
    int criticalTriggerLen = 3;
    int cautionTriggerLen = 5;

    // Hold lengths in steps, arming step included
    int criticalHoldLen = 5;
    int cautionHoldLen = 3;

    HoldMode mode = HoldMode::STREAK_DUAL_HOLD;

    // Floor-window/reminder mode
    int floorWindowLen = 0;      // steps the floor alert stays asserted
    int reminderCooldownLen = 0; // 0 disables the reminder
    int dropHoldLen = 0;         // 0 => drop asserts only on its own step

    // Caution persistence controls
    bool cautionRuleEnabled = true;
    bool cautionDuringCritical = false; // false: caution rule suppressed inside critical band
};

// Per-step derived measure
struct Measure {
    double reserve = 0.0;
    bool hasDelta = false;      // false on the first step
    double delta = 0.0;
    double deterioration = 0.0; // max(0, -delta)
    bool flat = false;
};

struct StreakState {
    int critical = 0;
    int caution = 0;
};

// One remaining-steps counter per rule. onLeft/reason mirror the
// highest-priority running hold; lower holds pause underneath it.
struct HoldState {
    int onLeft = 0;             // steps the alert stays asserted
    Reason reason = Reason::NONE;
    int cooldownLeft = 0;       // steps until the floor hold may re-arm
    std::array<int, 5> left {}; // indexed by Reason
};

// One output record per input step
struct Row {
    int index = 0;              // 1-based step (minute)
    int raw = 0;
    double reserve = 0.0;       // rounded for display
    bool hasDelta = false;
    double delta = 0.0;
    double deterioration = 0.0;
    AlertLevel alert = AlertLevel::OFF;
    Reason reason = Reason::NONE;
    std::string note;
};

// Ordered annotation list for one step, joined by the Row Emitter
class Notes {
public:
    void add(const std::string& s) { parts_.push_back(s); }
    std::string join() const;
private:
    std::vector<std::string> parts_;
};

// Tolerance comparisons
inline bool lessOrEqual(double a, double b) { return a <= b + kEpsilon; }
inline bool greaterOrEqual(double a, double b) { return a >= b - kEpsilon; }
inline bool greaterThan(double a, double b) { return a > b + kEpsilon; }
inline bool atFloor(double reserve) { return reserve <= kEpsilon; }

// Normalizer
int clampSample(int raw, const RuleConfig& cfg);
double reserveAt(double sample, const RuleConfig& cfg);
double normalizeReserve(int raw, const RuleConfig& cfg);

// Delta Tracker
Measure computeMeasure(double reserve, bool hasPrev, double prevReserve, double flatThreshold);

// Persistence Tracker
Band classifyBand(double reserve, const RuleConfig& cfg);
bool isRecovered(double reserve, const RuleConfig& cfg);
// Applies reset override or band update; returns the band used
Band updateStreaks(StreakState& streaks, double reserve, const RuleConfig& cfg, Notes& notes);

// Row Emitter
double roundDisplay(double x);
Row emitRow(int index, int raw, const Measure& m, AlertLevel alert, Reason reason, const Notes& notes);

const char* toString(AlertLevel a);
const char* toString(Reason r);
const char* toString(Band b);

// Evaluate a whole series with a fresh engine. One Row per sample, in order.
// Throws std::invalid_argument if the configuration is invalid.
std::vector<Row> evaluate(const std::vector<int>& series, const RuleConfig& cfg = {});

} // namespace reservealert
