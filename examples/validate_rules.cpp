// Rule-by-rule validation of the alert engine
#include <iostream>
#include <string>
#include <vector>
#include "../cpp/reservealert_core.h"
#include "../cpp/reservealert_config.h"
#include "../cpp/reservealert_engine.h"
#include "test_require.h"

using namespace reservealert;

namespace {

bool hasNote(const Row& r, const char* text) {
    return r.note.find(text) != std::string::npos;
}

void requireAlerts(const std::vector<Row>& rows, const std::vector<AlertLevel>& alerts,
                   const std::vector<Reason>& reasons, const char* name) {
    REQUIRE(rows.size() == alerts.size() && rows.size() == reasons.size(), name << ": row count");
    for (size_t i = 0; i < rows.size(); ++i) {
        REQUIRE(rows[i].alert == alerts[i], name << ": alert at step " << (i + 1) << " was "
                << toString(rows[i].alert) << " expected " << toString(alerts[i]));
        REQUIRE(rows[i].reason == reasons[i], name << ": reason at step " << (i + 1) << " was "
                << toString(rows[i].reason) << " expected " << toString(reasons[i]));
    }
}

const AlertLevel OFF = AlertLevel::OFF;
const AlertLevel ON = AlertLevel::ON;
const AlertLevel ONF = AlertLevel::ON_FLOOR;
const Reason NONE = Reason::NONE;
const Reason FLOOR = Reason::FLOOR_LIMIT;
const Reason DROP = Reason::DROP_EVENT;
const Reason CRIT = Reason::CRITICAL_PERSIST;
const Reason CAUT = Reason::CAUTION_PERSIST;

void testNormalizer() {
    RuleConfig cfg;
    REQUIRE(normalizeReserve(88, cfg) == 0.0, "bad maps to 0");
    REQUIRE(normalizeReserve(70, cfg) == 0.0, "below bad saturates at 0");
    REQUIRE(normalizeReserve(10, cfg) == 0.0, "below plausible range clamps and saturates");
    REQUIRE(normalizeReserve(100, cfg) == 1.0, "good maps to 1");
    REQUIRE(normalizeReserve(250, cfg) == 1.0, "above plausible range clamps to good");
    RuleConfig wide;
    wide.plausibleMax = 110;
    REQUIRE(normalizeReserve(105, wide) == 1.0, "above good saturates at 1");

    double prev = -1.0;
    for (int raw = 40; raw <= 110; ++raw) {
        double e = normalizeReserve(raw, cfg);
        REQUIRE(e >= 0.0 && e <= 1.0, "reserve in [0,1] at raw " << raw);
        REQUIRE(e >= prev, "reserve non-decreasing with raw at " << raw);
        prev = e;
    }
    REQUIRE_NEAR(normalizeReserve(89, cfg), cfg.criticalMax, 1e-12, "critical bound is reserve at 89");
    REQUIRE_NEAR(normalizeReserve(91, cfg), cfg.cautionMax, 1e-12, "caution bound is reserve at 91");
    REQUIRE_NEAR(reserveAt(92.0, cfg), cfg.recoveryThreshold, 1e-12, "recovery is reserve at 92");
    REQUIRE(clampSample(49, cfg) == 50 && clampSample(101, cfg) == 100, "plausible clamp");
}

void testDelta() {
    Measure first = computeMeasure(0.5, false, 0.0, 0.01);
    REQUIRE(!first.hasDelta && first.delta == 0.0 && first.deterioration == 0.0, "first step has no delta");

    Measure down = computeMeasure(0.4, true, 0.5, 0.01);
    REQUIRE(down.hasDelta, "delta present");
    REQUIRE_NEAR(down.delta, -0.1, 1e-12, "delta");
    REQUIRE_NEAR(down.deterioration, 0.1, 1e-12, "deterioration");
    REQUIRE(!down.flat, "not flat");

    Measure up = computeMeasure(0.6, true, 0.5, 0.01);
    REQUIRE(up.deterioration == 0.0, "rise has no deterioration");

    Measure flat = computeMeasure(0.5, true, 0.49, 0.01);
    REQUIRE(flat.flat, "|delta| == flat threshold is flat");
}

void testStreaks() {
    RuleConfig cfg;
    AlertEngine engine(cfg);
    const int series[] = {91, 91, 89, 89, 91, 93, 89};
    const int critical[] = {0, 0, 1, 2, 0, 0, 1};
    const int caution[] = {1, 2, 3, 4, 5, 0, 1};
    for (int i = 0; i < 7; ++i) {
        engine.step(series[i]);
        REQUIRE(engine.streaks().critical == critical[i], "critical streak at step " << (i + 1));
        REQUIRE(engine.streaks().caution == caution[i], "caution streak at step " << (i + 1));
    }

    Notes notes;
    StreakState s;
    s.critical = 2;
    s.caution = 4;
    REQUIRE(updateStreaks(s, 0.0, cfg, notes) == Band::CRITICAL, "floor is inside the critical band");
    REQUIRE(s.critical == 0 && s.caution == 0 && notes.join() == "reset (floor)", "floor resets streaks");

    // recovery equal to the caution bound: override wins over band membership
    RuleConfig tight;
    tight.recoveryThreshold = tight.cautionMax;
    StreakState t;
    Notes n2;
    updateStreaks(t, tight.cautionMax, tight, n2);
    REQUIRE(t.caution == 0, "recovery override skips the band update");
}

void testCautionPersistence() {
    auto rows = evaluate({91, 91, 91, 91, 91, 91, 91, 91, 91}, RuleConfig{});
    requireAlerts(rows, {OFF, OFF, OFF, OFF, ON, ON, ON, OFF, OFF},
                  {NONE, NONE, NONE, NONE, CAUT, CAUT, CAUT, NONE, NONE}, "caution hold");
    REQUIRE(hasNote(rows[4], "hold armed (3 min)"), "caution arms its hold");
    REQUIRE(hasNote(rows[5], "holding ON (2 min left)"), "hold countdown reported");
    REQUIRE(hasNote(rows[6], "hold completed"), "hold completes after its length");
    REQUIRE(hasNote(rows[3], "counting caution persistence (4/5)"), "counting note");
}

void testCriticalPersistence() {
    auto rows = evaluate({89, 89, 89, 89, 89, 89, 89, 89, 89, 89}, RuleConfig{});
    requireAlerts(rows, {OFF, OFF, ON, ON, ON, ON, ON, OFF, OFF, OFF},
                  {NONE, NONE, CRIT, CRIT, CRIT, CRIT, CRIT, NONE, NONE, NONE}, "critical hold");
    int armed = 0;
    for (const auto& r : rows) if (hasNote(r, "hold armed")) ++armed;
    REQUIRE(armed == 1, "exact-hit trigger never re-fires while the streak climbs");
}

void testCautionDuringCritical() {
    RuleConfig cfg;
    cfg.cautionDuringCritical = true;
    auto rows = evaluate({89, 89, 89, 89, 89, 89, 89, 89, 89, 89, 89}, cfg);
    // caution fires at step 5 under the running critical hold; each hold only
    // counts down on its own steps, so the caution hold finishes afterwards
    requireAlerts(rows, {OFF, OFF, ON, ON, ON, ON, ON, ON, ON, ON, OFF},
                  {NONE, NONE, CRIT, CRIT, CAUT, CRIT, CRIT, CRIT, CAUT, CAUT, NONE}, "caution during critical");
    REQUIRE(hasNote(rows[4], "hold armed (3 min)"), "lower-priority hold armed");
    REQUIRE(hasNote(rows[7], "hold completed") && !hasNote(rows[7], "next OFF"), "critical hold done, caution pending");
    REQUIRE(hasNote(rows[8], "holding ON (2 min left)"), "caution hold resumes");

    RuleConfig off;
    off.cautionRuleEnabled = false;
    auto quiet = evaluate({91, 91, 91, 91, 91, 91}, off);
    for (const auto& r : quiet) REQUIRE(r.alert == OFF, "caution rule disabled");
}

void testEarlyCancel() {
    auto rows = evaluate({89, 89, 89, 91, 91}, RuleConfig{});
    requireAlerts(rows, {OFF, OFF, ON, OFF, ON}, {NONE, NONE, CRIT, NONE, CAUT}, "leave critical band");
    REQUIRE(hasNote(rows[3], "hold ended early (left critical band)"), "critical hold cancelled");

    RuleConfig cfg;
    cfg.recoveryThreshold = 0.9; // clear band below recovery
    auto rows2 = evaluate({91, 91, 91, 91, 91, 93, 91}, cfg);
    requireAlerts(rows2, {OFF, OFF, OFF, OFF, ON, OFF, OFF},
                  {NONE, NONE, NONE, NONE, CAUT, NONE, NONE}, "leave caution band");
    REQUIRE(hasNote(rows2[5], "hold ended early (left caution band)"), "caution hold cancelled");
    REQUIRE(!hasNote(rows2[5], "reset"), "band exit is not a recovery");
}

void testRecovery() {
    AlertEngine engine(RuleConfig{});
    for (int i = 0; i < 5; ++i) engine.step(91);
    REQUIRE(engine.hold().onLeft == 2, "caution hold running");
    Row r = engine.step(93);
    REQUIRE(r.alert == OFF && r.reason == NONE, "recovery step is OFF right after a hold");
    REQUIRE(hasNote(r, "hold cancelled (reserve>=recovery)") && hasNote(r, "reset (reserve>=recovery)"),
            "recovery annotated");
    REQUIRE(engine.hold().onLeft == 0 && engine.hold().reason == NONE, "hold cleared");
    REQUIRE(engine.streaks().critical == 0 && engine.streaks().caution == 0, "streaks cleared");

    // a drop on the recovery step still fires
    auto rows = evaluate({100, 92}, RuleConfig{});
    requireAlerts(rows, {OFF, ON}, {NONE, DROP}, "drop on recovery step");
}

void testFloor() {
    AlertEngine engine(RuleConfig{});
    engine.step(89);
    engine.step(89);
    Row crit = engine.step(89);
    REQUIRE(crit.reason == CRIT, "critical fired");
    Row floor = engine.step(88);
    REQUIRE(floor.alert == ONF && floor.reason == FLOOR, "floor overrides a running hold");
    REQUIRE(hasNote(floor, "hold cleared (floor)"), "floor clears timers");
    REQUIRE(engine.hold().onLeft == 0, "hold state cleared");
    Row after = engine.step(89);
    REQUIRE(after.alert == OFF, "no stale hold after the floor");
    REQUIRE(engine.streaks().critical == 1, "fresh streak after the floor");

    // floor outranks a simultaneous drop
    auto rows = evaluate({100, 88}, RuleConfig{});
    requireAlerts(rows, {OFF, ONF}, {NONE, FLOOR}, "floor beats drop");
    REQUIRE(rows[1].deterioration == 1.0, "drop still reported");
}

void testDrop() {
    auto rows = evaluate({92, 89, 94, 91}, RuleConfig{});
    requireAlerts(rows, {OFF, ON, OFF, ON}, {NONE, DROP, NONE, DROP}, "drop events");
    REQUIRE_NEAR(rows[1].deterioration, 0.3958, 1e-9, "displayed deterioration");

    // 91 -> 89 deteriorates by exactly 40/144
    RuleConfig edge;
    edge.dropThreshold = 40.0 / 144.0;
    auto equal = evaluate({91, 89}, edge);
    requireAlerts(equal, {OFF, OFF}, {NONE, NONE}, "drop equal to threshold");
    edge.dropThreshold = 40.0 / 144.0 - 0.5 * kEpsilon;
    auto within = evaluate({91, 89}, edge);
    requireAlerts(within, {OFF, OFF}, {NONE, NONE}, "drop within tolerance");
    edge.dropThreshold = 40.0 / 144.0 - 2.0 * kEpsilon;
    auto above = evaluate({91, 89}, edge);
    requireAlerts(above, {OFF, ON}, {NONE, DROP}, "drop just above threshold");

    RuleConfig cfg;
    cfg.dropHoldLen = 2;
    auto held = evaluate({100, 89, 89, 89, 89}, cfg);
    requireAlerts(held, {OFF, ON, ON, ON, ON}, {NONE, DROP, DROP, CRIT, CRIT}, "windowed drop");
    REQUIRE(hasNote(held[2], "holding ON (1 min left)"), "drop window countdown");

    // critical hold armed while the drop window still runs
    cfg.dropHoldLen = 3;
    auto overlap = evaluate({100, 89, 89, 89, 89, 89, 89, 89, 89, 89}, cfg);
    requireAlerts(overlap, {OFF, ON, ON, ON, ON, ON, ON, ON, ON, OFF},
                  {NONE, DROP, DROP, CRIT, DROP, CRIT, CRIT, CRIT, CRIT, NONE}, "critical under drop window");
    REQUIRE(hasNote(overlap[3], "hold armed (5 min)"), "critical hold armed under the drop window");
    REQUIRE(hasNote(overlap[4], "hold completed") && !hasNote(overlap[4], "next OFF"), "drop window ends first");
    REQUIRE(hasNote(overlap[5], "holding ON (4 min left)"), "critical hold resumes");
    REQUIRE(hasNote(overlap[8], "hold completed -> next OFF unless retrigger"), "critical hold ends");
}

void testFloorWindowReminder() {
    RuleConfig cfg;
    applyPresetFloorWindow(cfg);
    AlertEngine engine(cfg);
    std::vector<Row> rows;
    engine.push({89, 88, 88, 88, 88, 89, 89, 89, 89, 89, 93}, rows);
    requireAlerts(rows, {OFF, ONF, ONF, ONF, OFF, OFF, OFF, ON, ONF, ONF, OFF},
                  {NONE, FLOOR, FLOOR, FLOOR, NONE, NONE, NONE, CRIT, FLOOR, FLOOR, NONE}, "floor window");
    REQUIRE(hasNote(rows[3], "reminder armed (5 min)"), "cooldown armed when the window expires");
    REQUIRE(hasNote(rows[4], "floor reminder in 4 min"), "floor suppressed during cooldown");
    REQUIRE(hasNote(rows[8], "reminder re-armed"), "reminder re-arms the floor window");
    REQUIRE(hasNote(rows[10], "hold cancelled (reserve>=recovery)"), "recovery cancels the window");
    REQUIRE(engine.hold().cooldownLeft == 0 && engine.hold().onLeft == 0, "timers cleared");

    auto cancelled = evaluate({88, 88, 88, 90, 88}, cfg);
    requireAlerts(cancelled, {ONF, ONF, ONF, OFF, ONF}, {FLOOR, FLOOR, FLOOR, NONE, FLOOR}, "cooldown cancel");
    REQUIRE(hasNote(cancelled[3], "reminder cancelled (left critical band)"), "band exit cancels cooldown");

    auto noCaution = evaluate({91, 91, 91, 91, 91, 91}, cfg);
    for (const auto& r : noCaution) REQUIRE(r.alert == OFF, "preset drops the caution rule");
}

void testRows() {
    auto rows = evaluate({93, 89}, RuleConfig{});
    REQUIRE(rows[0].index == 1 && rows[1].index == 2, "1-based indices");
    REQUIRE(rows[0].raw == 93, "raw sample kept");
    REQUIRE(rows[0].note == "first sample; reset (reserve>=recovery)", "notes in production order");
    REQUIRE(rows[1].reserve == 0.1597, "reserve rounded to 4 decimals");
    REQUIRE(roundDisplay(-0.00001) == 0.0, "no negative zero");
    REQUIRE(std::string(toString(ONF)) == "ON*" && std::string(toString(NONE)) == "NO_TRIGGER", "codes");
    REQUIRE(std::string(toString(classifyBand(0.1597, RuleConfig{}))) == "critical", "band name");

    auto flat = evaluate({89, 89}, RuleConfig{});
    REQUIRE(hasNote(flat[1], "flat"), "flat annotation");
    REQUIRE(flat[1].delta == 0.0 && flat[1].deterioration == 0.0, "zero delta");
}

void testEngineLifecycle() {
    RuleConfig cfg;
    cfg.criticalHoldLen = 2;
    AlertEngine engine(cfg);
    REQUIRE(engine.config().criticalHoldLen == 2, "engine keeps its configuration");
    std::vector<Row> rows;
    engine.push({89, 89, 89}, rows);
    REQUIRE(engine.hold().reason == CRIT && engine.hold().onLeft == 1, "critical hold running");
    REQUIRE(engine.stepsProcessed() == 3, "steps counted");
    engine.reset();
    REQUIRE(engine.stepsProcessed() == 0 && engine.hold().onLeft == 0, "reset clears state");
    Row r = engine.step(89);
    REQUIRE(r.index == 1 && !r.hasDelta && hasNote(r, "first sample"), "first sample after reset");

    REQUIRE(evaluate({}, RuleConfig{}).empty(), "empty series yields no rows");

    auto a = evaluate({93, 91, 90, 89, 88, 89, 89, 91, 92, 89, 90, 91, 92, 91, 89, 90}, RuleConfig{});
    auto b = evaluate({93, 91, 90, 89, 88, 89, 89, 91, 92, 89, 90, 91, 92, 91, 89, 90}, RuleConfig{});
    REQUIRE(a.size() == b.size(), "idempotent size");
    for (size_t i = 0; i < a.size(); ++i) {
        REQUIRE(a[i].reserve == b[i].reserve && a[i].delta == b[i].delta && a[i].alert == b[i].alert &&
                a[i].reason == b[i].reason && a[i].note == b[i].note, "idempotent row " << (i + 1));
    }
}

} // namespace

int main() {
    testNormalizer();
    testDelta();
    testStreaks();
    testCautionPersistence();
    testCriticalPersistence();
    testCautionDuringCritical();
    testEarlyCancel();
    testRecovery();
    testFloor();
    testDrop();
    testFloorWindowReminder();
    testRows();
    testEngineLifecycle();
    std::cout << "OK: validate_rules\n";
    return 0;
}
