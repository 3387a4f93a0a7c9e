// Per-series alert engine: hold/reminder timers and the rule evaluator
#pragma once

#include <vector>
#include <cstddef>
#include "reservealert_core.h"

namespace reservealert {

// Owns the StreakState/HoldState pair of one series evaluation. Steps must be
// fed in order; one engine per series (no sharing across threads).
class AlertEngine {
public:
    explicit AlertEngine(const RuleConfig& cfg = {}); // throws std::invalid_argument on invalid config

    // Process one raw sample and emit its row
    Row step(int raw);
    void push(const int* samples, size_t n, std::vector<Row>& out);
    void push(const std::vector<int>& samples, std::vector<Row>& out);

    // Forget all state; the next step is treated as the first sample
    void reset();

    const RuleConfig& config() const { return cfg_; }
    const StreakState& streaks() const { return streaks_; }
    const HoldState& hold() const { return hold_; }
    int stepsProcessed() const { return index_; }

private:
    enum class Rule { FLOOR, DROP, CRITICAL_PERSIST, CAUTION_PERSIST, ACTIVE_HOLD };

    struct StepContext {
        const Measure& m;
        Band band;
        bool floor;
        bool recovered;
        bool reminderDue;
        AlertLevel alert;
        Reason reason;
        Notes& notes;
    };

    void updateTimers(StepContext& ctx);
    bool applyRule(Rule rule, StepContext& ctx);
    bool ruleFloor(StepContext& ctx);
    bool ruleDrop(StepContext& ctx);
    bool ruleCriticalPersist(StepContext& ctx);
    bool ruleCautionPersist(StepContext& ctx);
    bool ruleActiveHold(StepContext& ctx);
    void arm(Reason reason, int len, Notes& notes);
    void cancelHold(Reason reason, const char* why, Notes& notes);
    void commitHold(StepContext& ctx);
    void syncHold();
    int& holdLeft(Reason reason) { return hold_.left[static_cast<size_t>(reason)]; }

    RuleConfig cfg_ {};
    StreakState streaks_ {};
    HoldState hold_ {};
    bool hasPrev_ {false};
    double prevReserve_ {0.0};
    int index_ {0};
};

} // namespace reservealert

// Optional plain C bridge (symbols have C linkage; still compiled as C++)
extern "C" {
    void* ra_engine_create(const reservealert::RuleConfig* cfg); // nullptr on invalid config
    int   ra_engine_step(void* h, int raw, reservealert::Row* out);
    void  ra_engine_reset(void* h);
    void  ra_engine_destroy(void* h);
}
