#include "reservealert_engine.h"
#include "reservealert_config.h"

#include <string>

namespace reservealert {

namespace {

inline std::string minutes(int n) {
    return std::to_string(n) + " min";
}

} // namespace

AlertEngine::AlertEngine(const RuleConfig& cfg)
    : cfg_(cfg) {
    requireValidConfig(cfg_);
}

void AlertEngine::reset() {
    streaks_ = StreakState{};
    hold_ = HoldState{};
    hasPrev_ = false;
    prevReserve_ = 0.0;
    index_ = 0;
}

void AlertEngine::push(const int* samples, size_t n, std::vector<Row>& out) {
    if (!samples || n == 0) return;
    out.reserve(out.size() + n);
    for (size_t i = 0; i < n; ++i) out.push_back(step(samples[i]));
}

void AlertEngine::push(const std::vector<int>& samples, std::vector<Row>& out) {
    push(samples.data(), samples.size(), out);
}

Row AlertEngine::step(int raw) {
    // Priority order, first match wins; OFF/NO_TRIGGER when nothing matches
    static constexpr Rule kRulePriority[] = {
        Rule::FLOOR,
        Rule::DROP,
        Rule::CRITICAL_PERSIST,
        Rule::CAUTION_PERSIST,
        Rule::ACTIVE_HOLD,
    };

    const int index = ++index_;
    const double reserve = normalizeReserve(raw, cfg_);
    const Measure m = computeMeasure(reserve, hasPrev_, prevReserve_, cfg_.flatThreshold);

    Notes notes;
    if (!m.hasDelta) notes.add("first sample");
    else if (m.flat) notes.add("flat (|delta|<=flat)");

    StepContext ctx{m, Band::CLEAR, atFloor(reserve), isRecovered(reserve, cfg_), false,
                    AlertLevel::OFF, Reason::NONE, notes};
    ctx.band = updateStreaks(streaks_, reserve, cfg_, notes);
    updateTimers(ctx);

    for (Rule rule : kRulePriority) {
        if (applyRule(rule, ctx)) break;
    }
    commitHold(ctx);

    hasPrev_ = true;
    prevReserve_ = reserve;
    return emitRow(index, raw, m, ctx.alert, ctx.reason, notes);
}

// Recovery override, early cancellation and reminder countdown, all before
// priority resolution
void AlertEngine::updateTimers(StepContext& ctx) {
    if (ctx.recovered) {
        if (hold_.onLeft > 0) ctx.notes.add("hold cancelled (reserve>=recovery)");
        if (hold_.cooldownLeft > 0) ctx.notes.add("reminder cancelled (reserve>=recovery)");
        hold_ = HoldState{};
        return;
    }
    // drop windows run to completion
    if (ctx.band != Band::CRITICAL) {
        cancelHold(Reason::FLOOR_LIMIT, "hold ended early (left critical band)", ctx.notes);
        cancelHold(Reason::CRITICAL_PERSIST, "hold ended early (left critical band)", ctx.notes);
    }
    if (ctx.band == Band::CLEAR) {
        cancelHold(Reason::CAUTION_PERSIST, "hold ended early (left caution band)", ctx.notes);
    }
    syncHold();
    if (hold_.cooldownLeft > 0) {
        if (ctx.band != Band::CRITICAL) {
            hold_.cooldownLeft = 0;
            ctx.notes.add("reminder cancelled (left critical band)");
        } else if (--hold_.cooldownLeft == 0) {
            ctx.reminderDue = true;
        }
    }
}

bool AlertEngine::applyRule(Rule rule, StepContext& ctx) {
    switch (rule) {
        case Rule::FLOOR: return ruleFloor(ctx);
        case Rule::DROP: return ruleDrop(ctx);
        case Rule::CRITICAL_PERSIST: return ruleCriticalPersist(ctx);
        case Rule::CAUTION_PERSIST: return ruleCautionPersist(ctx);
        case Rule::ACTIVE_HOLD: return ruleActiveHold(ctx);
    }
    return false;
}

bool AlertEngine::ruleFloor(StepContext& ctx) {
    if (cfg_.mode == HoldMode::STREAK_DUAL_HOLD) {
        if (!ctx.floor) return false;
        // new worst-case episode: streaks were reset by the tracker, timers go too
        if (hold_.onLeft > 0 || hold_.cooldownLeft > 0) ctx.notes.add("hold cleared (floor)");
        hold_ = HoldState{};
        ctx.alert = AlertLevel::ON_FLOOR;
        ctx.reason = Reason::FLOOR_LIMIT;
        return true;
    }

    if (ctx.reminderDue) {
        ctx.notes.add("reminder re-armed");
        arm(Reason::FLOOR_LIMIT, cfg_.floorWindowLen, ctx.notes);
    } else {
        if (!ctx.floor) return false;
        if (holdLeft(Reason::FLOOR_LIMIT) > 0) {
            ctx.notes.add("holding ON* (" + minutes(holdLeft(Reason::FLOOR_LIMIT)) + " left)");
        } else if (hold_.cooldownLeft > 0) {
            ctx.notes.add("floor reminder in " + minutes(hold_.cooldownLeft));
            return false;
        } else {
            arm(Reason::FLOOR_LIMIT, cfg_.floorWindowLen, ctx.notes);
        }
    }
    ctx.alert = AlertLevel::ON_FLOOR;
    ctx.reason = Reason::FLOOR_LIMIT;
    return true;
}

bool AlertEngine::ruleDrop(StepContext& ctx) {
    if (!ctx.m.hasDelta || !greaterThan(ctx.m.deterioration, cfg_.dropThreshold)) return false;
    if (cfg_.dropHoldLen > 0) arm(Reason::DROP_EVENT, cfg_.dropHoldLen, ctx.notes);
    ctx.alert = AlertLevel::ON;
    ctx.reason = Reason::DROP_EVENT;
    return true;
}

// Exact hit only: the step where the streak becomes equal to the trigger length
bool AlertEngine::ruleCriticalPersist(StepContext& ctx) {
    if (streaks_.critical != cfg_.criticalTriggerLen) return false;
    arm(Reason::CRITICAL_PERSIST, cfg_.criticalHoldLen, ctx.notes);
    ctx.alert = AlertLevel::ON;
    ctx.reason = Reason::CRITICAL_PERSIST;
    return true;
}

bool AlertEngine::ruleCautionPersist(StepContext& ctx) {
    if (!cfg_.cautionRuleEnabled) return false;
    if (streaks_.caution != cfg_.cautionTriggerLen) return false;
    if (ctx.band == Band::CRITICAL && !cfg_.cautionDuringCritical) return false;
    arm(Reason::CAUTION_PERSIST, cfg_.cautionHoldLen, ctx.notes);
    ctx.alert = AlertLevel::ON;
    ctx.reason = Reason::CAUTION_PERSIST;
    return true;
}

bool AlertEngine::ruleActiveHold(StepContext& ctx) {
    if (hold_.onLeft <= 0) return false;
    const bool floorHold = (hold_.reason == Reason::FLOOR_LIMIT);
    ctx.alert = floorHold ? AlertLevel::ON_FLOOR : AlertLevel::ON;
    ctx.reason = hold_.reason;
    ctx.notes.add(std::string(floorHold ? "holding ON* (" : "holding ON (") + minutes(hold_.onLeft) + " left)");
    return true;
}

// Re-arming restarts that rule's counter; holds of other rules keep theirs
void AlertEngine::arm(Reason reason, int len, Notes& notes) {
    holdLeft(reason) = len;
    if (reason == Reason::FLOOR_LIMIT) hold_.cooldownLeft = 0;
    notes.add("hold armed (" + minutes(len) + ")");
    syncHold();
}

void AlertEngine::cancelHold(Reason reason, const char* why, Notes& notes) {
    if (holdLeft(reason) <= 0) return;
    holdLeft(reason) = 0;
    notes.add(why);
}

// Hold time is consumed only by steps reported under the held reason, so a
// hold covered by a higher-priority one resumes when that one ends
void AlertEngine::commitHold(StepContext& ctx) {
    if (ctx.reason == Reason::NONE || holdLeft(ctx.reason) <= 0) return;
    if (--holdLeft(ctx.reason) > 0) {
        syncHold();
        return;
    }

    syncHold();
    ctx.notes.add(hold_.onLeft > 0 ? "hold completed" : "hold completed -> next OFF unless retrigger");
    if (ctx.reason == Reason::FLOOR_LIMIT && cfg_.mode == HoldMode::FLOOR_WINDOW_REMINDER &&
        cfg_.reminderCooldownLen > 0 && ctx.band == Band::CRITICAL) {
        hold_.cooldownLeft = cfg_.reminderCooldownLen;
        ctx.notes.add("reminder armed (" + minutes(hold_.cooldownLeft) + ")");
    }
}

void AlertEngine::syncHold() {
    hold_.onLeft = 0;
    hold_.reason = Reason::NONE;
    for (size_t r = hold_.left.size(); r-- > 1;) {
        if (hold_.left[r] > 0) {
            hold_.onLeft = hold_.left[r];
            hold_.reason = static_cast<Reason>(r);
            return;
        }
    }
}

} // namespace reservealert

// C bridge
struct _ra_engine_handle { reservealert::AlertEngine* p; };

void* ra_engine_create(const reservealert::RuleConfig* cfg) {
    reservealert::RuleConfig c = cfg ? *cfg : reservealert::RuleConfig{};
    if (!ra_validate_config(c, nullptr, nullptr)) return nullptr;
    auto* h = new _ra_engine_handle();
    h->p = new reservealert::AlertEngine(c);
    return h;
}

int ra_engine_step(void* h, int raw, reservealert::Row* out) {
    if (!h || !out) return 0;
    auto* S = reinterpret_cast<_ra_engine_handle*>(h);
    *out = S->p->step(raw);
    return 1;
}

void ra_engine_reset(void* h) {
    if (!h) return; auto* S = reinterpret_cast<_ra_engine_handle*>(h); S->p->reset();
}

void ra_engine_destroy(void* h) {
    if (!h) return; auto* S = reinterpret_cast<_ra_engine_handle*>(h); delete S->p; delete S;
}
