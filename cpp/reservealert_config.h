// Central rule-set validation and presets
#pragma once

#include <string>
#include "reservealert_core.h"

// Returns false if the configuration is invalid. On failure, sets err_code
// (stable code) and err_msg (short reason). On success, err_code/msg are untouched.
// Validation only, no mutation.
extern "C" bool ra_validate_config(const reservealert::RuleConfig& cfg,
                                   const char** err_code,
                                   std::string* err_msg);

namespace reservealert {

// Throws std::invalid_argument("<code>: <message>") on an invalid configuration
void requireValidConfig(const RuleConfig& cfg);

// Floor-window/reminder rule set: the floor asserts for a window and re-arms
// after a cooldown while the critical band persists, drops hold briefly,
// caution persistence is not evaluated.
void applyPresetFloorWindow(RuleConfig& cfg);

} // namespace reservealert
