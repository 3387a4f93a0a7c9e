// Parse a per-minute series, evaluate it and render the alert table (or JSON)
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include "../cpp/reservealert_config.h"
#include "../cpp/reservealert_core.h"

static bool g_debug = false;
#define DBG if (g_debug) std::cerr << "[debug] "

static const char* kDefaultSeries = "93,91,90,89,88,89,89,91,92,89,90,91,92,91,89,90";

void printUsage(const char* progName) {
    std::cout << "Usage: " << progName << " [series] [options]\n";
    std::cout << "  series                     comma/space/semicolon separated integers\n";
    std::cout << "Options:\n";
    std::cout << "  --file <path>              Read the series from a file\n";
    std::cout << "  --max-points <n>           Truncate input to n points (default: 100)\n";
    std::cout << "  --json                     Output JSON instead of a table\n";
    std::cout << "  --floor-window             Floor-window/reminder rule set\n";
    std::cout << "  --caution-during-critical  Evaluate caution persistence inside the critical band\n";
    std::cout << "  --no-caution               Disable caution persistence\n";
    std::cout << "  --debug                    Trace parsing and configuration to stderr\n";
    std::cout << "  --help                     Show this help\n";
}

static bool isInteger(const std::string& tok) {
    size_t i = (tok[0] == '+' || tok[0] == '-') ? 1 : 0;
    if (i >= tok.size()) return false;
    for (; i < tok.size(); ++i) if (!std::isdigit(static_cast<unsigned char>(tok[i]))) return false;
    return true;
}

// Non-integer tokens are skipped; integers beyond int range saturate.
// Parsing stops at maxPoints
std::vector<int> parseSeries(const std::string& text, size_t maxPoints, bool& truncated) {
    std::string content = text;
    for (char& ch : content) { if (ch == ',' || ch == ';') ch = ' '; }
    std::stringstream ss(content);
    std::vector<int> out;
    std::string tok;
    truncated = false;
    while (ss >> tok) {
        if (!isInteger(tok)) {
            DBG << "skipping token '" << tok << "'\n";
            continue;
        }
        if (out.size() >= maxPoints) { truncated = true; break; }
        try {
            out.push_back(std::stoi(tok));
        } catch (const std::out_of_range&) {
            DBG << "saturating out-of-range token '" << tok << "'\n";
            out.push_back(tok[0] == '-' ? std::numeric_limits<int>::min() : std::numeric_limits<int>::max());
        }
    }
    return out;
}

std::string loadText(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + filename);
    }
    std::stringstream buf;
    buf << file.rdbuf();
    return buf.str();
}

static std::string jsonEscape(const std::string& s) {
    std::string out;
    for (char c : s) {
        if (c == '"' || c == '\\') out.push_back('\\');
        out.push_back(c);
    }
    return out;
}

void printJSON(const std::vector<reservealert::Row>& rows) {
    std::cout << std::fixed << std::setprecision(4);
    std::cout << "[\n";
    for (size_t i = 0; i < rows.size(); ++i) {
        const auto& r = rows[i];
        std::cout << "  {\"minute\": " << r.index << ", \"raw\": " << r.raw << ", \"reserve\": " << r.reserve;
        if (r.hasDelta) std::cout << ", \"delta\": " << r.delta << ", \"drop\": " << r.deterioration;
        else std::cout << ", \"delta\": null, \"drop\": null";
        std::cout << ", \"alert\": \"" << reservealert::toString(r.alert) << "\""
                  << ", \"reason\": \"" << reservealert::toString(r.reason) << "\""
                  << ", \"note\": \"" << jsonEscape(r.note) << "\"}"
                  << (i + 1 < rows.size() ? ",\n" : "\n");
    }
    std::cout << "]\n";
}

void printTable(const std::vector<reservealert::Row>& rows, const reservealert::RuleConfig& cfg) {
    std::cout << std::left << std::setw(7) << "Minute" << std::setw(5) << "Raw" << std::setw(9) << "Reserve"
              << std::setw(9) << "Delta" << std::setw(8) << "Drop" << std::setw(6) << "Alert"
              << std::setw(17) << "Reason" << "Note\n";
    std::cout << std::fixed << std::setprecision(4);
    for (const auto& r : rows) {
        std::cout << std::setw(7) << r.index << std::setw(5) << r.raw << std::setw(9) << r.reserve;
        if (r.hasDelta) std::cout << std::setw(9) << r.delta << std::setw(8) << r.deterioration;
        else std::cout << std::setw(9) << "-" << std::setw(8) << "-";
        std::cout << std::setw(6) << reservealert::toString(r.alert)
                  << std::setw(17) << reservealert::toString(r.reason) << r.note << "\n";
    }
    std::cout << std::setprecision(2) << "\n";
    std::cout << "Reason codes: FLOOR_LIMIT, DROP_EVENT, CRITICAL_PERSIST, CAUTION_PERSIST, NO_TRIGGER\n";
    std::cout << "  ON*  FLOOR_LIMIT when reserve = 0";
    if (cfg.mode == reservealert::HoldMode::FLOOR_WINDOW_REMINDER) {
        std::cout << " (held " << cfg.floorWindowLen << " min, reminder every " << cfg.reminderCooldownLen
                  << " min while critical)";
    }
    std::cout << "\n";
    std::cout << "  ON   DROP_EVENT when drop > " << cfg.dropThreshold << "\n";
    std::cout << "  ON   CRITICAL_PERSIST when the critical streak hits " << cfg.criticalTriggerLen
              << ", held " << cfg.criticalHoldLen << " min\n";
    if (cfg.cautionRuleEnabled) {
        std::cout << "  ON   CAUTION_PERSIST when the caution streak hits " << cfg.cautionTriggerLen
                  << ", held " << cfg.cautionHoldLen << " min\n";
    }
    std::cout << "  flat in Note means |delta| <= " << cfg.flatThreshold << "\n";
}

int main(int argc, char* argv[]) {
    reservealert::RuleConfig cfg;
    std::string text;
    std::string filename;
    size_t maxPoints = 100;
    bool json = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--file" && i + 1 < argc) {
            filename = argv[++i];
        } else if (arg == "--max-points" && i + 1 < argc) {
            int n = std::atoi(argv[++i]);
            maxPoints = n > 0 ? static_cast<size_t>(n) : maxPoints;
        } else if (arg == "--json") {
            json = true;
        } else if (arg == "--floor-window") {
            reservealert::applyPresetFloorWindow(cfg);
        } else if (arg == "--caution-during-critical") {
            cfg.cautionDuringCritical = true;
        } else if (arg == "--no-caution") {
            cfg.cautionRuleEnabled = false;
        } else if (arg == "--debug") {
            g_debug = true;
        } else {
            if (!text.empty()) text += ",";
            text += arg;
        }
    }

    try {
        if (!filename.empty()) text = loadText(filename);
        if (text.empty()) text = kDefaultSeries;

        bool truncated = false;
        std::vector<int> series = parseSeries(text, maxPoints, truncated);
        if (series.empty()) {
            std::cerr << "Error: No valid numbers found. Example: 92,91,90,89,88,90,91,92" << std::endl;
            return 1;
        }
        if (truncated) {
            std::cerr << "Warning: input exceeded " << maxPoints << " points; only the first "
                      << maxPoints << " were used." << std::endl;
        }
        DBG << "parsed " << series.size() << " samples, mode="
            << (cfg.mode == reservealert::HoldMode::FLOOR_WINDOW_REMINDER ? "floor-window" : "streak-dual-hold")
            << " caution=" << cfg.cautionRuleEnabled << " cautionDuringCritical=" << cfg.cautionDuringCritical
            << "\n";

        auto rows = reservealert::evaluate(series, cfg);
        for (const auto& r : rows) {
            DBG << "minute " << r.index << " band="
                << reservealert::toString(reservealert::classifyBand(reservealert::normalizeReserve(r.raw, cfg), cfg))
                << "\n";
        }
        if (json) printJSON(rows);
        else printTable(rows, cfg);
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
