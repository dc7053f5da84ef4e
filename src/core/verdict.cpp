#include "evidenceforge/verdict.hpp"

#include <algorithm>
#include <cctype>

namespace ef {

namespace {

const VerdictProfile kCompliant{
    Verdict::Compliant,
    /*classification*/ { {0.0, 5.0}, {75.0, 95.0}, {0.55, 0.85}, {0.90, 0.98}, false },
    /*thermal*/        { 0.20, 0.05, 0.4, 0, 0, 0, 0, {0.0, 0.0} },
    "NO FIRE DETECTED [OK]",
    palette::ok_green,
};

const VerdictProfile kViolation{
    Verdict::Violation,
    /*classification*/ { {25.0, 55.0}, {20.0, 45.0}, {0.10, 0.35}, {0.82, 0.95}, true },
    /*thermal*/        { 0.15, 0.05, 1.0, 2, 5, 20, 60, {0.5, 0.9} },
    "[!] THERMAL ANOMALY DETECTED",
    palette::alert_red,
};

} // namespace

const char* to_string(Verdict v) {
    switch (v) {
    case Verdict::Compliant: return "COMPLIANT";
    case Verdict::Violation: return "VIOLATION";
    }
    return "UNKNOWN";
}

bool parse_verdict(const std::string& s, Verdict& out) {
    std::string t = s;
    std::transform(t.begin(), t.end(), t.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    if (t == "compliant") { out = Verdict::Compliant; return true; }
    if (t == "violation") { out = Verdict::Violation; return true; }
    return false;
}

const VerdictProfile& profile_for(Verdict v) {
    return v == Verdict::Violation ? kViolation : kCompliant;
}

} // namespace ef
