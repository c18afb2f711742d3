#include "warden/governance/BudgetSolvency.hpp"
#include "warden/canon/DataFile.hpp"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <set>
#include <utility>

namespace json = boost::json;

namespace warden {

namespace {

const char* const kCheckName = "BUDGET_SOLVENCY";

std::string memberText(
    const json::value& doc,
    const char* key
) {
    const json::value* v = findMember(doc, key);
    return v ? scalarText(*v) : std::string();
}

std::string formatG(double d) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.6g", d);
    return buf;
}

} // namespace

// ---------------------------------------------------------------------------
// Document extraction
// ---------------------------------------------------------------------------

std::vector<RiskTolerance> extractTolerances(
    const json::value& contract,
    const std::string& source
) {
    std::vector<RiskTolerance> out;
    const json::value* list = findMember(contract, "tolerances");
    if (list == nullptr || !list->is_array()) return out;

    for (const auto& tol : list->get_array()) {
        if (!tol.is_object()) continue;
        RiskTolerance t;
        t.hazard_id = memberText(tol, "hazard_id");
        t.severity_id = memberText(tol, "severity_id");
        t.context_class = memberText(tol, "context_class");
        if (const json::value* tau = findMember(tol, "tau")) t.tau = *tau;
        t.source = source;
        out.push_back(std::move(t));
    }
    return out;
}

std::vector<RiskFit> extractRiskFits(
    const json::value& doc,
    const std::string& source
) {
    std::vector<RiskFit> out;
    auto add = [&](const json::value& item) {
        if (!item.is_object()) return;
        RiskFit f;
        f.hazard_id = memberText(item, "hazard_id");
        f.severity_id = memberText(item, "severity_id");
        f.context_class = memberText(item, "context_class");
        f.data = item.get_object();
        f.source = source;
        out.push_back(std::move(f));
    };

    if (doc.is_array()) {
        for (const auto& item : doc.get_array()) add(item);
    } else {
        add(doc);
    }
    return out;
}

std::vector<OversightPlan> extractPlanEntries(
    const json::value& doc,
    const std::string& source
) {
    const json::array* entries = nullptr;
    json::array single;

    if (doc.is_array()) {
        entries = &doc.get_array();
    } else if (doc.is_object()) {
        const json::object& obj = doc.get_object();
        const json::value* list = nullptr;
        if (obj.contains("plans_by_context")) {
            list = obj.if_contains("plans_by_context");
        } else if (obj.contains("plans")) {
            list = obj.if_contains("plans");
        } else if (obj.contains("context_class")) {
            single.push_back(doc);
            entries = &single;
        }
        if (list != nullptr && list->is_array()) entries = &list->get_array();
    }

    std::vector<OversightPlan> plans;
    if (entries == nullptr) return plans;

    for (const auto& entry : *entries) {
        if (!entry.is_object()) continue;
        OversightPlan p;
        p.context_class = memberText(entry, "context_class");
        if (p.context_class.empty()) continue;
        p.plan_id = memberText(entry, "plan_id");
        const json::value* alloc = findMember(entry, "channel_allocations");
        if (alloc != nullptr && !alloc->is_null()) {
            const bool emptyObject = alloc->is_object() && alloc->get_object().empty();
            if (!emptyObject) p.channel_allocations = *alloc;
        }
        p.source = source;
        plans.push_back(std::move(p));
    }
    return plans;
}

// ---------------------------------------------------------------------------
// Risk arithmetic
// ---------------------------------------------------------------------------

double toNumeric(
    const json::value& v,
    const std::string& field,
    const std::string& source
) {
    if (v.is_double()) return v.get_double();
    if (v.is_int64()) return static_cast<double>(v.get_int64());
    if (v.is_uint64()) return static_cast<double>(v.get_uint64());
    if (v.is_string()) {
        const std::string s(v.get_string());
        const char* begin = s.c_str();
        char* end = nullptr;
        const double d = std::strtod(begin, &end);
        if (end != begin) {
            while (*end == ' ' || *end == '\t' || *end == '\n' || *end == '\r') ++end;
            if (*end == '\0') return d;
        }
    }
    throw SolvencyError("Invalid numeric '" + field + "' in " + source);
}

double computeFitRisk(
    const RiskFit& fit,
    const json::value* allocations
) {
    const json::object& data = fit.data;

    const json::value* epsilon = data.if_contains("conservative_epsilon_high");
    if (epsilon == nullptr) epsilon = data.if_contains("epsilon_high");
    double risk = toNumeric(epsilon ? *epsilon : json::value(),
                            "conservative_epsilon_high", fit.source);

    if (allocations == nullptr) return risk;
    if (!allocations->is_object()) {
        throw SolvencyError("channel_allocations must be an object in " + fit.source);
    }

    const json::value* kDefault = data.if_contains("conservative_k_low");
    if (kDefault == nullptr) kDefault = data.if_contains("k_low");

    const json::object* kByChannel = nullptr;
    if (const json::value* k = data.if_contains("k_low_by_channel"); k && k->is_object()) {
        kByChannel = &k->get_object();
    }

    for (const auto& kv : allocations->get_object()) {
        const std::string channel(kv.key());
        const double allocation = toNumeric(kv.value(),
                                            "channel_allocations[" + channel + "]", fit.source);
        if (allocation <= 0) {
            throw SolvencyError("channel_allocations[" + channel + "] must be > 0 in " + fit.source);
        }

        const json::value* kLow = kDefault;
        if (kByChannel != nullptr) {
            if (const json::value* k = kByChannel->if_contains(channel)) kLow = k;
        }
        if (kLow == nullptr || kLow->is_null()) continue;

        risk += toNumeric(*kLow, "k_low[" + channel + "]", fit.source) / allocation;
    }
    return risk;
}

json::object SolvencyFailure::toJson() const {
    json::object o;
    o["plan"] = plan;
    o["reason"] = reason;
    o["hazard_id"] = hazard_id;
    o["severity_id"] = severity_id;
    o["file"] = file;
    return o;
}

// ---------------------------------------------------------------------------
// BudgetSolvencyChecker
// ---------------------------------------------------------------------------

BudgetSolvencyChecker::BudgetSolvencyChecker(const ContextLattice& lattice)
    : lattice_(lattice) {}

SolvencyVerdict BudgetSolvencyChecker::evaluate(
    const OversightPlan& plan,
    const std::string& hazard_id,
    const std::string& severity_id,
    const std::vector<RiskTolerance>& tolerances,
    const std::vector<RiskFit>& fits,
    std::vector<SolvencyFailure>& failures
) const {
    SolvencyVerdict verdict;
    verdict.hazard_id = hazard_id;
    verdict.severity_id = severity_id;

    auto fail = [&](const std::string& reason, const std::string& file) {
        failures.push_back(SolvencyFailure{plan.label(), reason, hazard_id, severity_id, file});
    };

    // Tolerances whose context covers the plan
    std::vector<const RiskTolerance*> applicableTolerances;
    for (const auto& tol : tolerances) {
        if (tol.hazard_id != hazard_id || tol.severity_id != severity_id) continue;
        if (tol.context_class.empty()) {
            fail("Tolerance missing context_class", tol.source);
            continue;
        }
        try {
            if (lattice_.covers(tol.context_class, plan.context_class)) {
                applicableTolerances.push_back(&tol);
            }
        } catch (const LatticeError& e) {
            fail(e.what(), tol.source);
        }
    }
    if (applicableTolerances.empty()) {
        fail("No tolerance covers plan context", plan.source);
        return verdict;
    }

    std::vector<double> taus;
    for (const auto* tol : applicableTolerances) {
        try {
            taus.push_back(toNumeric(tol->tau, "tau", tol->source));
        } catch (const SolvencyError& e) {
            fail(e.what(), tol->source);
        }
    }
    if (taus.empty()) {
        fail("No valid tau values found", plan.source);
        return verdict;
    }
    const double strictestTau = *std::min_element(taus.begin(), taus.end());
    verdict.strictest_tau = strictestTau;

    // Fits whose context covers the plan
    std::vector<const RiskFit*> applicableFits;
    for (const auto& fit : fits) {
        if (fit.hazard_id != hazard_id || fit.severity_id != severity_id) continue;
        if (fit.context_class.empty()) {
            fail("Risk fit missing context_class", fit.source);
            continue;
        }
        try {
            if (lattice_.covers(fit.context_class, plan.context_class)) {
                applicableFits.push_back(&fit);
            }
        } catch (const LatticeError& e) {
            fail(e.what(), fit.source);
        }
    }
    if (applicableFits.empty()) {
        fail("No risk fit covers plan context", plan.source);
        return verdict;
    }

    std::vector<double> risks;
    for (const auto* fit : applicableFits) {
        try {
            risks.push_back(computeFitRisk(*fit, &plan.channel_allocations));
        } catch (const std::exception& e) {
            fail(e.what(), fit->source);
        }
    }
    if (risks.empty()) {
        fail("No computable risk from applicable fits", plan.source);
        return verdict;
    }
    const double worstRisk = *std::max_element(risks.begin(), risks.end());
    verdict.worst_case_risk = worstRisk;

    if (worstRisk > strictestTau) {
        fail("Risk " + formatG(worstRisk) + " exceeds tau " + formatG(strictestTau), plan.source);
        return verdict;
    }
    verdict.solvent = true;
    return verdict;
}

InvariantCheck BudgetSolvencyChecker::check(
    const std::vector<OversightPlan>& plans,
    const std::vector<RiskTolerance>& tolerances,
    const std::vector<RiskFit>& fits
) const {
    if (plans.empty()) {
        return InvariantCheck(kCheckName, InvariantStatus::SKIP,
                              "No oversight plans found (lattice: " + lattice_.version() + ")");
    }
    if (tolerances.empty()) {
        return InvariantCheck(kCheckName, InvariantStatus::FAIL,
                              "No safety contract tolerances found");
    }
    if (fits.empty()) {
        return InvariantCheck(kCheckName, InvariantStatus::FAIL, "No risk fits found");
    }

    std::set<std::pair<std::string, std::string>> hazards;
    for (const auto& tol : tolerances) {
        if (!tol.hazard_id.empty() && !tol.severity_id.empty()) {
            hazards.emplace(tol.hazard_id, tol.severity_id);
        }
    }

    std::vector<SolvencyFailure> failures;
    for (const auto& plan : plans) {
        for (const auto& h : hazards) {
            evaluate(plan, h.first, h.second, tolerances, fits, failures);
        }
    }

    if (!failures.empty()) {
        json::array arr;
        for (const auto& f : failures) arr.push_back(f.toJson());
        json::object details;
        details["failures"] = std::move(arr);

        std::cerr << "[BudgetSolvency] FAIL: " << failures.size()
                  << " solvency issue(s) across " << plans.size() << " plan(s)\n";
        return InvariantCheck(kCheckName, InvariantStatus::FAIL,
                              std::to_string(failures.size()) + " solvency issue(s) detected",
                              std::move(details));
    }

    std::cout << "[BudgetSolvency] PASS: " << plans.size() << " plan(s) solvent\n";
    return InvariantCheck(kCheckName, InvariantStatus::PASS,
                          "Verified " + std::to_string(plans.size()) +
                          " oversight plan(s) against lattice and tolerances");
}

}
