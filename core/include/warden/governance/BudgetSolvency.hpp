// =============================================================================
// BudgetSolvency.hpp - OVERSIGHT BUDGET VS. RISK TOLERANCE
// =============================================================================
// For every oversight plan and every (hazard, severity) pair declared by a
// tolerance:
//   strictest_tau   = min tau over tolerances whose context covers the plan
//   worst_case_risk = max risk over fits whose context covers the plan
//   solvent        <=> worst_case_risk <= strictest_tau
//
// risk = epsilon_high + sum over channels of k_low(channel) / allocation
//
// Aggregation is min/max, never an average.
// =============================================================================
#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <boost/json.hpp>

#include "warden/governance/InvariantCheck.hpp"
#include "warden/lattice/ContextLattice.hpp"

namespace warden {

// Non-numeric or out-of-range input to the risk arithmetic.
class SolvencyError : public std::runtime_error {
public:
    explicit SolvencyError(
        const std::string& msg
    ) : std::runtime_error(msg) {}
};

struct RiskTolerance {
    std::string hazard_id;
    std::string severity_id;
    std::string context_class;
    boost::json::value tau;
    std::string source;
};

struct RiskFit {
    std::string hazard_id;
    std::string severity_id;
    std::string context_class;
    boost::json::object data;
    std::string source;
};

struct OversightPlan {
    std::string plan_id;
    std::string context_class;
    boost::json::value channel_allocations = boost::json::object();
    std::string source;

    const std::string& label() const { return plan_id.empty() ? context_class : plan_id; }
};

// Entries of a safety contract's tolerances[]; non-objects are skipped.
std::vector<RiskTolerance> extractTolerances(
    const boost::json::value& contract,
    const std::string& source
);

// A fit document is one object or a list of objects.
std::vector<RiskFit> extractRiskFits(
    const boost::json::value& doc,
    const std::string& source
);

// A list, plans_by_context, plans, or one object with context_class.
// Entries without context_class are dropped.
std::vector<OversightPlan> extractPlanEntries(
    const boost::json::value& doc,
    const std::string& source
);

// Numbers and numeric strings.
double toNumeric(
    const boost::json::value& v,
    const std::string& field,
    const std::string& source
);

// allocations == nullptr means epsilon only.
double computeFitRisk(
    const RiskFit& fit,
    const boost::json::value* allocations
);

struct SolvencyFailure {
    std::string plan;
    std::string reason;
    std::string hazard_id;
    std::string severity_id;
    std::string file;

    boost::json::object toJson() const;
};

struct SolvencyVerdict {
    std::string hazard_id;
    std::string severity_id;
    std::optional<double> strictest_tau;
    std::optional<double> worst_case_risk;
    bool solvent = false;
};

class BudgetSolvencyChecker {
public:
    explicit BudgetSolvencyChecker(const ContextLattice& lattice);

    // One plan against one (hazard, severity). Problems are appended to
    // failures; the verdict is solvent only when both sides were computed
    // and the risk fits inside the budget.
    SolvencyVerdict evaluate(
        const OversightPlan& plan,
        const std::string& hazard_id,
        const std::string& severity_id,
        const std::vector<RiskTolerance>& tolerances,
        const std::vector<RiskFit>& fits,
        std::vector<SolvencyFailure>& failures
    ) const;

    // BUDGET_SOLVENCY invariant over every plan and declared hazard pair.
    InvariantCheck check(
        const std::vector<OversightPlan>& plans,
        const std::vector<RiskTolerance>& tolerances,
        const std::vector<RiskFit>& fits
    ) const;

private:
    const ContextLattice& lattice_;
};

}
