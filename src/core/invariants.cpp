#include <stratum/core/invariants.h>

#include <algorithm>
#include <iterator>
#include <sstream>

namespace stratum::core {

namespace {
bool passed(const InvariantResult& r) { return r.passed; }
} // namespace

void InvariantValidator::add_check(const std::string& subject, const std::string& name,
                                   InvariantPredicate predicate) {
    checks_.push_back({subject, name, std::move(predicate)});
}

bool InvariantValidator::validate_all() {
    results_.clear();
    results_.reserve(checks_.size());
    for (const auto& entry : checks_) {
        InvariantResult result{entry.subject, entry.name, false, {}};
        result.passed = entry.predicate(result.detail);
        results_.push_back(std::move(result));
    }
    return all_passed();
}

std::vector<InvariantResult> InvariantValidator::failures() const {
    std::vector<InvariantResult> failed;
    std::copy_if(results_.begin(), results_.end(), std::back_inserter(failed),
                 [](const InvariantResult& r) { return !r.passed; });
    return failed;
}

const InvariantResult* InvariantValidator::first_failure() const {
    auto it = std::find_if_not(results_.begin(), results_.end(), passed);
    return it == results_.end() ? nullptr : &*it;
}

bool InvariantValidator::all_passed() const {
    return !results_.empty() && std::all_of(results_.begin(), results_.end(), passed);
}

std::size_t InvariantValidator::pass_count() const {
    return static_cast<std::size_t>(std::count_if(results_.begin(), results_.end(), passed));
}

std::string InvariantValidator::format_report() const {
    std::ostringstream out;
    out << pass_count() << " of " << results_.size() << " invariants hold\n";
    for (const auto& r : results_) {
        out << (r.passed ? "  ok   " : "  FAIL ") << r.subject << "::" << r.name;
        if (!r.passed && !r.detail.empty()) out << ": " << r.detail;
        out << '\n';
    }
    return out.str();
}

void InvariantValidator::clear() {
    checks_.clear();
    results_.clear();
}

} // namespace stratum::core
