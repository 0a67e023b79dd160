#pragma once
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace stratum::core {

// A structural property of some tree. The predicate reads the tree when
// it runs and explains a violation through |detail|.
using InvariantPredicate = std::function<bool(std::string& detail)>;

struct InvariantResult {
    std::string subject;
    std::string name;
    bool passed = false;
    std::string detail;
};

// Registry of named invariants that can be re-evaluated at any point,
// typically after every mutation in a test. Only the results of the most
// recent run are kept.
class InvariantValidator {
public:
    void add_check(const std::string& subject, const std::string& name,
                   InvariantPredicate predicate);

    // Runs every check. Returns all_passed().
    bool validate_all();

    const std::vector<InvariantResult>& results() const { return results_; }
    std::vector<InvariantResult> failures() const;
    const InvariantResult* first_failure() const;

    // False until a run has produced at least one result.
    bool all_passed() const;
    std::size_t pass_count() const;
    std::size_t fail_count() const { return results_.size() - pass_count(); }
    std::size_t check_count() const { return checks_.size(); }

    std::string format_report() const;
    void clear();

private:
    struct Entry {
        std::string subject;
        std::string name;
        InvariantPredicate predicate;
    };

    std::vector<Entry> checks_;
    std::vector<InvariantResult> results_;
};

} // namespace stratum::core
