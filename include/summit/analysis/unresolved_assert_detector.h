#ifndef SUMMIT_ANALYSIS_UNRESOLVED_ASSERT_DETECTOR_H
#define SUMMIT_ANALYSIS_UNRESOLVED_ASSERT_DETECTOR_H

#include <gtest/gtest_prod.h>

#include "analysis/warning.h"
#include "ir/constraint/constraint.h"
#include "sym/variable.h"

#include <map>
#include <memory>
#include <vector>

class TestLibAnalysis_UnresolvedAssertDetector_Test;

namespace analysis {
    /**
 * Flags assertions whose condition degenerated into a bare boolean variable that occurs nowhere else in the
 * constraint system. Such a condition carries no information and usually means the abstraction failed to parse the
 * original assert condition.
 */
    class UnresolvedAssertDetector {
    private:
        FRIEND_TEST(::TestLibAnalysis, UnresolvedAssertDetector);

    public:
        static constexpr const char *MESSAGE = "Failed to parse the assert condition";

        UnresolvedAssertDetector() = default;

        // At most one warning per source location, in order of the constraints.
        std::vector<Warning> detect(const std::vector<std::unique_ptr<ir::Constraint>> &constraints) const;

    private:
        // Number of occurrences of every variable in all expressions of all constraints, assumptions included.
        static std::map<sym::Var, unsigned int>
        countVariableUses(const std::vector<std::unique_ptr<ir::Constraint>> &constraints);
    };
}// namespace analysis

#endif//SUMMIT_ANALYSIS_UNRESOLVED_ASSERT_DETECTOR_H
