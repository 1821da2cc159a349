#pragma once
#include <string>
#include "QuestionComparison.h"
#include "TestResult.h"
#include "ValidationReport.h"

namespace synvalidator::diagnostics {

/**
 * @brief Receives notifications while a ComparisonEngine runs.
 *
 * Callbacks may arrive concurrently when one engine is shared between
 * threads; implementations that keep state must synchronise it.
 */
class IComparisonObserver {
public:
    virtual ~IComparisonObserver() = default;

    /// scope is the question id, or empty in flat mode
    virtual void onTestCompleted(const std::string& scope, const TestResult& result) = 0;
    virtual void onQuestionCompared(const QuestionComparison& question) = 0;
    virtual void onReportCompleted(const ValidationReport& report) = 0;
};

} // namespace synvalidator::diagnostics
