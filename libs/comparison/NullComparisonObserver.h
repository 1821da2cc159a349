#pragma once
#include "IComparisonObserver.h"

namespace synvalidator::diagnostics {

class NullComparisonObserver : public IComparisonObserver {
public:
    NullComparisonObserver() = default;
    ~NullComparisonObserver() override = default;

    void onTestCompleted(const std::string& /*scope*/, const TestResult& /*result*/) override {}
    void onQuestionCompared(const QuestionComparison& /*question*/) override {}
    void onReportCompleted(const ValidationReport& /*report*/) override {}
};

} // namespace synvalidator::diagnostics
