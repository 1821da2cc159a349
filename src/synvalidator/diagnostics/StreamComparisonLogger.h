#pragma once
#include "IComparisonObserver.h"
#include <mutex>
#include <ostream>

namespace synvalidator::diagnostics {

/**
 * @brief Writes level-tagged progress lines to a stream.
 *
 * Failed tests, unmatched or insufficient questions and input errors are
 * logged as [WARN]. Per-test success lines are only written in verbose mode.
 */
class StreamComparisonLogger : public IComparisonObserver {
public:
    explicit StreamComparisonLogger(std::ostream& os, bool verbose = false);

    void onTestCompleted(const std::string& scope, const TestResult& result) override;
    void onQuestionCompared(const QuestionComparison& question) override;
    void onReportCompleted(const ValidationReport& report) override;

private:
    std::ostream& m_os;
    std::mutex m_mutex;
    bool m_verbose;
};

} // namespace synvalidator::diagnostics
