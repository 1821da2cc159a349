#pragma once
#include "IComparisonObserver.h"
#include <fstream>
#include <mutex>
#include <string>

namespace synvalidator::diagnostics {

/**
 * @brief Appends one CSV row per test result. The header is written only when
 *        the file is new or empty.
 */
class CsvTestResultCollector : public IComparisonObserver {
public:
    explicit CsvTestResultCollector(const std::string& filepath);
    ~CsvTestResultCollector();

    void onTestCompleted(const std::string& scope, const TestResult& result) override;
    void onQuestionCompared(const QuestionComparison&) override {}
    void onReportCompleted(const ValidationReport&) override;

private:
    void writeHeaderIfNeeded();

    std::string m_filepath;
    std::ofstream m_ofs;
    std::mutex m_mutex;
    bool m_headerWritten = false;
};

} // namespace synvalidator::diagnostics
