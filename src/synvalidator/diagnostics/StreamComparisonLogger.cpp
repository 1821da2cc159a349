#include "StreamComparisonLogger.h"
#include <iomanip>

namespace synvalidator::diagnostics
{
  namespace
  {
    std::string scopePrefix(const std::string& scope)
    {
      return scope.empty() ? std::string() : scope + ": ";
    }
  }

  StreamComparisonLogger::StreamComparisonLogger(std::ostream& os, bool verbose)
    : m_os(os),
      m_verbose(verbose)
  {
  }

  void StreamComparisonLogger::onTestCompleted(const std::string& scope, const TestResult& result)
  {
    std::lock_guard<std::mutex> lk(m_mutex);

    if (result.isError()) {
      m_os << "[WARN] " << scopePrefix(scope) << result.getName()
           << " failed: " << *result.getError() << std::endl;
      return;
    }

    if (!m_verbose) return;

    m_os << "[INFO] " << scopePrefix(scope) << result.getName()
         << " match_score=" << std::fixed << std::setprecision(4) << *result.getMatchScore()
         << std::defaultfloat
         << " tier=" << tierToString(result.getTier()) << std::endl;
  }

  void StreamComparisonLogger::onQuestionCompared(const QuestionComparison& q)
  {
    std::lock_guard<std::mutex> lk(m_mutex);

    if (!q.isCompared()) {
      m_os << "[WARN] Question " << q.getQuestionId() << " (" << q.getQuestionName() << "): "
           << questionStatusToString(q.getStatus());
      if (q.getError())
        m_os << " - " << *q.getError();
      m_os << std::endl;
      return;
    }

    m_os << "[INFO] Question " << q.getQuestionId() << " (" << q.getQuestionName() << "): "
         << questionTypeToString(q.getType())
         << " match_score=" << std::fixed << std::setprecision(4) << *q.getMatchScore()
         << std::defaultfloat
         << " tier=" << tierToString(q.getTier()) << std::endl;
  }

  void StreamComparisonLogger::onReportCompleted(const ValidationReport& report)
  {
    std::lock_guard<std::mutex> lk(m_mutex);

    if (report.getInputError()) {
      m_os << "[WARN] Input could not be compared: " << *report.getInputError() << std::endl;
      return;
    }

    const auto& summary = report.getTestSummary();
    m_os << (report.isInsufficientData() ? "[WARN] " : "[INFO] ")
         << "Overall accuracy=" << std::fixed << std::setprecision(4) << report.getOverallAccuracy()
         << std::defaultfloat
         << " tier=" << tierToString(report.getOverallTier())
         << " (" << summary.successfulTests << " of " << summary.totalTests << " scored)"
         << std::endl;
  }
} // namespace synvalidator::diagnostics
