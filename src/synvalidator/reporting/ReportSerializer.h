#pragma once

#include <ostream>
#include <string>
#include "ValidationReport.h"

namespace synvalidator
{
namespace reporting
{
  /**
   * @class ReportSerializer
   * @brief Renders a ValidationReport as JSON.
   *
   * Top-level fields: overall_accuracy, overall_tier ("N/A" when absent),
   * insufficient_data, tier_distribution, test_summary, synthetic_size,
   * real_size, input_error (only when set), tests, question_comparisons.
   * Each test carries its name, tier, match_score and native statistics, or
   * its error. NaN and infinite values are written as null.
   */
  class ReportSerializer
  {
  public:
    static std::string toJson(const ValidationReport& report, bool pretty = false);

    static void write(const ValidationReport& report, std::ostream& os, bool pretty = false);
  };
}
}
