#include "QuestionComparison.h"

namespace synvalidator
{
  std::string questionStatusToString(QuestionStatus status)
  {
    switch (status)
      {
      case QuestionStatus::Compared:
        return "Compared";
      case QuestionStatus::InsufficientData:
        return "Insufficient data";
      case QuestionStatus::Unmatched:
        return "Unmatched";
      }

    return "Unmatched";
  }

  std::string questionTypeToString(QuestionType type)
  {
    switch (type)
      {
      case QuestionType::RatingScale:
        return "Rating Scale";
      case QuestionType::Categorical:
        return "Categorical";
      case QuestionType::Numeric:
        return "Numeric";
      case QuestionType::StatisticalSummary:
        return "Statistical Summary";
      }

    return "Categorical";
  }
}
