#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "ResponseSet.h"
#include "TestResult.h"
#include "Tier.h"

namespace synvalidator
{
  enum class QuestionStatus
  {
    Compared,
    InsufficientData,
    Unmatched
  };

  enum class QuestionType
  {
    RatingScale,
    Categorical,
    Numeric,
    StatisticalSummary
  };

  /**
   * @brief "Compared", "Insufficient data" or "Unmatched".
   */
  std::string questionStatusToString(QuestionStatus status);

  /**
   * @brief "Rating Scale", "Categorical", "Numeric" or "Statistical Summary".
   */
  std::string questionTypeToString(QuestionType type);

  /**
   * @brief A synthetic and a real ResponseSet already paired for one question.
   */
  struct QuestionResponses
  {
    QuestionResponses(std::string id, std::string name, ResponseSet syn, ResponseSet rl)
      : questionId(std::move(id)),
        questionName(std::move(name)),
        synthetic(std::move(syn)),
        real(std::move(rl))
    {}

    std::string questionId;
    std::string questionName;
    ResponseSet synthetic;
    ResponseSet real;
  };

  /**
   * @brief One question of one survey, before synthetic and real are matched by id.
   */
  struct SurveyQuestion
  {
    SurveyQuestion(std::string id, std::string name, ResponseSet rs)
      : questionId(std::move(id)),
        questionName(std::move(name)),
        responses(std::move(rs))
    {}

    std::string questionId;
    std::string questionName;
    ResponseSet responses;
  };

  /**
   * @class QuestionComparison
   * @brief Result of comparing the synthetic and real answers to one question.
   *
   * A question with status Compared always carries a match score and tier;
   * Insufficient data and Unmatched never do.
   */
  class QuestionComparison
  {
  public:
    QuestionComparison(std::string questionId,
                       std::string questionName,
                       std::vector<OptionComparison> optionComparisons,
                       std::vector<TestResult> tests,
                       std::optional<double> matchScore,
                       std::optional<Tier> tier,
                       QuestionStatus status,
                       QuestionType type,
                       double syntheticTotal,
                       double realTotal,
                       std::optional<std::string> error = std::nullopt)
      : mQuestionId(std::move(questionId)),
        mQuestionName(std::move(questionName)),
        mOptionComparisons(std::move(optionComparisons)),
        mTests(std::move(tests)),
        mMatchScore(matchScore),
        mTier(tier),
        mStatus(status),
        mType(type),
        mSyntheticTotal(syntheticTotal),
        mRealTotal(realTotal),
        mError(std::move(error))
    {}

    const std::string& getQuestionId() const
    {
      return mQuestionId;
    }

    const std::string& getQuestionName() const
    {
      return mQuestionName;
    }

    const std::vector<OptionComparison>& getOptionComparisons() const
    {
      return mOptionComparisons;
    }

    const std::vector<TestResult>& getTests() const
    {
      return mTests;
    }

    const std::optional<double>& getMatchScore() const
    {
      return mMatchScore;
    }

    const std::optional<Tier>& getTier() const
    {
      return mTier;
    }

    QuestionStatus getStatus() const
    {
      return mStatus;
    }

    QuestionType getType() const
    {
      return mType;
    }

    double getSyntheticTotal() const
    {
      return mSyntheticTotal;
    }

    double getRealTotal() const
    {
      return mRealTotal;
    }

    /**
     * @brief Why the pair could not be compared at all (type mismatch, both empty).
     */
    const std::optional<std::string>& getError() const
    {
      return mError;
    }

    bool isCompared() const
    {
      return mStatus == QuestionStatus::Compared;
    }

    bool operator==(const QuestionComparison& rhs) const
    {
      return mQuestionId == rhs.mQuestionId &&
        mQuestionName == rhs.mQuestionName &&
        mOptionComparisons == rhs.mOptionComparisons &&
        mTests == rhs.mTests &&
        mMatchScore == rhs.mMatchScore &&
        mTier == rhs.mTier &&
        mStatus == rhs.mStatus &&
        mType == rhs.mType &&
        mSyntheticTotal == rhs.mSyntheticTotal &&
        mRealTotal == rhs.mRealTotal &&
        mError == rhs.mError;
    }

  private:
    std::string mQuestionId;
    std::string mQuestionName;
    std::vector<OptionComparison> mOptionComparisons;
    std::vector<TestResult> mTests;
    std::optional<double> mMatchScore;
    std::optional<Tier> mTier;
    QuestionStatus mStatus;
    QuestionType mType;
    double mSyntheticTotal;
    double mRealTotal;
    std::optional<std::string> mError;
  };
}
