#include "QuestionComparator.h"
#include <algorithm>
#include <cctype>
#include <boost/algorithm/string/trim.hpp>
#include "ComparisonException.h"

namespace synvalidator
{
  namespace
  {
    bool isRatingLabel(const std::string& label)
    {
      const std::string trimmed = boost::algorithm::trim_copy(label);
      if (trimmed.empty() || trimmed.size() > 2)
        return false;

      if (!std::all_of(trimmed.begin(), trimmed.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; }))
        return false;

      const int value = std::stoi(trimmed);
      return value >= 1 && value <= 10;
    }

    QuestionType typeOf(const ResponseSet& responses)
    {
      if (responses.isNumeric())
        return QuestionType::Numeric;

      if (responses.size() == 0 && responses.hasSummaryStatistics())
        return QuestionType::StatisticalSummary;

      std::vector<OptionComparison> options;
      for (const auto& oc : responses.getOptionCounts())
        options.push_back(OptionComparison{oc.first, oc.second, 0.0});

      return QuestionComparator::classifyOptions(options);
    }

    QuestionComparison insufficient(const QuestionResponses& question,
                                    QuestionType type,
                                    const std::string& reason)
    {
      return QuestionComparison(question.questionId, question.questionName, {}, {},
                                std::nullopt, std::nullopt,
                                QuestionStatus::InsufficientData, type,
                                question.synthetic.total(), question.real.total(),
                                reason);
    }
  }

  QuestionType QuestionComparator::classifyOptions(const std::vector<OptionComparison>& options)
  {
    if (options.empty())
      return QuestionType::Categorical;

    for (const auto& oc : options)
      {
        if (!isRatingLabel(oc.option))
          return QuestionType::Categorical;
      }

    return QuestionType::RatingScale;
  }

  QuestionComparison QuestionComparator::compare(const QuestionResponses& question) const
  {
    const ResponseSet& syn = question.synthetic;
    const ResponseSet& real = question.real;

    try
      {
        requireComparable(syn, real, "question " + question.questionId);
      }
    catch (const InputError& e)
      {
        return insufficient(question, typeOf(syn), e.what());
      }

    if (syn.isNumeric())
      return compareNumeric(question);

    const bool bothHaveOptions = syn.size() > 0 && real.size() > 0;
    if (!bothHaveOptions && syn.hasSummaryStatistics() && real.hasSummaryStatistics())
      return compareSummary(question);

    return compareCategorical(question);
  }

  QuestionComparison QuestionComparator::compareNumeric(const QuestionResponses& question) const
  {
    std::vector<TestResult> tests = mBattery.run(mComposition.questionNumeric,
                                                 question.synthetic, question.real);

    return finish(question, {}, std::move(tests), QuestionType::Numeric,
                  question.synthetic.total(), question.real.total());
  }

  QuestionComparison QuestionComparator::compareCategorical(const QuestionResponses& question) const
  {
    std::vector<OptionComparison> options = alignOptions(question.synthetic, question.real);
    const QuestionType type = classifyOptions(options);

    std::vector<TestResult> tests = mBattery.run(mComposition.questionCategorical,
                                                 question.synthetic, question.real);

    return finish(question, std::move(options), std::move(tests), type,
                  question.synthetic.total(), question.real.total());
  }

  QuestionComparison QuestionComparator::compareSummary(const QuestionResponses& question) const
  {
    const ResponseSet& syn = question.synthetic;
    const ResponseSet& real = question.real;

    std::vector<OptionComparison> options;
    for (const char* key : {"MEAN", "MEDIAN", "STD"})
      {
        const auto s = syn.getSummaryStatistic(key);
        const auto r = real.getSummaryStatistic(key);
        if (s || r)
          options.push_back(OptionComparison{key, s.value_or(0.0), r.value_or(0.0)});
      }

    std::vector<TestResult> tests = mBattery.run(mComposition.questionSummary, syn, real);

    return finish(question, std::move(options), std::move(tests), QuestionType::StatisticalSummary,
                  syn.getSummaryStatistic("MEAN").value_or(0.0),
                  real.getSummaryStatistic("MEAN").value_or(0.0));
  }

  QuestionComparison QuestionComparator::finish(const QuestionResponses& question,
                                                std::vector<OptionComparison> options,
                                                std::vector<TestResult> tests,
                                                QuestionType type,
                                                double syntheticTotal,
                                                double realTotal) const
  {
    double sum = 0.0;
    std::size_t scored = 0;
    for (const auto& t : tests)
      {
        if (t.hasScore())
          {
            sum += *t.getMatchScore();
            ++scored;
          }
      }

    if (scored == 0)
      return QuestionComparison(question.questionId, question.questionName,
                                std::move(options), std::move(tests),
                                std::nullopt, std::nullopt,
                                QuestionStatus::InsufficientData, type,
                                syntheticTotal, realTotal);

    const double score = sum / static_cast<double>(scored);
    return QuestionComparison(question.questionId, question.questionName,
                              std::move(options), std::move(tests),
                              score, mBattery.getClassifier().classify(score),
                              QuestionStatus::Compared, type,
                              syntheticTotal, realTotal);
  }

  QuestionComparison QuestionComparator::unmatched(const std::string& questionId,
                                                   const std::string& questionName,
                                                   const ResponseSet& responses,
                                                   bool syntheticSide)
  {
    const double total = responses.total();
    return QuestionComparison(questionId, questionName, {}, {},
                              std::nullopt, std::nullopt,
                              QuestionStatus::Unmatched, typeOf(responses),
                              syntheticSide ? total : 0.0,
                              syntheticSide ? 0.0 : total);
  }
}
