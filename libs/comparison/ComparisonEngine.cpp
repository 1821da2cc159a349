#include "ComparisonEngine.h"
#include <map>
#include <set>
#include <string>
#include "ComparisonException.h"
#include "NullComparisonObserver.h"

namespace synvalidator
{
  namespace
  {
    diagnostics::IComparisonObserver* nullObserver()
    {
      static diagnostics::NullComparisonObserver instance;
      return &instance;
    }

    std::map<std::string, const SurveyQuestion*> indexById(const std::vector<SurveyQuestion>& questions)
    {
      std::map<std::string, const SurveyQuestion*> index;
      for (const auto& q : questions)
        {
          if (!q.questionId.empty())
            index[q.questionId] = &q;
        }

      return index;
    }

    std::string displayName(const SurveyQuestion* syn, const SurveyQuestion* real, const std::string& id)
    {
      if (syn && !syn->questionName.empty())
        return syn->questionName;
      if (real && !real->questionName.empty())
        return real->questionName;

      return id;
    }
  }

  ComparisonEngine::ComparisonEngine(const ComparisonConfiguration& config,
                                     diagnostics::IComparisonObserver* observer)
    : mConfig(config),
      mBattery(config.makeTierClassifier(), config.getBatterySettings()),
      mComparator(mBattery, config.getBatteryComposition()),
      mAggregator(config.makeTierClassifier()),
      mObserver(observer ? observer : nullObserver())
  {}

  ValidationReport ComparisonEngine::compareSamples(const ResponseSet& synthetic,
                                                    const ResponseSet& real) const
  {
    try
      {
        requireComparable(synthetic, real, "flat comparison");
      }
    catch (const InputError& e)
      {
        return finish(mAggregator.fromInputError(e.what(), synthetic.total(), real.total()));
      }

    const BatteryComposition& composition = mConfig.getBatteryComposition();
    const std::vector<TestKind>& kinds = synthetic.isNumeric()
      ? composition.flatNumeric
      : composition.flatCategorical;

    std::vector<TestResult> tests = mBattery.run(kinds, synthetic, real);
    for (const auto& t : tests)
      mObserver->onTestCompleted(std::string(), t);

    return finish(mAggregator.fromTests(std::move(tests), synthetic.total(), real.total()));
  }

  ValidationReport ComparisonEngine::compareQuestions(const std::vector<QuestionResponses>& questions) const
  {
    std::vector<QuestionComparison> comparisons;
    comparisons.reserve(questions.size());

    for (const auto& q : questions)
      comparisons.push_back(compareOne(q));

    const double n = static_cast<double>(questions.size());
    return finish(mAggregator.fromQuestions(std::move(comparisons), n, n, comparePooled(questions)));
  }

  ValidationReport ComparisonEngine::compareSurveys(const std::vector<SurveyQuestion>& synthetic,
                                                    const std::vector<SurveyQuestion>& real) const
  {
    const auto synIndex = indexById(synthetic);
    const auto realIndex = indexById(real);

    std::set<std::string> ids;
    for (const auto& entry : synIndex)
      ids.insert(entry.first);
    for (const auto& entry : realIndex)
      ids.insert(entry.first);

    std::vector<QuestionComparison> comparisons;
    comparisons.reserve(ids.size());
    std::vector<QuestionResponses> matched;

    for (const auto& id : ids)
      {
        auto s = synIndex.find(id);
        auto r = realIndex.find(id);
        const SurveyQuestion* syn = (s == synIndex.end()) ? nullptr : s->second;
        const SurveyQuestion* rl = (r == realIndex.end()) ? nullptr : r->second;
        const std::string name = displayName(syn, rl, id);

        if (syn && rl)
          {
            matched.emplace_back(id, name, syn->responses, rl->responses);
            comparisons.push_back(compareOne(matched.back()));
          }
        else
          {
            const SurveyQuestion* present = syn ? syn : rl;
            comparisons.push_back(QuestionComparator::unmatched(id, name, present->responses, syn != nullptr));
            mObserver->onQuestionCompared(comparisons.back());
          }
      }

    return finish(mAggregator.fromQuestions(std::move(comparisons),
                                            static_cast<double>(synIndex.size()),
                                            static_cast<double>(realIndex.size()),
                                            comparePooled(matched)));
  }

  QuestionComparison ComparisonEngine::compareOne(const QuestionResponses& question) const
  {
    QuestionComparison comparison = mComparator.compare(question);

    for (const auto& t : comparison.getTests())
      mObserver->onTestCompleted(question.questionId, t);

    mObserver->onQuestionCompared(comparison);
    return comparison;
  }

  std::vector<TestResult> ComparisonEngine::comparePooled(const std::vector<QuestionResponses>& pairs) const
  {
    std::vector<ResponseSet::OptionCount> synCounts;
    std::vector<ResponseSet::OptionCount> realCounts;
    std::vector<double> synValues;
    std::vector<double> realValues;

    for (const auto& q : pairs)
      {
        if (q.synthetic.isCategorical() && q.real.isCategorical())
          {
            const auto& s = q.synthetic.getOptionCounts();
            const auto& r = q.real.getOptionCounts();
            synCounts.insert(synCounts.end(), s.begin(), s.end());
            realCounts.insert(realCounts.end(), r.begin(), r.end());
          }
        else if (q.synthetic.isNumeric() && q.real.isNumeric())
          {
            const auto& s = q.synthetic.getValues();
            const auto& r = q.real.getValues();
            synValues.insert(synValues.end(), s.begin(), s.end());
            realValues.insert(realValues.end(), r.begin(), r.end());
          }
      }

    const BatteryComposition& composition = mConfig.getBatteryComposition();
    std::vector<TestResult> tests;

    // fromCounts merges repeated labels by summing their counts
    if (!synCounts.empty() && !realCounts.empty())
      tests = mBattery.run(composition.flatCategorical,
                           ResponseSet::fromCounts(synCounts),
                           ResponseSet::fromCounts(realCounts));
    else if (!synValues.empty() && !realValues.empty())
      tests = mBattery.run(composition.flatNumeric,
                           ResponseSet::fromValues(std::move(synValues)),
                           ResponseSet::fromValues(std::move(realValues)));

    for (const auto& t : tests)
      mObserver->onTestCompleted(std::string(), t);

    return tests;
  }

  ValidationReport ComparisonEngine::finish(ValidationReport report) const
  {
    mObserver->onReportCompleted(report);
    return report;
  }
}
