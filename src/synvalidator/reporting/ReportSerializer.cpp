#include "ReportSerializer.h"
#include <cmath>
#include <optional>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

using namespace rapidjson;

namespace synvalidator
{
namespace reporting
{
  namespace
  {
    template <class Writer>
    void writeNumber(Writer& writer, double value)
    {
      if (std::isfinite(value))
        writer.Double(value);
      else
        writer.Null();
    }

    template <class Writer>
    void writeNumber(Writer& writer, const std::optional<double>& value)
    {
      if (value)
        writeNumber(writer, *value);
      else
        writer.Null();
    }

    template <class Writer>
    void writeKey(Writer& writer, const std::string& key)
    {
      writer.Key(key.c_str(), static_cast<SizeType>(key.size()));
    }

    template <class Writer>
    void writeString(Writer& writer, const std::string& value)
    {
      writer.String(value.c_str(), static_cast<SizeType>(value.size()));
    }

    template <class Writer>
    void writeTest(Writer& writer, const TestResult& test)
    {
      writer.StartObject();

      writeKey(writer, "test");
      writeString(writer, test.getName());

      if (test.isError())
        {
          writeKey(writer, "error");
          writeString(writer, *test.getError());
        }
      else
        {
          writeKey(writer, "tier");
          writeString(writer, tierToString(test.getTier()));
          writeKey(writer, "match_score");
          writeNumber(writer, test.getMatchScore());
        }

      for (const auto& stat : test.getStatistics())
        {
          writeKey(writer, stat.first);
          writeNumber(writer, stat.second);
        }

      writer.EndObject();
    }

    template <class Writer>
    void writeTests(Writer& writer, const std::vector<TestResult>& tests)
    {
      writer.StartArray();
      for (const auto& t : tests)
        writeTest(writer, t);
      writer.EndArray();
    }

    template <class Writer>
    void writeQuestion(Writer& writer, const QuestionComparison& q)
    {
      writer.StartObject();

      writeKey(writer, "question_id");
      writeString(writer, q.getQuestionId());
      writeKey(writer, "question_name");
      writeString(writer, q.getQuestionName());
      writeKey(writer, "match_score");
      writeNumber(writer, q.getMatchScore());
      writeKey(writer, "tier");
      writeString(writer, tierToString(q.getTier()));
      writeKey(writer, "status");
      writeString(writer, questionStatusToString(q.getStatus()));
      writeKey(writer, "type");
      writeString(writer, questionTypeToString(q.getType()));
      writeKey(writer, "synthetic_total");
      writeNumber(writer, q.getSyntheticTotal());
      writeKey(writer, "real_total");
      writeNumber(writer, q.getRealTotal());

      if (q.getError())
        {
          writeKey(writer, "error");
          writeString(writer, *q.getError());
        }

      writeKey(writer, "tests");
      writeTests(writer, q.getTests());

      writeKey(writer, "option_comparisons");
      writer.StartArray();
      for (const auto& oc : q.getOptionComparisons())
        {
          writer.StartObject();
          writeKey(writer, "option");
          writeString(writer, oc.option);
          writeKey(writer, "synthetic_count");
          writeNumber(writer, oc.syntheticCount);
          writeKey(writer, "real_count");
          writeNumber(writer, oc.realCount);
          writer.EndObject();
        }
      writer.EndArray();

      writer.EndObject();
    }

    template <class Writer>
    void writeReport(Writer& writer, const ValidationReport& report)
    {
      writer.StartObject();

      writeKey(writer, "overall_accuracy");
      writeNumber(writer, report.getOverallAccuracy());
      writeKey(writer, "overall_tier");
      writeString(writer, tierToString(report.getOverallTier()));
      writeKey(writer, "insufficient_data");
      writer.Bool(report.isInsufficientData());

      writeKey(writer, "tier_distribution");
      writer.StartObject();
      for (Tier tier : kAllTiers)
        {
          writeKey(writer, tierToString(tier));
          writer.Uint64(report.getTierDistribution()[static_cast<std::size_t>(tier)]);
        }
      writer.EndObject();

      const TestSummary& summary = report.getTestSummary();
      writeKey(writer, "test_summary");
      writer.StartObject();
      writeKey(writer, "total_tests");
      writer.Uint64(summary.totalTests);
      writeKey(writer, "successful_tests");
      writer.Uint64(summary.successfulTests);
      writeKey(writer, "failed_tests");
      writer.Uint64(summary.failedTests);
      writeKey(writer, "tier_1_ratio");
      writeNumber(writer, summary.tier1Ratio);
      writeKey(writer, "tier_2_ratio");
      writeNumber(writer, summary.tier2Ratio);
      writer.EndObject();

      writeKey(writer, "synthetic_size");
      writeNumber(writer, report.getSyntheticSize());
      writeKey(writer, "real_size");
      writeNumber(writer, report.getRealSize());

      if (report.getInputError())
        {
          writeKey(writer, "input_error");
          writeString(writer, *report.getInputError());
        }

      writeKey(writer, "tests");
      writeTests(writer, report.getTests());

      writeKey(writer, "question_comparisons");
      writer.StartArray();
      for (const auto& q : report.getQuestionComparisons())
        writeQuestion(writer, q);
      writer.EndArray();

      writer.EndObject();
    }
  }

  std::string ReportSerializer::toJson(const ValidationReport& report, bool pretty)
  {
    StringBuffer buffer;

    if (pretty)
      {
        PrettyWriter<StringBuffer> writer(buffer);
        writer.SetIndent(' ', 2);
        writeReport(writer, report);
      }
    else
      {
        Writer<StringBuffer> writer(buffer);
        writeReport(writer, report);
      }

    return buffer.GetString();
  }

  void ReportSerializer::write(const ValidationReport& report, std::ostream& os, bool pretty)
  {
    os << toJson(report, pretty) << '\n';
  }
}
}
