#include "ComparisonConfigurationFileReader.h"
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include "OutputUtils.h"

using namespace rapidjson;

namespace synvalidator
{
  static const Value* findSection(const Value& doc, const char* name);
  static void overrideDouble(const Value& section, const char* key, double& target);
  static void overrideBattery(const Value& section, const char* key, std::vector<TestKind>& target);

  ComparisonConfiguration ComparisonConfigurationFileReader::readConfigurationFile() const
  {
    std::string contents;
    try
      {
        contents = utils::readFileContents(mConfigFilePath);
      }
    catch (const std::runtime_error& e)
      {
        throw ComparisonConfigurationFileReaderException(e.what());
      }

    try
      {
        return parse(contents);
      }
    catch (const ComparisonConfigurationFileReaderException& e)
      {
        throw ComparisonConfigurationFileReaderException(mConfigFilePath + ": " + e.what());
      }
  }

  ComparisonConfiguration ComparisonConfigurationFileReader::parse(const std::string& json)
  {
    Document doc;
    doc.Parse(json.c_str());

    if (doc.HasParseError())
      throw ComparisonConfigurationFileReaderException(std::string("JSON parse error at offset ") +
                                                       std::to_string(doc.GetErrorOffset()) + ": " +
                                                       GetParseError_En(doc.GetParseError()));
    if (!doc.IsObject())
      throw ComparisonConfigurationFileReaderException("configuration must be a JSON object");

    TierThresholds thresholds;
    OverallTierPolicy policy;
    BatterySettings settings;
    BatteryComposition composition = BatteryComposition::defaults();

    if (const Value* s = findSection(doc, "tier_thresholds"))
      {
        overrideDouble(*s, "tier1", thresholds.tier1Cutoff);
        overrideDouble(*s, "tier2", thresholds.tier2Cutoff);
        overrideDouble(*s, "tier3", thresholds.tier3Cutoff);
      }

    if (const Value* s = findSection(doc, "overall_tier"))
      {
        overrideDouble(*s, "tier1_share", policy.tier1Share);
        overrideDouble(*s, "tier2_share", policy.tier2Share);
        overrideDouble(*s, "tier3_share", policy.tier3Share);
      }

    if (const Value* s = findSection(doc, "tests"))
      {
        auto bins = s->FindMember("max_histogram_bins");
        if (bins != s->MemberEnd())
          {
            if (!bins->value.IsUint())
              throw ComparisonConfigurationFileReaderException("'max_histogram_bins' must be a non-negative integer");
            settings.maxHistogramBins = bins->value.GetUint();
          }

        overrideDouble(*s, "kl_epsilon", settings.klEpsilon);
      }

    if (const Value* s = findSection(doc, "batteries"))
      {
        overrideBattery(*s, "flat_numeric", composition.flatNumeric);
        overrideBattery(*s, "flat_categorical", composition.flatCategorical);
        overrideBattery(*s, "question_categorical", composition.questionCategorical);
        overrideBattery(*s, "question_numeric", composition.questionNumeric);
        overrideBattery(*s, "question_summary", composition.questionSummary);
      }

    return ComparisonConfiguration(thresholds, policy, settings, composition);
  }

  static const Value* findSection(const Value& doc, const char* name)
  {
    auto it = doc.FindMember(name);
    if (it == doc.MemberEnd())
      return nullptr;

    if (!it->value.IsObject())
      throw ComparisonConfigurationFileReaderException(std::string("'") + name + "' must be an object");

    return &it->value;
  }

  static void overrideDouble(const Value& section, const char* key, double& target)
  {
    auto it = section.FindMember(key);
    if (it == section.MemberEnd())
      return;

    if (!it->value.IsNumber())
      throw ComparisonConfigurationFileReaderException(std::string("'") + key + "' must be a number");

    target = it->value.GetDouble();
  }

  static void overrideBattery(const Value& section, const char* key, std::vector<TestKind>& target)
  {
    auto it = section.FindMember(key);
    if (it == section.MemberEnd())
      return;

    if (!it->value.IsArray())
      throw ComparisonConfigurationFileReaderException(std::string("battery '") + key + "' must be an array");

    std::vector<TestKind> kinds;
    for (const auto& name : it->value.GetArray())
      {
        if (!name.IsString())
          throw ComparisonConfigurationFileReaderException(std::string("battery '") + key +
                                                           "' must list test names");
        try
          {
            kinds.push_back(stringToTestKind(name.GetString()));
          }
        catch (const std::invalid_argument&)
          {
            throw ComparisonConfigurationFileReaderException(std::string("battery '") + key +
                                                             "' names unknown test '" + name.GetString() + "'");
          }
      }

    target = std::move(kinds);
  }
}
