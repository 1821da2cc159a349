#include "SurveyInputReader.h"
#include <rapidjson/error/en.h>
#include "OutputUtils.h"

using namespace rapidjson;

namespace synvalidator
{
namespace io
{
  namespace
  {
    double numberAt(const Value& v, const std::string& context)
    {
      if (!v.IsNumber())
        throw SurveyInputException(context + ": expected a number");

      return v.GetDouble();
    }

    std::string stringMember(const Value& obj, const char* name)
    {
      auto it = obj.FindMember(name);
      if (it == obj.MemberEnd() || it->value.IsNull())
        return std::string();

      if (it->value.IsString())
        return it->value.GetString();
      if (it->value.IsInt64())
        return std::to_string(it->value.GetInt64());

      throw SurveyInputException(std::string("'") + name + "' must be a string");
    }
  }

  std::string inputModeToString(InputMode mode)
  {
    switch (mode)
      {
      case InputMode::FlatNumeric:
        return "flat numeric";
      case InputMode::FlatCategorical:
        return "flat categorical";
      case InputMode::Survey:
        return "survey";
      }

    return "unknown";
  }

  SurveyInput SurveyInputReader::read() const
  {
    std::string contents;
    try
      {
        contents = utils::readFileContents(mFilePath);
      }
    catch (const std::runtime_error& e)
      {
        throw SurveyInputException(e.what());
      }

    try
      {
        return parse(contents);
      }
    catch (const SurveyInputException& e)
      {
        throw SurveyInputException(mFilePath + ": " + e.what());
      }
  }

  SurveyInput SurveyInputReader::parse(const std::string& json)
  {
    Document doc;
    doc.Parse(json.c_str());

    if (doc.HasParseError())
      throw SurveyInputException(std::string("JSON parse error at offset ") +
                                 std::to_string(doc.GetErrorOffset()) + ": " +
                                 GetParseError_En(doc.GetParseError()));

    if (!doc.IsObject())
      throw SurveyInputException("input document must be a JSON object");

    SurveyInput input;

    if (doc.HasMember("synthetic_questions") || doc.HasMember("real_questions"))
      {
        if (!doc.HasMember("synthetic_questions") || !doc.HasMember("real_questions"))
          throw SurveyInputException("survey input needs both 'synthetic_questions' and 'real_questions'");

        input.mode = InputMode::Survey;
        input.syntheticQuestions = parseQuestions(doc["synthetic_questions"], "synthetic");
        input.realQuestions = parseQuestions(doc["real_questions"], "real");
      }
    else if (doc.HasMember("synthetic_counts") || doc.HasMember("real_counts"))
      {
        if (!doc.HasMember("synthetic_counts") || !doc.HasMember("real_counts"))
          throw SurveyInputException("categorical input needs both 'synthetic_counts' and 'real_counts'");

        input.mode = InputMode::FlatCategorical;
        input.synthetic = parseCounts(doc["synthetic_counts"], "synthetic_counts");
        input.real = parseCounts(doc["real_counts"], "real_counts");
      }
    else if (doc.HasMember("synthetic_responses") || doc.HasMember("real_responses"))
      {
        if (!doc.HasMember("synthetic_responses") || !doc.HasMember("real_responses"))
          throw SurveyInputException("numeric input needs both 'synthetic_responses' and 'real_responses'");

        input.mode = InputMode::FlatNumeric;
        input.synthetic = parseValues(doc["synthetic_responses"], "synthetic_responses");
        input.real = parseValues(doc["real_responses"], "real_responses");
      }
    else
      {
        throw SurveyInputException("input document has none of 'synthetic_responses', "
                                   "'synthetic_counts' or 'synthetic_questions'");
      }

    return input;
  }

  ResponseSet SurveyInputReader::parseValues(const Value& value, const std::string& context)
  {
    if (!value.IsArray())
      throw SurveyInputException(context + ": expected an array of numbers");

    std::vector<double> values;
    values.reserve(value.Size());
    for (SizeType i = 0; i < value.Size(); ++i)
      values.push_back(numberAt(value[i], context + "[" + std::to_string(i) + "]"));

    try
      {
        return ResponseSet::fromValues(std::move(values));
      }
    catch (const std::domain_error& e)
      {
        throw SurveyInputException(context + ": " + e.what());
      }
  }

  ResponseSet SurveyInputReader::parseCounts(const Value& value, const std::string& context)
  {
    try
      {
        if (value.IsArray())
          {
            std::vector<double> counts;
            for (SizeType i = 0; i < value.Size(); ++i)
              counts.push_back(numberAt(value[i], context + "[" + std::to_string(i) + "]"));

            return ResponseSet::fromCountVector(counts);
          }

        if (!value.IsObject())
          throw SurveyInputException(context + ": expected an object of option counts");

        std::vector<ResponseSet::OptionCount> counts;
        for (auto it = value.MemberBegin(); it != value.MemberEnd(); ++it)
          {
            const std::string label = it->name.GetString();
            counts.emplace_back(label, numberAt(it->value, context + "." + label));
          }

        return ResponseSet::fromCounts(counts);
      }
    catch (const std::domain_error& e)
      {
        throw SurveyInputException(context + ": " + e.what());
      }
  }

  std::vector<SurveyQuestion> SurveyInputReader::parseQuestions(const Value& value, const std::string& side)
  {
    if (!value.IsArray())
      throw SurveyInputException(side + "_questions: expected an array");

    std::vector<SurveyQuestion> questions;
    questions.reserve(value.Size());

    for (SizeType i = 0; i < value.Size(); ++i)
      {
        const Value& q = value[i];
        const std::string where = side + "_questions[" + std::to_string(i) + "]";

        if (!q.IsObject())
          throw SurveyInputException(where + ": expected an object");

        std::string id;
        std::string name;
        try
          {
            id = stringMember(q, "question_id");
            name = stringMember(q, "question_name");
          }
        catch (const SurveyInputException& e)
          {
            throw SurveyInputException(where + ": " + e.what());
          }

        const std::string context = where + (id.empty() ? std::string() : " (" + id + ")");

        if (q.HasMember("responses"))
          questions.emplace_back(id, name, parseValues(q["responses"], context + ".responses"));
        else if (q.HasMember("response_counts"))
          questions.emplace_back(id, name, parseCounts(q["response_counts"], context + ".response_counts"));
        else
          throw SurveyInputException(context + ": needs 'response_counts' or 'responses'");
      }

    return questions;
  }
}
}
