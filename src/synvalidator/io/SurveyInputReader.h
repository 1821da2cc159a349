#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <rapidjson/document.h>
#include "QuestionComparison.h"
#include "ResponseSet.h"

namespace synvalidator
{
namespace io
{
  class SurveyInputException : public std::runtime_error
  {
  public:
    SurveyInputException(const std::string msg)
      : std::runtime_error(msg)
    {}

    ~SurveyInputException()
    {}
  };

  /**
   * @brief Which comparison mode an input document asks for.
   */
  enum class InputMode
  {
    FlatNumeric,
    FlatCategorical,
    Survey
  };

  std::string inputModeToString(InputMode mode);

  /**
   * @brief Parsed input document. Flat modes fill synthetic and real; survey
   *        mode fills the two question lists.
   */
  struct SurveyInput
  {
    InputMode mode = InputMode::FlatNumeric;
    std::optional<ResponseSet> synthetic;
    std::optional<ResponseSet> real;
    std::vector<SurveyQuestion> syntheticQuestions;
    std::vector<SurveyQuestion> realQuestions;
  };

  /**
   * @class SurveyInputReader
   * @brief Reads the JSON document given to the command line driver.
   *
   * Accepted forms:
   *
   *   {"synthetic_responses": [numbers], "real_responses": [numbers]}
   *   {"synthetic_counts": {label: count}, "real_counts": {label: count}}
   *   {"synthetic_questions": [question], "real_questions": [question]}
   *
   * where a question is
   *
   *   {"question_id": str, "question_name": str,
   *    "response_counts": {label: count} | "responses": [numbers]}
   *
   * Option order follows document order. A counts value may also be given as
   * a plain array, whose options are then labelled "1".."K".
   */
  class SurveyInputReader
  {
  public:
    explicit SurveyInputReader(const std::string& filePath)
      : mFilePath(filePath)
    {}

    /**
     * @throws SurveyInputException if the file is unreadable or malformed
     */
    SurveyInput read() const;

    /**
     * @throws SurveyInputException if the document is malformed
     */
    static SurveyInput parse(const std::string& json);

  private:
    static ResponseSet parseValues(const rapidjson::Value& value, const std::string& context);
    static ResponseSet parseCounts(const rapidjson::Value& value, const std::string& context);
    static std::vector<SurveyQuestion> parseQuestions(const rapidjson::Value& value, const std::string& side);

    std::string mFilePath;
  };
}
}
