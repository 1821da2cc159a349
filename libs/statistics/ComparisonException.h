#pragma once

#include <stdexcept>
#include <string>

namespace synvalidator
{
  /**
   * @brief Raised inside a single statistical test when the input is degenerate
   *        for that test (zero variance, zero-sum weights, too few points...).
   *
   * A ComputationError never crosses the test boundary: TestBattery converts it
   * into a TestResult carrying the message as its error.
   */
  class ComputationError : public std::runtime_error
  {
  public:
    ComputationError(const std::string msg)
      : std::runtime_error(msg)
    {}

    ~ComputationError()
    {}
  };

  /**
   * @brief Raised when a ResponseSet pair is unusable as a whole (both sides
   *        empty, or numeric compared against categorical).
   *
   * The engine records the message in the report instead of propagating it.
   */
  class InputError : public std::runtime_error
  {
  public:
    InputError(const std::string msg)
      : std::runtime_error(msg)
    {}

    ~InputError()
    {}
  };
}
