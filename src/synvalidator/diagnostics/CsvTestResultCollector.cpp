#include "CsvTestResultCollector.h"
#include <filesystem>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace synvalidator::diagnostics
{
  namespace
  {
    std::string quoted(const std::string& field)
    {
      if (field.find_first_of(",\"\n") == std::string::npos)
        return field;

      std::string out = "\"";
      for (char c : field) {
        if (c == '"') out += '"';
        out += c;
      }
      out += '"';
      return out;
    }

    std::string joinStatistics(const std::vector<TestResult::Statistic>& stats)
    {
      std::ostringstream os;
      os.precision(std::numeric_limits<double>::max_digits10);
      for (std::size_t i = 0; i < stats.size(); ++i) {
        if (i > 0) os << ';';
        os << stats[i].first << '=' << stats[i].second;
      }
      return os.str();
    }
  }

  CsvTestResultCollector::CsvTestResultCollector(const std::string& filepath)
    : m_filepath(filepath)
  {
    std::error_code ec;
    if (std::filesystem::exists(m_filepath, ec) && std::filesystem::file_size(m_filepath, ec) > 0 && !ec) {
      m_headerWritten = true;
    }

    m_ofs.open(m_filepath, std::ios::out | std::ios::app);
    if (!m_ofs.is_open()) {
      throw std::runtime_error("Failed to open diagnostic file: " + m_filepath);
    }

    if (!m_headerWritten) {
      writeHeaderIfNeeded();
    }
  }

  CsvTestResultCollector::~CsvTestResultCollector() {
    std::lock_guard<std::mutex> lk(m_mutex);
    if (m_ofs.is_open()) m_ofs.close();
  }

  void CsvTestResultCollector::writeHeaderIfNeeded()
  {
    std::lock_guard<std::mutex> lk(m_mutex);
    if (m_headerWritten) return;

    m_ofs << "Scope,Test,Status,MatchScore,Tier,Error,Statistics\n";

    m_ofs.flush();
    m_headerWritten = true;
  }

  void CsvTestResultCollector::onTestCompleted(const std::string& scope, const TestResult& r)
  {
    std::lock_guard<std::mutex> lk(m_mutex);
    if (!m_ofs.is_open()) return;

    m_ofs << quoted(scope) << ","
          << r.getName() << ",";

    if (r.isError()) {
      m_ofs << "ERROR,,," << quoted(*r.getError()) << ",";
    } else {
      m_ofs << "OK,"
            << *r.getMatchScore() << ","
            << tierToString(r.getTier()) << ",,";
    }

    m_ofs << quoted(joinStatistics(r.getStatistics())) << "\n";
  }

  void CsvTestResultCollector::onReportCompleted(const ValidationReport&)
  {
    std::lock_guard<std::mutex> lk(m_mutex);
    if (m_ofs.is_open()) m_ofs.flush();
  }
} // namespace synvalidator::diagnostics
