#pragma once
#include "IComparisonObserver.h"
#include <algorithm>
#include <mutex>
#include <shared_mutex>
#include <vector>

namespace synvalidator::diagnostics {

/**
 * @brief Forwards every notification to a list of attached observers.
 *
 * Attached observers are not owned and must outlive this object.
 */
class CompositeComparisonObserver : public IComparisonObserver {
public:
    void attach(IComparisonObserver* observer) {
        std::unique_lock<std::shared_mutex> lock(m_observersMutex);
        if (observer)
            m_observers.push_back(observer);
    }

    void detach(IComparisonObserver* observer) {
        std::unique_lock<std::shared_mutex> lock(m_observersMutex);
        m_observers.erase(
            std::remove(m_observers.begin(), m_observers.end(), observer),
            m_observers.end()
        );
    }

    std::size_t size() const {
        std::shared_lock<std::shared_mutex> lock(m_observersMutex);
        return m_observers.size();
    }

    void onTestCompleted(const std::string& scope, const TestResult& result) override {
        std::shared_lock<std::shared_mutex> lock(m_observersMutex);
        for (auto* observer : m_observers)
            observer->onTestCompleted(scope, result);
    }

    void onQuestionCompared(const QuestionComparison& question) override {
        std::shared_lock<std::shared_mutex> lock(m_observersMutex);
        for (auto* observer : m_observers)
            observer->onQuestionCompared(question);
    }

    void onReportCompleted(const ValidationReport& report) override {
        std::shared_lock<std::shared_mutex> lock(m_observersMutex);
        for (auto* observer : m_observers)
            observer->onReportCompleted(report);
    }

private:
    mutable std::shared_mutex m_observersMutex;
    std::vector<IComparisonObserver*> m_observers;
};

} // namespace synvalidator::diagnostics
