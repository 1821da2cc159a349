#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace synvalidator
{
  /**
   * @brief Ordered confidence classification of a match score. Tier1 is best.
   */
  enum class Tier
  {
    Tier1 = 0,
    Tier2 = 1,
    Tier3 = 2,
    Tier4 = 3
  };

  constexpr std::size_t kNumTiers = 4;

  constexpr std::array<Tier, kNumTiers> kAllTiers = {
    Tier::Tier1, Tier::Tier2, Tier::Tier3, Tier::Tier4
  };

  /**
   * @brief "TIER_1" .. "TIER_4".
   */
  std::string tierToString(Tier tier);

  /**
   * @brief Rendering used when no tier could be assigned.
   */
  std::string tierToString(const std::optional<Tier>& tier);

  /**
   * @brief Parse "TIER_1" .. "TIER_4".
   * @throws std::invalid_argument for any other string
   */
  Tier stringToTier(const std::string& str);

  /**
   * @brief Cut points that map a match score to a tier.
   *
   * A score strictly above tier1Cutoff is Tier1, strictly above tier2Cutoff is
   * Tier2, strictly above tier3Cutoff is Tier3, everything else is Tier4.
   */
  struct TierThresholds
  {
    double tier1Cutoff = 0.85;
    double tier2Cutoff = 0.75;
    double tier3Cutoff = 0.50;
  };

  /**
   * @brief Cumulative proportions used to derive an overall tier from the tier
   *        distribution of many questions or tests.
   *
   *   Tier1 if share(Tier1)               >= tier1Share
   *   Tier2 if share(Tier1 + Tier2)       >= tier2Share
   *   Tier3 if share(Tier1 + Tier2 + Tier3) >= tier3Share
   *   Tier4 otherwise
   */
  struct OverallTierPolicy
  {
    double tier1Share = 0.60;
    double tier2Share = 0.40;
    double tier3Share = 0.40;
  };

  /**
   * @brief Counts of items per tier, indexed by Tier.
   */
  using TierDistribution = std::array<std::size_t, kNumTiers>;

  /**
   * @class TierClassifier
   * @brief Pure mapping from match scores to tiers.
   *
   * Holds nothing but its cut points, so one instance can be shared across
   * threads freely.
   */
  class TierClassifier
  {
  public:
    TierClassifier()
      : mThresholds(),
        mOverallPolicy()
    {}

    TierClassifier(const TierThresholds& thresholds, const OverallTierPolicy& overallPolicy)
      : mThresholds(thresholds),
        mOverallPolicy(overallPolicy)
    {}

    Tier classify(double matchScore) const noexcept;

    /**
     * @brief Count how many of the given tiers fall into each bucket.
     */
    static TierDistribution distribution(const std::vector<Tier>& tiers) noexcept;

    /**
     * @brief Overall tier from a tier distribution.
     * @return std::nullopt when the distribution is empty
     */
    std::optional<Tier> overallTier(const TierDistribution& distribution) const noexcept;

    const TierThresholds& getThresholds() const
    {
      return mThresholds;
    }

    const OverallTierPolicy& getOverallPolicy() const
    {
      return mOverallPolicy;
    }

  private:
    TierThresholds mThresholds;
    OverallTierPolicy mOverallPolicy;
  };
}
