#include "Tier.h"
#include <numeric>
#include <stdexcept>

namespace synvalidator
{
  std::string tierToString(Tier tier)
  {
    switch (tier)
      {
      case Tier::Tier1:
        return "TIER_1";
      case Tier::Tier2:
        return "TIER_2";
      case Tier::Tier3:
        return "TIER_3";
      case Tier::Tier4:
        return "TIER_4";
      }

    return "TIER_4";
  }

  std::string tierToString(const std::optional<Tier>& tier)
  {
    return tier ? tierToString(*tier) : std::string("N/A");
  }

  Tier stringToTier(const std::string& str)
  {
    for (Tier t : kAllTiers)
      {
        if (tierToString(t) == str)
          return t;
      }

    throw std::invalid_argument("Unknown tier: " + str);
  }

  Tier TierClassifier::classify(double matchScore) const noexcept
  {
    if (matchScore > mThresholds.tier1Cutoff)
      return Tier::Tier1;
    if (matchScore > mThresholds.tier2Cutoff)
      return Tier::Tier2;
    if (matchScore > mThresholds.tier3Cutoff)
      return Tier::Tier3;

    return Tier::Tier4;
  }

  TierDistribution TierClassifier::distribution(const std::vector<Tier>& tiers) noexcept
  {
    TierDistribution counts{};
    for (Tier t : tiers)
      ++counts[static_cast<std::size_t>(t)];

    return counts;
  }

  std::optional<Tier> TierClassifier::overallTier(const TierDistribution& distribution) const noexcept
  {
    const std::size_t total = std::accumulate(distribution.begin(), distribution.end(), std::size_t(0));
    if (total == 0)
      return std::nullopt;

    const double n = static_cast<double>(total);
    const double share1 = static_cast<double>(distribution[0]) / n;
    const double share12 = static_cast<double>(distribution[0] + distribution[1]) / n;
    const double share123 = static_cast<double>(distribution[0] + distribution[1] + distribution[2]) / n;

    if (share1 >= mOverallPolicy.tier1Share)
      return Tier::Tier1;
    if (share12 >= mOverallPolicy.tier2Share)
      return Tier::Tier2;
    if (share123 >= mOverallPolicy.tier3Share)
      return Tier::Tier3;

    return Tier::Tier4;
  }
}
