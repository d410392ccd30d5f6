// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "Bucketing.h"
#include "ABTestException.h"
#include "RngUtils.h"
#include "randutils.hpp"
#include <algorithm>
#include <cmath>
#include <set>
#include <sstream>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>

namespace mkc_abtest
{
  using rng_utils::CRNKey;
  using rng_utils::CRNEngineProvider;

  GroupAllocation::GroupAllocation(std::vector<GroupWeight> weights, double tolerance)
    : mWeights(std::move(weights)),
      mCumulative()
  {
    if (mWeights.empty())
      throw ConfigurationError("GroupAllocation: at least one group is required");

    std::set<std::string> seen;
    double total = 0.0;
    for (const auto& gw : mWeights)
      {
	if (gw.first.empty())
	  throw ConfigurationError("GroupAllocation: group labels must not be empty");

	if (!seen.insert(gw.first).second)
	  throw ConfigurationError("GroupAllocation: duplicate group label '" + gw.first + "'");

	if (!std::isfinite(gw.second) || gw.second <= 0.0)
	  throw ConfigurationError("GroupAllocation: weight for group '" + gw.first +
				   "' must be positive");

	total += gw.second;
	mCumulative.push_back(total);
      }

    if (std::fabs(total - 1.0) > tolerance)
      {
	std::ostringstream os;
	os.precision(12);
	os << "GroupAllocation: weights sum to " << total << ", expected 1";
	throw ConfigurationError(os.str());
      }

    // The last boundary is exactly one so every u in [0,1) finds a group
    mCumulative.back() = 1.0;
  }

  GroupAllocation GroupAllocation::fromBucketRanges(const std::string& ranges,
						    std::size_t bucketCount)
  {
    if (bucketCount == 0)
      throw ConfigurationError("GroupAllocation: bucket count must be positive");

    struct Range
    {
      std::string label;
      std::size_t lo;
      std::size_t hi;
    };

    std::vector<std::string> entries;
    boost::algorithm::split(entries, ranges, boost::is_any_of(","));

    std::vector<Range> parsed;
    for (auto entry : entries)
      {
	boost::algorithm::trim(entry);
	if (entry.empty())
	  continue;

	const auto colon = entry.rfind(':');
	const auto dash = entry.find('-', colon == std::string::npos ? 0 : colon);
	if (colon == std::string::npos || dash == std::string::npos)
	  throw ConfigurationError("GroupAllocation: malformed bucket range '" + entry +
				   "', expected label:lo-hi");

	Range r;
	r.label = boost::algorithm::trim_copy(entry.substr(0, colon));
	try
	  {
	    r.lo = boost::lexical_cast<std::size_t>(boost::algorithm::trim_copy(entry.substr(colon + 1, dash - colon - 1)));
	    r.hi = boost::lexical_cast<std::size_t>(boost::algorithm::trim_copy(entry.substr(dash + 1)));
	  }
	catch (const boost::bad_lexical_cast&)
	  {
	    throw ConfigurationError("GroupAllocation: non-numeric bounds in bucket range '" +
				     entry + "'");
	  }

	if (r.label.empty() || r.lo >= r.hi)
	  throw ConfigurationError("GroupAllocation: empty label or empty range in '" + entry + "'");

	parsed.push_back(r);
      }

    if (parsed.empty())
      throw ConfigurationError("GroupAllocation: no bucket ranges in '" + ranges + "'");

    std::stable_sort(parsed.begin(), parsed.end(),
		     [](const Range& a, const Range& b) { return a.lo < b.lo; });

    std::size_t expectedLo = 0;
    std::vector<GroupWeight> weights;
    for (const auto& r : parsed)
      {
	if (r.lo != expectedLo)
	  {
	    std::ostringstream os;
	    os << "GroupAllocation: bucket ranges must be contiguous; range for '" << r.label
	       << "' starts at " << r.lo << " but " << expectedLo << " was expected";
	    throw ConfigurationError(os.str());
	  }

	weights.emplace_back(r.label,
			     static_cast<double>(r.hi - r.lo) / static_cast<double>(bucketCount));
	expectedLo = r.hi;
      }

    if (expectedLo != bucketCount)
      {
	std::ostringstream os;
	os << "GroupAllocation: bucket ranges cover [0, " << expectedLo << ") but must cover [0, "
	   << bucketCount << ")";
	throw ConfigurationError(os.str());
      }

    return GroupAllocation(std::move(weights));
  }

  GroupAllocation GroupAllocation::evenSplit(const std::vector<std::string>& labels)
  {
    if (labels.empty())
      throw ConfigurationError("GroupAllocation: at least one group is required");

    std::vector<GroupWeight> weights;
    const double w = 1.0 / static_cast<double>(labels.size());
    for (const auto& label : labels)
      weights.emplace_back(label, w);

    return GroupAllocation(std::move(weights));
  }

  std::vector<std::string> GroupAllocation::getLabels() const
  {
    std::vector<std::string> labels;
    labels.reserve(mWeights.size());
    for (const auto& gw : mWeights)
      labels.push_back(gw.first);

    return labels;
  }

  bool GroupAllocation::contains(const std::string& label) const
  {
    return std::any_of(mWeights.begin(), mWeights.end(),
		       [&label](const GroupWeight& gw) { return gw.first == label; });
  }

  double GroupAllocation::getWeight(const std::string& label) const
  {
    for (const auto& gw : mWeights)
      if (gw.first == label)
	return gw.second;

    throw ConfigurationError("GroupAllocation: unknown group '" + label + "'");
  }

  const std::string& GroupAllocation::groupForUnit(double u) const
  {
    const auto it = std::upper_bound(mCumulative.begin(), mCumulative.end(), u);
    if (it == mCumulative.end())
      return mWeights.back().first;

    return mWeights[static_cast<std::size_t>(it - mCumulative.begin())].first;
  }

  // Integer bucket boundaries. Rounding the cumulative weights avoids the
  // 0.1 + 0.2 != 0.3 problem when weights came from integer ranges.
  std::vector<std::size_t> GroupAllocation::bucketUpperBounds(std::size_t bucketCount) const
  {
    std::vector<std::size_t> bounds;
    bounds.reserve(mCumulative.size());
    for (double c : mCumulative)
      bounds.push_back(static_cast<std::size_t>(std::llround(c * static_cast<double>(bucketCount))));

    bounds.back() = bucketCount;
    return bounds;
  }

  const std::string& GroupAllocation::groupForBucket(std::size_t bucket, std::size_t bucketCount) const
  {
    if (bucketCount == 0 || bucket >= bucketCount)
      throw ConfigurationError("GroupAllocation: bucket outside [0, bucket_count)");

    const auto bounds = bucketUpperBounds(bucketCount);
    const auto it = std::upper_bound(bounds.begin(), bounds.end(), bucket);
    return mWeights[static_cast<std::size_t>(it - bounds.begin())].first;
  }

  std::string GroupAllocation::toBucketRanges(std::size_t bucketCount) const
  {
    const auto bounds = bucketUpperBounds(bucketCount);
    std::ostringstream os;
    std::size_t lo = 0;
    for (std::size_t i = 0; i < mWeights.size(); ++i)
      {
	if (i > 0)
	  os << ",";
	os << mWeights[i].first << ":" << lo << "-" << bounds[i];
	lo = bounds[i];
      }

    return os.str();
  }

  BucketingEngine::BucketingEngine(const EngineDefaults& defaults)
    : mDefaultStrategy(defaults.bucketingStrategy),
      mBucketCount(defaults.bucketCount)
  {
    if (mBucketCount == 0)
      throw ConfigurationError("BucketingEngine: bucket count must be positive");
  }

  uint64_t BucketingEngine::subjectHash(const std::string& subjectId, const std::string& experimentKey)
  {
    // Unit separator keeps ("ab", "c") and ("a", "bc") apart
    std::string material(subjectId);
    material.push_back('\x1f');
    material.append(experimentKey);
    return rng_utils::hash_string64(material);
  }

  std::size_t BucketingEngine::bucketOf(const std::string& subjectId,
					const std::string& experimentKey) const
  {
    return static_cast<std::size_t>(subjectHash(subjectId, experimentKey) % mBucketCount);
  }

  double BucketingEngine::unitValue(const std::string& subjectId,
				    const std::string& experimentKey,
				    BucketingStrategy strategy,
				    std::optional<uint64_t> seed) const
  {
    switch (strategy)
      {
      case BucketingStrategy::Hash:
	return rng_utils::to_unit_interval(subjectHash(subjectId, experimentKey));

      case BucketingStrategy::SeededRandom:
	{
	  if (!seed)
	    throw ConfigurationError("BucketingEngine: the seeded random strategy requires an explicit seed");

	  CRNEngineProvider<randutils::mt19937_rng> provider(
	    CRNKey(*seed, { rng_utils::fnv1a64(experimentKey) }));
	  auto rng = provider.make_engine(static_cast<std::size_t>(rng_utils::fnv1a64(subjectId)));
	  return rng_utils::get_random_uniform_01(rng);
	}

      case BucketingStrategy::Bucket:
	return static_cast<double>(bucketOf(subjectId, experimentKey)) /
	  static_cast<double>(mBucketCount);

      default:
	throw ConfigurationError("BucketingEngine: unknown bucketing strategy");
      }
  }

  std::string BucketingEngine::assign(const std::string& subjectId,
				      const std::string& experimentKey,
				      const GroupAllocation& allocation) const
  {
    return assign(subjectId, experimentKey, mDefaultStrategy, allocation);
  }

  std::string BucketingEngine::assign(const std::string& subjectId,
				      const std::string& experimentKey,
				      BucketingStrategy strategy,
				      const GroupAllocation& allocation,
				      std::optional<uint64_t> seed) const
  {
    if (strategy == BucketingStrategy::Bucket)
      return allocation.groupForBucket(bucketOf(subjectId, experimentKey), mBucketCount);

    return allocation.groupForUnit(unitValue(subjectId, experimentKey, strategy, seed));
  }

  GroupAssignment BucketingEngine::assignAll(const std::vector<std::string>& subjectIds,
					     const std::string& experimentKey,
					     BucketingStrategy strategy,
					     const GroupAllocation& allocation,
					     std::optional<uint64_t> seed) const
  {
    if (strategy == BucketingStrategy::SeededRandom && !seed)
      throw ConfigurationError("BucketingEngine: the seeded random strategy requires an explicit seed");

    GroupAssignment result;
    for (const auto& id : subjectIds)
      result.emplace(id, assign(id, experimentKey, strategy, allocation, seed));

    return result;
  }

  std::size_t BucketingEngine::reassignmentCount(const GroupAssignment& before,
						 const GroupAssignment& after)
  {
    std::size_t moved = 0;
    for (const auto& entry : before)
      {
	const auto it = after.find(entry.first);
	if (it != after.end() && it->second != entry.second)
	  ++moved;
      }

    return moved;
  }

  std::map<std::string, std::size_t> BucketingEngine::countByGroup(const GroupAssignment& assignment)
  {
    std::map<std::string, std::size_t> counts;
    for (const auto& entry : assignment)
      ++counts[entry.second];

    return counts;
  }

} // namespace mkc_abtest
