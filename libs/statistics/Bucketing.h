// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __BUCKETING_H
#define __BUCKETING_H 1

#include <cstdint>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "ABTestTypes.h"
#include "ABTestConfiguration.h"

namespace mkc_abtest
{
  /**
   * @brief Ordered list of (group label, weight) pairs.
   *
   * Weights must be positive and sum to one within the engine tolerance.
   * The order is significant: a uniform draw u in [0,1) lands in the first
   * group whose cumulative weight exceeds u.
   */
  class GroupAllocation
  {
  public:
    using GroupWeight = std::pair<std::string, double>;

    GroupAllocation(std::vector<GroupWeight> weights, double tolerance = 1e-9);

    /**
     * @brief Parse bucket range syntax, e.g. "control:0-50,test1:50-100".
     *
     * Ranges are half open [lo, hi) over bucketCount buckets. They must not
     * overlap and together must cover [0, bucketCount).
     *
     * @throws ConfigurationError on malformed text, gaps, overlaps or
     *         duplicate labels.
     */
    static GroupAllocation fromBucketRanges(const std::string& ranges,
					    std::size_t bucketCount = 100);

    // Equal weights over the given labels
    static GroupAllocation evenSplit(const std::vector<std::string>& labels);

    const std::vector<GroupWeight>& getWeights() const
    {
      return mWeights;
    }

    std::vector<std::string> getLabels() const;

    std::size_t size() const
    {
      return mWeights.size();
    }

    bool contains(const std::string& label) const;

    double getWeight(const std::string& label) const;

    // Group whose cumulative weight interval contains u in [0,1)
    const std::string& groupForUnit(double u) const;

    // Group for an integer bucket in [0, bucketCount)
    const std::string& groupForBucket(std::size_t bucket, std::size_t bucketCount) const;

    // Canonical text form in bucket range syntax
    std::string toBucketRanges(std::size_t bucketCount = 100) const;

  private:
    std::vector<std::size_t> bucketUpperBounds(std::size_t bucketCount) const;

  private:
    std::vector<GroupWeight> mWeights;
    std::vector<double> mCumulative;
  };

  // subject id -> group label
  using GroupAssignment = std::map<std::string, std::string>;

  /**
   * @brief Deterministic assignment of subjects to experiment groups.
   *
   * Every strategy is a pure function of (subject id, experiment key, seed,
   * allocation): running twice yields the same map. Changing the allocation
   * never rewrites an existing assignment; reassignmentCount reports how
   * many subjects would move so the caller can decide what to do.
   */
  class BucketingEngine
  {
  public:
    explicit BucketingEngine(const EngineDefaults& defaults);

    std::string assign(const std::string& subjectId,
		       const std::string& experimentKey,
		       const GroupAllocation& allocation) const;

    std::string assign(const std::string& subjectId,
		       const std::string& experimentKey,
		       BucketingStrategy strategy,
		       const GroupAllocation& allocation,
		       std::optional<uint64_t> seed = std::nullopt) const;

    GroupAssignment assignAll(const std::vector<std::string>& subjectIds,
			      const std::string& experimentKey,
			      BucketingStrategy strategy,
			      const GroupAllocation& allocation,
			      std::optional<uint64_t> seed = std::nullopt) const;

    // Bucket in [0, bucketCount) used by the bucket strategy
    std::size_t bucketOf(const std::string& subjectId, const std::string& experimentKey) const;

    // Uniform value in [0,1) used by the hash and seeded random strategies
    double unitValue(const std::string& subjectId,
		     const std::string& experimentKey,
		     BucketingStrategy strategy,
		     std::optional<uint64_t> seed) const;

    std::size_t getBucketCount() const
    {
      return mBucketCount;
    }

    /**
     * @brief Number of subjects present in both maps whose group differs.
     */
    static std::size_t reassignmentCount(const GroupAssignment& before,
					 const GroupAssignment& after);

    static std::map<std::string, std::size_t> countByGroup(const GroupAssignment& assignment);

  private:
    static uint64_t subjectHash(const std::string& subjectId, const std::string& experimentKey);

  private:
    BucketingStrategy mDefaultStrategy;
    std::size_t mBucketCount;
  };

} // namespace mkc_abtest

#endif
