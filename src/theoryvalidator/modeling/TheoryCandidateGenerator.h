#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "CohortDataset.h"
#include "EvaluationTypes.h"
#include "FeatureTypes.h"
#include "TargetDefinition.h"

namespace theory_validator
{
  namespace modeling
  {
    struct CandidatePolicy
    {
      std::size_t minSampleSize{150};
      double minLift{0.02};
      std::size_t maxFeatures{25};
      std::size_t maxCandidates{10};
    };

    /**
     * @brief A single-feature quartile condition and how its games fared.
     *
     * lift is hitRate minus the cohort-wide baseline rate and may be
     * negative. Candidates are drafts for a person to review.
     */
    struct TheoryCandidate
    {
      std::string feature;
      std::string condition;
      // ">=" for the upper quartile, "<=" for the lower quartile.
      std::string op;
      double threshold{0.0};
      std::size_t sampleSize{0};
      double hitRate{0.0};
      double baselineRate{0.0};
      double lift{0.0};
      std::string framingDraft;
      std::string status{"draft"};
    };

    struct SuggestedTheory
    {
      std::string text;
      std::vector<std::string> featuresUsed;
      double historicalEdge{0.0};
      std::string confidence;
    };

    /**
     * @brief Turns a binary-target dataset into draft theories.
     *
     * For each of the first maxFeatures columns the side of the feature that
     * wins more often decides the condition: the upper quartile when winners
     * average higher, the lower quartile otherwise. A condition becomes a
     * candidate when at least minSampleSize games meet it and |lift| is at
     * least minLift. Candidates are ranked by |lift|, then sample size, then
     * feature name, and the first maxCandidates are kept.
     */
    class TheoryCandidateGenerator
    {
    public:
      explicit TheoryCandidateGenerator(const CandidatePolicy& policy);

      std::vector<TheoryCandidate> generate(const std::vector<features::GeneratedFeature>& columns,
					    const std::vector<std::size_t>& columnIndices,
					    const std::vector<const cohort::CohortRow*>& rows,
					    const evaluation::TargetDefinition& target) const;

      // Top three correlations followed by the two strongest candidates.
      static std::vector<SuggestedTheory> suggest(const std::vector<evaluation::FeatureCorrelation>& correlations,
						  const std::vector<TheoryCandidate>& candidates);

    private:
      CandidatePolicy mPolicy;
    };
  }
}
