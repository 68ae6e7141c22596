// Copyright 2025 Findex Project
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>
#include <findex/core/types.h>
#include <findex/metadata/catalog_store.h>
#include <findex/metadata/catalog_types.h>

namespace findex::search {

inline constexpr double kDefaultMinScore = 70.0;
inline constexpr std::size_t kDefaultSearchLimit = 5;

struct RankingConfig {
    double minScore = kDefaultMinScore;
    std::size_t candidateCap = metadata::kDefaultCandidateCap;
};

struct NormalizedQuery {
    std::string text;                ///< normalizeFilename() of the raw query
    std::vector<std::string> tokens; ///< whitespace tokens of `text`
};

NormalizedQuery normalizeQuery(std::string_view rawQuery);

/**
 * @brief A catalog row plus the derived fields every scoring term reads
 */
struct Candidate {
    metadata::FileSystemEntry entry;
    std::string normalizedName;
    std::string lowerPath;
    double ageDays = 0.0;
};

Candidate makeCandidate(const metadata::FileSystemEntry& entry, double nowEpochSeconds);

/**
 * Individual scoring terms. Each is a pure function of the query and one candidate;
 * RankingEngine sums them.
 */
namespace scoring {

/// Best token-set similarity of the query against the normalized name or the lowercased path
double fuzzyBase(const NormalizedQuery& query, const Candidate& candidate);

/// +40 when the query equals the normalized name, +20 when it is a substring of it
double exactBoost(const NormalizedQuery& query, const Candidate& candidate);

/// +15 when the query is a substring of the normalized name
double nameVsPathBoost(const NormalizedQuery& query, const Candidate& candidate);

/// +20 under a day old, +10 under a week, +5 under 30 days
double recencyBoost(const Candidate& candidate);

/// +25 when the query names a document type ("pdf", "word", "excel", ...) the candidate has
double extensionIntentBoost(const NormalizedQuery& query, const Candidate& candidate);

/// +5 per query token found in the lowercased path
double folderContextBoost(const NormalizedQuery& query, const Candidate& candidate);

/// 0.5 per path separator; subtracted from the total
double depthPenalty(const Candidate& candidate);

} // namespace scoring

struct ScoreBreakdown {
    double fuzzyBase = 0.0;
    double exactBoost = 0.0;
    double nameVsPathBoost = 0.0;
    double recencyBoost = 0.0;
    double extensionIntentBoost = 0.0;
    double folderContextBoost = 0.0;
    double depthPenalty = 0.0;

    double total() const {
        return fuzzyBase + exactBoost + nameVsPathBoost + recencyBoost + extensionIntentBoost +
               folderContextBoost - depthPenalty;
    }
};

ScoreBreakdown scoreCandidate(const NormalizedQuery& query, const Candidate& candidate);

struct RankedEntry {
    metadata::FileSystemEntry entry;
    ScoreBreakdown breakdown;
    double score = 0.0;
};

/**
 * @brief Fuzzy, weighted lookup of catalog entries by spoken or typed name.
 *
 * Candidates come from CatalogStore::queryCandidates(); each is scored, those under
 * the minimum score are dropped, and the rest are ordered by descending score. Ties
 * keep prefilter order.
 */
class RankingEngine {
public:
    explicit RankingEngine(metadata::CatalogStore& store, RankingConfig config = {});

    Result<std::vector<metadata::FileSystemEntry>> search(std::string_view query,
                                                          std::size_t limit = kDefaultSearchLimit);

    /**
     * @brief Same as search() but keeps the score and its breakdown for each result.
     */
    Result<std::vector<RankedEntry>> searchDetailed(std::string_view query,
                                                    std::size_t limit = kDefaultSearchLimit);

    /**
     * @brief Score and order an explicit candidate list. Touches neither the store nor the clock.
     */
    std::vector<RankedEntry> rank(const NormalizedQuery& query,
                                  const std::vector<metadata::FileSystemEntry>& candidates,
                                  double nowEpochSeconds, std::size_t limit) const;

    const RankingConfig& config() const { return config_; }

private:
    metadata::CatalogStore& store_;
    RankingConfig config_;
};

} // namespace findex::search
