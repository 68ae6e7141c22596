// Copyright 2025 Findex Project
// SPDX-License-Identifier: GPL-3.0-or-later

#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <chrono>
#include <utility>
#include <findex/metadata/path_utils.h>
#include <findex/search/ranking.h>
#include <findex/search/similarity.h>
#include <findex/search/text_normalize.h>

namespace findex::search {

namespace {

constexpr double kSecondsPerDay = 86400.0;

constexpr std::array<std::pair<std::string_view, std::string_view>, 7> kExtensionKeywords = {{
    {"pdf", ".pdf"},
    {"word", ".docx"},
    {"doc", ".docx"},
    {"excel", ".xlsx"},
    {"sheet", ".xlsx"},
    {"powerpoint", ".pptx"},
    {"presentation", ".pptx"},
}};

bool contains(std::string_view haystack, std::string_view needle) {
    return haystack.find(needle) != std::string_view::npos;
}

double currentEpochSeconds() {
    return std::chrono::duration<double>(std::chrono::system_clock::now().time_since_epoch())
        .count();
}

} // namespace

NormalizedQuery normalizeQuery(std::string_view rawQuery) {
    NormalizedQuery q;
    q.text = normalizeFilename(rawQuery);
    q.tokens = splitWhitespace(q.text);
    return q;
}

Candidate makeCandidate(const metadata::FileSystemEntry& entry, double nowEpochSeconds) {
    Candidate c;
    c.entry = entry;
    c.normalizedName = normalizeFilename(entry.name);
    c.lowerPath = toLowerAscii(entry.path);
    c.ageDays = (nowEpochSeconds - entry.lastModified) / kSecondsPerDay;
    return c;
}

namespace scoring {

double fuzzyBase(const NormalizedQuery& query, const Candidate& candidate) {
    return std::max(tokenSetRatio(query.text, candidate.normalizedName),
                    tokenSetRatio(query.text, candidate.lowerPath));
}

double exactBoost(const NormalizedQuery& query, const Candidate& candidate) {
    if (query.text == candidate.normalizedName)
        return 40.0;
    if (contains(candidate.normalizedName, query.text))
        return 20.0;
    return 0.0;
}

double nameVsPathBoost(const NormalizedQuery& query, const Candidate& candidate) {
    return contains(candidate.normalizedName, query.text) ? 15.0 : 0.0;
}

double recencyBoost(const Candidate& candidate) {
    if (candidate.ageDays < 1.0)
        return 20.0;
    if (candidate.ageDays < 7.0)
        return 10.0;
    if (candidate.ageDays < 30.0)
        return 5.0;
    return 0.0;
}

double extensionIntentBoost(const NormalizedQuery& query, const Candidate& candidate) {
    for (const auto& [keyword, extension] : kExtensionKeywords) {
        if (contains(query.text, keyword) && candidate.entry.extension == extension)
            return 25.0;
    }
    return 0.0;
}

double folderContextBoost(const NormalizedQuery& query, const Candidate& candidate) {
    double boost = 0.0;
    for (const auto& token : query.tokens) {
        if (contains(candidate.lowerPath, token))
            boost += 5.0;
    }
    return boost;
}

double depthPenalty(const Candidate& candidate) {
    return 0.5 * metadata::countSeparators(candidate.lowerPath);
}

} // namespace scoring

ScoreBreakdown scoreCandidate(const NormalizedQuery& query, const Candidate& candidate) {
    ScoreBreakdown b;
    b.fuzzyBase = scoring::fuzzyBase(query, candidate);
    b.exactBoost = scoring::exactBoost(query, candidate);
    b.nameVsPathBoost = scoring::nameVsPathBoost(query, candidate);
    b.recencyBoost = scoring::recencyBoost(candidate);
    b.extensionIntentBoost = scoring::extensionIntentBoost(query, candidate);
    b.folderContextBoost = scoring::folderContextBoost(query, candidate);
    b.depthPenalty = scoring::depthPenalty(candidate);
    return b;
}

RankingEngine::RankingEngine(metadata::CatalogStore& store, RankingConfig config)
    : store_(store), config_(config) {}

Result<std::vector<metadata::FileSystemEntry>> RankingEngine::search(std::string_view query,
                                                                     std::size_t limit) {
    auto ranked = searchDetailed(query, limit);
    if (!ranked)
        return ranked.error();

    std::vector<metadata::FileSystemEntry> entries;
    entries.reserve(ranked.value().size());
    for (const auto& r : ranked.value()) {
        entries.push_back(r.entry);
    }
    return entries;
}

Result<std::vector<RankedEntry>> RankingEngine::searchDetailed(std::string_view query,
                                                               std::size_t limit) {
    const auto normalized = normalizeQuery(query);
    if (normalized.tokens.empty() || limit == 0) {
        return std::vector<RankedEntry>{};
    }

    auto candidates = store_.queryCandidates(normalized.tokens, config_.candidateCap);
    if (!candidates) {
        spdlog::error("[RankingEngine] Candidate query for '{}' failed: {}", normalized.text,
                      candidates.error().message);
        return candidates.error();
    }

    auto ranked = rank(normalized, candidates.value(), currentEpochSeconds(), limit);
    spdlog::debug("[RankingEngine] '{}': {} candidates, {} above threshold", normalized.text,
                  candidates.value().size(), ranked.size());
    return ranked;
}

std::vector<RankedEntry>
RankingEngine::rank(const NormalizedQuery& query,
                    const std::vector<metadata::FileSystemEntry>& candidates,
                    double nowEpochSeconds, std::size_t limit) const {
    std::vector<RankedEntry> ranked;
    for (const auto& entry : candidates) {
        const auto candidate = makeCandidate(entry, nowEpochSeconds);
        RankedEntry r;
        r.breakdown = scoreCandidate(query, candidate);
        r.score = r.breakdown.total();
        if (r.score < config_.minScore)
            continue;
        r.entry = entry;
        ranked.push_back(std::move(r));
    }

    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const RankedEntry& a, const RankedEntry& b) { return a.score > b.score; });

    if (ranked.size() > limit) {
        ranked.resize(limit);
    }
    return ranked;
}

} // namespace findex::search
