/*
 * Copyright (C) 2025 TRS contributors
 *
 * This file is part of TRS.
 *
 * TRS is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * TRS is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with TRS.  If not, see <http://www.gnu.org/licenses/>.
 */

#include "RecommendationService.hpp"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

#include "backend/IDataFetcher.hpp"
#include "core/ILogger.hpp"
#include "services/recommendation/Exception.hpp"

#include "CollaborativeScorer.hpp"
#include "Explanation.hpp"

#define LOG(sev, message) TRS_LOG(RECOMMENDATION, sev, "[Recommendation] " << message)

namespace trs::recommendation
{
    namespace
    {
        // Candidates of a lower tier always rank first
        enum class Tier
        {
            Primary,
            Fill,
        };

        struct RankedCandidate
        {
            Tier tier;
            CandidateScore candidate;
        };

        using ItemsByKey = std::unordered_map<backend::ItemKey, const backend::Item*>;

        void addCandidates(std::vector<RankedCandidate>& candidates, const ItemsByKey& itemsByKey, const ScoreMap& scores, Tier tier, Provenance provenance)
        {
            for (const auto& [itemKey, score] : scores)
            {
                if (!itemsByKey.contains(itemKey))
                {
                    LOG(WARNING, "Discarding score of unknown item " << itemKey);
                    continue;
                }

                candidates.push_back(RankedCandidate{ .tier = tier, .candidate = CandidateScore{ .itemKey = itemKey, .score = score, .provenance = provenance } });
            }
        }

        // Sort by tier, score descending then item key, dedup (first occurrence wins) and truncate
        std::vector<CandidateScore> rankCandidates(std::vector<RankedCandidate>& candidates, std::size_t desiredCount)
        {
            std::sort(std::begin(candidates), std::end(candidates), [](const RankedCandidate& a, const RankedCandidate& b) {
                if (a.tier != b.tier)
                    return a.tier < b.tier;
                if (a.candidate.score != b.candidate.score)
                    return a.candidate.score > b.candidate.score;
                return a.candidate.itemKey < b.candidate.itemKey;
            });

            std::vector<CandidateScore> res;
            std::unordered_set<backend::ItemKey> seenItemKeys;
            for (const RankedCandidate& rankedCandidate : candidates)
            {
                if (res.size() >= desiredCount)
                    break;

                if (seenItemKeys.insert(rankedCandidate.candidate.itemKey).second)
                    res.push_back(rankedCandidate.candidate);
            }

            return res;
        }

        std::unordered_set<backend::ItemKey> getCompletedItemKeys(const backend::InteractionHistory& history)
        {
            std::unordered_set<backend::ItemKey> res;
            for (const backend::Interaction& interaction : history.interactions)
            {
                if (interaction.type == backend::InteractionType::Completed)
                    res.insert(backend::getItemKey(interaction));
            }

            return res;
        }

        std::string describeItemType(std::optional<backend::ItemType> itemType)
        {
            return itemType ? " of type '" + std::string{ backend::toString(*itemType) } + "'" : std::string{};
        }
    } // namespace

    std::unique_ptr<IRecommendationService> createRecommendationService(backend::IDataFetcher& dataFetcher, const RecommendationSettings& settings)
    {
        return createRecommendationService(dataFetcher, settings, createCosineSimilarityScorer(settings.similarity), createPopularityColdStartPolicy(settings.coldStart));
    }

    std::unique_ptr<IRecommendationService> createRecommendationService(backend::IDataFetcher& dataFetcher, const RecommendationSettings& settings, std::unique_ptr<ISimilarityScorer> similarityScorer, std::unique_ptr<IColdStartPolicy> coldStartPolicy)
    {
        return std::make_unique<RecommendationService>(dataFetcher, settings, std::move(similarityScorer), std::move(coldStartPolicy));
    }

    RecommendationService::RecommendationService(backend::IDataFetcher& dataFetcher, const RecommendationSettings& settings, std::unique_ptr<ISimilarityScorer> similarityScorer, std::unique_ptr<IColdStartPolicy> coldStartPolicy)
        : _dataFetcher{ dataFetcher }
        , _settings{ settings }
        , _similarityScorer{ std::move(similarityScorer) }
        , _coldStartPolicy{ std::move(coldStartPolicy) }
        , _normalizer{ settings.normalization }
    {
        validateSettings(_settings);

        if (!_similarityScorer || !_coldStartPolicy)
            throw Exception{ "Missing scorer" };
    }

    RecommendationList RecommendationService::recommend(const backend::LearnerId& learnerId, std::size_t desiredCount, const RecommendOptions& options) const
    {
        if (desiredCount == 0)
            return {};

        const Snapshot snapshot{ fetchSnapshot(learnerId, options.itemTypeFilter) };
        if (snapshot.catalog.empty())
            throw InsufficientCatalogException{ "Empty catalog" };

        const bool includeCompleted{ options.includeCompleted.value_or(_settings.includeCompletedByDefault) };
        RecommendationList res{ rank(snapshot, desiredCount, includeCompleted, options.itemTypeFilter) };
        if (!res.empty())
            return res;

        // nothing ranked means no candidate at all, completed items are only filtered out of the cold start
        const bool hasCandidate{ std::any_of(std::cbegin(snapshot.catalog), std::cend(snapshot.catalog), [&](const backend::Item& item) { return !options.itemTypeFilter || item.type == *options.itemTypeFilter; }) };
        if (!hasCandidate)
            throw InsufficientCatalogException{ "No candidate item" + describeItemType(options.itemTypeFilter) };

        return res;
    }

    RecommendationsPerItemType RecommendationService::recommendPerItemType(const backend::LearnerId& learnerId, std::size_t desiredCount, std::optional<bool> includeCompleted) const
    {
        RecommendationsPerItemType res{
            { backend::ItemType::Test, {} },
            { backend::ItemType::Lecture, {} },
        };

        if (desiredCount == 0)
            return res;

        const Snapshot snapshot{ fetchSnapshot(learnerId, std::nullopt) };
        if (snapshot.catalog.empty())
            throw InsufficientCatalogException{ "Empty catalog" };

        const bool doIncludeCompleted{ includeCompleted.value_or(_settings.includeCompletedByDefault) };
        for (auto& [itemType, recommendations] : res)
            recommendations = rank(snapshot, desiredCount, doIncludeCompleted, itemType);

        return res;
    }

    RecommendationService::Snapshot RecommendationService::fetchSnapshot(const backend::LearnerId& learnerId, std::optional<backend::ItemType> itemTypeFilter) const
    {
        Snapshot snapshot;
        snapshot.history = _dataFetcher.fetchInteractionHistory(learnerId);

        const bool useSimilarity{ snapshot.history.interactions.size() >= _settings.coldStartThreshold };

        // the interacted items must be resolved from the catalog, unless they are all of the requested type
        std::optional<backend::ItemType> catalogItemType{ itemTypeFilter };
        if (catalogItemType && useSimilarity)
        {
            const bool needsOtherTypes{ std::any_of(std::cbegin(snapshot.history.interactions), std::cend(snapshot.history.interactions), [&](const backend::Interaction& interaction) { return interaction.itemType != *itemTypeFilter; }) };
            if (needsOtherTypes)
                catalogItemType.reset();
        }
        snapshot.catalog = _dataFetcher.fetchCatalog(catalogItemType);

        if (useSimilarity && _settings.collaborative.weight > 0)
            snapshot.peerProfiles = _dataFetcher.fetchPeerProfiles();

        return snapshot;
    }

    RecommendationList RecommendationService::rank(const Snapshot& snapshot, std::size_t desiredCount, bool includeCompleted, std::optional<backend::ItemType> itemTypeFilter) const
    {
        RecommendationList res;

        const backend::InteractionHistory& history{ snapshot.history };
        const backend::LearnerId& learnerId{ history.learnerId };
        const std::unordered_set<backend::ItemKey> completedItemKeys{ getCompletedItemKeys(history) };

        backend::Catalog candidates;
        backend::Catalog coldStartCandidates;
        for (const backend::Item& item : snapshot.catalog)
        {
            if (itemTypeFilter && item.type != *itemTypeFilter)
                continue;

            candidates.push_back(item);
            if (includeCompleted || !completedItemKeys.contains(backend::getItemKey(item)))
                coldStartCandidates.push_back(item);
        }

        if (candidates.empty())
        {
            LOG(DEBUG, "No candidate item" << describeItemType(itemTypeFilter) << " for learner '" << learnerId << "'");
            return res;
        }

        ItemsByKey itemsByKey;
        for (const backend::Item& item : candidates)
            itemsByKey.try_emplace(backend::getItemKey(item), &item);

        const auto computeColdStartScores{ [&] {
            ScoreMap scores{ _coldStartPolicy->score(history.attributes, coldStartCandidates) };
            _normalizer.normalize(scores);
            return scores;
        } };

        std::vector<RankedCandidate> rankedCandidates;
        if (history.interactions.size() >= _settings.coldStartThreshold)
        {
            ScoreMap similarityScores{ _similarityScorer->score(history, snapshot.catalog, candidates, includeCompleted) };
            _normalizer.normalize(similarityScores);
            blendPeerScores(similarityScores, snapshot, candidates);

            std::optional<ScoreMap> coldStartScores;
            if (_settings.blendMode == BlendMode::Weighted && !similarityScores.empty())
            {
                coldStartScores = computeColdStartScores();
                for (auto& [itemKey, score] : similarityScores)
                {
                    auto itColdStart{ coldStartScores->find(itemKey) };
                    const double coldStartScore{ itColdStart != std::cend(*coldStartScores) ? itColdStart->second : 0 };
                    score = _settings.similarityWeight * score + (1 - _settings.similarityWeight) * coldStartScore;
                }
                addCandidates(rankedCandidates, itemsByKey, similarityScores, Tier::Primary, Provenance::Blended);
            }
            else
                addCandidates(rankedCandidates, itemsByKey, similarityScores, Tier::Primary, Provenance::Similarity);

            if (similarityScores.size() < desiredCount)
            {
                LOG(DEBUG, "Similarity produced " << similarityScores.size() << " candidates" << describeItemType(itemTypeFilter) << " for learner '" << learnerId << "', filling with cold start");
                if (!coldStartScores)
                    coldStartScores = computeColdStartScores();
                addCandidates(rankedCandidates, itemsByKey, *coldStartScores, Tier::Fill, Provenance::ColdStart);
            }
        }
        else
        {
            LOG(DEBUG, "Learner '" << learnerId << "' has " << history.interactions.size() << " interactions, using cold start");
            addCandidates(rankedCandidates, itemsByKey, computeColdStartScores(), Tier::Primary, Provenance::ColdStart);
        }

        for (const CandidateScore& candidate : rankCandidates(rankedCandidates, desiredCount))
        {
            const backend::Item& item{ *itemsByKey.at(candidate.itemKey) };
            std::optional<ItemProgress> progress{ computeItemProgress(item, history) };
            std::string explanation{ buildExplanation(item, progress, history.attributes, candidate.provenance) };

            res.push_back(Recommendation{ .itemId = item.id, .itemType = item.type, .name = item.name, .score = candidate.score, .provenance = candidate.provenance, .explanation = std::move(explanation), .progress = std::move(progress) });
        }

        LOG(DEBUG, "Recommended " << res.size() << "/" << desiredCount << " items" << describeItemType(itemTypeFilter) << " to learner '" << learnerId << "'");
        return res;
    }

    void RecommendationService::blendPeerScores(ScoreMap& scores, const Snapshot& snapshot, std::span<const backend::Item> candidates) const
    {
        const double weight{ _settings.collaborative.weight };
        if (weight <= 0 || scores.empty())
            return;

        const std::vector<Peer> peers{ findPeers(snapshot.history, snapshot.peerProfiles, _settings.collaborative.peerCount) };
        if (peers.empty())
            return;

        ScoreMap peerScores{ scoreFromPeers(peers, candidates) };
        _normalizer.normalize(peerScores);

        for (auto& [itemKey, score] : scores)
        {
            auto itPeerScore{ peerScores.find(itemKey) };
            const double peerScore{ itPeerScore != std::cend(peerScores) ? itPeerScore->second : 0 };
            score = (1 - weight) * score + weight * peerScore;
        }
    }
} // namespace trs::recommendation
