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

#pragma once

#include <memory>
#include <optional>
#include <span>
#include <vector>

#include "services/recommendation/IColdStartPolicy.hpp"
#include "services/recommendation/IRecommendationService.hpp"
#include "services/recommendation/ISimilarityScorer.hpp"

#include "ScoreNormalizer.hpp"

namespace trs::recommendation
{
    class RecommendationService : public IRecommendationService
    {
    public:
        RecommendationService(backend::IDataFetcher& dataFetcher, const RecommendationSettings& settings, std::unique_ptr<ISimilarityScorer> similarityScorer, std::unique_ptr<IColdStartPolicy> coldStartPolicy);
        ~RecommendationService() override = default;
        RecommendationService(const RecommendationService&) = delete;
        RecommendationService& operator=(const RecommendationService&) = delete;

    private:
        RecommendationList recommend(const backend::LearnerId& learnerId, std::size_t desiredCount, const RecommendOptions& options) const override;
        RecommendationsPerItemType recommendPerItemType(const backend::LearnerId& learnerId, std::size_t desiredCount, std::optional<bool> includeCompleted) const override;
        const RecommendationSettings& getSettings() const override { return _settings; }

        // Data a request is ranked from, fetched once
        struct Snapshot
        {
            backend::InteractionHistory history;
            backend::Catalog catalog;
            std::vector<backend::InteractionHistory> peerProfiles; // only fetched if needed
        };
        Snapshot fetchSnapshot(const backend::LearnerId& learnerId, std::optional<backend::ItemType> itemTypeFilter) const;

        // Empty if there is no candidate
        RecommendationList rank(const Snapshot& snapshot, std::size_t desiredCount, bool includeCompleted, std::optional<backend::ItemType> itemTypeFilter) const;
        void blendPeerScores(ScoreMap& scores, const Snapshot& snapshot, std::span<const backend::Item> candidates) const;

        backend::IDataFetcher& _dataFetcher;
        const RecommendationSettings _settings;
        const std::unique_ptr<ISimilarityScorer> _similarityScorer;
        const std::unique_ptr<IColdStartPolicy> _coldStartPolicy;
        const ScoreNormalizer _normalizer;
    };
} // namespace trs::recommendation
