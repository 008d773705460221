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

#include <cstddef>
#include <memory>
#include <optional>

#include "backend/Types.hpp"
#include "services/recommendation/IColdStartPolicy.hpp"
#include "services/recommendation/ISimilarityScorer.hpp"
#include "services/recommendation/RecommendationSettings.hpp"
#include "services/recommendation/Types.hpp"

namespace trs::backend
{
    class IDataFetcher;
}

namespace trs::recommendation
{
    class IRecommendationService
    {
    public:
        virtual ~IRecommendationService() = default;

        // throws InsufficientCatalogException, InvalidFeatureDimensionException,
        // backend::UpstreamUnavailableException, backend::UpstreamAuthException
        virtual RecommendationList recommend(const backend::LearnerId& learnerId, std::size_t desiredCount, const RecommendOptions& options) const = 0;

        // Ranks every item type from a single fetch of the learner data and of the catalog
        // Each item type gets its own list of up to desiredCount items, empty if the catalog has no item of that type
        // throws InsufficientCatalogException if the catalog is empty, InvalidFeatureDimensionException,
        // backend::UpstreamUnavailableException, backend::UpstreamAuthException
        virtual RecommendationsPerItemType recommendPerItemType(const backend::LearnerId& learnerId, std::size_t desiredCount, std::optional<bool> includeCompleted) const = 0;

        virtual const RecommendationSettings& getSettings() const = 0;
    };

    std::unique_ptr<IRecommendationService> createRecommendationService(backend::IDataFetcher& dataFetcher, const RecommendationSettings& settings);
    std::unique_ptr<IRecommendationService> createRecommendationService(backend::IDataFetcher& dataFetcher, const RecommendationSettings& settings, std::unique_ptr<ISimilarityScorer> similarityScorer, std::unique_ptr<IColdStartPolicy> coldStartPolicy);
} // namespace trs::recommendation
