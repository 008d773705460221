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

namespace trs::core
{
    class IConfig;
}

namespace trs::recommendation
{
    enum class BlendMode
    {
        Fill,     // cold start only fills the slots similarity could not
        Weighted, // similarity candidates get a weighted cold start contribution
    };

    enum class Normalization
    {
        MinMax,
        None,
    };

    struct SimilaritySettings
    {
        double attemptedWeight{ 0.5 }; // completed interactions weigh 1
        bool useOutcome{ true };
        double recencyHalfLifeDays{ 30 }; // 0 disables recency weighting
        double topicWeight{ 0.3 };        // share of the topic deficiency, used if the learner has topic stats
    };

    struct ColdStartSettings
    {
        double popularityWeight{ 0.7 };
        double attributeWeight{ 0.3 };
        double topicWeight{ 0.3 }; // used if the learner has topic stats
        double targetMargin{ 50 };
        double difficultyTolerance{ 100 };
    };

    // Scores items by how well learners alike did with them
    struct CollaborativeSettings
    {
        double weight{}; // 0 disables the peer profiles fetch
        std::size_t peerCount{ 5 };
    };

    struct RecommendationSettings
    {
        std::size_t coldStartThreshold{ 2 };
        bool includeCompletedByDefault{};
        BlendMode blendMode{ BlendMode::Fill };
        double similarityWeight{ 0.7 }; // Weighted mode only
        Normalization normalization{ Normalization::MinMax };
        SimilaritySettings similarity;
        ColdStartSettings coldStart;
        CollaborativeSettings collaborative;
    };

    // throws InvalidSettingsException
    void validateSettings(const RecommendationSettings& settings);
    void validateSettings(const SimilaritySettings& settings);
    void validateSettings(const ColdStartSettings& settings);
    void validateSettings(const CollaborativeSettings& settings);

    // Missing keys get their default value, result is validated
    RecommendationSettings settingsFromConfig(core::IConfig& config);
} // namespace trs::recommendation
