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

#include "services/recommendation/RecommendationSettings.hpp"

#include <optional>
#include <string>

#include "core/IConfig.hpp"
#include "core/String.hpp"
#include "services/recommendation/Exception.hpp"

namespace trs::recommendation
{
    namespace
    {
        void checkInRange(std::string_view name, double value, double min, double max)
        {
            if (!(value >= min && value <= max))
                throw InvalidSettingsException{ "'" + std::string{ name } + "' must be in [" + std::to_string(min) + ", " + std::to_string(max) + "], got " + std::to_string(value) };
        }

        void checkPositive(std::string_view name, double value)
        {
            if (!(value >= 0))
                throw InvalidSettingsException{ "'" + std::string{ name } + "' must be positive, got " + std::to_string(value) };
        }

        void checkStrictlyPositive(std::string_view name, double value)
        {
            if (!(value > 0))
                throw InvalidSettingsException{ "'" + std::string{ name } + "' must be strictly positive, got " + std::to_string(value) };
        }

        BlendMode readBlendMode(core::IConfig& config)
        {
            const std::string_view str{ config.getString("recommendation-blend-mode", "fill") };
            if (core::stringUtils::stringCaseInsensitiveEqual(str, "fill"))
                return BlendMode::Fill;
            if (core::stringUtils::stringCaseInsensitiveEqual(str, "weighted"))
                return BlendMode::Weighted;

            throw InvalidSettingsException{ "Unknown blend mode '" + std::string{ str } + "'" };
        }

        Normalization readNormalization(core::IConfig& config)
        {
            const std::string_view str{ config.getString("recommendation-normalization", "minmax") };
            if (core::stringUtils::stringCaseInsensitiveEqual(str, "minmax"))
                return Normalization::MinMax;
            if (core::stringUtils::stringCaseInsensitiveEqual(str, "none"))
                return Normalization::None;

            throw InvalidSettingsException{ "Unknown normalization '" + std::string{ str } + "'" };
        }
    } // namespace

    void validateSettings(const SimilaritySettings& settings)
    {
        checkInRange("attemptedWeight", settings.attemptedWeight, 0, 1);
        checkPositive("recencyHalfLifeDays", settings.recencyHalfLifeDays);
        checkInRange("topicWeight", settings.topicWeight, 0, 1);
    }

    void validateSettings(const ColdStartSettings& settings)
    {
        checkPositive("popularityWeight", settings.popularityWeight);
        checkPositive("attributeWeight", settings.attributeWeight);
        checkPositive("topicWeight", settings.topicWeight);
        if (!(settings.popularityWeight + settings.attributeWeight > 0))
            throw InvalidSettingsException{ "'popularityWeight' and 'attributeWeight' cannot both be 0" };
        checkPositive("targetMargin", settings.targetMargin);
        checkStrictlyPositive("difficultyTolerance", settings.difficultyTolerance);
    }

    void validateSettings(const CollaborativeSettings& settings)
    {
        checkInRange("collaborativeWeight", settings.weight, 0, 1);
        if (settings.peerCount == 0)
            throw InvalidSettingsException{ "'peerCount' must be at least 1" };
    }

    void validateSettings(const RecommendationSettings& settings)
    {
        // learners without any interaction must always go through cold start
        if (settings.coldStartThreshold == 0)
            throw InvalidSettingsException{ "'coldStartThreshold' must be at least 1" };
        checkInRange("similarityWeight", settings.similarityWeight, 0, 1);
        validateSettings(settings.similarity);
        validateSettings(settings.coldStart);
        validateSettings(settings.collaborative);
    }

    RecommendationSettings settingsFromConfig(core::IConfig& config)
    {
        const RecommendationSettings defaultSettings;

        const RecommendationSettings settings{
            .coldStartThreshold = config.getULong("recommendation-cold-start-threshold", defaultSettings.coldStartThreshold),
            .includeCompletedByDefault = config.getBool("recommendation-include-completed", defaultSettings.includeCompletedByDefault),
            .blendMode = readBlendMode(config),
            .similarityWeight = config.getDouble("recommendation-similarity-weight", defaultSettings.similarityWeight),
            .normalization = readNormalization(config),
            .similarity = {
                .attemptedWeight = config.getDouble("recommendation-attempted-weight", defaultSettings.similarity.attemptedWeight),
                .useOutcome = config.getBool("recommendation-use-outcome", defaultSettings.similarity.useOutcome),
                .recencyHalfLifeDays = config.getDouble("recommendation-recency-half-life-days", defaultSettings.similarity.recencyHalfLifeDays),
                .topicWeight = config.getDouble("recommendation-topic-weight", defaultSettings.similarity.topicWeight),
            },
            .coldStart = {
                .popularityWeight = config.getDouble("recommendation-popularity-weight", defaultSettings.coldStart.popularityWeight),
                .attributeWeight = config.getDouble("recommendation-attribute-weight", defaultSettings.coldStart.attributeWeight),
                .topicWeight = config.getDouble("recommendation-cold-start-topic-weight", defaultSettings.coldStart.topicWeight),
                .targetMargin = config.getDouble("recommendation-target-margin", defaultSettings.coldStart.targetMargin),
                .difficultyTolerance = config.getDouble("recommendation-difficulty-tolerance", defaultSettings.coldStart.difficultyTolerance),
            },
            .collaborative = {
                .weight = config.getDouble("recommendation-collaborative-weight", defaultSettings.collaborative.weight),
                .peerCount = config.getULong("recommendation-peer-count", defaultSettings.collaborative.peerCount),
            },
        };

        validateSettings(settings);
        return settings;
    }
} // namespace trs::recommendation
