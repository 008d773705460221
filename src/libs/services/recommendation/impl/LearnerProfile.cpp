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

#include "LearnerProfile.hpp"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <unordered_map>

#include "services/recommendation/Exception.hpp"

namespace trs::recommendation
{
    namespace
    {
        constexpr double secondsPerDay{ 24 * 60 * 60 };

        // Reference is the most recent interaction, never the current time
        Wt::WDateTime computeReferenceDateTime(const backend::InteractionHistory& history)
        {
            Wt::WDateTime res;
            for (const backend::Interaction& interaction : history.interactions)
            {
                if (interaction.timestamp.isValid() && (!res.isValid() || interaction.timestamp > res))
                    res = interaction.timestamp;
            }

            return res;
        }

        double computeRecencyWeight(const Wt::WDateTime& timestamp, const Wt::WDateTime& reference, double halfLifeDays)
        {
            if (halfLifeDays <= 0 || !timestamp.isValid() || !reference.isValid())
                return 1;

            const double ageDays{ std::max(0.0, static_cast<double>(timestamp.secsTo(reference)) / secondsPerDay) };
            return std::pow(0.5, ageDays / halfLifeDays);
        }
    } // namespace

    double computeInteractionWeight(const backend::Interaction& interaction, const SimilaritySettings& settings)
    {
        double weight{ interaction.type == backend::InteractionType::Completed ? 1.0 : settings.attemptedWeight };
        if (settings.useOutcome && interaction.outcome)
            weight *= std::clamp(*interaction.outcome, 0.0, 1.0);

        return weight;
    }

    std::vector<double> buildLearnerProfile(const backend::InteractionHistory& history, const backend::Catalog& catalog, const SimilaritySettings& settings)
    {
        std::unordered_map<backend::ItemKey, const backend::Item*> itemsByKey;
        for (const backend::Item& item : catalog)
            itemsByKey.try_emplace(backend::getItemKey(item), &item);

        const Wt::WDateTime reference{ computeReferenceDateTime(history) };

        std::vector<double> profile;
        double totalWeight{};
        bool dimensionSet{};

        for (const backend::Interaction& interaction : history.interactions)
        {
            auto itItem{ itemsByKey.find(backend::getItemKey(interaction)) };
            if (itItem == std::cend(itemsByKey))
                continue;

            const backend::Item& item{ *itItem->second };
            if (!dimensionSet)
            {
                profile.resize(item.features.size(), 0.0);
                dimensionSet = true;
            }
            else if (item.features.size() != profile.size())
                throw InvalidFeatureDimensionException{ item.id, profile.size(), item.features.size() };

            const double weight{ computeInteractionWeight(interaction, settings) * computeRecencyWeight(interaction.timestamp, reference, settings.recencyHalfLifeDays) };
            if (weight <= 0)
                continue;

            for (std::size_t i{}; i < profile.size(); ++i)
                profile[i] += weight * item.features[i];
            totalWeight += weight;
        }

        if (totalWeight <= 0)
            return {};

        for (double& value : profile)
            value /= totalWeight;

        if (std::all_of(std::cbegin(profile), std::cend(profile), [](double value) { return value == 0; }))
            return {};

        return profile;
    }

    double computeCosineSimilarity(std::span<const double> a, std::span<const double> b)
    {
        assert(a.size() == b.size());

        double dotProduct{};
        double normA{};
        double normB{};
        for (std::size_t i{}; i < a.size(); ++i)
        {
            dotProduct += a[i] * b[i];
            normA += a[i] * a[i];
            normB += b[i] * b[i];
        }

        if (normA == 0 || normB == 0)
            return 0;

        return std::clamp(dotProduct / (std::sqrt(normA) * std::sqrt(normB)), 0.0, 1.0);
    }
} // namespace trs::recommendation
