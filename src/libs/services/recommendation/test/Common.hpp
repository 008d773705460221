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

#include <functional>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <gtest/gtest.h>

#include "backend/IDataFetcher.hpp"
#include "services/recommendation/IRecommendationService.hpp"
#include "services/recommendation/ISimilarityScorer.hpp"

namespace trs::recommendation::tests
{
    using backend::Catalog;
    using backend::Interaction;
    using backend::InteractionHistory;
    using backend::InteractionType;
    using backend::Item;
    using backend::ItemId;
    using backend::ItemKey;
    using backend::ItemType;
    using backend::LearnerId;

    struct ItemDesc
    {
        std::string_view id;
        std::vector<double> features;
        std::optional<double> popularity;
        std::optional<double> difficulty;
        ItemType type{ ItemType::Test };
    };

    inline ItemKey key(std::string_view id, ItemType type = ItemType::Test)
    {
        return ItemKey{ ItemId{ std::string{ id } }, type };
    }

    inline Item createItem(const ItemDesc& desc)
    {
        Item item;
        item.id = ItemId{ std::string{ desc.id } };
        item.type = desc.type;
        item.name = "Name of " + std::string{ desc.id };
        item.features = desc.features;
        item.popularity = desc.popularity;
        item.difficulty = desc.difficulty;
        return item;
    }

    inline Interaction createInteraction(std::string_view itemId, InteractionType type, std::optional<double> outcome = std::nullopt, Wt::WDateTime timestamp = {}, ItemType itemType = ItemType::Test)
    {
        Interaction interaction;
        interaction.itemId = ItemId{ std::string{ itemId } };
        interaction.itemType = itemType;
        interaction.type = type;
        interaction.outcome = outcome;
        interaction.timestamp = timestamp;
        return interaction;
    }

    inline std::vector<std::string> getItemIds(const RecommendationList& recommendations)
    {
        std::vector<std::string> res;
        for (const Recommendation& recommendation : recommendations)
            res.push_back(recommendation.itemId.value());
        return res;
    }

    // Serves fixed snapshots
    class FakeDataFetcher final : public backend::IDataFetcher
    {
    public:
        backend::InteractionHistory fetchInteractionHistory(const LearnerId& learnerId) override
        {
            ++historyFetchCount;
            if (onFetchHistory)
                onFetchHistory();

            backend::InteractionHistory res{ history };
            res.learnerId = learnerId;
            return res;
        }

        Catalog fetchCatalog(std::optional<ItemType> itemType) override
        {
            ++catalogFetchCount;
            catalogFetchItemTypes.push_back(itemType);
            if (onFetchCatalog)
                onFetchCatalog();

            Catalog res;
            for (const Item& item : catalog)
            {
                if (!itemType || item.type == *itemType)
                    res.push_back(item);
            }
            return res;
        }

        std::vector<InteractionHistory> fetchPeerProfiles() override
        {
            ++peerProfilesFetchCount;
            return peerProfiles;
        }

        backend::InteractionHistory history;
        Catalog catalog;
        std::vector<InteractionHistory> peerProfiles;
        std::function<void()> onFetchHistory; // may throw
        std::function<void()> onFetchCatalog; // may throw
        std::size_t historyFetchCount{};
        std::size_t catalogFetchCount{};
        std::vector<std::optional<ItemType>> catalogFetchItemTypes;
        std::size_t peerProfilesFetchCount{};
    };

    // Returns fixed scores and counts its invocations
    class FakeSimilarityScorer final : public ISimilarityScorer
    {
    public:
        explicit FakeSimilarityScorer(ScoreMap scores)
            : _scores{ std::move(scores) } {}

        std::size_t getCallCount() const { return _callCount; }

    private:
        ScoreMap score(const backend::InteractionHistory&, const backend::Catalog&, std::span<const backend::Item>, bool) const override
        {
            ++_callCount;
            return _scores;
        }

        const ScoreMap _scores;
        mutable std::size_t _callCount{};
    };
} // namespace trs::recommendation::tests
