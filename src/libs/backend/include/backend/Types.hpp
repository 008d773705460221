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

#include <compare>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <Wt/WDateTime.h>

#include "core/TaggedType.hpp"

namespace trs::backend
{
    using LearnerId = core::TaggedType<struct LearnerIdTag, std::string>;
    using ItemId = core::TaggedType<struct ItemIdTag, std::string>;

    enum class ItemType
    {
        Test,
        Lecture,
    };
    std::string_view toString(ItemType type);
    std::optional<ItemType> itemTypeFromString(std::string_view str);

    enum class InteractionType
    {
        Attempted,
        Completed,
    };

    // Tests and lectures have independent id spaces
    struct ItemKey
    {
        ItemId id;
        ItemType type{ ItemType::Test };

        auto operator<=>(const ItemKey&) const = default;
    };
    std::ostream& operator<<(std::ostream& os, const ItemKey& key);

    struct Interaction
    {
        ItemId itemId;
        ItemType itemType{ ItemType::Test };
        InteractionType type{ InteractionType::Attempted };
        std::optional<double> outcome; // in [0, 1]
        std::size_t attemptCount{ 1 };
        Wt::WDateTime timestamp; // may be invalid
    };

    struct TopicStat
    {
        std::string topic;
        std::size_t correctCount{};
        std::size_t incorrectCount{};
    };

    // Scores are on the TOEIC scale (0-990), section scores on 0-495
    struct LearnerAttributes
    {
        std::optional<double> targetScore;
        std::optional<double> currentScore;
        std::optional<double> listeningScore;
        std::optional<double> readingScore;
        std::vector<TopicStat> topicStats;
    };

    struct InteractionHistory
    {
        LearnerId learnerId;
        LearnerAttributes attributes;
        std::vector<Interaction> interactions;
    };

    struct Item
    {
        ItemId id;
        ItemType type{ ItemType::Test };
        std::string name;
        std::vector<std::string> topics;
        std::optional<double> difficulty; // TOEIC scale
        std::vector<double> features;
        std::optional<double> popularity; // raw attempt/learner count
    };

    using Catalog = std::vector<Item>;

    inline ItemKey getItemKey(const Item& item)
    {
        return ItemKey{ item.id, item.type };
    }

    inline ItemKey getItemKey(const Interaction& interaction)
    {
        return ItemKey{ interaction.itemId, interaction.itemType };
    }
} // namespace trs::backend

template<>
struct std::hash<trs::backend::ItemKey>
{
    std::size_t operator()(const trs::backend::ItemKey& key) const
    {
        return std::hash<trs::backend::ItemId>{}(key.id) ^ (static_cast<std::size_t>(key.type) << 1);
    }
};
