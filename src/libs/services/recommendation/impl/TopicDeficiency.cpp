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

#include "TopicDeficiency.hpp"

#include <algorithm>

namespace trs::recommendation
{
    namespace
    {
        constexpr double desiredCorrectRate{ 0.8 };
        constexpr double defaultDeficiency{ 0.5 };
    } // namespace

    double computeTopicDeficiency(std::string_view topic, std::span<const backend::TopicStat> topicStats)
    {
        auto itStat{ std::find_if(std::cbegin(topicStats), std::cend(topicStats), [&](const backend::TopicStat& stat) { return stat.topic == topic; }) };
        if (itStat == std::cend(topicStats))
            return defaultDeficiency;

        const std::size_t total{ itStat->correctCount + itStat->incorrectCount };
        if (total == 0)
            return defaultDeficiency;

        const double correctRate{ static_cast<double>(itStat->correctCount) / static_cast<double>(total) };
        return std::max(0.0, desiredCorrectRate - correctRate);
    }

    double computeTopicDeficiencyScore(const backend::Item& item, std::span<const backend::TopicStat> topicStats)
    {
        double totalDeficiency{};
        for (const std::string& topic : item.topics)
            totalDeficiency += computeTopicDeficiency(topic, topicStats);

        // a topic can at most lack the whole desired rate
        const double maxDeficiency{ std::max(1.0, static_cast<double>(item.topics.size()) * desiredCorrectRate) };
        return std::min(1.0, totalDeficiency / maxDeficiency);
    }

    std::vector<std::string> getDeficientTopics(const backend::Item& item, std::span<const backend::TopicStat> topicStats)
    {
        std::vector<std::string> res;
        for (const std::string& topic : item.topics)
        {
            if (computeTopicDeficiency(topic, topicStats) > 0)
                res.push_back(topic);
        }

        return res;
    }
} // namespace trs::recommendation
