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

#include "Explanation.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

#include "TopicDeficiency.hpp"

namespace trs::recommendation
{
    namespace
    {
        constexpr double maxTOEICScore{ 990 };
        constexpr double maxCompletionPercent{ 100 };
        constexpr std::string_view separator{ " | " };

        std::string toRoundedString(double value)
        {
            return std::to_string(std::lround(value));
        }

        std::string joinTopics(const std::vector<std::string>& topics)
        {
            std::string res;
            for (const std::string& topic : topics)
            {
                if (!res.empty())
                    res += ", ";
                res += topic;
            }

            return res;
        }

        void explainTest(std::vector<std::string>& parts, const backend::Item& item, const std::optional<ItemProgress>& progress, const backend::LearnerAttributes& attributes)
        {
            if (progress)
            {
                std::string part{ "taken " + std::to_string(progress->attemptCount) + (progress->attemptCount > 1 ? " times" : " time") };
                if (progress->averageScore)
                {
                    part += ", average score " + toRoundedString(*progress->averageScore);
                    if (attributes.targetScore && *progress->averageScore < *attributes.targetScore)
                        part += " (below target " + toRoundedString(*attributes.targetScore) + ")";
                }
                parts.push_back(std::move(part));
            }

            if (item.difficulty)
            {
                std::string part{ "difficulty " + toRoundedString(*item.difficulty) };
                if (attributes.targetScore)
                    part += ", " + toRoundedString(std::abs(*item.difficulty - *attributes.targetScore)) + " points from target";
                parts.push_back(std::move(part));
            }
        }

        void explainLecture(std::vector<std::string>& parts, const backend::Item& item, const std::optional<ItemProgress>& progress, const backend::LearnerAttributes& attributes)
        {
            if (progress && progress->completionPercent)
                parts.push_back("learned " + toRoundedString(*progress->completionPercent) + "%");

            // without topic stats, every topic of the lecture is worth improving
            const std::vector<std::string> topics{ attributes.topicStats.empty() ? item.topics : getDeficientTopics(item, attributes.topicStats) };
            if (!topics.empty())
                parts.push_back("helps improve topics: " + joinTopics(topics));
        }

        std::string_view explainProvenance(Provenance provenance)
        {
            switch (provenance)
            {
            case Provenance::Similarity:
            case Provenance::Blended:
                return "close to your past activity";
            case Provenance::ColdStart:
                return "popular among learners";
            }

            return "";
        }
    } // namespace

    std::optional<ItemProgress> computeItemProgress(const backend::Item& item, const backend::InteractionHistory& history)
    {
        const backend::ItemKey itemKey{ backend::getItemKey(item) };
        auto itInteraction{ std::find_if(std::cbegin(history.interactions), std::cend(history.interactions), [&](const backend::Interaction& interaction) { return backend::getItemKey(interaction) == itemKey; }) };
        if (itInteraction == std::cend(history.interactions))
            return std::nullopt;

        ItemProgress progress;
        progress.attemptCount = itInteraction->attemptCount;
        if (itInteraction->outcome)
        {
            switch (item.type)
            {
            case backend::ItemType::Test:
                progress.averageScore = *itInteraction->outcome * maxTOEICScore;
                break;
            case backend::ItemType::Lecture:
                progress.completionPercent = *itInteraction->outcome * maxCompletionPercent;
                break;
            }
        }

        return progress;
    }

    std::string buildExplanation(const backend::Item& item, const std::optional<ItemProgress>& progress, const backend::LearnerAttributes& attributes, Provenance provenance)
    {
        std::vector<std::string> parts;
        switch (item.type)
        {
        case backend::ItemType::Test:
            explainTest(parts, item, progress, attributes);
            break;
        case backend::ItemType::Lecture:
            explainLecture(parts, item, progress, attributes);
            break;
        }

        if (parts.empty())
            parts.emplace_back(explainProvenance(provenance));

        std::string res;
        for (const std::string& part : parts)
        {
            if (!res.empty())
                res += separator;
            res += part;
        }

        return res;
    }
} // namespace trs::recommendation
