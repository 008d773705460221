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

#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "backend/Types.hpp"

namespace trs::recommendation
{
    // How far the learner correct rate on a topic is below the desired rate, in [0, 1]
    // Topics without any answer or unknown to the learner get a default deficiency
    double computeTopicDeficiency(std::string_view topic, std::span<const backend::TopicStat> topicStats);

    // Average deficiency over the item topics, in [0, 1]
    // Items without topics get 0
    double computeTopicDeficiencyScore(const backend::Item& item, std::span<const backend::TopicStat> topicStats);

    // Topics of the item the learner has not mastered yet, in item order
    std::vector<std::string> getDeficientTopics(const backend::Item& item, std::span<const backend::TopicStat> topicStats);
} // namespace trs::recommendation
