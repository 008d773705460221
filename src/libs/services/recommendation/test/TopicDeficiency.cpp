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

#include "Common.hpp"

#include "TopicDeficiency.hpp"

namespace trs::recommendation::tests
{
    namespace
    {
        const std::vector<backend::TopicStat> topicStats{
            { .topic = "grammar", .correctCount = 8, .incorrectCount = 2 },
            { .topic = "listening", .correctCount = 2, .incorrectCount = 8 },
            { .topic = "reading", .correctCount = 0, .incorrectCount = 0 },
        };

        Item createItemWithTopics(std::vector<std::string> topics)
        {
            Item item{ createItem({ .id = "a", .features = {} }) };
            item.topics = std::move(topics);
            return item;
        }
    } // namespace

    TEST(TopicDeficiency, topic)
    {
        EXPECT_NEAR(computeTopicDeficiency("grammar", topicStats), 0.0, 1e-9);
        EXPECT_NEAR(computeTopicDeficiency("listening", topicStats), 0.6, 1e-9);
        EXPECT_DOUBLE_EQ(computeTopicDeficiency("reading", topicStats), 0.5);
        EXPECT_DOUBLE_EQ(computeTopicDeficiency("vocabulary", topicStats), 0.5);
        EXPECT_DOUBLE_EQ(computeTopicDeficiency("grammar", {}), 0.5);
    }

    TEST(TopicDeficiency, item)
    {
        EXPECT_DOUBLE_EQ(computeTopicDeficiencyScore(createItemWithTopics({}), topicStats), 0.0);
        EXPECT_NEAR(computeTopicDeficiencyScore(createItemWithTopics({ "listening" }), topicStats), 0.6, 1e-9);
        EXPECT_NEAR(computeTopicDeficiencyScore(createItemWithTopics({ "grammar", "listening" }), topicStats), 0.6 / 1.6, 1e-9);
        EXPECT_NEAR(computeTopicDeficiencyScore(createItemWithTopics({ "listening", "reading", "vocabulary" }), topicStats), 1.6 / 2.4, 1e-9);
    }

    TEST(TopicDeficiency, deficientTopics)
    {
        EXPECT_EQ(getDeficientTopics(createItemWithTopics({ "grammar", "listening", "vocabulary" }), topicStats), (std::vector<std::string>{ "listening", "vocabulary" }));
        EXPECT_TRUE(getDeficientTopics(createItemWithTopics({ "grammar" }), topicStats).empty());
    }
} // namespace trs::recommendation::tests
