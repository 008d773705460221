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

#include "services/recommendation/Exception.hpp"

#include "PopularityColdStartPolicy.hpp"

namespace trs::recommendation::tests
{
    namespace
    {
        backend::LearnerAttributes createAttributes(std::optional<double> targetScore, std::optional<double> currentScore)
        {
            backend::LearnerAttributes attributes;
            attributes.targetScore = targetScore;
            attributes.currentScore = currentScore;
            return attributes;
        }
    } // namespace

    TEST(PopularityColdStartPolicy, referenceDifficulty)
    {
        const PopularityColdStartPolicy policy{ ColdStartSettings{} };

        EXPECT_EQ(policy.computeReferenceDifficulty(createAttributes(std::nullopt, std::nullopt)), std::nullopt);
        EXPECT_EQ(policy.computeReferenceDifficulty(createAttributes(std::nullopt, 500)), std::nullopt);
        EXPECT_EQ(policy.computeReferenceDifficulty(createAttributes(700, 500)), 500);
        EXPECT_EQ(policy.computeReferenceDifficulty(createAttributes(700, 800)), 750);
        EXPECT_EQ(policy.computeReferenceDifficulty(createAttributes(700, std::nullopt)), 750);
    }

    TEST(PopularityColdStartPolicy, popularityOnly)
    {
        const Catalog candidates{
            createItem({ .id = "a", .features = {}, .popularity = 10 }),
            createItem({ .id = "b", .features = {}, .popularity = 5 }),
            createItem({ .id = "c", .features = {} }),
        };

        const auto policy{ createPopularityColdStartPolicy(ColdStartSettings{}) };
        const ScoreMap scores{ policy->score(backend::LearnerAttributes{}, candidates) };

        ASSERT_EQ(scores.size(), 3);
        EXPECT_DOUBLE_EQ(scores.at(key("a")), 1.0);
        EXPECT_DOUBLE_EQ(scores.at(key("b")), 0.5);
        EXPECT_DOUBLE_EQ(scores.at(key("c")), 0.0);
    }

    TEST(PopularityColdStartPolicy, everyCandidateIsScoredWithoutSignal)
    {
        const Catalog candidates{
            createItem({ .id = "a", .features = {} }),
            createItem({ .id = "b", .features = {} }),
        };

        const auto policy{ createPopularityColdStartPolicy(ColdStartSettings{}) };
        const ScoreMap scores{ policy->score(backend::LearnerAttributes{}, candidates) };

        ASSERT_EQ(scores.size(), 2);
        EXPECT_DOUBLE_EQ(scores.at(key("a")), 0.0);
        EXPECT_DOUBLE_EQ(scores.at(key("b")), 0.0);
    }

    TEST(PopularityColdStartPolicy, attributeMatch)
    {
        const Catalog candidates{
            createItem({ .id = "matching", .features = {}, .popularity = 10, .difficulty = 500 }),
            createItem({ .id = "far", .features = {}, .popularity = 10, .difficulty = 600 }),
            createItem({ .id = "close", .features = {}, .popularity = 0, .difficulty = 550 }),
            createItem({ .id = "unknown", .features = {}, .popularity = 10 }),
        };

        const auto policy{ createPopularityColdStartPolicy(ColdStartSettings{ .popularityWeight = 0.7, .attributeWeight = 0.3, .targetMargin = 50, .difficultyTolerance = 100 }) };
        const ScoreMap scores{ policy->score(createAttributes(700, 500), candidates) };

        ASSERT_EQ(scores.size(), 4);
        EXPECT_NEAR(scores.at(key("matching")), 1.0, 1e-9);
        EXPECT_NEAR(scores.at(key("far")), 0.7, 1e-9);
        EXPECT_NEAR(scores.at(key("close")), 0.15, 1e-9);
        EXPECT_NEAR(scores.at(key("unknown")), 0.7, 1e-9);
    }

    TEST(PopularityColdStartPolicy, emptyCandidates)
    {
        const auto policy{ createPopularityColdStartPolicy(ColdStartSettings{}) };
        EXPECT_TRUE(policy->score(createAttributes(700, 500), Catalog{}).empty());
    }

    TEST(PopularityColdStartPolicy, invalidSettings)
    {
        EXPECT_THROW(createPopularityColdStartPolicy(ColdStartSettings{ .popularityWeight = -1, .attributeWeight = 0.3, .targetMargin = 50, .difficultyTolerance = 100 }), InvalidSettingsException);
        EXPECT_THROW(createPopularityColdStartPolicy(ColdStartSettings{ .popularityWeight = 0, .attributeWeight = 0, .targetMargin = 50, .difficultyTolerance = 100 }), InvalidSettingsException);
        EXPECT_THROW(createPopularityColdStartPolicy(ColdStartSettings{ .popularityWeight = 0.7, .attributeWeight = 0.3, .targetMargin = 50, .difficultyTolerance = 0 }), InvalidSettingsException);
    }

    TEST(PopularityColdStartPolicy, topicDeficiency)
    {
        Item weakTopic{ createItem({ .id = "weak", .features = {}, .popularity = 10 }) };
        weakTopic.topics = { "listening" };
        Item masteredTopic{ createItem({ .id = "mastered", .features = {}, .popularity = 10 }) };
        masteredTopic.topics = { "grammar" };
        const Catalog candidates{ weakTopic, masteredTopic };

        backend::LearnerAttributes attributes;
        attributes.topicStats = {
            { .topic = "grammar", .correctCount = 9, .incorrectCount = 1 },
            { .topic = "listening", .correctCount = 2, .incorrectCount = 8 },
        };

        const auto policy{ createPopularityColdStartPolicy(ColdStartSettings{ .popularityWeight = 0.7, .attributeWeight = 0.3, .topicWeight = 0.3, .targetMargin = 50, .difficultyTolerance = 100 }) };
        const ScoreMap scores{ policy->score(attributes, candidates) };

        ASSERT_EQ(scores.size(), 2);
        // no reference difficulty: popularity and topic deficiency only
        EXPECT_NEAR(scores.at(key("weak")), (0.7 + 0.3 * 0.6) / 1.0, 1e-9);
        EXPECT_NEAR(scores.at(key("mastered")), 0.7, 1e-9);
    }

    TEST(PopularityColdStartPolicy, sameIdDifferentType)
    {
        const Catalog candidates{
            createItem({ .id = "1", .features = {}, .popularity = 10, .difficulty = std::nullopt, .type = ItemType::Test }),
            createItem({ .id = "1", .features = {}, .popularity = 5, .difficulty = std::nullopt, .type = ItemType::Lecture }),
        };

        const auto policy{ createPopularityColdStartPolicy(ColdStartSettings{}) };
        const ScoreMap scores{ policy->score(backend::LearnerAttributes{}, candidates) };

        ASSERT_EQ(scores.size(), 2);
        EXPECT_DOUBLE_EQ(scores.at(key("1", ItemType::Test)), 1.0);
        EXPECT_DOUBLE_EQ(scores.at(key("1", ItemType::Lecture)), 0.5);
    }
} // namespace trs::recommendation::tests
