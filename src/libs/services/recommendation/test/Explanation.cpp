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

#include "Explanation.hpp"

namespace trs::recommendation::tests
{
    namespace
    {
        backend::LearnerAttributes createAttributes(std::optional<double> targetScore)
        {
            backend::LearnerAttributes attributes;
            attributes.targetScore = targetScore;
            return attributes;
        }
    } // namespace

    TEST(Explanation, itemProgress)
    {
        const Item test{ createItem({ .id = "1", .features = {} }) };
        const Item lecture{ createItem({ .id = "1", .features = {}, .popularity = std::nullopt, .difficulty = std::nullopt, .type = ItemType::Lecture }) };

        InteractionHistory history;
        history.interactions = {
            createInteraction("1", InteractionType::Attempted, 0.6, {}, ItemType::Lecture),
        };

        EXPECT_FALSE(computeItemProgress(test, history));

        const std::optional<ItemProgress> lectureProgress{ computeItemProgress(lecture, history) };
        ASSERT_TRUE(lectureProgress);
        EXPECT_EQ(lectureProgress->attemptCount, 1);
        EXPECT_FALSE(lectureProgress->averageScore);
        ASSERT_TRUE(lectureProgress->completionPercent);
        EXPECT_NEAR(*lectureProgress->completionPercent, 60, 1e-9);

        Interaction testRecord{ createInteraction("1", InteractionType::Completed, 0.5) };
        testRecord.attemptCount = 3;
        history.interactions.push_back(testRecord);

        const std::optional<ItemProgress> testProgress{ computeItemProgress(test, history) };
        ASSERT_TRUE(testProgress);
        EXPECT_EQ(testProgress->attemptCount, 3);
        ASSERT_TRUE(testProgress->averageScore);
        EXPECT_NEAR(*testProgress->averageScore, 495, 1e-9);
        EXPECT_FALSE(testProgress->completionPercent);
    }

    TEST(Explanation, test)
    {
        const Item test{ createItem({ .id = "1", .features = {}, .popularity = std::nullopt, .difficulty = 700 }) };

        EXPECT_EQ(buildExplanation(test, std::nullopt, createAttributes(800), Provenance::ColdStart), "difficulty 700, 100 points from target");
        EXPECT_EQ(buildExplanation(test, std::nullopt, createAttributes(std::nullopt), Provenance::ColdStart), "difficulty 700");

        const ItemProgress progress{ .attemptCount = 2, .averageScore = 495, .completionPercent = std::nullopt };
        EXPECT_EQ(buildExplanation(test, progress, createAttributes(800), Provenance::Similarity), "taken 2 times, average score 495 (below target 800) | difficulty 700, 100 points from target");
        EXPECT_EQ(buildExplanation(test, progress, createAttributes(400), Provenance::Similarity), "taken 2 times, average score 495 | difficulty 700, 300 points from target");

        const ItemProgress singleAttempt{ .attemptCount = 1, .averageScore = std::nullopt, .completionPercent = std::nullopt };
        EXPECT_EQ(buildExplanation(createItem({ .id = "2", .features = {} }), singleAttempt, createAttributes(800), Provenance::Similarity), "taken 1 time");
    }

    TEST(Explanation, lecture)
    {
        Item lecture{ createItem({ .id = "1", .features = {}, .popularity = std::nullopt, .difficulty = std::nullopt, .type = ItemType::Lecture }) };
        lecture.topics = { "grammar", "listening" };

        EXPECT_EQ(buildExplanation(lecture, std::nullopt, createAttributes(800), Provenance::ColdStart), "helps improve topics: grammar, listening");

        backend::LearnerAttributes attributes{ createAttributes(800) };
        attributes.topicStats = { { .topic = "grammar", .correctCount = 10, .incorrectCount = 0 } };
        const ItemProgress progress{ .attemptCount = 1, .averageScore = std::nullopt, .completionPercent = 40 };
        EXPECT_EQ(buildExplanation(lecture, progress, attributes, Provenance::Similarity), "learned 40% | helps improve topics: listening");
    }

    TEST(Explanation, fallbackOnProvenance)
    {
        const Item test{ createItem({ .id = "1", .features = {} }) };

        EXPECT_EQ(buildExplanation(test, std::nullopt, createAttributes(800), Provenance::ColdStart), "popular among learners");
        EXPECT_EQ(buildExplanation(test, std::nullopt, createAttributes(800), Provenance::Similarity), "close to your past activity");
        EXPECT_EQ(buildExplanation(test, std::nullopt, createAttributes(800), Provenance::Blended), "close to your past activity");
    }
} // namespace trs::recommendation::tests
