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

#include <gtest/gtest.h>

#include <Wt/WDate.h>
#include <Wt/WTime.h>

#include "backend/Exception.hpp"

#include "ResponseParser.hpp"

namespace trs::backend::tests
{
    TEST(ResponseParser, learnerProfile)
    {
        constexpr std::string_view body{ R"({
            "data": {
                "userId": "learner-1",
                "target": 800,
                "averageTotalScore": 550,
                "testHistory": [
                    { "testId": "test-1", "attempt": 2, "avgScore": 495, "lastAttemptAt": "2025-01-10T08:00:00Z" },
                    { "testId": "test-2", "attempts": 1, "averageScore": 1200 }
                ],
                "learningProgress": {
                    "lecture-1": { "percent": 100, "updatedAt": "2025-01-12T08:00:00.000Z" },
                    "lecture-2": { "percent": 40 },
                    "lecture-3": 75
                }
            }
        })" };

        const InteractionHistory history{ responseParser::parseLearnerProfile(LearnerId{ "learner-1" }, body) };

        EXPECT_EQ(history.learnerId, LearnerId{ "learner-1" });
        EXPECT_EQ(history.attributes.targetScore, 800);
        EXPECT_EQ(history.attributes.currentScore, 550);

        ASSERT_EQ(history.interactions.size(), 5);

        const Interaction& test1{ history.interactions[0] };
        EXPECT_EQ(test1.itemId, ItemId{ "test-1" });
        EXPECT_EQ(test1.itemType, ItemType::Test);
        EXPECT_EQ(test1.type, InteractionType::Completed);
        EXPECT_EQ(test1.attemptCount, 2);
        ASSERT_TRUE(test1.outcome);
        EXPECT_DOUBLE_EQ(*test1.outcome, 0.5);
        EXPECT_EQ(test1.timestamp, (Wt::WDateTime{ Wt::WDate{ 2025, 1, 10 }, Wt::WTime{ 8, 0, 0 } }));

        const Interaction& test2{ history.interactions[1] };
        EXPECT_EQ(test2.itemId, ItemId{ "test-2" });
        EXPECT_EQ(test2.type, InteractionType::Completed);
        ASSERT_TRUE(test2.outcome);
        EXPECT_DOUBLE_EQ(*test2.outcome, 1.0); // clamped
        EXPECT_FALSE(test2.timestamp.isValid());

        // learning progress is keyed by lecture id, hence sorted
        const Interaction& lecture1{ history.interactions[2] };
        EXPECT_EQ(lecture1.itemId, ItemId{ "lecture-1" });
        EXPECT_EQ(lecture1.itemType, ItemType::Lecture);
        EXPECT_EQ(lecture1.type, InteractionType::Completed);
        EXPECT_TRUE(lecture1.timestamp.isValid());

        const Interaction& lecture2{ history.interactions[3] };
        EXPECT_EQ(lecture2.type, InteractionType::Attempted);
        ASSERT_TRUE(lecture2.outcome);
        EXPECT_DOUBLE_EQ(*lecture2.outcome, 0.4);

        const Interaction& lecture3{ history.interactions[4] };
        EXPECT_EQ(lecture3.itemId, ItemId{ "lecture-3" });
        ASSERT_TRUE(lecture3.outcome);
        EXPECT_DOUBLE_EQ(*lecture3.outcome, 0.75);
    }

    TEST(ResponseParser, learnerProfile_emptyAndPartial)
    {
        {
            const InteractionHistory history{ responseParser::parseLearnerProfile(LearnerId{ "learner-1" }, R"({ "data": { "userId": "learner-1", "averageTotalScore": 0 } })") };
            EXPECT_TRUE(history.interactions.empty());
            EXPECT_FALSE(history.attributes.targetScore);
            EXPECT_FALSE(history.attributes.currentScore);
        }

        {
            const InteractionHistory history{ responseParser::parseLearnerProfile(LearnerId{ "learner-1" }, R"({})") };
            EXPECT_EQ(history.learnerId, LearnerId{ "learner-1" });
            EXPECT_TRUE(history.interactions.empty());
        }
    }

    TEST(ResponseParser, learnerProfile_testRecordCompletion)
    {
        constexpr std::string_view body{ R"({
            "data": {
                "testHistory": [
                    { "testId": "test-1" },
                    { "testId": "test-2", "attempt": 0 },
                    { "testId": "test-3", "attempt": 0, "avgScore": 300 }
                ]
            }
        })" };

        const InteractionHistory history{ responseParser::parseLearnerProfile(LearnerId{ "learner-1" }, body) };
        ASSERT_EQ(history.interactions.size(), 3);
        EXPECT_EQ(history.interactions[0].type, InteractionType::Completed);
        EXPECT_EQ(history.interactions[0].attemptCount, 1);
        EXPECT_EQ(history.interactions[1].type, InteractionType::Attempted);
        EXPECT_EQ(history.interactions[2].type, InteractionType::Completed);
    }

    TEST(ResponseParser, learnerProfile_scoresAndTopicStats)
    {
        constexpr std::string_view body{ R"({
            "data": {
                "averageListeningScore": 300,
                "averageReadingScore": 250,
                "topicStats": [
                    { "topicName": "grammar", "totalCorrect": 8, "totalIncorrect": 2 },
                    { "topicName": "vocabulary" },
                    { "totalCorrect": 3 },
                    "garbage"
                ]
            }
        })" };

        const InteractionHistory history{ responseParser::parseLearnerProfile(LearnerId{ "learner-1" }, body) };
        EXPECT_EQ(history.attributes.listeningScore, 300);
        EXPECT_EQ(history.attributes.readingScore, 250);

        ASSERT_EQ(history.attributes.topicStats.size(), 2);
        EXPECT_EQ(history.attributes.topicStats[0].topic, "grammar");
        EXPECT_EQ(history.attributes.topicStats[0].correctCount, 8);
        EXPECT_EQ(history.attributes.topicStats[0].incorrectCount, 2);
        EXPECT_EQ(history.attributes.topicStats[1].topic, "vocabulary");
        EXPECT_EQ(history.attributes.topicStats[1].correctCount, 0);
        EXPECT_EQ(history.attributes.topicStats[1].incorrectCount, 0);
    }

    TEST(ResponseParser, peerProfiles)
    {
        constexpr std::string_view body{ R"({
            "data": [
                { "userId": "learner-2", "target": 700, "averageTotalScore": 500, "testHistory": [ { "testId": "test-1", "attempt": 3, "avgScore": 600 } ] },
                { "userId": 3, "learningProgress": { "lecture-1": 50 } },
                { "target": 900 }
            ]
        })" };

        const std::vector<InteractionHistory> profiles{ responseParser::parsePeerProfiles(body) };
        ASSERT_EQ(profiles.size(), 2);

        EXPECT_EQ(profiles[0].learnerId, LearnerId{ "learner-2" });
        EXPECT_EQ(profiles[0].attributes.targetScore, 700);
        ASSERT_EQ(profiles[0].interactions.size(), 1);
        EXPECT_EQ(profiles[0].interactions[0].attemptCount, 3);

        EXPECT_EQ(profiles[1].learnerId, LearnerId{ "3" });
        ASSERT_EQ(profiles[1].interactions.size(), 1);
        EXPECT_EQ(profiles[1].interactions[0].itemType, ItemType::Lecture);

        EXPECT_TRUE(responseParser::parsePeerProfiles(R"({ "data": {} })").empty());
    }

    TEST(ResponseParser, learnerProfile_malformedEntriesSkipped)
    {
        constexpr std::string_view body{ R"({
            "data": {
                "testHistory": [ { "attempt": 2 }, "garbage", { "testId": 12, "attempt": 1 } ],
                "learningProgress": { "lecture-1": "bad", "lecture-2": { "percent": 10 } }
            }
        })" };

        const InteractionHistory history{ responseParser::parseLearnerProfile(LearnerId{ "learner-1" }, body) };
        ASSERT_EQ(history.interactions.size(), 2);
        EXPECT_EQ(history.interactions[0].itemId, ItemId{ "12" });
        EXPECT_EQ(history.interactions[1].itemId, ItemId{ "lecture-2" });
    }

    TEST(ResponseParser, invalidBody)
    {
        EXPECT_THROW(responseParser::parseLearnerProfile(LearnerId{ "learner-1" }, "<html>Bad gateway</html>"), UpstreamUnavailableException);
        EXPECT_THROW(responseParser::parseTestCandidates(""), UpstreamUnavailableException);
        EXPECT_THROW(responseParser::parseLectureCandidates("[1, 2"), UpstreamUnavailableException);
    }

    TEST(ResponseParser, testCandidates)
    {
        constexpr std::string_view body{ R"({
            "data": [
                { "testId": "test-1", "name": "Full test 1", "difficulty": 600, "topics": ["grammar", "listening"], "totalUserAttempt": 42 },
                { "testId": "test-2", "name": "Full test 2", "topics": [], "features": [0.5, 1, 0] },
                { "name": "no id" }
            ]
        })" };

        const Catalog catalog{ responseParser::parseTestCandidates(body) };
        ASSERT_EQ(catalog.size(), 2);

        EXPECT_EQ(catalog[0].id, ItemId{ "test-1" });
        EXPECT_EQ(catalog[0].type, ItemType::Test);
        EXPECT_EQ(catalog[0].name, "Full test 1");
        EXPECT_EQ(catalog[0].difficulty, 600);
        EXPECT_EQ(catalog[0].topics, (std::vector<std::string>{ "grammar", "listening" }));
        EXPECT_EQ(catalog[0].popularity, 42);
        EXPECT_TRUE(catalog[0].features.empty());

        EXPECT_EQ(catalog[1].id, ItemId{ "test-2" });
        EXPECT_FALSE(catalog[1].difficulty);
        EXPECT_FALSE(catalog[1].popularity);
        EXPECT_EQ(catalog[1].features, (std::vector<double>{ 0.5, 1, 0 }));
    }

    TEST(ResponseParser, lectureCandidates)
    {
        constexpr std::string_view body{ R"({
            "data": [
                { "lectureId": "lecture-1", "name": "Tenses", "topics": ["grammar"], "totalLearners": 7 },
                { "lectureId": "lecture-2", "name": "Bad features", "features": [1, "x"] }
            ]
        })" };

        const Catalog catalog{ responseParser::parseLectureCandidates(body) };
        ASSERT_EQ(catalog.size(), 1);
        EXPECT_EQ(catalog[0].id, ItemId{ "lecture-1" });
        EXPECT_EQ(catalog[0].type, ItemType::Lecture);
        EXPECT_EQ(catalog[0].popularity, 7);
    }

    TEST(ResponseParser, candidates_noData)
    {
        EXPECT_TRUE(responseParser::parseTestCandidates(R"({ "message": "ok" })").empty());
        EXPECT_TRUE(responseParser::parseLectureCandidates(R"({ "data": [] })").empty());
    }
} // namespace trs::backend::tests
