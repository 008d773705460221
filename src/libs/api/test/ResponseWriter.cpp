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

#include <sstream>

#include <gtest/gtest.h>

#include "ResponseWriter.hpp"

namespace trs::api::tests
{
    TEST(ResponseWriter, serviceInfo)
    {
        std::ostringstream oss;
        writeServiceInfo(oss);
        EXPECT_EQ(oss.str(), R"({"name":"TOEIC Practice Recommender API","version":"1.0.0","status":"running"})");
    }

    TEST(ResponseWriter, health)
    {
        std::ostringstream oss;
        writeHealth(oss);
        EXPECT_EQ(oss.str(), R"({"status":"healthy"})");
    }

    TEST(ResponseWriter, recommendations)
    {
        RecommendationResponse response;
        response.learnerId = backend::LearnerId{ "42" };
        response.tests.push_back(recommendation::Recommendation{ .itemId = backend::ItemId{ "t1" }, .itemType = backend::ItemType::Test, .name = "Test \"1\"", .score = 0.5, .provenance = recommendation::Provenance::Similarity, .explanation = "difficulty 700", .progress = std::nullopt });
        response.tests.push_back(recommendation::Recommendation{ .itemId = backend::ItemId{ "t2" }, .itemType = backend::ItemType::Test, .name = "Test 2", .score = 0.25, .provenance = recommendation::Provenance::ColdStart, .explanation = "popular among learners", .progress = std::nullopt });

        std::ostringstream oss;
        writeRecommendations(oss, response);
        EXPECT_EQ(oss.str(), R"({"userId":"42","recommendedTests":[{"id":"t1","name":"Test \"1\"","score":0.5,"source":"similarity","explanation":"difficulty 700"},{"id":"t2","name":"Test 2","score":0.25,"source":"cold-start","explanation":"popular among learners"}],"recommendedLectures":[]})");
    }

    TEST(ResponseWriter, progress)
    {
        RecommendationResponse response;
        response.learnerId = backend::LearnerId{ "42" };
        response.tests.push_back(recommendation::Recommendation{
            .itemId = backend::ItemId{ "t1" },
            .itemType = backend::ItemType::Test,
            .name = "Test 1",
            .score = 1,
            .provenance = recommendation::Provenance::Similarity,
            .explanation = "taken 2 times, average score 495 | difficulty 700",
            .progress = recommendation::ItemProgress{ .attemptCount = 2, .averageScore = 495, .completionPercent = std::nullopt },
        });
        response.lectures.push_back(recommendation::Recommendation{
            .itemId = backend::ItemId{ "l1" },
            .itemType = backend::ItemType::Lecture,
            .name = "Lecture 1",
            .score = 1,
            .provenance = recommendation::Provenance::ColdStart,
            .explanation = "learned 40%",
            .progress = recommendation::ItemProgress{ .attemptCount = 1, .averageScore = std::nullopt, .completionPercent = 40 },
        });

        std::ostringstream oss;
        writeRecommendations(oss, response);
        EXPECT_EQ(oss.str(), R"({"userId":"42","recommendedTests":[{"id":"t1","name":"Test 1","score":1,"source":"similarity","explanation":"taken 2 times, average score 495 | difficulty 700","attempts":2,"averageScore":495}],)"
                             R"("recommendedLectures":[{"id":"l1","name":"Lecture 1","score":1,"source":"cold-start","explanation":"learned 40%","completion":40}]})");
    }

    TEST(ResponseWriter, error)
    {
        std::ostringstream oss;
        writeError(oss, "Upstream rejected credentials, status = 401");
        EXPECT_EQ(oss.str(), R"({"detail":"Upstream rejected credentials, status = 401"})");
    }
} // namespace trs::api::tests
