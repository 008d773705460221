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

#include <map>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "backend/Exception.hpp"
#include "backend/IDataFetcher.hpp"
#include "core/http/IClient.hpp"

namespace trs::backend::tests
{
    namespace
    {
        struct FakeResponse
        {
            std::optional<int> status; // not set means transport failure
            std::string body;
        };

        // Replies synchronously, from the calling thread
        class FakeClient final : public core::http::IClient
        {
        public:
            FakeClient(std::map<std::string, FakeResponse> responses, std::vector<core::http::ClientRequestParameters>& sentRequests)
                : _responses{ std::move(responses) }
                , _sentRequests{ sentRequests }
            {
            }

        private:
            void sendGETRequest(core::http::ClientRequestParameters&& request) override
            {
                _sentRequests.push_back(request);

                auto it{ _responses.find(request.relativeUrl) };
                if (it == std::cend(_responses))
                {
                    request.onFailureFunc(404);
                    return;
                }

                const FakeResponse& response{ it->second };
                if (!response.status)
                    request.onFailureFunc(std::nullopt);
                else if (*response.status >= 200 && *response.status < 300)
                {
                    Wt::Http::Message msg;
                    msg.setStatus(*response.status);
                    msg.addBodyText(response.body);
                    request.onSuccessFunc(msg);
                }
                else
                    request.onFailureFunc(*response.status);
            }

            const std::map<std::string, FakeResponse> _responses;
            std::vector<core::http::ClientRequestParameters>& _sentRequests;
        };

        class BackendDataFetcherTest : public ::testing::Test
        {
        protected:
            std::unique_ptr<IDataFetcher> createFetcher(std::map<std::string, FakeResponse> responses)
            {
                BackendSettings settings;
                settings.internalApiKey = "secret";
                return createBackendDataFetcher(std::make_unique<FakeClient>(std::move(responses), _sentRequests), settings);
            }

            std::vector<core::http::ClientRequestParameters> _sentRequests;
        };

        constexpr std::string_view testCandidates{ R"({ "data": [
            { "testId": "test-1", "name": "Test 1", "difficulty": 495, "topics": ["grammar"], "totalUserAttempt": 10 }
        ] })" };
        constexpr std::string_view lectureCandidates{ R"({ "data": [
            { "lectureId": "lecture-1", "name": "Lecture 1", "topics": ["listening"] }
        ] })" };
    } // namespace

    TEST_F(BackendDataFetcherTest, profile)
    {
        auto fetcher{ createFetcher({
            { "/api/v1/internal/users/learner-1/profile", { 200, R"({ "data": { "target": 700, "testHistory": [ { "testId": "test-1", "attempt": 1, "avgScore": 300 } ] } })" } },
        }) };

        const InteractionHistory history{ fetcher->fetchInteractionHistory(LearnerId{ "learner-1" }) };
        EXPECT_EQ(history.learnerId, LearnerId{ "learner-1" });
        EXPECT_EQ(history.attributes.targetScore, 700);
        ASSERT_EQ(history.interactions.size(), 1);

        ASSERT_EQ(_sentRequests.size(), 1);
        const auto& headers{ _sentRequests.front().headers };
        ASSERT_EQ(headers.size(), 2);
        EXPECT_EQ(headers[0].name(), "Content-Type");
        EXPECT_EQ(headers[0].value(), "application/json");
        EXPECT_EQ(headers[1].name(), "X-Internal-API-Key");
        EXPECT_EQ(headers[1].value(), "secret");
    }

    TEST_F(BackendDataFetcherTest, profile_unknownLearner)
    {
        auto fetcher{ createFetcher({}) };

        const InteractionHistory history{ fetcher->fetchInteractionHistory(LearnerId{ "newcomer" }) };
        EXPECT_EQ(history.learnerId, LearnerId{ "newcomer" });
        EXPECT_TRUE(history.interactions.empty());
        EXPECT_FALSE(history.attributes.targetScore);
    }

    TEST_F(BackendDataFetcherTest, profile_learnerIdEncoded)
    {
        auto fetcher{ createFetcher({}) };

        fetcher->fetchInteractionHistory(LearnerId{ "learner 1" });
        ASSERT_EQ(_sentRequests.size(), 1);
        EXPECT_EQ(_sentRequests.front().relativeUrl.find(' '), std::string::npos);
    }

    TEST_F(BackendDataFetcherTest, errors)
    {
        auto fetcher{ createFetcher({
            { "/api/v1/internal/users/unauthorized/profile", { 401, "" } },
            { "/api/v1/internal/users/forbidden/profile", { 403, "" } },
            { "/api/v1/internal/users/broken/profile", { 500, "" } },
            { "/api/v1/internal/users/unreachable/profile", { std::nullopt, "" } },
            { "/api/v1/internal/users/garbage/profile", { 200, "not json" } },
        }) };

        EXPECT_THROW(fetcher->fetchInteractionHistory(LearnerId{ "unauthorized" }), UpstreamAuthException);
        EXPECT_THROW(fetcher->fetchInteractionHistory(LearnerId{ "forbidden" }), UpstreamAuthException);
        EXPECT_THROW(fetcher->fetchInteractionHistory(LearnerId{ "broken" }), UpstreamUnavailableException);
        EXPECT_THROW(fetcher->fetchInteractionHistory(LearnerId{ "unreachable" }), UpstreamUnavailableException);
        EXPECT_THROW(fetcher->fetchInteractionHistory(LearnerId{ "garbage" }), UpstreamUnavailableException);
    }

    TEST_F(BackendDataFetcherTest, catalog)
    {
        auto fetcher{ createFetcher({
            { "/api/v1/internal/tests/candidates", { 200, std::string{ testCandidates } } },
            { "/api/v1/internal/lectures/candidates", { 200, std::string{ lectureCandidates } } },
        }) };

        const Catalog catalog{ fetcher->fetchCatalog(std::nullopt) };
        ASSERT_EQ(catalog.size(), 2);
        EXPECT_EQ(catalog[0].id, ItemId{ "test-1" });
        EXPECT_EQ(catalog[1].id, ItemId{ "lecture-1" });

        // vocabulary = grammar, listening + difficulty
        EXPECT_EQ(catalog[0].features, (std::vector<double>{ 1, 0, 0.5 }));
        EXPECT_EQ(catalog[1].features, (std::vector<double>{ 0, 1, 0 }));
    }

    TEST_F(BackendDataFetcherTest, catalog_filtered)
    {
        auto fetcher{ createFetcher({
            { "/api/v1/internal/tests/candidates", { 200, std::string{ testCandidates } } },
            { "/api/v1/internal/lectures/candidates", { 200, std::string{ lectureCandidates } } },
        }) };

        const Catalog catalog{ fetcher->fetchCatalog(ItemType::Lecture) };
        ASSERT_EQ(catalog.size(), 1);
        EXPECT_EQ(catalog[0].type, ItemType::Lecture);
        ASSERT_EQ(_sentRequests.size(), 1);
        EXPECT_EQ(_sentRequests.front().relativeUrl, "/api/v1/internal/lectures/candidates");
    }

    TEST_F(BackendDataFetcherTest, catalog_notFound)
    {
        auto fetcher{ createFetcher({
            { "/api/v1/internal/tests/candidates", { 200, std::string{ testCandidates } } },
        }) };

        // a missing candidates endpoint is an upstream failure
        EXPECT_THROW(fetcher->fetchCatalog(std::nullopt), UpstreamUnavailableException);
    }

    TEST_F(BackendDataFetcherTest, peerProfiles)
    {
        auto fetcher{ createFetcher({
            { "/api/v1/internal/users/profiles-for-similarity", { 200, R"({ "data": [ { "userId": "learner-2", "target": 600 } ] })" } },
        }) };

        const std::vector<InteractionHistory> profiles{ fetcher->fetchPeerProfiles() };
        ASSERT_EQ(profiles.size(), 1);
        EXPECT_EQ(profiles[0].learnerId, LearnerId{ "learner-2" });
        EXPECT_EQ(profiles[0].attributes.targetScore, 600);
    }

    TEST_F(BackendDataFetcherTest, peerProfiles_unavailable)
    {
        auto fetcher{ createFetcher({}) };
        EXPECT_THROW(fetcher->fetchPeerProfiles(), UpstreamUnavailableException);
    }

    TEST(BackendTypes, itemTypeFromString)
    {
        EXPECT_EQ(itemTypeFromString("test"), ItemType::Test);
        EXPECT_EQ(itemTypeFromString("Lecture"), ItemType::Lecture);
        EXPECT_EQ(itemTypeFromString("course"), std::nullopt);
        EXPECT_EQ(toString(ItemType::Test), "test");
    }

    TEST(BackendTypes, itemKey)
    {
        const ItemKey test1{ ItemId{ "1" }, ItemType::Test };
        const ItemKey lecture1{ ItemId{ "1" }, ItemType::Lecture };

        EXPECT_NE(test1, lecture1);
        EXPECT_LT((ItemKey{ ItemId{ "1" }, ItemType::Lecture }), (ItemKey{ ItemId{ "2" }, ItemType::Test }));

        Interaction interaction;
        interaction.itemId = ItemId{ "1" };
        interaction.itemType = ItemType::Lecture;
        EXPECT_EQ(getItemKey(interaction), lecture1);

        Item item;
        item.id = ItemId{ "1" };
        EXPECT_EQ(getItemKey(item), test1);
    }
} // namespace trs::backend::tests
