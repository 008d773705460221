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

#include <random>
#include <string>
#include <vector>

#include <benchmark/benchmark.h>

#include "backend/IDataFetcher.hpp"
#include "services/recommendation/IRecommendationService.hpp"

namespace trs::recommendation
{
    namespace
    {
        class SnapshotDataFetcher final : public backend::IDataFetcher
        {
        public:
            SnapshotDataFetcher(std::size_t itemCount, std::size_t interactionCount, std::size_t featureCount)
            {
                std::minstd_rand randomEngine{ 42 };
                std::uniform_real_distribution<double> featureDistrib{ 0, 1 };
                std::uniform_int_distribution<std::size_t> popularityDistrib{ 0, 10'000 };
                std::uniform_int_distribution<std::size_t> itemDistrib{ 0, itemCount - 1 };

                for (std::size_t i{}; i < itemCount; ++i)
                {
                    backend::Item item;
                    item.id = backend::ItemId{ "item-" + std::to_string(i) };
                    item.type = (i % 2) ? backend::ItemType::Lecture : backend::ItemType::Test;
                    item.name = "Item " + std::to_string(i);
                    item.popularity = static_cast<double>(popularityDistrib(randomEngine));
                    for (std::size_t feature{}; feature < featureCount; ++feature)
                        item.features.push_back(featureDistrib(randomEngine));

                    _catalog.push_back(std::move(item));
                }

                for (std::size_t i{}; i < interactionCount; ++i)
                {
                    const backend::Item& item{ _catalog[itemDistrib(randomEngine)] };

                    backend::Interaction interaction;
                    interaction.itemId = item.id;
                    interaction.itemType = item.type;
                    interaction.type = (i % 3) ? backend::InteractionType::Attempted : backend::InteractionType::Completed;
                    interaction.outcome = featureDistrib(randomEngine);
                    _history.interactions.push_back(std::move(interaction));
                }
            }

        private:
            backend::InteractionHistory fetchInteractionHistory(const backend::LearnerId&) override { return _history; }
            backend::Catalog fetchCatalog(std::optional<backend::ItemType> itemType) override
            {
                backend::Catalog res;
                for (const backend::Item& item : _catalog)
                {
                    if (!itemType || item.type == *itemType)
                        res.push_back(item);
                }
                return res;
            }
            std::vector<backend::InteractionHistory> fetchPeerProfiles() override { return {}; }

            backend::InteractionHistory _history;
            backend::Catalog _catalog;
        };
    } // namespace

    static void BM_Recommend_Similarity(benchmark::State& state)
    {
        SnapshotDataFetcher dataFetcher{ static_cast<std::size_t>(state.range(0)), 50, 16 };
        const auto service{ createRecommendationService(dataFetcher, RecommendationSettings{}) };

        for (auto _ : state)
        {
            const RecommendationList recommendations{ service->recommend(backend::LearnerId{ "learner" }, 10, RecommendOptions{}) };
            benchmark::DoNotOptimize(recommendations);
        }
    }

    static void BM_Recommend_ColdStart(benchmark::State& state)
    {
        SnapshotDataFetcher dataFetcher{ static_cast<std::size_t>(state.range(0)), 0, 16 };
        const auto service{ createRecommendationService(dataFetcher, RecommendationSettings{}) };

        for (auto _ : state)
        {
            const RecommendationList recommendations{ service->recommend(backend::LearnerId{ "learner" }, 10, RecommendOptions{}) };
            benchmark::DoNotOptimize(recommendations);
        }
    }

    static void BM_RecommendPerItemType_Similarity(benchmark::State& state)
    {
        SnapshotDataFetcher dataFetcher{ static_cast<std::size_t>(state.range(0)), 50, 16 };
        const auto service{ createRecommendationService(dataFetcher, RecommendationSettings{}) };

        for (auto _ : state)
        {
            const RecommendationsPerItemType recommendations{ service->recommendPerItemType(backend::LearnerId{ "learner" }, 10, std::nullopt) };
            benchmark::DoNotOptimize(recommendations);
        }
    }

    BENCHMARK(BM_Recommend_Similarity)->Arg(100)->Arg(1'000)->Arg(10'000);
    BENCHMARK(BM_Recommend_ColdStart)->Arg(100)->Arg(1'000)->Arg(10'000);
    BENCHMARK(BM_RecommendPerItemType_Similarity)->Arg(100)->Arg(1'000)->Arg(10'000);
} // namespace trs::recommendation

BENCHMARK_MAIN();
