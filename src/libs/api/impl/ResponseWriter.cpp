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

#include "ResponseWriter.hpp"

#include <cmath>

#include "core/String.hpp"

namespace trs::api
{
    namespace
    {
        constexpr std::string_view serviceName{ "TOEIC Practice Recommender API" };
        constexpr std::string_view serviceVersion{ "1.0.0" };

        void writeEscapedString(std::ostream& os, std::string_view str)
        {
            os << '\"';
            core::stringUtils::writeJsonEscapedString(os, str);
            os << '\"';
        }

        void writeNumber(std::ostream& os, double value)
        {
            if (!std::isfinite(value))
                os << "null";
            else
                os << value;
        }

        // Retake metadata for tests, continue metadata for lectures
        void writeProgress(std::ostream& os, backend::ItemType itemType, const recommendation::ItemProgress& progress)
        {
            switch (itemType)
            {
            case backend::ItemType::Test:
                os << ",\"attempts\":" << progress.attemptCount;
                if (progress.averageScore)
                {
                    os << ",\"averageScore\":";
                    writeNumber(os, *progress.averageScore);
                }
                break;

            case backend::ItemType::Lecture:
                if (progress.completionPercent)
                {
                    os << ",\"completion\":";
                    writeNumber(os, *progress.completionPercent);
                }
                break;
            }
        }

        void writeRecommendationList(std::ostream& os, const recommendation::RecommendationList& recommendations)
        {
            os << '[';

            bool first{ true };
            for (const recommendation::Recommendation& recommendation : recommendations)
            {
                if (!first)
                    os << ',';
                first = false;

                os << "{\"id\":";
                writeEscapedString(os, recommendation.itemId.value());
                os << ",\"name\":";
                writeEscapedString(os, recommendation.name);
                os << ",\"score\":";
                writeNumber(os, recommendation.score);
                os << ",\"source\":";
                writeEscapedString(os, recommendation::toString(recommendation.provenance));
                os << ",\"explanation\":";
                writeEscapedString(os, recommendation.explanation);
                if (recommendation.progress)
                    writeProgress(os, recommendation.itemType, *recommendation.progress);
                os << '}';
            }

            os << ']';
        }
    } // namespace

    void writeServiceInfo(std::ostream& os)
    {
        os << "{\"name\":";
        writeEscapedString(os, serviceName);
        os << ",\"version\":";
        writeEscapedString(os, serviceVersion);
        os << ",\"status\":\"running\"}";
    }

    void writeHealth(std::ostream& os)
    {
        os << "{\"status\":\"healthy\"}";
    }

    void writeRecommendations(std::ostream& os, const RecommendationResponse& response)
    {
        os << "{\"userId\":";
        writeEscapedString(os, response.learnerId.value());
        os << ",\"recommendedTests\":";
        writeRecommendationList(os, response.tests);
        os << ",\"recommendedLectures\":";
        writeRecommendationList(os, response.lectures);
        os << '}';
    }

    void writeError(std::ostream& os, std::string_view detail)
    {
        os << "{\"detail\":";
        writeEscapedString(os, detail);
        os << '}';
    }
} // namespace trs::api
