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

#include "ResponseParser.hpp"

#include <algorithm>

#include <Wt/Json/Array.h>
#include <Wt/Json/Object.h>
#include <Wt/Json/Parser.h>
#include <Wt/Json/Value.h>
#include <Wt/WException.h>

#include "backend/Exception.hpp"
#include "core/ILogger.hpp"
#include "core/String.hpp"

#define LOG(sev, message) TRS_LOG(BACKEND, sev, "[ResponseParser] " << message)

namespace trs::backend::responseParser
{
    namespace
    {
        constexpr double maxTOEICScore{ 990 };
        constexpr double maxCompletionPercent{ 100 };

        std::optional<double> getOptionalNumber(const Wt::Json::Object& obj, const std::string& name)
        {
            const Wt::Json::Value& value{ obj.get(name) };
            if (value.type() != Wt::Json::Type::Number)
                return std::nullopt;

            return static_cast<double>(value);
        }

        std::optional<std::string> getOptionalString(const Wt::Json::Object& obj, const std::string& name)
        {
            const Wt::Json::Value& value{ obj.get(name) };
            if (value.type() != Wt::Json::Type::String)
                return std::nullopt;

            return static_cast<std::string>(value);
        }

        // Identifiers may be sent as strings or as integers
        std::string getIdentifier(const Wt::Json::Object& obj, const std::string& name)
        {
            const Wt::Json::Value& value{ obj.get(name) };
            switch (value.type())
            {
            case Wt::Json::Type::String:
                if (std::string id{ static_cast<std::string>(value) }; !id.empty())
                    return id;
                break;
            case Wt::Json::Type::Number:
                return std::to_string(static_cast<long long>(value));
            default:
                break;
            }

            throw Exception{ "Missing or invalid '" + name + "'" };
        }

        double clampOutcome(double value)
        {
            return std::clamp(value, 0.0, 1.0);
        }

        Wt::WDateTime getOptionalDateTime(const Wt::Json::Object& obj, const std::string& name)
        {
            const std::optional<std::string> str{ getOptionalString(obj, name) };
            if (!str)
                return {};

            return core::stringUtils::fromISO8601String(*str);
        }

        std::vector<std::string> parseTopics(const Wt::Json::Object& obj)
        {
            std::vector<std::string> topics;

            const Wt::Json::Value& value{ obj.get("topics") };
            if (value.type() != Wt::Json::Type::Array)
                return topics;

            for (const Wt::Json::Value& topic : static_cast<const Wt::Json::Array&>(value))
            {
                if (topic.type() == Wt::Json::Type::String)
                    topics.push_back(static_cast<std::string>(topic));
            }

            return topics;
        }

        std::vector<double> parseFeatures(const Wt::Json::Object& obj)
        {
            std::vector<double> features;

            const Wt::Json::Value& value{ obj.get("features") };
            if (value.type() != Wt::Json::Type::Array)
                return features;

            for (const Wt::Json::Value& feature : static_cast<const Wt::Json::Array&>(value))
            {
                if (feature.type() != Wt::Json::Type::Number)
                    throw Exception{ "Non numeric feature value" };

                features.push_back(static_cast<double>(feature));
            }

            return features;
        }

        Interaction parseTestRecord(const Wt::Json::Object& recordObj)
        {
            Interaction interaction;
            interaction.itemId = ItemId{ getIdentifier(recordObj, "testId") };
            interaction.itemType = ItemType::Test;

            std::optional<double> attempts{ getOptionalNumber(recordObj, "attempt") };
            if (!attempts)
                attempts = getOptionalNumber(recordObj, "attempts");
            if (attempts && *attempts > 0)
                interaction.attemptCount = static_cast<std::size_t>(*attempts);

            std::optional<double> avgScore{ getOptionalNumber(recordObj, "avgScore") };
            if (!avgScore)
                avgScore = getOptionalNumber(recordObj, "averageScore");
            if (avgScore)
                interaction.outcome = clampOutcome(*avgScore / maxTOEICScore);

            // a record only exists once a test has been submitted, unless it explicitly reports no attempt
            const bool submitted{ avgScore || !attempts || *attempts > 0 };
            interaction.type = submitted ? InteractionType::Completed : InteractionType::Attempted;

            interaction.timestamp = getOptionalDateTime(recordObj, "lastAttemptAt");

            return interaction;
        }

        Interaction parseLectureProgress(const std::string& lectureId, const Wt::Json::Value& progressValue)
        {
            if (lectureId.empty())
                throw Exception{ "Empty lecture id" };

            Interaction interaction;
            interaction.itemId = ItemId{ lectureId };
            interaction.itemType = ItemType::Lecture;

            // either a bare percentage or an object
            std::optional<double> percent;
            if (progressValue.type() == Wt::Json::Type::Number)
            {
                percent = static_cast<double>(progressValue);
            }
            else if (progressValue.type() == Wt::Json::Type::Object)
            {
                const Wt::Json::Object& progressObj = progressValue;
                percent = getOptionalNumber(progressObj, "percent");
                interaction.timestamp = getOptionalDateTime(progressObj, "updatedAt");
            }
            else
                throw Exception{ "Invalid progress entry" };

            if (percent)
                interaction.outcome = clampOutcome(*percent / maxCompletionPercent);

            interaction.type = (percent && *percent >= maxCompletionPercent) ? InteractionType::Completed : InteractionType::Attempted;
            return interaction;
        }

        TopicStat parseTopicStat(const Wt::Json::Object& statObj)
        {
            TopicStat stat;
            stat.topic = getOptionalString(statObj, "topicName").value_or("");
            if (stat.topic.empty())
                throw Exception{ "Missing topic name" };

            stat.correctCount = static_cast<std::size_t>(std::max(0.0, getOptionalNumber(statObj, "totalCorrect").value_or(0)));
            stat.incorrectCount = static_cast<std::size_t>(std::max(0.0, getOptionalNumber(statObj, "totalIncorrect").value_or(0)));
            return stat;
        }

        template<typename Func>
        void forEachEntry(const Wt::Json::Array& entries, std::string_view entryDesc, Func&& func)
        {
            for (const Wt::Json::Value& entry : entries)
            {
                try
                {
                    if (entry.type() != Wt::Json::Type::Object)
                        throw Exception{ "Not an object" };

                    func(static_cast<const Wt::Json::Object&>(entry));
                }
                catch (const Exception& e)
                {
                    LOG(WARNING, "Cannot parse " << entryDesc << ": " << e.what() << ", skipping");
                }
                catch (const Wt::WException& e)
                {
                    LOG(WARNING, "Cannot parse " << entryDesc << ": " << e.what() << ", skipping");
                }
            }
        }

        Wt::Json::Object parseRoot(std::string_view msgBody)
        {
            Wt::Json::Object root;
            try
            {
                Wt::Json::parse(std::string{ msgBody }, root);
            }
            catch (const Wt::WException& e)
            {
                throw UpstreamUnavailableException{ "Cannot parse backend response: " + std::string{ e.what() } };
            }

            return root;
        }

        template<typename ItemParseFunc>
        Catalog parseCandidates(std::string_view msgBody, std::string_view entryDesc, ItemParseFunc itemParseFunc)
        {
            Catalog catalog;

            const Wt::Json::Object root{ parseRoot(msgBody) };
            const Wt::Json::Value& data{ root.get("data") };
            if (data.type() != Wt::Json::Type::Array)
            {
                LOG(WARNING, "Unexpected " << entryDesc << " response structure, no 'data' array");
                return catalog;
            }

            const Wt::Json::Array& entries = data;
            catalog.reserve(entries.size());
            forEachEntry(entries, entryDesc, [&](const Wt::Json::Object& obj) {
                catalog.push_back(itemParseFunc(obj));
            });

            LOG(DEBUG, "Parsed " << catalog.size() << "/" << entries.size() << " " << entryDesc << " entries");
            return catalog;
        }

        std::optional<double> getPositiveNumber(const Wt::Json::Object& obj, const std::string& name)
        {
            const std::optional<double> value{ getOptionalNumber(obj, name) };
            if (!value || *value <= 0)
                return std::nullopt;

            return value;
        }

        InteractionHistory parseProfile(const LearnerId& learnerId, const Wt::Json::Object& profileObj)
        {
            InteractionHistory history;
            history.learnerId = learnerId;

            history.attributes.targetScore = getPositiveNumber(profileObj, "target");
            // 0 means no test taken yet
            history.attributes.currentScore = getPositiveNumber(profileObj, "averageTotalScore");
            history.attributes.listeningScore = getPositiveNumber(profileObj, "averageListeningScore");
            history.attributes.readingScore = getPositiveNumber(profileObj, "averageReadingScore");

            if (const Wt::Json::Value & topicStats{ profileObj.get("topicStats") }; topicStats.type() == Wt::Json::Type::Array)
            {
                forEachEntry(static_cast<const Wt::Json::Array&>(topicStats), "topic stat", [&](const Wt::Json::Object& statObj) {
                    history.attributes.topicStats.push_back(parseTopicStat(statObj));
                });
            }

            if (const Wt::Json::Value & testHistory{ profileObj.get("testHistory") }; testHistory.type() == Wt::Json::Type::Array)
            {
                forEachEntry(static_cast<const Wt::Json::Array&>(testHistory), "test history record", [&](const Wt::Json::Object& recordObj) {
                    history.interactions.push_back(parseTestRecord(recordObj));
                });
            }

            if (const Wt::Json::Value & learningProgress{ profileObj.get("learningProgress") }; learningProgress.type() == Wt::Json::Type::Object)
            {
                for (const auto& [lectureId, progressValue] : static_cast<const Wt::Json::Object&>(learningProgress))
                {
                    try
                    {
                        history.interactions.push_back(parseLectureProgress(lectureId, progressValue));
                    }
                    catch (const Exception& e)
                    {
                        LOG(WARNING, "Cannot parse learning progress of lecture '" << lectureId << "': " << e.what() << ", skipping");
                    }
                    catch (const Wt::WException& e)
                    {
                        LOG(WARNING, "Cannot parse learning progress of lecture '" << lectureId << "': " << e.what() << ", skipping");
                    }
                }
            }

            return history;
        }
    } // namespace

    InteractionHistory parseLearnerProfile(const LearnerId& learnerId, std::string_view msgBody)
    {
        const Wt::Json::Object root{ parseRoot(msgBody) };
        const Wt::Json::Value& data{ root.get("data") };
        if (data.type() != Wt::Json::Type::Object)
        {
            LOG(WARNING, "No profile data for learner '" << learnerId << "'");
            return InteractionHistory{ .learnerId = learnerId, .attributes = {}, .interactions = {} };
        }

        return parseProfile(learnerId, static_cast<const Wt::Json::Object&>(data));
    }

    std::vector<InteractionHistory> parsePeerProfiles(std::string_view msgBody)
    {
        std::vector<InteractionHistory> profiles;

        const Wt::Json::Object root{ parseRoot(msgBody) };
        const Wt::Json::Value& data{ root.get("data") };
        if (data.type() != Wt::Json::Type::Array)
        {
            LOG(WARNING, "Unexpected peer profiles response structure, no 'data' array");
            return profiles;
        }

        const Wt::Json::Array& entries = data;
        profiles.reserve(entries.size());
        forEachEntry(entries, "peer profile", [&](const Wt::Json::Object& profileObj) {
            profiles.push_back(parseProfile(LearnerId{ getIdentifier(profileObj, "userId") }, profileObj));
        });

        LOG(DEBUG, "Parsed " << profiles.size() << "/" << entries.size() << " peer profiles");
        return profiles;
    }

    Catalog parseTestCandidates(std::string_view msgBody)
    {
        return parseCandidates(msgBody, "test candidate", [](const Wt::Json::Object& testObj) {
            Item item;
            item.id = ItemId{ getIdentifier(testObj, "testId") };
            item.type = ItemType::Test;
            item.name = getOptionalString(testObj, "name").value_or("");
            item.topics = parseTopics(testObj);
            item.difficulty = getOptionalNumber(testObj, "difficulty");
            item.features = parseFeatures(testObj);
            item.popularity = getOptionalNumber(testObj, "totalUserAttempt");
            return item;
        });
    }

    Catalog parseLectureCandidates(std::string_view msgBody)
    {
        return parseCandidates(msgBody, "lecture candidate", [](const Wt::Json::Object& lectureObj) {
            Item item;
            item.id = ItemId{ getIdentifier(lectureObj, "lectureId") };
            item.type = ItemType::Lecture;
            item.name = getOptionalString(lectureObj, "name").value_or("");
            item.topics = parseTopics(lectureObj);
            item.difficulty = getOptionalNumber(lectureObj, "difficulty");
            item.features = parseFeatures(lectureObj);
            item.popularity = getOptionalNumber(lectureObj, "totalLearners");
            return item;
        });
    }
} // namespace trs::backend::responseParser
