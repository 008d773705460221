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

#include <algorithm>
#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include <Wt/WLogSink.h>
#include <Wt/WServer.h>
#include <boost/asio/io_context.hpp>

#include "api/RecommendationResource.hpp"
#include "backend/IDataFetcher.hpp"
#include "core/Exception.hpp"
#include "core/IConfig.hpp"
#include "core/ILogger.hpp"
#include "core/IOContextRunner.hpp"
#include "core/Service.hpp"
#include "core/http/IClient.hpp"
#include "services/recommendation/IRecommendationService.hpp"

namespace trs
{
    namespace
    {
        std::size_t getThreadCount()
        {
            const unsigned long configHttpServerThreadCount{ core::Service<core::IConfig>::get()->getULong("http-server-thread-count", 0) };

            // Requests block while waiting for the backend
            return configHttpServerThreadCount ? configHttpServerThreadCount : std::max<unsigned long>(2, std::thread::hardware_concurrency());
        }

        std::vector<std::string> generateWtArgs(std::string execPath)
        {
            core::IConfig& config{ *core::Service<core::IConfig>::get() };

            std::vector<std::string> args;

            args.push_back(execPath);
            args.push_back("--docroot=.");
            args.push_back("--http-port=" + std::to_string(config.getULong("listen-port", 8000)));
            args.push_back("--http-address=" + std::string{ config.getString("listen-addr", "0.0.0.0") });
            args.push_back("--threads=" + std::to_string(getThreadCount()));

            return args;
        }

        core::logging::Severity getLogMinSeverity()
        {
            const std::string_view minSeverity{ core::Service<core::IConfig>::get()->getString("log-min-severity", "info") };

            if (const std::optional<core::logging::Severity> severity{ core::logging::severityFromString(minSeverity) })
                return *severity;

            throw core::TrsException{ "Invalid config value for 'log-min-severity'" };
        }

        core::http::ClientSettings getBackendClientSettings()
        {
            core::IConfig& config{ *core::Service<core::IConfig>::get() };

            return core::http::ClientSettings{
                .baseUrl = std::string{ config.getString("backend-api-base-url", "http://localhost:8080") },
                .timeout = std::chrono::seconds{ config.getULong("backend-timeout", 5) },
                .maxRetryCount = config.getULong("backend-max-retry-count", 2),
                .retryWaitDuration = std::chrono::seconds{ 1 },
            };
        }

        backend::BackendSettings getBackendSettings()
        {
            core::IConfig& config{ *core::Service<core::IConfig>::get() };

            backend::BackendSettings settings;
            settings.internalApiKey = config.getString("backend-internal-api-key", "");
            config.visitStrings("feature-topics", [&](std::string_view topic) {
                settings.topicVocabulary.emplace_back(topic);
            },
                {});
            settings.difficultyScale = config.getDouble("feature-difficulty-scale", settings.difficultyScale);

            return settings;
        }

        class TrsLogSink : public Wt::WLogSink
        {
        public:
            TrsLogSink(core::logging::ILogger& logger)
                : _logger{ logger }
            {
            }

        private:
            void log(const std::string& type, const std::string& scope, const std::string& message) const noexcept override
            {
                // Some wt code path may go here without testing logging()
                if (logging(type, scope))
                {
                    const core::logging::Severity severity{ getSeverity(type, scope) };
                    _logger.processLog(core::logging::Module::WT, severity, message);
                }
            }

            bool logging(const std::string& type, const std::string& scope) const noexcept override
            {
                const core::logging::Severity severity{ getSeverity(type, scope) };
                return _logger.isSeverityActive(severity);
            }

            static core::logging::Severity getSeverity(const std::string& type, std::string_view scope)
            {
                const core::logging::Severity severity{ core::logging::severityFromString(type).value_or(core::logging::Severity::INFO) };

                // access logs are too verbose
                if (severity == core::logging::Severity::INFO && (scope == "WebRequest" || scope == "wthttp"))
                    return core::logging::Severity::DEBUG;

                return severity;
            }

            core::logging::ILogger& _logger;
        };
    } // namespace

    int main(int argc, char* argv[])
    {
        std::filesystem::path configFilePath{ "/etc/trs.conf" };
        int res{ EXIT_FAILURE };

        assert(argc > 0);
        assert(argv[0] != NULL);

        auto displayUsage{ [&](std::ostream& os) {
            os << "Usage:\t" << argv[0] << "\t[conf_file]\n\n"
               << "Options:\n"
               << "\tconf_file:\t path to the TRS configuration file (defaults to " << configFilePath << ")\n\n";
        } };

        if (argc == 2)
        {
            const std::string_view arg{ argv[1] };
            if (arg == "-h" || arg == "--help")
            {
                displayUsage(std::cout);
                return EXIT_SUCCESS;
            }
            configFilePath = std::string(arg, 0, 256);
        }
        else if (argc > 2)
        {
            displayUsage(std::cerr);
            return EXIT_FAILURE;
        }

        try
        {
            core::Service<core::IConfig> config{ core::createConfig(configFilePath) };
            core::Service<core::logging::ILogger> logger{ core::logging::createLogger(getLogMinSeverity(), config->getPath("log-file", "")) };

            const std::vector<std::string> wtServerArgs{ generateWtArgs(argv[0]) };

            std::vector<const char*> wtArgv(wtServerArgs.size());
            for (std::size_t i = 0; i < wtServerArgs.size(); ++i)
                wtArgv[i] = wtServerArgs[i].c_str();

            TrsLogSink trsLogSink{ *logger };
            Wt::WServer server{ argv[0] };
            server.setCustomLogger(trsLogSink);
            server.setServerConfiguration(wtServerArgs.size(), const_cast<char**>(&wtArgv[0]));

            boost::asio::io_context ioContext; // drives the backend HTTP client, out of the Wt event loop
            core::IOContextRunner ioContextRunner{ ioContext, 1, "Backend" };

            // Service initialization order is important (reverse-order for deinit)
            const std::unique_ptr<backend::IDataFetcher> dataFetcher{ backend::createBackendDataFetcher(core::http::createClient(ioContext, getBackendClientSettings()), getBackendSettings()) };
            const recommendation::RecommendationSettings recommendationSettings{ recommendation::settingsFromConfig(*config) };
            core::Service<recommendation::IRecommendationService> recommendationService{ recommendation::createRecommendationService(*dataFetcher, recommendationSettings) };

            TRS_LOG(MAIN, INFO, "Recommendation settings: cold start threshold = " << recommendationSettings.coldStartThreshold
                                                                                    << ", blend mode = " << (recommendationSettings.blendMode == recommendation::BlendMode::Fill ? "fill" : "weighted")
                                                                                    << ", include completed = " << (recommendationSettings.includeCompletedByDefault ? "true" : "false"));

            const std::unique_ptr<Wt::WResource> recommendationResource{ api::createRecommendationResource(*recommendationService) };
            server.addResource(recommendationResource.get(), "/");
            server.addResource(recommendationResource.get(), "/health");
            server.addResource(recommendationResource.get(), "/recommendations");

            TRS_LOG(MAIN, INFO, "Starting web server...");
            server.start();

            TRS_LOG(MAIN, INFO, "Now running...");
            Wt::WServer::waitForShutdown();

            TRS_LOG(MAIN, INFO, "Stopping server...");
            server.stop();

            TRS_LOG(MAIN, INFO, "Quitting...");
            res = EXIT_SUCCESS;
        }
        catch (const Wt::WServer::Exception& e)
        {
            TRS_LOG(MAIN, FATAL, "Caught WServer::Exception: " << e.what());
            std::cerr << "Caught a WServer::Exception: " << e.what() << std::endl;
            res = EXIT_FAILURE;
        }
        catch (const std::exception& e)
        {
            TRS_LOG(MAIN, FATAL, "Caught std::exception: " << e.what());
            std::cerr << "Caught std::exception: " << e.what() << std::endl;
            res = EXIT_FAILURE;
        }

        return res;
    }
} // namespace trs

int main(int argc, char* argv[])
{
    return trs::main(argc, argv);
}
