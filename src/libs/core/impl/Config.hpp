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

#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include <libconfig.h++>

#include "core/IConfig.hpp"

namespace trs::core
{
    // libconfig file, loaded once at construction
    class Config final : public IConfig
    {
    public:
        explicit Config(const std::filesystem::path& p);
        ~Config() override = default;

        Config(const Config&) = delete;
        Config& operator=(const Config&) = delete;

    private:
        std::string_view getString(std::string_view setting, std::string_view def) override;
        void visitStrings(std::string_view setting, std::function<void(std::string_view)> func, std::initializer_list<std::string_view> defs) override;
        std::filesystem::path getPath(std::string_view setting, const std::filesystem::path& def) override;
        unsigned long getULong(std::string_view setting, unsigned long def) override;
        double getDouble(std::string_view setting, double def) override;
        bool getBool(std::string_view setting, bool def) override;

        // nullopt if the setting is missing or has an unexpected type (logged)
        const libconfig::Setting* lookup(std::string_view setting) const;

        template<typename T>
        std::optional<T> lookupAs(std::string_view setting) const;

        const std::filesystem::path _path;
        libconfig::Config _config;
    };
} // namespace trs::core
