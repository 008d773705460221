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

#include "Config.hpp"

#include "core/Exception.hpp"
#include "core/ILogger.hpp"

#define LOG(sev, message) TRS_LOG(CONFIG, sev, "[Config] " << message)

namespace trs::core
{
    std::unique_ptr<IConfig> createConfig(const std::filesystem::path& p)
    {
        return std::make_unique<Config>(p);
    }

    Config::Config(const std::filesystem::path& p)
        : _path{ p }
    {
        // so that "weight = 1;" can be read as a floating point value
        _config.setAutoConvert(true);

        try
        {
            _config.readFile(p.c_str());
        }
        catch (const libconfig::FileIOException&)
        {
            throw TrsException{ "Cannot open config file '" + p.string() + "'" };
        }
        catch (const libconfig::ParseException& e)
        {
            throw TrsException{ "Cannot parse config file '" + p.string() + "', line = " + std::to_string(e.getLine()) + ", error = '" + e.getError() + "'" };
        }
        catch (const libconfig::ConfigException& e)
        {
            throw TrsException{ "Cannot open config file '" + p.string() + "': " + e.what() };
        }
    }

    const libconfig::Setting* Config::lookup(std::string_view setting) const
    {
        const std::string path{ setting };
        if (!_config.exists(path))
            return nullptr;

        return &_config.lookup(path);
    }

    template<typename T>
    std::optional<T> Config::lookupAs(std::string_view setting) const
    {
        const libconfig::Setting* value{ lookup(setting) };
        if (!value)
            return std::nullopt;

        try
        {
            return static_cast<T>(*value);
        }
        catch (const libconfig::SettingTypeException&)
        {
            LOG(WARNING, "Unexpected type for '" << setting << "' in '" << _path.string() << "', using default value");
            return std::nullopt;
        }
    }

    std::string_view Config::getString(std::string_view setting, std::string_view def)
    {
        // points to the storage of the loaded configuration
        if (const auto value{ lookupAs<const char*>(setting) })
            return *value;

        return def;
    }

    void Config::visitStrings(std::string_view setting, std::function<void(std::string_view)> func, std::initializer_list<std::string_view> defs)
    {
        const libconfig::Setting* values{ lookup(setting) };
        if (!values)
        {
            for (std::string_view def : defs)
                func(def);
            return;
        }

        if (!values->isList() && !values->isArray())
        {
            LOG(WARNING, "Expected a list for '" << setting << "' in '" << _path.string() << "'");
            return;
        }

        for (int i{}; i < values->getLength(); ++i)
        {
            const libconfig::Setting& value{ (*values)[i] };
            if (value.getType() != libconfig::Setting::TypeString)
            {
                LOG(WARNING, "Skipping non string entry #" << i << " of '" << setting << "'");
                continue;
            }

            func(static_cast<const char*>(value));
        }
    }

    std::filesystem::path Config::getPath(std::string_view setting, const std::filesystem::path& def)
    {
        if (const auto value{ lookupAs<const char*>(setting) })
            return std::filesystem::path{ *value };

        return def;
    }

    unsigned long Config::getULong(std::string_view setting, unsigned long def)
    {
        if (const auto value{ lookupAs<long long>(setting) })
        {
            if (*value >= 0)
                return static_cast<unsigned long>(*value);

            LOG(WARNING, "Negative value for '" << setting << "', using default value");
        }

        return def;
    }

    double Config::getDouble(std::string_view setting, double def)
    {
        return lookupAs<double>(setting).value_or(def);
    }

    bool Config::getBool(std::string_view setting, bool def)
    {
        return lookupAs<bool>(setting).value_or(def);
    }
} // namespace trs::core
