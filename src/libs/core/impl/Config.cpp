/*
 * Copyright (C) 2025 Emeric Poupon
 *
 * This file is part of Shelf.
 *
 * Shelf is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * Shelf is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with Shelf.  If not, see <http://www.gnu.org/licenses/>.
 */

#include "Config.hpp"

#include <string>

#include "core/Exception.hpp"
#include "core/ILogger.hpp"

namespace shelf::core
{
    std::unique_ptr<IConfig> createConfig(const std::filesystem::path& p)
    {
        return std::make_unique<Config>(p);
    }

    Config::Config(const std::filesystem::path& p)
    {
        try
        {
            _config.readFile(p.c_str());
        }
        catch (const libconfig::FileIOException&)
        {
            throw ShelfException{ "Cannot open config file '" + p.string() + "'" };
        }
        catch (const libconfig::ParseException& e)
        {
            throw ShelfException{ "Cannot parse config file '" + p.string() + "', line " + std::to_string(e.getLine()) + ": " + e.getError() };
        }
    }

    template<typename T, typename SettingType>
    T Config::getValue(std::string_view setting, T def, std::string_view typeName) const
    {
        const std::string path{ setting };
        if (!_config.exists(path))
            return def;

        try
        {
            return static_cast<SettingType>(_config.lookup(path));
        }
        catch (const libconfig::SettingTypeException&)
        {
            SHELF_LOG(MAIN, WARNING, "Setting '" << setting << "' is not " << typeName << ", using default value");
            return def;
        }
    }

    std::string_view Config::getString(std::string_view setting, std::string_view def)
    {
        return getValue<std::string_view, const char*>(setting, def, "a string");
    }

    std::filesystem::path Config::getPath(std::string_view setting, const std::filesystem::path& def)
    {
        const std::string_view res{ getString(setting, "") };
        if (res.empty())
            return def;

        return std::filesystem::path{ res };
    }

    unsigned long Config::getULong(std::string_view setting, unsigned long def)
    {
        return getValue<unsigned long, unsigned int>(setting, def, "an unsigned integer");
    }

    bool Config::getBool(std::string_view setting, bool def)
    {
        return getValue<bool>(setting, def, "a boolean");
    }
} // namespace shelf::core
