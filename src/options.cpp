/*
 *  Copyright (C) 2013 Daniel Pfeifer <daniel@pfeifer-mail.de>
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU General Public License as published by
 *  the Free Software Foundation, either version 3 of the License, or
 *  (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU General Public License for more details.
 *
 *  You should have received a copy of the GNU General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */

#include "options.hpp"
#include "log.hpp"

#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <chrono>
#include <stdexcept>

Options options;

Options::Options()
  : user("wikirev"),
    message("Edited with wikirev-admin"),
    log_level("info")
  {
  }

namespace
{

void apply_milliseconds(
  boost::property_tree::ptree const& config, char const* key, std::chrono::milliseconds& value)
  {
  if (boost::optional<boost::property_tree::ptree const&> node = config.get_child_optional(key))
    {
    // Throws ptree_bad_data for anything but a number
    long const ms = node->get_value<long>();
    if (ms <= 0)
      {
      throw std::runtime_error(std::string("configuration value ") + key + " must be positive");
      }
    value = std::chrono::milliseconds(ms);
    }
  }

} // namespace

void apply_config(boost::property_tree::ptree const& config, Options& result)
  {
  if (boost::optional<std::string> git = config.get_optional<std::string>("git.executable"))
    {
    result.settings.git = *git;
    }
  apply_milliseconds(config, "git.timeout_ms", result.settings.limits.timeout);
  apply_milliseconds(config, "git.grace_ms", result.settings.limits.grace);
  apply_milliseconds(config, "git.maintenance_timeout_ms", result.settings.maintenance.timeout);
  result.settings.maintenance.grace = result.settings.limits.grace;

  if (boost::optional<std::string> domain = config.get_optional<std::string>("store.domain"))
    {
    result.settings.domain = *domain;
    }
  if (boost::optional<std::string> level = config.get_optional<std::string>("log.level"))
    {
    result.log_level = *level;
    }
  }

void load_config_file(std::string const& filename, Options& result)
  {
  Log::debug() << "Reading configuration from " << filename << std::endl;

  boost::property_tree::ptree config;
  boost::property_tree::read_ini(filename, config);
  apply_config(config, result);
  }
