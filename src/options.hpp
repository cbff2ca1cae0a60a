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

#ifndef OPTIONS_HPP
#define OPTIONS_HPP

#include "revision_store.hpp"

#include <boost/property_tree/ptree_fwd.hpp>
#include <string>

struct Options
  {
  Options();

  std::string repository;
  std::string user;
  std::string message;
  std::string log_level;
  wikirev::store_settings settings;
  };

extern Options options;

// Takes the settings present in an INI configuration tree, leaving the
// others as they are:
//
//   [git]
//   executable = /usr/bin/git
//   timeout_ms = 1800
//   grace_ms = 500
//   maintenance_timeout_ms = 60000
//
//   [store]
//   domain = example.com
//
//   [log]
//   level = info
void apply_config(boost::property_tree::ptree const& config, Options& result);

// Reads an INI file and applies it.  Throws ini_parser_error if the
// file cannot be read or parsed.
void load_config_file(std::string const& filename, Options& result);

#endif /* OPTIONS_HPP */
