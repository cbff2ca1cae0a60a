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

#include "log.hpp"
#include <atomic>
#include <cstdlib>
#include <stdexcept>

namespace Log
{

static std::atomic<int> level(Log::Info);

static std::atomic<std::size_t> num_errors(0);

// One per thread: filtered writes still touch the stream's state bits
static std::ostream& dummy()
  {
  static thread_local std::ostream stream(0);
  return stream;
  }

void set_level(Level value)
  {
  level = value;
  }

Level get_level()
  {
  return static_cast<Level>(level.load());
  }

Level parse_level(std::string const& name)
  {
  if (name == "warning")
    {
    return Log::Warning;
    }
  if (name == "info")
    {
    return Log::Info;
    }
  if (name == "debug")
    {
    return Log::Debug;
    }
  if (name == "trace")
    {
    return Log::Trace;
    }
  throw std::runtime_error("unknown log level: " + name);
  }

std::ostream& error()
  {
  ++num_errors;
  return std::cerr << "++ ERROR: ";
  }

std::ostream& trace()
  {
  if (level < Log::Trace)
    {
    return dummy();
    }
  return std::clog << "-- ";
  }

std::ostream& debug()
  {
  if (level < Log::Debug)
    {
    return dummy();
    }
  return std::clog << "-- ";
  }

std::ostream& info()
  {
  if (level < Log::Info)
    {
    return dummy();
    }
  return std::clog << "-- ";
  }

std::ostream& warn()
  {
  return std::clog << "++ WARNING: ";
  }

std::size_t error_count()
  {
  return num_errors;
  }

int result()
  {
  if (num_errors == 0)
    {
    return EXIT_SUCCESS;
    }
  std::cerr << "\n" << num_errors << " Errors occured!" << std::endl;
  return EXIT_FAILURE;
  }

} // namespace Log
