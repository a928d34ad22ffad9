/* Copyright 2026, Ableton AG, Berlin. All rights reserved.
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU General Public License as published by
 *  the Free Software Foundation, either version 2 of the License, or
 *  (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU General Public License for more details.
 *
 *  You should have received a copy of the GNU General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 *
 *  If you would like to incorporate MediaSession into a proprietary software
 *  application, please contact <link-devs@ableton.com>.
 */

#pragma once

#include <iostream>
#include <ostream>
#include <string>
#include <utility>

namespace mediasession
{
namespace util
{

// Concept: Log
// Requirements:
//  - copyable
//  - selectors for debug, info, warning, and error streams
//  - channel function that provides new log object tagged with the
//    given channel name

// Null object for the Log concept
struct NullLog
{
  template <typename T>
  friend NullLog& operator<<(NullLog& log, const T&)
  {
    return log;
  }

  friend NullLog& debug(NullLog& log)
  {
    return log;
  }

  friend NullLog& info(NullLog& log)
  {
    return log;
  }

  friend NullLog& warning(NullLog& log)
  {
    return log;
  }

  friend NullLog& error(NullLog& log)
  {
    return log;
  }

  friend NullLog channel(const NullLog&, std::string)
  {
    return {};
  }
};

// std streams-based log. Debug, info and warning lines go to the output
// stream, error lines to the error stream. Both streams must outlive
// the log and every channel derived from it.
class StdLog
{
public:
  StdLog(std::string channelName = {},
         std::ostream& output = std::clog,
         std::ostream& errors = std::cerr)
    : mChannelName(std::move(channelName))
    , mpOutput(&output)
    , mpErrors(&errors)
  {
  }

  // Writes the channel prefix on construction and terminates the line
  // when the statement ends
  class StdLogStream
  {
  public:
    StdLogStream(std::ostream& ioStream, const std::string& channelName)
      : mpIoStream(&ioStream)
    {
      if (!channelName.empty())
      {
        ioStream << "[" << channelName << "] ";
      }
    }

    StdLogStream(StdLogStream&& rhs)
      : mpIoStream(rhs.mpIoStream)
    {
      rhs.mpIoStream = nullptr;
    }

    ~StdLogStream()
    {
      if (mpIoStream)
      {
        (*mpIoStream) << "\n";
      }
    }

    template <typename T>
    std::ostream& operator<<(const T& rhs)
    {
      (*mpIoStream) << rhs;
      return *mpIoStream;
    }

  private:
    std::ostream* mpIoStream;
  };

  const std::string& channelName() const
  {
    return mChannelName;
  }

  friend StdLogStream debug(const StdLog& log)
  {
    return {*log.mpOutput, log.mChannelName};
  }

  friend StdLogStream info(const StdLog& log)
  {
    return {*log.mpOutput, log.mChannelName};
  }

  friend StdLogStream warning(const StdLog& log)
  {
    return {*log.mpOutput, log.mChannelName};
  }

  friend StdLogStream error(const StdLog& log)
  {
    return {*log.mpErrors, log.mChannelName};
  }

  // Channels nest: the parent name and the new name are joined by "::"
  friend StdLog channel(const StdLog& log, const std::string& channelName)
  {
    auto compositeName =
      log.mChannelName.empty() ? channelName : log.mChannelName + "::" + channelName;
    return {std::move(compositeName), *log.mpOutput, *log.mpErrors};
  }

private:
  std::string mChannelName;
  std::ostream* mpOutput;
  std::ostream* mpErrors;
};

} // namespace util
} // namespace mediasession
