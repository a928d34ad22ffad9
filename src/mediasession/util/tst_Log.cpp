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

#include <mediasession/test/CatchWrapper.hpp>
#include <mediasession/util/Log.hpp>
#include <sstream>
#include <string>

namespace mediasession
{
namespace util
{

TEST_CASE("StdLog | Levels", "[Log]")
{
  std::ostringstream output;
  std::ostringstream errors;
  const auto log = StdLog{"wire", output, errors};

  SECTION("EachStatementIsOneLine")
  {
    debug(log) << "entry " << 42;
    info(log) << "parsed";
    warning(log) << "skipped";
    CHECK("[wire] entry 42\n[wire] parsed\n[wire] skipped\n" == output.str());
    CHECK(errors.str().empty());
  }

  SECTION("ErrorsGoToErrorStream")
  {
    error(log) << "truncated";
    CHECK(output.str().empty());
    CHECK("[wire] truncated\n" == errors.str());
  }

  SECTION("UnnamedLogHasNoPrefix")
  {
    debug(StdLog{{}, output, errors}) << "plain";
    CHECK("plain\n" == output.str());
  }
}

TEST_CASE("StdLog | Channels", "[Log]")
{
  std::ostringstream output;
  std::ostringstream errors;

  SECTION("NamesNest")
  {
    const auto log = channel(channel(StdLog{{}, output, errors}, "token"), "Record");
    CHECK("token::Record" == log.channelName());
    debug(log) << "restored";
    CHECK("[token::Record] restored\n" == output.str());
  }

  SECTION("ChannelOutlivesParent")
  {
    auto makeChild = [&] {
      auto parent = StdLog{"app", output, errors};
      return channel(parent, "child");
    };
    const auto child = makeChild();
    error(child) << "late";
    CHECK("[app::child] late\n" == errors.str());
  }
}

TEST_CASE("NullLog | AcceptsAnyStatement", "[Log]")
{
  auto log = channel(NullLog{}, "ignored");
  debug(log) << "value " << 1 << 2.5;
  error(log) << std::string{"text"};
  CHECK(&log == &info(log));
}

} // namespace util
} // namespace mediasession
