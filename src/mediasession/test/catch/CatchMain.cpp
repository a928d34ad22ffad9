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

#define CATCH_CONFIG_RUNNER

#include <mediasession/test/CatchWrapper.hpp>
#include <algorithm>
#include <string>
#include <vector>

namespace
{

const char* pathForXmlOutput(const int argc, const char* const argv[])
{
  const std::string outputArgPrefix = "--gtest_output=xml:";

  for (int i = 1; i < argc; i++)
  {
    if (std::string{argv[i]}.compare(0, outputArgPrefix.length(), outputArgPrefix) == 0)
    {
      return argv[i] + outputArgPrefix.length();
    }
  }

  return nullptr;
}

} // anonymous namespace

int main(const int argc, const char* const argv[])
{
  // CI passes google test-style output flags, translate them for Catch
  const auto pPath = pathForXmlOutput(argc, argv);
  const auto args = pPath == nullptr
                      ? std::vector<const char*>{}
                      : std::vector<const char*>{"-r", "junit", "-o", pPath};

  std::vector<const char*> inArgs(argv, argv + argc);

  inArgs.erase(std::remove_if(inArgs.begin(), inArgs.end(),
                              [](const char* arg) {
                                return std::string{arg}.find("--gtest") != std::string::npos;
                              }),
               inArgs.end());

  inArgs.insert(inArgs.end(), args.begin(), args.end());

  Catch::Session session;
  const auto result = session.applyCommandLine(int(inArgs.size()), inArgs.data());
  if (result != 0)
  {
    return result;
  }
  return session.run();
}
