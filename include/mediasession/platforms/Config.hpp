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

#include <mediasession/platforms/asio/EndpointBinder.hpp>
#include <mediasession/token/SessionToken.hpp>
#include <mediasession/util/Log.hpp>

#if !defined(MEDIASESSION_PLATFORM_LINUX) && !defined(MEDIASESSION_PLATFORM_MACOSX)      \
  && !defined(MEDIASESSION_PLATFORM_WINDOWS)
#error "Please define one of MEDIASESSION_PLATFORM_LINUX, MEDIASESSION_PLATFORM_MACOSX or MEDIASESSION_PLATFORM_WINDOWS"
#endif

namespace mediasession
{
namespace platform
{

#if defined(MEDIASESSION_DEBUG_LOG)
using Log = util::StdLog;
#else
using Log = util::NullLog;
#endif

using Binder = platforms::asio::EndpointBinder;
using BinderTable = platforms::asio::EndpointBinderTable;

} // namespace platform

using SessionToken = token::SessionToken<platform::Binder>;

} // namespace mediasession
