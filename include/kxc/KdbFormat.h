/*
This file is part of the Mg KDB-IPC C++ Library (hereinafter "The Library").

The Library is free software: you can redistribute it and/or modify it under
the terms of the GNU Affero Public License as published by the Free Software
Foundation, either version 3 of the License, or (at your option) any later
version.

The Library is distributed in the hope that it will be useful, but WITHOUT ANY
WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A
PARTICULAR PURPOSE. See the GNU Affero Public License for more details.

You should have received a copy of the GNU Affero Public License along with The
Library. If not, see https://www.gnu.org/licenses/agpl.txt.
*/

#ifndef __kxc_KdbFormat__H__
#define __kxc_KdbFormat__H__
#pragma once

#include "kxc/KdbType.h"

#include <cstdint>
#include <format>
#include <string>

namespace kxc {

namespace time {

// Each appends the q rendering of a temporal value to 'out'; nulls render as 0N followed
// by the type char when 'suffix' is set
void formatTimestamp(std::string & out, int64_t nanos, bool suffix = true);
void formatMonth(std::string & out, int32_t mth, bool suffix = true);
void formatDate(std::string & out, int32_t days, bool suffix = true);
void formatDatetime(std::string & out, double days, bool suffix = true);
void formatTimespan(std::string & out, int64_t nanos, bool suffix = true);
void formatMinute(std::string & out, int32_t mins, bool suffix = true);
void formatSecond(std::string & out, int32_t secs, bool suffix = true);
void formatTime(std::string & out, int32_t millis, bool suffix = true);

// Days since 2000.01.01 for a calendar date
int32_t getDays(int32_t y, int32_t m, int32_t d);

} // end namespace time

// Renders any value in q notation, e.g. (flip `a`b!(1 2;`x`y))
void formatTo(std::string & out, const KdbBase & obj);
std::string toString(const KdbBase & obj);

} // end namespace kxc

// https://www.open-std.org/jtc1/sc22/wg21/docs/papers/2019/p0645r10.html
template<std::derived_from<kxc::KdbBase> Derived, typename CharT>
struct std::formatter<Derived, CharT>
{
	constexpr auto parse(std::format_parse_context & ctx) { return ctx.begin(); }
	template <class FormatContext> FormatContext::iterator format(const Derived & obj, FormatContext & ctx) const
	{
		std::string tmp{};
		kxc::formatTo(tmp, obj);
		return std::format_to(ctx.out(), "{}", tmp);
	}
};

#endif // defined __kxc_KdbFormat__H__
