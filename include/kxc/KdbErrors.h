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

#ifndef __kxc_KdbErrors__H__
#define __kxc_KdbErrors__H__
#pragma once

#include <format>
#include <stdexcept>
#include <string>
#include <string_view>
#include <string.h> // strerror

namespace kxc {

class ErrnoMsg
{
	int m_errno;
	std::string_view m_msg;
public:
	ErrnoMsg(int err, std::string_view msg) : m_errno(err), m_msg(msg) {}
	ErrnoMsg() : ErrnoMsg(0, "") {}
	int errnum() const noexcept { return m_errno; }
	std::string_view message() const noexcept { return m_msg; }
};

//-------------------------------------------------------------------------------- KdbError
struct KdbError : public std::runtime_error
{
	explicit KdbError(const std::string & what) : std::runtime_error(what) {}
};

// The server refused the credentials, or hung up before sending its version byte
struct KdbAccessError : public KdbError
{
	KdbAccessError() : KdbError("access") {}
};

// Carries the text of an error frame, e.g. "type" for 0x80 74797065 00
struct KdbRemoteError : public KdbError
{
	explicit KdbRemoteError(std::string_view msg) : KdbError(std::string{msg}) {}
};

struct KdbIoError : public KdbError
{
	ErrnoMsg m_err;

	explicit KdbIoError(ErrnoMsg err)
	 : KdbError(0 == err.errnum()
			? std::string{err.message()}
			: std::format("{}: {}", err.message(), strerror(err.errnum())))
	 , m_err(err)
	{}

	int errnum() const noexcept { return m_err.errnum(); }
};

struct KdbProtocolError : public KdbError
{
	explicit KdbProtocolError(const std::string & what) : KdbError(what) {}
};

struct KdbEncodingError : public KdbError
{
	explicit KdbEncodingError(const std::string & what) : KdbError(what) {}
};

} // end namespace kxc

template<>
struct std::formatter<kxc::ErrnoMsg>
{
	constexpr auto parse(std::format_parse_context& ctx) { return ctx.begin(); }
	template<class FormatContext> auto format(const kxc::ErrnoMsg & err, FormatContext & ctx) const
	{
		return std::format_to(ctx.out(), "Error({}, errno={})", err.message(), err.errnum());
	}
};

#endif
