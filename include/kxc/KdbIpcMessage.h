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

#ifndef __kxc_KdbIpcMessage__H__
#define __kxc_KdbIpcMessage__H__
#pragma once

#include "kxc/KdbType.h"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace kxc {

// The eight bytes that start every message:
//   0    byte-order of everything that follows, 1 little-endian, 0 big-endian
//   1    message type, see KdbMsgType
//   2    1 when compressed
//   3    unused
//   4-7  total length, header included, in the declared byte-order
struct KdbMsgHeader
{
	bool       little_endian;
	KdbMsgType msg_typ;
	bool       compressed;
	uint32_t   ipc_len;
};

struct KdbIpcMessage
{
	KdbMsgHeader             header;
	std::unique_ptr<KdbBase> value;

	bool isError() const { return value && KdbType::EXCEPTION == value->m_typ; }
	// Hands over the value, throwing KdbRemoteError if the body was an error
	std::unique_ptr<KdbBase> take();
};

class KdbIpcMessageReader
{
	public:
		// Throws KdbProtocolError for a length that cannot hold a header
		static KdbMsgHeader parseHeader(const int8_t *hdr);
		// 'src' holds one complete message, header included; compressed messages are inflated
		// first. Throws KdbProtocolError if the bytes don't decode to exactly one value.
		static KdbIpcMessage readMsg(const int8_t *src, uint64_t len);
};

class KdbIpcMessageWriter
{
	KdbMsgType     m_msg_typ;
	const KdbBase &m_root;
	int8_t         m_ipc_ver;
	uint64_t       m_ipc_len;

	public:
		// Throws KdbProtocolError if the message would exceed the 2GB wire limit
		KdbIpcMessageWriter(KdbMsgType msg_typ, const KdbBase & msg, int8_t ipc_ver = MAX_IPC_VERSION);

		uint64_t ipcLength() const { return m_ipc_len; }
		// A big-endian message, compressed when asked and the length exceeds MIN_COMPRESS_SZ
		std::vector<int8_t> serialize(bool compress = false) const;

		// A response whose body is the error type -128 followed by the null-terminated text
		static std::vector<int8_t> errorMessage(std::string_view text);
};

struct KdbUtil
{
	// "<creds>\3\0": the \3 advertises the highest capability this client supports
	static std::vector<int8_t> writeLoginMsg(std::string_view creds);

	// Re-encodes UTF-8 as ISO-8859-1; throws KdbEncodingError for invalid UTF-8 or any code
	// point above U+00FF
	static std::string toLatin1(std::string_view utf8);
};

} // end namespace kxc

#endif // defined __kxc_KdbIpcMessage__H__
