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

#include "kxc/KdbIpcMessage.h"
#include "kxc/KdbCompress.h"
#include "kxc/KdbErrors.h"
#include "kxc/kxc_fmt_defs.h"

#include <cstring>
#include <format>
#include <tuple>

namespace kxc {

//-------------------------------------------------------------------------------- KdbIpcMessage
std::unique_ptr<KdbBase> KdbIpcMessage::take()
{
	if (isError())
		throw KdbRemoteError(static_cast<const KdbException&>(*value).m_msg);
	return std::move(value);
}

//-------------------------------------------------------------------------------- KdbIpcMessageReader
KdbMsgHeader KdbIpcMessageReader::parseHeader(const int8_t *hdr)
{
	KdbMsgHeader res;
	res.little_endian = 1 == hdr[0];
	res.msg_typ = static_cast<KdbMsgType>(hdr[1]);
	res.compressed = 1 == hdr[2];

	ReadBuf buf{hdr, SZ_MSG_HDR, res.little_endian};
	buf.skip(4);
	const int32_t len = buf.read<int32_t>();
	if (len < SZ_MSG_HDR + SZ_BYTE)
		throw KdbProtocolError(std::format("Invalid IPC message length {}", len));
	res.ipc_len = static_cast<uint32_t>(len);
	return res;
}

KdbIpcMessage KdbIpcMessageReader::readMsg(const int8_t *src, uint64_t len)
{
	if (len < static_cast<uint64_t>(SZ_MSG_HDR))
		throw KdbProtocolError(std::format("IPC message of {} bytes is shorter than its header", len));

	KdbIpcMessage msg{parseHeader(src), nullptr};
	if (msg.header.ipc_len != len)
		throw KdbProtocolError(std::format("IPC header declares {} bytes but {} were supplied", msg.header.ipc_len, len));

	std::vector<int8_t> tmp;
	const int8_t *body = src;
	uint64_t body_len = len;
	if (msg.header.compressed) {
		KdbIpcDecompressor inflater{src, len, msg.header.little_endian};
		tmp = inflater.uncompress();
		body = tmp.data();
		body_len = tmp.size();
		TRA_PRINT("Uncompressed {} bytes to {}", len, body_len);
	}

	ReadBuf buf{body, body_len, msg.header.little_endian};
	buf.skip(SZ_MSG_HDR);

	switch (readObject(buf, msg.value)) {
		case ReadResult::RD_OK:
			break;
		case ReadResult::RD_INCOMPLETE:
			throw KdbProtocolError(std::format("IPC message truncated at offset {} of {}", buf.offset(), body_len));
		case ReadResult::RD_ERR_IPC:
			throw KdbProtocolError(std::format("Malformed IPC message near offset {}", buf.offset()));
	}

	if (buf.remaining() > 0)
		WRN_PRINT("{} trailing bytes after the message value", buf.remaining());

	return msg;
}

//-------------------------------------------------------------------------------- KdbIpcMessageWriter
KdbIpcMessageWriter::KdbIpcMessageWriter(KdbMsgType msg_typ, const KdbBase & msg, int8_t ipc_ver)
 : m_msg_typ(msg_typ)
 , m_root(msg)
 , m_ipc_ver(ipc_ver)
 , m_ipc_len(msg.wireSz() + SZ_MSG_HDR)
{
	if (m_ipc_len > static_cast<uint64_t>(INT32_MAX))
		throw KdbProtocolError(std::format("Message of {} bytes exceeds the IPC limit", m_ipc_len));
}

std::vector<int8_t> KdbIpcMessageWriter::serialize(bool compress) const
{
	std::vector<int8_t> ipc(m_ipc_len);
	WriteBuf buf{ipc.data(), ipc.size(), m_ipc_ver};

	buf.write<int8_t>(0);                              // big endian, see WriteBuf
	buf.write<int8_t>(static_cast<int8_t>(m_msg_typ)); // msg type
	buf.write<int8_t>(0);                              // compressed
	buf.write<int8_t>(0);
	buf.write<int32_t>(static_cast<int32_t>(m_ipc_len));

	if (WriteResult::WR_OK != m_root.write(buf) || buf.offset() != m_ipc_len)
		throw KdbProtocolError(std::format("Serialized {} of {} predicted bytes", buf.offset(), m_ipc_len));

	if (compress && m_ipc_len > MIN_COMPRESS_SZ)
		std::ignore = KdbIpcCompressor::compress(ipc);

	return ipc;
}

std::vector<int8_t> KdbIpcMessageWriter::errorMessage(std::string_view text)
{
	const uint64_t len = SZ_MSG_HDR + SZ_BYTE + text.length() + SZ_BYTE;
	std::vector<int8_t> ipc(len);
	WriteBuf buf{ipc.data(), ipc.size()};

	buf.write<int8_t>(0);
	buf.write<int8_t>(static_cast<int8_t>(KdbMsgType::RESPONSE));
	buf.write<int8_t>(0);
	buf.write<int8_t>(0);
	buf.write<int32_t>(static_cast<int32_t>(len));
	buf.writeTyp(KdbType::EXCEPTION);
	buf.writeSym(text);
	return ipc;
}

//--------------------------------------------------------------------------------------- KdbUtil
std::vector<int8_t> KdbUtil::writeLoginMsg(std::string_view creds)
{
	std::vector<int8_t> msg(creds.length() + SZ_BYTE + SZ_BYTE);
	memcpy(msg.data(), creds.data(), creds.length());
	msg[creds.length()] = MAX_IPC_VERSION;
	msg[creds.length() + 1] = 0;
	return msg;
}

std::string KdbUtil::toLatin1(std::string_view utf8)
{
	std::string out;
	out.reserve(utf8.length());

	for (size_t i = 0 ; i < utf8.length() ; ) {
		const uint8_t b0 = static_cast<uint8_t>(utf8[i]);
		if (b0 < 0x80) {
			out.push_back(static_cast<char>(b0));
			i += 1;
			continue;
		}
		// ISO-8859-1 only reaches U+00FF, i.e. two-byte sequences led by 0xC2 or 0xC3
		if (b0 == 0xC2 || b0 == 0xC3) {
			if (i + 1 >= utf8.length())
				throw KdbEncodingError(std::format("Truncated UTF-8 sequence at offset {}", i));
			const uint8_t b1 = static_cast<uint8_t>(utf8[i + 1]);
			if (0x80 != (b1 & 0xC0))
				throw KdbEncodingError(std::format("Invalid UTF-8 continuation byte at offset {}", i + 1));
			out.push_back(static_cast<char>(((b0 & 0x1F) << 6) | (b1 & 0x3F)));
			i += 2;
			continue;
		}
		if (b0 < 0xC2 || b0 > 0xF4)
			throw KdbEncodingError(std::format("Invalid UTF-8 lead byte 0x{:02x} at offset {}", b0, i));
		throw KdbEncodingError(std::format("Character at offset {} is not representable in ISO-8859-1", i));
	}
	return out;
}

} // end namespace kxc
