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

#include "kxc/KdbConnection.h"
#include "kxc/KdbErrors.h"
#include "kxc/KdbFormat.h"
#include "kxc/KdbIoDefs.h"
#include "kxc/kxc_fmt_defs.h"

#include <algorithm>
#include <cstring>
#include <format>
#include <mutex>
#include <tuple>
#include <utility>

namespace kxc {

//-------------------------------------------------------------------------------- lifecycle
KdbConnection::KdbConnection(KdbConnection && rhs) noexcept
 : m_transport(std::move(rhs.m_transport))
 , m_state(std::exchange(rhs.m_state, State::Disconnected))
 , m_ipc_ver(std::exchange(rhs.m_ipc_ver, 0))
 , m_loopback(std::exchange(rhs.m_loopback, false))
 , m_compress(rhs.m_compress)
 , m_pending(std::exchange(rhs.m_pending, 0))
 , m_name(std::move(rhs.m_name))
 , m_cancel_fd(std::exchange(rhs.m_cancel_fd, -1))
{}

KdbConnection & KdbConnection::operator=(KdbConnection && rhs) noexcept
{
	if (this != &rhs) {
		close();
		m_transport = std::move(rhs.m_transport);
		m_state = std::exchange(rhs.m_state, State::Disconnected);
		m_ipc_ver = std::exchange(rhs.m_ipc_ver, 0);
		m_loopback = std::exchange(rhs.m_loopback, false);
		m_compress = rhs.m_compress;
		m_pending = std::exchange(rhs.m_pending, 0);
		m_name = std::move(rhs.m_name);
		m_cancel_fd = std::exchange(rhs.m_cancel_fd, -1);
	}
	return *this;
}

void KdbConnection::connect(const Options & opts)
{
	close();
	m_name = std::format("{}:{}", opts.host, opts.port);
	m_compress = opts.compress;
	m_state = State::Connecting;

	auto conn = tcp_connect(opts.host, std::to_string(opts.port), static_cast<int32_t>(opts.timeout.count()));
	if (!conn) {
		m_state = State::Disconnected;
		throw KdbIoError(conn.error());
	}
	m_loopback = isLoopbackAddr(conn->peer);

	try {
		if (opts.use_tls)
			m_transport = std::make_unique<TlsTransport>(conn->fd, opts.host);
		else
			m_transport = std::make_unique<TcpTransport>(conn->fd);
		{
			std::lock_guard<std::mutex> lock{m_cancel_mtx};
			m_cancel_fd = m_transport->fd();
		}

		m_state = State::Handshaking;
		const std::vector<int8_t> login = KdbUtil::writeLoginMsg(opts.credentials);
		m_transport->sendAll(login.data(), login.size());

		uint8_t ver = 0;
		if (0 == m_transport->recvSome(&ver, 1)) {
			WRN_PRINT("Login to {} rejected", m_name);
			throw KdbAccessError();
		}
		m_ipc_ver = static_cast<int8_t>(std::min<uint8_t>(MAX_IPC_VERSION, ver));
	}
	catch (const KdbError &) {
		close();
		throw;
	}

	m_state = State::Ready;
	INF_PRINT("Connected to {} (peer {}), IPC version {}, tls={}, loopback={}",
			m_name, conn->peer, m_ipc_ver, opts.use_tls, m_loopback);
}

void KdbConnection::close() noexcept
{
	{
		std::lock_guard<std::mutex> lock{m_cancel_mtx};
		m_cancel_fd = -1;
	}
	if (m_transport) {
		m_transport->close();
		m_transport.reset();
		DBG_PRINT("Closed connection to {}", m_name);
	}
	m_state = State::Disconnected;
	m_pending = 0;
}

void KdbConnection::cancel() noexcept
{
	std::lock_guard<std::mutex> lock{m_cancel_mtx};
	if (-1 == m_cancel_fd)
		return;
	auto res = io::shutdown(m_cancel_fd, SHUT_RDWR);
	if (!res && ENOTCONN != res.error())
		WRN_PRINT("Failed to cancel {}: {}", m_name, strerror(res.error()));
	else
		DBG_PRINT("Cancelled connection to {}", m_name);
}

bool KdbConnection::isConnected() noexcept
{
	if (!isOpen())
		return false;
	try {
		std::ignore = sendSync("1+1");
		return true;
	}
	catch (const KdbRemoteError & e) {
		DBG_PRINT("Liveness probe of {} answered with error '{}'", m_name, e.what());
		return true;
	}
	catch (const std::exception & e) {
		WRN_PRINT("Liveness probe of {} failed: {}", m_name, e.what());
		return false;
	}
}

//-------------------------------------------------------------------------------- framing
void KdbConnection::requireReady() const
{
	if (!isOpen())
		throw KdbIoError(ErrnoMsg{ENOTCONN, "Not connected"});
}

void KdbConnection::sendBytes(const std::vector<int8_t> & ipc)
{
	try {
		m_transport->sendAll(ipc.data(), ipc.size());
	}
	catch (const KdbIoError &) {
		close();
		throw;
	}
}

std::vector<int8_t> KdbConnection::frame(KdbMsgType msg_typ, const KdbBase & msg) const
{
	requireReady();
	KdbIpcMessageWriter writer{msg_typ, msg, m_ipc_ver};
	std::vector<int8_t> ipc = writer.serialize(m_compress && !m_loopback);
	TRA_PRINT("Framed type {} message of {} bytes ({} on the wire), compressed={}",
			static_cast<int>(msg_typ), writer.ipcLength(), ipc.size(), 1 == ipc[2]);
	return ipc;
}

void KdbConnection::sendMsg(KdbMsgType msg_typ, const KdbBase & msg)
{
	sendBytes(frame(msg_typ, msg));
}

KdbIpcMessage KdbConnection::readMsg()
{
	requireReady();
	try {
		int8_t hdr[SZ_MSG_HDR];
		m_transport->recvAll(hdr, sizeof hdr);
		const KdbMsgHeader header = KdbIpcMessageReader::parseHeader(hdr);

		std::vector<int8_t> ipc(header.ipc_len);
		memcpy(ipc.data(), hdr, sizeof hdr);
		m_transport->recvAll(ipc.data() + SZ_MSG_HDR, ipc.size() - SZ_MSG_HDR);
		TRA_PRINT("Received type {} message of {} bytes, compressed={}",
				static_cast<int>(header.msg_typ), header.ipc_len, header.compressed);

		KdbIpcMessage msg = KdbIpcMessageReader::readMsg(ipc.data(), ipc.size());
		if (KdbMsgType::SYNC == msg.header.msg_typ)
			m_pending++;
		return msg;
	}
	catch (const KdbIoError &) {
		close();
		throw;
	}
	catch (const KdbProtocolError &) {
		close();
		throw;
	}
}

std::unique_ptr<KdbBase> KdbConnection::awaitResponse()
{
	for (;;) {
		KdbIpcMessage msg = readMsg();
		switch (msg.header.msg_typ) {
			case KdbMsgType::RESPONSE:
				return msg.take();
			case KdbMsgType::ASYNC:
				WRN_PRINT("Discarding async message from {} while awaiting a response: {}", m_name, *msg.value);
				break;
			case KdbMsgType::SYNC:
				WRN_PRINT("Discarding sync request from {} while awaiting a response, {} pending: {}", m_name, m_pending, *msg.value);
				break;
			default:
				WRN_PRINT("Discarding message of unknown type {} from {}", static_cast<int>(msg.header.msg_typ), m_name);
				break;
		}
	}
}

//-------------------------------------------------------------------------------- operations
void KdbConnection::sendAsync(const KdbBase & msg)
{
	sendMsg(KdbMsgType::ASYNC, msg);
}

void KdbConnection::sendAsync(std::string_view expr)
{
	sendAsync(KdbCharVector{expr});
}

std::unique_ptr<KdbBase> KdbConnection::sendSync(const KdbBase & msg)
{
	sendMsg(KdbMsgType::SYNC, msg);
	return awaitResponse();
}

std::unique_ptr<KdbBase> KdbConnection::sendSync(std::string_view expr)
{
	return sendSync(KdbCharVector{expr});
}

std::unique_ptr<KdbBase> KdbConnection::receive(KdbMsgType *msg_typ)
{
	KdbIpcMessage msg = readMsg();
	if (nullptr != msg_typ)
		*msg_typ = msg.header.msg_typ;
	return msg.take();
}

void KdbConnection::sendResponse(const KdbBase & msg)
{
	if (0 == m_pending)
		throw KdbProtocolError("Unexpected response msg");
	const std::vector<int8_t> ipc = frame(KdbMsgType::RESPONSE, msg);
	m_pending--;
	sendBytes(ipc);
}

void KdbConnection::sendError(std::string_view text)
{
	if (0 == m_pending)
		throw KdbProtocolError("Unexpected error msg");
	requireReady();
	const std::vector<int8_t> ipc = KdbIpcMessageWriter::errorMessage(text);
	m_pending--;
	TRA_PRINT("Sending error '{}' to {}", text, m_name);
	sendBytes(ipc);
}

} // end namespace kxc
