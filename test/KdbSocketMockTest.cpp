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

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/time.h>

#include <cstdint>
#include <cstring>
#include <tuple>
#include <vector>

// must precede the sources so that they bind to the mocks
#include "KdbIoMockDefs.h"

#include "../src/KdbType.cpp"
#include "../src/KdbFormat.cpp"
#include "../src/KdbCompress.cpp"
#include "../src/KdbIpcMessage.cpp"
#include "../src/KdbSocket.cpp"
#include "../src/KdbConnection.cpp"

#include "KdbHexDefs.h"

using namespace kxc;

namespace kxc::test {

using testing::_;
using testing::Invoke;
using testing::Return;
using testing::StrEq;

static const socklen_t INT_LEN = static_cast<socklen_t>(sizeof(int));
static const socklen_t TV_LEN = static_cast<socklen_t>(sizeof(struct timeval));

// One resolved IPv4 address, chained to 'next'
struct FakeAddr
{
	struct sockaddr_in sin{};
	struct addrinfo    ai{};

	FakeAddr(const char *ip, struct addrinfo *next = nullptr)
	{
		sin.sin_family = AF_INET;
		sin.sin_port = htons(5010);
		inet_pton(AF_INET, ip, &sin.sin_addr);
		ai.ai_family = AF_INET;
		ai.ai_socktype = SOCK_STREAM;
		ai.ai_protocol = IPPROTO_TCP;
		ai.ai_addr = reinterpret_cast<struct sockaddr*>(&sin);
		ai.ai_addrlen = sizeof sin;
		ai.ai_next = next;
	}
};

static auto peerIs(const char *ip)
{
	return Invoke([ip] (int, struct sockaddr *addr, socklen_t *len) -> std::expected<int,int> {
		auto *sin = reinterpret_cast<struct sockaddr_in*>(addr);
		sin->sin_family = AF_INET;
		inet_pton(AF_INET, ip, &sin->sin_addr);
		*len = sizeof *sin;
		return 0;
	});
}

static auto recvByte(uint8_t val)
{
	return Invoke([val] (int, void *buf, size_t len, int) -> std::expected<ssize_t,int> {
		EXPECT_LE(1, len);
		*static_cast<uint8_t*>(buf) = val;
		return 1;
	});
}

TEST(KdbSocketMockTest, TestConnectSetsSocketOptions)
{
	GetAddrInfoMock gai_mock;
	FreeAddrInfoMock fai_mock;
	SocketMock socket_mock;
	SetSockOptMock sso_mock;
	ConnectMock connect_mock;
	GetPeerNameMock gpn_mock;

	getaddrinfo_call = &gai_mock;
	freeaddrinfo_call = &fai_mock;
	socket_call = &socket_mock;
	setsockopt_call = &sso_mock;
	connect_call = &connect_mock;
	getpeername_call = &gpn_mock;

	FakeAddr addr{"10.0.0.1"};
	const int fd = 7;

	testing::InSequence marker;

	EXPECT_CALL(gai_mock, call(StrEq("kdb.example"), StrEq("5010"), _))
		.WillOnce(Return(&addr.ai));
	EXPECT_CALL(socket_mock, call(AF_INET, SOCK_STREAM, IPPROTO_TCP))
		.WillOnce(Return(fd));
	EXPECT_CALL(sso_mock, call(fd, IPPROTO_TCP, TCP_NODELAY, _, INT_LEN))
		.WillOnce(Return(0));
	EXPECT_CALL(sso_mock, call(fd, SOL_SOCKET, SO_KEEPALIVE, _, INT_LEN))
		.WillOnce(Return(0));
	EXPECT_CALL(sso_mock, call(fd, SOL_SOCKET, SO_RCVTIMEO, _, TV_LEN))
		.WillOnce(Invoke([] (int, int, int, const void *val, socklen_t) -> std::expected<int,int> {
			const auto *tv = static_cast<const struct timeval*>(val);
			EXPECT_EQ(2, tv->tv_sec);
			EXPECT_EQ(500000, tv->tv_usec);
			return 0;
		}));
	EXPECT_CALL(sso_mock, call(fd, SOL_SOCKET, SO_SNDTIMEO, _, TV_LEN))
		.WillOnce(Return(0));
	EXPECT_CALL(connect_mock, call(fd, static_cast<const struct sockaddr*>(addr.ai.ai_addr), addr.ai.ai_addrlen))
		.WillOnce(Return(0));
	EXPECT_CALL(fai_mock, call(&addr.ai));
	EXPECT_CALL(gpn_mock, call(fd, _, _))
		.WillOnce(peerIs("10.0.0.1"));

	auto conn = tcp_connect("kdb.example", "5010", 2500);
	ASSERT_TRUE(conn.has_value());
	EXPECT_EQ(fd, conn->fd);
	EXPECT_EQ("kdb.example", conn->host);
	EXPECT_EQ("5010", conn->service);
	EXPECT_EQ("10.0.0.1", conn->peer);
}

TEST(KdbSocketMockTest, TestConnectTriesEachAddress)
{
	GetAddrInfoMock gai_mock;
	FreeAddrInfoMock fai_mock;
	SocketMock socket_mock;
	SetSockOptMock sso_mock;
	ConnectMock connect_mock;
	GetPeerNameMock gpn_mock;
	CloseMock close_mock;

	getaddrinfo_call = &gai_mock;
	freeaddrinfo_call = &fai_mock;
	socket_call = &socket_mock;
	setsockopt_call = &sso_mock;
	connect_call = &connect_mock;
	getpeername_call = &gpn_mock;
	close_call = &close_mock;

	FakeAddr second{"10.0.0.2"};
	FakeAddr first{"10.0.0.1", &second.ai};

	testing::InSequence marker;

	EXPECT_CALL(gai_mock, call(StrEq("kdb"), StrEq("5010"), _))
		.WillOnce(Return(&first.ai));
	EXPECT_CALL(socket_mock, call(AF_INET, SOCK_STREAM, IPPROTO_TCP))
		.WillOnce(Return(7));
	// no timeout, so only the two options
	EXPECT_CALL(sso_mock, call(7, _, _, _, INT_LEN))
		.Times(2)
		.WillRepeatedly(Return(0));
	EXPECT_CALL(connect_mock, call(7, static_cast<const struct sockaddr*>(first.ai.ai_addr), _))
		.WillOnce(Return(std::unexpected<int>{ECONNREFUSED}));
	EXPECT_CALL(close_mock, call(7))
		.WillOnce(Return(0));
	EXPECT_CALL(socket_mock, call(AF_INET, SOCK_STREAM, IPPROTO_TCP))
		.WillOnce(Return(8));
	EXPECT_CALL(sso_mock, call(8, _, _, _, INT_LEN))
		.Times(2)
		.WillRepeatedly(Return(0));
	EXPECT_CALL(connect_mock, call(8, static_cast<const struct sockaddr*>(second.ai.ai_addr), _))
		.WillOnce(Return(0));
	EXPECT_CALL(fai_mock, call(&first.ai));
	// an unknown peer is logged, not fatal
	EXPECT_CALL(gpn_mock, call(8, _, _))
		.WillOnce(Return(std::unexpected<int>{ENOTCONN}));

	auto conn = tcp_connect("kdb", "5010", 0);
	ASSERT_TRUE(conn.has_value());
	EXPECT_EQ(8, conn->fd);
	EXPECT_EQ("", conn->peer);
}

TEST(KdbSocketMockTest, TestConnectFailsWhenResolveFails)
{
	GetAddrInfoMock gai_mock;
	FreeAddrInfoMock fai_mock;
	SocketMock socket_mock;

	getaddrinfo_call = &gai_mock;
	freeaddrinfo_call = &fai_mock;
	socket_call = &socket_mock;

	EXPECT_CALL(gai_mock, call(StrEq("nowhere"), StrEq("5010"), _))
		.WillOnce(Return(std::unexpected<int>{EAI_NONAME}));
	EXPECT_CALL(fai_mock, call(_)).Times(0);
	EXPECT_CALL(socket_mock, call(_, _, _)).Times(0);

	auto conn = tcp_connect("nowhere", "5010", 0);
	ASSERT_FALSE(conn.has_value());
	EXPECT_EQ(0, conn.error().errnum());
	EXPECT_EQ("Failed to resolve host", conn.error().message());
}

TEST(KdbSocketMockTest, TestConnectReportsSetSockOptFailure)
{
	GetAddrInfoMock gai_mock;
	FreeAddrInfoMock fai_mock;
	SocketMock socket_mock;
	SetSockOptMock sso_mock;
	ConnectMock connect_mock;
	CloseMock close_mock;

	getaddrinfo_call = &gai_mock;
	freeaddrinfo_call = &fai_mock;
	socket_call = &socket_mock;
	setsockopt_call = &sso_mock;
	connect_call = &connect_mock;
	close_call = &close_mock;

	FakeAddr addr{"10.0.0.1"};

	testing::InSequence marker;

	EXPECT_CALL(gai_mock, call(_, _, _))
		.WillOnce(Return(&addr.ai));
	EXPECT_CALL(socket_mock, call(_, _, _))
		.WillOnce(Return(7));
	EXPECT_CALL(sso_mock, call(7, IPPROTO_TCP, TCP_NODELAY, _, INT_LEN))
		.WillOnce(Return(std::unexpected<int>{EBADF}));
	EXPECT_CALL(close_mock, call(7))
		.WillOnce(Return(0));
	EXPECT_CALL(fai_mock, call(&addr.ai));
	EXPECT_CALL(connect_mock, call(_, _, _)).Times(0);

	auto conn = tcp_connect("kdb", "5010", 0);
	ASSERT_FALSE(conn.has_value());
	EXPECT_EQ(EBADF, conn.error().errnum());
	EXPECT_EQ("setsockopt(TCP_NODELAY)", conn.error().message());
}

TEST(KdbSocketMockTest, TestConnectTimeoutIsReportedAsSuch)
{
	GetAddrInfoMock gai_mock;
	FreeAddrInfoMock fai_mock;
	SocketMock socket_mock;
	SetSockOptMock sso_mock;
	ConnectMock connect_mock;
	CloseMock close_mock;

	getaddrinfo_call = &gai_mock;
	freeaddrinfo_call = &fai_mock;
	socket_call = &socket_mock;
	setsockopt_call = &sso_mock;
	connect_call = &connect_mock;
	close_call = &close_mock;

	FakeAddr addr{"10.0.0.1"};

	testing::InSequence marker;

	EXPECT_CALL(gai_mock, call(_, _, _))
		.WillOnce(Return(&addr.ai));
	EXPECT_CALL(socket_mock, call(_, _, _))
		.WillOnce(Return(7));
	EXPECT_CALL(sso_mock, call(7, _, _, _, _))
		.Times(4)
		.WillRepeatedly(Return(0));
	// a blocking connect that runs into SO_SNDTIMEO
	EXPECT_CALL(connect_mock, call(7, _, _))
		.WillOnce(Return(std::unexpected<int>{EINPROGRESS}));
	EXPECT_CALL(close_mock, call(7))
		.WillOnce(Return(0));
	EXPECT_CALL(fai_mock, call(&addr.ai));

	auto conn = tcp_connect("kdb", "5010", 100);
	ASSERT_FALSE(conn.has_value());
	EXPECT_EQ(ETIMEDOUT, conn.error().errnum());
	EXPECT_EQ("Failed to connect", conn.error().message());

	KdbIoError err{conn.error()};
	EXPECT_THAT(err.what(), testing::StartsWith("Failed to connect: "));
}

TEST(KdbSocketMockTest, TestSendRetriesAndResumes)
{
	SendMock send_mock;
	ShutdownMock shutdown_mock;
	CloseMock close_mock;

	send_call = &send_mock;
	shutdown_call = &shutdown_mock;
	close_call = &close_mock;

	const char buf[] = "hello";

	testing::InSequence marker;

	EXPECT_CALL(send_mock, call(9, static_cast<const void*>(buf), 5, MSG_NOSIGNAL))
		.WillOnce(Return(std::unexpected<int>{EINTR}))
		.WillOnce(Return(3));
	EXPECT_CALL(send_mock, call(9, static_cast<const void*>(buf + 3), 2, MSG_NOSIGNAL))
		.WillOnce(Return(2));
	EXPECT_CALL(shutdown_mock, call(9, SHUT_RDWR))
		.WillOnce(Return(std::unexpected<int>{ENOTCONN}));
	EXPECT_CALL(close_mock, call(9))
		.WillOnce(Return(0));

	TcpTransport tcp{9};
	tcp.sendAll(buf, 5);
	tcp.close();
	EXPECT_EQ(-1, tcp.fd());
	// the destructor has nothing left to do
}

TEST(KdbSocketMockTest, TestSendAndRecvErrors)
{
	SendMock send_mock;
	RecvMock recv_mock;
	ShutdownMock shutdown_mock;
	CloseMock close_mock;

	send_call = &send_mock;
	recv_call = &recv_mock;
	shutdown_call = &shutdown_mock;
	close_call = &close_mock;

	EXPECT_CALL(send_mock, call(9, _, _, MSG_NOSIGNAL))
		.WillOnce(Return(std::unexpected<int>{EAGAIN}))
		.WillOnce(Return(std::unexpected<int>{EPIPE}));
	EXPECT_CALL(recv_mock, call(9, _, _, 0))
		.WillOnce(Return(std::unexpected<int>{EWOULDBLOCK}))
		.WillOnce(Return(std::unexpected<int>{ECONNRESET}))
		.WillOnce(Return(2))
		.WillOnce(Return(0));
	EXPECT_CALL(shutdown_mock, call(9, SHUT_RDWR))
		.WillOnce(Return(0));
	EXPECT_CALL(close_mock, call(9))
		.WillOnce(Return(0));

	TcpTransport tcp{9};
	int8_t buf[8] = {0};

	try {
		tcp.sendAll(buf, sizeof buf);
		FAIL() << "send timed out";
	}
	catch (const KdbIoError & e) {
		EXPECT_EQ(ETIMEDOUT, e.errnum());
	}
	try {
		tcp.sendAll(buf, sizeof buf);
		FAIL() << "send failed";
	}
	catch (const KdbIoError & e) {
		EXPECT_EQ(EPIPE, e.errnum());
	}
	try {
		std::ignore = tcp.recvSome(buf, sizeof buf);
		FAIL() << "recv timed out";
	}
	catch (const KdbIoError & e) {
		EXPECT_EQ(ETIMEDOUT, e.errnum());
	}
	try {
		std::ignore = tcp.recvSome(buf, sizeof buf);
		FAIL() << "recv failed";
	}
	catch (const KdbIoError & e) {
		EXPECT_EQ(ECONNRESET, e.errnum());
	}
	// two bytes, then end-of-stream part way through
	try {
		tcp.recvAll(buf, 4);
		FAIL() << "short read";
	}
	catch (const KdbIoError & e) {
		EXPECT_EQ(0, e.errnum());
		EXPECT_STREQ("Connection closed by peer", e.what());
	}
}

// Connects a KdbConnection to a resolved-but-fake peer at 10.0.0.1
static void expectTcpConnect(GetAddrInfoMock & gai_mock, FreeAddrInfoMock & fai_mock, SocketMock & socket_mock,
		SetSockOptMock & sso_mock, ConnectMock & connect_mock, GetPeerNameMock & gpn_mock, FakeAddr & addr, int fd)
{
	EXPECT_CALL(gai_mock, call(StrEq("kdb"), StrEq("5010"), _))
		.WillOnce(Return(&addr.ai));
	EXPECT_CALL(socket_mock, call(_, _, _))
		.WillOnce(Return(fd));
	EXPECT_CALL(sso_mock, call(fd, _, _, _, _))
		.Times(2)
		.WillRepeatedly(Return(0));
	EXPECT_CALL(connect_mock, call(fd, _, _))
		.WillOnce(Return(0));
	EXPECT_CALL(fai_mock, call(&addr.ai));
	EXPECT_CALL(gpn_mock, call(fd, _, _))
		.WillOnce(peerIs("10.0.0.1"));
}

TEST(KdbSocketMockTest, TestConnectionHandshakeAndCompression)
{
	GetAddrInfoMock gai_mock;
	FreeAddrInfoMock fai_mock;
	SocketMock socket_mock;
	SetSockOptMock sso_mock;
	ConnectMock connect_mock;
	GetPeerNameMock gpn_mock;
	SendMock send_mock;
	RecvMock recv_mock;
	ShutdownMock shutdown_mock;
	CloseMock close_mock;

	getaddrinfo_call = &gai_mock;
	freeaddrinfo_call = &fai_mock;
	socket_call = &socket_mock;
	setsockopt_call = &sso_mock;
	connect_call = &connect_mock;
	getpeername_call = &gpn_mock;
	send_call = &send_mock;
	recv_call = &recv_mock;
	shutdown_call = &shutdown_mock;
	close_call = &close_mock;

	FakeAddr addr{"10.0.0.1"};
	const int fd = 11;
	std::vector<int8_t> login;
	std::vector<int8_t> sent;

	testing::InSequence marker;

	expectTcpConnect(gai_mock, fai_mock, socket_mock, sso_mock, connect_mock, gpn_mock, addr, fd);
	EXPECT_CALL(send_mock, call(fd, _, _, MSG_NOSIGNAL))
		.WillOnce(Invoke([&login] (int, const void *buf, size_t len, int) -> std::expected<ssize_t,int> {
			const int8_t *src = static_cast<const int8_t*>(buf);
			login.assign(src, src + len);
			return static_cast<ssize_t>(len);
		}));
	EXPECT_CALL(recv_mock, call(fd, _, 1, 0))
		.WillOnce(recvByte(6));
	EXPECT_CALL(send_mock, call(fd, _, _, MSG_NOSIGNAL))
		.WillOnce(Invoke([&sent] (int, const void *buf, size_t len, int) -> std::expected<ssize_t,int> {
			const int8_t *src = static_cast<const int8_t*>(buf);
			sent.assign(src, src + len);
			return static_cast<ssize_t>(len);
		}));
	EXPECT_CALL(shutdown_mock, call(fd, SHUT_RDWR))
		.WillOnce(Return(0));
	EXPECT_CALL(close_mock, call(fd))
		.WillOnce(Return(0));

	KdbConnection conn{};
	KdbConnection::Options opts{};
	opts.host = "kdb";
	opts.credentials = "u:p";
	opts.compress = true;
	conn.connect(opts);

	EXPECT_EQ("0x753a700300", toHex(login));
	EXPECT_EQ(3, conn.ipcVersion());
	EXPECT_FALSE(conn.isLoopback());

	// a remote peer gets the compressed form
	KdbLongVector zeros{std::vector<int64_t>(1000, 0)};
	conn.sendAsync(zeros);
	ASSERT_GT(sent.size(), static_cast<size_t>(SZ_MSG_HDR));
	EXPECT_EQ(0, sent[0]);
	EXPECT_EQ(0, sent[1]);
	EXPECT_EQ(1, sent[2]);
	EXPECT_LT(sent.size(), SZ_MSG_HDR + zeros.wireSz());

	KdbIpcMessage msg = KdbIpcMessageReader::readMsg(sent.data(), sent.size());
	ASSERT_NE(nullptr, msg.value);
	EXPECT_TRUE(zeros == *msg.value);

	conn.close();
	EXPECT_EQ(KdbConnection::State::Disconnected, conn.state());
}

TEST(KdbSocketMockTest, TestConnectionLoginRejected)
{
	GetAddrInfoMock gai_mock;
	FreeAddrInfoMock fai_mock;
	SocketMock socket_mock;
	SetSockOptMock sso_mock;
	ConnectMock connect_mock;
	GetPeerNameMock gpn_mock;
	SendMock send_mock;
	RecvMock recv_mock;
	ShutdownMock shutdown_mock;
	CloseMock close_mock;

	getaddrinfo_call = &gai_mock;
	freeaddrinfo_call = &fai_mock;
	socket_call = &socket_mock;
	setsockopt_call = &sso_mock;
	connect_call = &connect_mock;
	getpeername_call = &gpn_mock;
	send_call = &send_mock;
	recv_call = &recv_mock;
	shutdown_call = &shutdown_mock;
	close_call = &close_mock;

	FakeAddr addr{"10.0.0.1"};
	const int fd = 12;

	testing::InSequence marker;

	expectTcpConnect(gai_mock, fai_mock, socket_mock, sso_mock, connect_mock, gpn_mock, addr, fd);
	EXPECT_CALL(send_mock, call(fd, _, 2, MSG_NOSIGNAL))
		.WillOnce(Return(2));
	EXPECT_CALL(recv_mock, call(fd, _, 1, 0))
		.WillOnce(Return(0));
	EXPECT_CALL(shutdown_mock, call(fd, SHUT_RDWR))
		.WillOnce(Return(std::unexpected<int>{ENOTCONN}));
	EXPECT_CALL(close_mock, call(fd))
		.WillOnce(Return(0));

	KdbConnection conn{};
	KdbConnection::Options opts{};
	opts.host = "kdb";
	try {
		conn.connect(opts);
		FAIL() << "login accepted";
	}
	catch (const KdbAccessError & e) {
		EXPECT_STREQ("access", e.what());
	}
	EXPECT_EQ(KdbConnection::State::Disconnected, conn.state());
}

TEST(KdbSocketMockTest, TestConnectionHandshakeIoError)
{
	GetAddrInfoMock gai_mock;
	FreeAddrInfoMock fai_mock;
	SocketMock socket_mock;
	SetSockOptMock sso_mock;
	ConnectMock connect_mock;
	GetPeerNameMock gpn_mock;
	SendMock send_mock;
	RecvMock recv_mock;
	ShutdownMock shutdown_mock;
	CloseMock close_mock;

	getaddrinfo_call = &gai_mock;
	freeaddrinfo_call = &fai_mock;
	socket_call = &socket_mock;
	setsockopt_call = &sso_mock;
	connect_call = &connect_mock;
	getpeername_call = &gpn_mock;
	send_call = &send_mock;
	recv_call = &recv_mock;
	shutdown_call = &shutdown_mock;
	close_call = &close_mock;

	FakeAddr addr{"10.0.0.1"};
	const int fd = 13;

	testing::InSequence marker;

	expectTcpConnect(gai_mock, fai_mock, socket_mock, sso_mock, connect_mock, gpn_mock, addr, fd);
	EXPECT_CALL(send_mock, call(fd, _, _, MSG_NOSIGNAL))
		.WillOnce(Return(2));
	EXPECT_CALL(recv_mock, call(fd, _, 1, 0))
		.WillOnce(Return(std::unexpected<int>{ECONNRESET}));
	EXPECT_CALL(shutdown_mock, call(fd, SHUT_RDWR))
		.WillOnce(Return(0));
	EXPECT_CALL(close_mock, call(fd))
		.WillOnce(Return(0));

	KdbConnection conn{};
	KdbConnection::Options opts{};
	opts.host = "kdb";
	try {
		conn.connect(opts);
		FAIL() << "handshake survived a reset";
	}
	catch (const KdbIoError & e) {
		EXPECT_EQ(ECONNRESET, e.errnum());
	}
	EXPECT_FALSE(conn.isOpen());
}

} // end namespace kxc::test

int main(int argc, char *argv[]) {
	using namespace kxc::test;
	testing::InitGoogleTest(&argc, argv);
	return RUN_ALL_TESTS();
}
