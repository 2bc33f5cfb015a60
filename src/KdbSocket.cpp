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

#include "kxc/KdbSocket.h"
#include "kxc/KdbIoDefs.h"
#include "kxc/kxc_fmt_defs.h"

#include <arpa/inet.h> // inet_ntop
#include <netinet/in.h>
#include <netinet/tcp.h> // TCP_NODELAY
#include <sys/time.h> // timeval

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <climits>
#include <cstring>

namespace kxc {

//-------------------------------------------------------------------------------- helpers
static void closeQuietly(int fd)
{
	auto res = io::close(fd);
	if (!res)
		WRN_PRINT("close(fd={}) failed: {}", fd, strerror(res.error()));
}

static std::string peerAddress(int fd)
{
	struct sockaddr_storage addr{};
	socklen_t addr_len = sizeof addr;
	auto res = io::getpeername(fd, reinterpret_cast<struct sockaddr*>(&addr), &addr_len);
	if (!res) {
		WRN_PRINT("getpeername(fd={}) failed: {}", fd, strerror(res.error()));
		return {};
	}

	char txt[INET6_ADDRSTRLEN] = {0};
	const void *src = nullptr;
	if (AF_INET == addr.ss_family)
		src = &reinterpret_cast<struct sockaddr_in*>(&addr)->sin_addr;
	else if (AF_INET6 == addr.ss_family)
		src = &reinterpret_cast<struct sockaddr_in6*>(&addr)->sin6_addr;

	if (nullptr == src || nullptr == inet_ntop(addr.ss_family, src, txt, sizeof txt))
		return {};
	return txt;
}

static std::expected<void,ErrnoMsg> configureSocket(int fd, int32_t timeout_ms)
{
	const int one = 1;
	auto res = io::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof one);
	if (!res)
		return std::unexpected(ErrnoMsg{res.error(), "setsockopt(TCP_NODELAY)"});

	res = io::setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &one, sizeof one);
	if (!res)
		return std::unexpected(ErrnoMsg{res.error(), "setsockopt(SO_KEEPALIVE)"});

	if (timeout_ms > 0) {
		struct timeval tv{};
		tv.tv_sec = timeout_ms / 1000;
		tv.tv_usec = (timeout_ms % 1000) * 1000;
		res = io::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof tv);
		if (!res)
			return std::unexpected(ErrnoMsg{res.error(), "setsockopt(SO_RCVTIMEO)"});
		res = io::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof tv);
		if (!res)
			return std::unexpected(ErrnoMsg{res.error(), "setsockopt(SO_SNDTIMEO)"});
	}
	return {};
}

//-------------------------------------------------------------------------------- tcp_connect
std::expected<TcpConn,ErrnoMsg> tcp_connect(std::string_view host, std::string_view service, int32_t timeout_ms)
{
	const std::string node{host};
	const std::string port{service};

	struct addrinfo hints{};
	hints.ai_family = AF_UNSPEC;
	hints.ai_socktype = SOCK_STREAM;

	DBG_PRINT(GRN "tcp_connect" RST ": resolving {}:{}", node, port);
	auto gai = io::getaddrinfo(node.c_str(), port.c_str(), &hints);
	if (!gai) {
		ERR_PRINT(GRN "tcp_connect" RST ": getaddrinfo({}) failed: {}", node, gai_strerror(gai.error()));
		return std::unexpected(ErrnoMsg{0, "Failed to resolve host"});
	}

	int last_err = ECONNREFUSED;
	for (struct addrinfo *ai = gai.value() ; nullptr != ai ; ai = ai->ai_next) {
		auto sock = io::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
		if (!sock) {
			WRN_PRINT(GRN "tcp_connect" RST ": socket({}, {}, {}) failed: {}", ai->ai_family, ai->ai_socktype, ai->ai_protocol, strerror(sock.error()));
			last_err = sock.error();
			continue;
		}
		const int fd = sock.value();

		// the send timeout also bounds connect(2)
		auto cfg = configureSocket(fd, timeout_ms);
		if (!cfg) {
			ERR_PRINT(GRN "tcp_connect" RST ": {}", cfg.error());
			closeQuietly(fd);
			io::freeaddrinfo(gai.value());
			return std::unexpected(cfg.error());
		}

		auto res = io::connect(fd, ai->ai_addr, ai->ai_addrlen);
		if (!res) {
			WRN_PRINT(GRN "tcp_connect" RST ": connect to {}:{} failed: {}", node, port, strerror(res.error()));
			last_err = EINPROGRESS == res.error() ? ETIMEDOUT : res.error();
			closeQuietly(fd);
			continue;
		}

		io::freeaddrinfo(gai.value());
		TcpConn conn{fd, node, port, peerAddress(fd)};
		INF_PRINT(GRN "tcp_connect" RST ": connected {}", conn);
		return conn;
	}

	io::freeaddrinfo(gai.value());
	return std::unexpected(ErrnoMsg{last_err, "Failed to connect"});
}

bool isLoopbackAddr(std::string_view addr)
{
	return "127.0.0.1" == addr || "::1" == addr || "0.0.0.0" == addr;
}

//-------------------------------------------------------------------------------- KdbTransport
void KdbTransport::recvAll(void *buf, size_t len)
{
	uint8_t *dst = static_cast<uint8_t*>(buf);
	size_t got = 0;
	while (got < len) {
		const size_t n = recvSome(dst + got, len - got);
		if (0 == n)
			throw KdbIoError(ErrnoMsg{0, "Connection closed by peer"});
		got += n;
	}
}

//-------------------------------------------------------------------------------- TcpTransport
void TcpTransport::sendAll(const void *buf, size_t len)
{
	const uint8_t *src = static_cast<const uint8_t*>(buf);
	size_t sent = 0;
	while (sent < len) {
		auto res = io::send(m_fd, src + sent, len - sent, MSG_NOSIGNAL);
		if (!res) {
			if (EINTR == res.error())
				continue;
			if (EAGAIN == res.error() || EWOULDBLOCK == res.error())
				throw KdbIoError(ErrnoMsg{ETIMEDOUT, "Timed out sending"});
			throw KdbIoError(ErrnoMsg{res.error(), "Failed to send"});
		}
		sent += static_cast<size_t>(res.value());
	}
	TRA_PRINT("Sent {} bytes on fd {}", len, m_fd);
}

size_t TcpTransport::recvSome(void *buf, size_t len)
{
	for (;;) {
		auto res = io::recv(m_fd, buf, len, 0);
		if (res)
			return static_cast<size_t>(res.value());
		if (EINTR == res.error())
			continue;
		if (EAGAIN == res.error() || EWOULDBLOCK == res.error())
			throw KdbIoError(ErrnoMsg{ETIMEDOUT, "Timed out receiving"});
		throw KdbIoError(ErrnoMsg{res.error(), "Failed to receive"});
	}
}

void TcpTransport::close() noexcept
{
	if (-1 == m_fd)
		return;
	auto res = io::shutdown(m_fd, SHUT_RDWR);
	if (!res && ENOTCONN != res.error())
		TRA_PRINT("shutdown(fd={}) failed: {}", m_fd, strerror(res.error()));
	closeQuietly(m_fd);
	m_fd = -1;
}

//-------------------------------------------------------------------------------- TlsTransport
void SslCtxDeleter::operator()(SSL_CTX *ctx) const { SSL_CTX_free(ctx); }
void SslDeleter::operator()(SSL *ssl) const { SSL_free(ssl); }

// Drains the OpenSSL error queue into the log
static void logSslErrors(std::string_view what)
{
	std::array<char,256> txt;
	unsigned long err = ERR_get_error();
	if (0 == err) {
		ERR_PRINT("{}: no OpenSSL error detail", what);
		return;
	}
	for ( ; 0 != err ; err = ERR_get_error()) {
		ERR_error_string_n(err, txt.data(), txt.size());
		ERR_PRINT("{}: {}", what, txt.data());
	}
}

TlsTransport::TlsTransport(int fd, const std::string & host)
 : m_fd(fd)
{
	m_ctx.reset(SSL_CTX_new(TLS_client_method()));
	if (!m_ctx) {
		logSslErrors("SSL_CTX_new");
		close();
		throw KdbIoError(ErrnoMsg{0, "Failed to create TLS context"});
	}
	SSL_CTX_set_verify(m_ctx.get(), SSL_VERIFY_PEER, nullptr);
	if (1 != SSL_CTX_set_default_verify_paths(m_ctx.get()))
		logSslErrors("SSL_CTX_set_default_verify_paths");

	m_ssl.reset(SSL_new(m_ctx.get()));
	if (!m_ssl || 1 != SSL_set_fd(m_ssl.get(), m_fd)) {
		logSslErrors("SSL_new");
		close();
		throw KdbIoError(ErrnoMsg{0, "Failed to create TLS session"});
	}

	if (1 != SSL_set_tlsext_host_name(m_ssl.get(), host.c_str()) || 1 != SSL_set1_host(m_ssl.get(), host.c_str())) {
		logSslErrors("SSL_set1_host");
		close();
		throw KdbIoError(ErrnoMsg{0, "Failed to set TLS server name"});
	}

	const int ret = SSL_connect(m_ssl.get());
	if (1 != ret) {
		const int err = SSL_get_error(m_ssl.get(), ret);
		const int sys_err = SSL_ERROR_SYSCALL == err ? errno : 0;
		ERR_PRINT("TLS handshake with {} failed, SSL_get_error={}, verify={}", host, err,
				X509_verify_cert_error_string(SSL_get_verify_result(m_ssl.get())));
		logSslErrors("SSL_connect");
		close();
		throw KdbIoError(ErrnoMsg{sys_err, "TLS handshake failed"});
	}
	DBG_PRINT("TLS established with {} using {}", host, SSL_get_version(m_ssl.get()));
}

void TlsTransport::sendAll(const void *buf, size_t len)
{
	const uint8_t *src = static_cast<const uint8_t*>(buf);
	size_t sent = 0;
	while (sent < len) {
		const int chunk = static_cast<int>(std::min<size_t>(len - sent, INT_MAX));
		const int ret = SSL_write(m_ssl.get(), src + sent, chunk);
		if (ret <= 0) {
			const int err = SSL_get_error(m_ssl.get(), ret);
			if (SSL_ERROR_SYSCALL == err && (EAGAIN == errno || EWOULDBLOCK == errno))
				throw KdbIoError(ErrnoMsg{ETIMEDOUT, "Timed out sending"});
			const int sys_err = SSL_ERROR_SYSCALL == err ? errno : 0;
			logSslErrors("SSL_write");
			throw KdbIoError(ErrnoMsg{sys_err, "Failed to send over TLS"});
		}
		sent += static_cast<size_t>(ret);
	}
	TRA_PRINT("Sent {} bytes over TLS on fd {}", len, m_fd);
}

size_t TlsTransport::recvSome(void *buf, size_t len)
{
	errno = 0;
	const int ret = SSL_read(m_ssl.get(), buf, static_cast<int>(std::min<size_t>(len, INT_MAX)));
	if (ret > 0)
		return static_cast<size_t>(ret);

	const int err = SSL_get_error(m_ssl.get(), ret);
	if (SSL_ERROR_ZERO_RETURN == err)
		return 0;
	if (SSL_ERROR_SYSCALL == err) {
		if (0 == errno)
			return 0; // peer hung up without close_notify
		if (EAGAIN == errno || EWOULDBLOCK == errno)
			throw KdbIoError(ErrnoMsg{ETIMEDOUT, "Timed out receiving"});
		throw KdbIoError(ErrnoMsg{errno, "Failed to receive over TLS"});
	}
	logSslErrors("SSL_read");
	throw KdbIoError(ErrnoMsg{0, "Failed to receive over TLS"});
}

void TlsTransport::close() noexcept
{
	if (m_ssl) {
		if (SSL_shutdown(m_ssl.get()) < 0)
			ERR_clear_error(); // the peer may already have gone
		m_ssl.reset();
	}
	m_ctx.reset();
	if (-1 != m_fd) {
		auto res = io::shutdown(m_fd, SHUT_RDWR);
		if (!res && ENOTCONN != res.error())
			TRA_PRINT("shutdown(fd={}) failed: {}", m_fd, strerror(res.error()));
		closeQuietly(m_fd);
		m_fd = -1;
	}
}

} // end namespace kxc
