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

#ifndef __kxc_KdbSocket__H__
#define __kxc_KdbSocket__H__
#pragma once

#include "kxc/KdbErrors.h"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <format>
#include <memory>
#include <string>
#include <string_view>

typedef struct ssl_st SSL;
typedef struct ssl_ctx_st SSL_CTX;

namespace kxc {

//-------------------------------------------------------------------------------- TcpConn
struct TcpConn
{
	int         fd;
	std::string host;
	std::string service;
	std::string peer; // numeric address of the remote end
};

// Resolves 'host' and connects to the first address that accepts, with TCP_NODELAY and
// SO_KEEPALIVE set. A positive 'timeout_ms' becomes the socket's send and receive timeout.
std::expected<TcpConn,ErrnoMsg> tcp_connect(std::string_view host, std::string_view service, int32_t timeout_ms);

// True for 127.0.0.1, ::1 and 0.0.0.0, the peers for which compression is never used
bool isLoopbackAddr(std::string_view addr);

//-------------------------------------------------------------------------------- KdbTransport
// A connected, blocking byte stream. Every failure throws KdbIoError.
class KdbTransport
{
	public:
		virtual ~KdbTransport() = default;

		virtual void sendAll(const void *buf, size_t len) = 0;
		// Returns zero at end-of-stream
		virtual size_t recvSome(void *buf, size_t len) = 0;
		virtual void close() noexcept = 0;
		virtual int fd() const = 0;

		// Loops until 'len' bytes arrive; end-of-stream part way is an error
		void recvAll(void *buf, size_t len);
};

class TcpTransport : public KdbTransport
{
	int m_fd;

	public:
		explicit TcpTransport(int fd) : m_fd(fd) {}
		~TcpTransport() override { close(); }
		TcpTransport(const TcpTransport &) = delete;
		TcpTransport & operator=(const TcpTransport &) = delete;

		void sendAll(const void *buf, size_t len) override;
		size_t recvSome(void *buf, size_t len) override;
		void close() noexcept override;
		int fd() const override { return m_fd; }
};

struct SslCtxDeleter { void operator()(SSL_CTX *ctx) const; };
struct SslDeleter { void operator()(SSL *ssl) const; };

// Verifies the server certificate against the default trust store and checks that it was
// issued for 'host', which is also sent as SNI
class TlsTransport : public KdbTransport
{
	int                                   m_fd;
	std::unique_ptr<SSL_CTX,SslCtxDeleter> m_ctx;
	std::unique_ptr<SSL,SslDeleter>        m_ssl;

	public:
		// Takes ownership of 'fd' and completes the TLS handshake
		TlsTransport(int fd, const std::string & host);
		~TlsTransport() override { close(); }
		TlsTransport(const TlsTransport &) = delete;
		TlsTransport & operator=(const TlsTransport &) = delete;

		void sendAll(const void *buf, size_t len) override;
		size_t recvSome(void *buf, size_t len) override;
		void close() noexcept override;
		int fd() const override { return m_fd; }
};

} // end namespace kxc

template<>
struct std::formatter<kxc::TcpConn>
{
	constexpr auto parse(std::format_parse_context& ctx) { return ctx.begin(); }
	template<class FormatContext> auto format(const kxc::TcpConn & conn, FormatContext & ctx) const
	{
		return std::format_to(ctx.out(), "TcpConn(fd={}, {}:{}, peer={})", conn.fd, conn.host, conn.service, conn.peer);
	}
};

#endif // defined __kxc_KdbSocket__H__
