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

#ifndef __kxc_KdbIoDefs__H__
#define __kxc_KdbIoDefs__H__

#pragma once

#include <stdint.h>
#include <stddef.h> // size_t
#include <sys/types.h> // ssize_t
#include <unistd.h> // close
#include <sys/socket.h> // socket, send, recv, setsockopt
#include <netdb.h> // getaddrinfo
#include <errno.h>

#include <expected>

namespace kxc::io {

// NB the error value is the EAI_* code rather than errno; use gai_strerror on it
inline
std::expected<struct addrinfo*,int> getaddrinfo(const char *node, const char *service, const struct addrinfo *hints)
{
	struct addrinfo *res = nullptr;
	int ret = ::getaddrinfo(node, service, hints, &res);
	if (0 != ret) {
		return std::unexpected(ret);
	}
	return res;
}

inline
void freeaddrinfo(struct addrinfo *res)
{
	::freeaddrinfo(res);
}

inline
std::expected<int,int> socket(int domain, int type, int protocol)
{
	int ret = ::socket(domain, type, protocol);
	if (-1 == ret) {
		return std::unexpected(errno);
	}
	return ret;
}

inline
std::expected<int,int> connect(int sockfd, const struct sockaddr *addr, socklen_t addrlen)
{
	int ret = ::connect(sockfd, addr, addrlen);
	if (-1 == ret) {
		return std::unexpected(errno);
	}
	return ret;
}

inline
std::expected<int,int> setsockopt(int sockfd, int level, int optname, const void *optval, socklen_t optlen)
{
	int ret = ::setsockopt(sockfd, level, optname, optval, optlen);
	if (-1 == ret) {
		return std::unexpected(errno);
	}
	return ret;
}

inline
std::expected<int,int> getpeername(int sockfd, struct sockaddr *addr, socklen_t *addrlen)
{
	int ret = ::getpeername(sockfd, addr, addrlen);
	if (-1 == ret) {
		return std::unexpected(errno);
	}
	return ret;
}

inline
std::expected<ssize_t,int> send(int fd, const void *buf, size_t count, int flags)
{
	ssize_t res = ::send(fd, buf, count, flags);
	if (-1 == res) {
		return std::unexpected(errno);
	}
	return res;
}

inline
std::expected<ssize_t,int> recv(int fd, void *buf, size_t count, int flags)
{
	ssize_t res = ::recv(fd, buf, count, flags);
	if (-1 == res) {
		return std::unexpected(errno);
	}
	return res;
}

inline
std::expected<int,int> shutdown(int fd, int how)
{
	int res = ::shutdown(fd, how);
	if (-1 == res) {
		return std::unexpected(errno);
	}
	return res;
}

inline
std::expected<int,int> close(int fd)
{
	int res = ::close(fd);
	if (-1 == res) {
		return std::unexpected(errno);
	}
	return res;
}

} // end namepace kxc::io

#endif
