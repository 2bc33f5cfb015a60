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

#ifndef __kxc_KdbConnection__H__
#define __kxc_KdbConnection__H__
#pragma once

#include "kxc/KdbType.h"
#include "kxc/KdbIpcMessage.h"
#include "kxc/KdbSocket.h"

#include <chrono>
#include <concepts>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace kxc {

template <typename T>
concept KdbOwnedPtr = requires (T t) { { std::unique_ptr<KdbBase>{std::move(t)} }; };

// A positional argument of a function call: a KdbBase (borrowed for the duration of the call),
// a unique_ptr to one (adopted), or a host value converted with toKdb
template <typename T>
concept KdbCallArg = std::derived_from<std::remove_cvref_t<T>, KdbBase>
	|| KdbOwnedPtr<std::remove_cvref_t<T>>
	|| KdbHostAtom<T>;

/**
 * A blocking client connection to a kdb+ process.
 *
 * One synchronous request may be in flight at a time: instances are not thread-safe and callers
 * needing concurrent requests must use separate connections or serialise access externally.
 * cancel() is the one member that may be called from another thread: it shuts the socket down so
 * that a blocked read fails with KdbIoError, leaving the blocked thread to release the connection.
 *
 * A KdbIoError, or a malformed inbound message, closes the connection before the exception
 * propagates; reconnecting is the caller's responsibility.
 */
class KdbConnection
{
	public:
		struct Options
		{
			std::string               host{"localhost"};
			uint16_t                  port{5010};
			std::string               credentials{};   // "user:pass"
			bool                      use_tls{false};
			std::chrono::milliseconds timeout{0};      // zero for none
			bool                      compress{false};
		};

		enum class State { Disconnected, Connecting, Handshaking, Ready };

	private:
		std::unique_ptr<KdbTransport> m_transport;
		State    m_state{State::Disconnected};
		int8_t   m_ipc_ver{0};
		bool     m_loopback{false};
		bool     m_compress{false};
		uint32_t m_pending{0};
		std::string m_name;
		std::mutex  m_cancel_mtx;
		int         m_cancel_fd{-1}; // guarded by m_cancel_mtx

		void requireReady() const;
		// Serialises 'msg' for the negotiated version, compressing if enabled
		std::vector<int8_t> frame(KdbMsgType msg_typ, const KdbBase & msg) const;
		void sendMsg(KdbMsgType msg_typ, const KdbBase & msg);
		void sendBytes(const std::vector<int8_t> & ipc);
		KdbIpcMessage readMsg();
		std::unique_ptr<KdbBase> awaitResponse();

		template <KdbCallArg T>
		static void pushArg(KdbList & list, T && arg)
		{
			using U = std::remove_cvref_t<T>;
			if constexpr (std::derived_from<U, KdbBase>)
				list.push(arg);
			else if constexpr (KdbOwnedPtr<U>)
				list.push(std::unique_ptr<KdbBase>{std::move(arg)});
			else
				list.push(toKdb(std::forward<T>(arg)));
		}

		// [func; args...] with the function name as a char vector
		template <KdbCallArg... Args>
		static KdbList callOf(std::string_view func, Args && ... args)
		{
			KdbList list{1 + sizeof...(Args)};
			list.push(std::make_unique<KdbCharVector>(func));
			(pushArg(list, std::forward<Args>(args)), ...);
			return list;
		}

	public:
		KdbConnection() = default;
		~KdbConnection() { close(); }
		KdbConnection(KdbConnection && rhs) noexcept;
		KdbConnection & operator=(KdbConnection && rhs) noexcept;
		KdbConnection(const KdbConnection &) = delete;
		KdbConnection & operator=(const KdbConnection &) = delete;

		// Opens the stream and logs in. Throws KdbAccessError if the server hangs up before sending
		// its version byte, KdbIoError for any transport failure.
		void connect(const Options & opts);

		void sendAsync(const KdbBase & msg);
		// Sends 'expr' as a char vector, for the server to evaluate
		void sendAsync(std::string_view expr);
		template <KdbCallArg... Args>
			requires (sizeof...(Args) >= 1 && sizeof...(Args) <= 3)
		void sendAsync(std::string_view func, Args && ... args)
		{
			sendAsync(callOf(func, std::forward<Args>(args)...));
		}

		// Blocks until the response arrives, discarding interleaved messages of other kinds.
		// Throws KdbRemoteError if the response is an error.
		std::unique_ptr<KdbBase> sendSync(const KdbBase & msg);
		std::unique_ptr<KdbBase> sendSync(std::string_view expr);
		template <KdbCallArg... Args>
			requires (sizeof...(Args) >= 1 && sizeof...(Args) <= 3)
		std::unique_ptr<KdbBase> sendSync(std::string_view func, Args && ... args)
		{
			return sendSync(callOf(func, std::forward<Args>(args)...));
		}

		// Reads the next message of any kind. A sync request from the peer must be answered with
		// sendResponse or sendError.
		std::unique_ptr<KdbBase> receive(KdbMsgType *msg_typ = nullptr);
		void sendResponse(const KdbBase & msg);
		void sendError(std::string_view text);

		// Round-trips a trivial expression; never throws
		bool isConnected() noexcept;
		void close() noexcept;
		// Thread-safe. Shuts the socket down without releasing it; a no-op once closed.
		void cancel() noexcept;

		void setCompression(bool compress) { m_compress = compress; }
		int8_t ipcVersion() const { return m_ipc_ver; }
		bool isLoopback() const { return m_loopback; }
		bool isOpen() const { return State::Ready == m_state; }
		uint32_t pendingSync() const { return m_pending; }
		State state() const { return m_state; }
};

} // end namespace kxc

template<>
struct std::formatter<kxc::KdbConnection::State>
{
	constexpr auto parse(std::format_parse_context& ctx) { return ctx.begin(); }
	template<class FormatContext> auto format(kxc::KdbConnection::State st, FormatContext & ctx) const
	{
		using State = kxc::KdbConnection::State;
		std::string_view name = "?";
		switch (st) {
			case State::Disconnected: name = "Disconnected"; break;
			case State::Connecting:   name = "Connecting";   break;
			case State::Handshaking:  name = "Handshaking";  break;
			case State::Ready:        name = "Ready";        break;
		}
		return std::format_to(ctx.out(), "{}", name);
	}
};

#endif // defined __kxc_KdbConnection__H__
