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

#ifndef __kxc_KdbClient__H__
#define __kxc_KdbClient__H__
#pragma once

#include "kxc/KdbConnection.h"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace kxc {

/**
 * Publishes text payloads to a kdb+ function, e.g. `.u.updjson[`hass_event; "{...}"]`,
 * reconnecting on demand. No exception escapes: failures are logged and reported as false.
 * Not thread-safe.
 */
class KdbClient
{
	public:
		struct Config
		{
			std::string               host{"localhost"};
			uint16_t                  port{5010};
			std::string               credentials{};
			bool                      use_tls{false};
			std::chrono::milliseconds timeout{0};
			bool                      compress{false};
			std::string               function{".u.updjson"};
			std::string               table{"hass_event"};
			bool                      sync{true};   // false to send asynchronously

			KdbConnection::Options options() const
			{
				return {.host = host, .port = port, .credentials = credentials, .use_tls = use_tls,
						.timeout = timeout, .compress = compress};
			}
		};

	private:
		Config        m_cfg;
		KdbConnection m_conn;

	public:
		explicit KdbClient(Config cfg) : m_cfg(std::move(cfg)) {}

		// Closes any existing connection first
		bool connect();
		bool isConnected();
		// Calls 'func' with the table name as a symbol and 'payload' as a char vector. Both strings
		// are UTF-8 and are converted to ISO-8859-1 before sending.
		bool send(std::string_view func, std::string_view table, std::string_view payload);
		bool publish(std::string_view payload) { return send(m_cfg.function, m_cfg.table, payload); }
		void close() noexcept { m_conn.close(); }

		const Config & config() const { return m_cfg; }
		KdbConnection & connection() { return m_conn; }
};

} // end namespace kxc

#endif // defined __kxc_KdbClient__H__
