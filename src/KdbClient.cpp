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

#include "kxc/KdbClient.h"
#include "kxc/KdbErrors.h"
#include "kxc/KdbFormat.h"
#include "kxc/kxc_fmt_defs.h"

namespace kxc {

bool KdbClient::connect()
{
	try {
		m_conn.connect(m_cfg.options());
		return true;
	}
	catch (const std::exception & e) {
		ERR_PRINT("Failed to connect to {}:{}: {}", m_cfg.host, m_cfg.port, e.what());
		m_conn.close();
		return false;
	}
}

bool KdbClient::isConnected()
{
	return m_conn.isConnected();
}

bool KdbClient::send(std::string_view func, std::string_view table, std::string_view payload)
{
	if (!m_conn.isConnected() && !connect())
		return false;

	try {
		const std::string tbl = KdbUtil::toLatin1(table);
		const std::string txt = KdbUtil::toLatin1(payload);
		if (m_cfg.sync) {
			std::unique_ptr<KdbBase> res = m_conn.sendSync(func, KdbSymbolAtom{tbl}, KdbCharVector{txt});
			DBG_PRINT("{} returned {}", func, *res);
		}
		else {
			m_conn.sendAsync(func, KdbSymbolAtom{tbl}, KdbCharVector{txt});
		}
		return true;
	}
	catch (const std::exception & e) {
		ERR_PRINT("Failed to send to {}:{}: {}", m_cfg.host, m_cfg.port, e.what());
		m_conn.close();
		return false;
	}
}

} // end namespace kxc
