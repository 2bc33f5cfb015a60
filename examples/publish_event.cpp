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

/*
	Publishes one JSON event to a kdb+ process, as `.u.updjson[`hass_event; "{...}"]`.

	usage: kxc_publish [host [port [table [function]]]]

	On the q side something like this will receive it:

		q).u.updjson:{[t;j] t insert enlist .j.k j}
 */
#include "kxc/KdbClient.h"
#include "kxc/KdbFormat.h"
#include "kxc/kxc_fmt_defs.h"

#include <stdlib.h> // EXIT_FAILURE

#include <charconv>
#include <format>
#include <print>
#include <string_view>

using namespace kxc;

int main(int argc, char **argv)
{
	KdbClient::Config cfg{};
	if (argc > 1)
		cfg.host = argv[1];
	if (argc > 2) {
		const std::string_view arg{argv[2]};
		auto [ptr, ec] = std::from_chars(arg.data(), arg.data() + arg.size(), cfg.port);
		if (std::errc{} != ec || ptr != arg.data() + arg.size()) {
			std::print("ERROR: invalid port '{}'\n", arg);
			exit(EXIT_FAILURE);
		}
	}
	if (argc > 3)
		cfg.table = argv[3];
	if (argc > 4)
		cfg.function = argv[4];

	KdbClient client{cfg};
	if (!client.connect()) {
		std::print("ERROR: failed to connect to {}:{}\n", cfg.host, cfg.port);
		exit(EXIT_FAILURE);
	}

	std::print(" INFO: connected to {}:{}, IPC version {}\n", cfg.host, cfg.port, client.connection().ipcVersion());

	const std::string_view event = R"({"entity_id":"sensor.kitchen_temperature","state":"21.5","attributes":{"unit_of_measurement":"°C"}})";
	if (!client.publish(event)) {
		std::print("ERROR: failed to publish to {}\n", cfg.table);
		client.close();
		exit(EXIT_FAILURE);
	}

	try {
		std::unique_ptr<KdbBase> count = client.connection().sendSync(std::format("count {}", cfg.table));
		std::print(" INFO: {} now holds {} rows\n", cfg.table, *count);
	}
	catch (const KdbError & e) {
		std::print(" WARN: failed to count {}: {}\n", cfg.table, e.what());
	}

	client.close();
	return 0;
}
