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

#include "kxc/KdbCompress.h"
#include "kxc/KdbType.h"
#include "kxc/KdbErrors.h"
#include "kxc/kxc_fmt_defs.h"

#include <algorithm>
#include <cstring>
#include <format>

namespace kxc {

//-------------------------------------------------------------------------------- KdbIpcCompressor
bool KdbIpcCompressor::compress(std::vector<int8_t> & ipc)
{
	const uint8_t *y = reinterpret_cast<const uint8_t*>(ipc.data());
	const int64_t t = static_cast<int64_t>(ipc.size());
	const int64_t e = t / 2;

	// room for the header, the original length and one worst-case group
	if (e < SZ_MSG_HDR + SZ_INT + 17)
		return false;

	std::vector<int8_t> out(e, 0);
	uint8_t *dst = reinterpret_cast<uint8_t*>(out.data());
	memcpy(dst, y, 4);
	dst[2] = 1;

	WriteBuf hdr{dst + 8, SZ_INT};
	hdr.write<int32_t>(static_cast<int32_t>(t));

	int64_t cc = 12, d = cc, s = 8, p = 0, s0 = 0;
	uint32_t i = 0, f = 0, h = 0, h0 = 0;
	int64_t a[256] = {0};

	while (s < t) {
		if (0 == i) {
			if (d > e - 17) {
				TRA_PRINT("Compression abandoned at input offset {} of {}", s, t);
				return false;
			}
			i = 1;
			dst[cc] = static_cast<uint8_t>(f);
			cc = d++;
			f = 0;
		}

		// NB 'h' keeps its previous value when the first test short-circuits; it matters
		// because h0 is taken from it below
		bool g = s > t - 3;
		if (!g) {
			h = 0xFF & (y[s] ^ y[s+1]);
			p = a[h];
			g = 0 == p || y[s] != y[p];
		}

		if (s0 > 0) {
			a[h0] = s0;
			s0 = 0;
		}

		if (g) {
			h0 = h;
			s0 = s;
			dst[d++] = y[s++];
		}
		else {
			a[h] = s;
			f |= i;
			p += 2;
			s += 2;
			const int64_t r = s;
			const int64_t q = std::min(s + 255, t);
			while (s < q && y[p] == y[s]) {
				p++;
				s++;
			}
			dst[d++] = static_cast<uint8_t>(h);
			dst[d++] = static_cast<uint8_t>(s - r);
		}

		i *= 2;
		if (256 == i)
			i = 0;
	}

	dst[cc] = static_cast<uint8_t>(f);
	WriteBuf len{dst + 4, SZ_INT};
	len.write<int32_t>(static_cast<int32_t>(d));

	out.resize(d);
	DBG_PRINT("Compressed IPC message from {} to {} bytes", t, d);
	ipc.swap(out);
	return true;
}

//-------------------------------------------------------------------------------- KdbIpcDecompressor
KdbIpcDecompressor::KdbIpcDecompressor(const int8_t *src, uint64_t len, bool little)
 : m_src(src)
 , m_len(len)
 , m_little(little)
{
	std::fill(std::begin(m_lbh), std::end(m_lbh), 0);
}

uint8_t KdbIpcDecompressor::next()
{
	if (m_rdx >= m_len)
		throw KdbProtocolError(std::format("Compressed message truncated at offset {} of {}", m_rdx, m_len));
	return static_cast<uint8_t>(m_src[m_rdx++]);
}

std::vector<int8_t> KdbIpcDecompressor::uncompress()
{
	if (m_len < static_cast<uint64_t>(SZ_MSG_HDR + SZ_INT))
		throw KdbProtocolError(std::format("Compressed message of {} bytes is too short", m_len));

	ReadBuf buf{m_src, m_len, m_little};
	buf.skip(SZ_MSG_HDR);
	const int32_t msg_len = buf.read<int32_t>();
	if (msg_len < SZ_MSG_HDR)
		throw KdbProtocolError(std::format("Invalid uncompressed length {}", msg_len));

	std::vector<int8_t> out(msg_len, 0);
	uint8_t *dst = reinterpret_cast<uint8_t*>(out.data());
	memcpy(dst, m_src, SZ_MSG_HDR);
	dst[2] = 0;
	for (int b = 0 ; b < SZ_INT ; b++) {
		const int sft = m_little ? 8 * b : 8 * (SZ_INT - 1 - b);
		dst[4 + b] = static_cast<uint8_t>(static_cast<uint32_t>(msg_len) >> sft);
	}

	const uint64_t dst_len = static_cast<uint64_t>(msg_len);
	m_off = m_chx = SZ_MSG_HDR;
	m_rdx = SZ_MSG_HDR + SZ_INT;
	m_idx = 0;

	while (m_off < dst_len) {

		if (0 == m_idx) {
			m_bit = next();
			m_idx = 1;
		}

		uint32_t rdn = 0;
		if (0 != (m_bit & m_idx)) {
			uint64_t old = m_lbh[next()];
			rdn = next();
			if (m_off + 2 + rdn > dst_len)
				throw KdbProtocolError(std::format("Back-reference of {} bytes at {} overruns the {} byte message", rdn + 2, m_off, dst_len));
			dst[m_off++] = dst[old++];
			dst[m_off++] = dst[old++];
			// source and destination may overlap: copy byte by byte
			for (uint32_t m = 0 ; m < rdn ; m++) {
				dst[m_off + m] = dst[old + m];
			}
		}
		else {
			dst[m_off++] = next(); // copy a plaintext byte
		}

		while (m_chx < (m_off - 1)) {
			m_lbh[dst[m_chx] ^ dst[m_chx+1]] = static_cast<uint32_t>(m_chx);
			m_chx++;
		}

		if (0 != (m_bit & m_idx)) {
			m_chx = m_off += rdn;
		}

		m_idx *= 2;
		if (256 == m_idx) {
			m_idx = 0;
		}
	}

	return out;
}

} // end namespace kxc
