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

#ifndef __kxc_KdbCompress__H__
#define __kxc_KdbCompress__H__
#pragma once

#include <cstdint>
#include <vector>

namespace kxc {

// Messages no longer than this go out uncompressed
constexpr uint64_t MIN_COMPRESS_SZ = 2000;

// The kdb+ IPC compression scheme: a control byte precedes each group of eight tokens, a
// set bit marking a back-reference (hash-slot, run-length) and a clear bit a literal byte.
// The hash of each pair of bytes indexes a 256-entry table holding the last offset at
// which that pair was seen.
class KdbIpcCompressor
{
	public:
		// Compresses the complete IPC message in 'ipc' in place: byte 2 of the header is set,
		// the compressed length is written at offset 4 and the original length at offset 8.
		// Returns false, leaving 'ipc' untouched, if the result would not fit in half the
		// original length.
		static bool compress(std::vector<int8_t> & ipc);
};

class KdbIpcDecompressor
{
	const int8_t *m_src;
	uint64_t      m_len;
	bool          m_little;

	uint32_t m_idx{0};   // i
	uint64_t m_off{0};   // s
	uint64_t m_rdx{0};   // d: offset into the compressed message
	uint64_t m_chx{0};   // p: trails m_off, filling the hash table
	uint32_t m_bit{0};   // f
	uint32_t m_lbh[256]; // aa

	uint8_t next();

	public:
		// 'src' is the complete compressed message, header included; 'little' is the byte-order
		// declared in its header
		KdbIpcDecompressor(const int8_t *src, uint64_t len, bool little);

		// Returns the uncompressed message: the original header (with the compressed flag cleared)
		// followed by the body. Throws KdbProtocolError if the input is malformed.
		std::vector<int8_t> uncompress();
		uint64_t getUsedInputCount() const { return m_rdx; }
};

} // end namespace kxc

#endif // defined __kxc_KdbCompress__H__
