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

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "kxc/KdbType.h"
#include "kxc/KdbIpcMessage.h"
#include "kxc/KdbErrors.h"
#include "KdbHexDefs.h"

#include <gtest/gtest.h>

#include "../src/KdbType.cpp"
#include "../src/KdbCompress.cpp"
#include "../src/KdbIpcMessage.cpp"

using namespace kxc;

namespace kxc::test {

TEST(KdbIpcMessageTest, TestParseHeader)
{
	const std::vector<int8_t> le = fromHex("0x010200001b000000");
	KdbMsgHeader hdr = KdbIpcMessageReader::parseHeader(le.data());
	EXPECT_TRUE(hdr.little_endian);
	EXPECT_EQ(KdbMsgType::RESPONSE, hdr.msg_typ);
	EXPECT_FALSE(hdr.compressed);
	EXPECT_EQ(27, hdr.ipc_len);

	const std::vector<int8_t> be = fromHex("0x000101000000001b");
	hdr = KdbIpcMessageReader::parseHeader(be.data());
	EXPECT_FALSE(hdr.little_endian);
	EXPECT_EQ(KdbMsgType::SYNC, hdr.msg_typ);
	EXPECT_TRUE(hdr.compressed);
	EXPECT_EQ(27, hdr.ipc_len);

	const std::vector<int8_t> bad = fromHex("0x0100000008000000");
	EXPECT_THROW(KdbIpcMessageReader::parseHeader(bad.data()), KdbProtocolError);
}

TEST(KdbIpcMessageTest, TestReadMsgFromQ)
{
	// q)-8!"Hello, world!"
	const std::vector<int8_t> src = fromHex("0x010000001b0000000a000d00000048656c6c6f2c20776f726c6421");
	KdbIpcMessage msg = KdbIpcMessageReader::readMsg(src.data(), src.size());
	EXPECT_EQ(KdbMsgType::ASYNC, msg.header.msg_typ);
	EXPECT_FALSE(msg.isError());
	ASSERT_NE(nullptr, msg.value);
	ASSERT_EQ(KdbType::CHAR_VECTOR, msg.value->m_typ);
	EXPECT_EQ("Hello, world!", static_cast<const KdbCharVector&>(*msg.value).getString());

	// the same value written back is big-endian
	KdbIpcMessageWriter writer{KdbMsgType::ASYNC, *msg.value};
	EXPECT_EQ(27, writer.ipcLength());
	EXPECT_EQ("0x000000000000001b0a000000000d48656c6c6f2c20776f726c6421", toHex(writer.serialize()));
}

TEST(KdbIpcMessageTest, TestReadMsgRejectsBadFrames)
{
	const std::vector<int8_t> src = fromHex("0x010000001b0000000a000d00000048656c6c6f2c20776f726c6421");
	EXPECT_THROW(KdbIpcMessageReader::readMsg(src.data(), src.size() - 1), KdbProtocolError);
	EXPECT_THROW(KdbIpcMessageReader::readMsg(src.data(), 4), KdbProtocolError);

	// body claims 13 chars but the frame only has room for 3
	const std::vector<int8_t> truncated = fromHex("0x01000000110000000a000d000000484865");
	EXPECT_THROW(KdbIpcMessageReader::readMsg(truncated.data(), truncated.size()), KdbProtocolError);

	// type 77 isn't a thing
	const std::vector<int8_t> unknown = fromHex("0x010000000a0000004d00");
	EXPECT_THROW(KdbIpcMessageReader::readMsg(unknown.data(), unknown.size()), KdbProtocolError);
}

TEST(KdbIpcMessageTest, TestErrorMessage)
{
	const std::vector<int8_t> ipc = KdbIpcMessageWriter::errorMessage("type");
	EXPECT_EQ("0x000200000000000e807479706500", toHex(ipc));

	KdbIpcMessage msg = KdbIpcMessageReader::readMsg(ipc.data(), ipc.size());
	EXPECT_EQ(KdbMsgType::RESPONSE, msg.header.msg_typ);
	EXPECT_TRUE(msg.isError());
	try {
		std::ignore = msg.take();
		FAIL() << "take() handed over an error";
	}
	catch (const KdbRemoteError & e) {
		EXPECT_STREQ("type", e.what());
	}
}

TEST(KdbIpcMessageTest, TestTakeHandsOverTheValue)
{
	const std::vector<int8_t> src = fromHex("0x010002000d000000fa2a000000");
	KdbIpcMessage msg = KdbIpcMessageReader::readMsg(src.data(), src.size());
	std::unique_ptr<KdbBase> val = msg.take();
	ASSERT_NE(nullptr, val);
	EXPECT_TRUE(KdbIntAtom{42} == *val);
	EXPECT_EQ(nullptr, msg.value);
}

TEST(KdbIpcMessageTest, TestSmallMessagesAreNotCompressed)
{
	KdbLongVector vec{std::vector<int64_t>(200, 1)};
	KdbIpcMessageWriter writer{KdbMsgType::SYNC, vec};
	ASSERT_LT(writer.ipcLength(), MIN_COMPRESS_SZ);
	const std::vector<int8_t> ipc = writer.serialize(true);
	EXPECT_EQ(0, ipc[2]);
	EXPECT_EQ(writer.ipcLength(), ipc.size());

	KdbLongVector big{std::vector<int64_t>(300, 1)};
	KdbIpcMessageWriter big_writer{KdbMsgType::SYNC, big};
	ASSERT_GT(big_writer.ipcLength(), MIN_COMPRESS_SZ);
	EXPECT_EQ(1, big_writer.serialize(true)[2]);
}

TEST(KdbIpcMessageTest, TestWriterHonoursIpcVersion)
{
	KdbGuidAtom guid{};
	KdbIpcMessageWriter old{KdbMsgType::SYNC, guid, 2};
	EXPECT_THROW(old.serialize(), KdbProtocolError);

	KdbIpcMessageWriter cur{KdbMsgType::SYNC, guid, 3};
	EXPECT_EQ(SZ_MSG_HDR + SZ_BYTE + SZ_GUID, cur.serialize().size());
}

TEST(KdbIpcMessageTest, TestLoginMessage)
{
	EXPECT_EQ("0x757365723a706173730300", toHex(KdbUtil::writeLoginMsg("user:pass")));
	EXPECT_EQ("0x0300", toHex(KdbUtil::writeLoginMsg("")));
}

TEST(KdbIpcMessageTest, TestToLatin1)
{
	EXPECT_EQ("plain ascii", KdbUtil::toLatin1("plain ascii"));
	EXPECT_EQ("21.5\xb0" "C", KdbUtil::toLatin1("21.5°C"));
	EXPECT_EQ("\xe9t\xe9", KdbUtil::toLatin1("été"));
	// the euro sign is beyond U+00FF
	EXPECT_THROW(KdbUtil::toLatin1("5€"), KdbEncodingError);
	EXPECT_THROW(KdbUtil::toLatin1("\xc3"), KdbEncodingError);
	EXPECT_THROW(KdbUtil::toLatin1("\xc3(" ), KdbEncodingError);
	EXPECT_THROW(KdbUtil::toLatin1("\xff"), KdbEncodingError);
}

} // end namespace kxc::test

int main(int argc, char *argv[]) {
	using namespace kxc::test;
	testing::InitGoogleTest(&argc, argv);
	return RUN_ALL_TESTS();
}
