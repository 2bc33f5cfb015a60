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

#ifndef __kxc_KdbType__H__
#define __kxc_KdbType__H__
#pragma once
#include <array>
#include <bit>
#include <concepts>
#include <cstdint>
#include <cstring> // memcpy
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace kxc {

constexpr static int32_t SZ_BYTE     =  1;
constexpr static int32_t SZ_SHORT    =  2;
constexpr static int32_t SZ_INT      =  4;
constexpr static int32_t SZ_LONG     =  8;
constexpr static int32_t SZ_GUID     = 16;
constexpr static int32_t SZ_REAL     =  4;
constexpr static int32_t SZ_FLOAT    =  8;
constexpr static int32_t SZ_VEC_META =  5;
constexpr static int32_t SZ_VEC_HDR  =  SZ_BYTE + SZ_VEC_META;
constexpr static int32_t SZ_MSG_HDR  =  8;

constexpr int16_t NULL_SHORT     = std::bit_cast<int16_t>((unsigned short)0x8000);
constexpr int32_t NULL_INT       = 0x80000000;
constexpr int64_t NULL_LONG      = 0x8000000000000000L;
constexpr int32_t NULL_REAL      = 0xffc00000;
constexpr int64_t NULL_FLOAT     = 0xfff8000000000000L;
constexpr uint8_t NULL_CHAR      = 0x20;

// The highest IPC capability this library advertises during the handshake
constexpr int8_t MAX_IPC_VERSION = 3;

enum class KdbType
{
	EXCEPTION         = -128,
	TIME_ATOM         = -19,
	SECOND_ATOM       = -18,
	MINUTE_ATOM       = -17,
	TIMESPAN_ATOM     = -16,
	DATETIME_ATOM     = -15,
	DATE_ATOM         = -14,
	MONTH_ATOM        = -13,
	TIMESTAMP_ATOM    = -12,
	SYMBOL_ATOM       = -11,
	CHAR_ATOM         = -10,
	FLOAT_ATOM        =  -9,
	REAL_ATOM         =  -8,
	LONG_ATOM         =  -7,
	INT_ATOM          =  -6,
	SHORT_ATOM        =  -5,
	BYTE_ATOM         =  -4,
	GUID_ATOM         =  -2,
	BOOL_ATOM         =  -1,
	LIST              =   0,
	BOOL_VECTOR       = -BOOL_ATOM,
	GUID_VECTOR       = -GUID_ATOM,
	BYTE_VECTOR       = -BYTE_ATOM,
	SHORT_VECTOR      = -SHORT_ATOM,
	INT_VECTOR        = -INT_ATOM,
	LONG_VECTOR       = -LONG_ATOM,
	REAL_VECTOR       = -REAL_ATOM,
	FLOAT_VECTOR      = -FLOAT_ATOM,
	CHAR_VECTOR       = -CHAR_ATOM,
	SYMBOL_VECTOR     = -SYMBOL_ATOM,
	TIMESTAMP_VECTOR  = -TIMESTAMP_ATOM,
	MONTH_VECTOR      = -MONTH_ATOM,
	DATE_VECTOR       = -DATE_ATOM,
	DATETIME_VECTOR   = -DATETIME_ATOM,
	TIMESPAN_VECTOR   = -TIMESPAN_ATOM,
	MINUTE_VECTOR     = -MINUTE_ATOM,
	SECOND_VECTOR     = -SECOND_ATOM,
	TIME_VECTOR       = -TIME_ATOM,
	TABLE             = 98,
	DICT              = 99,
	FUNCTION          = 100, // {x+y}
	UNARY_PRIMITIVE   = 101, // neg, also :: with a zero byte
	BINARY_PRIMITIVE  = 102, // +
	TERNARY_PRIMITIVE = 103, // '
	PROJECTION        = 104, // {x+y}[1]
	COMPOSITION       = 105, // ('[neg;+])
	EACH              = 106, // f'
	OVER              = 107, // f/
	SCAN              = 108, // f\ .
	EACH_PRIOR        = 109, // f':
	EACH_RIGHT        = 110, // f/:
	EACH_LEFT         = 111, // f\:
	DYNAMIC_LOAD      = 112, // 2: loaded function
};

enum class KdbMsgType
{
	ASYNC    = 0,
	SYNC     = 1,
	RESPONSE = 2
};

enum class KdbAttr
{
	NONE    = 0,
	SORTED  = 1,
	UNIQUE  = 2,
	PARTED  = 3,
	GROUPED = 4
};

enum class ReadResult
{
	RD_OK,
	RD_INCOMPLETE,
	RD_ERR_IPC,
};

enum class WriteResult
{
	WR_OK,
	WR_INCOMPLETE,
};

using GuidType = std::array<uint8_t,16>;

//-------------------------------------------------------------------------------- ReadBuf
// Reads honour the byte-order declared in byte 0 of the message that is being decoded: it
// may differ from one message to the next on the same connection. Wider values are
// composed from narrower reads, two bytes into a short, two shorts into an int and so on.
class ReadBuf
{
	int8_t const *m_src;
	uint64_t      m_len;
	uint64_t      m_off{0};
	bool          m_little;

	public:
		ReadBuf(const int8_t *src, uint64_t len, bool little = true);

		uint64_t remaining() const { return m_len - m_off; }
		bool canRead(uint64_t bytes) const { return remaining() >= bytes; }
		uint64_t length() const { return m_len; }
		uint64_t offset() const { return m_off; }
		bool isLittleEndian() const { return m_little; }
		void skip(uint64_t bytes) { m_off += bytes; }

		template<typename T> T read();
		void readRaw(void *dst, uint64_t len);
		ReadResult readSym(std::string & str);
};

template<typename T>
T ReadBuf::read()
{
	static_assert(std::is_arithmetic<T>::value, "ReadBuf::read is for arithmetic types");

	if constexpr (std::is_floating_point<T>::value) {
		using I = std::conditional_t<sizeof(T) == SZ_REAL, int32_t, int64_t>;
		return std::bit_cast<T>(read<I>());
	}
	else if constexpr (SZ_BYTE == sizeof(T)) {
		return static_cast<T>(m_src[m_off++]);
	}
	else if constexpr (SZ_SHORT == sizeof(T)) {
		const uint32_t b0 = static_cast<uint8_t>(m_src[m_off++]);
		const uint32_t b1 = static_cast<uint8_t>(m_src[m_off++]);
		return static_cast<T>(static_cast<uint16_t>(m_little ? (b1 << 8 | b0) : (b0 << 8 | b1)));
	}
	else if constexpr (SZ_INT == sizeof(T)) {
		const uint32_t s0 = static_cast<uint16_t>(read<int16_t>());
		const uint32_t s1 = static_cast<uint16_t>(read<int16_t>());
		return static_cast<T>(m_little ? (s1 << 16 | s0) : (s0 << 16 | s1));
	}
	else {
		const uint64_t i0 = static_cast<uint32_t>(read<int32_t>());
		const uint64_t i1 = static_cast<uint32_t>(read<int32_t>());
		return static_cast<T>(m_little ? (i1 << 32 | i0) : (i0 << 32 | i1));
	}
}

//-------------------------------------------------------------------------------- WriteBuf
// NB: always writes big-endian and the message writer always sets byte 0 to zero, unlike
// ReadBuf which honours the declared order. Existing peers rely on this; keep it asymmetric.
class WriteBuf
{
	int8_t  *m_dst;
	uint64_t m_cap;
	uint64_t m_off{0};
	int8_t   m_ipc_ver;

	public:
		WriteBuf(void *dst, uint64_t cap, int8_t ipc_ver = MAX_IPC_VERSION);

		bool canWrite(uint64_t bytes) const { return m_off + bytes <= m_cap; }
		uint64_t offset() const { return m_off; }
		uint64_t remaining() const { return m_cap - m_off; }
		int8_t ipcVersion() const { return m_ipc_ver; }

		bool writeTyp(KdbType typ);
		bool writeAtt(KdbAttr att);
		bool writeHdr(KdbType typ, KdbAttr att, int32_t len);
		template<typename T> bool write(T val);
		bool writeRaw(const void *src, uint64_t len);
		bool writeSym(const std::string_view sv);
};

template<typename T>
bool WriteBuf::write(T val)
{
	static_assert(std::is_arithmetic<T>::value, "WriteBuf::write is for arithmetic types");

	if (!canWrite(sizeof(T)))
		return false;

	if constexpr (std::is_floating_point<T>::value) {
		using I = std::conditional_t<sizeof(T) == SZ_REAL, int32_t, int64_t>;
		return write<I>(std::bit_cast<I>(val));
	}
	else if constexpr (SZ_BYTE == sizeof(T)) {
		m_dst[m_off++] = static_cast<int8_t>(val);
	}
	else if constexpr (SZ_SHORT == sizeof(T)) {
		const uint16_t u = static_cast<uint16_t>(val);
		m_dst[m_off++] = static_cast<int8_t>(u >> 8);
		m_dst[m_off++] = static_cast<int8_t>(u & 0xff);
	}
	else if constexpr (SZ_INT == sizeof(T)) {
		const uint32_t u = static_cast<uint32_t>(val);
		write<int16_t>(static_cast<int16_t>(u >> 16));
		write<int16_t>(static_cast<int16_t>(u & 0xffff));
	}
	else {
		const uint64_t u = static_cast<uint64_t>(val);
		write<int32_t>(static_cast<int32_t>(u >> 32));
		write<int32_t>(static_cast<int32_t>(u & 0xffffffff));
	}
	return true;
}

//-------------------------------------------------------------------------------- KdbBase
struct KdbBase
{
	const KdbType m_typ;

	KdbBase(KdbType typ) : m_typ(typ) {}

	virtual ~KdbBase() = 0;
	virtual uint64_t count() const = 0;
	virtual uint64_t wireSz() const = 0;
	virtual ReadResult read(ReadBuf & buf) = 0;
	virtual WriteResult write(WriteBuf & buf) const = 0;
	// Bitwise for floating-point values, so that NaN nulls compare equal to themselves
	virtual bool equals(const KdbBase & rhs) const = 0;
};

inline bool operator==(const KdbBase & lhs, const KdbBase & rhs)
{
	return lhs.equals(rhs);
}

//-------------------------------------------------------------------------------- KdbScalar
// One template covers every fixed-width atom, the m_val type being the wire representation
template<KdbType TYP, typename E>
struct KdbScalar : public KdbBase
{
	constexpr static KdbType kdb_type = TYP;
	using value_type = E;

	E m_val;

	KdbScalar() : KdbBase(TYP), m_val{} {}
	KdbScalar(E val) : KdbBase(TYP), m_val(val) {}

	uint64_t count() const override { return -1; }
	uint64_t wireSz() const override { return SZ_BYTE + sizeof(E); }
	ReadResult read(ReadBuf & buf) override;
	WriteResult write(WriteBuf & buf) const override;
	bool equals(const KdbBase & rhs) const override;
};

using KdbBoolAtom      = KdbScalar<KdbType::BOOL_ATOM,      int8_t>;
using KdbGuidAtom      = KdbScalar<KdbType::GUID_ATOM,      GuidType>;
using KdbByteAtom      = KdbScalar<KdbType::BYTE_ATOM,      uint8_t>;
using KdbShortAtom     = KdbScalar<KdbType::SHORT_ATOM,     int16_t>;
using KdbIntAtom       = KdbScalar<KdbType::INT_ATOM,       int32_t>;
using KdbLongAtom      = KdbScalar<KdbType::LONG_ATOM,      int64_t>;
using KdbRealAtom      = KdbScalar<KdbType::REAL_ATOM,      float>;
using KdbFloatAtom     = KdbScalar<KdbType::FLOAT_ATOM,     double>;
using KdbCharAtom      = KdbScalar<KdbType::CHAR_ATOM,      char>;
using KdbTimestampAtom = KdbScalar<KdbType::TIMESTAMP_ATOM, int64_t>; // nanos since 2000.01.01
using KdbMonthAtom     = KdbScalar<KdbType::MONTH_ATOM,     int32_t>; // months since 2000.01
using KdbDateAtom      = KdbScalar<KdbType::DATE_ATOM,      int32_t>; // days since 2000.01.01
using KdbDatetimeAtom  = KdbScalar<KdbType::DATETIME_ATOM,  double>;  // fractional days since 2000.01.01
using KdbTimespanAtom  = KdbScalar<KdbType::TIMESPAN_ATOM,  int64_t>; // nanos
using KdbMinuteAtom    = KdbScalar<KdbType::MINUTE_ATOM,    int32_t>;
using KdbSecondAtom    = KdbScalar<KdbType::SECOND_ATOM,    int32_t>;
using KdbTimeAtom      = KdbScalar<KdbType::TIME_ATOM,      int32_t>; // millis

//-------------------------------------------------------------------------------- KdbSymbolAtom
struct KdbSymbolAtom : public KdbBase
{
	constexpr static KdbType kdb_type = KdbType::SYMBOL_ATOM;

	std::string m_val;

	KdbSymbolAtom() : KdbBase(kdb_type), m_val() {}
	KdbSymbolAtom(std::string_view val) : KdbBase(kdb_type), m_val(val) {}

	uint64_t count() const override { return -1; }
	uint64_t wireSz() const override { return SZ_BYTE + m_val.length() + SZ_BYTE; }
	ReadResult read(ReadBuf & buf) override;
	WriteResult write(WriteBuf & buf) const override;
	bool equals(const KdbBase & rhs) const override;
};

//-------------------------------------------------------------------------------- KdbException
struct KdbException : public KdbBase
{
	constexpr static KdbType kdb_type = KdbType::EXCEPTION;

	std::string m_msg;

	KdbException() : KdbException("") {}
	KdbException(std::string_view msg): KdbBase(kdb_type), m_msg(msg) {}

	uint64_t count() const override { return -1; }
	uint64_t wireSz() const override { return SZ_BYTE + m_msg.length() + SZ_BYTE; }
	ReadResult read(ReadBuf & buf) override;
	WriteResult write(WriteBuf & buf) const override;
	bool equals(const KdbBase & rhs) const override;
};

//-------------------------------------------------------------------------------- KdbVector
template<KdbType TYP, typename E>
struct KdbVector : public KdbBase
{
	constexpr static KdbType kdb_type = TYP;
	using value_type = E;

	KdbAttr        m_attr;
	std::vector<E> m_vec;

	KdbVector(uint64_t cap = 0, KdbAttr attr = KdbAttr::NONE)
	 : KdbBase(TYP)
	 , m_attr(attr)
	 , m_vec()
	{
		m_vec.reserve(cap);
	}

	KdbVector(std::vector<E> vals, KdbAttr attr = KdbAttr::NONE)
	 : KdbBase(TYP)
	 , m_attr(attr)
	 , m_vec(std::move(vals))
	{}

	uint64_t count() const override { return m_vec.size(); }
	uint64_t wireSz() const override { return SZ_VEC_HDR + m_vec.size() * sizeof(E); }
	void push(E val) { m_vec.push_back(val); }
	E get(uint64_t idx) const { return m_vec.at(idx); }
	ReadResult read(ReadBuf & buf) override;
	WriteResult write(WriteBuf & buf) const override;
	bool equals(const KdbBase & rhs) const override;
};

using KdbBoolVector      = KdbVector<KdbType::BOOL_VECTOR,      int8_t>;
using KdbGuidVector      = KdbVector<KdbType::GUID_VECTOR,      GuidType>;
using KdbByteVector      = KdbVector<KdbType::BYTE_VECTOR,      uint8_t>;
using KdbShortVector     = KdbVector<KdbType::SHORT_VECTOR,     int16_t>;
using KdbIntVector       = KdbVector<KdbType::INT_VECTOR,       int32_t>;
using KdbLongVector      = KdbVector<KdbType::LONG_VECTOR,      int64_t>;
using KdbRealVector      = KdbVector<KdbType::REAL_VECTOR,      float>;
using KdbFloatVector     = KdbVector<KdbType::FLOAT_VECTOR,     double>;
using KdbTimestampVector = KdbVector<KdbType::TIMESTAMP_VECTOR, int64_t>;
using KdbMonthVector     = KdbVector<KdbType::MONTH_VECTOR,     int32_t>;
using KdbDateVector      = KdbVector<KdbType::DATE_VECTOR,      int32_t>;
using KdbDatetimeVector  = KdbVector<KdbType::DATETIME_VECTOR,  double>;
using KdbTimespanVector  = KdbVector<KdbType::TIMESPAN_VECTOR,  int64_t>;
using KdbMinuteVector    = KdbVector<KdbType::MINUTE_VECTOR,    int32_t>;
using KdbSecondVector    = KdbVector<KdbType::SECOND_VECTOR,    int32_t>;
using KdbTimeVector      = KdbVector<KdbType::TIME_VECTOR,      int32_t>;

//-------------------------------------------------------------------------------- KdbCharVector
// A string that goes over the wire as a char-vector rather than a symbol; function names
// must be sent this way, column and table names as symbols.
struct KdbCharVector : public KdbBase
{
	constexpr static KdbType kdb_type = KdbType::CHAR_VECTOR;

	KdbAttr     m_attr;
	std::string m_str;

	KdbCharVector() : KdbBase(kdb_type), m_attr(KdbAttr::NONE), m_str() {}
	KdbCharVector(std::string_view str, KdbAttr attr = KdbAttr::NONE) : KdbBase(kdb_type), m_attr(attr), m_str(str) {}

	uint64_t count() const override { return m_str.size(); }
	std::string_view getString() const { return m_str; }
	uint64_t wireSz() const override { return SZ_VEC_HDR + m_str.size(); }
	ReadResult read(ReadBuf & buf) override;
	WriteResult write(WriteBuf & buf) const override;
	bool equals(const KdbBase & rhs) const override;
};

//-------------------------------------------------------------------------------- KdbSymbolVector
class KdbSymbolVector : public KdbBase
{
	KdbAttr                  m_attr;
	std::vector<std::string> m_vec;

public:
	constexpr static KdbType kdb_type = KdbType::SYMBOL_VECTOR;

	KdbSymbolVector(uint64_t cap = 0, KdbAttr attr = KdbAttr::NONE);
	KdbSymbolVector(const std::vector<std::string_view> & vals, KdbAttr attr = KdbAttr::NONE);

	uint64_t count() const override { return m_vec.size(); }
	KdbAttr attr() const { return m_attr; }
	std::string_view getString(uint64_t idx) const;
	int32_t indexOf(const std::string_view & sym) const;
	void push(const std::string_view & sym);
	uint64_t wireSz() const override;
	ReadResult read(ReadBuf & buf) override;
	WriteResult write(WriteBuf & buf) const override;
	bool equals(const KdbBase & rhs) const override;
};

//-------------------------------------------------------------------------------- KdbList/PtrRef
// A list element is either owned (read from the wire, or pushed as a unique_ptr) or borrowed
// from the caller, who must keep it alive for as long as the list is in use.
struct PtrRef
{
	const KdbBase *m_ptr;
	bool           m_own;

	PtrRef(const KdbBase & ref) : m_ptr(&ref), m_own(false) {}
	PtrRef(const KdbBase *ptr) : m_ptr(ptr), m_own(true) {}
	PtrRef(PtrRef && rhs) noexcept : m_ptr(rhs.m_ptr), m_own(rhs.m_own) { rhs.m_own = false; }
	PtrRef & operator=(PtrRef && rhs) noexcept;
	PtrRef(const PtrRef &) = delete;
	PtrRef & operator=(const PtrRef &) = delete;

	~PtrRef()
	{
		if (m_own && m_ptr) {
			delete m_ptr;
		}
	}
};

class KdbList : public KdbBase
{
	KdbAttr             m_attr;
	std::vector<PtrRef> m_vals;

public:
	constexpr static KdbType kdb_type = KdbType::LIST;

	KdbList(uint64_t cap = 0, KdbAttr attr = KdbAttr::NONE);

	uint64_t count() const override { return m_vals.size(); }
	void push(std::unique_ptr<KdbBase> val);
	void push(const KdbBase & val);
	void append(KdbList && rhs);
	const KdbBase* getObj(size_t idx) const;
	KdbType typeAt(size_t idx) const;
	uint64_t wireSz() const override;
	ReadResult read(ReadBuf & buf) override;
	WriteResult write(WriteBuf & buf) const override;
	bool equals(const KdbBase & rhs) const override;
};

//-------------------------------------------------------------------------------- KdbDict
struct KdbDict : public KdbBase
{
	constexpr static KdbType kdb_type = KdbType::DICT;

	std::unique_ptr<KdbBase> m_keys;
	std::unique_ptr<KdbBase> m_vals;

	KdbDict() : KdbBase(kdb_type), m_keys{}, m_vals{} {}
	KdbDict(std::unique_ptr<KdbBase> keys, std::unique_ptr<KdbBase> vals);

	uint64_t count() const override;
	uint64_t wireSz() const override;
	const KdbBase* getKeys() const { return m_keys.get(); }
	const KdbBase* getValues() const { return m_vals.get(); }
	ReadResult read(ReadBuf & buf) override;
	WriteResult write(WriteBuf & buf) const override;
	bool equals(const KdbBase & rhs) const override;
};

//-------------------------------------------------------------------------------- KdbTable
template <typename T>
concept KdbColCapable =
	std::is_base_of<KdbBase, T>::value &&
	static_cast<int>(T::kdb_type) <= static_cast<int>(KdbType::TIME_VECTOR) &&
	static_cast<int>(T::kdb_type) >= static_cast<int>(KdbType::LIST);

class KdbTable : public KdbBase
{
	std::unique_ptr<KdbSymbolVector> m_cols;
	std::unique_ptr<KdbList>         m_vals;

	void validate() const;

public:
	constexpr static KdbType kdb_type = KdbType::TABLE;

	KdbTable() : KdbBase(kdb_type), m_cols(), m_vals() {}
	KdbTable(std::unique_ptr<KdbSymbolVector> cols, std::unique_ptr<KdbList> vals);
	// Borrows the columns, which must outlive the table
	template <KdbColCapable ...T> KdbTable(const std::vector<std::string_view> & names, T & ... cols);

	// Flattens a keyed table, i.e. a dictionary of two tables, into a single table whose
	// columns are the key columns followed by the value columns. An unkeyed table is
	// returned as is.
	static std::unique_ptr<KdbTable> unkey(std::unique_ptr<KdbBase> obj);

	uint64_t count() const override;
	const KdbSymbolVector* key() const { return m_cols.get(); }
	const KdbList* value() const { return m_vals.get(); }
	const KdbBase* column(std::string_view name) const;
	uint64_t wireSz() const override;
	ReadResult read(ReadBuf & buf) override;
	WriteResult write(WriteBuf & buf) const override;
	bool equals(const KdbBase & rhs) const override;
};

template <KdbColCapable ...T>
KdbTable::KdbTable(const std::vector<std::string_view> & names, T & ... cols)
 : KdbBase(kdb_type)
 , m_cols(std::make_unique<KdbSymbolVector>(names))
 , m_vals(std::make_unique<KdbList>(sizeof...(cols)))
{
	(m_vals->push(cols), ...);
	validate();
}

//-------------------------------------------------------------------------------- KdbFunction
// Covers type-codes 100 through 112. Nothing is evaluated locally, but the structure is
// kept so the bytes are consumed exactly and the value can be written back unchanged:
//   100      context symbol then a body (usually the source as a char-vector)
//   101-103  a single byte identifying the primitive
//   104-105  an int count then that many objects
//   106-112  one object
class KdbFunction : public KdbBase
{
	std::string                           m_ctx;
	uint8_t                               m_byte{0};
	std::vector<std::unique_ptr<KdbBase>> m_args;

public:
	constexpr static KdbType kdb_type = KdbType::FUNCTION;

	explicit KdbFunction(KdbType typ);
	KdbFunction(KdbType typ, uint8_t val);

	static std::unique_ptr<KdbFunction> lambda(std::string_view src, std::string_view ctx = "");

	// The generic null, i.e. (::)
	bool isIdentity() const { return KdbType::UNARY_PRIMITIVE == m_typ && 0 == m_byte; }
	std::string_view context() const { return m_ctx; }
	uint8_t primitive() const { return m_byte; }
	size_t argCount() const { return m_args.size(); }
	const KdbBase* getArg(size_t idx) const { return m_args.at(idx).get(); }

	uint64_t count() const override { return -1; }
	uint64_t wireSz() const override;
	ReadResult read(ReadBuf & buf) override;
	WriteResult write(WriteBuf & buf) const override;
	bool equals(const KdbBase & rhs) const override;
};

//-------------------------------------------------------------------------------- Construction
std::unique_ptr<KdbBase> newInstance(int8_t typ);

// Decodes one object of any type from 'buf'; 'out' is only set when the result is RD_OK
ReadResult readObject(ReadBuf & buf, std::unique_ptr<KdbBase> & out);

// The canonical null atom for each of the one-letter type chars in " bg xhijefcspmdznuvt";
// throws std::invalid_argument for any other char
std::unique_ptr<KdbBase> nullOf(char typ);

inline uint64_t sizeOf(const KdbBase & obj) { return obj.wireSz(); }

inline int8_t typeCode(const KdbBase & obj) { return static_cast<int8_t>(obj.m_typ); }

//-------------------------------------------------------------------------------- Host types
template <typename T>
concept KdbStringLike = std::convertible_to<T, std::string_view>;

template <typename T>
concept KdbTyped = std::derived_from<T, KdbBase> && requires { T::kdb_type; };

// Maps a host type to the wire type it is sent as; anything unrecognised maps to the general list
template <typename T>
constexpr KdbType kdbTypeOf()
{
	using U = std::remove_cvref_t<T>;
	if constexpr (KdbTyped<U>)                          return U::kdb_type;
	else if constexpr (std::same_as<U, bool>)           return KdbType::BOOL_ATOM;
	else if constexpr (std::same_as<U, char>)           return KdbType::CHAR_ATOM;
	else if constexpr (std::same_as<U, int8_t>)         return KdbType::BYTE_ATOM;
	else if constexpr (std::same_as<U, uint8_t>)        return KdbType::BYTE_ATOM;
	else if constexpr (std::same_as<U, int16_t>)        return KdbType::SHORT_ATOM;
	else if constexpr (std::same_as<U, int32_t>)        return KdbType::INT_ATOM;
	else if constexpr (std::signed_integral<U> && SZ_LONG == sizeof(U)) return KdbType::LONG_ATOM;
	else if constexpr (std::same_as<U, float>)          return KdbType::REAL_ATOM;
	else if constexpr (std::same_as<U, double>)         return KdbType::FLOAT_ATOM;
	else if constexpr (KdbStringLike<U>)                return KdbType::SYMBOL_ATOM;
	else                                                return KdbType::LIST;
}

template <typename T>
constexpr int8_t typeCode() { return static_cast<int8_t>(kdbTypeOf<T>()); }

template <typename T>
concept KdbHostAtom = !std::derived_from<std::remove_cvref_t<T>, KdbBase> && KdbType::LIST != kdbTypeOf<T>();

// Strings become symbols: wrap them in a KdbCharVector to send a char-vector instead
template <KdbHostAtom T>
std::unique_ptr<KdbBase> toKdb(T && val)
{
	constexpr KdbType typ = kdbTypeOf<T>();
	if constexpr (KdbType::SYMBOL_ATOM == typ)      return std::make_unique<KdbSymbolAtom>(std::string_view{val});
	else if constexpr (KdbType::BOOL_ATOM == typ)   return std::make_unique<KdbBoolAtom>(static_cast<int8_t>(val ? 1 : 0));
	else if constexpr (KdbType::CHAR_ATOM == typ)   return std::make_unique<KdbCharAtom>(val);
	else if constexpr (KdbType::BYTE_ATOM == typ)   return std::make_unique<KdbByteAtom>(static_cast<uint8_t>(val));
	else if constexpr (KdbType::SHORT_ATOM == typ)  return std::make_unique<KdbShortAtom>(val);
	else if constexpr (KdbType::INT_ATOM == typ)    return std::make_unique<KdbIntAtom>(val);
	else if constexpr (KdbType::LONG_ATOM == typ)   return std::make_unique<KdbLongAtom>(static_cast<int64_t>(val));
	else if constexpr (KdbType::REAL_ATOM == typ)   return std::make_unique<KdbRealAtom>(val);
	else                                            return std::make_unique<KdbFloatAtom>(val);
}

//-------------------------------------------------------------------------------- extern templates
extern template struct KdbScalar<KdbType::BOOL_ATOM,      int8_t>;
extern template struct KdbScalar<KdbType::GUID_ATOM,      GuidType>;
extern template struct KdbScalar<KdbType::BYTE_ATOM,      uint8_t>;
extern template struct KdbScalar<KdbType::SHORT_ATOM,     int16_t>;
extern template struct KdbScalar<KdbType::INT_ATOM,       int32_t>;
extern template struct KdbScalar<KdbType::LONG_ATOM,      int64_t>;
extern template struct KdbScalar<KdbType::REAL_ATOM,      float>;
extern template struct KdbScalar<KdbType::FLOAT_ATOM,     double>;
extern template struct KdbScalar<KdbType::CHAR_ATOM,      char>;
extern template struct KdbScalar<KdbType::TIMESTAMP_ATOM, int64_t>;
extern template struct KdbScalar<KdbType::MONTH_ATOM,     int32_t>;
extern template struct KdbScalar<KdbType::DATE_ATOM,      int32_t>;
extern template struct KdbScalar<KdbType::DATETIME_ATOM,  double>;
extern template struct KdbScalar<KdbType::TIMESPAN_ATOM,  int64_t>;
extern template struct KdbScalar<KdbType::MINUTE_ATOM,    int32_t>;
extern template struct KdbScalar<KdbType::SECOND_ATOM,    int32_t>;
extern template struct KdbScalar<KdbType::TIME_ATOM,      int32_t>;

extern template struct KdbVector<KdbType::BOOL_VECTOR,      int8_t>;
extern template struct KdbVector<KdbType::GUID_VECTOR,      GuidType>;
extern template struct KdbVector<KdbType::BYTE_VECTOR,      uint8_t>;
extern template struct KdbVector<KdbType::SHORT_VECTOR,     int16_t>;
extern template struct KdbVector<KdbType::INT_VECTOR,       int32_t>;
extern template struct KdbVector<KdbType::LONG_VECTOR,      int64_t>;
extern template struct KdbVector<KdbType::REAL_VECTOR,      float>;
extern template struct KdbVector<KdbType::FLOAT_VECTOR,     double>;
extern template struct KdbVector<KdbType::TIMESTAMP_VECTOR, int64_t>;
extern template struct KdbVector<KdbType::MONTH_VECTOR,     int32_t>;
extern template struct KdbVector<KdbType::DATE_VECTOR,      int32_t>;
extern template struct KdbVector<KdbType::DATETIME_VECTOR,  double>;
extern template struct KdbVector<KdbType::TIMESPAN_VECTOR,  int64_t>;
extern template struct KdbVector<KdbType::MINUTE_VECTOR,    int32_t>;
extern template struct KdbVector<KdbType::SECOND_VECTOR,    int32_t>;
extern template struct KdbVector<KdbType::TIME_VECTOR,      int32_t>;

} // end namespace kxc

#endif // defined __kxc_KdbType__H__
