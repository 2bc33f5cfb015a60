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

#include "kxc/KdbType.h"
#include "kxc/KdbErrors.h"
#include "kxc/kxc_fmt_defs.h"

#include <algorithm>
#include <format>
#include <stdexcept>
#include <tuple>
#include <string.h> // memchr

namespace kxc {

//--------------------------------------------------------------------------------------- ReadBuf
ReadBuf::ReadBuf(const int8_t *src, uint64_t len, bool little)
 : m_src(src)
 , m_len(len)
 , m_little(little)
{}

void ReadBuf::readRaw(void *dst, uint64_t len)
{
	memcpy(dst, m_src + m_off, len);
	m_off += len;
}

ReadResult ReadBuf::readSym(std::string & str)
{
	const uint64_t rem = remaining();
	if (0 == rem)
		return ReadResult::RD_INCOMPLETE;

	const char *src = reinterpret_cast<const char*>(m_src + m_off);
	const void *end = memchr(src, 0, rem);
	if (nullptr == end)
		return ReadResult::RD_INCOMPLETE;

	const size_t str_len = static_cast<const char*>(end) - src;
	str.assign(src, str_len);
	m_off += str_len + SZ_BYTE;
	return ReadResult::RD_OK;
}

//--------------------------------------------------------------------------------------- WriteBuf
WriteBuf::WriteBuf(void *dst, uint64_t cap, int8_t ipc_ver)
 : m_dst(static_cast<int8_t*>(dst))
 , m_cap(cap)
 , m_ipc_ver(ipc_ver)
{}

bool WriteBuf::writeTyp(KdbType typ)
{
	return write<int8_t>(static_cast<int8_t>(typ));
}

bool WriteBuf::writeAtt(KdbAttr att)
{
	return write<int8_t>(static_cast<int8_t>(att));
}

bool WriteBuf::writeHdr(KdbType typ, KdbAttr att, int32_t len)
{
	if (!canWrite(SZ_VEC_HDR))
		return false;
	writeTyp(typ);
	writeAtt(att);
	write<int32_t>(len);
	return true;
}

bool WriteBuf::writeRaw(const void *src, uint64_t len)
{
	if (!canWrite(len))
		return false;
	memcpy(m_dst + m_off, src, len);
	m_off += len;
	return true;
}

bool WriteBuf::writeSym(const std::string_view sv)
{
	if (std::string_view::npos != sv.find('\0'))
		throw KdbEncodingError(std::format("Symbol contains an embedded null: '{}'", sv.substr(0, sv.find('\0'))));

	if (!canWrite(sv.length() + SZ_BYTE))
		return false;

	writeRaw(sv.data(), sv.length());
	m_dst[m_off++] = 0;
	return true;
}

//--------------------------------------------------------------------------------------- helpers
// Guids need a v3 peer, timestamps and timespans v1 (kdb+ 2.6)
static void checkWireVersion(KdbType typ, const WriteBuf & buf)
{
	switch (typ) {
		case KdbType::GUID_ATOM:
		case KdbType::GUID_VECTOR:
			if (buf.ipcVersion() < 3)
				throw KdbProtocolError("Guid not valid pre kdb+3.0");
			break;
		case KdbType::TIMESTAMP_ATOM:
		case KdbType::TIMESTAMP_VECTOR:
			if (buf.ipcVersion() < 1)
				throw KdbProtocolError("Timestamp not valid pre kdb+2.6");
			break;
		case KdbType::TIMESPAN_ATOM:
		case KdbType::TIMESPAN_VECTOR:
			if (buf.ipcVersion() < 1)
				throw KdbProtocolError("Timespan not valid pre kdb+2.6");
			break;
		default:
			break;
	}
}

template<typename E>
static E readElement(ReadBuf & buf)
{
	if constexpr (std::is_same<E, GuidType>::value) {
		GuidType val;
		buf.readRaw(val.data(), val.size());
		return val;
	}
	else {
		return buf.read<E>();
	}
}

template<typename E>
static void writeElement(WriteBuf & buf, const E & val)
{
	if constexpr (std::is_same<E, GuidType>::value) {
		buf.writeRaw(val.data(), val.size());
	}
	else {
		buf.write<E>(val);
	}
}

// Floating-point values compare by bit-pattern so that nulls and infinities compare as stored
template<typename E>
static bool sameBits(const E & lhs, const E & rhs)
{
	if constexpr (std::is_floating_point<E>::value) {
		using I = std::conditional_t<sizeof(E) == SZ_REAL, uint32_t, uint64_t>;
		return std::bit_cast<I>(lhs) == std::bit_cast<I>(rhs);
	}
	else {
		return lhs == rhs;
	}
}

// Reads the attribute byte and count common to every vector-like type
static ReadResult readVecMeta(ReadBuf & buf, KdbAttr & attr, int32_t & len)
{
	if (!buf.canRead(SZ_VEC_META))
		return ReadResult::RD_INCOMPLETE;
	attr = static_cast<KdbAttr>(buf.read<int8_t>());
	len = buf.read<int32_t>();
	return len < 0 ? ReadResult::RD_ERR_IPC : ReadResult::RD_OK;
}

//-------------------------------------------------------------------------------- KdbBase
KdbBase::~KdbBase()
{
}

//-------------------------------------------------------------------------------- KdbScalar
template<KdbType TYP, typename E>
ReadResult KdbScalar<TYP,E>::read(ReadBuf & buf)
{
	if (!buf.canRead(sizeof(E)))
		return ReadResult::RD_INCOMPLETE;
	m_val = readElement<E>(buf);
	return ReadResult::RD_OK;
}

template<KdbType TYP, typename E>
WriteResult KdbScalar<TYP,E>::write(WriteBuf & buf) const
{
	checkWireVersion(TYP, buf);
	if (!buf.canWrite(wireSz()))
		return WriteResult::WR_INCOMPLETE;
	buf.writeTyp(TYP);
	writeElement<E>(buf, m_val);
	return WriteResult::WR_OK;
}

template<KdbType TYP, typename E>
bool KdbScalar<TYP,E>::equals(const KdbBase & rhs) const
{
	if (rhs.m_typ != m_typ)
		return false;
	return sameBits(m_val, static_cast<const KdbScalar<TYP,E>&>(rhs).m_val);
}

//-------------------------------------------------------------------------------- KdbSymbolAtom
ReadResult KdbSymbolAtom::read(ReadBuf & buf)
{
	return buf.readSym(m_val);
}

WriteResult KdbSymbolAtom::write(WriteBuf & buf) const
{
	if (!buf.canWrite(wireSz()))
		return WriteResult::WR_INCOMPLETE;
	buf.writeTyp(m_typ);
	buf.writeSym(m_val);
	return WriteResult::WR_OK;
}

bool KdbSymbolAtom::equals(const KdbBase & rhs) const
{
	return rhs.m_typ == m_typ && static_cast<const KdbSymbolAtom&>(rhs).m_val == m_val;
}

//-------------------------------------------------------------------------------- KdbException
ReadResult KdbException::read(ReadBuf & buf)
{
	return buf.readSym(m_msg);
}

WriteResult KdbException::write(WriteBuf & buf) const
{
	if (!buf.canWrite(wireSz()))
		return WriteResult::WR_INCOMPLETE;
	buf.writeTyp(m_typ);
	buf.writeSym(m_msg);
	return WriteResult::WR_OK;
}

bool KdbException::equals(const KdbBase & rhs) const
{
	return rhs.m_typ == m_typ && static_cast<const KdbException&>(rhs).m_msg == m_msg;
}

//-------------------------------------------------------------------------------- KdbVector
template<KdbType TYP, typename E>
ReadResult KdbVector<TYP,E>::read(ReadBuf & buf)
{
	int32_t len;
	if (ReadResult rr = readVecMeta(buf, m_attr, len); ReadResult::RD_OK != rr)
		return rr;

	if (!buf.canRead(static_cast<uint64_t>(len) * sizeof(E)))
		return ReadResult::RD_INCOMPLETE;

	m_vec.clear();
	m_vec.reserve(len);
	for (int32_t i = 0 ; i < len ; i++) {
		m_vec.push_back(readElement<E>(buf));
	}
	return ReadResult::RD_OK;
}

template<KdbType TYP, typename E>
WriteResult KdbVector<TYP,E>::write(WriteBuf & buf) const
{
	checkWireVersion(TYP, buf);
	if (!buf.canWrite(wireSz()))
		return WriteResult::WR_INCOMPLETE;

	buf.writeHdr(TYP, m_attr, static_cast<int32_t>(m_vec.size()));
	for (const E & val : m_vec) {
		writeElement<E>(buf, val);
	}
	return WriteResult::WR_OK;
}

template<KdbType TYP, typename E>
bool KdbVector<TYP,E>::equals(const KdbBase & rhs) const
{
	if (rhs.m_typ != m_typ)
		return false;
	const auto & vec = static_cast<const KdbVector<TYP,E>&>(rhs);
	if (vec.m_attr != m_attr || vec.m_vec.size() != m_vec.size())
		return false;
	for (size_t i = 0 ; i < m_vec.size() ; i++) {
		if (!sameBits(m_vec[i], vec.m_vec[i]))
			return false;
	}
	return true;
}

//-------------------------------------------------------------------------------- KdbCharVector
ReadResult KdbCharVector::read(ReadBuf & buf)
{
	int32_t len;
	if (ReadResult rr = readVecMeta(buf, m_attr, len); ReadResult::RD_OK != rr)
		return rr;

	if (!buf.canRead(len))
		return ReadResult::RD_INCOMPLETE;

	m_str.resize(len);
	buf.readRaw(m_str.data(), len);
	return ReadResult::RD_OK;
}

WriteResult KdbCharVector::write(WriteBuf & buf) const
{
	if (!buf.canWrite(wireSz()))
		return WriteResult::WR_INCOMPLETE;
	buf.writeHdr(m_typ, m_attr, static_cast<int32_t>(m_str.size()));
	buf.writeRaw(m_str.data(), m_str.size());
	return WriteResult::WR_OK;
}

bool KdbCharVector::equals(const KdbBase & rhs) const
{
	if (rhs.m_typ != m_typ)
		return false;
	const auto & cv = static_cast<const KdbCharVector&>(rhs);
	return cv.m_attr == m_attr && cv.m_str == m_str;
}

//-------------------------------------------------------------------------------- KdbSymbolVector
KdbSymbolVector::KdbSymbolVector(uint64_t cap, KdbAttr attr)
 : KdbBase(kdb_type)
 , m_attr(attr)
 , m_vec()
{
	m_vec.reserve(cap);
}

KdbSymbolVector::KdbSymbolVector(const std::vector<std::string_view> & vals, KdbAttr attr)
 : KdbSymbolVector(vals.size(), attr)
{
	for (const auto & sv : vals) {
		m_vec.emplace_back(sv);
	}
}

std::string_view KdbSymbolVector::getString(uint64_t idx) const
{
	return m_vec.at(idx);
}

int32_t KdbSymbolVector::indexOf(const std::string_view & sym) const
{
	for (size_t i = 0 ; i < m_vec.size() ; i++) {
		if (sym == m_vec[i])
			return static_cast<int32_t>(i);
	}
	return -1;
}

void KdbSymbolVector::push(const std::string_view & sym)
{
	m_vec.emplace_back(sym);
}

uint64_t KdbSymbolVector::wireSz() const
{
	uint64_t sz = SZ_VEC_HDR;
	for (const auto & sym : m_vec) {
		sz += sym.length() + SZ_BYTE;
	}
	return sz;
}

ReadResult KdbSymbolVector::read(ReadBuf & buf)
{
	int32_t len;
	if (ReadResult rr = readVecMeta(buf, m_attr, len); ReadResult::RD_OK != rr)
		return rr;

	// every symbol needs at least its terminator
	if (!buf.canRead(len))
		return ReadResult::RD_INCOMPLETE;

	m_vec.clear();
	m_vec.reserve(len);
	for (int32_t i = 0 ; i < len ; i++) {
		std::string sym;
		if (ReadResult rr = buf.readSym(sym); ReadResult::RD_OK != rr)
			return rr;
		m_vec.push_back(std::move(sym));
	}
	return ReadResult::RD_OK;
}

WriteResult KdbSymbolVector::write(WriteBuf & buf) const
{
	if (!buf.canWrite(wireSz()))
		return WriteResult::WR_INCOMPLETE;
	buf.writeHdr(m_typ, m_attr, static_cast<int32_t>(m_vec.size()));
	for (const auto & sym : m_vec) {
		buf.writeSym(sym);
	}
	return WriteResult::WR_OK;
}

bool KdbSymbolVector::equals(const KdbBase & rhs) const
{
	if (rhs.m_typ != m_typ)
		return false;
	const auto & sv = static_cast<const KdbSymbolVector&>(rhs);
	return sv.m_attr == m_attr && sv.m_vec == m_vec;
}

//-------------------------------------------------------------------------------- PtrRef
PtrRef & PtrRef::operator=(PtrRef && rhs) noexcept
{
	if (this != &rhs) {
		if (m_own && m_ptr)
			delete m_ptr;
		m_ptr = rhs.m_ptr;
		m_own = rhs.m_own;
		rhs.m_own = false;
	}
	return *this;
}

//-------------------------------------------------------------------------------- KdbList
KdbList::KdbList(uint64_t cap, KdbAttr attr)
 : KdbBase(kdb_type)
 , m_attr(attr)
 , m_vals()
{
	m_vals.reserve(cap);
}

void KdbList::push(std::unique_ptr<KdbBase> val)
{
	m_vals.emplace_back(val.release());
}

void KdbList::push(const KdbBase & val)
{
	m_vals.emplace_back(val);
}

void KdbList::append(KdbList && rhs)
{
	m_vals.reserve(m_vals.size() + rhs.m_vals.size());
	for (auto & ref : rhs.m_vals) {
		m_vals.push_back(std::move(ref));
	}
	rhs.m_vals.clear();
}

const KdbBase* KdbList::getObj(size_t idx) const
{
	return m_vals.at(idx).m_ptr;
}

KdbType KdbList::typeAt(size_t idx) const
{
	return m_vals.at(idx).m_ptr->m_typ;
}

uint64_t KdbList::wireSz() const
{
	uint64_t sz = SZ_VEC_HDR;
	for (size_t i = 0 ; i < m_vals.size() ; i++) {
		sz += m_vals[i].m_ptr->wireSz();
	}
	return sz;
}

ReadResult KdbList::read(ReadBuf & buf)
{
	int32_t len;
	if (ReadResult rr = readVecMeta(buf, m_attr, len); ReadResult::RD_OK != rr)
		return rr;

	// every item needs at least its type byte
	if (!buf.canRead(len))
		return ReadResult::RD_INCOMPLETE;

	m_vals.clear();
	m_vals.reserve(len);
	for (int32_t i = 0 ; i < len ; i++) {
		std::unique_ptr<KdbBase> obj;
		if (ReadResult rr = readObject(buf, obj); ReadResult::RD_OK != rr)
			return rr;
		push(std::move(obj));
	}
	return ReadResult::RD_OK;
}

WriteResult KdbList::write(WriteBuf & buf) const
{
	if (!buf.writeHdr(m_typ, m_attr, static_cast<int32_t>(m_vals.size())))
		return WriteResult::WR_INCOMPLETE;

	for (size_t i = 0 ; i < m_vals.size() ; i++) {
		WriteResult wr = m_vals[i].m_ptr->write(buf);
		if (WriteResult::WR_OK != wr)
			return wr;
	}
	return WriteResult::WR_OK;
}

bool KdbList::equals(const KdbBase & rhs) const
{
	if (rhs.m_typ != m_typ)
		return false;
	const auto & lst = static_cast<const KdbList&>(rhs);
	if (lst.m_attr != m_attr || lst.m_vals.size() != m_vals.size())
		return false;
	for (size_t i = 0 ; i < m_vals.size() ; i++) {
		if (!m_vals[i].m_ptr->equals(*lst.m_vals[i].m_ptr))
			return false;
	}
	return true;
}

//-------------------------------------------------------------------------------- KdbDict
KdbDict::KdbDict(std::unique_ptr<KdbBase> keys, std::unique_ptr<KdbBase> vals)
 : KdbBase(kdb_type)
 , m_keys(std::move(keys))
 , m_vals(std::move(vals))
{
	if (!m_keys || !m_vals)
		throw std::invalid_argument("Dictionary keys and values must both be present");
	if (m_keys->count() != m_vals->count())
		throw std::invalid_argument(std::format("Dictionary length mismatch: {} keys, {} values",
			static_cast<int64_t>(m_keys->count()), static_cast<int64_t>(m_vals->count())));
}

uint64_t KdbDict::count() const
{
	return !m_keys ? 0 : m_keys->count();
}

uint64_t KdbDict::wireSz() const
{
	return SZ_BYTE + m_keys->wireSz() + m_vals->wireSz();
}

ReadResult KdbDict::read(ReadBuf & buf)
{
	if (ReadResult rr = readObject(buf, m_keys); ReadResult::RD_OK != rr)
		return rr;
	return readObject(buf, m_vals);
}

WriteResult KdbDict::write(WriteBuf & buf) const
{
	if (!buf.writeTyp(m_typ))
		return WriteResult::WR_INCOMPLETE;
	if (WriteResult wr = m_keys->write(buf); WriteResult::WR_OK != wr)
		return wr;
	return m_vals->write(buf);
}

bool KdbDict::equals(const KdbBase & rhs) const
{
	if (rhs.m_typ != m_typ)
		return false;
	const auto & dct = static_cast<const KdbDict&>(rhs);
	if (!m_keys || !dct.m_keys || !m_vals || !dct.m_vals)
		return false;
	return m_keys->equals(*dct.m_keys) && m_vals->equals(*dct.m_vals);
}

//-------------------------------------------------------------------------------- KdbTable
KdbTable::KdbTable(std::unique_ptr<KdbSymbolVector> cols, std::unique_ptr<KdbList> vals)
 : KdbBase(kdb_type)
 , m_cols(std::move(cols))
 , m_vals(std::move(vals))
{
	validate();
}

void KdbTable::validate() const
{
	if (!m_cols || !m_vals)
		throw std::invalid_argument("Table requires column names and values");
	if (m_cols->count() != m_vals->count())
		throw std::invalid_argument(std::format("Table has {} names but {} columns", m_cols->count(), m_vals->count()));
	if (0 == m_vals->count())
		return;

	const uint64_t rows = m_vals->getObj(0)->count();
	for (size_t i = 0 ; i < m_vals->count() ; i++) {
		const KdbBase *col = m_vals->getObj(i);
		const int typ = static_cast<int>(col->m_typ);
		if (typ < 0 || typ > static_cast<int>(KdbType::TIME_VECTOR))
			throw std::invalid_argument(std::format("Column '{}' is not a vector", m_cols->getString(i)));
		if (col->count() != rows)
			throw std::invalid_argument(std::format("Column '{}' has length {}, expected {}", m_cols->getString(i), col->count(), rows));
	}
}

std::unique_ptr<KdbTable> KdbTable::unkey(std::unique_ptr<KdbBase> obj)
{
	if (!obj)
		throw std::invalid_argument("Cannot unkey a null object");

	if (KdbType::TABLE == obj->m_typ)
		return std::unique_ptr<KdbTable>(static_cast<KdbTable*>(obj.release()));

	if (KdbType::DICT != obj->m_typ)
		throw std::invalid_argument(std::format("Cannot unkey an object of type {}", typeCode(*obj)));

	KdbDict & dct = static_cast<KdbDict&>(*obj);
	if (!dct.m_keys || !dct.m_vals || KdbType::TABLE != dct.m_keys->m_typ || KdbType::TABLE != dct.m_vals->m_typ)
		throw std::invalid_argument("A keyed table is a dictionary of two tables");

	KdbTable & key = static_cast<KdbTable&>(*dct.m_keys);
	KdbTable & val = static_cast<KdbTable&>(*dct.m_vals);

	auto cols = std::make_unique<KdbSymbolVector>(key.m_cols->count() + val.m_cols->count());
	for (uint64_t i = 0 ; i < key.m_cols->count() ; i++)
		cols->push(key.m_cols->getString(i));
	for (uint64_t i = 0 ; i < val.m_cols->count() ; i++)
		cols->push(val.m_cols->getString(i));

	auto vals = std::make_unique<KdbList>(cols->count());
	vals->append(std::move(*key.m_vals));
	vals->append(std::move(*val.m_vals));

	return std::make_unique<KdbTable>(std::move(cols), std::move(vals));
}

uint64_t KdbTable::count() const
{
	if (!m_vals || 0 == m_vals->count())
		return 0;
	return m_vals->getObj(0)->count();
}

const KdbBase* KdbTable::column(std::string_view name) const
{
	if (!m_cols)
		return nullptr;
	const int32_t idx = m_cols->indexOf(name);
	return idx < 0 ? nullptr : m_vals->getObj(idx);
}

uint64_t KdbTable::wireSz() const
{
	return SZ_BYTE + SZ_BYTE + SZ_BYTE + m_cols->wireSz() + m_vals->wireSz();
}

ReadResult KdbTable::read(ReadBuf & buf)
{
	if (!buf.canRead(SZ_BYTE + SZ_BYTE))
		return ReadResult::RD_INCOMPLETE;

	std::ignore = buf.read<int8_t>(); // attr
	if (KdbType::DICT != static_cast<KdbType>(buf.read<int8_t>()))
		return ReadResult::RD_ERR_IPC;

	std::unique_ptr<KdbBase> obj;
	if (ReadResult rr = readObject(buf, obj); ReadResult::RD_OK != rr)
		return rr;
	if (KdbType::SYMBOL_VECTOR != obj->m_typ)
		return ReadResult::RD_ERR_IPC;
	m_cols.reset(static_cast<KdbSymbolVector*>(obj.release()));

	if (ReadResult rr = readObject(buf, obj); ReadResult::RD_OK != rr)
		return rr;
	if (KdbType::LIST != obj->m_typ)
		return ReadResult::RD_ERR_IPC;
	m_vals.reset(static_cast<KdbList*>(obj.release()));

	return m_cols->count() == m_vals->count() ? ReadResult::RD_OK : ReadResult::RD_ERR_IPC;
}

WriteResult KdbTable::write(WriteBuf & buf) const
{
	if (!buf.canWrite(SZ_BYTE + SZ_BYTE + SZ_BYTE))
		return WriteResult::WR_INCOMPLETE;
	buf.writeTyp(m_typ);
	buf.writeAtt(KdbAttr::NONE);
	buf.writeTyp(KdbType::DICT);

	if (WriteResult wr = m_cols->write(buf); WriteResult::WR_OK != wr)
		return wr;
	return m_vals->write(buf);
}

bool KdbTable::equals(const KdbBase & rhs) const
{
	if (rhs.m_typ != m_typ)
		return false;
	const auto & tbl = static_cast<const KdbTable&>(rhs);
	if (!m_cols || !tbl.m_cols)
		return !m_cols && !tbl.m_cols;
	return m_cols->equals(*tbl.m_cols) && m_vals->equals(*tbl.m_vals);
}

//-------------------------------------------------------------------------------- KdbFunction
static bool isFunctionType(KdbType typ)
{
	const int val = static_cast<int>(typ);
	return val >= static_cast<int>(KdbType::FUNCTION) && val <= static_cast<int>(KdbType::DYNAMIC_LOAD);
}

KdbFunction::KdbFunction(KdbType typ)
 : KdbBase(typ)
{
	if (!isFunctionType(typ))
		throw std::invalid_argument(std::format("Not a function type: {}", static_cast<int>(typ)));
}

KdbFunction::KdbFunction(KdbType typ, uint8_t val)
 : KdbFunction(typ)
{
	m_byte = val;
}

std::unique_ptr<KdbFunction> KdbFunction::lambda(std::string_view src, std::string_view ctx)
{
	auto fn = std::make_unique<KdbFunction>(KdbType::FUNCTION);
	fn->m_ctx = ctx;
	fn->m_args.push_back(std::make_unique<KdbCharVector>(src));
	return fn;
}

uint64_t KdbFunction::wireSz() const
{
	uint64_t sz = SZ_BYTE;
	switch (m_typ) {
		case KdbType::FUNCTION:
			sz += m_ctx.length() + SZ_BYTE;
			break;
		case KdbType::UNARY_PRIMITIVE:
		case KdbType::BINARY_PRIMITIVE:
		case KdbType::TERNARY_PRIMITIVE:
			return sz + SZ_BYTE;
		case KdbType::PROJECTION:
		case KdbType::COMPOSITION:
			sz += SZ_INT;
			break;
		default:
			break;
	}
	for (const auto & arg : m_args) {
		sz += arg->wireSz();
	}
	return sz;
}

ReadResult KdbFunction::read(ReadBuf & buf)
{
	int32_t cnt = 1;
	switch (m_typ) {
		case KdbType::FUNCTION:
			if (ReadResult rr = buf.readSym(m_ctx); ReadResult::RD_OK != rr)
				return rr;
			break;
		case KdbType::UNARY_PRIMITIVE:
		case KdbType::BINARY_PRIMITIVE:
		case KdbType::TERNARY_PRIMITIVE:
			if (!buf.canRead(SZ_BYTE))
				return ReadResult::RD_INCOMPLETE;
			m_byte = buf.read<uint8_t>();
			return ReadResult::RD_OK;
		case KdbType::PROJECTION:
		case KdbType::COMPOSITION:
			if (!buf.canRead(SZ_INT))
				return ReadResult::RD_INCOMPLETE;
			cnt = buf.read<int32_t>();
			if (cnt < 0)
				return ReadResult::RD_ERR_IPC;
			break;
		default:
			break;
	}

	m_args.clear();
	for (int32_t i = 0 ; i < cnt ; i++) {
		std::unique_ptr<KdbBase> obj;
		if (ReadResult rr = readObject(buf, obj); ReadResult::RD_OK != rr)
			return rr;
		m_args.push_back(std::move(obj));
	}
	return ReadResult::RD_OK;
}

WriteResult KdbFunction::write(WriteBuf & buf) const
{
	if (!buf.canWrite(wireSz()))
		return WriteResult::WR_INCOMPLETE;

	buf.writeTyp(m_typ);
	switch (m_typ) {
		case KdbType::FUNCTION:
			buf.writeSym(m_ctx);
			break;
		case KdbType::UNARY_PRIMITIVE:
		case KdbType::BINARY_PRIMITIVE:
		case KdbType::TERNARY_PRIMITIVE:
			buf.write<uint8_t>(m_byte);
			return WriteResult::WR_OK;
		case KdbType::PROJECTION:
		case KdbType::COMPOSITION:
			buf.write<int32_t>(static_cast<int32_t>(m_args.size()));
			break;
		default:
			break;
	}

	for (const auto & arg : m_args) {
		if (WriteResult wr = arg->write(buf); WriteResult::WR_OK != wr)
			return wr;
	}
	return WriteResult::WR_OK;
}

bool KdbFunction::equals(const KdbBase & rhs) const
{
	if (rhs.m_typ != m_typ)
		return false;
	const auto & fn = static_cast<const KdbFunction&>(rhs);
	if (fn.m_ctx != m_ctx || fn.m_byte != m_byte || fn.m_args.size() != m_args.size())
		return false;
	for (size_t i = 0 ; i < m_args.size() ; i++) {
		if (!m_args[i]->equals(*fn.m_args[i]))
			return false;
	}
	return true;
}

//--------------------------------------------------------------------------------------- newInstance
std::unique_ptr<KdbBase> newInstance(int8_t typ_i8)
{
	const KdbType typ = static_cast<KdbType>(typ_i8);
	switch (typ) {
		case KdbType::EXCEPTION:           return std::make_unique<KdbException>();
		case KdbType::TIME_ATOM:           return std::make_unique<KdbTimeAtom>();
		case KdbType::SECOND_ATOM:         return std::make_unique<KdbSecondAtom>();
		case KdbType::MINUTE_ATOM:         return std::make_unique<KdbMinuteAtom>();
		case KdbType::TIMESPAN_ATOM:       return std::make_unique<KdbTimespanAtom>();
		case KdbType::DATETIME_ATOM:       return std::make_unique<KdbDatetimeAtom>();
		case KdbType::DATE_ATOM:           return std::make_unique<KdbDateAtom>();
		case KdbType::MONTH_ATOM:          return std::make_unique<KdbMonthAtom>();
		case KdbType::TIMESTAMP_ATOM:      return std::make_unique<KdbTimestampAtom>();
		case KdbType::SYMBOL_ATOM:         return std::make_unique<KdbSymbolAtom>();
		case KdbType::CHAR_ATOM:           return std::make_unique<KdbCharAtom>();
		case KdbType::FLOAT_ATOM:          return std::make_unique<KdbFloatAtom>();
		case KdbType::REAL_ATOM:           return std::make_unique<KdbRealAtom>();
		case KdbType::LONG_ATOM:           return std::make_unique<KdbLongAtom>();
		case KdbType::INT_ATOM:            return std::make_unique<KdbIntAtom>();
		case KdbType::SHORT_ATOM:          return std::make_unique<KdbShortAtom>();
		case KdbType::BYTE_ATOM:           return std::make_unique<KdbByteAtom>();
		case KdbType::GUID_ATOM:           return std::make_unique<KdbGuidAtom>();
		case KdbType::BOOL_ATOM:           return std::make_unique<KdbBoolAtom>();
		case KdbType::LIST:                return std::make_unique<KdbList>();
		case KdbType::BOOL_VECTOR:         return std::make_unique<KdbBoolVector>();
		case KdbType::GUID_VECTOR:         return std::make_unique<KdbGuidVector>();
		case KdbType::BYTE_VECTOR:         return std::make_unique<KdbByteVector>();
		case KdbType::SHORT_VECTOR:        return std::make_unique<KdbShortVector>();
		case KdbType::INT_VECTOR:          return std::make_unique<KdbIntVector>();
		case KdbType::LONG_VECTOR:         return std::make_unique<KdbLongVector>();
		case KdbType::REAL_VECTOR:         return std::make_unique<KdbRealVector>();
		case KdbType::FLOAT_VECTOR:        return std::make_unique<KdbFloatVector>();
		case KdbType::CHAR_VECTOR:         return std::make_unique<KdbCharVector>();
		case KdbType::SYMBOL_VECTOR:       return std::make_unique<KdbSymbolVector>();
		case KdbType::TIMESTAMP_VECTOR:    return std::make_unique<KdbTimestampVector>();
		case KdbType::MONTH_VECTOR:        return std::make_unique<KdbMonthVector>();
		case KdbType::DATE_VECTOR:         return std::make_unique<KdbDateVector>();
		case KdbType::DATETIME_VECTOR:     return std::make_unique<KdbDatetimeVector>();
		case KdbType::TIMESPAN_VECTOR:     return std::make_unique<KdbTimespanVector>();
		case KdbType::MINUTE_VECTOR:       return std::make_unique<KdbMinuteVector>();
		case KdbType::SECOND_VECTOR:       return std::make_unique<KdbSecondVector>();
		case KdbType::TIME_VECTOR:         return std::make_unique<KdbTimeVector>();
		case KdbType::TABLE:               return std::make_unique<KdbTable>();
		case KdbType::DICT:                return std::make_unique<KdbDict>();
		case KdbType::FUNCTION:
		case KdbType::UNARY_PRIMITIVE:
		case KdbType::BINARY_PRIMITIVE:
		case KdbType::TERNARY_PRIMITIVE:
		case KdbType::PROJECTION:
		case KdbType::COMPOSITION:
		case KdbType::EACH:
		case KdbType::OVER:
		case KdbType::SCAN:
		case KdbType::EACH_PRIOR:
		case KdbType::EACH_RIGHT:
		case KdbType::EACH_LEFT:
		case KdbType::DYNAMIC_LOAD:        return std::make_unique<KdbFunction>(typ);
		default:
			return nullptr;
	}
}

ReadResult readObject(ReadBuf & buf, std::unique_ptr<KdbBase> & out)
{
	if (!buf.canRead(SZ_BYTE))
		return ReadResult::RD_INCOMPLETE;

	const int8_t typ = buf.read<int8_t>();
	std::unique_ptr<KdbBase> obj = newInstance(typ);
	if (!obj) {
		WRN_PRINT("Unsupported type {} at offset {}", typ, buf.offset() - SZ_BYTE);
		return ReadResult::RD_ERR_IPC;
	}

	ReadResult rr = obj->read(buf);
	if (ReadResult::RD_OK == rr)
		out = std::move(obj);
	return rr;
}

//--------------------------------------------------------------------------------------- nullOf
std::unique_ptr<KdbBase> nullOf(char typ)
{
	switch (typ) {
		case ' ': return std::make_unique<KdbFunction>(KdbType::UNARY_PRIMITIVE, 0);
		case 'b': return std::make_unique<KdbBoolAtom>(0);
		case 'g': return std::make_unique<KdbGuidAtom>(GuidType{});
		case 'x': return std::make_unique<KdbByteAtom>(0);
		case 'h': return std::make_unique<KdbShortAtom>(NULL_SHORT);
		case 'i': return std::make_unique<KdbIntAtom>(NULL_INT);
		case 'j': return std::make_unique<KdbLongAtom>(NULL_LONG);
		case 'e': return std::make_unique<KdbRealAtom>(std::bit_cast<float>(NULL_REAL));
		case 'f': return std::make_unique<KdbFloatAtom>(std::bit_cast<double>(NULL_FLOAT));
		case 'c': return std::make_unique<KdbCharAtom>(static_cast<char>(NULL_CHAR));
		case 's': return std::make_unique<KdbSymbolAtom>("");
		case 'p': return std::make_unique<KdbTimestampAtom>(NULL_LONG);
		case 'm': return std::make_unique<KdbMonthAtom>(NULL_INT);
		case 'd': return std::make_unique<KdbDateAtom>(NULL_INT);
		case 'z': return std::make_unique<KdbDatetimeAtom>(std::bit_cast<double>(NULL_FLOAT));
		case 'n': return std::make_unique<KdbTimespanAtom>(NULL_LONG);
		case 'u': return std::make_unique<KdbMinuteAtom>(NULL_INT);
		case 'v': return std::make_unique<KdbSecondAtom>(NULL_INT);
		case 't': return std::make_unique<KdbTimeAtom>(NULL_INT);
		default:
			throw std::invalid_argument(std::format("No null for type char '{}'", typ));
	}
}

//--------------------------------------------------------------------------------------- instantiations
template struct KdbScalar<KdbType::BOOL_ATOM,      int8_t>;
template struct KdbScalar<KdbType::GUID_ATOM,      GuidType>;
template struct KdbScalar<KdbType::BYTE_ATOM,      uint8_t>;
template struct KdbScalar<KdbType::SHORT_ATOM,     int16_t>;
template struct KdbScalar<KdbType::INT_ATOM,       int32_t>;
template struct KdbScalar<KdbType::LONG_ATOM,      int64_t>;
template struct KdbScalar<KdbType::REAL_ATOM,      float>;
template struct KdbScalar<KdbType::FLOAT_ATOM,     double>;
template struct KdbScalar<KdbType::CHAR_ATOM,      char>;
template struct KdbScalar<KdbType::TIMESTAMP_ATOM, int64_t>;
template struct KdbScalar<KdbType::MONTH_ATOM,     int32_t>;
template struct KdbScalar<KdbType::DATE_ATOM,      int32_t>;
template struct KdbScalar<KdbType::DATETIME_ATOM,  double>;
template struct KdbScalar<KdbType::TIMESPAN_ATOM,  int64_t>;
template struct KdbScalar<KdbType::MINUTE_ATOM,    int32_t>;
template struct KdbScalar<KdbType::SECOND_ATOM,    int32_t>;
template struct KdbScalar<KdbType::TIME_ATOM,      int32_t>;

template struct KdbVector<KdbType::BOOL_VECTOR,      int8_t>;
template struct KdbVector<KdbType::GUID_VECTOR,      GuidType>;
template struct KdbVector<KdbType::BYTE_VECTOR,      uint8_t>;
template struct KdbVector<KdbType::SHORT_VECTOR,     int16_t>;
template struct KdbVector<KdbType::INT_VECTOR,       int32_t>;
template struct KdbVector<KdbType::LONG_VECTOR,      int64_t>;
template struct KdbVector<KdbType::REAL_VECTOR,      float>;
template struct KdbVector<KdbType::FLOAT_VECTOR,     double>;
template struct KdbVector<KdbType::TIMESTAMP_VECTOR, int64_t>;
template struct KdbVector<KdbType::MONTH_VECTOR,     int32_t>;
template struct KdbVector<KdbType::DATE_VECTOR,      int32_t>;
template struct KdbVector<KdbType::DATETIME_VECTOR,  double>;
template struct KdbVector<KdbType::TIMESPAN_VECTOR,  int64_t>;
template struct KdbVector<KdbType::MINUTE_VECTOR,    int32_t>;
template struct KdbVector<KdbType::SECOND_VECTOR,    int32_t>;
template struct KdbVector<KdbType::TIME_VECTOR,      int32_t>;

} // end namespace kxc
