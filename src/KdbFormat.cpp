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

#include "kxc/KdbFormat.h"

#include <cmath>
#include <cstdlib>
#include <iterator>
#include <limits>

namespace kxc {

namespace time {

static const int64_t NANOS_IN_DAY = 86400000000000L;
static const int64_t NANOS_IN_HOUR = NANOS_IN_DAY / 24;
static const int64_t NANOS_IN_MINUTE = 60000000000L;
static const int64_t NANOS_IN_SECOND =  1000000000L;

static const int32_t MILLIS_IN_SECOND = 1000;
static const int32_t MILLIS_IN_MINUTE = 60 * MILLIS_IN_SECOND;
static const int32_t MILLIS_IN_HOUR = 60 * MILLIS_IN_MINUTE;
static const int32_t MILLIS_IN_DAY = MILLIS_IN_HOUR * 24;

static const int32_t DAYS_SINCE_0AD = 730425;

static int64_t floorDiv(int64_t val, int64_t div)
{
	int64_t q = val / div;
	return (val % div < 0) ? q - 1 : q;
}

static void appendNull(std::string & out, const char *typ, bool suffix)
{
	std::format_to(std::back_inserter(out), "0N{}", suffix ? typ : "");
}

// C.f. http://web.archive.org/web/20170507133619/https://alcor.concordia.ca/~gpkatch/gdate-algorithm.html
static void appendDateNotation(std::string & out, int64_t days)
{
	int64_t g, y, ddd, mi, mm, dd;
	g = DAYS_SINCE_0AD + days;
	y = (10000L * g + 14780L)/3652425L;
	ddd = g - (365*y + y/4 - y/100 + y/400);
	if (ddd < 0) {
		y = y - 1;
		ddd = g - (365*y + y/4 - y/100 + y/400);
	}
	mi = (100*ddd + 52)/3060;
	mm = (mi + 2) % 12 + 1;
	y = y + (mi + 2)/12;
	dd = ddd - (mi*306 + 5)/10 + 1;
	std::format_to(std::back_inserter(out), "{:04}.{:02}.{:02}", y, mm, dd);
}

int32_t getDays(int32_t y, int32_t m, int32_t d)
{
	int32_t month = (m + 9) % 12;    //mar=0, feb=11
	int32_t year = y - month / 10;   //if Jan/Feb, year--
	return (year * 365 + year / 4 - year / 100 + year / 400 + (month * 306 + 5) / 10 + (d - 1)) - DAYS_SINCE_0AD;
}

void formatTimestamp(std::string & out, int64_t nanos, bool suffix)
{
	if (NULL_LONG == nanos)
		return appendNull(out, "p", suffix);

	const int64_t days = floorDiv(nanos, NANOS_IN_DAY);
	const int64_t tod = nanos - days * NANOS_IN_DAY;
	appendDateNotation(out, days);
	std::format_to(std::back_inserter(out), "D{:02}:{:02}:{:02}.{:09}",
		tod / NANOS_IN_HOUR, (tod % NANOS_IN_HOUR) / NANOS_IN_MINUTE, (tod % NANOS_IN_MINUTE) / NANOS_IN_SECOND, tod % NANOS_IN_SECOND);
}

void formatMonth(std::string & out, int32_t mth, bool suffix)
{
	if (NULL_INT == mth)
		return appendNull(out, "m", suffix);
	const int64_t yrs = floorDiv(mth, 12);
	std::format_to(std::back_inserter(out), "{:04}.{:02}{}", 2000 + yrs, mth - yrs * 12 + 1, suffix ? "m" : "");
}

void formatDate(std::string & out, int32_t days, bool suffix)
{
	if (NULL_INT == days)
		return appendNull(out, "d", suffix);
	appendDateNotation(out, days);
}

void formatDatetime(std::string & out, double days, bool suffix)
{
	if (std::isnan(days))
		return appendNull(out, "z", suffix);

	const int64_t millis = std::llround(days * MILLIS_IN_DAY);
	const int64_t date = floorDiv(millis, MILLIS_IN_DAY);
	const int64_t tod = millis - date * MILLIS_IN_DAY;
	appendDateNotation(out, date);
	std::format_to(std::back_inserter(out), "T{:02}:{:02}:{:02}.{:03}",
		tod / MILLIS_IN_HOUR, (tod % MILLIS_IN_HOUR) / MILLIS_IN_MINUTE, (tod % MILLIS_IN_MINUTE) / MILLIS_IN_SECOND, tod % MILLIS_IN_SECOND);
}

void formatTimespan(std::string & out, int64_t nanos, bool suffix)
{
	if (NULL_LONG == nanos)
		return appendNull(out, "n", suffix);

	if (nanos < 0) {
		out.push_back('-');
		nanos = -nanos;
	}
	int64_t d, h, m, s, n;
	d = nanos / NANOS_IN_DAY;
	nanos = nanos % NANOS_IN_DAY;
	h = nanos / NANOS_IN_HOUR;
	m = (nanos % NANOS_IN_HOUR) / NANOS_IN_MINUTE;
	s = (nanos % NANOS_IN_MINUTE) / NANOS_IN_SECOND;
	n = nanos % NANOS_IN_SECOND;
	std::format_to(std::back_inserter(out), "{}D{:02}:{:02}:{:02}.{:09}", d, h, m, s, n);
}

void formatMinute(std::string & out, int32_t mins, bool suffix)
{
	if (NULL_INT == mins)
		return appendNull(out, "u", suffix);
	std::format_to(std::back_inserter(out), "{:02}:{:02}", mins / 60, mins % 60);
}

void formatSecond(std::string & out, int32_t secs, bool suffix)
{
	if (NULL_INT == secs)
		return appendNull(out, "v", suffix);

	int32_t hours, mins;
	hours = secs / 3600;
	secs -= hours * 3600;
	mins = secs / 60;
	secs -= mins * 60;
	std::format_to(std::back_inserter(out), "{:02}:{:02}:{:02}", hours, mins, secs);
}

void formatTime(std::string & out, int32_t time, bool suffix)
{
	if (NULL_INT == time)
		return appendNull(out, "t", suffix);

	int32_t hours, mins, secs;
	hours = time / MILLIS_IN_HOUR;
	time -= hours * MILLIS_IN_HOUR;
	mins = time / MILLIS_IN_MINUTE;
	time -= mins * MILLIS_IN_MINUTE;
	secs = time / MILLIS_IN_SECOND;
	time -= secs * MILLIS_IN_SECOND;
	std::format_to(std::back_inserter(out), "{:02}:{:02}:{:02}.{:03}", hours, mins, secs, time);
}

} // end namespace time

//-------------------------------------------------------------------------------- element text
#define _KXC_GUID_FMT_STR "{:02x}{:02x}{:02x}{:02x}-{:02x}{:02x}-{:02x}{:02x}-{:02x}{:02x}-{:02x}{:02x}{:02x}{:02x}{:02x}{:02x}"
#define _KXC_GUID_FMT_ELM(e) (e)[0], (e)[1], (e)[2], (e)[3], (e)[4], (e)[5], (e)[6], (e)[7] , (e)[8], (e)[9], (e)[10], (e)[11], (e)[12], (e)[13], (e)[14], (e)[15]

static const char QTYPE_CHARS[] = " bg xhijefcspmdznuvt";

static char qTypeChar(KdbType typ)
{
	const int idx = std::abs(static_cast<int>(typ));
	return idx < 20 ? QTYPE_CHARS[idx] : ' ';
}

// Appends one element without its type suffix; returns false when the element is null
template<KdbType TYP, typename E>
static bool appendElement(std::string & out, const E & val)
{
	auto it = std::back_inserter(out);
	constexpr int VEC = static_cast<int>(TYP) < 0 ? -static_cast<int>(TYP) : static_cast<int>(TYP);

	if constexpr (std::is_same<E, GuidType>::value) {
		std::format_to(it, _KXC_GUID_FMT_STR, _KXC_GUID_FMT_ELM(val));
		return val != GuidType{};
	}
	else if constexpr (std::is_floating_point<E>::value && VEC != static_cast<int>(KdbType::DATETIME_VECTOR)) {
		if (std::isnan(val)) {
			out.append("0N");
			return false;
		}
		if (std::isinf(val)) {
			out.append(val > 0 ? "0w" : "-0w");
			return true;
		}
		std::format_to(it, "{}", val);
		return true;
	}
	else if constexpr (VEC == static_cast<int>(KdbType::BOOL_VECTOR)) {
		std::format_to(it, "{:d}", val ? 1 : 0);
		return true;
	}
	else if constexpr (VEC == static_cast<int>(KdbType::BYTE_VECTOR)) {
		std::format_to(it, "{:02x}", static_cast<uint8_t>(val));
		return true;
	}
	else if constexpr (VEC == static_cast<int>(KdbType::CHAR_VECTOR)) {
		out.push_back(val);
		return true;
	}
	else if constexpr (VEC == static_cast<int>(KdbType::TIMESTAMP_VECTOR)) {
		time::formatTimestamp(out, val, false);
		return NULL_LONG != val;
	}
	else if constexpr (VEC == static_cast<int>(KdbType::MONTH_VECTOR)) {
		time::formatMonth(out, val, false);
		return NULL_INT != val;
	}
	else if constexpr (VEC == static_cast<int>(KdbType::DATE_VECTOR)) {
		time::formatDate(out, val, false);
		return NULL_INT != val;
	}
	else if constexpr (VEC == static_cast<int>(KdbType::DATETIME_VECTOR)) {
		time::formatDatetime(out, val, false);
		return !std::isnan(val);
	}
	else if constexpr (VEC == static_cast<int>(KdbType::TIMESPAN_VECTOR)) {
		time::formatTimespan(out, val, false);
		return NULL_LONG != val;
	}
	else if constexpr (VEC == static_cast<int>(KdbType::MINUTE_VECTOR)) {
		time::formatMinute(out, val, false);
		return NULL_INT != val;
	}
	else if constexpr (VEC == static_cast<int>(KdbType::SECOND_VECTOR)) {
		time::formatSecond(out, val, false);
		return NULL_INT != val;
	}
	else if constexpr (VEC == static_cast<int>(KdbType::TIME_VECTOR)) {
		time::formatTime(out, val, false);
		return NULL_INT != val;
	}
	else {
		// short, int, long
		constexpr E NUL = std::numeric_limits<E>::min();
		if (NUL == val) {
			out.append("0N");
			return false;
		}
		if (std::numeric_limits<E>::max() == val) {
			out.append("0W");
			return true;
		}
		if (NUL + 1 == val) {
			out.append("-0W");
			return true;
		}
		std::format_to(it, "{}", val);
		return true;
	}
}

// Types whose atoms and vectors always carry the type char
static bool alwaysSuffixed(KdbType typ)
{
	switch (std::abs(static_cast<int>(typ))) {
		case static_cast<int>(KdbType::BOOL_VECTOR):
		case static_cast<int>(KdbType::SHORT_VECTOR):
		case static_cast<int>(KdbType::INT_VECTOR):
		case static_cast<int>(KdbType::REAL_VECTOR):
		case static_cast<int>(KdbType::FLOAT_VECTOR):
		case static_cast<int>(KdbType::MONTH_VECTOR):
			return true;
		default:
			return false;
	}
}

template<KdbType TYP, typename E>
static void formatAtom(std::string & out, const KdbScalar<TYP,E> & atm)
{
	constexpr KdbType VEC = static_cast<KdbType>(-static_cast<int>(TYP));
	if constexpr (KdbType::CHAR_ATOM == TYP) {
		std::format_to(std::back_inserter(out), "\"{:c}\"", atm.m_val);
	}
	else if constexpr (KdbType::GUID_ATOM == TYP) {
		out.append("(\"G\"$\"");
		appendElement<VEC, E>(out, atm.m_val);
		out.append("\")");
	}
	else if constexpr (KdbType::BYTE_ATOM == TYP) {
		out.append("0x");
		appendElement<VEC, E>(out, atm.m_val);
	}
	else {
		const bool val = appendElement<VEC, E>(out, atm.m_val);
		if (!val || alwaysSuffixed(TYP))
			out.push_back(qTypeChar(TYP));
	}
}

template<KdbType TYP, typename E>
static void formatVector(std::string & out, const KdbVector<TYP,E> & vec)
{
	auto it = std::back_inserter(out);
	if (0 == vec.count()) {
		std::format_to(it, "({}h$())", static_cast<int>(TYP));
		return;
	}
	if (1 == vec.count())
		out.append("(enlist ");

	if constexpr (KdbType::GUID_VECTOR == TYP) {
		out.append("\"G\"$(\"");
		for (size_t i = 0 ; i < vec.m_vec.size() ; i++) {
			if (i > 0)
				out.append("\";\"");
			appendElement<TYP, E>(out, vec.m_vec[i]);
		}
		out.append("\")");
	}
	else if constexpr (KdbType::BYTE_VECTOR == TYP || KdbType::BOOL_VECTOR == TYP) {
		if (KdbType::BYTE_VECTOR == TYP)
			out.append("0x");
		for (const E & val : vec.m_vec)
			appendElement<TYP, E>(out, val);
		if (KdbType::BOOL_VECTOR == TYP)
			out.push_back('b');
	}
	else {
		bool none = true;
		for (size_t i = 0 ; i < vec.m_vec.size() ; i++) {
			if (i > 0)
				out.push_back(' ');
			if (appendElement<TYP, E>(out, vec.m_vec[i]))
				none = false;
		}
		if (none || alwaysSuffixed(TYP))
			out.push_back(qTypeChar(TYP));
	}

	if (1 == vec.count())
		out.push_back(')');
}

static void formatSymbol(std::string & out, std::string_view sym)
{
	if (std::string_view::npos == sym.find(' '))
		std::format_to(std::back_inserter(out), "`{}", sym);
	else
		std::format_to(std::back_inserter(out), "(`$\"{}\")", sym);
}

static void formatSymbols(std::string & out, const KdbSymbolVector & vec)
{
	if (0 == vec.count()) {
		out.append("(`$())");
		return;
	}
	if (1 == vec.count())
		out.append("(enlist");
	for (uint64_t i = 0 ; i < vec.count() ; i++) {
		formatSymbol(out, vec.getString(i));
	}
	if (1 == vec.count())
		out.push_back(')');
}

static void formatList(std::string & out, const KdbList & lst)
{
	if (0 == lst.count()) {
		out.append("()");
		return;
	}
	if (1 == lst.count()) {
		out.append("(enlist ");
		formatTo(out, *lst.getObj(0));
		out.push_back(')');
		return;
	}
	out.push_back('(');
	for (size_t i = 0 ; i < lst.count() ; i++) {
		if (i > 0)
			out.push_back(';');
		formatTo(out, *lst.getObj(i));
	}
	out.push_back(')');
}

static void formatFunction(std::string & out, const KdbFunction & fnc)
{
	static const char *UNARY[] = {
			"::", "+:", "-:", "*:", "%:", "&:", "|:", "^:", "=:", "<:", ">:", "$:", ",:", "#:", "_:", "~:", "!:",
			"?:", "@:", ".:", "0::", "1::", "2::", "avg", "last", "sum", "prd", "min", "max", "exit", "getenv", "abs",
			"sqrt", "log", "exp", "sin", "asin", "cos", "acos", "tan", "atan", "enlist", "var"
	};
	static const char *BINARY[] = {
			":", "+", "-", "*", "%", "&", "|", "^", "=", "<", ">", "$", ",", "#", "_", "~", "!",
			"?", "@", ".", "0:", "1:", "2:", "in", "within", "like", "bin", "ss", "insert", "wsum",
			"wavg", "div", "xexp", "setenv", "binr", "cov", "cor"
	};
	static const char *ADVERB[] = { "'", "/", "\\", "':", "/:", "\\:" };

	auto lookup = [&out](const char **ary, size_t len, uint8_t idx) {
		if (idx < len)
			out.append(ary[idx]);
		else
			std::format_to(std::back_inserter(out), "<prim {}>", idx);
	};

	switch (fnc.m_typ) {
		case KdbType::FUNCTION:
			if (!fnc.context().empty())
				std::format_to(std::back_inserter(out), "(\\d .{}) ", fnc.context());
			if (1 == fnc.argCount() && KdbType::CHAR_VECTOR == fnc.getArg(0)->m_typ)
				out.append(static_cast<const KdbCharVector*>(fnc.getArg(0))->getString());
			else
				out.append("{...}");
			break;
		case KdbType::UNARY_PRIMITIVE:
			lookup(UNARY, std::size(UNARY), fnc.primitive());
			break;
		case KdbType::BINARY_PRIMITIVE:
			lookup(BINARY, std::size(BINARY), fnc.primitive());
			break;
		case KdbType::TERNARY_PRIMITIVE:
			lookup(ADVERB, std::size(ADVERB), fnc.primitive());
			break;
		case KdbType::PROJECTION:
			for (size_t i = 0 ; i < fnc.argCount() ; i++) {
				if (1 == i)
					out.push_back('[');
				else if (i > 1)
					out.push_back(';');
				formatTo(out, *fnc.getArg(i));
			}
			out.push_back(']');
			break;
		case KdbType::COMPOSITION:
			out.append("('[");
			for (size_t i = 0 ; i < fnc.argCount() ; i++) {
				if (i > 0)
					out.push_back(';');
				formatTo(out, *fnc.getArg(i));
			}
			out.append("])");
			break;
		case KdbType::DYNAMIC_LOAD:
			out.append("`code");
			break;
		default:
			if (fnc.argCount() > 0)
				formatTo(out, *fnc.getArg(0));
			out.append(ADVERB[static_cast<int>(fnc.m_typ) - static_cast<int>(KdbType::EACH)]);
			break;
	}
}

//-------------------------------------------------------------------------------- formatTo
#define _KXC_ATOM_CASE(T)   case T::kdb_type: formatAtom(out, static_cast<const T&>(obj)); break
#define _KXC_VECTOR_CASE(T) case T::kdb_type: formatVector(out, static_cast<const T&>(obj)); break

void formatTo(std::string & out, const KdbBase & obj)
{
	switch (obj.m_typ) {
		_KXC_ATOM_CASE(KdbBoolAtom);
		_KXC_ATOM_CASE(KdbGuidAtom);
		_KXC_ATOM_CASE(KdbByteAtom);
		_KXC_ATOM_CASE(KdbShortAtom);
		_KXC_ATOM_CASE(KdbIntAtom);
		_KXC_ATOM_CASE(KdbLongAtom);
		_KXC_ATOM_CASE(KdbRealAtom);
		_KXC_ATOM_CASE(KdbFloatAtom);
		_KXC_ATOM_CASE(KdbCharAtom);
		_KXC_ATOM_CASE(KdbTimestampAtom);
		_KXC_ATOM_CASE(KdbMonthAtom);
		_KXC_ATOM_CASE(KdbDateAtom);
		_KXC_ATOM_CASE(KdbDatetimeAtom);
		_KXC_ATOM_CASE(KdbTimespanAtom);
		_KXC_ATOM_CASE(KdbMinuteAtom);
		_KXC_ATOM_CASE(KdbSecondAtom);
		_KXC_ATOM_CASE(KdbTimeAtom);
		_KXC_VECTOR_CASE(KdbBoolVector);
		_KXC_VECTOR_CASE(KdbGuidVector);
		_KXC_VECTOR_CASE(KdbByteVector);
		_KXC_VECTOR_CASE(KdbShortVector);
		_KXC_VECTOR_CASE(KdbIntVector);
		_KXC_VECTOR_CASE(KdbLongVector);
		_KXC_VECTOR_CASE(KdbRealVector);
		_KXC_VECTOR_CASE(KdbFloatVector);
		_KXC_VECTOR_CASE(KdbTimestampVector);
		_KXC_VECTOR_CASE(KdbMonthVector);
		_KXC_VECTOR_CASE(KdbDateVector);
		_KXC_VECTOR_CASE(KdbDatetimeVector);
		_KXC_VECTOR_CASE(KdbTimespanVector);
		_KXC_VECTOR_CASE(KdbMinuteVector);
		_KXC_VECTOR_CASE(KdbSecondVector);
		_KXC_VECTOR_CASE(KdbTimeVector);
		case KdbType::SYMBOL_ATOM:
			formatSymbol(out, static_cast<const KdbSymbolAtom&>(obj).m_val);
			break;
		case KdbType::CHAR_VECTOR: {
			const auto & cv = static_cast<const KdbCharVector&>(obj);
			if (1 == cv.count())
				std::format_to(std::back_inserter(out), "(enlist \"{}\")", cv.getString());
			else
				std::format_to(std::back_inserter(out), "\"{}\"", cv.getString());
			break;
		}
		case KdbType::SYMBOL_VECTOR:
			formatSymbols(out, static_cast<const KdbSymbolVector&>(obj));
			break;
		case KdbType::LIST:
			formatList(out, static_cast<const KdbList&>(obj));
			break;
		case KdbType::EXCEPTION:
			std::format_to(std::back_inserter(out), "'{}", static_cast<const KdbException&>(obj).m_msg);
			break;
		case KdbType::DICT: {
			const auto & dct = static_cast<const KdbDict&>(obj);
			if (nullptr == dct.getKeys() || nullptr == dct.getValues()) {
				out.append("(()!())");
				break;
			}
			out.push_back('(');
			formatTo(out, *dct.getKeys());
			out.push_back('!');
			formatTo(out, *dct.getValues());
			out.push_back(')');
			break;
		}
		case KdbType::TABLE: {
			const auto & tbl = static_cast<const KdbTable&>(obj);
			if (nullptr == tbl.key()) {
				out.append("(flip ()!())");
				break;
			}
			out.append("(flip ");
			formatTo(out, *tbl.key());
			out.push_back('!');
			formatTo(out, *tbl.value());
			out.push_back(')');
			break;
		}
		default:
			formatFunction(out, static_cast<const KdbFunction&>(obj));
			break;
	}
}

#undef _KXC_ATOM_CASE
#undef _KXC_VECTOR_CASE

std::string toString(const KdbBase & obj)
{
	std::string tmp{};
	formatTo(tmp, obj);
	return tmp;
}

} // end namespace kxc
