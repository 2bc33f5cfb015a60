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

#ifndef __kxc_fmt_defs__H__
#define __kxc_fmt_defs__H__
#pragma once

#include <source_location>
#include <print>

#define KXC_STRINGIFY(x) #x
#define KXC_TOSTRING(x) KXC_STRINGIFY(x)
#define _KXC_TRACE_ 0
#define _KXC_DEBUG_ 1
#define _KXC_INFO_  2
#define _KXC_WARN_  3
#define _KXC_ERROR_ 4

#ifndef _KXC_LOG_LVL_
#define _KXC_LOG_LVL_ _KXC_INFO_
#endif

/* see https://gist.github.com/JBlond/2fea43a3049b38287e5e9cefc87b2124 for other codes */
#define RED   "\x1B[0;91m"
#define GRN   "\x1B[0;92m"
#define YEL   "\x1B[0;93m"
#define BLU   "\x1B[0;94m"
#define MAG   "\x1B[0;95m"
#define CYN   "\x1B[0;96m"
#define RST   "\x1B[0m"

#define KXC_LOG_TRA_ENABLED (_KXC_LOG_LVL_ <= _KXC_TRACE_)
#define KXC_LOG_DBG_ENABLED (_KXC_LOG_LVL_ <= _KXC_DEBUG_)
#define KXC_LOG_INF_ENABLED (_KXC_LOG_LVL_ <= _KXC_INFO_)
#define KXC_LOG_WRN_ENABLED (_KXC_LOG_LVL_ <= _KXC_WARN_)
#define KXC_LOG_ERR_ENABLED (_KXC_LOG_LVL_ <= _KXC_ERROR_)

#define KXC_LOG(lvl,fmt,...) { \
  const std::source_location loc = std::source_location::current(); \
  std::print(lvl ": " fmt " [" MAG "{}" RST "] " BLU "{}" RST ":" CYN KXC_TOSTRING(__LINE__) "\n" RST,##__VA_ARGS__, __func__, loc.file_name()); \
}

#define TRA_PRINT(fmt, ...)        do { if (KXC_LOG_TRA_ENABLED) KXC_LOG(BLU "TRACE" RST, fmt RST,##__VA_ARGS__)} while (0)
#define DBG_PRINT(fmt, ...)        do { if (KXC_LOG_DBG_ENABLED) KXC_LOG(MAG "DEBUG" RST, fmt RST,##__VA_ARGS__)} while (0)
#define INF_PRINT(fmt, ...)        do { if (KXC_LOG_INF_ENABLED) KXC_LOG(CYN " INFO" RST, fmt RST,##__VA_ARGS__)} while (0)
#define WRN_PRINT(fmt, ...)        do { if (KXC_LOG_WRN_ENABLED) KXC_LOG(YEL " WARN" RST, fmt RST,##__VA_ARGS__)} while (0)
#define ERR_PRINT(fmt, ...)        do { if (KXC_LOG_ERR_ENABLED) KXC_LOG(RED "ERROR" RST, fmt RST,##__VA_ARGS__)} while (0)

#endif
