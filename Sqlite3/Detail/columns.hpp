#ifndef SQLITE3_DETAIL_COLUMNS_HPP
#define SQLITE3_DETAIL_COLUMNS_HPP

#include<cstdint>
#include<string>
#include<type_traits>

namespace Sqlite3 { namespace Detail {

double column_d(void* stmt, int c);
std::int64_t column_i(void* stmt, int c);
std::uint64_t column_u(void* stmt, int c);
std::string column_s(void* stmt, int c);

template<typename a, typename = void>
struct Column;

template<typename a>
struct Column< a
	     , typename std::enable_if< std::is_integral<a>::value
				      && std::is_signed<a>::value
				      >::type
	     > {
	static a column(void* stmt, int c) {
		return a(column_i(stmt, c));
	}
};
/* Negative stored values throw rather than wrap.  */
template<typename a>
struct Column< a
	     , typename std::enable_if< std::is_integral<a>::value
				      && std::is_unsigned<a>::value
				      && !std::is_same<a, bool>::value
				      >::type
	     > {
	static a column(void* stmt, int c) {
		return a(column_u(stmt, c));
	}
};
template<>
struct Column<bool> {
	static bool column(void* stmt, int c) {
		return column_i(stmt, c) != 0;
	}
};
template<>
struct Column<double> {
	static double column(void* stmt, int c) {
		return column_d(stmt, c);
	}
};
template<>
struct Column<std::string> {
	static std::string column(void* stmt, int c) {
		return column_s(stmt, c);
	}
};

}}

#endif /* !defined(SQLITE3_DETAIL_COLUMNS_HPP) */
