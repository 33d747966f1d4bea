#ifndef SQLITE3_DETAIL_BINDS_HPP
#define SQLITE3_DETAIL_BINDS_HPP

#include<cstddef>
#include<cstdint>
#include<string>
#include<type_traits>

namespace Sqlite3 { namespace Detail {

void bind_d(void* stmt, int l, double);
void bind_i(void* stmt, int l, std::int64_t);
void bind_u(void* stmt, int l, std::uint64_t);
void bind_s(void* stmt, int l, std::string const&);
void bind_null(void *stmt, int l);

/* Integers are stored as SQLITE3 64-bit signed
 * integers; unsigned values above INT64_MAX are
 * rejected rather than wrapped.  */
template<typename a, typename = void>
struct Bind;

template<typename a>
struct Bind< a
	   , typename std::enable_if< std::is_integral<a>::value
				    && std::is_signed<a>::value
				    >::type
	   > {
	static void bind(void* stmt, int l, a v) {
		bind_i(stmt, l, std::int64_t(v));
	}
};
template<typename a>
struct Bind< a
	   , typename std::enable_if< std::is_integral<a>::value
				    && std::is_unsigned<a>::value
				    && !std::is_same<a, bool>::value
				    >::type
	   > {
	static void bind(void* stmt, int l, a v) {
		bind_u(stmt, l, std::uint64_t(v));
	}
};
template<>
struct Bind<bool> {
	static void bind(void* stmt, int l, bool v) {
		bind_i(stmt, l, v ? 1 : 0);
	}
};
template<>
struct Bind<double> {
	static void bind(void* stmt, int l, double v) {
		bind_d(stmt, l, v);
	}
};
template<>
struct Bind<char const*> {
	static void bind(void* stmt, int l, char const* v) {
		bind_s(stmt, l, v);
	}
};
template<>
struct Bind<std::string> {
	static void bind(void* stmt, int l, std::string const& v) {
		bind_s(stmt, l, v);
	}
};
template<>
struct Bind<std::nullptr_t> {
	static void bind(void* stmt, int l, std::nullptr_t) {
		bind_null(stmt, l);
	}
};

}}

#endif /* !defined(SQLITE3_DETAIL_BINDS_HPP) */
