#include"Sqlite3/Detail/binds.hpp"
#include"Sqlite3/Error.hpp"
#include<limits>
#include<sqlite3.h>

namespace {

void check(int res, char const* what, int l) {
	if (res != SQLITE_OK)
		throw Sqlite3::Error( std::string("bind ") + what
				      + " to parameter " + std::to_string(l)
				    , res
				    , sqlite3_errstr(res)
				    );
}

}

namespace Sqlite3 { namespace Detail {

void bind_d(void* stmt, int l, double v) {
	check(sqlite3_bind_double((sqlite3_stmt*) stmt, l, v), "real", l);
}
void bind_i(void* stmt, int l, std::int64_t v) {
	check(sqlite3_bind_int64((sqlite3_stmt*) stmt, l, v), "integer", l);
}
void bind_u(void* stmt, int l, std::uint64_t v) {
	if (v > std::uint64_t(std::numeric_limits<std::int64_t>::max()))
		throw Sqlite3::Error( "bind integer to parameter "
				      + std::to_string(l)
				    , SQLITE_RANGE
				    , std::to_string(v) + " does not fit"
				    );
	bind_i(stmt, l, std::int64_t(v));
}
void bind_s(void* stmt, int l, std::string const& v) {
	check(sqlite3_bind_text( (sqlite3_stmt*) stmt
			       , l, v.data(), int(v.size())
			       , SQLITE_TRANSIENT
			       ), "text", l);
}
void bind_null(void* stmt, int l) {
	check(sqlite3_bind_null((sqlite3_stmt*) stmt, l), "null", l);
}

}}
