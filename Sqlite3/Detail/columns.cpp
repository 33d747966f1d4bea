#include"Sqlite3/Detail/columns.hpp"
#include"Sqlite3/Error.hpp"
#include<sqlite3.h>

namespace Sqlite3 { namespace Detail {

double column_d(void* stmt, int c) {
	return sqlite3_column_double((sqlite3_stmt*) stmt, c);
}
std::int64_t column_i(void* stmt, int c) {
	return sqlite3_column_int64((sqlite3_stmt*) stmt, c);
}
std::uint64_t column_u(void* stmt, int c) {
	auto v = column_i(stmt, c);
	if (v < 0)
		throw Sqlite3::Error( "column " + std::to_string(c)
				    , SQLITE_MISMATCH
				    , "negative value " + std::to_string(v)
				      + " read as unsigned"
				    );
	return std::uint64_t(v);
}
std::string column_s(void* vstmt, int c) {
	auto stmt = (sqlite3_stmt*) vstmt;
	auto dat = (char const*) sqlite3_column_text(stmt, c);
	auto len = sqlite3_column_bytes(stmt, c);
	if (!dat)
		return std::string();
	return std::string(dat, std::size_t(len));
}

}}
