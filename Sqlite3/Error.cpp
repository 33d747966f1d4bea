#include"Sqlite3/Error.hpp"
#include<sqlite3.h>

namespace Sqlite3 {

bool Error::constraint() const {
	return (code & 0xFF) == SQLITE_CONSTRAINT;
}

namespace Detail {

void throw_error(void* vconnection, std::string const& where) {
	auto connection = (sqlite3*) vconnection;
	if (!connection)
		throw Error(where, SQLITE_NOMEM, "out of memory");
	throw Error( where
		   , sqlite3_extended_errcode(connection)
		   , sqlite3_errmsg(connection)
		   );
}

}

}
