#include"Sqlite3/Db.hpp"
#include"Sqlite3/Error.hpp"
#include"Sqlite3/Result.hpp"
#include<sqlite3.h>

namespace Sqlite3 {

Result::Result(Sqlite3::Db const& db_, void* stmt_
	      ) : db(db_), stmt(stmt_) {
	advance();
}
Result::Result(Result&& o) : db(std::move(o.db)), stmt(o.stmt) {
	o.stmt = nullptr;
}
Result::~Result() {
	if (stmt)
		sqlite3_finalize((sqlite3_stmt*) stmt);
}

bool Result::advance() {
	auto ss = (sqlite3_stmt*) stmt;
	switch (sqlite3_step(ss)) {
	case SQLITE_ROW:
		return true;
	case SQLITE_DONE:
		sqlite3_finalize(ss);
		stmt = nullptr;
		return false;
	default: {
		auto connection = (sqlite3*) db.get_connection();
		auto e = Error( sqlite3_sql(ss)
			      , sqlite3_extended_errcode(connection)
			      , sqlite3_errmsg(connection)
			      );
		sqlite3_finalize(ss);
		stmt = nullptr;
		throw e;
	}
	}
}

}
