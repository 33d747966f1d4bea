#include"Sqlite3/Db.hpp"
#include"Sqlite3/Error.hpp"
#include"Sqlite3/Query.hpp"
#include"Sqlite3/Result.hpp"
#include<memory>
#include<sqlite3.h>

namespace Sqlite3 {

class Query::Impl {
public:
	Db db;
	sqlite3_stmt* stmt;

	Impl(Db const& db_, void* stmt_)
		: db(db_), stmt((sqlite3_stmt*) stmt_) { }
	~Impl() {
		if (stmt)
			(void) sqlite3_finalize(stmt);
	}
};

Query::Query(Sqlite3::Db const& db, void* stmt)
	: pimpl(std::make_unique<Impl>(db, stmt)) { }
Query::Query(Query&& o) : pimpl(std::move(o.pimpl)) { }
Query::~Query() { }

void* Query::get_stmt() const { return pimpl->stmt; }
int Query::get_location(const char* field) const {
	auto res = sqlite3_bind_parameter_index(pimpl->stmt, field);
	if (res == 0)
		throw Sqlite3::Error( std::string("bind ") + field
				    , SQLITE_RANGE
				    , std::string("no such parameter in: ")
				      + sqlite3_sql(pimpl->stmt)
				    );
	return res;
}

Result Query::execute() {
	auto p = std::move(pimpl);
	auto stmt = p->stmt;
	p->stmt = nullptr;
	/* Runs the first step.  */
	return Result(p->db, stmt);
}

}
