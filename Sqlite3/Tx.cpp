#include"Sqlite3/Db.hpp"
#include"Sqlite3/Error.hpp"
#include"Sqlite3/Query.hpp"
#include"Sqlite3/Tx.hpp"
#include<memory>
#include<sqlite3.h>

namespace Sqlite3 {

class Tx::Impl {
private:
	Sqlite3::Db db;
	bool open;

	sqlite3* connection() const {
		return (sqlite3*) db.get_connection();
	}
	void exec(char const* sql) {
		if (sqlite3_exec(connection(), sql, nullptr, nullptr, nullptr)
		    != SQLITE_OK)
			Detail::throw_error(connection(), sql);
	}

public:
	explicit
	Impl(Sqlite3::Db const& db_) : db(db_), open(false) {
		exec("BEGIN IMMEDIATE");
		open = true;
	}
	~Impl() {
		if (open)
			/* Fails only if SQLITE3 already rolled
			 * back on its own.  */
			(void) sqlite3_exec( connection(), "ROLLBACK"
					   , nullptr, nullptr, nullptr
					   );
		db.transaction_finish();
	}

	void commit() {
		exec("COMMIT");
		open = false;
	}

	void query_execute(char const* q) {
		exec(q);
	}
	int changes() const {
		return sqlite3_changes(connection());
	}

	Query query(char const* sql) {
		auto stmt = (sqlite3_stmt*) nullptr;
		auto res = sqlite3_prepare_v2( connection(), sql, -1
					     , &stmt, nullptr
					     );
		if (res != SQLITE_OK)
			Detail::throw_error(connection(), sql);
		return Query(db, stmt);
	}
};

Tx::Tx(Sqlite3::Db const& db)
		: pimpl(std::make_unique<Impl>(db)) { }
Tx::Tx() : pimpl(nullptr) { }
Tx::Tx(Tx&& o) : pimpl(std::move(o.pimpl)) { }
Tx::~Tx() { }

Tx& Tx::operator=(Tx&& o) {
	auto tmp = std::move(o);
	std::swap(pimpl, tmp.pimpl);
	return *this;
}

void Tx::commit() {
	auto p = std::move(pimpl);
	p->commit();
}
void Tx::rollback() {
	pimpl = nullptr;
}

Query Tx::query(char const* sql) {
	return pimpl->query(sql);
}
Query Tx::query(std::string const& q) {
	return query(q.c_str());
}
void Tx::query_execute(char const* q) {
	pimpl->query_execute(q);
}
int Tx::changes() const {
	return pimpl->changes();
}

}
