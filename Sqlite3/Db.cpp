#include"Ev/Io.hpp"
#include"Ev/yield.hpp"
#include"Sqlite3/Db.hpp"
#include"Sqlite3/Error.hpp"
#include"Sqlite3/Tx.hpp"
#include<queue>
#include<sqlite3.h>

namespace {

auto const pragmas = std::string(R"SQL(
PRAGMA foreign_keys = ON;
PRAGMA journal_mode = WAL;
PRAGMA synchronous = FULL;
)SQL");

auto const busy_timeout_ms = int(5000);

}

namespace Sqlite3 {

class Db::Impl {
private:
	sqlite3* connection;

	bool in_transaction;
	struct Waiter {
		std::function<void(Sqlite3::Tx)> pass;
		std::function<void(std::exception_ptr)> fail;
	};
	std::queue<Waiter> waiting;

	/* Start a transaction for the next waiter, failing
	 * any waiter whose BEGIN fails.  */
	void hand_over(Db const& db) {
		while (!waiting.empty()) {
			auto w = std::move(waiting.front());
			waiting.pop();
			auto tx = Sqlite3::Tx();
			try {
				tx = Sqlite3::Tx(db);
			} catch (Error const&) {
				w.fail(std::current_exception());
				continue;
			}
			return w.pass(std::move(tx));
		}
		in_transaction = false;
	}

	void fail(std::string const& where) {
		auto c = connection;
		try {
			Detail::throw_error(c, where);
		} catch (Error const&) {
			if (c)
				sqlite3_close_v2(c);
			connection = nullptr;
			throw;
		}
	}

public:
	explicit
	Impl(std::string const& filename)
		: connection(nullptr), in_transaction(false) {
		auto flags = SQLITE_OPEN_READWRITE
			   | SQLITE_OPEN_CREATE
			   | SQLITE_OPEN_NOMUTEX
			   ;
		if (sqlite3_open_v2(filename.c_str(), &connection, flags, nullptr)
		    != SQLITE_OK)
			fail("open " + filename);
		if (sqlite3_extended_result_codes(connection, 1) != SQLITE_OK)
			fail("sqlite3_extended_result_codes");
		if (sqlite3_busy_timeout(connection, busy_timeout_ms) != SQLITE_OK)
			fail("sqlite3_busy_timeout");
		if (sqlite3_exec(connection, pragmas.c_str(), nullptr, nullptr, nullptr)
		    != SQLITE_OK)
			fail("pragmas");
	}
	~Impl() {
		if (connection)
			sqlite3_close_v2(connection);
	}

	Ev::Io<Sqlite3::Tx> transact(Db const& db) {
		auto ptx = std::make_shared<Sqlite3::Tx>();
		return Ev::Io<Sqlite3::Tx>([ this, db
					   ]( std::function<void(Sqlite3::Tx)> pass
					    , std::function<void(std::exception_ptr)> fail
					    ) {
			waiting.push(Waiter{std::move(pass), std::move(fail)});
			if (in_transaction)
				return;
			in_transaction = true;
			hand_over(db);
		}).then([ptx](Sqlite3::Tx tx) {
			/* Let the previous holder unwind first.  */
			*ptx = std::move(tx);
			return Ev::yield();
		}).then([ptx]() {
			return Ev::lift(std::move(*ptx));
		});
	}
	void* get_connection() const { return connection; }
	void transaction_finish(Db const& db) {
		hand_over(db);
	}
};

void* Db::get_connection() const {
	return pimpl->get_connection();
}
void Db::transaction_finish() {
	return pimpl->transaction_finish(*this);
}
Ev::Io<Sqlite3::Tx> Db::transact() {
	return pimpl->transact(*this);
}

Db::Db( std::string const& filename
      ) : pimpl(std::make_shared<Impl>(filename)) { }

}
