#ifndef SQLITE3_TX_HPP
#define SQLITE3_TX_HPP

#include<memory>
#include<string>

namespace Sqlite3 { class Db; }
namespace Sqlite3 { class Query; }

namespace Sqlite3 {

/** class Sqlite3::Tx
 *
 * @brief an open transaction, obtained from
 * `Sqlite3::Db::transact`.
 *
 * @desc Movable, not copyable.
 * A valid `Tx` that is destroyed without `commit()`
 * rolls back.
 * `commit()` and `rollback()` end the transaction
 * and leave the object invalid; `commit()` only
 * returns once SQLITE3 has made the writes durable,
 * and throws `Sqlite3::Error` otherwise, in which
 * case the writes are rolled back.
 */
class Tx {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

	friend class Sqlite3::Db;
	explicit
	Tx(Sqlite3::Db const&);

public:
	Tx();
	Tx(Tx&&);
	~Tx();
	Tx& operator=(Tx&&);

	explicit
	operator bool() const { return !!pimpl; }
	bool operator!() const { return !pimpl; }

	Sqlite3::Query query(char const*);
	Sqlite3::Query query(std::string const&);

	/* Runs one or more statements without
	 * parameters or results, e.g. schema setup.  */
	void query_execute(char const*);
	void query_execute(std::string const& q) {
		query_execute(q.c_str());
	}

	/* Rows changed by the last INSERT, UPDATE or
	 * DELETE in this transaction.  */
	int changes() const;

	void commit();
	void rollback();
};

}

#endif /* !defined(SQLITE3_TX_HPP) */
