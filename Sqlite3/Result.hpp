#ifndef SQLITE3_RESULT_HPP
#define SQLITE3_RESULT_HPP

#include"Sqlite3/Db.hpp"
#include"Sqlite3/Detail/columns.hpp"
#include<iterator>

namespace Sqlite3 { class Query; }
namespace Sqlite3 { class Result; }

namespace Sqlite3 {

/** class Sqlite3::Row
 *
 * @brief the current row of a `Sqlite3::Result`.
 */
class Row {
private:
	Result* r;

	friend class Sqlite3::Result;
	explicit
	Row(Result* r_) : r(r_) { }

public:
	Row(Row const&) =delete;

	/* Column `c`, counting from 0.  */
	template<typename a>
	a get(int c);
};

/** class Sqlite3::Result
 *
 * @brief rows produced by an executed query.
 *
 * @desc Single-pass: iterating advances the
 * underlying statement, so a `Result` can be
 * walked only once.
 * Statements that produce no rows (INSERT, UPDATE)
 * have already run when `execute()` returns.
 */
class Result {
private:
	Sqlite3::Db db;
	void* stmt;

	friend class Sqlite3::Query;
	friend class Sqlite3::Row;

	Result(Sqlite3::Db const& db_, void* stmt_);

	/* False once the statement is done.  */
	bool advance();

public:
	Result() =delete;
	Result(Result const&) =delete;
	Result(Result&&);
	~Result();

	class iterator : Row {
	private:
		friend class Sqlite3::Result;
		explicit
		iterator(Result* r_) : Row(r_ && r_->stmt ? r_ : nullptr) { }

	public:
		typedef std::input_iterator_tag iterator_category;
		typedef Row value_type;
		typedef Row& reference;
		typedef Row* pointer;
		typedef std::ptrdiff_t difference_type;

		iterator() : Row(nullptr) { }
		iterator(iterator const& o) : Row(o.r) { }

		bool operator==(iterator const& o) const { return r == o.r; }
		bool operator!=(iterator const& o) const { return r != o.r; }

		iterator& operator++() {
			if (r && !r->advance())
				r = nullptr;
			return *this;
		}
		Row& operator*() { return *this; }
	};

	iterator begin() { return iterator(this); }
	iterator end() { return iterator(); }
};

template<typename a>
a Row::get(int c) {
	return Detail::Column<a>::column(r->stmt, c);
}

}

#endif /* !defined(SQLITE3_RESULT_HPP) */
