#ifndef SQLITE3_QUERY_HPP
#define SQLITE3_QUERY_HPP

#include"Sqlite3/Detail/binds.hpp"
#include<memory>
#include<string>

namespace Sqlite3 { class Db; }
namespace Sqlite3 { class Result; }
namespace Sqlite3 { class Tx; }

namespace Sqlite3 {

/** class Sqlite3::Query
 *
 * @brief a prepared statement waiting for its
 * `:name` parameters.
 *
 * @desc Unbound parameters are NULL.
 * `execute()` consumes the query.
 */
class Query {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

	friend class Sqlite3::Tx;
	Query(Sqlite3::Db const&, void*);

	void* get_stmt() const;
	int get_location(char const*) const;

public:
	Query() =delete;
	Query(Query&&);
	~Query();

	template<typename a>
	Query& bind(char const* field, a value) {
		Detail::Bind<a>::bind(get_stmt(), get_location(field), value);
		return *this;
	}
	template<typename a>
	Query& bind(std::string const& field, a value) {
		return bind<a>(field.c_str(), std::move(value));
	}

	Result execute();
};

}

#endif /* !defined(SQLITE3_QUERY_HPP) */
