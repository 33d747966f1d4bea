#ifndef SQLITE3_ERROR_HPP
#define SQLITE3_ERROR_HPP

#include"Util/BacktraceException.hpp"
#include<stdexcept>
#include<string>

namespace Sqlite3 {

/** class Sqlite3::Error
 *
 * @brief thrown when SQLITE3 reports a failure.
 *
 * @desc `code` is the extended result code.
 */
class Error : public Util::BacktraceException<std::runtime_error> {
public:
	int code;

	Error(std::string const& where, int code_, std::string const& msg)
		: Util::BacktraceException<std::runtime_error>(
			"Sqlite3: " + where + ": " + msg
		  )
		, code(code_)
		{ }

	/* A UNIQUE, NOT NULL, CHECK or FOREIGN KEY
	 * constraint was violated.  */
	bool constraint() const;
};

namespace Detail {

/* Throw an `Sqlite3::Error` built from the last error
 * on the connection.  */
[[noreturn]]
void throw_error(void* connection, std::string const& where);

}

}

#endif /* !defined(SQLITE3_ERROR_HPP) */
