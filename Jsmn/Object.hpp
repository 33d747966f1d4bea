#ifndef JSMN_OBJECT_HPP
#define JSMN_OBJECT_HPP

#include"Jsmn/Detail/Iterator.hpp"
#include<cstddef>
#include<istream>
#include<memory>
#include<ostream>
#include<stdexcept>
#include<string>
#include<vector>

namespace Jsmn { namespace Detail { struct Document; }}
namespace Jsmn { class Parser; }

namespace Jsmn {

/* Thrown when a value is used as the wrong JSON
 * type.  Command handlers report it as an invalid
 * parameter.  */
class TypeError : public std::invalid_argument {
public:
	TypeError() : std::invalid_argument("Incorrect JSON type.") { }
};

/** class Jsmn::Object
 *
 * @brief a read-only view of one value inside a
 * parsed JSON datum.
 *
 * @desc Copies share the parsed text.
 * A default-constructed object, or a missing
 * key or index, is JSON `null`.
 */
class Object {
private:
	class Impl;
	std::shared_ptr<Impl> pimpl;

	Object( std::shared_ptr<Detail::Document const>
	      , unsigned int
	      );

public:
	Object();

	Object(Object const&) =default;
	Object(Object&&) =default;
	Object& operator=(Object const&) =default;
	Object& operator=(Object&&) =default;

	bool is_null() const;
	bool is_boolean() const;
	bool is_string() const;
	bool is_object() const;
	bool is_array() const;
	bool is_number() const;

	/* Throw TypeError on the wrong type, except that
	 * null converts to false.  */
	explicit operator bool() const;
	explicit operator std::string() const;
	explicit operator double() const;

	/* Keys of an object, or elements of an array.  */
	std::size_t size() const;

	std::vector<std::string> keys() const;
	bool has(std::string const&) const;
	Object operator[](std::string const&) const;
	Object operator[](std::size_t) const;

	/* The unparsed text, e.g. to read a number
	 * without going through double.  */
	std::string direct_text() const;

	typedef Jsmn::Detail::Iterator const_iterator;
	typedef Jsmn::Detail::Iterator iterator;
	iterator begin() const;
	iterator end() const;

	friend class Parser;
	friend class Jsmn::Detail::Iterator;
};

/* Compact, single-line JSON.  */
std::ostream& operator<<(std::ostream&, Jsmn::Object const&);
/* Reads exactly one datum.  Leaves `o` unchanged
 * if the stream ends before one starts.  */
std::istream& operator>>(std::istream&, Jsmn::Object& o);

}

#endif /* !defined(JSMN_OBJECT_HPP) */
