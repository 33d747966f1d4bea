#ifndef JSON_OUT_HPP
#define JSON_OUT_HPP

#include"Jsmn/Detail/Str.hpp"
#include"Jsmn/Object.hpp"
#include<cstddef>
#include<memory>
#include<sstream>
#include<string>
#include<type_traits>

namespace Json { class Out; }

namespace Json { namespace Detail {

typedef std::ostringstream Content;
template<typename Up> class Object;
template<typename Up> class Array;

/* How a value of type `t` is written as JSON.  */
template<typename t, typename = void>
struct Serializer;

/* Integers are written exactly; amounts and
 * counters must not go through double.  */
template<typename t>
struct Serializer< t
		 , typename std::enable_if< std::is_integral<t>::value
					 && !std::is_same<t, bool>::value
					  >::type
		 > {
	static std::string serialize(t v) {
		return std::to_string(v);
	}
};
template<>
struct Serializer<double> {
	static std::string serialize(double v) {
		return Jsmn::Detail::Str::from_double(v);
	}
};
template<>
struct Serializer<bool> {
	static std::string serialize(bool v) {
		return v ? "true" : "false";
	}
};
template<>
struct Serializer<std::string> {
	static std::string serialize(std::string const& v) {
		return "\"" + Jsmn::Detail::Str::to_escaped(v) + "\"";
	}
};
template<std::size_t n>
struct Serializer<char [n]> {
	static std::string serialize(char const v[n]) {
		return Serializer<std::string>::serialize(v);
	}
};
template<>
struct Serializer<std::nullptr_t> {
	static std::string serialize(std::nullptr_t) {
		return "null";
	}
};

/* What objects and arrays have in common: where
 * to write, where to return to, and whether a
 * separator is due.  */
template<typename Up>
class Container {
protected:
	Up& up;
	Content& content;
	bool empty;

	Container(Up& up_, Content& content_, char open)
		: up(up_), content(content_), empty(true) {
		content << open;
	}

	void next() {
		if (!empty)
			content << ", ";
		empty = false;
	}
	void next(std::string const& key) {
		next();
		content << Serializer<std::string>::serialize(key) << ": ";
	}
	Up& close(char c) {
		content << c;
		return up;
	}
};

template<typename Up>
class Object : private Container<Up> {
private:
	using Container<Up>::content;
	using Container<Up>::next;

public:
	Object(Up& up_, Content& content_)
		: Container<Up>(up_, content_, '{') { }

	template<typename a>
	Object& field(std::string const& name, a const& value) {
		next(name);
		content << Serializer<a>::serialize(value);
		return *this;
	}

	Array<Object> start_array(std::string const& name) {
		next(name);
		return Array<Object>(*this, content);
	}
	Object<Object> start_object(std::string const& name) {
		next(name);
		return Object<Object>(*this, content);
	}

	Up& end_object() {
		return this->close('}');
	}
};

template<typename Up>
class Array : private Container<Up> {
private:
	using Container<Up>::content;
	using Container<Up>::next;

public:
	Array(Up& up_, Content& content_)
		: Container<Up>(up_, content_, '[') { }

	template<typename a>
	Array& entry(a const& value) {
		next();
		content << Serializer<a>::serialize(value);
		return *this;
	}

	Array<Array> start_array() {
		next();
		return Array<Array>(*this, content);
	}
	Object<Array> start_object() {
		next();
		return Object<Array>(*this, content);
	}

	Up& end_array() {
		return this->close(']');
	}
};

}

/** class Json::Out
 *
 * @brief builds JSON text, for JSON-RPC responses,
 * notifications and commands to lightningd.
 *
 * @desc
 *     Json::Out()
 *         .start_object()
 *             .field("unit", std::string("sat"))
 *             .start_array("keysets")
 *             .end_array()
 *         .end_object()
 *
 * Copies share the same text, so a value may be
 * passed around cheaply once built.
 */
class Out {
private:
	std::shared_ptr<Json::Detail::Content> content;

public:
	Out() : content(std::make_shared<Json::Detail::Content>()) { }
	/* Re-serialize a parsed value.  */
	explicit Out(Jsmn::Object const& js) : Out() {
		*content << js;
	}

	std::string output() const {
		return content->str();
	}

	Json::Detail::Object<Out> start_object() {
		return Json::Detail::Object<Out>(*this, *content);
	}
	Json::Detail::Array<Out> start_array() {
		return Json::Detail::Array<Out>(*this, *content);
	}

	static Out empty_object() {
		return Out().start_object().end_object();
	}

	/* A JSON value that is just `value`.  */
	template<typename a>
	static Out direct(a const& value);
};

namespace Detail {

template<>
struct Serializer<Json::Out> {
	static std::string serialize(Json::Out const& v) {
		return v.output();
	}
};
template<>
struct Serializer<Jsmn::Object> {
	static std::string serialize(Jsmn::Object const& v) {
		return Json::Out(v).output();
	}
};

}

template<typename a>
Out Out::direct(a const& value) {
	auto rv = Out();
	*rv.content << Json::Detail::Serializer<a>::serialize(value);
	return rv;
}

}

#endif /* !defined(JSON_OUT_HPP) */
