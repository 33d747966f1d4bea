#include"Jsmn/Detail/Boundary.hpp"
#include"Jsmn/Detail/Document.hpp"
#include"Jsmn/Detail/Str.hpp"
#include"Jsmn/Object.hpp"
#include"Jsmn/Parser.hpp"

namespace Jsmn {

class Object::Impl {
private:
	std::shared_ptr<Detail::Document const> doc;
	unsigned int i;

	Detail::Token const& token() const {
		return doc->tokens[i];
	}
	std::shared_ptr<Impl> view(unsigned int at) const {
		return std::make_shared<Impl>(doc, at);
	}

	void require(Detail::Type t) const {
		if (token().type != t)
			throw TypeError();
	}

	/* Index of the value for `key`, or 0 since
	 * the root can never be a value.  */
	unsigned int find(std::string const& key) const {
		require(Detail::Object);
		auto k = i + 1;
		for (auto n = 0; n < token().size; ++n) {
			if (Detail::Str::from_escaped(doc->slice(k)) == key)
				return k + 1;
			k = doc->skip(k);
		}
		return 0;
	}

public:
	Impl( std::shared_ptr<Detail::Document const> doc_
	    , unsigned int i_
	    ) : doc(std::move(doc_)), i(i_) { }

	Detail::Type type() const { return token().type; }
	char first_char() const {
		return doc->text[token().start];
	}

	bool to_bool() const {
		require(Detail::Primitive);
		switch (first_char()) {
		case 't': return true;
		case 'f': return false;
		case 'n': return false;
		default: throw TypeError();
		}
	}
	std::string to_string() const {
		require(Detail::String);
		return Detail::Str::from_escaped(doc->slice(i));
	}
	double to_double() const {
		require(Detail::Primitive);
		auto c = first_char();
		if (c == 't' || c == 'f' || c == 'n')
			throw TypeError();
		return Detail::Str::to_double(doc->slice(i));
	}
	std::string direct_text() const {
		return doc->slice(i);
	}

	std::size_t size() const {
		if (type() != Detail::Object && type() != Detail::Array)
			throw TypeError();
		return std::size_t(token().size);
	}

	std::vector<std::string> keys() const {
		require(Detail::Object);
		auto rv = std::vector<std::string>();
		auto k = i + 1;
		for (auto n = 0; n < token().size; ++n) {
			rv.push_back(Detail::Str::from_escaped(doc->slice(k)));
			k = doc->skip(k);
		}
		return rv;
	}
	bool has(std::string const& key) const {
		return find(key) != 0;
	}
	std::shared_ptr<Impl> at(std::string const& key) const {
		auto k = find(key);
		if (k == 0)
			return nullptr;
		return view(k);
	}
	std::shared_ptr<Impl> at(std::size_t n) const {
		require(Detail::Array);
		if (n >= std::size_t(token().size))
			return nullptr;
		auto k = i + 1;
		for (auto e = std::size_t(0); e < n; ++e)
			k = doc->skip(k);
		return view(k);
	}

	Detail::Iterator begin() const {
		require(Detail::Array);
		return Detail::Iterator(doc, i + 1);
	}
	Detail::Iterator end() const {
		require(Detail::Array);
		return Detail::Iterator(doc, doc->skip(i));
	}
};

Object::Object() { }
Object::Object( std::shared_ptr<Detail::Document const> doc
	      , unsigned int i
	      ) : pimpl(std::make_shared<Impl>(std::move(doc), i)) { }

bool Object::is_null() const {
	return !pimpl
	    || ( pimpl->type() == Detail::Primitive
	      && pimpl->first_char() == 'n'
	       );
}
bool Object::is_boolean() const {
	if (!pimpl || pimpl->type() != Detail::Primitive)
		return false;
	auto c = pimpl->first_char();
	return c == 't' || c == 'f';
}
bool Object::is_string() const {
	return pimpl && pimpl->type() == Detail::String;
}
bool Object::is_object() const {
	return pimpl && pimpl->type() == Detail::Object;
}
bool Object::is_array() const {
	return pimpl && pimpl->type() == Detail::Array;
}
bool Object::is_number() const {
	return pimpl
	    && pimpl->type() == Detail::Primitive
	    && !is_boolean()
	    && !is_null()
	     ;
}

Object::operator bool() const {
	return pimpl && pimpl->to_bool();
}
Object::operator std::string() const {
	if (!pimpl)
		throw TypeError();
	return pimpl->to_string();
}
Object::operator double() const {
	if (!pimpl)
		throw TypeError();
	return pimpl->to_double();
}

std::size_t Object::size() const {
	if (!pimpl)
		throw TypeError();
	return pimpl->size();
}
std::vector<std::string> Object::keys() const {
	if (!pimpl)
		throw TypeError();
	return pimpl->keys();
}
bool Object::has(std::string const& key) const {
	if (!pimpl)
		throw TypeError();
	return pimpl->has(key);
}
Object Object::operator[](std::string const& key) const {
	if (!pimpl)
		throw TypeError();
	auto rv = Object();
	rv.pimpl = pimpl->at(key);
	return rv;
}
Object Object::operator[](std::size_t n) const {
	if (!pimpl)
		throw TypeError();
	auto rv = Object();
	rv.pimpl = pimpl->at(n);
	return rv;
}

std::string Object::direct_text() const {
	if (!pimpl)
		return "null";
	return pimpl->direct_text();
}

Detail::Iterator Object::begin() const {
	if (!pimpl)
		throw TypeError();
	return pimpl->begin();
}
Detail::Iterator Object::end() const {
	if (!pimpl)
		throw TypeError();
	return pimpl->end();
}

namespace {

void print(std::ostream& os, Jsmn::Object const& o) {
	if (o.is_object()) {
		auto sep = "";
		os << '{';
		for (auto const& key : o.keys()) {
			os << sep << '"' << Detail::Str::to_escaped(key) << "\": ";
			print(os, o[key]);
			sep = ", ";
		}
		os << '}';
	} else if (o.is_array()) {
		auto sep = "";
		os << '[';
		for (auto e : o) {
			os << sep;
			print(os, e);
			sep = ", ";
		}
		os << ']';
	} else if (o.is_string()) {
		os << '"' << Detail::Str::to_escaped(std::string(o)) << '"';
	} else {
		/* Numbers, booleans and null as written.  */
		os << o.direct_text();
	}
}

}

std::ostream& operator<<(std::ostream& os, Jsmn::Object const& o) {
	print(os, o);
	return os;
}

std::istream& operator>>(std::istream& is, Jsmn::Object& o) {
	is >> std::ws;
	if (!is || is.peek() == std::char_traits<char>::eof())
		return is;

	auto boundary = Detail::Boundary();
	auto parser = Jsmn::Parser();
	auto text = std::string();
	auto c = char();
	while (is.get(c)) {
		text.push_back(c);
		if (!boundary.feed(c))
			continue;
		auto res = parser.feed(text);
		text.clear();
		if (!res.empty()) {
			o = std::move(res[0]);
			return is;
		}
	}
	throw std::runtime_error("Jsmn::Object: input ended inside a JSON datum");
}

}
