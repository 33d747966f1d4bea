#include"Jsmn/Detail/Boundary.hpp"
#include"Jsmn/Detail/Document.hpp"
#include"Jsmn/Object.hpp"
#include"Jsmn/ParseError.hpp"
#include"Jsmn/Parser.hpp"
#include<algorithm>

/* jsmn.h carries its whole implementation, so
 * instantiate it here and only here.  */
#define JSMN_STATIC 1
#undef JSMN_HEADER
#define JSMN_PARENT_LINKS 1
#define JSMN_STRICT 1
# include <jsmn.h>

namespace {

Jsmn::Detail::Token convert(jsmntok_t const& tok) {
	auto rv = Jsmn::Detail::Token();
	switch (tok.type) {
	case JSMN_OBJECT: rv.type = Jsmn::Detail::Object; break;
	case JSMN_ARRAY: rv.type = Jsmn::Detail::Array; break;
	case JSMN_STRING: rv.type = Jsmn::Detail::String; break;
	case JSMN_PRIMITIVE: rv.type = Jsmn::Detail::Primitive; break;
	default: rv.type = Jsmn::Detail::Undefined; break;
	}
	rv.start = tok.start;
	rv.end = tok.end;
	rv.size = tok.size;
	return rv;
}

}

namespace Jsmn {

std::string ParseError::enmessage(std::string const& input, unsigned int i) {
	auto constexpr context = std::size_t(24);
	auto begin = i > context ? i - context : std::size_t(0);
	auto end = std::min(input.size(), std::size_t(i) + context);
	return "JSON parse error at offset " + std::to_string(i)
	     + " near: " + input.substr(begin, end - begin)
	     ;
}

class Parser::Impl {
private:
	/* Text not yet returned as a datum.  */
	std::string text;
	/* How much of `text` the boundary has seen.  */
	std::size_t scanned;
	Detail::Boundary boundary;
	std::vector<jsmntok_t> toks;

	/* Parse the datum at the front of `text`, which
	 * may end at `end`.
	 * Returns the number of characters consumed, or
	 * 0 if jsmn wants more text.  */
	std::size_t parse_one(std::size_t end, std::vector<Object>& out) {
		for (;;) {
			auto base = jsmn_parser();
			jsmn_init(&base);
			auto res = jsmn_parse( &base
					     , text.data(), end
					     , toks.data(), toks.size()
					     );
			if (res == JSMN_ERROR_NOMEM) {
				toks.resize(toks.size() * 2);
				continue;
			}
			if (res == JSMN_ERROR_INVAL)
				throw ParseError(text.substr(0, end), base.pos);
			if (res == JSMN_ERROR_PART)
				return 0;
			if (res > 0) {
				auto doc = std::make_shared<Detail::Document>();
				doc->text = text.substr(0, base.pos);
				doc->tokens.reserve(res);
				for (auto i = 0; i < res; ++i)
					doc->tokens.push_back(convert(toks[i]));
				out.push_back(Parser::wrap(std::move(doc)));
			}
			/* res == 0 is whitespace only.  */
			return base.pos;
		}
	}

public:
	Impl() : scanned(0), toks(16) { }

	std::vector<Object> feed(std::string const& s) {
		auto rv = std::vector<Object>();
		text += s;
		while (scanned < text.size()) {
			if (!boundary.feed(text[scanned++]))
				continue;
			auto consumed = parse_one(scanned, rv);
			if (consumed == 0)
				continue;
			text.erase(0, consumed);
			scanned -= std::min(scanned, consumed);
		}
		return rv;
	}
};

Jsmn::Object Parser::wrap(std::shared_ptr<Detail::Document const> doc) {
	return Jsmn::Object(std::move(doc), 0);
}

Parser::Parser() : pimpl(std::make_unique<Impl>()) { }
Parser::~Parser() { }

std::vector<Jsmn::Object> Parser::feed(std::string const& s) {
	return pimpl->feed(s);
}

}
