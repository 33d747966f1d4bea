#include"Jsmn/Detail/Document.hpp"

namespace Jsmn { namespace Detail {

unsigned int Document::skip(unsigned int i) const {
	auto pending = 1u;
	while (pending != 0) {
		pending += unsigned(tokens[i].size);
		--pending;
		++i;
	}
	return i;
}

std::string Document::slice(unsigned int i) const {
	auto const& tok = tokens[i];
	return text.substr(tok.start, tok.end - tok.start);
}

}}
