#include"Jsmn/Detail/Boundary.hpp"

namespace Jsmn { namespace Detail {

bool Boundary::close() {
	if (depth != 0) {
		state = Inside;
		return false;
	}
	state = Between;
	return true;
}

bool Boundary::feed(char c) {
	switch (state) {
	case Escaped:
		state = Quoted;
		return false;
	case Quoted:
		if (c == '\\')
			state = Escaped;
		else if (c == '"')
			return close();
		return false;
	case Between:
	case Inside:
		break;
	}

	switch (c) {
	case '"':
		state = Quoted;
		return false;
	case '{':
	case '[':
		++depth;
		state = Inside;
		return false;
	case '}':
	case ']':
		if (depth != 0)
			--depth;
		return close();
	case ' ':
	case '\t':
	case '\n':
	case '\r':
	case '\v':
		if (state == Between)
			return false;
		return close();
	default:
		state = Inside;
		return false;
	}
}

}}
