#include"Jsmn/Detail/Str.hpp"
#include"Util/Str.hpp"
#include<cmath>
#include<cstdint>
#include<iomanip>
#include<locale>
#include<sstream>
#include<stdexcept>

namespace {

void put_utf8(std::string& out, std::uint32_t cp) {
	if (cp < 0x80) {
		out.push_back(char(cp));
	} else if (cp < 0x800) {
		out.push_back(char(0xC0 | (cp >> 6)));
		out.push_back(char(0x80 | (cp & 0x3F)));
	} else if (cp < 0x10000) {
		out.push_back(char(0xE0 | (cp >> 12)));
		out.push_back(char(0x80 | ((cp >> 6) & 0x3F)));
		out.push_back(char(0x80 | (cp & 0x3F)));
	} else {
		out.push_back(char(0xF0 | (cp >> 18)));
		out.push_back(char(0x80 | ((cp >> 12) & 0x3F)));
		out.push_back(char(0x80 | ((cp >> 6) & 0x3F)));
		out.push_back(char(0x80 | (cp & 0x3F)));
	}
}

std::uint32_t read_u4(std::string const& s, std::size_t at) {
	if (at + 4 > s.size())
		throw std::invalid_argument("Truncated \\u escape.");
	auto bytes = Util::Str::hexread(s.substr(at, 4));
	return (std::uint32_t(bytes[0]) << 8) | std::uint32_t(bytes[1]);
}

}

namespace Jsmn { namespace Detail { namespace Str {

std::string to_escaped(std::string const& s) {
	auto rv = std::string();
	rv.reserve(s.size());
	for (auto c : s) {
		switch (c) {
		case '"': rv += "\\\""; break;
		case '\\': rv += "\\\\"; break;
		case '\b': rv += "\\b"; break;
		case '\f': rv += "\\f"; break;
		case '\n': rv += "\\n"; break;
		case '\r': rv += "\\r"; break;
		case '\t': rv += "\\t"; break;
		default:
			if ((unsigned char) c < 0x20) {
				auto os = std::ostringstream();
				os << "\\u" << std::hex << std::setfill('0')
				   << std::setw(4) << unsigned((unsigned char) c);
				rv += os.str();
			} else
				rv.push_back(c);
		}
	}
	return rv;
}

std::string from_escaped(std::string const& s) {
	auto rv = std::string();
	rv.reserve(s.size());
	for (auto i = std::size_t(0); i < s.size(); ++i) {
		if (s[i] != '\\') {
			rv.push_back(s[i]);
			continue;
		}
		if (++i == s.size())
			throw std::invalid_argument("Trailing backslash.");
		switch (s[i]) {
		case '"': rv.push_back('"'); break;
		case '\\': rv.push_back('\\'); break;
		case '/': rv.push_back('/'); break;
		case 'b': rv.push_back('\b'); break;
		case 'f': rv.push_back('\f'); break;
		case 'n': rv.push_back('\n'); break;
		case 'r': rv.push_back('\r'); break;
		case 't': rv.push_back('\t'); break;
		case 'u': {
			auto cp = read_u4(s, i + 1);
			i += 4;
			/* Surrogate pair.  */
			if ( cp >= 0xD800 && cp < 0xDC00
			  && i + 6 < s.size()
			  && s[i + 1] == '\\' && s[i + 2] == 'u'
			   ) {
				auto lo = read_u4(s, i + 3);
				if (lo >= 0xDC00 && lo < 0xE000) {
					cp = 0x10000
					   + ((cp - 0xD800) << 10)
					   + (lo - 0xDC00)
					   ;
					i += 6;
				}
			}
			put_utf8(rv, cp);
		} break;
		default:
			throw std::invalid_argument("Unknown escape.");
		}
	}
	return rv;
}

double to_double(std::string const& s) {
	auto is = std::istringstream(s);
	is.imbue(std::locale::classic());
	auto rv = double(0);
	is >> rv;
	return rv;
}
std::string from_double(double d) {
	auto os = std::ostringstream();
	os.imbue(std::locale::classic());
	/* Whole numbers, such as msat amounts and
	 * timestamps, print without an exponent.  */
	if (std::floor(d) == d && std::fabs(d) < 9007199254740992.0)
		os << std::int64_t(d);
	else
		os << std::setprecision(17) << d;
	return os.str();
}

}}}
