#include"Util/Str.hpp"
#include<cctype>
#include<stdio.h>

namespace {

char const digits[] = "0123456789abcdef";

int nibble(char c) {
	if ('0' <= c && c <= '9')
		return c - '0';
	if ('a' <= c && c <= 'f')
		return c - 'a' + 10;
	if ('A' <= c && c <= 'F')
		return c - 'A' + 10;
	return -1;
}

}

namespace Util {
namespace Str {

std::string hexbyte(std::uint8_t v) {
	auto rv = std::string(2, '0');
	rv[0] = digits[v >> 4];
	rv[1] = digits[v & 0xF];
	return rv;
}

std::string hexdump(void const* vp, std::size_t s) {
	auto p = static_cast<std::uint8_t const*>(vp);
	auto rv = std::string();
	rv.reserve(s * 2);
	for (auto i = std::size_t(0); i < s; ++i) {
		rv.push_back(digits[p[i] >> 4]);
		rv.push_back(digits[p[i] & 0xF]);
	}
	return rv;
}

std::vector<std::uint8_t> hexread(std::string const& s) {
	if (s.size() % 2 != 0)
		throw HexParseFailure("odd number of digits");
	auto rv = std::vector<std::uint8_t>();
	rv.reserve(s.size() / 2);
	for (auto i = std::size_t(0); i < s.size(); i += 2) {
		auto hi = nibble(s[i]);
		auto lo = nibble(s[i + 1]);
		if (hi < 0 || lo < 0)
			throw HexParseFailure( "not a hex digit at offset "
					     + std::to_string(hi < 0 ? i : i + 1)
					     );
		rv.push_back(std::uint8_t((hi << 4) | lo));
	}
	return rv;
}

bool ishex(std::string const& s) {
	if (s.size() % 2 != 0)
		return false;
	for (auto c : s)
		if (nibble(c) < 0)
			return false;
	return true;
}

std::string trim(std::string const& s) {
	auto space = [](char c) {
		return std::isspace((unsigned char) c) != 0;
	};
	auto b = std::size_t(0);
	auto e = s.size();
	while (b < e && space(s[b]))
		++b;
	while (e > b && space(s[e - 1]))
		--e;
	return s.substr(b, e - b);
}

std::string vfmt(char const* tpl, va_list ap) {
	auto buf = std::string(64, '\0');
	for (;;) {
		va_list copy;
		va_copy(copy, ap);
		auto n = vsnprintf(&buf[0], buf.size(), tpl, copy);
		va_end(copy);
		if (n < 0)
			throw Util::BacktraceException<std::invalid_argument>(
				std::string("Util::Str::vfmt: bad format: ") + tpl
			);
		if (std::size_t(n) < buf.size()) {
			buf.resize(std::size_t(n));
			return buf;
		}
		buf.resize(std::size_t(n) + 1);
	}
}
std::string fmt(char const* tpl, ...) {
	va_list ap;
	va_start(ap, tpl);
	auto rv = vfmt(tpl, ap);
	va_end(ap);
	return rv;
}

}
}
