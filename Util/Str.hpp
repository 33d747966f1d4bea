#ifndef UTIL_STR_HPP
#define UTIL_STR_HPP

#ifdef HAVE_CONFIG_H
# include"config.h"
#endif

#include"Util/BacktraceException.hpp"
#include<cstddef>
#include<cstdint>
#include<stdarg.h>
#include<sstream>
#include<stdexcept>
#include<string>
#include<vector>

namespace Util {
namespace Str {

/* Lowercase hex.  */
std::string hexbyte(std::uint8_t);
std::string hexdump(void const* p, std::size_t s);

struct HexParseFailure : public Util::BacktraceException<std::invalid_argument> {
	HexParseFailure(std::string const& msg)
		: Util::BacktraceException<std::invalid_argument>("hexread: " + msg) { }
};
/* Either case is accepted.  */
std::vector<std::uint8_t> hexread(std::string const&);

/* Even number of hex digits, possibly zero.  */
bool ishex(std::string const&);

std::string trim(std::string const& s);

/* `printf` into a `std::string`.  */
std::string fmt(char const *tpl, ...)
#if HAVE_ATTRIBUTE_FORMAT
	__attribute__ ((format (printf, 1, 2)))
#endif
;
std::string vfmt(char const *tpl, va_list ap);

/* Whatever `operator<<` prints for `v`.  */
template<typename a>
std::string show(a const& v) {
	auto os = std::ostringstream();
	os << v;
	return os.str();
}

}}

#endif /* !defined(UTIL_STR_HPP) */
