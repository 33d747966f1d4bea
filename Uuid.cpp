#include"Util/BacktraceException.hpp"
#include"Util/Str.hpp"
#include"Uuid.hpp"
#include<sodium/core.h>
#include<sodium/randombytes.h>
#include<stdexcept>
#include<string.h>

namespace {

/* Where the dashes go in the text form.  */
bool dash_at(std::size_t i) {
	return i == 8 || i == 13 || i == 18 || i == 23;
}

}

Uuid::Uuid() {
	memset(data, 0, sizeof(data));
}

Uuid::Uuid(std::string const& s) {
	auto fail = [&s]() {
		return Util::BacktraceException<std::invalid_argument>(
			"Uuid: not a UUID: " + s
		);
	};
	if (s.size() != 36)
		throw fail();
	auto hex = std::string();
	for (auto i = std::size_t(0); i < s.size(); ++i) {
		if (dash_at(i)) {
			if (s[i] != '-')
				throw fail();
			continue;
		}
		hex.push_back(s[i]);
	}
	if (!Util::Str::ishex(hex))
		throw fail();
	auto buf = Util::Str::hexread(hex);
	memcpy(data, &buf[0], sizeof(data));
}

Uuid Uuid::random() {
	if (sodium_init() < 0)
		throw Util::BacktraceException<std::runtime_error>(
			"Uuid: libsodium failed to initialize"
		);
	auto rv = Uuid();
	randombytes_buf(rv.data, sizeof(rv.data));
	rv.data[6] = (rv.data[6] & 0x0F) | 0x40;
	rv.data[8] = (rv.data[8] & 0x3F) | 0x80;
	return rv;
}

Uuid::operator std::string() const {
	auto hex = Util::Str::hexdump(data, sizeof(data));
	auto rv = std::string();
	auto it = hex.begin();
	for (auto i = std::size_t(0); i < 36; ++i)
		rv.push_back(dash_at(i) ? '-' : *it++);
	return rv;
}

bool Uuid::operator==(Uuid const& o) const {
	return memcmp(data, o.data, sizeof(data)) == 0;
}
bool Uuid::operator<(Uuid const& o) const {
	return memcmp(data, o.data, sizeof(data)) < 0;
}
