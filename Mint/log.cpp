#include"Ev/Io.hpp"
#include"Mint/Msg/Log.hpp"
#include"Mint/log.hpp"
#include"S/Bus.hpp"
#include"Util/Str.hpp"
#include<stdarg.h>

namespace {

struct LevelName {
	Mint::LogLevel level;
	char const* name;
};
LevelName const level_names[] =
{ {Mint::Trace, "trace"}
, {Mint::Debug, "debug"}
, {Mint::Info, "info"}
, {Mint::Warn, "warn"}
, {Mint::Error, "error"}
};

}

namespace Mint {

char const* log_level_name(LogLevel l) {
	for (auto const& ln : level_names)
		if (ln.level == l)
			return ln.name;
	return "info";
}
bool log_level_from_name(std::string const& name, LogLevel& level) {
	for (auto const& ln : level_names)
		if (name == ln.name) {
			level = ln.level;
			return true;
		}
	return false;
}

Ev::Io<void> log(S::Bus& bus, LogLevel l, const char *fmt, ...) {
	va_list ap;
	va_start(ap, fmt);
	auto msg = Util::Str::vfmt(fmt, ap);
	va_end(ap);

	return bus.raise(Msg::Log{l, std::move(msg)});
}

}
