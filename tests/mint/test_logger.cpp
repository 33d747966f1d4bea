#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include"Jsmn/Object.hpp"
#include"Json/Out.hpp"
#include"Mint/Mod/Logger.hpp"
#include"Mint/Msg/JsonCout.hpp"
#include"Mint/Msg/ManifestOption.hpp"
#include"Mint/Msg/Manifestation.hpp"
#include"Mint/Msg/Option.hpp"
#include"Mint/log.hpp"
#include"S/Bus.hpp"
#include<assert.h>
#include<sstream>
#include<stdexcept>
#include<vector>

namespace {

Jsmn::Object parse(std::string const& text) {
	auto is = std::istringstream(text);
	auto rv = Jsmn::Object();
	is >> rv;
	return rv;
}

}

int main() {
	auto bus = S::Bus();
	auto logger = Mint::Mod::Logger(bus);

	auto out = std::vector<Jsmn::Object>();
	bus.subscribe<Mint::Msg::JsonCout>([&](Mint::Msg::JsonCout const& m) {
		out.push_back(parse(m.obj.output()));
		return Ev::lift();
	});
	auto registered = false;
	bus.subscribe<Mint::Msg::ManifestOption
		     >([&](Mint::Msg::ManifestOption const& o) {
		if (o.name == "clmint-log-level") {
			registered = true;
			assert(o.type == Mint::Msg::OptionType_String);
			assert(o.default_value.output() == "\"debug\"");
		}
		return Ev::lift();
	});

	auto level = Mint::LogLevel();
	assert(Mint::log_level_from_name("warn", level));
	assert(level == Mint::Warn);
	assert(!Mint::log_level_from_name("unusual", level));
	assert(std::string(Mint::log_level_name(Mint::Trace)) == "trace");

	auto code = Ev::lift().then([&]() {
		return bus.raise(Mint::Msg::Manifestation());
	}).then([&]() {
		assert(registered);

		/* Default threshold is debug.  */
		return Mint::log(bus, Mint::Trace, "Rpc: #%d listpays", 1);
	}).then([&]() {
		assert(out.empty());
		return Mint::log(bus, Mint::Debug, "Swap: %d inputs", 3);
	}).then([&]() {
		assert(out.size() == 1);
		assert(std::string(out[0]["method"]) == "log");
		assert(std::string(out[0]["params"]["level"]) == "debug");
		assert(std::string(out[0]["params"]["message"]) == "Swap: 3 inputs");

		out.clear();
		return bus.raise(Mint::Msg::Option{
			"clmint-log-level", parse("\"warn\"")
		});
	}).then([&]() {
		return Mint::log(bus, Mint::Info, "ignored");
	}).then([&]() {
		assert(out.empty());
		/* One notification per line.  */
		return Mint::log(bus, Mint::Error, "first\nsecond\n");
	}).then([&]() {
		assert(out.size() == 2);
		assert(std::string(out[0]["params"]["level"]) == "error");
		assert(std::string(out[0]["params"]["message"]) == "first");
		assert(std::string(out[1]["params"]["message"]) == "second");

		/* Long messages are not truncated.  */
		out.clear();
		auto long_text = std::string(1000, 'x');
		return Mint::log(bus, Mint::Warn, "%s", long_text.c_str());
	}).then([&]() {
		assert(out.size() == 1);
		assert(std::string(out[0]["params"]["message"]).size() == 1000);

		return bus.raise(Mint::Msg::Option{
			"clmint-log-level", parse("\"loud\"")
		}).then([]() {
			return Ev::lift(false);
		}).catching<std::invalid_argument>([](std::invalid_argument const&) {
			return Ev::lift(true);
		});
	}).then([&](bool rejected) {
		assert(rejected);
		return Ev::lift(0);
	});

	return Ev::start(code);
}
