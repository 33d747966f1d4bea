#include"Ev/Io.hpp"
#include"Json/Out.hpp"
#include"Mint/Mod/Logger.hpp"
#include"Mint/Msg/JsonCout.hpp"
#include"Mint/Msg/Log.hpp"
#include"Mint/Msg/ManifestOption.hpp"
#include"Mint/Msg/Manifestation.hpp"
#include"Mint/Msg/Option.hpp"
#include"Mint/log.hpp"
#include"S/Bus.hpp"
#include"Util/BacktraceException.hpp"
#include<memory>
#include<stdexcept>

namespace {

auto const option_name = std::string("clmint-log-level");

}

namespace Mint { namespace Mod {

class Logger::Impl {
private:
	S::Bus& bus;
	LogLevel threshold;

	Json::Out notification(LogLevel level, std::string const& line) {
		return Json::Out()
			.start_object()
				.field("jsonrpc", std::string("2.0"))
				.field("method", std::string("log"))
				.start_object("params")
					.field("level", std::string(log_level_name(level)))
					.field("message", line)
				.end_object()
			.end_object()
			;
	}

	Ev::Io<void> on_log(Msg::Log const& l) {
		if (l.level < threshold)
			return Ev::lift();
		auto act = Ev::lift();
		auto start = std::size_t(0);
		for (;;) {
			auto nl = l.message.find('\n', start);
			auto line = l.message.substr(start, nl == std::string::npos ?
							    std::string::npos :
							    nl - start);
			if (!line.empty())
				act += bus.raise(Msg::JsonCout{
					notification(l.level, line)
				});
			if (nl == std::string::npos)
				break;
			start = nl + 1;
		}
		return act;
	}

public:
	explicit
	Impl(S::Bus& bus_) : bus(bus_), threshold(Debug) {
		bus.subscribe<Msg::Log>([this](Msg::Log const& l) {
			return on_log(l);
		});
		bus.subscribe<Msg::Manifestation
			     >([this](Msg::Manifestation const&) {
			return bus.raise(Msg::ManifestOption{
				option_name, Msg::OptionType_String,
				Json::Out::direct(std::string("debug")),
				"Least severe log level passed to lightningd: "
				"trace, debug, info, warn or error."
			});
		});
		bus.subscribe<Msg::Option>([this](Msg::Option const& o) {
			if (o.name != option_name)
				return Ev::lift();
			auto name = o.value.is_string() ? std::string(o.value)
							: std::string();
			if (!log_level_from_name(name, threshold))
				throw Util::BacktraceException<std::invalid_argument>(
					option_name + ": unknown level '" + name + "'"
				);
			return Ev::lift();
		});
	}
};

Logger::Logger(S::Bus& bus) : pimpl(std::make_unique<Impl>(bus)) { }
Logger::Logger(Logger&&) =default;
Logger::~Logger() =default;

}}
