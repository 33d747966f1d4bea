#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Mint/Shutdown.hpp"
#include"Mint/concurrent.hpp"
#include"Mint/log.hpp"
#include<stdexcept>
#include<string>

namespace Mint {

Ev::Io<void> concurrent(S::Bus& bus, char const* who, Ev::Io<void> io) {
	auto name = std::string(who);
	auto guarded = std::move(io).catching<Mint::Shutdown>([](Mint::Shutdown const&) {
		return Ev::lift();
	}).catching<std::exception>([&bus, name](std::exception const& e) {
		return Mint::log( bus, Error
				, "%s: %s"
				, name.c_str(), e.what()
				);
	});
	return Ev::concurrent(std::move(guarded));
}

}
