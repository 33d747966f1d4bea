#include"Ev/Io.hpp"
#include"Mint/Mod/JsonOutputter.hpp"
#include"Mint/Msg/JsonCout.hpp"
#include"S/Bus.hpp"
#include"Util/BacktraceException.hpp"
#include<stdexcept>
#include<string>

namespace Mint { namespace Mod {

JsonOutputter::JsonOutputter( std::ostream& cout_
			    , S::Bus& bus
			    ) : cout(cout_), written(0) {
	bus.subscribe<Msg::JsonCout>([this](Msg::JsonCout const& j) {
		if (!cout)
			throw Util::BacktraceException<std::runtime_error>(
				"JsonOutputter: stdout failed after "
				+ std::to_string(written) + " messages"
			);
		cout << j.obj.output() << "\n\n" << std::flush;
		++written;
		return Ev::lift();
	});
}

}}
