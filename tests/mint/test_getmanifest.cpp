#undef NDEBUG
#include<Ev/Io.hpp>
#include<Ev/start.hpp>
#include<Jsmn/Object.hpp>
#include<Jsmn/Parser.hpp>
#include<Mint/Main.hpp>
#include<Net/Fd.hpp>
#include<assert.h>
#include<iostream>
#include<set>
#include<sstream>
#include<stdexcept>

/* Test that getmanifest causes Mint::Main to emit
 * the commands and options we expect.
 */
namespace {
auto const expected_commands = std::vector<std::string>
{ "clmint-info"
, "clmint-keysets"
, "clmint-keys"
, "clmint-rotate"
, "clmint-mint-quote"
, "clmint-mint-quote-check"
, "clmint-mint"
, "clmint-melt-quote"
, "clmint-melt-quote-check"
, "clmint-melt"
, "clmint-swap"
, "clmint-checkstate"
};
auto const expected_options = std::vector<std::string>
{ "clmint-db"
, "clmint-seed"
, "clmint-units"
, "clmint-max-order"
, "clmint-fee-percent"
, "clmint-reserve-fee-min"
, "clmint-mint-quote-expiry"
, "clmint-melt-quote-expiry"
, "clmint-backend"
, "clmint-poll-interval"
, "clmint-name"
, "clmint-log-level"
};
}

int main() {
	auto argv = std::vector<std::string>{"clmint"};

	/* Send a single getmanifest command.  */
	auto cin = std::stringstream(R"JSON(
	{"id": 0, "method": "getmanifest", "params": {}}
	)JSON");
	auto cout = std::stringstream("");
	auto cerr = std::stringstream("");

	auto dummy_open_rpc_socket = []( std::string const& lightning_dir
				       , std::string const& rpc_file
				       ){
		throw std::runtime_error("Should not be called");
		return Net::Fd();
	};
	auto main = Mint::Main( argv, cin, cout, cerr
			      , dummy_open_rpc_socket
			      );

	auto ec = Ev::start(main.run().then([](int ec) {
		return Ev::lift(ec);
	}));
	assert(ec == 0);

	std::cout << cout.str() << std::endl;

	Jsmn::Parser parser;
	auto output = parser.feed(cout.str());
	/* Log notifications surround the response.  */
	auto response = Jsmn::Object();
	for (auto const& o : output) {
		assert(o.is_object());
		if (o.has("id"))
			response = o;
		else
			assert(std::string(o["method"]) == "log");
	}
	assert(response.is_object());
	assert(response.has("result"));
	auto result = response["result"];
	assert(result.is_object());
	assert(result.has("rpcmethods"));
	assert(result.has("options"));
	/* Stopping mid-melt would strand pending proofs.  */
	assert(result.has("dynamic") && !bool(result["dynamic"]));
	assert(result.has("nonnumericids") && bool(result["nonnumericids"]));
	assert(result["subscriptions"].is_array());
	assert(result["hooks"].size() == 0);
	auto j_rpcmethods = result["rpcmethods"];
	auto j_options = result["options"];
	assert(j_rpcmethods.is_array());
	assert(j_options.is_array());

	auto actual_commands = std::set<std::string>();
	auto actual_options = std::set<std::string>();
	for (auto cmd : j_rpcmethods) {
		assert(cmd.is_object());
		assert(cmd.has("name"));
		auto name = cmd["name"];
		assert(name.is_string());
		/* Every command documents its parameters.  */
		assert(cmd.has("usage"));
		assert(cmd.has("description"));
		actual_commands.emplace(std::string(name));
	}
	for (auto opt : j_options) {
		assert(opt.is_object());
		assert(opt.has("name"));
		auto name = opt["name"];
		assert(name.is_string());
		actual_options.emplace(std::string(name));
	}

	assert(actual_commands.size() == expected_commands.size());
	for (auto const& cmd : expected_commands) {
		assert(actual_commands.find(cmd) != actual_commands.end());
	}
	for (auto const& opt : expected_options) {
		assert(actual_options.find(opt) != actual_options.end());
	}

	return 0;
}
