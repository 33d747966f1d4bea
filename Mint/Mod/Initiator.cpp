#include"Mint/Mod/Initiator.hpp"
#include"Mint/Mod/Rpc.hpp"
#include"Mint/Msg/CommandRequest.hpp"
#include"Mint/Msg/CommandResponse.hpp"
#include"Mint/Msg/Init.hpp"
#include"Mint/Msg/ManifestOption.hpp"
#include"Mint/Msg/Manifestation.hpp"
#include"Mint/Msg/Option.hpp"
#include"Mint/log.hpp"
#include"Ev/ThreadPool.hpp"
#include"Ev/yield.hpp"
#include"Jsmn/Object.hpp"
#include"Json/Out.hpp"
#include"Net/Fd.hpp"
#include"S/Bus.hpp"
#include"Sqlite3.hpp"
#include"Util/BacktraceException.hpp"
#include"Util/Str.hpp"
#include<memory>
#include<set>
#include<stdexcept>

#ifdef HAVE_CONFIG_H
# include "config.h"
#endif

namespace {

auto const db_option = std::string("clmint-db");
auto const db_default = std::string("data.clmint");

}

namespace Mint { namespace Mod {

class Initiator::Impl {
private:
	S::Bus& bus;
	Ev::ThreadPool& threadpool;
	std::function<Net::Fd( std::string const&
			     , std::string const&
			     )> open_rpc_socket;

	Sqlite3::Db db;
	std::string db_file;

	bool initted;
	Ln::CommandId init_id;
	std::unique_ptr<Mint::Mod::Rpc> rpc;

	std::set<std::string> options;

	Ev::Io<void> error( std::string const& comment
			  , Jsmn::Object const& params
			  ) {
		auto ps = Util::Str::show(params);
		return Mint::log( bus, Mint::Error
				, "init: %s: %s"
				, comment.c_str()
				, ps.c_str()
				).then([]() {
			/* Let the log message get out first.  */
			return Ev::yield(32);
		}).then([comment]() {
			throw Util::BacktraceException<std::runtime_error>(
				"init: " + comment
			);
			return Ev::lift();
		});
	}

	Ev::Io<void> handle_options(Jsmn::Object options_j) {
		auto rv = Ev::lift();

		if (!options_j.is_object())
			return error( "options not object"
				    , options_j
				    );
		for (auto const& o : options) {
			if (!options_j.has(o))
				continue;
			auto value = options_j[o];
			rv += bus.raise(Msg::Option{o, std::move(value)});
		}
		return rv;
	}

	Ev::Io<void> init( std::string const& lightning_dir
			 , std::string const& rpc_file
			 ) {
		return threadpool.background< Net::Fd
					    >([ this
					      , lightning_dir
					      , rpc_file
					      ]() {
			return open_rpc_socket( lightning_dir
					      , rpc_file
					      );
		}).then([this](Net::Fd fd) {
			rpc = std::make_unique<Mint::Mod::Rpc>
				(bus, std::move(fd));
			return Mint::log( bus, Debug
					, "RPC socket opened."
					);
		}).then([this]() {
			db = Sqlite3::Db(db_file);
			return db.transact();
		}).then([this](Sqlite3::Tx tx) {
			/* "CLMT" */
			tx.query_execute("PRAGMA application_id = 0x434C4D54;");
			tx.query_execute("PRAGMA user_version = 1;");
			tx.commit();
			return Mint::log( bus, Debug
					, "Database file %s opened."
					, db_file.c_str()
					);
		}).then([this, lightning_dir]() {
			return bus.raise(Mint::Msg::Init{
				*rpc, db, lightning_dir
			});
		}).then([this]() {
			return Mint::log( bus, Debug
					, "Initialization raised."
					);
		}).then([this]() {
			return bus.raise(Mint::Msg::CommandResponse{
				init_id,
				Json::Out::empty_object()
			});
		}).then([this]() {
			return Mint::log( bus, Info
					, "Started."
					);
		});
	}

	Ev::Io<void> disable(std::string const& reason) {
		return Mint::log( bus, Mint::Error
				, "Cannot start: %s"
				, reason.c_str()
				).then([this, reason]() {
			return bus.raise(Mint::Msg::CommandResponse{
				init_id,
				Json::Out()
					.start_object()
						.field("disable", reason)
					.end_object()
			});
		});
	}

public:
	Impl( S::Bus& bus_
	    , Ev::ThreadPool& threadpool_
	    , std::function<Net::Fd( std::string const&
				   , std::string const&
				   )> open_rpc_socket_
	    ) : bus(bus_)
	      , threadpool(threadpool_)
	      , open_rpc_socket(std::move(open_rpc_socket_))
	      , db()
	      , db_file(db_default)
	      , initted(false)
	      {
		bus.subscribe<Mint::Msg::CommandRequest>([this](Mint::Msg::CommandRequest const& c) {
			if (c.command != "init")
				return Ev::lift();

			init_id = c.id;
			auto const& params = c.params;

			if (initted)
				return error("multiple init", params);
			initted = true;

			if (!params.is_object())
				return error("params not object", params);
			if (!params.has("configuration"))
				return error( "no 'configuration' param"
					    , params
					    );

			auto pre_act = Ev::lift();
			if (params.has("options"))
				pre_act += handle_options(params["options"]);

			auto configuration = params["configuration"];
			if (!configuration.is_object())
				return error( "configuration not object"
					    , configuration
					    );

			auto lightning_dir = std::string(".");
			if (configuration.has("lightning-dir")) {
				auto lightning_dir_js = configuration["lightning-dir"];
				if (!lightning_dir_js.is_string())
					return error( "lightning-dir not string"
						    , lightning_dir_js
						    );
				lightning_dir = std::string(lightning_dir_js);
			}

			auto rpc_file = std::string("lightning-rpc");
			if (configuration.has("rpc-file")) {
				auto rpc_file_js = configuration["rpc-file"];
				if (!rpc_file_js.is_string())
					return error( "rpc-file not string"
						    , rpc_file_js
						    );
				rpc_file = std::string(rpc_file_js);
			}

			return Mint::log( bus, Info
					, "%s"
					, PACKAGE_STRING
					)
			     + ( std::move(pre_act)
			       + init(lightning_dir, rpc_file)
			       ).catching<std::exception>([this](std::exception const& e) {
				return disable(e.what());
			});
		});

		bus.subscribe<Msg::Manifestation
			     >([this](Msg::Manifestation const&) {
			return bus.raise(Msg::ManifestOption{
				db_option, Msg::OptionType_String,
				Json::Out::direct(db_default),
				"Database file of the mint, relative to "
				"the lightning directory."
			});
		});
		bus.subscribe<Msg::ManifestOption
			     >([this](Msg::ManifestOption const& o) {
			options.insert(o.name);
			return Ev::lift();
		});
		bus.subscribe<Msg::Option
			     >([this](Msg::Option const& o) {
			if (o.name != db_option)
				return Ev::lift();
			if (o.value.is_string())
				db_file = std::string(o.value);
			return Ev::lift();
		});
	}
};

Initiator::Initiator( S::Bus& bus
		    , Ev::ThreadPool& threadpool
		    , std::function<Net::Fd( std::string const&
					   , std::string const&
					   )> open_rpc_socket
		    ) : pimpl(std::make_unique<Impl>( bus, threadpool
						     , std::move(open_rpc_socket)
						     ))
		      { }

Initiator::Initiator(Initiator&& o) : pimpl(std::move(o.pimpl)) { }
Initiator::~Initiator() { }

}}
