#include"Ev/Io.hpp"
#include"Jsmn/ParseError.hpp"
#include"Jsmn/Parser.hpp"
#include"Json/Out.hpp"
#include"Mint/Error.hpp"
#include"Mint/Mod/Rpc.hpp"
#include"Mint/Shutdown.hpp"
#include"Mint/log.hpp"
#include"Net/Fd.hpp"
#include"S/Bus.hpp"
#include"Util/Str.hpp"
#include<cstdint>
#include<errno.h>
#include<ev.h>
#include<map>
#include<memory>
#include<stdexcept>
#include<string.h>
#include<unistd.h>

namespace {

int error_code(Jsmn::Object const& e) {
	if (!e.is_object() || !e.has("code") || !e["code"].is_number())
		return 0;
	return int(double(e["code"]));
}
std::string error_message(Jsmn::Object const& e) {
	if (e.is_object() && e.has("message") && e["message"].is_string())
		return std::string(e["message"]);
	return Util::Str::show(e);
}

}

namespace Mint { namespace Mod {

RpcError::RpcError( std::string command_
		  , Jsmn::Object error_
		  ) : std::runtime_error( command_ + ": "
					+ error_message(error_)
					)
		    , command(std::move(command_))
		    , code(error_code(error_))
		    , message(error_message(error_))
		    , error(std::move(error_))
		    { }

class Rpc::Impl {
private:
	S::Bus& bus;
	Net::Fd socket;
	Jsmn::Parser parser;

	enum State { Open, Lost, Stopped };
	State state;
	/* Why the socket was lost.  */
	std::string lost_reason;

	std::uint64_t next_id;
	struct Pending {
		std::string command;
		std::function<void(Jsmn::Object)> pass;
		std::function<void(std::exception_ptr)> fail;
	};
	std::map<std::uint64_t, Pending> pendings;

	std::string outbox;

	ev_io reader;
	ev_io writer;

	std::exception_ptr closed_error() const {
		if (state == Stopped)
			return std::make_exception_ptr(Mint::Shutdown());
		return std::make_exception_ptr(Mint::Failure(
			ErrorCode_BackendUnavailable,
			"lightningd RPC: " + lost_reason
		));
	}

	void close(State new_state, std::string reason) {
		if (state != Open)
			return;
		state = new_state;
		lost_reason = std::move(reason);
		ev_io_stop(EV_DEFAULT_ &reader);
		ev_io_stop(EV_DEFAULT_ &writer);
		outbox.clear();

		auto failing = std::move(pendings);
		pendings.clear();
		for (auto& p : failing)
			p.second.fail(closed_error());
	}

	void answer(Jsmn::Object const& resp) {
		/* Notifications and junk.  */
		if ( !resp.is_object()
		  || !resp.has("id")
		  || !resp["id"].is_number()
		   )
			return;
		auto it = pendings.find(std::uint64_t(double(resp["id"])));
		if (it == pendings.end())
			return;
		auto p = std::move(it->second);
		pendings.erase(it);

		if (resp.has("error"))
			p.fail(std::make_exception_ptr(RpcError( std::move(p.command)
							       , resp["error"]
							       )));
		else
			p.pass(resp["result"]);
	}

	void on_readable() {
		char buf[4096];
		for (;;) {
			auto res = read(socket.get(), buf, sizeof(buf));
			if (res < 0 && errno == EINTR)
				continue;
			if (res < 0 && (errno == EAGAIN || errno == EWOULDBLOCK))
				return;
			if (res < 0)
				return close(Lost, std::string("read: ") + strerror(errno));
			if (res == 0)
				return close(Lost, "connection closed");

			auto responses = std::vector<Jsmn::Object>();
			try {
				responses = parser.feed(std::string(buf, std::size_t(res)));
			} catch (Jsmn::ParseError const& e) {
				return close(Lost, e.what());
			}
			for (auto const& r : responses) {
				answer(r);
				if (state != Open)
					return;
			}
		}
	}
	static
	void on_readable_static(EV_P_ ev_io* e, int) {
		static_cast<Impl*>(e->data)->on_readable();
	}

	void on_writable() {
		while (!outbox.empty()) {
			auto res = write(socket.get(), outbox.data(), outbox.size());
			if (res < 0 && errno == EINTR)
				continue;
			if (res < 0 && (errno == EAGAIN || errno == EWOULDBLOCK))
				break;
			if (res < 0)
				return close(Lost, std::string("write: ") + strerror(errno));
			outbox.erase(0, std::size_t(res));
		}
		if (outbox.empty())
			ev_io_stop(EV_DEFAULT_ &writer);
		else if (!ev_is_active(&writer))
			ev_io_start(EV_DEFAULT_ &writer);
	}
	static
	void on_writable_static(EV_P_ ev_io* e, int) {
		static_cast<Impl*>(e->data)->on_writable();
	}

	Ev::Io<Jsmn::Object> send( std::uint64_t id
				 , std::string const& command
				 , Json::Out const& params
				 ) {
		return Ev::Io<Jsmn::Object>([ this, id, command, params
					    ]( std::function<void(Jsmn::Object)> pass
					     , std::function<void(std::exception_ptr)> fail
					     ) {
			if (state != Open)
				return fail(closed_error());

			outbox += Json::Out()
				.start_object()
					.field("jsonrpc", std::string("2.0"))
					.field("id", id)
					.field("method", command)
					.field("params", params)
				.end_object()
				.output();
			outbox += "\n\n";
			pendings[id] = Pending{ command
					      , std::move(pass)
					      , std::move(fail)
					      };
			on_writable();
		});
	}

public:
	Impl( S::Bus& bus_
	    , Net::Fd socket_
	    ) : bus(bus_)
	      , socket(std::move(socket_))
	      , state(Open)
	      , next_id(0)
	      {
		socket.set_nonblocking();

		ev_io_init(&reader, &on_readable_static, socket.get(), EV_READ);
		reader.data = this;
		ev_io_start(EV_DEFAULT_ &reader);
		ev_io_init(&writer, &on_writable_static, socket.get(), EV_WRITE);
		writer.data = this;

		bus.subscribe<Mint::Shutdown>([this](Mint::Shutdown const&) {
			close(Stopped, "shutting down");
			return Ev::lift();
		});
	}
	~Impl() {
		close(Stopped, "shutting down");
	}

	Ev::Io<Jsmn::Object> command( std::string const& command
				    , Json::Out params
				    ) {
		auto id = next_id++;
		return Mint::log( bus, Trace
				, "Rpc: #%llu %s %s"
				, (unsigned long long) id
				, command.c_str()
				, params.output().c_str()
				).then([this, id, command, params]() {
			return send(id, command, params);
		}).then([this, id](Jsmn::Object result) {
			return Mint::log( bus, Trace
					, "Rpc: #%llu done"
					, (unsigned long long) id
					).then([result]() {
				return Ev::lift(result);
			});
		}).catching<RpcError>([this, id](RpcError const& e) {
			return Mint::log( bus, Debug
					, "Rpc: #%llu %s failed: %d %s"
					, (unsigned long long) id
					, e.command.c_str()
					, e.code
					, e.message.c_str()
					).then([e]() -> Ev::Io<Jsmn::Object> {
				throw e;
			});
		});
	}
};

Rpc::Rpc( S::Bus& bus
	, Net::Fd socket
	) : pimpl(std::make_unique<Impl>(bus, std::move(socket)))
	  { }
Rpc::Rpc(Rpc&& o) : pimpl(std::move(o.pimpl)) { }
Rpc::~Rpc() { }

Ev::Io<Jsmn::Object> Rpc::command( std::string const& command
				 , Json::Out params
				 ) {
	if (!pimpl)
		throw std::logic_error("Rpc: used after move");
	return pimpl->command(command, std::move(params));
}

}}
