#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"
#include"Jsmn/Object.hpp"
#include"Jsmn/Parser.hpp"
#include"Json/Out.hpp"
#include"Ln/Preimage.hpp"
#include"Mint/Config.hpp"
#include"Mint/Error.hpp"
#include"Mint/Lightning/ClnBackend.hpp"
#include"Mint/Lightning/FakeBackend.hpp"
#include"Mint/Mod/Rpc.hpp"
#include"Mint/Mod/Waiter.hpp"
#include"Mint/Shutdown.hpp"
#include"Net/Fd.hpp"
#include"S/Bus.hpp"
#include"tests/mint/expect_failure.hpp"
#include<assert.h>
#include<errno.h>
#include<functional>
#include<map>
#include<sys/types.h>
#include<unistd.h>

using namespace Mint::Lightning;

namespace {

auto const preimage_hex = std::string(
	"0101010101010101010101010101010101010101010101010101010101010101"
);

/* Just enough of lightningd to answer the commands we
 * send it.
 * Each handler returns the `result`, or throws a
 * std::string for an `error`.  */
class FakeLightningd {
public:
	typedef std::function<Json::Out(Jsmn::Object const&)> Handler;

private:
	Net::Fd socket;
	Jsmn::Parser parser;
	std::map<std::string, Handler> handlers;
	bool stopped;

	Ev::Io<void> writeloop(std::string to_write) {
		return Ev::yield().then([this, to_write]() {
			auto res = write( socket.get()
					, to_write.c_str(), to_write.size()
					);
			if (res < 0 && ( errno == EWOULDBLOCK
				      || errno == EAGAIN
				       ))
				return writeloop(to_write);
			assert(res >= 0);
			if (std::size_t(res) < to_write.size())
				return writeloop(to_write.substr(res));
			return Ev::lift();
		});
	}

	std::string answer(Jsmn::Object const& req) {
		auto id = double(req["id"]);
		auto method = std::string(req["method"]);
		auto it = handlers.find(method);
		assert(it != handlers.end());
		try {
			auto result = it->second(req["params"]);
			return Json::Out()
				.start_object()
					.field("jsonrpc", std::string("2.0"))
					.field("id", id)
					.field("result", result)
				.end_object()
				.output()
				;
		} catch (std::string const& message) {
			auto err = Json::Out()
				.start_object()
					.field("code", double(-1))
					.field("message", message)
				.end_object()
				;
			return Json::Out()
				.start_object()
					.field("jsonrpc", std::string("2.0"))
					.field("id", id)
					.field("error", err)
				.end_object()
				.output()
				;
		}
	}

public:
	explicit
	FakeLightningd(Net::Fd socket_) : socket(std::move(socket_))
					, stopped(false) {
		socket.set_nonblocking();
	}

	void on(std::string const& method, Handler h) {
		handlers[method] = std::move(h);
	}
	void stop() { stopped = true; }

	Ev::Io<void> serve() {
		return Ev::yield().then([this]() {
			if (stopped)
				return Ev::lift();
			char buf[1024];
			auto data = std::string();
			for (;;) {
				auto res = read(socket.get(), buf, sizeof(buf));
				if (res <= 0)
					break;
				data.append(buf, std::size_t(res));
			}
			auto act = Ev::lift();
			if (!data.empty())
				for (auto const& req : parser.feed(data))
					act += writeloop(answer(req));
			return act.then([this]() {
				return serve();
			});
		});
	}
};

Json::Out one(std::string const& array, Json::Out item) {
	auto rv = Json::Out();
	auto obj = rv.start_object();
	auto arr = obj.start_array(array);
	arr.entry(item);
	arr.end_array();
	obj.end_object();
	return rv;
}

Json::Out none(std::string const& array) {
	auto rv = Json::Out();
	auto obj = rv.start_object();
	obj.start_array(array).end_array();
	obj.end_object();
	return rv;
}

Json::Out with_status(std::string const& status) {
	return Json::Out()
		.start_object()
			.field("status", status)
		.end_object()
		;
}

Json::Out complete() {
	return Json::Out()
		.start_object()
			.field("status", std::string("complete"))
			.field("payment_preimage", preimage_hex)
			.field("preimage", preimage_hex)
			.field("amount_msat", std::uint64_t(100000))
			.field("amount_sent_msat", std::uint64_t(100500))
		.end_object()
		;
}

}

int main() {
	auto bus = S::Bus();
	auto waiter = Mint::Mod::Waiter(bus);
	auto config = Mint::Config();
	config.pay_timeout = 60;

	auto sockets = Net::Fd::socketpair();
	auto lightningd = FakeLightningd(std::move(sockets.first));
	auto rpc = Mint::Mod::Rpc(bus, std::move(sockets.second));
	auto backend = ClnBackend(bus, rpc, waiter, config);

	/* Only used to make invoices that decode.  */
	auto other_node = FakeBackend(config);
	auto hash = Sha256::Hash();
	auto invoice = other_node.make_invoice(Ln::Amount::sat(100), hash);

	auto client = Ev::lift().then([&]() {
		lightningd.on("invoice", [&](Jsmn::Object const& p) {
			assert(double(p["amount_msat"]) == 2000);
			assert(std::string(p["label"]).substr(0, 7) == "clmint-");
			assert(double(p["expiry"]) == 600);
			return Json::Out()
				.start_object()
					.field("bolt11", invoice)
					.field("payment_hash", std::string(hash))
					.field("expires_at", double(1700000600))
				.end_object()
				;
		});
		return backend.create_invoice(Ln::Amount::sat(2), "test", 600);
	}).then([&](Invoice inv) {
		assert(inv.request == invoice);
		assert(inv.payment_hash == hash);
		assert(inv.expiry == 1700000600);

		lightningd.on("listinvoices", [&](Jsmn::Object const& p) {
			assert(std::string(p["payment_hash"]) == std::string(hash));
			return one("invoices", with_status("paid"));
		});
		return backend.invoice_status(hash);
	}).then([&](InvoiceStatus s) {
		assert(s == InvoiceStatus_Paid);

		lightningd.on("listinvoices", [](Jsmn::Object const&) {
			return one("invoices", with_status("unpaid"));
		});
		return backend.invoice_status(hash);
	}).then([&](InvoiceStatus s) {
		assert(s == InvoiceStatus_Unpaid);

		/* Deleted invoices can never be paid.  */
		lightningd.on("listinvoices", [](Jsmn::Object const&) {
			return none("invoices");
		});
		return backend.invoice_status(hash);
	}).then([&](InvoiceStatus s) {
		assert(s == InvoiceStatus_Expired);

		lightningd.on("listinvoices", [](Jsmn::Object const&) -> Json::Out {
			throw std::string("database is locked");
		});
		return expect_failure( backend.invoice_status(hash)
				     , Mint::ErrorCode_BackendUnavailable
				     );
	}).then([&]() {
		lightningd.on("pay", [&](Jsmn::Object const& p) {
			assert(std::string(p["bolt11"]) == invoice);
			assert(double(p["maxfee"]) == 1000);
			return complete();
		});
		return backend.pay(invoice, Ln::Amount::sat(100), Ln::Amount::sat(1));
	}).then([&](PaymentResult r) {
		assert(r.status == PaymentStatus_Succeeded);
		assert(r.preimage == Ln::Preimage(preimage_hex));
		assert(r.fee_paid == Ln::Amount::msat(500));

		/* `pay` errors, and no attempt is on record.  */
		lightningd.on("pay", [](Jsmn::Object const&) -> Json::Out {
			throw std::string("no route");
		});
		lightningd.on("listpays", [](Jsmn::Object const&) {
			return none("pays");
		});
		return backend.pay(invoice, Ln::Amount::sat(100), Ln::Amount::sat(1));
	}).then([&](PaymentResult r) {
		assert(r.status == PaymentStatus_Failed);

		/* `pay` errors, but an attempt is still going.  */
		lightningd.on("listpays", [](Jsmn::Object const&) {
			auto rv = Json::Out();
			auto obj = rv.start_object();
			auto arr = obj.start_array("pays");
			arr.entry(with_status("failed"));
			arr.entry(with_status("pending"));
			arr.end_array();
			obj.end_object();
			return rv;
		});
		return backend.pay(invoice, Ln::Amount::sat(100), Ln::Amount::sat(1));
	}).then([&](PaymentResult r) {
		assert(r.status == PaymentStatus_Uncertain);

		/* `pay` errors and so does `listpays`.  */
		lightningd.on("listpays", [](Jsmn::Object const&) -> Json::Out {
			throw std::string("lightningd is shutting down");
		});
		return expect_failure( backend.pay(invoice, Ln::Amount::sat(100), Ln::Amount::sat(1))
				     , Mint::ErrorCode_BackendUnavailable
				     );
	}).then([&]() {
		lightningd.on("listpays", [](Jsmn::Object const&) {
			auto rv = Json::Out();
			auto obj = rv.start_object();
			auto arr = obj.start_array("pays");
			arr.entry(with_status("failed"));
			arr.entry(complete());
			arr.end_array();
			obj.end_object();
			return rv;
		});
		return backend.payment_status(hash);
	}).then([&](PaymentResult r) {
		assert(r.status == PaymentStatus_Succeeded);
		assert(r.preimage == Ln::Preimage(preimage_hex));

		lightningd.on("listpays", [](Jsmn::Object const&) {
			return one("pays", with_status("failed"));
		});
		return backend.payment_status(hash);
	}).then([&](PaymentResult r) {
		assert(r.status == PaymentStatus_Failed);

		lightningd.on("listpays", [](Jsmn::Object const&) {
			return none("pays");
		});
		return backend.payment_status(hash);
	}).then([&](PaymentResult r) {
		assert(r.status == PaymentStatus_Unknown);

		lightningd.stop();
		return bus.raise(Mint::Shutdown());
	}).then([]() {
		return Ev::lift(0);
	});

	auto code = Ev::lift().then([&]() {
		return Ev::concurrent(lightningd.serve());
	}).then([&]() {
		return client;
	});

	return Ev::start(code);
}
