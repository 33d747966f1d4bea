#undef NDEBUG
#include<Ev/Io.hpp>
#include<Ev/start.hpp>
#include<Ev/yield.hpp>
#include<S/Bus.hpp>
#include<assert.h>
#include<memory>
#include<stdexcept>
#include<string>
#include<vector>

namespace {

struct QuotePaid {
	std::string quote;
};
struct QuoteExpired {
	std::string quote;
};

}

Ev::Io<void> io_main() {
	auto bus = std::make_shared<S::Bus>();
	auto seen = std::make_shared<std::vector<std::string>>();

	return Ev::yield().then([=]() {
		/* Nobody listening yet.  */
		return bus->raise(QuotePaid{"q0"});
	}).then([=]() {
		bus->subscribe<QuotePaid>([=](QuotePaid const& m) {
			seen->push_back("paid " + m.quote);
			return Ev::lift();
		});
		bus->subscribe<QuotePaid>([=](QuotePaid const& m) {
			/* Finishes later than the first.  */
			return Ev::yield().then([=]() {
				seen->push_back("late " + m.quote);
				return Ev::lift();
			});
		});
		return bus->raise(QuotePaid{"q1"});
	}).then([=]() {
		/* raise waits for every subscriber.  */
		assert(seen->size() == 2);
		assert((*seen)[0] == "paid q1");
		assert((*seen)[1] == "late q1");

		/* Only exact types are delivered.  */
		seen->clear();
		return bus->raise(QuoteExpired{"q2"});
	}).then([=]() {
		assert(seen->empty());

		/* A subscriber added during a raise misses
		 * that message but gets later ones.  */
		bus->subscribe<QuoteExpired>([=](QuoteExpired const& m) {
			bus->subscribe<QuoteExpired>([=](QuoteExpired const& m2) {
				seen->push_back("added " + m2.quote);
				return Ev::lift();
			});
			seen->push_back("expired " + m.quote);
			return Ev::lift();
		});
		return bus->raise(QuoteExpired{"q3"});
	}).then([=]() {
		assert(seen->size() == 1);
		assert((*seen)[0] == "expired q3");

		/* A failing subscriber fails the raise, after
		 * the others have run.  */
		seen->clear();
		bus->subscribe<int>([](int const&) -> Ev::Io<void> {
			throw std::runtime_error("subscriber failed");
		});
		bus->subscribe<int>([=](int const& i) {
			return Ev::yield().then([=]() {
				seen->push_back(std::to_string(i));
				return Ev::lift();
			});
		});
		return bus->raise(7).then([]() {
			return Ev::lift(false);
		}).catching<std::runtime_error>([](std::runtime_error const&) {
			return Ev::lift(true);
		});
	}).then([=](bool failed) {
		assert(failed);
		assert(seen->size() == 1);
		assert((*seen)[0] == "7");
		return Ev::lift();
	});
}

int main() {
	return Ev::start(io_main().then([](){
		return Ev::lift(0);
	}));
}
