#undef NDEBUG
#include"Cashu/Keyset.hpp"
#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include"Mint/Config.hpp"
#include"Mint/Error.hpp"
#include"Mint/KeysetManager.hpp"
#include"S/Bus.hpp"
#include"Secp256k1/PubKey.hpp"
#include"Sqlite3.hpp"
#include"tests/mint/expect_failure.hpp"
#include<assert.h>
#include<memory>

namespace {

bool fails_with(std::function<void()> f, Mint::ErrorCode code) {
	try {
		f();
	} catch (Mint::Failure const& e) {
		return e.get_code() == code;
	}
	return false;
}

}

int main() {
	auto bus = S::Bus();
	auto db = Sqlite3::Db(":memory:");
	auto now = double(1000);
	auto get_now = [&now]() { return now; };

	auto config = Mint::Config();
	config.seed = "000102030405060708090a0b0c0d0e0f"
		      "101112131415161718191a1b1c1d1e1f";
	config.units = {"sat", "msat"};
	config.max_order = 8;
	config.keyset_retention = 100;

	auto km = std::make_shared<Mint::KeysetManager>(bus, db, config, get_now);
	auto gen_db = Sqlite3::Db(":memory:");
	auto gen_config = Mint::Config();
	auto gen_a = std::shared_ptr<Mint::KeysetManager>();
	auto gen_b = std::shared_ptr<Mint::KeysetManager>();

	auto old_sat = std::string();
	auto new_sat = std::string();

	auto code = Ev::lift().then([&]() {
		return km->load();
	}).then([&]() {
		auto list = km->list();
		assert(list.size() == 2);
		for (auto const& k : list) {
			assert(k.active);
			assert(k.counter == 0);
		}
		/* Sorted by unit.  */
		assert(list[0].unit == "msat");
		assert(list[1].unit == "sat");
		assert(km->units().size() == 2);

		auto const& sat = km->get_active("sat");
		old_sat = sat.get_id();
		assert(sat.get_pubkeys().size() == 8);
		assert(km->derive_keyset("sat", 0).get_id() == old_sat);
		assert(km->get_by_id(old_sat).get_unit() == "sat");
		assert(km->is_active(old_sat));
		assert(km->get_active("msat").get_id() != old_sat);

		assert(fails_with([&]() { km->get_active("usd"); }
				 , Mint::ErrorCode_UnsupportedUnit
				 ));
		assert(fails_with([&]() { km->get_by_id("00ffffffffffffff"); }
				 , Mint::ErrorCode_UnknownKeyset
				 ));

		return km->rotate("sat");
	}).then([&](Cashu::Keyset k) {
		new_sat = k.get_id();
		assert(k.get_counter() == 1);
		assert(new_sat != old_sat);
		assert(km->get_active("sat").get_id() == new_sat);
		assert(!km->is_active(old_sat));
		assert(km->is_active(new_sat));
		assert(km->list().size() == 3);

		/* Still redeemable within retention.  */
		now += 50;
		assert(km->get_for_verification(old_sat).get_id() == old_sat);
		now += 100;
		assert(fails_with([&]() { km->get_for_verification(old_sat); }
				 , Mint::ErrorCode_InactiveKeyset
				 ));
		/* Known, just not redeemable.  */
		assert(km->get_by_id(old_sat).get_id() == old_sat);

		return expect_failure( km->rotate("usd")
				     , Mint::ErrorCode_UnsupportedUnit
				     );
	}).then([&]() {
		/* A restart finds the same keysets.  */
		km = std::make_shared<Mint::KeysetManager>(bus, db, config, get_now);
		return km->load();
	}).then([&]() {
		assert(km->list().size() == 3);
		assert(km->get_active("sat").get_id() == new_sat);
		assert(!km->is_active(old_sat));

		/* Adding a unit later creates its keyset.  */
		config.units.push_back("usd");
		km = std::make_shared<Mint::KeysetManager>(bus, db, config, get_now);
		return km->load();
	}).then([&]() {
		assert(km->list().size() == 4);
		assert(km->get_active("usd").get_counter() == 0);

		/* Without a configured seed, one is made once
		 * and kept.  */
		gen_config.seed = "";
		gen_a = std::make_shared<Mint::KeysetManager>(bus, gen_db, gen_config, get_now);
		return gen_a->load();
	}).then([&]() {
		gen_b = std::make_shared<Mint::KeysetManager>(bus, gen_db, gen_config, get_now);
		return gen_b->load();
	}).then([&]() {
		assert(gen_a->get_active("sat").get_id()
		    == gen_b->get_active("sat").get_id());
		assert(gen_a->mint_pubkey() == gen_b->mint_pubkey());
		assert(gen_a->mint_pubkey() != km->mint_pubkey());
		return Ev::lift(0);
	});

	return Ev::start(code);
}
