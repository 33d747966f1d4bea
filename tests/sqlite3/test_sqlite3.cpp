#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"
#include"Sqlite3.hpp"
#include"Sqlite3/Error.hpp"
#include<assert.h>
#include<cstdint>
#include<limits>
#include<memory>

int main() {
	auto db = Sqlite3::Db(":memory:");

	/* Transactions are handed out one at a time.  */
	auto order = std::string();
	auto append = [&](char c) {
		return db.transact().then([&, c](Sqlite3::Tx tx) {
			auto ptx = std::make_shared<Sqlite3::Tx>(std::move(tx));
			order.push_back(c);
			return Ev::yield().then([&, c, ptx]() {
				order.push_back(c);
				ptx->commit();
				return Ev::lift();
			});
		});
	};

	auto code = Ev::lift().then([&]() {
		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		assert(tx);
		tx.query_execute(R"QRY(
		CREATE TABLE "Spent"
		     ( y TEXT PRIMARY KEY
		     , amount INTEGER NOT NULL
		     , state TEXT NOT NULL
		     );
		)QRY");
		tx.commit();
		assert(!tx);

		return Ev::concurrent(append('a'));
	}).then([&]() {
		return Ev::concurrent(append('b'));
	}).then([&]() {
		return append('c');
	}).then([&]() {
		/* No transaction began while another was
		 * open.  */
		assert(order.size() == 6);
		assert(order[0] == order[1]);
		assert(order[2] == order[3]);
		assert(order[4] == order[5]);

		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		/* Full u64 range is not storable.  */
		auto big = std::uint64_t(1) << 62;
		tx.query(R"QRY(
		INSERT INTO "Spent" VALUES(:y, :amount, 'SPENT');
		)QRY")
			.bind(":y", "02aa")
			.bind(":amount", big)
			.execute()
			;
		assert(tx.changes() == 1);

		auto caught = false;
		try {
			tx.query(R"QRY(
			INSERT INTO "Spent" VALUES(:y, :amount, 'SPENT');
			)QRY")
				.bind(":y", "02bb")
				.bind(":amount", std::numeric_limits<std::uint64_t>::max())
				.execute()
				;
		} catch (Sqlite3::Error const& e) {
			caught = true;
			assert(!e.constraint());
		}
		assert(caught);

		/* The same Y twice violates the key.  */
		caught = false;
		try {
			tx.query(R"QRY(
			INSERT INTO "Spent" VALUES('02aa', 1, 'PENDING');
			)QRY").execute();
		} catch (Sqlite3::Error const& e) {
			caught = true;
			assert(e.constraint());
		}
		assert(caught);

		auto found = 0;
		for (auto& r : tx.query(R"QRY(
			SELECT amount, state FROM "Spent" WHERE y = :y;
			)QRY").bind(":y", std::string("02aa")).execute()) {
			++found;
			assert(r.get<std::uint64_t>(0) == big);
			assert(r.get<std::string>(1) == "SPENT");
		}
		assert(found == 1);

		/* Guarded update touches nothing.  */
		tx.query(R"QRY(
		UPDATE "Spent" SET state = 'UNSPENT'
		 WHERE y = '02aa' AND state = 'PENDING';
		)QRY").execute();
		assert(tx.changes() == 0);

		tx.commit();

		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		/* Dropped without commit: rolled back.  */
		tx.query_execute(R"QRY(DELETE FROM "Spent";)QRY");
		return Ev::lift();
	}).then([&]() {
		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		auto count = -1;
		for (auto& r : tx.query(R"QRY(SELECT COUNT(*) FROM "Spent";)QRY")
				.execute())
			count = r.get<int>(0);
		assert(count == 1);

		/* Negative values are not read as unsigned.  */
		auto caught = false;
		try {
			for (auto& r : tx.query("SELECT -1;").execute())
				(void) r.get<std::uint64_t>(0);
		} catch (Sqlite3::Error const&) {
			caught = true;
		}
		assert(caught);

		caught = false;
		try {
			tx.query("SELECT :x;").bind(":y", 1);
		} catch (Sqlite3::Error const&) {
			caught = true;
		}
		assert(caught);

		tx.rollback();
		return Ev::lift(0);
	});

	return Ev::start(code);
}
