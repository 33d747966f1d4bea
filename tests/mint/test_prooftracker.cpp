#undef NDEBUG
#include"Cashu/Proof.hpp"
#include"Cashu/ProofState.hpp"
#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include"Mint/Error.hpp"
#include"Mint/ProofTracker.hpp"
#include"Secp256k1/PrivKey.hpp"
#include"Secp256k1/PubKey.hpp"
#include"Secp256k1/Random.hpp"
#include"Sqlite3.hpp"
#include<assert.h>

using Cashu::ProofState_Pending;
using Cashu::ProofState_Spent;
using Cashu::ProofState_Unspent;

int main() {
	auto db = Sqlite3::Db(":memory:");
	auto tracker = Mint::ProofTracker(db, []() { return 1000.0; });

	auto random = Secp256k1::Random();
	auto make_proof = [&](std::uint64_t amount, std::string secret) {
		auto C = Secp256k1::PubKey(Secp256k1::PrivKey(random));
		return Cashu::Proof{amount, "009a1f293253e41e", secret, C};
	};
	auto p1 = make_proof(1, "secret one");
	auto p2 = make_proof(2, "secret two");
	auto p3 = make_proof(4, "secret three");
	auto Ys = std::vector<std::string>{p1.Y(), p2.Y(), p3.Y()};

	auto code = Ev::lift().then([&]() {
		return tracker.init();
	}).then([&]() {
		return tracker.check_state(Ys);
	}).then([&](std::vector<Cashu::ProofState> states) {
		/* Never seen means unspent.  */
		assert(states.size() == 3);
		for (auto s : states)
			assert(s == ProofState_Unspent);

		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		tracker.reserve(tx, {p1, p2}, ProofState_Pending, "q1");
		tx.commit();
		return tracker.check_state(Ys);
	}).then([&](std::vector<Cashu::ProofState> states) {
		assert(states[0] == ProofState_Pending);
		assert(states[1] == ProofState_Pending);
		assert(states[2] == ProofState_Unspent);

		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		/* All or nothing: p3 is not reserved either.  */
		auto failed = false;
		try {
			tracker.reserve(tx, {p3, p1}, ProofState_Spent);
		} catch (Mint::Failure const& e) {
			assert(e.get_code() == Mint::ErrorCode_ProofNotUnspent);
			failed = true;
		}
		assert(failed);
		tx.rollback();
		return tracker.check_state(Ys);
	}).then([&](std::vector<Cashu::ProofState> states) {
		assert(states[2] == ProofState_Unspent);

		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		auto pending = tracker.pending_for_quote(tx, "q1");
		assert(pending.size() == 2);
		for (auto const& p : pending) {
			assert(p.secret == p1.secret || p.secret == p2.secret);
			if (p.secret == p1.secret) {
				assert(p.amount == 1);
				assert(p.C == p1.C);
				assert(p.id == p1.id);
			}
		}
		assert(tracker.pending_for_quote(tx, "q2").empty());

		/* Roll the melt back.  */
		assert(tracker.settle(tx, "q1", ProofState_Pending, ProofState_Unspent) == 2);
		assert(tracker.pending_for_quote(tx, "q1").empty());
		tx.commit();
		return tracker.check_state(Ys);
	}).then([&](std::vector<Cashu::ProofState> states) {
		for (auto s : states)
			assert(s == ProofState_Unspent);

		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		tracker.reserve(tx, {p1}, ProofState_Pending, "q2");
		assert(tracker.settle(tx, "q2", ProofState_Pending, ProofState_Spent) == 1);
		/* Already settled.  */
		assert(tracker.settle(tx, "q2", ProofState_Pending, ProofState_Spent) == 0);
		/* Nothing moves a proof out of Spent.  */
		assert(tracker.settle(tx, "q2", ProofState_Spent, ProofState_Unspent) == 0);
		assert(tracker.settle(tx, "q2", ProofState_Spent, ProofState_Pending) == 0);
		assert(!tracker.transition(tx, p1.Y(), ProofState_Spent, ProofState_Pending));

		assert(!tracker.transition(tx, p1.Y(), ProofState_Unspent, ProofState_Spent));
		assert(!tracker.transition(tx, p1.Y(), ProofState_Spent, ProofState_Unspent));
		assert(tracker.transition(tx, p1.Y(), ProofState_Spent, ProofState_Spent));
		/* An unseen Y is Unspent.  */
		assert(tracker.transition(tx, p3.Y(), ProofState_Unspent, ProofState_Spent));
		tx.commit();
		return tracker.check_state(Ys);
	}).then([&](std::vector<Cashu::ProofState> states) {
		assert(states[0] == ProofState_Spent);
		assert(states[1] == ProofState_Unspent);
		assert(states[2] == ProofState_Spent);
		return Ev::lift(0);
	});

	return Ev::start(code);
}
