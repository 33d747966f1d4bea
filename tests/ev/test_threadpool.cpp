#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/ThreadPool.hpp"
#include"Ev/start.hpp"
#include<assert.h>
#include<chrono>
#include<stdexcept>
#include<string>
#include<thread>

int main() {
	auto loop_thread = std::this_thread::get_id();
	auto pool = Ev::ThreadPool(2);

	auto code = Ev::lift().then([&]() {
		return pool.background<std::string>([&]() {
			assert(std::this_thread::get_id() != loop_thread);
			std::this_thread::sleep_for(std::chrono::milliseconds(10));
			return std::string("connected");
		});
	}).then([&](std::string s) {
		assert(std::this_thread::get_id() == loop_thread);
		assert(s == "connected");

		return pool.background<int>([]() -> int {
			throw std::runtime_error("no such socket");
		}).catching<std::runtime_error>([](std::runtime_error const& e) {
			assert(std::string(e.what()) == "no such socket");
			return Ev::lift(-1);
		});
	}).then([&](int v) {
		assert(v == -1);

		/* More calls than threads all complete.  */
		auto total = std::make_shared<int>(0);
		auto act = Ev::lift();
		for (auto i = 1; i <= 5; ++i)
			act += pool.background<int>([i]() {
				return i;
			}).then([total](int n) {
				*total += n;
				return Ev::lift();
			});
		return act.then([total]() {
			return Ev::lift(*total);
		});
	}).then([&](int total) {
		assert(total == 15);
		return Ev::lift(0);
	});

	/* Returns only when the pool stops holding the
	 * loop open.  */
	return Ev::start(code);
}
