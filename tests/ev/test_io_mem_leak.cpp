#undef NDEBUG
#include<new>
#include<stddef.h>
#include<stdlib.h>

/* Live heap objects.  A long-running poll loop must
 * not accumulate continuations.  */
unsigned long live = 0;

#if !USE_VALGRIND
void* operator new(size_t size) {
	++live;
	auto p = malloc(size ? size : 1);
	if (!p)
		throw std::bad_alloc();
	return p;
}
void operator delete(void* p) noexcept {
	if (!p)
		return;
	--live;
	free(p);
}
void operator delete(void* p, size_t) noexcept {
	operator delete(p);
}
#endif

#include<assert.h>
#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"

namespace {

auto const rounds = 500ul;
auto ceiling = 0ul;

Ev::Io<int> poll(unsigned long n, unsigned long& polled) {
	return Ev::yield().then([n, &polled]() {
		++polled;
		if (polled == 2)
			ceiling = live + 8;
		else if (polled > 2)
			assert(live <= ceiling);
		if (n == 0)
			return Ev::lift(0);
		return poll(n - 1, polled);
	});
}

}

int main() {
	auto polled = 0ul;
	auto ec = Ev::start(poll(rounds, polled));
	assert(polled == rounds + 1);
	return ec;
}
