#ifndef EV_IO_HPP
#define EV_IO_HPP

#include<exception>
#include<functional>
#include<memory>
#include<type_traits>
#include<utility>

namespace Ev {

template<typename a>
class Io;

namespace Detail {

/* Io<a> -> a.  */
template<typename t>
struct IoInner;
template<typename a>
struct IoInner<Io<a>> {
	typedef a type;
};

template<typename a>
struct PassFunc {
	typedef std::function<void(a)> type;
};
template<>
struct PassFunc<void> {
	typedef std::function<void()> type;
};
typedef std::function<void(std::exception_ptr)> FailFunc;

/* Continuation handling that differs between
 * `Io<void>` and `Io<a>`.  */
template<typename a>
struct Step {
	/* Wraps `pass` so it does nothing once `done`.  */
	static typename PassFunc<a>::type
	once(std::shared_ptr<bool> done, typename PassFunc<a>::type pass) {
		return [done, pass](a value) {
			if (*done)
				return;
			*done = true;
			pass(std::move(value));
		};
	}
	/* What `then(f)` returns.  */
	template<typename f>
	struct Next {
		typedef decltype(std::declval<f&>()(std::declval<a>())) type;
	};
	/* A pass function that feeds the value to `func`
	 * and runs the action it returns.  */
	template<typename f, typename b>
	static typename PassFunc<a>::type
	bind( f func
	    , typename PassFunc<b>::type pass
	    , FailFunc fail
	    ) {
		return [func, pass, fail](a value) {
			auto next = std::function<void( typename PassFunc<b>::type
						      , FailFunc
						      )>();
			try {
				next = func(std::move(value)).core;
			} catch (...) {
				return fail(std::current_exception());
			}
			next(pass, fail);
		};
	}
};
template<>
struct Step<void> {
	static PassFunc<void>::type
	once(std::shared_ptr<bool> done, PassFunc<void>::type pass) {
		return [done, pass]() {
			if (*done)
				return;
			*done = true;
			pass();
		};
	}
	template<typename f>
	struct Next {
		typedef decltype(std::declval<f&>()()) type;
	};
	template<typename f, typename b>
	static PassFunc<void>::type
	bind( f func
	    , typename PassFunc<b>::type pass
	    , FailFunc fail
	    ) {
		return [func, pass, fail]() {
			auto next = std::function<void( typename PassFunc<b>::type
						      , FailFunc
						      )>();
			try {
				next = func().core;
			} catch (...) {
				return fail(std::current_exception());
			}
			next(pass, fail);
		};
	}
};

}

/** class Ev::Io<a>
 *
 * @brief an action which, when run, eventually
 * produces an `a` or fails with an exception.
 *
 * @desc Nothing happens until the action is run,
 * normally by `Ev::start` or as part of a larger
 * action built with `then`.
 * An exception thrown anywhere in the chain skips
 * to the nearest matching `catching`.
 */
template<typename a>
class Io {
public:
	typedef std::function<void( typename Detail::PassFunc<a>::type
				  , Detail::FailFunc
				  )> CoreFunc;

private:
	CoreFunc core;

	template<typename b>
	friend class Io;
	template<typename b>
	friend struct Detail::Step;

public:
	Io(CoreFunc core_) : core(std::move(core_)) { }

	/* Runs `f` on the result and continues with the
	 * action it returns.  */
	template<typename f>
	Io<typename Detail::IoInner<
		typename Detail::Step<a>::template Next<f>::type
	>::type>
	then(f func) const {
		typedef typename Detail::IoInner<
			typename Detail::Step<a>::template Next<f>::type
		>::type b;
		auto first = core;
		return Io<b>([first, func]( typename Detail::PassFunc<b>::type pass
					  , Detail::FailFunc fail
					  ) {
			try {
				first( Detail::Step<a>::template bind<f, b>(func, pass, fail)
				     , fail
				     );
			} catch (...) {
				fail(std::current_exception());
			}
		});
	}

	/* Recovers from exceptions of type `e`; others
	 * pass through.  */
	template<typename e>
	Io<a> catching(std::function<Io<a>(e const&)> handler) const {
		auto first = core;
		return Io<a>([first, handler]( typename Detail::PassFunc<a>::type pass
					     , Detail::FailFunc fail
					     ) {
			auto recover = [pass, fail, handler](std::exception_ptr err) {
				auto next = CoreFunc();
				try {
					try {
						std::rethrow_exception(err);
					} catch (e const& ex) {
						next = handler(ex).core;
					}
				} catch (...) {
					return fail(std::current_exception());
				}
				next(pass, fail);
			};
			try {
				first(pass, recover);
			} catch (...) {
				recover(std::current_exception());
			}
		});
	}

	/* Starts the action; exactly one of `pass` and
	 * `fail` is eventually called, at most once.  */
	void run( typename Detail::PassFunc<a>::type pass
		, Detail::FailFunc fail
		) const noexcept {
		auto done = std::make_shared<bool>(false);
		auto guarded_fail = [done, fail](std::exception_ptr e) {
			if (*done)
				return;
			*done = true;
			fail(std::move(e));
		};
		try {
			core( Detail::Step<a>::once(done, std::move(pass))
			    , guarded_fail
			    );
		} catch (...) {
			guarded_fail(std::current_exception());
		}
	}

	/* Sequences `next` after this action.  */
	template<typename u = a>
	typename std::enable_if<std::is_void<u>::value, Io<void>&>::type
	operator+=(Io<void> next) {
		auto first = core;
		auto second = std::move(next.core);
		core = [first, second]( std::function<void()> pass
				      , Detail::FailFunc fail
				      ) {
			first([second, pass, fail]() {
				second(pass, fail);
			}, fail);
		};
		return *this;
	}
};

template<typename a>
Io<a> lift(a val) {
	auto container = std::make_shared<a>(std::move(val));
	return Io<a>([container]( std::function<void(a)> pass
				, Detail::FailFunc
				) {
		pass(std::move(*container));
	});
}
inline
Io<void> lift() {
	return Io<void>([]( std::function<void()> pass
			  , Detail::FailFunc
			  ) {
		pass();
	});
}

inline
Io<void> operator+(Io<void> a, Io<void> b) {
	a += std::move(b);
	return a;
}

}

#endif /* !defined(EV_IO_HPP) */
