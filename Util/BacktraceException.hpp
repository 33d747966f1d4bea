#ifndef UTIL_BACKTRACE_EXCEPTION_HPP
#define UTIL_BACKTRACE_EXCEPTION_HPP

#ifdef HAVE_CONFIG_H
# include"config.h"
#endif

#include<utility>

#if ENABLE_EXCEPTION_BACKTRACE
# include<cstdint>
# include<cstdlib>
# include<execinfo.h>
# include<sstream>
# include<string>
# include<vector>
# define UNW_LOCAL_ONLY
# include<libunwind.h>
#endif

namespace Util {

/** class Util::BacktraceException<E>
 *
 * @brief every exception the mint throws on its own
 * account is an `E` wrapped in this.
 *
 * @desc Built with `-DCLMINT_EXCEPTION_BACKTRACE=ON`,
 * the throw site's stack is captured with libunwind
 * and appended to `what()`.
 * Otherwise `what()` is the plain message.
 */
#if !ENABLE_EXCEPTION_BACKTRACE

template <typename T>
class BacktraceException : public T {
public:
	template <typename... Args>
	BacktraceException(Args&&... args)
		: T(std::forward<Args>(args)...) { }
};

#else

template <typename T>
class BacktraceException : public T {
private:
	std::vector<void*> frames;
	mutable std::string message;

	void capture() {
		auto context = unw_context_t();
		auto cursor = unw_cursor_t();
		unw_getcontext(&context);
		unw_init_local(&cursor, &context);
		while (frames.size() < 64 && unw_step(&cursor) > 0) {
			auto ip = unw_word_t();
			unw_get_reg(&cursor, UNW_REG_IP, &ip);
			frames.push_back(reinterpret_cast<void*>(std::uintptr_t(ip)));
		}
	}

public:
	template <typename... Args>
	BacktraceException(Args&&... args)
		: T(std::forward<Args>(args)...) {
		capture();
	}

	const char* what() const noexcept override {
		if (frames.empty())
			return T::what();
		if (!message.empty())
			return message.c_str();
		auto os = std::ostringstream();
		os << T::what() << "\nBacktrace:\n";
		auto names = backtrace_symbols(frames.data(), int(frames.size()));
		for (auto i = std::size_t(0); i < frames.size(); ++i) {
			os << "#" << i << " ";
			if (names)
				os << names[i];
			else
				os << frames[i];
			os << "\n";
		}
		std::free(names);
		message = os.str();
		return message.c_str();
	}
};

#endif

}

#endif /* UTIL_BACKTRACE_EXCEPTION_HPP */
