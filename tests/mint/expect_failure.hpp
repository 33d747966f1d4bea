#ifndef TESTS_MINT_EXPECT_FAILURE_HPP
#define TESTS_MINT_EXPECT_FAILURE_HPP

#include"Ev/Io.hpp"
#include"Mint/Error.hpp"
#include<assert.h>
#include<iostream>
#include<memory>

/* Runs the action, which must fail with the given
 * error code.  */
template<typename T>
Ev::Io<void> expect_failure(Ev::Io<T> io, Mint::ErrorCode code) {
	auto failed = std::make_shared<bool>(false);
	return io.then([](T) {
		return Ev::lift();
	}).template catching<Mint::Failure>([failed, code](Mint::Failure const& e) {
		if (e.get_code() != code)
			std::cerr << "unexpected: " << e.what() << std::endl;
		assert(e.get_code() == code);
		*failed = true;
		return Ev::lift();
	}).then([failed]() {
		assert(*failed);
		return Ev::lift();
	});
}
inline
Ev::Io<void> expect_failure(Ev::Io<void> io, Mint::ErrorCode code) {
	auto failed = std::make_shared<bool>(false);
	return io.catching<Mint::Failure>([failed, code](Mint::Failure const& e) {
		if (e.get_code() != code)
			std::cerr << "unexpected: " << e.what() << std::endl;
		assert(e.get_code() == code);
		*failed = true;
		return Ev::lift();
	}).then([failed]() {
		assert(*failed);
		return Ev::lift();
	});
}

#endif /* !defined(TESTS_MINT_EXPECT_FAILURE_HPP) */
