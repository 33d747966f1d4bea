#ifndef MINT_MSG_LOG_HPP
#define MINT_MSG_LOG_HPP

#include"Mint/log.hpp"
#include<string>

namespace Mint { namespace Msg {

/** struct Mint::Msg::Log
 *
 * @brief a formatted log record, emitted by
 * `Mint::log`.
 */
struct Log {
	Mint::LogLevel level;
	std::string message;
};

}}

#endif /* !defined(MINT_MSG_LOG_HPP) */
