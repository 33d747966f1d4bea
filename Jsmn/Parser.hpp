#ifndef JSMN_PARSER_HPP
#define JSMN_PARSER_HPP

#include<memory>
#include<string>
#include<vector>

namespace Jsmn { class Object; }
namespace Jsmn { namespace Detail { struct Document; }}

namespace Jsmn {

/** class Jsmn::Parser
 *
 * @brief a stateful jsmn-based parser for a stream
 * of JSON datums, such as a JSON-RPC socket.
 *
 * @desc Text may be fed in arbitrary pieces.
 * `feed` returns every datum completed so far, and
 * keeps any incomplete trailing datum for the next
 * call.
 * Throws `Jsmn::ParseError` on malformed input.
 */
class Parser {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

	static Jsmn::Object wrap(std::shared_ptr<Detail::Document const>);

public:
	Parser();
	~Parser();

	Parser(Parser const&) =delete;
	Parser(Parser&&) =delete;

	std::vector<Jsmn::Object> feed(std::string const& s);
};

}

#endif /* !defined(JSMN_PARSER_HPP) */
