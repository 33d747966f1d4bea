#ifndef JSMN_DETAIL_BOUNDARY_HPP
#define JSMN_DETAIL_BOUNDARY_HPP

namespace Jsmn { namespace Detail {

/** class Jsmn::Detail::Boundary
 *
 * @brief watches a character stream for places
 * where a top-level JSON datum could end.
 *
 * @desc `feed` returns true on the closing quote
 * or bracket of a top-level string or container,
 * and on the first whitespace after a top-level
 * number or literal.
 * Only a hint: jsmn still decides whether the
 * text so far is a whole datum.
 */
class Boundary {
private:
	enum State { Between, Inside, Quoted, Escaped };
	State state;
	unsigned int depth;

	bool close();

public:
	Boundary() : state(Between), depth(0) { }

	bool feed(char c);
};

}}

#endif /* !defined(JSMN_DETAIL_BOUNDARY_HPP) */
