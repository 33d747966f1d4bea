#ifndef JSMN_DETAIL_DOCUMENT_HPP
#define JSMN_DETAIL_DOCUMENT_HPP

#include<string>
#include<vector>

namespace Jsmn { namespace Detail {

/* Mirror of jsmntype_t, so that jsmn.h is only
 * needed by the parser compilation unit.  */
enum Type {
	Undefined = 0,
	Object = 1,
	Array = 2,
	String = 3,
	Primitive = 4
};

struct Token {
	Type type;
	int start;
	int end;
	/* Direct children: elements of an array, keys
	 * of an object, or the one value of a key.  */
	int size;
};

/** struct Jsmn::Detail::Document
 *
 * @brief one parsed datum, its text and the jsmn
 * tokens over it in document order.
 *
 * @desc Shared by every `Jsmn::Object` and
 * iterator looking into it.
 */
struct Document {
	std::string text;
	std::vector<Token> tokens;

	/* Index just past token `i` and everything
	 * nested under it.  */
	unsigned int skip(unsigned int i) const;
	/* Text covered by token `i`, quotes excluded
	 * for strings.  */
	std::string slice(unsigned int i) const;
};

}}

#endif /* !defined(JSMN_DETAIL_DOCUMENT_HPP) */
