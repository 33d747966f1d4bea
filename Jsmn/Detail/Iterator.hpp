#ifndef JSMN_DETAIL_ITERATOR_HPP
#define JSMN_DETAIL_ITERATOR_HPP

#include<cstddef>
#include<iterator>
#include<memory>

namespace Jsmn { namespace Detail { struct Document; }}
namespace Jsmn { class Object; }

namespace Jsmn { namespace Detail {

/* Walks the elements of a JSON array.  */
class Iterator {
private:
	std::shared_ptr<Document const> doc;
	unsigned int i;

	friend class Jsmn::Object;
	Iterator(std::shared_ptr<Document const> doc_, unsigned int i_)
		: doc(std::move(doc_)), i(i_) { }

public:
	typedef std::forward_iterator_tag iterator_category;
	typedef Jsmn::Object value_type;
	typedef std::ptrdiff_t difference_type;
	typedef Jsmn::Object const* pointer;
	typedef Jsmn::Object reference;

	Iterator() : doc(), i(0) { }

	bool operator==(Iterator const& o) const {
		return doc == o.doc && i == o.i;
	}
	bool operator!=(Iterator const& o) const {
		return !(*this == o);
	}
	Iterator& operator++();
	Iterator operator++(int) {
		auto rv = *this;
		++*this;
		return rv;
	}

	Jsmn::Object operator*() const;
};

}}

#endif /* !defined(JSMN_DETAIL_ITERATOR_HPP) */
