#include"Jsmn/Detail/Document.hpp"
#include"Jsmn/Detail/Iterator.hpp"
#include"Jsmn/Object.hpp"

namespace Jsmn { namespace Detail {

Iterator& Iterator::operator++() {
	i = doc->skip(i);
	return *this;
}
Jsmn::Object Iterator::operator*() const {
	return Jsmn::Object(doc, i);
}

}}
