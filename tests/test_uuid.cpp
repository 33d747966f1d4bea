#undef NDEBUG
#include"Uuid.hpp"
#include<assert.h>
#include<set>
#include<stdexcept>

namespace {

bool rejects(std::string const& s) {
	try {
		(void) Uuid(s);
	} catch (std::invalid_argument const&) {
		return true;
	}
	return false;
}

}

int main() {
	assert(std::string(Uuid()) == "00000000-0000-0000-0000-000000000000");

	auto a = Uuid::random();
	auto text = std::string(a);
	assert(text.size() == 36);
	assert(text[8] == '-' && text[13] == '-');
	assert(text[18] == '-' && text[23] == '-');
	/* Version 4, RFC 4122 variant.  */
	assert(text[14] == '4');
	assert( text[19] == '8' || text[19] == '9'
	     || text[19] == 'a' || text[19] == 'b'
	      );
	assert(Uuid(text) == a);

	/* Quote ids do not repeat.  */
	auto seen = std::set<Uuid>();
	for (auto i = 0; i < 1000; ++i)
		seen.insert(Uuid::random());
	assert(seen.size() == 1000);

	auto b = Uuid("0F1E2D3C-4B5A-4968-8776-a5b4c3d2e1f0");
	assert(std::string(b) == "0f1e2d3c-4b5a-4968-8776-a5b4c3d2e1f0");
	assert(b != a);

	assert(rejects(""));
	assert(rejects("0f1e2d3c4b5a49688776a5b4c3d2e1f0"));
	assert(rejects("0f1e2d3c-4b5a-4968-8776-a5b4c3d2e1f"));
	assert(rejects("0f1e2d3c_4b5a-4968-8776-a5b4c3d2e1f0"));
	assert(rejects("0f1e2d3c-4b5a-4968-8776-a5b4c3d2e1fg"));

	return 0;
}
