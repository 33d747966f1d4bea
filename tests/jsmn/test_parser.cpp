#undef NDEBUG
#include"Jsmn/Object.hpp"
#include"Jsmn/ParseError.hpp"
#include"Jsmn/Parser.hpp"
#include<assert.h>
#include<sstream>

int main() {
	Jsmn::Parser p;

	/* A lightningd response arriving in pieces.  */
	{
		auto res = p.feed(R"JSON({"jsonrpc": "2.0", "id": 4, "res)JSON");
		assert(res.empty());
		res = p.feed(R"JSON(ult": {"bolt11": "lnbc1...", "expires_at": 1700000600})JSON");
		assert(res.empty());
		res = p.feed("}\n\n");
		assert(res.size() == 1);
		assert(double(res[0]["id"]) == 4);
		assert(std::string(res[0]["result"]["bolt11"]) == "lnbc1...");
		assert(double(res[0]["result"]["expires_at"]) == 1700000600);
		assert(res[0]["error"].is_null());
	}

	/* Several responses in one read.  */
	{
		auto res = p.feed(
			"{\"id\": 5, \"result\": {}}\n\n"
			"{\"id\": 6, \"error\": {\"code\": 210, \"message\": \"no route\"}}\n\n"
			"{\"id\": 7, "
		);
		assert(res.size() == 2);
		assert(res[0]["result"].is_object());
		assert(res[0]["result"].size() == 0);
		assert(double(res[1]["error"]["code"]) == 210);
		res = p.feed("\"result\": [1, 2]}");
		assert(res.size() == 1);
		assert(res[0]["result"].size() == 2);
	}

	/* Top-level numbers end only at whitespace.  */
	{
		auto res = p.feed("100");
		assert(res.empty());
		res = p.feed("0 ");
		assert(res.size() == 1);
		assert(res[0].is_number());
		assert(res[0].direct_text() == "1000");
	}

	/* Brackets and quotes inside strings.  */
	{
		auto res = p.feed(R"JSON({"secret": "}]\"[{", "n": [true, false, null]})JSON");
		assert(res.size() == 1);
		assert(std::string(res[0]["secret"]) == "}]\"[{");
		assert(bool(res[0]["n"][0]));
		assert(res[0]["n"][1].is_boolean());
		assert(!bool(res[0]["n"][1]));
		assert(res[0]["n"][2].is_null());
		assert(res[0]["n"][3].is_null());
	}

	/* Escapes, including a surrogate pair.  */
	{
		auto res = p.feed(R"JSON(["caf\u00e9", "\ud83e\udd5c", "a\/b\tc"])JSON");
		assert(res.size() == 1);
		assert(std::string(res[0][0]) == "caf\xc3\xa9");
		assert(std::string(res[0][1]) == "\xf0\x9f\xa5\x9c");
		assert(std::string(res[0][2]) == "a/b\tc");
	}

	/* Wrong types.  */
	{
		auto res = p.feed("{\"amount\": \"100\"}");
		assert(res.size() == 1);
		auto caught = false;
		try {
			(void) double(res[0]["amount"]);
		} catch (Jsmn::TypeError const&) {
			caught = true;
		}
		assert(caught);
	}

	/* Garbage.  */
	{
		Jsmn::Parser bad;
		auto caught = false;
		try {
			bad.feed("{\"id\": ?}");
		} catch (Jsmn::ParseError const& e) {
			caught = true;
			assert(std::string(e.what()).find("?") != std::string::npos);
		}
		assert(caught);
	}

	/* Stream extraction reads one datum at a time.  */
	{
		auto is = std::istringstream("{\"a\": 1}\n[2]\n");
		auto o = Jsmn::Object();
		is >> o;
		assert(o.is_object());
		assert(double(o["a"]) == 1);
		is >> o;
		assert(o.is_array());
		assert(double(o[0]) == 2);
		is >> o;
		assert(is.eof());
		assert(o.is_array());
	}

	return 0;
}
