#include"Jsmn/Object.hpp"
#include"Json/Out.hpp"
#include"Ln/CommandId.hpp"
#include<memory>
#include<algorithm>
#include<cctype>
#include<string>

namespace {

/* Digits only, as an unsigned 64-bit value.  */
bool is_u64(std::string const& s) {
	if (s.empty() || s.size() > 20)
		return false;
	if (!std::all_of(s.begin(), s.end(), [](char c) {
		return std::isdigit((unsigned char) c) != 0;
	}))
		return false;
	if (s.size() > 1 && s[0] == '0')
		return false;
	return s.size() < 20 || s <= "18446744073709551615";
}

}

namespace Ln {

CommandId CommandId::number(std::uint64_t n) {
	return CommandId(std::to_string(n));
}
CommandId CommandId::string(std::string const& s) {
	return CommandId(Json::Out::direct(s).output());
}

std::unique_ptr<CommandId>
command_id_from_jsmn_object(Jsmn::Object const& j) {
	if (j.is_number()) {
		auto text = j.direct_text();
		if (!is_u64(text))
			return nullptr;
		return std::make_unique<CommandId>(
			CommandId::number(std::stoull(text))
		);
	}
	if (j.is_string())
		return std::make_unique<CommandId>(
			CommandId::string(std::string(j))
		);
	return nullptr;
}

}
