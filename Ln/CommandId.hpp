#ifndef LN_COMMANDID_HPP
#define LN_COMMANDID_HPP

#include"Json/Out.hpp"
#include<cstdint>
#include<memory>
#include<string>

namespace Jsmn { class Object; }

namespace Ln {

/** class Ln::CommandId
 *
 * @brief the `id` of a JSON-RPC request from
 * lightningd, echoed back unchanged in the reply.
 *
 * @desc lightningd sends either a non-negative
 * integer or a string such as
 * `"cli:mint-quote#12/cln:mint-quote#40"`.
 */
class CommandId {
private:
	/* The id as JSON text.  */
	std::string text;

	explicit
	CommandId(std::string text_) : text(std::move(text_)) { }

public:
	CommandId() =delete;

	static
	CommandId number(std::uint64_t);
	static
	CommandId string(std::string const&);

	std::string const& json() const { return text; }

	bool operator==(CommandId const& o) const { return text == o.text; }
	bool operator!=(CommandId const& o) const { return text != o.text; }
	bool operator<(CommandId const& o) const { return text < o.text; }
};

/* Null if the value cannot be a request id.  */
std::unique_ptr<CommandId>
command_id_from_jsmn_object(Jsmn::Object const&);

}

namespace Json { namespace Detail {

template<>
struct Serializer<Ln::CommandId> {
	static std::string serialize(Ln::CommandId const& id) {
		return id.json();
	}
};

}}

#endif /* !defined(LN_COMMANDID_HPP) */
