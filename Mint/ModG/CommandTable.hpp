#ifndef MINT_MODG_COMMANDTABLE_HPP
#define MINT_MODG_COMMANDTABLE_HPP

#include"Jsmn/Object.hpp"
#include"Mint/Error.hpp"
#include<functional>
#include<map>
#include<memory>
#include<stdexcept>
#include<string>
#include<vector>

namespace Ev { template<typename a> class Io; }
namespace Json { class Out; }
namespace Mint { class Engine; }
namespace S { class Bus; }

namespace Mint { namespace ModG {

/** class Mint::ModG::Params
 *
 * @brief the parameters of a command, given
 * either by name or by position.
 *
 * @desc Positions follow the order of the names
 * given at construction.
 * Malformed parameters are reported as
 * `Mint::Failure` with `ErrorCode_InvalidRequest`.
 */
class Params {
private:
	Jsmn::Object params;
	std::vector<std::string> names;

public:
	Params( Jsmn::Object params
	      , std::vector<std::string> names
	      );

	bool has(std::string const& name) const;
	/* Throws InvalidRequest if absent.  */
	Jsmn::Object required(std::string const& name) const;
	/* Null object if absent.  */
	Jsmn::Object optional(std::string const& name) const;

	std::string string(std::string const& name) const;
	std::uint64_t amount(std::string const& name) const;
	/* Each element of the named array through `f`.  */
	template<typename T>
	std::vector<T> array( std::string const& name
			    , std::function<T(Jsmn::Object const&)> f
			    ) const {
		auto rv = std::vector<T>();
		auto arr = array_object(name);
		for (auto e : arr)
			rv.push_back(convert<T>(name, e, f));
		return rv;
	}

private:
	Jsmn::Object array_object(std::string const& name) const;
	template<typename T>
	T convert( std::string const& name
		 , Jsmn::Object const& e
		 , std::function<T(Jsmn::Object const&)> const& f
		 ) const {
		try {
			return f(e);
		} catch (Mint::Failure const&) {
			throw;
		} catch (std::exception const& ex) {
			throw invalid(name, ex.what());
		}
	}
	Mint::Failure invalid( std::string const& name
			     , std::string const& why
			     ) const;
};

/** class Mint::ModG::CommandTable
 *
 * @brief registers a set of `clmint-*` commands
 * and runs them against the engine once it is
 * ready.
 *
 * @desc Each handler returns the JSON result of
 * the command.
 * A `Mint::Failure` it throws is answered with
 * its NUT error code, any other exception with
 * -32603.
 */
class CommandTable {
public:
	typedef std::function<Ev::Io<Json::Out>( Mint::Engine&
					       , Params const&
					       )> Handler;
	struct Command {
		std::string name;
		/* Parameter names, in positional order.  */
		std::vector<std::string> params;
		std::string usage;
		std::string description;
		Handler handler;
	};

private:
	class Impl;
	std::shared_ptr<Impl> pimpl;

public:
	CommandTable() =delete;
	CommandTable( S::Bus& bus
		    , std::vector<Command> commands
		    );
	CommandTable(CommandTable&&);
	~CommandTable();
};

}}

#endif /* !defined(MINT_MODG_COMMANDTABLE_HPP) */
