#ifndef MINT_MOD_RPC_HPP
#define MINT_MOD_RPC_HPP

#include"Jsmn/Object.hpp"
#include<memory>
#include<stdexcept>
#include<string>

namespace Ev { template<typename a> class Io; }
namespace Json { class Out; }
namespace Net { class Fd; }
namespace S { class Bus; }

namespace Mint { namespace Mod {

/** struct Mint::Mod::RpcError
 *
 * @brief lightningd answered a command with a
 * JSON-RPC `error`.
 *
 * @desc `code` is the lightningd error code, or
 * 0 if the error object did not carry one.
 */
struct RpcError : public std::runtime_error {
	RpcError() =delete;
	RpcError(std::string command, Jsmn::Object error);

	std::string command;
	int code;
	std::string message;
	Jsmn::Object error;
};

/** class Mint::Mod::Rpc
 *
 * @brief the mint's connection to the lightningd
 * JSON-RPC socket.
 *
 * @desc Constructed by `Initiator` once `init`
 * gives the socket path.
 * If the socket closes, every outstanding and
 * later command fails with `Mint::Failure`
 * `ErrorCode_BackendUnavailable`.
 * At `Mint::Shutdown` they fail with
 * `Mint::Shutdown` instead.
 */
class Rpc {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Rpc(S::Bus& bus, Net::Fd socket);
	Rpc(Rpc&&);
	~Rpc();

	Ev::Io<Jsmn::Object> command( std::string const& command
				    , Json::Out params
				    );
};

}}

#endif /* !defined(MINT_MOD_RPC_HPP) */
