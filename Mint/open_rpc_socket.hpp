#ifndef MINT_OPEN_RPC_SOCKET_HPP
#define MINT_OPEN_RPC_SOCKET_HPP

#include<string>

namespace Net { class Fd; }

namespace Mint {

/** Mint::open_rpc_socket
 *
 * @brief connects to lightningd's JSON-RPC socket.
 *
 * @desc `rpc_file` is taken relative to
 * `lightning_dir` unless absolute, as lightningd
 * reports them in `init`.
 * If the joined path is too long for a Unix socket
 * address, changes to `lightning_dir` first.
 * Blocks, so run it on the thread pool.
 * Throws std::system_error.
 *
 * Main takes this as a parameter so tests can
 * substitute their own.
 */
Net::Fd open_rpc_socket( std::string const& lightning_dir
		       , std::string const& rpc_file
		       );

}

#endif /* !defined(MINT_OPEN_RPC_SOCKET_HPP) */
