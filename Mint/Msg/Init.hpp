#ifndef MINT_MSG_INIT_HPP
#define MINT_MSG_INIT_HPP

#include"Sqlite3/Db.hpp"
#include<string>

namespace Mint { namespace Mod { class Rpc; }}

namespace Mint { namespace Msg {

/** struct Mint::Msg::Init
 *
 * @brief emitted when the `init` command is
 * performed, after all `Mint::Msg::Option`
 * messages.
 */
struct Init {
	Mint::Mod::Rpc& rpc;
	Sqlite3::Db db;
	std::string lightning_dir;
};

}}

#endif /* !defined(MINT_MSG_INIT_HPP) */
