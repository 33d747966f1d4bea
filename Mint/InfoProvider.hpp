#ifndef MINT_INFOPROVIDER_HPP
#define MINT_INFOPROVIDER_HPP

#include<string>

namespace Json { class Out; }
namespace Mint { class KeysetManager; }
namespace Mint { struct Config; }

namespace Mint {

/** class Mint::InfoProvider
 *
 * @brief the read-only public face of the mint:
 * its keysets, their public keys, and the mint
 * description.
 */
class InfoProvider {
private:
	Mint::Config const& config;
	KeysetManager const& keysets;

public:
	InfoProvider() =delete;
	InfoProvider( Mint::Config const& config_
		    , KeysetManager const& keysets_
		    ) : config(config_), keysets(keysets_) { }

	/* {"keysets": [{id, unit, active}]}  */
	Json::Out list_keysets() const;
	/* {"keysets": [{id, unit, keys}]}, just the one.
	 * Throws UnknownKeyset.  */
	Json::Out get_keyset_keys(std::string const& id) const;
	/* Same shape, all active keysets.  */
	Json::Out get_keys() const;
	Json::Out get_info() const;
};

}

#endif /* !defined(MINT_INFOPROVIDER_HPP) */
