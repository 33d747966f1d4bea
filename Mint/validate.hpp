#ifndef MINT_VALIDATE_HPP
#define MINT_VALIDATE_HPP

#include<cstdint>
#include<string>
#include<vector>

namespace Cashu { struct BlindedMessage; }
namespace Cashu { struct Proof; }
namespace Mint { class BlindSigner; }
namespace Mint { class KeysetManager; }

namespace Mint {

/* Unit and total of a batch of proofs.  */
struct InputTotal {
	std::string unit;
	std::uint64_t amount;
};

/** Mint::check_inputs
 *
 * @brief checks proofs offered for spending:
 * non-empty, no repeated secret, all from
 * keysets of one unit, all signatures valid.
 * Does not consult the proof ledger.
 */
InputTotal check_inputs( BlindSigner& signer
		       , KeysetManager const& keysets
		       , std::vector<Cashu::Proof> const& inputs
		       );

/** Mint::check_outputs
 *
 * @brief checks blinded messages to be signed:
 * non-empty, power-of-two amounts, no repeated
 * `B_`, all in the active keyset of `unit`.
 * Returns their total.
 */
std::uint64_t check_outputs( KeysetManager const& keysets
			   , std::vector<Cashu::BlindedMessage> const& outputs
			   , std::string const& unit
			   );

auto constexpr max_blank_outputs = std::size_t(64);

/** Mint::check_blank_outputs
 *
 * @brief checks blank outputs for melt change:
 * at most `max_blank_outputs`, no repeated
 * `B_`, all in the active keyset of `unit`.
 * Amounts are ignored.
 */
void check_blank_outputs( KeysetManager const& keysets
			, std::vector<Cashu::BlindedMessage> const& outputs
			, std::string const& unit
			);

}

#endif /* !defined(MINT_VALIDATE_HPP) */
