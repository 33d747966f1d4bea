#include"Ln/Bolt11.hpp"
#include"Secp256k1/Detail/context.hpp"
#include"Secp256k1/PrivKey.hpp"
#include"Sha256/Hasher.hpp"
#include"Util/Bech32.hpp"
#include<algorithm>
#include<ctype.h>
#include<secp256k1.h>
#include<secp256k1_recovery.h>
#include<sodium/utils.h>
#include<vector>

using Secp256k1::Detail::context;

namespace {

/* Tagged field types.  */
auto constexpr tag_p = std::uint8_t(1);
auto constexpr tag_x = std::uint8_t(6);
auto constexpr tag_d = std::uint8_t(13);
auto constexpr tag_n = std::uint8_t(19);

auto constexpr signature_words = std::size_t(104);
auto constexpr timestamp_words = std::size_t(7);

auto constexpr msat_per_btc = std::uint64_t(100000000000ULL);

std::uint64_t read_be(std::vector<std::uint8_t>::const_iterator b, std::size_t n) {
	auto rv = std::uint64_t(0);
	for (auto i = std::size_t(0); i < n; ++i, ++b)
		rv = (rv << 5) | *b;
	return rv;
}

void write_be(std::vector<std::uint8_t>& out, std::uint64_t v, std::size_t n) {
	for (auto i = n; i > 0; --i)
		out.push_back(std::uint8_t((v >> (5 * (i - 1))) & 31));
}

std::vector<std::uint8_t> minimal_be(std::uint64_t v) {
	auto rv = std::vector<std::uint8_t>();
	do {
		rv.insert(rv.begin(), std::uint8_t(v & 31));
		v >>= 5;
	} while (v != 0);
	return rv;
}

void add_tag( std::vector<std::uint8_t>& out
	    , std::uint8_t tag
	    , std::vector<std::uint8_t> const& data
	    ) {
	out.push_back(tag);
	write_be(out, data.size(), 2);
	out.insert(out.end(), data.begin(), data.end());
}

Ln::Amount parse_amount(std::string const& s) {
	auto digits = s;
	auto mult = char(0);
	if (!s.empty() && !isdigit((unsigned char) s.back())) {
		mult = s.back();
		digits = s.substr(0, s.size() - 1);
	}
	if (digits.empty() || digits.size() > 19)
		throw Ln::Bolt11DecodeError("bad amount");
	auto n = std::uint64_t(0);
	for (auto c : digits) {
		if (!isdigit((unsigned char) c))
			throw Ln::Bolt11DecodeError("bad amount");
		n = n * 10 + std::uint64_t(c - '0');
	}

	auto factor = std::uint64_t(0);
	switch (mult) {
	case 0: factor = msat_per_btc; break;
	case 'm': factor = msat_per_btc / 1000; break;
	case 'u': factor = msat_per_btc / 1000000; break;
	case 'n': factor = msat_per_btc / 1000000000; break;
	case 'p':
		if (n % 10 != 0)
			throw Ln::Bolt11DecodeError("sub-millisatoshi amount");
		return Ln::Amount::msat(n / 10);
	default:
		throw Ln::Bolt11DecodeError("bad amount multiplier");
	}
	if (n > UINT64_MAX / factor)
		throw Ln::Bolt11DecodeError("amount too large");
	return Ln::Amount::msat(n * factor);
}

std::string format_amount(Ln::Amount a) {
	auto msat = a.to_msat();
	if (msat % msat_per_btc == 0)
		return std::to_string(msat / msat_per_btc);
	if (msat % (msat_per_btc / 1000) == 0)
		return std::to_string(msat / (msat_per_btc / 1000)) + "m";
	if (msat % (msat_per_btc / 1000000) == 0)
		return std::to_string(msat / (msat_per_btc / 1000000)) + "u";
	if (msat % (msat_per_btc / 1000000000) == 0)
		return std::to_string(msat / (msat_per_btc / 1000000000)) + "n";
	return std::to_string(msat * 10) + "p";
}

/* The signed message is the HRP followed by the data words
 * packed into bytes, with the last byte zero-padded.  */
Sha256::Hash signing_hash( std::string const& hrp
			 , std::vector<std::uint8_t> const& words
			 ) {
	auto bytes = std::vector<std::uint8_t>();
	auto acc = std::uint32_t(0);
	auto bits = 0;
	for (auto w : words) {
		acc = (acc << 5) | w;
		bits += 5;
		if (bits >= 8) {
			bits -= 8;
			bytes.push_back(std::uint8_t((acc >> bits) & 0xFF));
		}
	}
	if (bits > 0)
		bytes.push_back(std::uint8_t((acc << (8 - bits)) & 0xFF));

	auto hasher = Sha256::Hasher();
	hasher.feed(hrp);
	if (!bytes.empty())
		hasher.feed(&bytes[0], bytes.size());
	return std::move(hasher).finalize();
}

Secp256k1::PubKey recover_payee( Sha256::Hash const& hash
			       , std::vector<std::uint8_t> const& sig
			       ) {
	if (sig.size() != 65 || sig[64] > 3)
		throw Ln::Bolt11DecodeError("bad signature");

	auto rsig = secp256k1_ecdsa_recoverable_signature();
	if (!secp256k1_ecdsa_recoverable_signature_parse_compact(
		context(), &rsig, &sig[0], int(sig[64])
	))
		throw Ln::Bolt11DecodeError("bad signature");

	auto plain = secp256k1_ecdsa_signature();
	secp256k1_ecdsa_recoverable_signature_convert(context(), &plain, &rsig);
	if (secp256k1_ecdsa_signature_normalize(context(), nullptr, &plain))
		throw Ln::Bolt11DecodeError("high-S signature");

	std::uint8_t msg[32];
	hash.to_buffer(msg);
	auto pk = secp256k1_pubkey();
	if (!secp256k1_ecdsa_recover(context(), &pk, &rsig, msg))
		throw Ln::Bolt11DecodeError("signature does not recover");

	std::uint8_t buf[33];
	auto len = sizeof(buf);
	secp256k1_ec_pubkey_serialize( context(), buf, &len, &pk
				     , SECP256K1_EC_COMPRESSED
				     );
	return Secp256k1::PubKey::from_buffer(buf);
}

}

namespace Ln {

Bolt11 Bolt11::decode(std::string const& invoice) {
	auto hrp = std::string();
	auto words = std::vector<std::uint8_t>();
	if (!Util::Bech32::decode(hrp, words, invoice))
		throw Bolt11DecodeError("invalid bech32");
	if (hrp.size() < 4 || hrp.substr(0, 2) != "ln")
		throw Bolt11DecodeError("not a lightning invoice");
	if (words.size() < timestamp_words + signature_words)
		throw Bolt11DecodeError("too short");

	auto rv = Bolt11();

	auto rest = hrp.substr(2);
	auto digit = std::find_if(rest.begin(), rest.end(), [](char c) {
		return isdigit((unsigned char) c);
	});
	rv.currency = std::string(rest.begin(), digit);
	if (rv.currency.empty())
		throw Bolt11DecodeError("no currency prefix");
	if (digit != rest.end()) {
		rv.has_amount = true;
		rv.amount = parse_amount(std::string(digit, rest.end()));
	}

	auto it = words.cbegin();
	auto end = words.cend() - signature_words;
	rv.timestamp = read_be(it, timestamp_words);
	it += timestamp_words;

	auto have_hash = false;
	auto stated_payee = std::vector<std::uint8_t>();
	while (it != end) {
		if (end - it < 3)
			throw Bolt11DecodeError("truncated tagged field");
		auto tag = *it;
		auto len = std::size_t(read_be(it + 1, 2));
		it += 3;
		if (std::size_t(end - it) < len)
			throw Bolt11DecodeError("truncated tagged field");
		auto data_end = it + len;

		switch (tag) {
		case tag_p:
			/* Readers skip p fields of the wrong length.  */
			if (len == 52) {
				auto bytes = Util::Bech32::words_to_bytes(it, data_end);
				rv.payment_hash = Sha256::Hash::from_buffer(&bytes[0]);
				have_hash = true;
			}
			break;
		case tag_x:
			if (len > 12)
				throw Bolt11DecodeError("expiry too large");
			rv.expiry = read_be(it, len);
			break;
		case tag_d: {
			auto bytes = Util::Bech32::words_to_bytes(it, data_end);
			rv.description = std::string(bytes.begin(), bytes.end());
		} break;
		case tag_n:
			if (len == 53)
				stated_payee = Util::Bech32::words_to_bytes(it, data_end);
			break;
		default:
			break;
		}
		it = data_end;
	}
	if (!have_hash)
		throw Bolt11DecodeError("no payment hash");

	auto signed_words = std::vector<std::uint8_t>(words.cbegin(), end);
	rv.payee = recover_payee( signing_hash(hrp, signed_words)
				, Util::Bech32::words_to_bytes(end, words.cend())
				);
	if (!stated_payee.empty()) {
		if (stated_payee.size() != 33)
			throw Bolt11DecodeError("bad payee field");
		std::uint8_t buf[33];
		rv.payee.to_buffer(buf);
		if (!std::equal(buf, buf + 33, stated_payee.begin()))
			throw Bolt11DecodeError("signature is not by the payee");
	}

	return rv;
}

std::string Bolt11::encode(Secp256k1::PrivKey const& node_key) const {
	auto hrp = "ln" + currency;
	if (has_amount)
		hrp += format_amount(amount);

	auto words = std::vector<std::uint8_t>();
	write_be(words, timestamp, timestamp_words);

	std::uint8_t hash[32];
	payment_hash.to_buffer(hash);
	add_tag( words, tag_p
	       , Util::Bech32::bytes_to_words(
			std::vector<std::uint8_t>(hash, hash + 32)
		 )
	       );
	add_tag( words, tag_d
	       , Util::Bech32::bytes_to_words(
			std::vector<std::uint8_t>( description.begin()
						 , description.end()
						 )
		 )
	       );
	if (expiry != 3600)
		add_tag(words, tag_x, minimal_be(expiry));

	std::uint8_t msg[32];
	signing_hash(hrp, words).to_buffer(msg);
	std::uint8_t sk[32];
	node_key.to_buffer(sk);

	auto sig = secp256k1_ecdsa_recoverable_signature();
	auto res = secp256k1_ecdsa_sign_recoverable( context()
						   , &sig
						   , msg
						   , sk
						   , nullptr, nullptr
						   );
	sodium_memzero(sk, sizeof(sk));
	if (!res)
		throw Util::BacktraceException<std::runtime_error>(
			"Ln::Bolt11: signing failed"
		);

	std::uint8_t sigbuf[65];
	auto recid = int();
	secp256k1_ecdsa_recoverable_signature_serialize_compact(
		context(), sigbuf, &recid, &sig
	);
	sigbuf[64] = std::uint8_t(recid);

	auto sigwords = Util::Bech32::bytes_to_words(
		std::vector<std::uint8_t>(sigbuf, sigbuf + 65)
	);
	words.insert(words.end(), sigwords.begin(), sigwords.end());

	return Util::Bech32::encode(hrp, words);
}

}
