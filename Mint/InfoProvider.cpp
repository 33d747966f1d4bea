#include"Json/Out.hpp"
#include"Mint/Config.hpp"
#include"Mint/InfoProvider.hpp"
#include"Mint/KeysetManager.hpp"
#include"Mint/units.hpp"

#ifdef HAVE_CONFIG_H
# include"config.h"
#endif

namespace {

template<typename Up>
void add_methods( Json::Detail::Array<Up>& arr
		, std::vector<std::string> const& units
		, std::uint64_t min_amount
		, std::uint64_t max_amount
		) {
	for (auto const& u : units) {
		if (!Mint::is_lightning_unit(u))
			continue;
		auto m = arr.start_object();
		m
			.field("method", std::string("bolt11"))
			.field("unit", u)
			;
		if (min_amount != 0)
			m.field("min_amount", min_amount);
		if (max_amount != 0)
			m.field("max_amount", max_amount);
		m.end_object();
	}
}

}

namespace Mint {

Json::Out InfoProvider::list_keysets() const {
	auto rv = Json::Out();
	auto obj = rv.start_object();
	auto arr = obj.start_array("keysets");
	for (auto const& ks : keysets.list())
		arr
			.start_object()
				.field("id", ks.id)
				.field("unit", ks.unit)
				.field("active", ks.active)
			.end_object()
			;
	arr.end_array();
	obj.end_object();
	return rv;
}

Json::Out InfoProvider::get_keyset_keys(std::string const& id) const {
	auto const& ks = keysets.get_by_id(id);
	return Json::Out()
		.start_object()
			.start_array("keysets")
				.start_object()
					.field("id", ks.get_id())
					.field("unit", ks.get_unit())
					.field("keys", ks.keys_json())
				.end_object()
			.end_array()
		.end_object()
		;
}

Json::Out InfoProvider::get_keys() const {
	auto rv = Json::Out();
	auto obj = rv.start_object();
	auto arr = obj.start_array("keysets");
	for (auto const& u : keysets.units()) {
		auto const& ks = keysets.get_active(u);
		arr
			.start_object()
				.field("id", ks.get_id())
				.field("unit", ks.get_unit())
				.field("keys", ks.keys_json())
			.end_object()
			;
	}
	arr.end_array();
	obj.end_object();
	return rv;
}

Json::Out InfoProvider::get_info() const {
	auto units = keysets.units();

	auto rv = Json::Out();
	auto obj = rv.start_object();
	obj
		.field("name", config.name)
		.field("pubkey", std::string(keysets.mint_pubkey()))
		.field("version", std::string("clmint/") + PACKAGE_VERSION)
		.field("description", config.description)
		.field("description_long", config.description_long)
		;
	auto contact = obj.start_array("contact");
	for (auto const& c : config.contact)
		contact
			.start_object()
				.field("method", c.first)
				.field("info", c.second)
			.end_object()
			;
	contact.end_array();
	obj.field("motd", config.motd);

	auto nuts = obj.start_object("nuts");

	auto nut4 = nuts.start_object("4");
	auto mint_methods = nut4.start_array("methods");
	add_methods( mint_methods, units
		   , config.mint_min_amount, config.mint_max_amount
		   );
	mint_methods.end_array();
	nut4.field("disabled", false);
	nut4.end_object();

	auto nut5 = nuts.start_object("5");
	auto melt_methods = nut5.start_array("methods");
	add_methods( melt_methods, units
		   , config.melt_min_amount, config.melt_max_amount
		   );
	melt_methods.end_array();
	nut5.field("disabled", false);
	nut5.end_object();

	for (auto nut : {"7", "8", "12"})
		nuts
			.start_object(nut)
				.field("supported", true)
			.end_object()
			;
	nuts.end_object();

	obj.end_object();
	return rv;
}

}
