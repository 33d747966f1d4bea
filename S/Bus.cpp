#include<S/Bus.hpp>
#include<unordered_map>

namespace S {

class Bus::Impl {
public:
	std::unordered_map< std::type_index
			  , std::unique_ptr<Detail::SignalBase>
			  > signals;
};

Bus::Bus() : pimpl(std::make_unique<Impl>()) { }
Bus::Bus(Bus&& o) : pimpl(std::move(o.pimpl)) { }
Bus::~Bus() { }

Detail::SignalBase* Bus::find(std::type_index type) const {
	auto it = pimpl->signals.find(type);
	if (it == pimpl->signals.end())
		return nullptr;
	return it->second.get();
}
Detail::SignalBase& Bus::add( std::type_index type
			    , std::unique_ptr<Detail::SignalBase> s
			    ) {
	auto& slot = pimpl->signals[type];
	slot = std::move(s);
	return *slot;
}

}
