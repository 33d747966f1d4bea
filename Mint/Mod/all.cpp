#include"Mint/Mod/CommandReceiver.hpp"
#include"Mint/Mod/EngineLoader.hpp"
#include"Mint/Mod/InfoCommands.hpp"
#include"Mint/Mod/Initiator.hpp"
#include"Mint/Mod/JsonOutputter.hpp"
#include"Mint/Mod/Logger.hpp"
#include"Mint/Mod/Manifester.hpp"
#include"Mint/Mod/MeltCommands.hpp"
#include"Mint/Mod/MintCommands.hpp"
#include"Mint/Mod/QuoteWatcher.hpp"
#include"Mint/Mod/SwapCommands.hpp"
#include"Mint/Mod/Waiter.hpp"
#include"Mint/Mod/all.hpp"
#include"Net/Fd.hpp"
#include<vector>

namespace {

class All {
private:
	std::vector<std::shared_ptr<void>> modules;

public:
	template<typename M, typename... As>
	std::shared_ptr<M> install(As&&... as) {
		auto ptr = std::make_shared<M>(std::forward<As>(as)...);
		modules.push_back(std::shared_ptr<void>(ptr));
		return ptr;
	}
};

}

namespace Mint { namespace Mod {

std::shared_ptr<void> all( std::ostream& cout
			 , S::Bus& bus
			 , Ev::ThreadPool& threadpool
			 , std::function< Net::Fd( std::string const&
						 , std::string const&
						 )
					> open_rpc_socket
			 ) {
	auto all = std::make_shared<All>();

	/* Plugin protocol.  */
	auto waiter = all->install<Waiter>(bus);
	all->install<JsonOutputter>(cout, bus);
	all->install<Logger>(bus);
	all->install<CommandReceiver>(bus);
	all->install<Manifester>(bus);
	all->install<Initiator>(bus, threadpool, std::move(open_rpc_socket));

	/* The mint.  */
	all->install<EngineLoader>(bus, *waiter);
	all->install<QuoteWatcher>(bus, *waiter);

	/* Commands.  */
	all->install<InfoCommands>(bus);
	all->install<MintCommands>(bus);
	all->install<MeltCommands>(bus);
	all->install<SwapCommands>(bus);

	return all;
}

}}
