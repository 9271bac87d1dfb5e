#pragma once

#include <string>

namespace flarb {
namespace model {

struct address_t;
struct Event;
struct ExecutorConfig;
struct VenueConfig;
class Ledger;

} // namespace model

namespace venues {

struct ExchangeRouter;
struct LendingAuthority;
struct FlashLoanReceiver;
class ConstantProductRouter;
class SimulatedLendingPool;

} // namespace venues

namespace executor {

struct TradePath;
struct Venue;
class VenueQuoter;
class PriceComparator;
class SwapExecutor;
class ArbitrageEngine;
class AccessController;
class LoanCoordinator;

} // namespace executor
} // namespace flarb
