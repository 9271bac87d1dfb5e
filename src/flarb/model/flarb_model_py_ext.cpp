#pragma GCC diagnostic ignored "-Wdeprecated-declarations" // Silencing GCC nagging me about std::auto_ptr somewhere in boost legacy snippets

#include <boost/python.hpp>
#include <boost/python/suite/indexing/vector_indexing_suite.hpp>
#include <sstream>
#include "longobject.h"
#include "unicodeobject.h"
#include "flarb_types.hpp"
#include "flarb_events.hpp"
#include "flarb_config.hpp"
#include "flarb_ledger.hpp"
#include "flarb_errors.hpp"
#include "flarb_amm_estimation.hpp"
#include "../venues/amm_router.hpp"
#include "../venues/lending_pool.hpp"
#include "../executor/trade_path.hpp"
#include "../executor/loan_coordinator.hpp"
#include "../commons/flarb_log.hpp"



using namespace boost::python;
using namespace flarb::model;
using namespace flarb::venues;
using namespace flarb::executor;


/**
 * @brief PyLong_AsBalance
 *
 * Translate a CPython bigint into a boost::multiprecision bigint (balance_t).
 *
 * Used to provide transparent translation from Python to C++ data.
 */
static balance_t PyLong_AsBalance(PyObject *vv)
{
    // it's complicated to efficiently transpose Python's internal bigint representation
    // into boost::multiprecision bigint object limbs. I'm using string serialization
    // and lexing of the uint number.

    if (PyBytes_Check(vv))
    {
        try {
            return balance_t(PyBytes_AsString(vv));
        } catch (const std::runtime_error &) {
            PyErr_SetString(PyExc_ValueError, "bad uint representation");
            return 0;
        }
    }

    PyObject *str_repr = PyObject_Str(vv);
    PyObject *encodedString = PyUnicode_AsEncodedString(str_repr, "UTF-8", "strict");
    balance_t res = 0;
    if (encodedString)
    {
        char *repr = PyBytes_AsString(encodedString);
        try {
            res = balance_t(repr);
        }
        catch (const std::runtime_error &) {
            PyErr_SetString(PyExc_ValueError, "value error");
        }
        Py_DECREF(encodedString);
    }
    else {
        PyErr_SetString(PyExc_ValueError, "bad uint representation");
    }
    Py_DECREF(str_repr);

    return res;
}


/**
 * @brief Translator which executes transparent translation of Python unbounded "int" into
 *        balance_t objects.
 */
struct balance_from_python_long
{
    balance_from_python_long()
    {
        converter::registry::push_back(
                    &convertible,
                    &construct,
                    boost::python::type_id<balance_t>());

    }

    // Determine if obj_ptr can be converted
    static void* convertible(PyObject* obj_ptr)
    {
        if (PyLong_Check(obj_ptr) ||
                PyUnicode_Check(obj_ptr) ||
                PyBytes_Check(obj_ptr)
                ) return obj_ptr;
        return 0;
    }

    static void construct(
        PyObject* obj_ptr,
        converter::rvalue_from_python_stage1_data* data)
    {
        balance_t* storage = reinterpret_cast<balance_t*>(((converter::rvalue_from_python_storage<balance_t>*)data)->storage.bytes);
        new (storage) balance_t(PyLong_AsBalance(obj_ptr));
        data->convertible = storage;
    }

};


/**
 * @brief ... and back: balance_t objects are handed to Python as plain ints
 */
struct balance_to_python_long
{
    static void install()
    {
        converter::registry::insert(
                    &balance_to_python_long::convert_from_ptr
                    , type_id<balance_t>());
    }
    static PyObject* convert_from_ptr(const void *p)
    {
        const balance_t *o = static_cast<const balance_t *>(p);
        std::stringstream ss;
        ss << *o;
        return PyLong_FromString(ss.str().c_str(), nullptr, 0);
    }
};


/**
 * @brief Raises a dedicated Python exception type for the C++ exception E
 *
 * Types are created in the module namespace by install(), so Python code can
 * write "except flarb_model_ext.Unauthorized". what() becomes the message.
 */
template<typename E>
struct exception_to_python
{
    static PyObject *type;

    static void install(const char *name, PyObject *base)
    {
        const std::string qualified = std::string("flarb_model_ext.") + name;
        type = PyErr_NewException(const_cast<char *>(qualified.c_str()), base, nullptr);
        if (type == nullptr)
        {
            throw_error_already_set();
        }
        // the module keeps its own reference. Ours lives as long as the process.
        scope().attr(name) = object(handle<>(borrowed(type)));
        register_exception_translator<E>(&translate);
    }

    static void translate(const E &e)
    {
        PyErr_SetString(type, e.what());
    }
};

template<typename E> PyObject *exception_to_python<E>::type = nullptr;

// the shortfall travels with the exception, as exc.profit
template<>
void exception_to_python<UnprofitableArbitrage>::translate(const UnprofitableArbitrage &e)
{
    object exc_type(handle<>(borrowed(type)));
    object exc = exc_type(std::string(e.what()));
    exc.attr("profit") = e.profit;
    PyErr_SetObject(type, exc.ptr());
}


/**
 * @defgroup py_helpers Python-friendly shims
 *
 * Where the C++ signature does not map nicely onto Python types.
 *
 * @{
 */
static boost::python::list ledger_events(const Ledger &ledger)
{
    boost::python::list res;
    for (auto &e: ledger.events())
    {
        res.append(e);
    }
    return res;
}

static boost::python::tuple router_reserves(const ConstantProductRouter &router
                                            , const address_t &tokenIn
                                            , const address_t &tokenOut)
{
    auto r = router.reserves(tokenIn, tokenOut);
    return boost::python::make_tuple(r.first, r.second);
}

static std::string trade_path_encode_hex(const TradePath &tp)
{
    return to_hex(tp.encode());
}

static TradePath trade_path_decode_hex(const std::string &hexstring)
{
    return TradePath::decode(from_hex(hexstring));
}

static ArbitrageResult coordinator_initiate_hex(LoanCoordinator &coordinator
                                                , const address_t &caller
                                                , const address_t &asset
                                                , const balance_t &amount
                                                , const std::string &encodedPath)
{
    return coordinator.initiate(caller, asset, amount, from_hex(encodedPath));
}
/** @} */


#define BALANCE_PROPERTY(cls, member) \
    make_getter(&cls::member, return_value_policy<return_by_value>()), \
    make_setter(&cls::member, default_call_policies())

#define BALANCE_GETTER(cls, member) \
    make_getter(&cls::member, return_value_policy<return_by_value>())


/**
 * @brief Export C++ model to Python.
 *
 * This is what is seen by "import" of this CPython extension.
 */
BOOST_PYTHON_MODULE(flarb_model_ext)
{
    using dont_make_copies = boost::noncopyable;
    using copy_address = return_value_policy<copy_const_reference>;
    using keep_host_alive = with_custodian_and_ward<1, 2>;

    balance_to_python_long::install();
    balance_from_python_long();

    // ExecutorError itself is never raised: it is there to be caught
    PyObject *executor_error = PyErr_NewException(const_cast<char *>("flarb_model_ext.ExecutorError")
                                                  , PyExc_RuntimeError
                                                  , nullptr);
    if (executor_error == nullptr)
    {
        throw_error_already_set();
    }
    scope().attr("ExecutorError") = object(handle<>(borrowed(executor_error)));
    exception_to_python<Unauthorized>::install("Unauthorized", executor_error);
    exception_to_python<InvalidOwner>::install("InvalidOwner", executor_error);
    exception_to_python<UntrustedCaller>::install("UntrustedCaller", executor_error);
    exception_to_python<PathMismatch>::install("PathMismatch", executor_error);
    exception_to_python<MalformedLoan>::install("MalformedLoan", executor_error);
    exception_to_python<ReentrancyError>::install("ReentrancyError", executor_error);
    exception_to_python<NothingToWithdraw>::install("NothingToWithdraw", executor_error);
    exception_to_python<UnprofitableArbitrage>::install("UnprofitableArbitrage", executor_error);

    exception_to_python<PathConsistencyError>::install("PathConsistencyError", PyExc_ValueError);
    exception_to_python<ConfigConsistencyError>::install("ConfigConsistencyError", PyExc_ValueError);
    exception_to_python<amm::swap_error>::install("SwapError", PyExc_RuntimeError);
    exception_to_python<TransferError>::install("TransferError", PyExc_RuntimeError);
    exception_to_python<TransactionError>::install("TransactionError", PyExc_RuntimeError);
    exception_to_python<LendingError>::install("LendingError", PyExc_RuntimeError);

    class_<address_t>("address_t")
            .def(init<const char *>())
            .def("is_zero", &address_t::is_zero)
            .def(self_ns::repr(self_ns::self))
            .def(self_ns::str(self_ns::self))
            .def(self == self)
            .def(self != self)
            ;
    implicitly_convertible<std::string, address_t>();

    class_<token_path_t>("token_path_t")
            .def(vector_indexing_suite<token_path_t>());
    class_<std::vector<balance_t>>("amounts_t")
            .def(vector_indexing_suite<std::vector<balance_t>, true>());

    def("to_hex", to_hex);
    def("from_hex", from_hex);
    class_<bytes_t>("bytes_t")
            .def(vector_indexing_suite<bytes_t, true>());

    enum_<EventType_e>("EventType")
            .value("LOAN_INITIATED"        , EVENT_LOAN_INITIATED       )
            .value("ARBITRAGE_EXECUTED"    , EVENT_ARBITRAGE_EXECUTED   )
            .value("OWNERSHIP_TRANSFERRED" , EVENT_OWNERSHIP_TRANSFERRED)
            ;

    class_<Event>("Event", no_init)
            .def_readonly("type"           , &Event::type)
            .def_readonly("emitter"        , &Event::emitter)
            .def_readonly("assets"         , &Event::assets)
            .def_readonly("amounts"        , &Event::amounts)
            .add_property("profit"         , BALANCE_GETTER(Event, profit))
            .def_readonly("previous_owner" , &Event::previous_owner)
            .def_readonly("new_owner"      , &Event::new_owner)
            .def(self_ns::repr(self_ns::self))
            .def(self_ns::str(self_ns::self))
            ;

    class_<Ledger, dont_make_copies>("Ledger", init<optional<timestamp_t>>())
            .def("balance_of"        , &Ledger::balance_of)
            .def("allowance"         , &Ledger::allowance)
            .def("approve"           , &Ledger::approve)
            .def("transfer"          , &Ledger::transfer)
            .def("transfer_from"     , &Ledger::transfer_from)
            .def("mint"              , &Ledger::mint)
            .def("events"            , ledger_events)
            .def("events_count"      , &Ledger::events_count)
            .def("timestamp"         , &Ledger::timestamp)
            .def("set_timestamp"     , &Ledger::set_timestamp)
            .def("advance_time"      , &Ledger::advance_time)
            .def("transaction_depth" , &Ledger::transaction_depth)
            .def("holdings_count"    , &Ledger::holdings_count)
            ;

    class_<ExchangeRouter, dont_make_copies>("ExchangeRouter", no_init)
            .def("address"   , &ExchangeRouter::address, copy_address())
            .def("name"      , &ExchangeRouter::name, return_value_policy<copy_const_reference>())
            .def("quoteOut"  , &ExchangeRouter::quoteOut)
            .def("swap"      , &ExchangeRouter::swap)
            ;

    class_<ConstantProductRouter, bases<ExchangeRouter>, dont_make_copies>("ConstantProductRouter"
            , init<Ledger &, const address_t &, const std::string &, optional<unsigned int>>()[keep_host_alive()])
            .def("add_pool"     , &ConstantProductRouter::add_pool)
            .def("pool_of"      , &ConstantProductRouter::pool_of)
            .def("reserves"     , router_reserves)
            .def("feesPPM"      , &ConstantProductRouter::feesPPM)
            .def("pools_count"  , &ConstantProductRouter::pools_count)
            ;

    class_<LendingAuthority, dont_make_copies>("LendingAuthority", no_init)
            .def("address"              , &LendingAuthority::address, copy_address())
            .def("resolvePoolAddress"   , &LendingAuthority::resolvePoolAddress)
            ;

    class_<SimulatedLendingPool, bases<LendingAuthority>, dont_make_copies>("SimulatedLendingPool"
            , init<Ledger &, const address_t &, const address_t &, optional<unsigned int>>()[keep_host_alive()])
            .def("set_pool_address" , &SimulatedLendingPool::set_pool_address)
            .def("premium_of"       , &SimulatedLendingPool::premium_of)
            .def("feesPPM"          , &SimulatedLendingPool::feesPPM)
            .def("setFeesPPM"       , &SimulatedLendingPool::setFeesPPM)
            .def("loans_count"      , &SimulatedLendingPool::loans_count)
            ;

    class_<TradePath>("TradePath")
            .def_readwrite("path"          , &TradePath::path)
            .def_readwrite("reverse_path"  , &TradePath::reverse_path)
            .def("make"                    , &TradePath::make)
            .staticmethod("make")
            .def("check_consistency"       , &TradePath::check_consistency)
            .def("encode"                  , &TradePath::encode)
            .def("encode_hex"              , trade_path_encode_hex)
            .def("decode"                  , &TradePath::decode)
            .staticmethod("decode")
            .def("decode_hex"              , trade_path_decode_hex)
            .staticmethod("decode_hex")
            .def(self_ns::repr(self_ns::self))
            .def(self_ns::str(self_ns::self))
            ;

    class_<VenueConfig>("VenueConfig")
            .def_readwrite("name"   , &VenueConfig::name)
            .def_readwrite("router" , &VenueConfig::router)
            ;

    class_<ExecutorConfig>("ExecutorConfig")
            .def_readwrite("self"              , &ExecutorConfig::self)
            .def_readwrite("owner"             , &ExecutorConfig::owner)
            .def_readwrite("lending_provider"  , &ExecutorConfig::lending_provider)
            .def_readwrite("venue_a"           , &ExecutorConfig::venue_a)
            .def_readwrite("venue_b"           , &ExecutorConfig::venue_b)
            .def_readwrite("swap_deadline"     , &ExecutorConfig::swap_deadline)
            .add_property("min_amount_out"     , BALANCE_PROPERTY(ExecutorConfig, min_amount_out))
            .def_readwrite("referral_code"     , &ExecutorConfig::referral_code)
            .def("check_consistency"           , &ExecutorConfig::check_consistency)
            ;

    enum_<Phase_e>("Phase")
            .value("IDLE"                 , PHASE_IDLE                )
            .value("LOAN_REQUESTED"       , PHASE_LOAN_REQUESTED      )
            .value("FUNDS_RECEIVED"       , PHASE_FUNDS_RECEIVED      )
            .value("LEG1_EXECUTED"        , PHASE_LEG1_EXECUTED       )
            .value("LEG2_EXECUTED"        , PHASE_LEG2_EXECUTED       )
            .value("PROFIT_EVALUATED"     , PHASE_PROFIT_EVALUATED    )
            .value("REPAYMENT_AUTHORIZED" , PHASE_REPAYMENT_AUTHORIZED)
            .value("COMPLETED"            , PHASE_COMPLETED           )
            .value("ABORTED"              , PHASE_ABORTED             )
            ;

    class_<ArbitrageResult>("ArbitrageResult", no_init)
            .def_readonly("success"              , &ArbitrageResult::success)
            .add_property("profit"               , BALANCE_GETTER(ArbitrageResult, profit))
            .add_property("initial_balance"      , BALANCE_GETTER(ArbitrageResult, initial_balance))
            .add_property("final_balance"        , BALANCE_GETTER(ArbitrageResult, final_balance))
            .add_property("intermediate_amount"  , BALANCE_GETTER(ArbitrageResult, intermediate_amount))
            .def_readonly("leg1_venue"           , &ArbitrageResult::leg1_venue)
            .def_readonly("leg2_venue"           , &ArbitrageResult::leg2_venue)
            .def(self_ns::repr(self_ns::self))
            .def(self_ns::str(self_ns::self))
            ;

    class_<LoanCoordinator, dont_make_copies>("LoanCoordinator"
            , init<Ledger &, LendingAuthority &, ExchangeRouter &, ExchangeRouter &, const ExecutorConfig &>()
                  [with_custodian_and_ward<1, 2, with_custodian_and_ward<1, 3,
                   with_custodian_and_ward<1, 4, with_custodian_and_ward<1, 5>>>>()])
            .def("initiate"            , &LoanCoordinator::initiate)
            .def("initiate"            , coordinator_initiate_hex)
            .def("onFundsReceived"     , &LoanCoordinator::onFundsReceived)
            .def("withdraw"            , &LoanCoordinator::withdraw)
            .def("transfer_ownership"  , &LoanCoordinator::transfer_ownership)
            .def("address"             , &LoanCoordinator::address, copy_address())
            .def("owner"               , &LoanCoordinator::owner, copy_address())
            .def("phase"               , &LoanCoordinator::phase)
            ;

    enum_<log_level>("log_level")
            .value("trace"  , log_level_trace  )
            .value("debug"  , log_level_debug  )
            .value("info"   , log_level_info   )
            .value("warning", log_level_warning)
            .value("error"  , log_level_error  )
            .export_values()
            ;
    def("log_get_level", log_get_level);
    def("log_set_level", log_set_level);
    def("log_register_sink", log_register_sink);
    def("log_unregister_sink", log_unregister_sink);
}
