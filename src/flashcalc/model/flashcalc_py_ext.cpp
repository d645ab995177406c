#pragma GCC diagnostic ignored "-Wdeprecated-declarations" // Silencing GCC nagging me about std::auto_ptr somewhere in boost legacy snippets

#include <boost/python.hpp>
#include <sstream>
#include "longobject.h"
#include "unicodeobject.h"
#include "flashcalc_math.hpp"
#include "flashcalc_price.hpp"
#include "flashcalc_leverage.hpp"
#include "flashcalc_fees.hpp"
#include "flashcalc_constraints.hpp"
#include "../sizing/engine.hpp"
#include "../sizing/swap_venue.hpp"
#include "../commons/flashcalc_log.hpp"



using namespace boost::python;
using namespace flashcalc::model;
using namespace flashcalc::sizing;



/**
 * @brief PyLong_AsBalance
 *
 * Translate a CPython bigint into a boost::multiprecision bigint (balance_t).
 *
 * Used to provide transparent translation from Python to C++ data.
 *
 * @param vv
 * @return
 */
static balance_t PyLong_AsBalance(PyObject *vv)
{
    // it's complicated to efficiently transpose Python's internal bigint representation
    // into boost::multiprecision bigint object limbs. I'm using string serialization
    // and lexing of the uint number.

    std::string repr;
    if (PyBytes_Check(vv))
    {
        repr = PyBytes_AsString(vv);
    }
    else
    {
        PyObject *str_repr = PyObject_Str(vv);
        if (!str_repr)
        {
            throw_error_already_set();
        }
        PyObject *encodedString = PyUnicode_AsEncodedString(str_repr, "UTF-8", "strict");
        Py_DECREF(str_repr);
        if (!encodedString)
        {
            PyErr_SetString(PyExc_ValueError, "bad uint representation");
            throw_error_already_set();
        }
        repr = PyBytes_AsString(encodedString);
        Py_DECREF(encodedString);
    }

    if (!repr.empty() && repr[0] == '-')
    {
        PyErr_SetString(PyExc_ValueError, "negative amounts are not balances");
        throw_error_already_set();
    }
    try {
        // parsed checked: anything past 256 bits is refused, never truncated
        return math::parseBalance(repr.c_str());
    }
    catch (const EngineError &e) {
        PyErr_SetString(PyExc_ValueError, e.what());
        throw_error_already_set();
    }
    return 0; // unreachable
}


/**
 * @brief Translator which executes transparent translation of Python unbounded "int" into
 *        balance_t objects, which are very big numbers, much larger than
 *        the largest CPU registry.
 *
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
        // Grab pointer to memory into which to construct the new value
        balance_t* storage = reinterpret_cast<balance_t*>(((converter::rvalue_from_python_storage<balance_t>*)data)->storage.bytes);

        // in-place construct the new value using the character data
        // extraced from the python object
        new (storage) balance_t(PyLong_AsBalance(obj_ptr));

        // Stash the memory chunk pointer for later use by boost.python
        data->convertible = storage;
    }

};


/**
 * @brief turns any bignum back into a Python int, via its decimal representation
 */
template<typename T>
static object bignum_to_python_long(const T &o)
{
    std::stringstream ss;
    ss << o;
    return object(handle<>(PyLong_FromString(ss.str().c_str(), nullptr, 10)));
}


static balance_t *make_balance(const char *literal)
{
    return new balance_t(math::parseBalance(literal));
}


static Asset *make_asset(const char *address
                         , const std::string &symbol
                         , unsigned int decimals
                         , const balance_t &price)
{
    return new Asset(address_t(address), symbol, decimals, price);
}


// C++ exceptions surface in Python as their closest builtin:
static void translate_arithmetic_error(const ArithmeticError &e)
{
    PyErr_SetString(PyExc_ArithmeticError, e.what());
}

static void translate_input_error(const InputError &e)
{
    PyErr_SetString(PyExc_ValueError, e.what());
}

static void translate_swap_error(const swap_error &e)
{
    PyErr_SetString(PyExc_RuntimeError, e.what());
}


BOOST_PYTHON_FUNCTION_OVERLOADS(scaleDecimals_overloads, math::scaleDecimals, 3, 4)
BOOST_PYTHON_FUNCTION_OVERLOADS(checkSpendReport_overloads, checkSpendReport, 2, 3)


/**
 * @brief Export C++ model to Python.
 *
 * This is what is seen by "import" of this CPython extension.
 */
BOOST_PYTHON_MODULE(flashcalc_ext)
{
    using dont_make_copies = boost::noncopyable;

    register_exception_translator<ArithmeticError>(&translate_arithmetic_error);
    register_exception_translator<InputError>(&translate_input_error);
    register_exception_translator<swap_error>(&translate_swap_error);

    class_<balance_t>("balance_t")
            .def("__init__", make_constructor(&make_balance))
            .def(init<unsigned long long int>())
            .def("__int__", &bignum_to_python_long<balance_t>)
            .def("__index__", &bignum_to_python_long<balance_t>)
            .def(self == self)
            .def(self < self)
            .def(self_ns::repr(self_ns::self))
            .def(self_ns::str(self_ns::self))
            ;
    balance_from_python_long();

    class_<margin_t>("margin_t", no_init)
            .def("__int__", &bignum_to_python_long<margin_t>)
            .def("__index__", &bignum_to_python_long<margin_t>)
            .def(self_ns::repr(self_ns::self))
            .def(self_ns::str(self_ns::self))
            ;

    class_<address_t>("address_t")
            .def(init<const char *>())
            .def(self_ns::repr(self_ns::self))
            .def(self_ns::str(self_ns::self))
            ;

    scope().attr("BPS_ONE") = math::BPS_ONE;
    scope().attr("DEFAULT_SLIPPAGE_BPS") = DEFAULT_SLIPPAGE_BPS;
    scope().attr("DEFAULT_MIN_PROFIT_BPS") = DEFAULT_MIN_PROFIT_BPS;
    scope().attr("DEFAULT_FLASH_FEE_BPS") = DEFAULT_FLASH_FEE_BPS;
    scope().attr("DEFAULT_TREASURY_FEE_BPS") = DEFAULT_TREASURY_FEE_BPS;
    scope().attr("DEFAULT_MIN_FLASH_AMOUNT") = bignum_to_python_long(DEFAULT_MIN_FLASH_AMOUNT);
    scope().attr("DEFAULT_MAX_FLASH_AMOUNT") = bignum_to_python_long(DEFAULT_MAX_FLASH_AMOUNT);
    scope().attr("DEFAULT_MIN_PROFIT_AMOUNT") = bignum_to_python_long(DEFAULT_MIN_PROFIT_AMOUNT);

    // fixed point math
    def("parseBalance"  , &math::parseBalance);
    def("mulDiv"        , &math::mulDiv);
    def("scaleDecimals" , &math::scaleDecimals, scaleDecimals_overloads());
    def("pow10"         , &math::pow10);
    def("bpsMul"        , &math::bpsMul);
    def("rayMul"        , &math::rayMul);
    def("rayDiv"        , &math::rayDiv);
    def("wadMul"        , &math::wadMul);
    def("wadDiv"        , &math::wadDiv);

    // prices
    class_<Asset>("Asset")
            .def("__init__"             , make_constructor(&make_asset))
            .def_readwrite("address"    , &Asset::address)
            .def_readwrite("symbol"     , &Asset::symbol)
            .def_readwrite("decimals"   , &Asset::decimals)
            .def_readwrite("price"      , &Asset::price)
            .def("sameAs"               , &Asset::sameAs)
            .def(self_ns::repr(self_ns::self))
            .def(self_ns::str(self_ns::self))
            ;
    def("convert"               , &price::convert);
    def("withSlippageBuffer"    , &price::withSlippageBuffer);
    def("withSlippageDiscount"  , &price::withSlippageDiscount);
    def("toBaseCurrency"        , &price::toBaseCurrency);
    def("fromBaseCurrency"      , &price::fromBaseCurrency);

    // fees
    def("feeOn"                 , &fees::feeOn);
    def("netAfterFee"           , &fees::netAfterFee);
    def("grossRequiredForNet"   , &fees::grossRequiredForNet);

    // leverage
    class_<LeverageConfig>("LeverageConfig")
            .def(init<unsigned int, unsigned int, unsigned int, optional<unsigned int>>())
            .def_readwrite("targetBps"          , &LeverageConfig::targetBps)
            .def_readwrite("lowerBps"           , &LeverageConfig::lowerBps)
            .def_readwrite("upperBps"           , &LeverageConfig::upperBps)
            .def_readwrite("maxSubsidyBps"      , &LeverageConfig::maxSubsidyBps)
            .def_readwrite("minDeviationBps"    , &LeverageConfig::minDeviationBps)
            .def("check_consistency"            , &LeverageConfig::check_consistency)
            ;

    class_<VaultPosition>("VaultPosition")
            .def(init<const balance_t &, const balance_t &>())
            .def_readwrite("collateral" , &VaultPosition::collateral)
            .def_readwrite("debt"       , &VaultPosition::debt)
            ;

    enum_<RebalanceQuote::Direction>("RebalanceDirection")
            .value("none"       , RebalanceQuote::REBALANCE_NONE)
            .value("increase"   , RebalanceQuote::REBALANCE_INCREASE)
            .value("decrease"   , RebalanceQuote::REBALANCE_DECREASE)
            ;

    class_<RebalanceQuote>("RebalanceQuote")
            .def_readonly("direction"           , &RebalanceQuote::direction)
            .def_readonly("subsidyBps"          , &RebalanceQuote::subsidyBps)
            .def_readonly("inputBase"           , &RebalanceQuote::inputBase)
            .def_readonly("outputBase"          , &RebalanceQuote::outputBase)
            .def_readonly("inputTokenAmount"    , &RebalanceQuote::inputTokenAmount)
            .def_readonly("outputTokenAmount"   , &RebalanceQuote::outputTokenAmount)
            .def(self_ns::repr(self_ns::self))
            .def(self_ns::str(self_ns::self))
            ;

    def("currentLeverageBps"            , static_cast<balance_t (*)(const balance_t &, const balance_t &)>(&leverage::currentLeverageBps));
    def("currentLeverageBps"            , static_cast<balance_t (*)(const VaultPosition &)>(&leverage::currentLeverageBps));
    def("leveragedDepositAmount"        , &leverage::leveragedDepositAmount);
    def("collateralToRemoveForRedeem"   , &leverage::collateralToRemoveForRedeem);
    def("unleveragedAmount"             , &leverage::unleveragedAmount);
    def("debtToKeepLeverage"            , &leverage::debtToKeepLeverage);
    def("isWithinBounds"                , &leverage::isWithinBounds);
    def("currentSubsidyBps"             , &leverage::currentSubsidyBps);
    def("quoteRebalance"                , &leverage::quoteRebalance);

    // swaps
    class_<SwapRequest>("SwapRequest")
            .def(init<const Asset &, const Asset &, const balance_t &, const balance_t &, unsigned int, optional<uint64_t>>())
            .def_readwrite("inputAsset"     , &SwapRequest::inputAsset)
            .def_readwrite("outputAsset"    , &SwapRequest::outputAsset)
            .def_readwrite("exactInput"     , &SwapRequest::exactInput)
            .def_readwrite("exactOutput"    , &SwapRequest::exactOutput)
            .def_readwrite("slippageBps"    , &SwapRequest::slippageBps)
            .def_readwrite("deadline"       , &SwapRequest::deadline)
            .def("isExactOutput"            , &SwapRequest::isExactOutput)
            .def("check_consistency"        , &SwapRequest::check_consistency)
            .def(self_ns::repr(self_ns::self))
            .def(self_ns::str(self_ns::self))
            ;

    class_<SwapResult>("SwapResult")
            .def(init<const balance_t &, const balance_t &, optional<const balance_t &>>())
            .def_readwrite("amountSpent"    , &SwapResult::amountSpent)
            .def_readwrite("amountReceived" , &SwapResult::amountReceived)
            .def_readwrite("amountReported" , &SwapResult::amountReported)
            ;

    class_<SwapValidation>("SwapValidation")
            .def_readonly("surplus"         , &SwapValidation::surplus)
            .def_readonly("unspentInput"    , &SwapValidation::unspentInput)
            ;

    def("maxInputForExactOutput"    , &maxInputForExactOutput);
    def("minOutputForExactInput"    , &minOutputForExactInput);
    def("validateSwapResult"        , &validateSwapResult);
    def("validateExactInputResult"  , &validateExactInputResult);
    def("checkSpendReport"          , &checkSpendReport, checkSpendReport_overloads());

    class_<SwapVenue, dont_make_copies>("SwapVenue", no_init)
            .def("quoteExactOutput"     , &SwapVenue::quoteExactOutput)
            .def("quoteExactInput"      , &SwapVenue::quoteExactInput)
            .def("executeExactOutput"   , &SwapVenue::executeExactOutput)
            .def("executeExactInput"    , &SwapVenue::executeExactInput)
            ;

    class_<ConstantProductVenue, bases<SwapVenue>>("ConstantProductVenue"
            , init<const Asset &, const Asset &, const balance_t &, const balance_t &, optional<unsigned int>>())
            .def_readonly("token0"      , &ConstantProductVenue::token0)
            .def_readonly("token1"      , &ConstantProductVenue::token1)
            .def_readwrite("feePPM"     , &ConstantProductVenue::feePPM)
            .def("reserve0"             , &ConstantProductVenue::reserve0, return_value_policy<copy_const_reference>())
            .def("reserve1"             , &ConstantProductVenue::reserve1, return_value_policy<copy_const_reference>())
            ;

    class_<ExecutionReport>("ExecutionReport")
            .def_readonly("result"      , &ExecutionReport::result)
            .def_readonly("validation"  , &ExecutionReport::validation)
            ;

    def("simulateExecution"         , &simulateExecution);

    // engine
    class_<SizingPolicy>("SizingPolicy")
            .def_readwrite("flashFeeBps"        , &SizingPolicy::flashFeeBps)
            .def_readwrite("protocolFeeBps"     , &SizingPolicy::protocolFeeBps)
            .def_readwrite("minProfitBps"       , &SizingPolicy::minProfitBps)
            .def_readwrite("acceptBreakEven"    , &SizingPolicy::acceptBreakEven)
            .def_readwrite("minFlashAmount"     , &SizingPolicy::minFlashAmount)
            .def_readwrite("maxFlashAmount"     , &SizingPolicy::maxFlashAmount)
            .def_readwrite("minProfitAmount"    , &SizingPolicy::minProfitAmount)
            .def("check_consistency"            , &SizingPolicy::check_consistency)
            ;

    class_<OperationProceeds>("OperationProceeds")
            .def(init<const balance_t &, const Asset &, const balance_t &>())
            .def_readwrite("heldCollateral" , &OperationProceeds::heldCollateral)
            .def_readwrite("rewardAsset"    , &OperationProceeds::rewardAsset)
            .def_readwrite("rewardAmount"   , &OperationProceeds::rewardAmount)
            ;

    enum_<RejectReason>("RejectReason")
            .value("none"           , REASON_NONE)
            .value("OutOfBounds"    , REASON_OUT_OF_BOUNDS)
            .value("BelowThreshold" , REASON_BELOW_THRESHOLD)
            .value("NegativeMargin" , REASON_NEGATIVE_MARGIN)
            .value("ZeroPrincipal"  , REASON_ZERO_PRINCIPAL)
            .value("FlashLimit"     , REASON_FLASH_LIMIT)
            ;

    class_<SizingDecision>("SizingDecision")
            .def_readonly("reason"              , &SizingDecision::reason)
            .def_readonly("flashPrincipal"      , &SizingDecision::flashPrincipal)
            .def_readonly("maxSwapInput"        , &SizingDecision::maxSwapInput)
            .def_readonly("expectedNetProfit"   , &SizingDecision::expectedNetProfit)
            .def_readonly("expectedOutput"      , &SizingDecision::expectedOutput)
            .def_readonly("depositedCollateral" , &SizingDecision::depositedCollateral)
            .def_readonly("borrowedProceeds"    , &SizingDecision::borrowedProceeds)
            .def_readonly("rewardValue"         , &SizingDecision::rewardValue)
            .def_readonly("flashFee"            , &SizingDecision::flashFee)
            .def_readonly("protocolFee"         , &SizingDecision::protocolFee)
            .def_readonly("netMargin"           , &SizingDecision::netMargin)
            .def_readonly("leverageBeforeBps"   , &SizingDecision::leverageBeforeBps)
            .def_readonly("leverageAfterBps"    , &SizingDecision::leverageAfterBps)
            .def_readonly("deadline"            , &SizingDecision::deadline)
            .def("proceed"                      , &SizingDecision::proceed)
            .def("rejected"                     , &SizingDecision::rejected)
            .def("infos"                        , &SizingDecision::infos)
            .def(self_ns::repr(self_ns::self))
            .def(self_ns::str(self_ns::self))
            ;

    class_<RedeemSizing>("RedeemSizing")
            .def_readonly("collateralToRemove"      , &RedeemSizing::collateralToRemove)
            .def_readonly("debtToRepay"             , &RedeemSizing::debtToRepay)
            .def_readonly("flashFee"                , &RedeemSizing::flashFee)
            .def_readonly("flashRepayment"          , &RedeemSizing::flashRepayment)
            .def_readonly("maxCollateralSpent"      , &RedeemSizing::maxCollateralSpent)
            .def_readonly("collateralToReceiver"    , &RedeemSizing::collateralToReceiver)
            .def_readonly("swapRequest"             , &RedeemSizing::swapRequest)
            .def_readonly("viable"                  , &RedeemSizing::viable)
            .def("infos"                            , &RedeemSizing::infos)
            ;

    def("evaluate", static_cast<SizingDecision (*)(const VaultPosition &
                                                   , const LeverageConfig &
                                                   , const SwapRequest &
                                                   , const OperationProceeds &
                                                   , const SizingPolicy &)>(&evaluate));
    def("evaluate", static_cast<SizingDecision (*)(const VaultPosition &
                                                   , const LeverageConfig &
                                                   , const SwapRequest &
                                                   , const OperationProceeds &
                                                   , unsigned int
                                                   , unsigned int
                                                   , unsigned int)>(&evaluate));
    def("sizeDeposit"   , &sizeDeposit);
    def("sizeRedeem"    , &sizeRedeem);

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
    def("log_has_sink", log_has_sink);
}
