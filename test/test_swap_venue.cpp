#include "test_utils.hpp"
#include <flashcalc/sizing/swap_venue.hpp>
#include <flashcalc/model/flashcalc_math.hpp>
#include <limits>


using namespace flashcalc::model;
using namespace flashcalc::sizing;
using namespace flashcalc::test;


static ConstantProductVenue make_pool()
{
    // 1M each side, 0.3% fee
    return ConstantProductVenue(dusd(), wstk(), ether(1000000), ether(1000000), 3000);
}


/**
 * @brief a venue that ignores the bounds it is given
 */
struct GreedyVenue: SwapVenue
{
    balance_t overcharge = 0;
    balance_t reported = 0;

    virtual balance_t quoteExactOutput(const SwapRequest &request) const
    {
        return request.exactOutput + overcharge;
    }
    virtual balance_t quoteExactInput(const SwapRequest &request) const
    {
        return request.exactInput;
    }
    virtual SwapResult executeExactOutput(const SwapRequest &request, const balance_t &)
    {
        return SwapResult(quoteExactOutput(request), request.exactOutput, reported);
    }
    virtual SwapResult executeExactInput(const SwapRequest &request, const balance_t &)
    {
        return SwapResult(request.exactInput, quoteExactInput(request), reported);
    }
};


static SizingDecision make_decision(const SwapRequest &request)
{
    SizingDecision d;
    if (request.isExactOutput())
    {
        d.expectedOutput = request.exactOutput;
        d.maxSwapInput = maxInputForExactOutput(request.exactOutput
                                                , request.inputAsset
                                                , request.outputAsset
                                                , request.slippageBps);
    }
    else
    {
        d.maxSwapInput = request.exactInput;
        d.expectedOutput = minOutputForExactInput(request.exactInput
                                                  , request.inputAsset
                                                  , request.outputAsset
                                                  , request.slippageBps);
    }
    d.flashPrincipal = d.maxSwapInput;
    return d;
}


static void test_quotes()
{
    auto pool = make_pool();
    SwapRequest buy(dusd(), wstk(), 0, ether(1000), 50);
    SwapRequest sell(dusd(), wstk(), ether(1000), 0, 50);

    const auto in = pool.quoteExactOutput(buy);
    const auto out = pool.quoteExactInput(sell);
    // fee + price impact, about 0.4%
    expect(in > ether(1004) && in < ether(1005), strfmt("exact out quote %1%", in));
    expect(out > ether(995) && out < ether(997), strfmt("exact in quote %1%", out));

    // quotes don't move the pool
    expect_eq(pool.reserve0(), ether(1000000), "reserve0 untouched");
    expect_eq(pool.reserve1(), ether(1000000), "reserve1 untouched");
}

static void test_execution_moves_reserves()
{
    auto pool = make_pool();
    const auto k_before = pool.reserve0() * pool.reserve1();

    SwapRequest buy(dusd(), wstk(), 0, ether(1000), 50);
    auto res = pool.executeExactOutput(buy, ether(1005));
    expect_eq(res.amountReceived, ether(1000), "exact output received");
    expect_eq(pool.reserve0(), ether(1000000) + res.amountSpent, "dusd reserve in");
    expect_eq(pool.reserve1(), ether(999000), "wstk reserve out");
    expect(pool.reserve0() * pool.reserve1() >= k_before, "k never decreases");

    // the other way around
    SwapRequest sell(wstk(), dusd(), ether(500), 0, 50);
    res = pool.executeExactInput(sell, 0);
    expect_eq(res.amountSpent, ether(500), "exact input spent");
    expect_eq(pool.reserve1(), ether(999500), "wstk reserve in");
}

static void test_execution_bounds()
{
    auto pool = make_pool();
    SwapRequest buy(dusd(), wstk(), 0, ether(1000), 50);
    const auto in = pool.quoteExactOutput(buy);

    expect_throws<ExcessiveInput>([&]{ pool.executeExactOutput(buy, in - 1); }, "exact out over max input");
    expect_eq(pool.reserve0(), ether(1000000), "failed swap leaves the pool alone");
    pool.executeExactOutput(buy, in);

    SwapRequest sell(dusd(), wstk(), ether(1000), 0, 50);
    const auto out = pool.quoteExactInput(sell);
    expect_throws<InsufficientOutput>([&]{ pool.executeExactInput(sell, out + 1); }, "exact in under min output");
}

static void test_pool_errors()
{
    auto pool = make_pool();
    SwapRequest drain(dusd(), wstk(), 0, ether(1000000), 50);
    expect_throws<swap_error>([&]{ pool.quoteExactOutput(drain); }, "can't buy the whole reserve");

    SwapRequest foreign(dusd(), weth(), 0, ether(1), 50);
    expect_throws<swap_error>([&]{ pool.quoteExactOutput(foreign); }, "token not in pool");

    SwapRequest self(dusd(), dusd(), ether(1), 0, 50);
    expect_throws<swap_error>([&]{ pool.quoteExactInput(self); }, "identical tokens");

    ConstantProductVenue empty(dusd(), wstk(), 0, 0);
    SwapRequest sell(dusd(), wstk(), ether(1), 0, 50);
    expect_throws<swap_error>([&]{ empty.quoteExactInput(sell); }, "no liquidity");

    expect_throws<InvalidConfig>([]{ ConstantProductVenue(dusd(), wstk(), 1, 1, 1000000); }, "100% pool fee");

    const balance_t max = std::numeric_limits<balance_t>::max();
    ConstantProductVenue full(dusd(), wstk(), max - 10, ether(1000));
    expect_throws<math::ArithmeticOverflow>([&]{ full.executeExactInput(sell, 0); }, "reserve overflow");
    expect_eq(full.reserve0(), max - 10, "overflowing swap leaves the pool alone");
}

static void test_simulate_execution()
{
    // 0.5% tolerance covers fee and price impact
    auto pool = make_pool();
    SwapRequest buy(dusd(), wstk(), 0, ether(1000), 50);
    auto report = simulateExecution(make_decision(buy), buy, pool);
    expect_eq(report.result.amountReceived, ether(1000), "received");
    expect(report.validation.unspentInput > 0, "some allowance left");
    expect_eq(report.validation.surplus, 0, "exact output, no surplus");

    pool = make_pool();
    SwapRequest sell(dusd(), wstk(), ether(1000), 0, 50);
    report = simulateExecution(make_decision(sell), sell, pool);
    expect(report.validation.surplus > 0, "exact in surplus");

    // 0.1% does not
    pool = make_pool();
    SwapRequest tight(dusd(), wstk(), 0, ether(1000), 10);
    expect_throws<ExcessiveInput>([&]{ simulateExecution(make_decision(tight), tight, pool); }, "tight exact out");
    SwapRequest tightSell(dusd(), wstk(), ether(1000), 0, 10);
    expect_throws<InsufficientOutput>([&]{ simulateExecution(make_decision(tightSell), tightSell, pool); }, "tight exact in");

    auto rejected = make_decision(buy);
    rejected.reason = REASON_NEGATIVE_MARGIN;
    expect_throws<InvalidSwapRequest>([&]{ simulateExecution(rejected, buy, pool); }, "rejected decision");
}

static void test_simulate_untrusted_venue()
{
    SwapRequest buy(dusd(), wstk(), 0, ether(100), 50);
    const auto decision = make_decision(buy);

    GreedyVenue venue;
    simulateExecution(decision, buy, venue);

    // the venue does not enforce the bound, validation does
    venue.overcharge = ether(1);
    expect_throws<ExcessiveInput>([&]{ simulateExecution(decision, buy, venue); }, "overcharging venue");

    venue.overcharge = 0;
    venue.reported = ether(99);
    expect_throws<SpendReportMismatch>([&]{ simulateExecution(decision, buy, venue); }, "lying venue");
}

int main()
{
    test_quotes();
    test_execution_moves_reserves();
    test_execution_bounds();
    test_pool_errors();
    test_simulate_execution();
    test_simulate_untrusted_venue();
    return 0;
}
