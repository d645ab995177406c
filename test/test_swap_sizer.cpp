#include "test_utils.hpp"
#include <flashcalc/sizing/swap_sizer.hpp>


using namespace flashcalc::model;
using namespace flashcalc::sizing;
using namespace flashcalc::test;


static void test_request_consistency()
{
    SwapRequest(dusd(), wstk(), 0, ether(1), 50).check_consistency();
    SwapRequest(dusd(), wstk(), ether(1), 0, 50).check_consistency();
    expect_throws<InvalidSwapRequest>([]{ SwapRequest(dusd(), wstk(), 0, 0, 50).check_consistency(); }, "neither");
    expect_throws<InvalidSwapRequest>([]{ SwapRequest(dusd(), wstk(), 1, 1, 50).check_consistency(); }, "both");
    expect_throws<InputError>([]{ SwapRequest().check_consistency(); }, "default request is an InputError");
}

static void test_max_input_for_exact_output()
{
    // 295 collateral at 1:1, 0.5% slippage
    expect_eq(maxInputForExactOutput(ether(295), dusd(), wstk(), 50), bn("296475000000000000000"), "1:1 buffered");
    expect_eq(maxInputForExactOutput(ether(295), dusd(), wstk(), 0), ether(295), "1:1 no slippage");
    // 1 WETH for USDC: 2000 USDC, buffered 1% -> 2020
    expect_eq(maxInputForExactOutput(ether(1), usdc(), weth(), 100), 2020000000, "cross decimals");
    // 1 wei of WETH costs at least a unit of USDC: the vault pays, estimate up
    expect_eq(maxInputForExactOutput(1, usdc(), weth(), 0), 1, "dust rounds up");

    expect_throws<InvalidSlippage>([]{ maxInputForExactOutput(1, usdc(), weth(), 10000); }, "100% slippage");
    auto broken = weth();
    broken.price = 0;
    expect_throws<ZeroPrice>([&]{ maxInputForExactOutput(1, usdc(), broken, 50); }, "zero price");
}

static void test_min_output_for_exact_input()
{
    expect_eq(minOutputForExactInput(ether(100), dusd(), wstk(), 50), bn("99500000000000000000"), "1:1 discounted");
    expect_eq(minOutputForExactInput(2000000000, usdc(), weth(), 100), bn("990000000000000000"), "cross decimals");
    expect_eq(minOutputForExactInput(1, weth(), usdc(), 0), 0, "dust rounds down");
}

static void test_validate_directionality()
{
    const balance_t expected = ether(295);
    const balance_t maxInput = bn("296475000000000000000");

    // exact bounds are fine
    auto v = validateSwapResult(SwapResult(maxInput, expected), expected, maxInput);
    expect_eq(v.surplus, 0, "no surplus");
    expect_eq(v.unspentInput, 0, "all input spent");

    expect_throws<InsufficientOutput>([&]{
        validateSwapResult(SwapResult(maxInput, expected - 1), expected, maxInput);
    }, "one wei short");
    expect_throws<ExcessiveInput>([&]{
        validateSwapResult(SwapResult(maxInput + 1, expected), expected, maxInput);
    }, "one wei over");

    try
    {
        validateSwapResult(SwapResult(maxInput, expected - 5), expected, maxInput);
        throw std::runtime_error("InsufficientOutput not thrown");
    }
    catch (const InsufficientOutput &e)
    {
        expect_eq(e.expected, expected, "reported expected output");
        expect_eq(e.actual, expected - 5, "reported actual output");
    }
}

static void test_validate_leftovers()
{
    auto v = validateSwapResult(SwapResult(ether(290), ether(296)), ether(295), ether(300));
    expect_eq(v.surplus, ether(1), "surplus");
    expect_eq(v.unspentInput, ether(10), "unspent input");

    v = validateExactInputResult(SwapResult(ether(100), ether(100)), ether(100), bn("99500000000000000000"));
    expect_eq(v.surplus, ether(1) / 2, "exact in surplus");
    expect_eq(v.unspentInput, 0, "exact in spends everything");

    expect_throws<InsufficientOutput>([]{
        validateExactInputResult(SwapResult(ether(100), ether(99)), ether(100), bn("99500000000000000000"));
    }, "exact in, output short");
    expect_throws<ExcessiveInput>([]{
        validateExactInputResult(SwapResult(ether(100) + 1, ether(100)), ether(100), ether(99));
    }, "exact in, overspent");
}

static void test_spend_report()
{
    checkSpendReport(1000, 1000);
    checkSpendReport(1000, 999);
    checkSpendReport(999, 1000);
    expect_throws<SpendReportMismatch>([]{ checkSpendReport(1000, 998); }, "two wei off");
    expect_throws<swap_error>([]{ checkSpendReport(998, 1000); }, "mismatch is a swap_error");
    checkSpendReport(1000, 990, 10);

    // applied by validation when the venue reports its spend
    validateSwapResult(SwapResult(ether(1), ether(1), ether(1) + 1), ether(1), ether(2));
    expect_throws<SpendReportMismatch>([]{
        validateSwapResult(SwapResult(ether(1), ether(1), ether(1) + 2), ether(1), ether(2));
    }, "reported spend off");
}

int main()
{
    test_request_consistency();
    test_max_input_for_exact_output();
    test_min_output_for_exact_input();
    test_validate_directionality();
    test_validate_leftovers();
    test_spend_report();
    return 0;
}
