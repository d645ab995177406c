#include "test_utils.hpp"
#include <flashcalc/model/flashcalc_math.hpp>


using namespace flashcalc::model;
using namespace flashcalc::test;


static void test_convert_same_asset()
{
    auto a = dusd();
    auto b = dusd();
    b.price = 0;
    // no price lookup at all when from == to
    expect_eq(price::convert(12345, a, b, false), 12345, "same asset");
    expect_eq(price::convert(12345, b, b, true), 12345, "same asset, no price");
}

static void test_convert_decimals()
{
    // 1.5 USDC -> 1.5e18 dUSD
    expect_eq(price::convert(1500000, usdc(), dusd(), false), ether(3) / 2, "6 -> 18 decimals");
    // 1e18 + 1 wei dUSD -> USDC: the wei is lost, or rounded up
    expect_eq(price::convert(ether(1) + 1, dusd(), usdc(), false), 1000000, "18 -> 6 decimals floor");
    expect_eq(price::convert(ether(1) + 1, dusd(), usdc(), true), 1000001, "18 -> 6 decimals ceil");
}

static void test_convert_prices()
{
    // 1 WETH at 2000 USD -> 2000 dUSD, and back
    expect_eq(price::convert(ether(1), weth(), dusd(), false), ether(2000), "weth -> dusd");
    expect_eq(price::convert(ether(2000), dusd(), weth(), false), ether(1), "dusd -> weth");
    expect_eq(price::convert(1, dusd(), weth(), false), 0, "dust floor");
    expect_eq(price::convert(1, dusd(), weth(), true), 1, "dust ceil");
}

static void test_convert_round_trip_never_increases()
{
    const Asset assets[] = { dusd(), usdc(), weth(), wstk() };
    const balance_t amounts[] = { 1, 999, 1000001, ether(1) + 7, bn("123456789123456789123") };
    for (const auto &from: assets)
    {
        for (const auto &to: assets)
        {
            for (const auto &amount: amounts)
            {
                const auto there = price::convert(amount, from, to, false);
                const auto back = price::convert(there, to, from, false);
                expect(back <= amount, strfmt("round trip %1% %2% -> %3% -> %4%"
                                              , amount, from.symbol, to.symbol, back));
            }
        }
    }
}

static void test_convert_zero_price()
{
    auto broken = weth();
    broken.price = 0;
    expect_throws<ZeroPrice>([&]{ price::convert(1, broken, dusd(), false); }, "zero from price");
    expect_throws<ZeroPrice>([&]{ price::convert(1, dusd(), broken, false); }, "zero to price");
    expect_throws<InputError>([&]{ price::toBaseCurrency(1, broken, false); }, "zero price is an InputError");
}

static void test_slippage()
{
    expect_eq(price::withSlippageBuffer(ether(100), 50), bn("100500000000000000000"), "0.5% buffer");
    expect_eq(price::withSlippageBuffer(1, 50), 2, "buffer rounds up");
    expect_eq(price::withSlippageBuffer(1000, 0), 1000, "no slippage");
    expect_eq(price::withSlippageDiscount(ether(100), 50), bn("99500000000000000000"), "0.5% discount");
    expect_eq(price::withSlippageDiscount(1, 50), 0, "discount rounds down");

    // strictly increasing in both the amount and the tolerance. In the
    // tolerance only from 10000 units up: below that one more bps may
    // vanish in the rounding.
    balance_t prev = 0;
    for (unsigned int s = 0; s < 10000; s += 997)
    {
        const auto v = price::withSlippageBuffer(ether(7) + 3, s);
        expect(v > prev, strfmt("buffer increasing in slippage at %1%", s));
        expect(v >= ether(7) + 3, "buffer never shrinks");
        expect(price::withSlippageBuffer(ether(7) + 4, s) > v, "buffer increasing in amount");
        prev = v;
    }
    for (unsigned int s = 0; s < 9999; s += 1111)
    {
        expect(price::withSlippageBuffer(10000, s) < price::withSlippageBuffer(10000, s + 1)
               , strfmt("one more bps on 10000 units at %1%", s));
    }
    expect_eq(price::withSlippageBuffer(100, 1), price::withSlippageBuffer(100, 2), "small amounts plateau");

    expect_throws<InvalidSlippage>([]{ price::withSlippageBuffer(1, 10000); }, "100% buffer");
    expect_throws<InvalidSlippage>([]{ price::withSlippageDiscount(1, 12000); }, "120% discount");
}

static void test_base_currency()
{
    // base currency is 8 decimals USD
    expect_eq(price::toBaseCurrency(ether(3), weth(), false), bn("600000000000"), "3 WETH in USD");
    expect_eq(price::toBaseCurrency(2500000, usdc(), false), 250000000, "2.5 USDC in USD");
    expect_eq(price::fromBaseCurrency(250000000, usdc(), false), 2500000, "2.5 USD in USDC");
    expect_eq(price::toBaseCurrency(ether(1) / 2 + 1, dusd(), false), 50000000, "value floor");
    expect_eq(price::toBaseCurrency(ether(1) / 2 + 1, dusd(), true), 50000001, "value ceil");
}

int main()
{
    test_convert_same_asset();
    test_convert_decimals();
    test_convert_prices();
    test_convert_round_trip_never_increases();
    test_convert_zero_price();
    test_slippage();
    test_base_currency();
    return 0;
}
