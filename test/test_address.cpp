#include <flashcalc/model/flashcalc_types.hpp>
#include <flashcalc/model/flashcalc_price.hpp>
#include <ostream>
#include <sstream>

using namespace flashcalc::model;
using namespace std;

template<typename T> std::string to_string(const T& o) {
    std::stringstream ss;
    ss << o;
    return ss.str();
}

void test_ctor_def(void)
{
    address_t a;
    if (to_string(a) != "0x0000000000000000000000000000000000000000")
    {
        throw std::runtime_error("test_ctor_def");
    }
}

void test_ctor_fromstr(void)
{
    std::string input = "0x5369F69C74d1D7Bf70d5D402b92E66551Edd05e7";
    std::string lowercase = "0x5369f69c74d1d7bf70d5d402b92e66551edd05e7";
    address_t a0(input.c_str());
    if (to_string(a0) != lowercase)
    {
        throw std::runtime_error("test_ctor_fromstr");
    }
}

void test_zero_padding(void)
{
    address_t a0("0x00000000000000000000000000000000000000ff");
    if (to_string(a0) != "0x00000000000000000000000000000000000000ff")
    {
        throw std::runtime_error("test_zero_padding");
    }
}

void test_asset_identity(void)
{
    // identity is the address: symbol, decimals and price don't matter
    Asset a("0x5369f69c74d1d7bf70d5d402b92e66551edd05e7", "dUSD", 18, 100000000);
    Asset b("0x5369F69C74d1D7Bf70d5D402b92E66551Edd05e7", "dUSD.e", 6, 0);
    Asset c("0x5369f69c74d1d7bf70d5d402b92e66551edd05e8", "dUSD", 18, 100000000);
    if (!a.sameAs(b) || a.sameAs(c) || a.address != b.address)
    {
        throw std::runtime_error("test_asset_identity");
    }
}

int main()
{
    test_ctor_def();
    test_ctor_fromstr();
    test_zero_padding();
    test_asset_identity();
}
