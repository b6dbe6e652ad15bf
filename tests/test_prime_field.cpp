#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include <fieldkit/params.hpp>
#include <fieldkit/prime_field.hpp>

using fieldkit::prime_field;
namespace mp = boost::multiprecision;

class PrimeFieldTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        fieldkit::set_logging_level(fieldkit::log_level::disabled);
    }
};

TEST_F(PrimeFieldTest, Construction) {
    prime_field f(7);
    EXPECT_EQ(f.modulus(), 7);
    EXPECT_TRUE(f.checked());
    EXPECT_TRUE(f.zero().is_zero());
    EXPECT_EQ(f.one().data(), 1);
}

TEST_F(PrimeFieldTest, ElementIsReducedIntoCanonicalRange) {
    prime_field f(7);
    EXPECT_EQ(f.element(5), f.element(12));
    EXPECT_EQ(f.element(12).data(), 5);
    EXPECT_EQ(f.element(-1).data(), 6);
    EXPECT_EQ(f.element(-14).data(), 0);
    EXPECT_TRUE(f.element(7).is_zero());
    EXPECT_EQ(f.element(mp::cpp_int(-15)).data(), 6);
}

TEST_F(PrimeFieldTest, ElementIgnoresMultiplesOfModulus) {
    prime_field f(7);
    for (int v = -50; v <= 50; v++) {
        for (int k = -3; k <= 3; k++) {
            EXPECT_EQ(f.element(v), f.element(v + k * 7)) << "v=" << v << " k=" << k;
        }
    }
}

TEST_F(PrimeFieldTest, AdditionMatchesIntegerAddition) {
    constexpr int p = 13;
    prime_field f(p);
    for (int a = 0; a < p; a++) {
        for (int b = 0; b < p; b++) {
            auto x = f.element(a), y = f.element(b);
            EXPECT_EQ((x + y).data(), (a + b) % p);
            EXPECT_EQ(x + y, y + x);
            for (int c = 0; c < p; c++) {
                auto z = f.element(c);
                EXPECT_EQ((x + y) + z, x + (y + z));
            }
        }
    }
}

TEST_F(PrimeFieldTest, SubtractionStaysNonNegative) {
    prime_field f(7);
    EXPECT_EQ((f.element(2) - f.element(5)).data(), 4);
    EXPECT_EQ((f.element(5) - f.element(2)).data(), 3);
    EXPECT_TRUE((f.element(3) - f.element(3)).is_zero());
}

TEST_F(PrimeFieldTest, Negation) {
    prime_field f(7);
    EXPECT_EQ(-f.zero(), f.zero());
    EXPECT_EQ((-f.element(3)).data(), 4);
    for (int a = 0; a < 7; a++) {
        EXPECT_EQ(f.element(a) + (-f.element(a)), f.zero());
    }
}

TEST_F(PrimeFieldTest, MultiplicationModThree) {
    prime_field f(3);
    EXPECT_EQ(f.element(1) * f.element(1), f.one());
    EXPECT_EQ(f.element(2) * f.element(2), f.one());
    EXPECT_TRUE((f.element(0) * f.element(2)).is_zero());
}

TEST_F(PrimeFieldTest, MultiplicationIsCommutativeAndDistributive) {
    constexpr int p = 11;
    prime_field f(p);
    for (int a = 0; a < p; a++) {
        for (int b = 0; b < p; b++) {
            auto x = f.element(a), y = f.element(b);
            EXPECT_EQ((x * y).data(), (a * b) % p);
            EXPECT_EQ(x * y, y * x);
            for (int c = 0; c < p; c++) {
                auto z = f.element(c);
                EXPECT_EQ((x * y) * z, x * (y * z));
                EXPECT_EQ(x * (y + z), x * y + x * z);
            }
        }
    }
}

TEST_F(PrimeFieldTest, InverseOfThreeModSeven) {
    prime_field f(7);
    EXPECT_EQ(f.element(3).inverse(), f.element(5));
    EXPECT_EQ(f.element(3) * f.element(5), f.one());
    EXPECT_EQ(f.element(5), f.one() / f.element(3));
}

TEST_F(PrimeFieldTest, EveryNonzeroElementHasAnInverse) {
    prime_field f(101);
    for (int a = 1; a < 101; a++) {
        auto x = f.element(a);
        EXPECT_EQ(x * x.inverse(), f.one()) << "a=" << a;
        EXPECT_EQ(x / x, f.one()) << "a=" << a;
    }
}

TEST_F(PrimeFieldTest, DivisionByZeroFails) {
    prime_field f(3);
    EXPECT_THROW(f.zero().inverse(), fieldkit::division_by_zero_error);
    EXPECT_THROW(f.zero() / f.zero(), fieldkit::division_by_zero_error);
    EXPECT_THROW(f.element(2) / (f.zero() * f.element(2)), fieldkit::division_by_zero_error);
}

TEST_F(PrimeFieldTest, PowerIdentities) {
    constexpr int p = 101;
    prime_field f(p);
    EXPECT_EQ(f.zero().pow(0), f.one());
    for (int a = 0; a < p; a++) {
        auto x = f.element(a);
        EXPECT_EQ(x.pow(0), f.one());
        EXPECT_EQ(x.pow(1), x);
        EXPECT_EQ(x.pow(2), x * x);
        if (a != 0) {
            EXPECT_EQ(x.pow(p - 1), f.one()) << "a=" << a;
        }
    }
}

TEST_F(PrimeFieldTest, PowerWithHugeExponent) {
    prime_field f(101);
    const mp::cpp_int e = mp::cpp_int(1) << 200;
    EXPECT_EQ(f.element(2).pow(e).data(), 81);
    const mp::cpp_int expected = mp::powm(mp::cpp_int(2), e, mp::cpp_int(101));
    EXPECT_EQ(fieldkit::pow(f.element(2), e).data(), expected);
}

TEST_F(PrimeFieldTest, NegativePowerRaisesInverse) {
    prime_field f(7);
    EXPECT_EQ(f.element(3).pow(-1), f.element(5));
    EXPECT_EQ(f.element(3).pow(-2), f.element(5) * f.element(5));
    EXPECT_THROW(f.zero().pow(-1), fieldkit::division_by_zero_error);
}

TEST_F(PrimeFieldTest, Fractions) {
    prime_field f(11);
    EXPECT_EQ(f.fraction(1, 2) * f.fraction(1, 2), f.fraction(1, 4));
    EXPECT_EQ(f.fraction(3, 4) * f.fraction(5, 6), f.fraction(5, 8));
    EXPECT_EQ(f.fraction(6, 3), f.element(2));
    EXPECT_EQ(f.fraction(-1, 2), -f.fraction(1, 2));
    EXPECT_THROW(f.fraction(1, 22), fieldkit::division_by_zero_error);
}

TEST_F(PrimeFieldTest, ElementsOfDifferentFieldsAreNeverEqual) {
    prime_field f(7), g(11);
    EXPECT_NE(f.element(3), g.element(3));
    EXPECT_FALSE(f.element(0) == g.element(0));
    EXPECT_NE(f, g);
}

TEST_F(PrimeFieldTest, FieldsWithEqualModulusInteroperate) {
    prime_field f(7), h(7);
    EXPECT_EQ(f, h);
    EXPECT_EQ(f.element(3), h.element(3));
    EXPECT_EQ(f.element(3) + h.element(4), f.zero());
}

TEST_F(PrimeFieldTest, TextualRepresentation) {
    prime_field f(7);
    EXPECT_EQ(f.element(-1).to_string(), "6");
    EXPECT_EQ(f.element(21).to_string(), "0");

    std::ostringstream os;
    os << f.element(10);
    EXPECT_EQ(os.str(), "3");

    EXPECT_EQ(static_cast<int>(f.element(12)), 5);
}

TEST_F(PrimeFieldTest, LargeModulus) {
    prime_field m{mp::cpp_int(fieldkit::params::modulus_stark256)};
    const mp::cpp_int one = 1;

    EXPECT_NE(m.element(5), m.element(11));
    EXPECT_NE(m.element(one << 32), m.element(one << 64));
    EXPECT_NE(m.element(one << 64), m.element(one << 128));
    EXPECT_EQ(m.element(one << 256), m.element((one << 32) * 351 - 1));

    auto x = m.element(mp::cpp_int("123456789123456789123456789123456789"));
    EXPECT_EQ(x * x.inverse(), m.one());
    EXPECT_EQ(x.pow(m.modulus() - 1), m.one());
}
