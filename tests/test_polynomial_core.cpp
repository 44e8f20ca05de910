#include <gtest/gtest.h>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include "polybasis/polynomial.h"

using namespace polybasis;

TEST(PolynomialTest, BasicOperations) {
    std::cout << "Testing Polynomial basic operations...\n";

    Polynomial p(std::vector<double>{1.0, 0.0, -1.0});  // x^2 - 1
    EXPECT_EQ(p.degree(), 2);

    EXPECT_NEAR(p.evaluate(0.0), -1.0, 1e-12);
    EXPECT_NEAR(p.evaluate(1.0), 0.0, 1e-12);
    EXPECT_NEAR(p.evaluate(2.0), 3.0, 1e-12);

    EXPECT_NEAR(p.derivative(0.0), 0.0, 1e-12);
    EXPECT_NEAR(p.derivative(1.0), 2.0, 1e-12);

    EXPECT_NEAR(p.second_derivative(0.0), 2.0, 1e-12);
    EXPECT_NEAR(p.second_derivative(1.0), 2.0, 1e-12);
}

TEST(PolynomialTest, AscendingConstructionAndCoefficients) {
    std::cout << "Testing construction from ascending coefficients...\n";

    // 1 + 2x + 3x^2
    Polynomial p = Polynomial::from_ascending({1.0, 2.0, 3.0});
    EXPECT_EQ(p.degree(), 2);
    EXPECT_DOUBLE_EQ(p.coefficient(0), 1.0);
    EXPECT_DOUBLE_EQ(p.coefficient(1), 2.0);
    EXPECT_DOUBLE_EQ(p.coefficient(2), 3.0);
    EXPECT_DOUBLE_EQ(p.coefficient(3), 0.0);
    EXPECT_DOUBLE_EQ(p.coefficient(-1), 0.0);
    EXPECT_NEAR(p.evaluate(2.0), 17.0, 1e-12);
}

TEST(PolynomialTest, LeadingZerosStripped) {
    Polynomial p(std::vector<double>{0.0, 0.0, 2.0, 1.0});
    EXPECT_EQ(p.degree(), 1);
    EXPECT_NEAR(p.evaluate(3.0), 7.0, 1e-12);

    // Малый, но ненулевой старший коэффициент сохраняется
    Polynomial q(std::vector<double>{1e-20, 1.0});
    EXPECT_EQ(q.degree(), 1);

    Polynomial empty(std::vector<double>{});
    EXPECT_EQ(empty.degree(), 0);
    EXPECT_DOUBLE_EQ(empty.evaluate(5.0), 0.0);
}

TEST(PolynomialTest, IndefiniteIntegral) {
    std::cout << "Testing term-wise integration...\n";

    Polynomial p(std::vector<double>{1.0, 0.0, -1.0});  // x^2 - 1
    Polynomial L = p.integral();                        // x^3/3 - x

    EXPECT_EQ(L.degree(), 3);
    EXPECT_NEAR(L.coefficient(3), 1.0 / 3.0, 1e-15);
    EXPECT_NEAR(L.coefficient(2), 0.0, 1e-15);
    EXPECT_NEAR(L.coefficient(1), -1.0, 1e-15);
    EXPECT_NEAR(L.coefficient(0), 0.0, 1e-15);
    EXPECT_NEAR(L.evaluate(0.0), 0.0, 1e-15);
    EXPECT_NEAR(L.evaluate(1.0), -2.0 / 3.0, 1e-15);

    // L' = p
    for (double x : {-1.0, -0.3, 0.0, 0.8, 2.0}) {
        EXPECT_NEAR(L.derivative(x), p.evaluate(x), 1e-12);
    }

    EXPECT_NEAR(L.evaluate(1.0) - L.evaluate(-1.0), -4.0 / 3.0, 1e-14);
}

TEST(PolynomialTest, IntegralOfConstant) {
    Polynomial c(std::vector<double>{2.5});
    Polynomial L = c.integral();
    EXPECT_EQ(L.degree(), 1);
    EXPECT_NEAR(L.evaluate(2.0), 5.0, 1e-15);

    Polynomial zero(std::vector<double>{0.0});
    EXPECT_EQ(zero.integral().degree(), 0);
    EXPECT_DOUBLE_EQ(zero.integral().evaluate(4.0), 0.0);
}
