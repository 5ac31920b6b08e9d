// Created 07-Oct-2026 by David Kirkby (University of California, Irvine) <dkirkby@uci.edu>

#include "wcosmo/RedshiftInverter.h"
#include "wcosmo/RuntimeError.h"
#include "wcosmo/grid.h"

#include "boost/bind.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <vector>

namespace {

double linear(double z) { return 2 * z + 1; }

double decreasing(double z) { return 1 / (1 + z); }

double oscillating(double z) { return std::sin(z); }

double scaled(double z, double scale) { return scale * z * z; }

} // namespace

TEST(grid, LogspaceEndpoints)
{
  std::vector<double> z = wcosmo::logspace(1e-4, 100, 1000);
  ASSERT_EQ(z.size(), 1000u);
  EXPECT_NEAR(z.front(), 1e-4, 1e-18);
  EXPECT_EQ(z.back(), std::pow(10., std::log10(100.)));
  for (std::size_t i = 1; i < z.size(); ++i) EXPECT_GT(z[i], z[i - 1]);
  EXPECT_NEAR(z[1] / z[0], z[999] / z[998], 1e-10);
}

TEST(grid, LogspaceThrowsOnBadArguments)
{
  EXPECT_THROW(wcosmo::logspace(0, 1, 10), wcosmo::RuntimeError);
  EXPECT_THROW(wcosmo::logspace(2, 1, 10), wcosmo::RuntimeError);
  EXPECT_THROW(wcosmo::logspace(1, 2, 1), wcosmo::RuntimeError);
}

TEST(RedshiftInverter, RecoversLinearFunction)
{
  wcosmo::RedshiftInverter inverter(linear, 1e-3, 10, 200);
  EXPECT_NEAR(inverter.getMinValue(), 1.002, 1e-12);
  EXPECT_NEAR(inverter.getMaxValue(), 21, 1e-12);
  double zs[] = {0.0123, 0.5, 3.3, 9.99};
  for (int i = 0; i < 4; ++i) {
    EXPECT_NEAR(inverter(linear(zs[i])), zs[i], 1e-12);
  }
}

TEST(RedshiftInverter, ClampsOutsideRange)
{
  wcosmo::RedshiftInverter inverter(linear, 1e-3, 10);
  EXPECT_EQ(inverter(0.), 1e-3);
  EXPECT_EQ(inverter(1e6), 10);
  EXPECT_EQ(inverter.getZmin(), 1e-3);
  EXPECT_EQ(inverter.getZmax(), 10);
}

TEST(RedshiftInverter, DecreasingFunction)
{
  wcosmo::RedshiftInverter inverter(decreasing, 1e-2, 50, 2000);
  EXPECT_NEAR(inverter(decreasing(1.)), 1, 1e-4);
  // Large values occur at low redshift.
  EXPECT_EQ(inverter(2.), 1e-2);
  EXPECT_EQ(inverter(0.), 50);
}

TEST(RedshiftInverter, NanPropagates)
{
  wcosmo::RedshiftInverter inverter(linear);
  EXPECT_TRUE(std::isnan(inverter(std::nan(""))));
}

TEST(RedshiftInverter, ThrowsOnBadGrid)
{
  EXPECT_THROW(wcosmo::RedshiftInverter(linear, 0, 1), wcosmo::RuntimeError);
  EXPECT_THROW(wcosmo::RedshiftInverter(linear, 1, 1), wcosmo::RuntimeError);
  EXPECT_THROW(wcosmo::RedshiftInverter(linear, 1e-3, 1, 1), wcosmo::RuntimeError);
}

TEST(RedshiftInverter, ThrowsOnNonMonotonicFunction)
{
  EXPECT_THROW(wcosmo::RedshiftInverter(oscillating, 1e-2, 10), wcosmo::RuntimeError);
}

TEST(RedshiftInverter, VectorMatchesScalar)
{
  wcosmo::RedshiftFunction fn(boost::bind(scaled, _1, 3.));
  std::vector<double> fvals;
  fvals.push_back(-1);
  fvals.push_back(0.75);
  fvals.push_back(300);
  fvals.push_back(1e9);
  std::vector<double> z = wcosmo::zAtValue(fn, fvals);
  ASSERT_EQ(z.size(), fvals.size());
  for (std::size_t i = 0; i < z.size(); ++i) {
    EXPECT_EQ(z[i], wcosmo::zAtValue(fn, fvals[i]));
  }
  EXPECT_EQ(z[0], 1e-4);
  EXPECT_NEAR(z[1], 0.5, 1e-4);
  EXPECT_NEAR(z[2], 10, 1e-2);
  EXPECT_EQ(z[3], 100);
}
