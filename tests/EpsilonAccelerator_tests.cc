// Created 06-Oct-2026 by David Kirkby (University of California, Irvine) <dkirkby@uci.edu>

#include "wcosmo/EpsilonAccelerator.h"
#include "wcosmo/RuntimeError.h"

#include <gtest/gtest.h>

#include <cmath>

TEST(EpsilonAccelerator, GeometricSeriesIsExactAfterThreeTerms)
{
  // The [1/1] Pade approximant of 1/(1-x) is exact.
  wcosmo::EpsilonAccelerator accelerator(10);
  double sum(0), term(1);
  for (int n = 0; n < 3; ++n) {
    sum += term;
    accelerator(sum);
    term *= 0.5;
  }
  EXPECT_EQ(accelerator.getNumTerms(), 3);
  EXPECT_NEAR(accelerator.getEstimate(), 2, 1e-15);
}

TEST(EpsilonAccelerator, AlternatingHarmonicSeries)
{
  // Partial sums converge to ln(2) like 1/n, the accelerated sums much faster.
  wcosmo::EpsilonAccelerator accelerator(20);
  double sum(0), estimate(0);
  for (int n = 1; n <= 20; ++n) {
    sum += ((n % 2) ? 1. : -1.) / n;
    estimate = accelerator(sum);
  }
  EXPECT_GT(std::fabs(sum - std::log(2.)), 1e-2);
  EXPECT_NEAR(estimate, std::log(2.), 1e-12);
}

TEST(EpsilonAccelerator, ConstantSumsKeepLastEstimate)
{
  // Equal partial sums make every difference in the table vanish, so after the
  // second sum the diagonal carries no information and cannot signal convergence.
  wcosmo::EpsilonAccelerator accelerator(10);
  for (int n = 0; n < 4; ++n) accelerator(1.25);
  EXPECT_FALSE(accelerator.isConverged());
  EXPECT_EQ(accelerator.getEstimate(), 1.25);
  EXPECT_EQ(accelerator.getLastChange(), 0);
}

TEST(EpsilonAccelerator, SeriesWithSignChangingDenominators)
{
  // Partial sums of 2F1(1/2,1;-4.75;0.3), whose terms grow until n exceeds 4.75
  // and then pass through a near-cancellation in the table.
  double const expected = 0.917661292883989;
  wcosmo::EpsilonAccelerator accelerator(64);
  double term(1), sum(0), estimate(0);
  for (int n = 0; n < 64 && !accelerator.isConverged(); ++n) {
    sum += term;
    estimate = accelerator(sum);
    term *= (0.5 + n) * (1 + n) / ((-4.75 + n) * (n + 1)) * 0.3;
  }
  EXPECT_TRUE(accelerator.isConverged());
  EXPECT_NEAR(estimate, expected, 1e-13);
}

TEST(EpsilonAccelerator, RejectsInvalidUse)
{
  EXPECT_THROW(wcosmo::EpsilonAccelerator(0), wcosmo::RuntimeError);
  EXPECT_THROW(wcosmo::EpsilonAccelerator(10, 0), wcosmo::RuntimeError);
  wcosmo::EpsilonAccelerator accelerator(2);
  accelerator(1);
  accelerator(1.5);
  EXPECT_THROW(accelerator(1.75), wcosmo::RuntimeError);
}
