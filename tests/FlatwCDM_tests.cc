// Created 09-Oct-2026 by David Kirkby (University of California, Irvine) <dkirkby@uci.edu>

#include "wcosmo/FlatwCDM.h"
#include "wcosmo/distances.h"

#include <gtest/gtest.h>

TEST(FlatwCDM, Accessors)
{
  wcosmo::FlatwCDM cosmology(70, 0.3, -0.9);
  EXPECT_EQ(cosmology.getH0(), 70);
  EXPECT_EQ(cosmology.getOmegaMatter(), 0.3);
  EXPECT_EQ(cosmology.getW0(), -0.9);
  EXPECT_EQ(cosmology.getZmin(), 1e-4);
  EXPECT_EQ(cosmology.getZmax(), 100);
  EXPECT_EQ(cosmology.getName(), "");
  EXPECT_TRUE(cosmology.getMeta().empty());
}

TEST(FlatwCDM, MatchesFreeFunctions)
{
  wcosmo::FlatwCDM cosmology(68, 0.31, -1.2);
  double z(1.7);
  EXPECT_EQ(cosmology.getHubbleDistance(), wcosmo::hubbleDistance(68));
  EXPECT_EQ(cosmology.getHubbleTime(), wcosmo::hubbleTime(68));
  EXPECT_EQ(cosmology.getHubbleFunction(z), wcosmo::efunc(z, 0.31, -1.2));
  EXPECT_EQ(cosmology.getInverseHubbleFunction(z), wcosmo::invEfunc(z, 0.31, -1.2));
  EXPECT_EQ(cosmology.getHubbleParameter(z), wcosmo::hubbleParameter(z, 68, 0.31, -1.2));
  EXPECT_EQ(cosmology.getComovingDistance(z), wcosmo::comovingDistance(z, 68, 0.31, -1.2));
  EXPECT_EQ(cosmology.getLuminosityDistance(z), wcosmo::luminosityDistance(z, 68, 0.31, -1.2));
  EXPECT_EQ(cosmology.getLuminosityDistanceDerivative(z), wcosmo::dDLdz(z, 68, 0.31, -1.2));
  EXPECT_EQ(cosmology.getDifferentialComovingVolume(z),
            wcosmo::differentialComovingVolume(z, 68, 0.31, -1.2));
  EXPECT_EQ(cosmology.getComovingVolume(z), wcosmo::comovingVolume(z, 68, 0.31, -1.2));
  EXPECT_EQ(cosmology.getLookbackTime(z), wcosmo::lookbackTime(z, 68, 0.31, -1.2));
  EXPECT_EQ(cosmology.getAbsorptionDistance(z), wcosmo::absorptionDistance(z, 0.31, -1.2));
}

TEST(FlatwCDM, LambdaCDMIsWCDMWithMinusOne)
{
  wcosmo::FlatwCDM lcdm = wcosmo::createFlatLambdaCDM(70, 0.3);
  wcosmo::FlatwCDM wcdm(70, 0.3, -1);
  EXPECT_EQ(lcdm.getW0(), -1);
  EXPECT_EQ(lcdm.getHubbleFunction(2), wcdm.getHubbleFunction(2));
  EXPECT_EQ(lcdm.getComovingDistance(2), wcdm.getComovingDistance(2));
}

TEST(FlatwCDM, AgeIsLookbackDifference)
{
  wcosmo::FlatwCDM cosmology = wcosmo::createFlatLambdaCDM(70, 0.3);
  EXPECT_DOUBLE_EQ(cosmology.getAge(0), cosmology.getLookbackTime(1e5));
  EXPECT_NEAR(cosmology.getAge(0), 13.467, 1e-3);
  EXPECT_DOUBLE_EQ(cosmology.getAge(2) + cosmology.getLookbackTime(2), cosmology.getAge(0));
  EXPECT_EQ(cosmology.getAge(3, 3), 0);
}

TEST(FlatwCDM, LuminosityDistanceHubbleDerivative)
{
  // dL is proportional to dH at fixed redshift so the derivative is dL/dH.
  wcosmo::FlatwCDM cosmology(70, 0.3, -0.8);
  double z(0.6);
  EXPECT_DOUBLE_EQ(cosmology.getLuminosityDistanceHubbleDerivative(z),
                   cosmology.getLuminosityDistance(z) / cosmology.getHubbleDistance());
  wcosmo::FlatwCDM shifted(70 * 1.001, 0.3, -0.8);
  double dLdH = (cosmology.getLuminosityDistance(z) - shifted.getLuminosityDistance(z)) /
                (cosmology.getHubbleDistance() - shifted.getHubbleDistance());
  EXPECT_NEAR(cosmology.getLuminosityDistanceHubbleDerivative(z), dLdH, 1e-10);
}

TEST(FlatwCDM, RedshiftAtLuminosityDistance)
{
  wcosmo::FlatwCDM cosmology(70, 0.3, -1, 1e-3, 5);
  EXPECT_NEAR(cosmology.getRedshiftAtLuminosityDistance(cosmology.getLuminosityDistance(0.7)),
              0.7, 1e-4);
  EXPECT_EQ(cosmology.getRedshiftAtLuminosityDistance(1e7), 5);
  EXPECT_EQ(cosmology.getRedshiftAtLuminosityDistance(0), 1e-3);
}

TEST(FlatwCDM, FrameConversionsUseItsRange)
{
  wcosmo::FlatwCDM cosmology(70, 0.3, -1, 1e-3, 2);
  wcosmo::DetectorFrame detector = cosmology.sourceToDetectorFrame(30, 20, 3);
  EXPECT_DOUBLE_EQ(detector.mass1, 120);
  wcosmo::SourceFrame source = cosmology.detectorToSourceFrame(
      detector.mass1, detector.mass2, detector.luminosityDistance);
  EXPECT_EQ(source.redshift, 2);
  EXPECT_DOUBLE_EQ(source.mass2, 80. / 3);
}
