// Created 05-Oct-2026 by David Kirkby (University of California, Irvine) <dkirkby@uci.edu>

#include "wcosmo/types.h"

#include "wcosmo/RuntimeError.h"

#include "wcosmo/EpsilonAccelerator.h"
#include "wcosmo/AnalyticIntegral.h"

#include "wcosmo/distances.h"
#include "wcosmo/grid.h"
#include "wcosmo/RedshiftInverter.h"
#include "wcosmo/frames.h"

#include "wcosmo/FlatwCDM.h"
#include "wcosmo/presets.h"
