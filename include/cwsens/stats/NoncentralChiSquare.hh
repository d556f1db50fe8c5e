#pragma once

namespace cwsens::stats {

/// CDF of the noncentral chi^2 distribution with k degrees of freedom and
/// noncentrality lambda, as a Poisson(lambda/2) mixture of central chi^2 CDFs.
double NoncentralChiSquareCdf(double x, double k, double lambda);

/// Threshold x such that P(chi^2_k > x) = p.
double ChiSquareInverseFalseAlarm(double p, double k);

/// Probability P(chi^2_k > x) of the central distribution.
double ChiSquareFalseAlarm(double x, double k);

} // namespace cwsens::stats
