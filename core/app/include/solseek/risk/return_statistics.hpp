#pragma once

#include <deque>
#include <vector>

namespace solseek {
namespace stats {

// Simple returns p[i]/p[i-1] - 1 of a price series (empty for < 2 prices).
std::vector<double> simpleReturns(const std::deque<double>& prices);

// Quantile with linear interpolation between closest ranks, q in [0, 1].
// Linear interpolation between the closest ranks. Returns 0 for an empty series.
double quantile(std::vector<double> values, double q);

double mean(const std::vector<double>& values);

// Population standard deviation (divides by n).
double stddev(const std::vector<double>& values);

}  // namespace stats
}  // namespace solseek
