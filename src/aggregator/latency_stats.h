#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <numeric>
#include <vector>

namespace Shardrun {

class LatencyStats {
public:
	enum PercentileMethod {
		kNearestRank = 0,
		kLinearInterpolation = 1
	};
	static constexpr PercentileMethod kPercentileMethod = kLinearInterpolation;

	struct Summary {
		double min_s = 0.0;
		double p25_s = 0.0;
		double p50_s = 0.0;
		double p75_s = 0.0;
		double max_s = 0.0;
		double average_s = 0.0;
		size_t count = 0;
	};

	// Percentile of sorted input, p in [0, 1].
	static double Percentile(const std::vector<double>& sorted, double p,
	                         PercentileMethod method = kPercentileMethod) {
		if (sorted.empty()) return 0.0;
		const size_t n = sorted.size();
		if (method == kNearestRank) {
			const double rank = std::ceil(p * static_cast<double>(n));
			size_t idx = (rank <= 1.0) ? 0 : static_cast<size_t>(rank - 1.0);
			if (idx >= n) idx = n - 1;
			return sorted[idx];
		}
		// Linear interpolation between closest ranks
		const double pos = p * static_cast<double>(n - 1);
		const size_t lo = static_cast<size_t>(std::floor(pos));
		const size_t hi = std::min(lo + 1, n - 1);
		const double frac = pos - static_cast<double>(lo);
		return sorted[lo] + (sorted[hi] - sorted[lo]) * frac;
	}

	// Takes the sample in any order.
	static Summary ComputeSummary(std::vector<double> durations_s) {
		Summary s{};
		if (durations_s.empty()) {
			return s;
		}
		std::sort(durations_s.begin(), durations_s.end());

		s.count = durations_s.size();
		s.min_s = durations_s.front();
		s.max_s = durations_s.back();
		const double sum = std::accumulate(durations_s.begin(), durations_s.end(), 0.0);
		s.average_s = sum / static_cast<double>(s.count);

		s.p25_s = Percentile(durations_s, 0.25);
		s.p50_s = Percentile(durations_s, 0.50);
		s.p75_s = Percentile(durations_s, 0.75);
		return s;
	}
};

} // namespace Shardrun
