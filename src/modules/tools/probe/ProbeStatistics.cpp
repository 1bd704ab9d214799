/*
      This file is part of Smoothie (http://smoothieware.org/). The motion control part is heavily based on Grbl (https://github.com/simen/grbl).
      Smoothie is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
      Smoothie is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.
      You should have received a copy of the GNU General Public License along with Smoothie. If not, see <http://www.gnu.org/licenses/>.
*/


#include "ProbeStatistics.h"

#include <algorithm>
#include <cmath>

Position calc_probe_mean(const std::vector<Position>& samples)
{
    if(samples.empty()) return Position();

    float sum[3] = { 0, 0, 0 };
    for (const auto& p : samples) {
        for (int i = 0; i < 3; ++i) {
            sum[i] += p[i];
        }
    }
    float count = samples.size();
    return Position(sum[X_AXIS] / count, sum[Y_AXIS] / count, sum[Z_AXIS] / count);
}

Position calc_probe_median(const std::vector<Position>& samples, int axis)
{
    if(samples.empty()) return Position();

    std::vector<Position> sorted(samples);
    std::stable_sort(sorted.begin(), sorted.end(), [axis](const Position& a, const Position& b) { return a[axis] < b[axis]; });

    size_t middle = sorted.size() / 2;
    if((sorted.size() & 1) == 1) {
        // odd number of samples
        return sorted[middle];
    }

    // even number of samples
    std::vector<Position> pair(sorted.begin() + middle - 1, sorted.begin() + middle + 1);
    return calc_probe_mean(pair);
}

Position calc_probe_result(const std::vector<Position>& samples, SamplesResult method, int axis)
{
    if(method == SAMPLES_MEDIAN) {
        return calc_probe_median(samples, axis);
    }
    return calc_probe_mean(samples);
}

float calc_probe_spread(const std::vector<Position>& samples, int axis)
{
    if(samples.empty()) return 0;

    float mx = samples[0][axis];
    float mn = samples[0][axis];
    for (const auto& p : samples) {
        mx = std::max(mx, p[axis]);
        mn = std::min(mn, p[axis]);
    }
    return mx - mn;
}

ProbeAccuracy calc_probe_accuracy(const std::vector<Position>& samples, int axis)
{
    ProbeAccuracy a = { 0, 0, 0, 0, 0, 0 };
    if(samples.empty()) return a;

    a.maximum = samples[0][axis];
    a.minimum = samples[0][axis];
    for (const auto& p : samples) {
        a.maximum = std::max(a.maximum, p[axis]);
        a.minimum = std::min(a.minimum, p[axis]);
    }
    a.range = a.maximum - a.minimum;
    a.average = calc_probe_mean(samples)[axis];
    a.median = calc_probe_median(samples, axis)[axis];

    float deviation_sum = 0;
    for (const auto& p : samples) {
        float d = p[axis] - a.average;
        deviation_sum += d * d;
    }
    a.sigma = sqrtf(deviation_sum / samples.size());
    return a;
}
