/*
      This file is part of Smoothie (http://smoothieware.org/). The motion control part is heavily based on Grbl (https://github.com/simen/grbl).
      Smoothie is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
      Smoothie is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.
      You should have received a copy of the GNU General Public License along with Smoothie. If not, see <http://www.gnu.org/licenses/>.
*/


#ifndef PROBESTATISTICS_H
#define PROBESTATISTICS_H

#include "modules/robot/Position.h"

#include <vector>

// how the samples of one point are reduced to a single result
enum SamplesResult {
    SAMPLES_AVERAGE,
    SAMPLES_MEDIAN
};

struct ProbeAccuracy {
    float maximum;
    float minimum;
    float range;
    float average;
    float median;
    float sigma;
};

// All of these take the samples by const reference and never change them.
// An empty sample list gives an all zero result.

// mean of each coordinate
Position calc_probe_mean(const std::vector<Position>& samples);

// sample in the middle when sorted on axis, or the mean of the middle two for an even count
// equal axis values keep the order they were probed in
Position calc_probe_median(const std::vector<Position>& samples, int axis);

Position calc_probe_result(const std::vector<Position>& samples, SamplesResult method, int axis);

// largest minus smallest value on axis
float calc_probe_spread(const std::vector<Position>& samples, int axis);

// max, min, range, mean, median and population standard deviation of axis
ProbeAccuracy calc_probe_accuracy(const std::vector<Position>& samples, int axis);

#endif
