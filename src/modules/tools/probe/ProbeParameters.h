/*
      This file is part of Smoothie (http://smoothieware.org/). The motion control part is heavily based on Grbl (https://github.com/simen/grbl).
      Smoothie is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
      Smoothie is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.
      You should have received a copy of the GNU General Public License along with Smoothie. If not, see <http://www.gnu.org/licenses/>.
*/


#ifndef PROBEPARAMETERS_H
#define PROBEPARAMETERS_H

#include "ProbeError.h"
#include "ProbeStatistics.h"

#include <string>

class Command;

// Settings for one probing command, the configured defaults merged with what the command asked for
struct ProbeParameters {
    float probe_speed;            // mm/sec
    float lift_speed;             // mm/sec
    float max_distance;           // mm
    int samples;
    float sample_retract_dist;    // mm
    float samples_tolerance;      // mm
    int samples_tolerance_retries;
    SamplesResult samples_result;

    ProbeError validate() const;
};

// A value given on the command line, or nothing
template<typename T>
class ParameterOverride {
    public:
        ParameterOverride() : set(false), value() {}

        void assign(const T& v) { value = v; set = true; }
        void reset() { set = false; }
        bool is_set() const { return set; }
        const T& get() const { return value; }
        T or_default(const T& def) const { return set ? value : def; }

    private:
        bool set;
        T value;
};

struct ProbeParameterOverrides {
    ParameterOverride<float> probe_speed;
    ParameterOverride<float> lift_speed;
    ParameterOverride<float> max_distance;
    ParameterOverride<int> samples;
    ParameterOverride<float> sample_retract_dist;
    ParameterOverride<float> samples_tolerance;
    ParameterOverride<int> samples_tolerance_retries;
    ParameterOverride<SamplesResult> samples_result;
};

// read PROBE_SPEED, LIFT_SPEED, MAX_DISTANCE, SAMPLES, SAMPLE_RETRACT_DIST, SAMPLES_TOLERANCE,
// SAMPLES_TOLERANCE_RETRIES and SAMPLES_RESULT from a command, values that are not numbers are errors
ProbeError parse_probe_overrides(const Command& command, ProbeParameterOverrides& overrides);

ProbeParameters merge_probe_parameters(const ProbeParameters& defaults, const ProbeParameterOverrides& overrides);

// average (or mean) and median, case insensitive
ProbeError parse_samples_result(const std::string& name, SamplesResult& result);
const char *samples_result_name(SamplesResult result);

// false unless value is a whole number that fits in an int
bool to_whole_number(float value, int& out);

#endif
