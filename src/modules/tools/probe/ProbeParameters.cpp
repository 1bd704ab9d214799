/*
      This file is part of Smoothie (http://smoothieware.org/). The motion control part is heavily based on Grbl (https://github.com/simen/grbl).
      Smoothie is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
      Smoothie is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.
      You should have received a copy of the GNU General Public License along with Smoothie. If not, see <http://www.gnu.org/licenses/>.
*/


#include "ProbeParameters.h"
#include "modules/communication/utils/Command.h"
#include "libs/utils.h"

#include <cmath>
#include <cstdio>

static ProbeError config_error(const std::string& message)
{
    return ProbeError(ProbeError::INVALID_CONFIGURATION, message);
}

static ProbeError check_above_zero(const char *name, float value)
{
    if(!std::isfinite(value) || value <= 0) {
        char buf[128];
        snprintf(buf, sizeof(buf), "%s must be a number above 0, got %g", name, value);
        return config_error(buf);
    }
    return ProbeError::ok();
}

ProbeError ProbeParameters::validate() const
{
    ProbeError e;
    if(!(e = check_above_zero("probe_speed", probe_speed)).is_ok()) return e;
    if(!(e = check_above_zero("lift_speed", lift_speed)).is_ok()) return e;
    if(!(e = check_above_zero("max_distance", max_distance)).is_ok()) return e;
    if(!(e = check_above_zero("sample_retract_dist", sample_retract_dist)).is_ok()) return e;

    if(samples < 1) {
        return config_error("samples must be at least 1, got " + std::to_string(samples));
    }
    if(!std::isfinite(samples_tolerance) || samples_tolerance < 0) {
        char buf[128];
        snprintf(buf, sizeof(buf), "samples_tolerance must be a number of at least 0, got %g", samples_tolerance);
        return config_error(buf);
    }
    if(samples_tolerance_retries < 0) {
        return config_error("samples_tolerance_retries must be at least 0, got " + std::to_string(samples_tolerance_retries));
    }
    return ProbeError::ok();
}

ProbeError parse_samples_result(const std::string& name, SamplesResult& result)
{
    std::string n = lc(name);
    if(n == "average" || n == "mean") {
        result = SAMPLES_AVERAGE;
    } else if(n == "median") {
        result = SAMPLES_MEDIAN;
    } else {
        return config_error("samples_result must be average, mean or median, got '" + name + "'");
    }
    return ProbeError::ok();
}

const char *samples_result_name(SamplesResult result)
{
    return result == SAMPLES_MEDIAN ? "median" : "average";
}

bool to_whole_number(float value, int& out)
{
    if(!std::isfinite(value) || value != floorf(value)) return false;
    // 2^31 is the first float past INT_MAX
    if(value < -2147483648.0F || value >= 2147483648.0F) return false;
    out = (int)value;
    return true;
}

static ProbeError get_float_param(const Command& command, const char *key, ParameterOverride<float>& out)
{
    if(!command.has_param(key)) return ProbeError::ok();
    float v;
    if(!command.get_number(key, v)) {
        return config_error(std::string("Unable to parse '") + command.get_string(key) + "' as a float for " + key);
    }
    out.assign(v);
    return ProbeError::ok();
}

static ProbeError get_int_param(const Command& command, const char *key, ParameterOverride<int>& out)
{
    if(!command.has_param(key)) return ProbeError::ok();
    float v;
    int i;
    if(!command.get_number(key, v) || !to_whole_number(v, i)) {
        return config_error(std::string("Unable to parse '") + command.get_string(key) + "' as an integer for " + key);
    }
    out.assign(i);
    return ProbeError::ok();
}

ProbeError parse_probe_overrides(const Command& command, ProbeParameterOverrides& overrides)
{
    ProbeError e;
    if(!(e = get_float_param(command, "PROBE_SPEED", overrides.probe_speed)).is_ok()) return e;
    if(!(e = get_float_param(command, "LIFT_SPEED", overrides.lift_speed)).is_ok()) return e;
    if(!(e = get_float_param(command, "MAX_DISTANCE", overrides.max_distance)).is_ok()) return e;
    if(!(e = get_int_param(command, "SAMPLES", overrides.samples)).is_ok()) return e;
    if(!(e = get_float_param(command, "SAMPLE_RETRACT_DIST", overrides.sample_retract_dist)).is_ok()) return e;
    if(!(e = get_float_param(command, "SAMPLES_TOLERANCE", overrides.samples_tolerance)).is_ok()) return e;
    if(!(e = get_int_param(command, "SAMPLES_TOLERANCE_RETRIES", overrides.samples_tolerance_retries)).is_ok()) return e;

    if(command.has_param("SAMPLES_RESULT")) {
        SamplesResult r;
        if(!(e = parse_samples_result(command.get_string("SAMPLES_RESULT"), r)).is_ok()) return e;
        overrides.samples_result.assign(r);
    }
    return ProbeError::ok();
}

ProbeParameters merge_probe_parameters(const ProbeParameters& defaults, const ProbeParameterOverrides& overrides)
{
    ProbeParameters p;
    p.probe_speed = overrides.probe_speed.or_default(defaults.probe_speed);
    p.lift_speed = overrides.lift_speed.or_default(defaults.lift_speed);
    p.max_distance = overrides.max_distance.or_default(defaults.max_distance);
    p.samples = overrides.samples.or_default(defaults.samples);
    p.sample_retract_dist = overrides.sample_retract_dist.or_default(defaults.sample_retract_dist);
    p.samples_tolerance = overrides.samples_tolerance.or_default(defaults.samples_tolerance);
    p.samples_tolerance_retries = overrides.samples_tolerance_retries.or_default(defaults.samples_tolerance_retries);
    p.samples_result = overrides.samples_result.or_default(defaults.samples_result);
    return p;
}
