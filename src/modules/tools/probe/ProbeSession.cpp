/*
      This file is part of Smoothie (http://smoothieware.org/). The motion control part is heavily based on Grbl (https://github.com/simen/grbl).
      Smoothie is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
      Smoothie is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.
      You should have received a copy of the GNU General Public License along with Smoothie. If not, see <http://www.gnu.org/licenses/>.
*/


#include "ProbeSession.h"
#include "ProbeDirection.h"
#include "ProbeStatistics.h"
#include "BouncingProbe.h"
#include "libs/Kernel.h"
#include "libs/StreamOutputPool.h"
#include "modules/robot/MotionExecutor.h"
#include "modules/robot/ContactDetector.h"

static const char axis_letters[] = "XYZ";

ProbeSession::ProbeSession(Kernel *kernel, MotionExecutor& motion, ContactDetector *detectors[3], BouncingProbe& bouncing_probe)
    : kernel(kernel), motion(motion), bouncing_probe(bouncing_probe), held_axis(-1), pending(false)
{
    for (int i = 0; i < 3; ++i) {
        this->detectors[i] = detectors[i];
    }
}

ProbeError ProbeSession::state_error() const
{
    return ProbeError(ProbeError::SESSION_STATE_ERROR, "Internal probe error - start/end probe session mismatch");
}

ProbeError ProbeSession::begin(const std::string& direction)
{
    if(pending) return state_error();

    ProbeDirection d;
    ProbeError e = resolve_direction(direction, d);
    if(!e.is_ok()) return e;

    detectors[d.axis]->multi_probe_begin();
    held_axis = d.axis;
    pending = true;
    results.clear();
    return ProbeError::ok();
}

ProbeError ProbeSession::end(const std::string& direction)
{
    if(!pending) return state_error();

    ProbeDirection d;
    ProbeError e = resolve_direction(direction, d);
    if(!e.is_ok()) return e;

    // the probe given back is always the one taken in begin
    results.clear();
    positions.clear();
    pending = false;
    int axis = held_axis;
    held_axis = -1;
    detectors[axis]->multi_probe_end();
    return ProbeError::ok();
}

void ProbeSession::force_end()
{
    if(!pending) return;

    ProbeError e = end(probe_directions[held_axis * 2].name);
    if(!e.is_ok()) {
        kernel->streams->printf("WARNING: Multi-probe end failed: %s\n", e.get_message().c_str());
    }
}

std::vector<Position> ProbeSession::pull_probed_results()
{
    std::vector<Position> r;
    r.swap(results);
    return r;
}

ProbeError ProbeSession::run_probe(const std::string& direction, const ProbeParameters& params)
{
    if(!pending) return state_error();

    ProbeDirection d;
    ProbeError e = resolve_direction(direction, d);
    if(!e.is_ok()) return e;

    if(d.axis != held_axis) {
        return ProbeError(ProbeError::SESSION_STATE_ERROR,
                          std::string("Probe session holds the ") + axis_letters[held_axis] + " probe, cannot probe " + d.name);
    }

    e = params.validate();
    if(!e.is_ok()) return e;

    kernel->streams->printf("Probing %c axis with %s sense\n", axis_letters[d.axis], d.sign > 0 ? "positive" : "negative");

    Position start_position = motion.get_position();
    int retries = 0;
    positions.clear();

    while((int)positions.size() < params.samples) {
        Position pos;
        e = bouncing_probe.probe(d, params.probe_speed, params.max_distance, pos);
        if(!e.is_ok()) {
            positions.clear();
            return e;
        }
        positions.push_back(pos);

        // check samples tolerance
        if(calc_probe_spread(positions, d.axis) > params.samples_tolerance) {
            if(retries >= params.samples_tolerance_retries) {
                positions.clear();
                return ProbeError(ProbeError::TOLERANCE_EXCEEDED, "Probe samples exceed samples_tolerance");
            }
            kernel->streams->printf("Probe samples exceed tolerance. Retrying...\n");
            retries++;
            positions.clear();
            continue;
        }

        // retract, except after the last sample
        if((int)positions.size() < params.samples) {
            Position lift = start_position.with_axis(d.axis, pos[d.axis] - d.sign * params.sample_retract_dist);
            motion.move_to(lift, params.lift_speed);
        }
    }

    results.push_back(calc_probe_result(positions, params.samples_result, d.axis));
    positions.clear();
    return ProbeError::ok();
}
