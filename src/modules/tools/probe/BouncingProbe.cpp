/*
      This file is part of Smoothie (http://smoothieware.org/). The motion control part is heavily based on Grbl (https://github.com/simen/grbl).
      Smoothie is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
      Smoothie is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.
      You should have received a copy of the GNU General Public License along with Smoothie. If not, see <http://www.gnu.org/licenses/>.
*/


#include "BouncingProbe.h"
#include "libs/Kernel.h"
#include "libs/StreamOutputPool.h"
#include "modules/robot/MotionExecutor.h"
#include "modules/robot/Kinematics.h"
#include "modules/robot/ContactDetector.h"

#include <algorithm>
#include <cstdio>
#include <string>

#define HINT_TIMEOUT "If the probe did not move far enough to trigger, consider lowering the Z axis minimum so the probe can travel further (it can be negative) or raising MAX_DISTANCE."

BouncingProbe::BouncingProbe(Kernel *kernel, MotionExecutor& motion, Kinematics& kinematics, ContactDetector *detectors[3])
    : kernel(kernel), motion(motion), kinematics(kinematics)
{
    for (int i = 0; i < 3; ++i) {
        this->detectors[i] = detectors[i];
    }
}

ProbeError BouncingProbe::probe(const ProbeDirection& direction, float speed, float max_distance, Position& result)
{
    Position probe_start = motion.get_position();
    Position contact;

    float bouncing_speed = speed;
    for (int bounce = 0; bounce < PROBE_BOUNCE_COUNT; ++bounce) {
        ProbeError e = probe_once(direction, bouncing_speed, max_distance, contact);
        if(!e.is_ok()) return e;

        float lift_speed = bouncing_speed * PROBE_BOUNCE_LIFT_FACTOR;
        bouncing_speed *= PROBE_BOUNCE_SPEED_DECAY;
        float retract_dist = bouncing_speed * PROBE_BOUNCE_RETRACT_FACTOR;

        Position lift = probe_start.with_axis(direction.axis, contact[direction.axis] - direction.sign * retract_dist);
        motion.move_to(lift, lift_speed);
    }

    result = contact;

    // anything compensating probe results gets its own copy
    Position event_position(result);
    kernel->call_event(ON_PROBE_RESULT, &event_position);
    kernel->streams->printf("Probe made contact in %s direction at %1.4f,%1.4f,%1.4f\n", direction.name, result.x(), result.y(), result.z());
    return ProbeError::ok();
}

ProbeError BouncingProbe::probe_once(const ProbeDirection& direction, float speed, float max_distance, Position& contact)
{
    ProbeError e = check_homed();
    if(!e.is_ok()) return e;

    Position target = get_target_position(direction, max_distance);
    Position stop;
    if(!detectors[direction.axis]->probing_move(target, speed, stop)) {
        char buf[128];
        snprintf(buf, sizeof(buf), "No probe contact within %1.3f mm moving %s", max_distance, direction.name);
        ProbeError timeout(ProbeError::NO_CONTACT_TIMEOUT, buf);
        if(direction.axis == Z_AXIS) timeout.hint(HINT_TIMEOUT);
        return timeout;
    }

    contact = stop;
    return ProbeError::ok();
}

Position BouncingProbe::get_target_position(const ProbeDirection& direction, float max_distance) const
{
    Position pos = motion.get_position();
    int axis = direction.axis;
    if(direction.sign > 0) {
        return pos.with_axis(axis, std::min(pos[axis] + max_distance, kinematics.axis_maximum(axis)));
    }
    return pos.with_axis(axis, std::max(pos[axis] - max_distance, kinematics.axis_minimum(axis)));
}

ProbeError BouncingProbe::check_homed() const
{
    std::string homed = kinematics.homed_axes();
    if(homed.find('x') == std::string::npos || homed.find('y') == std::string::npos || homed.find('z') == std::string::npos) {
        return ProbeError(ProbeError::UNHOMED_AXIS, "Must home before probe");
    }
    return ProbeError::ok();
}
