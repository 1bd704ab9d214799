/*
      This file is part of Smoothie (http://smoothieware.org/). The motion control part is heavily based on Grbl (https://github.com/simen/grbl).
      Smoothie is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
      Smoothie is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.
      You should have received a copy of the GNU General Public License along with Smoothie. If not, see <http://www.gnu.org/licenses/>.
*/


#ifndef BOUNCINGPROBE_H
#define BOUNCINGPROBE_H

#include "ProbeError.h"
#include "ProbeDirection.h"
#include "modules/robot/Position.h"

class Kernel;
class MotionExecutor;
class Kinematics;
class ContactDetector;

#define PROBE_BOUNCE_COUNT           3
#define PROBE_BOUNCE_SPEED_DECAY     0.1F
#define PROBE_BOUNCE_RETRACT_FACTOR  3.0F
#define PROBE_BOUNCE_LIFT_FACTOR     2.0F

// One measurement made of several approaches to the surface, each slower and from closer than the last.
//
// Approach k is done at speed * 0.1^(k-1). After each contact the probe backs off 3 mm per mm/sec of the
// next approach speed at twice the speed of the approach it just did. The last contact is the result.
class BouncingProbe {
    public:
        BouncingProbe(Kernel *kernel, MotionExecutor& motion, Kinematics& kinematics, ContactDetector *detectors[3]);

        ProbeError probe(const ProbeDirection& direction, float speed, float max_distance, Position& result);

        // a single probing move from the current position, at most max_distance long
        ProbeError probe_once(const ProbeDirection& direction, float speed, float max_distance, Position& contact);

        // max_distance from the current position, kept inside the machine limits
        Position get_target_position(const ProbeDirection& direction, float max_distance) const;

        ProbeError check_homed() const;

    private:
        Kernel *kernel;
        MotionExecutor& motion;
        Kinematics& kinematics;
        ContactDetector *detectors[3];
};

#endif
