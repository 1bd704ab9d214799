/*
      This file is part of Smoothie (http://smoothieware.org/). The motion control part is heavily based on Grbl (https://github.com/simen/grbl).
      Smoothie is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
      Smoothie is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.
      You should have received a copy of the GNU General Public License along with Smoothie. If not, see <http://www.gnu.org/licenses/>.
*/


#ifndef PROBESESSION_H
#define PROBESESSION_H

#include "ProbeError.h"
#include "ProbeParameters.h"
#include "modules/robot/Position.h"

#include <string>
#include <vector>

class Kernel;
class MotionExecutor;
class ContactDetector;
class BouncingProbe;

// A run of probe measurements that share the probe of one axis.
//
//   begin(direction)        takes the probe of the direction's axis
//   run_probe(direction)    measures one point, appends the result
//   pull_probed_results()   hands over the results so far and forgets them
//   end(direction)          gives the probe back
//
// Only one session can be open at a time, run_probe and end need an open session.
class ProbeSession {
    public:
        ProbeSession(Kernel *kernel, MotionExecutor& motion, ContactDetector *detectors[3], BouncingProbe& bouncing_probe);

        ProbeError begin(const std::string& direction);
        ProbeError run_probe(const std::string& direction, const ProbeParameters& params);
        std::vector<Position> pull_probed_results();
        ProbeError end(const std::string& direction);

        // end an open session after a failed command, problems are only logged
        void force_end();

        bool is_pending() const { return pending; }
        int get_held_axis() const { return held_axis; }
        // raw samples of the point being measured
        const std::vector<Position>& get_sample_positions() const { return positions; }

    private:
        ProbeError state_error() const;

        Kernel *kernel;
        MotionExecutor& motion;
        ContactDetector *detectors[3];
        BouncingProbe& bouncing_probe;

        std::vector<Position> results;
        std::vector<Position> positions;
        int held_axis;
        bool pending;
};

#endif
