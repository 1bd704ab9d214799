/*
      This file is part of Smoothie (http://smoothieware.org/). The motion control part is heavily based on Grbl (https://github.com/simen/grbl).
      Smoothie is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
      Smoothie is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.
      You should have received a copy of the GNU General Public License along with Smoothie. If not, see <http://www.gnu.org/licenses/>.
*/


#ifndef PROBEPOINTS_H
#define PROBEPOINTS_H

#include "libs/Module.h"
#include "ProbePointsHelper.h"

#include <vector>

#define probe_points_checksum CHECKSUM("probe_points")

class StreamOutput;

// PROBE_POINTS, probes the configured XY points and prints the result of each
class ProbePoints : public Module {
    public:
        ProbePoints(MultiAxisProbe& probe, MotionExecutor& motion);
        ~ProbePoints();

        void on_module_loaded();
        void on_command_received(void *argument);

        bool is_enabled() const { return helper != nullptr; }
        const std::vector<Position>& get_last_results() const { return last_results; }

    private:
        ProbeError config_load();
        ProbePointsResult finalize(const ProbeOffsets& offsets, const std::vector<Position>& results);

        MultiAxisProbe& probe;
        MotionExecutor& motion;
        ProbePointsHelper *helper;
        StreamOutput *reply_stream;
        std::vector<Position> last_results;
};

#endif
