/*
      This file is part of Smoothie (http://smoothieware.org/). The motion control part is heavily based on Grbl (https://github.com/simen/grbl).
      Smoothie is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
      Smoothie is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.
      You should have received a copy of the GNU General Public License along with Smoothie. If not, see <http://www.gnu.org/licenses/>.
*/


#ifndef PROBEPOINTSHELPER_H
#define PROBEPOINTSHELPER_H

#include "ProbeError.h"
#include "ProbeParameters.h"
#include "MultiAxisProbe.h"
#include "modules/robot/Position.h"

#include <functional>
#include <string>
#include <vector>

class Command;
class MotionExecutor;

struct ProbePoint {
    float x;
    float y;
};

enum ProbePointsResult {
    POINTS_DONE,
    POINTS_RETRY
};

// called with the probe offsets and one result per point once all points are probed
// POINTS_RETRY probes all of them again
typedef std::function<ProbePointsResult(const ProbeOffsets&, const std::vector<Position>&)> ProbePointsCallback;

// parse "x,y;x,y;..." into points
ProbeError parse_probe_points(const std::string& text, std::vector<ProbePoint>& points);

// Probes down in Z at a list of XY points inside one probe session.
// Between points the tool is raised to horizontal_move_z, the first raise is done at travel speed
// and the others at the probe lift speed.
class ProbePointsHelper {
    public:
        ProbePointsHelper(const std::string& name, MultiAxisProbe& probe, MotionExecutor& motion, ProbePointsCallback finalize_callback);

        ProbeError update_probe_points(const std::vector<ProbePoint>& points, size_t min_points);
        ProbeError minimum_points(size_t n) const;

        void use_xy_offsets(bool use_offsets) { this->use_offsets = use_offsets; }
        void set_default_horizontal_move_z(float z) { default_horizontal_move_z = z; }
        void set_speed(float speed) { this->speed = speed; }
        float get_lift_speed() const { return lift_speed; }

        // HORIZONTAL_MOVE_Z and the probe parameter overrides come from the command
        ProbeError start_probe(const Command& command);
        ProbeError start_probe(float horizontal_move_z, const ProbeParameterOverrides& overrides);

    private:
        void raise_tool(bool is_first);
        void move_next(size_t probe_num);
        bool invoke_callback(const std::vector<Position>& results);

        std::string name;
        MultiAxisProbe& probe;
        MotionExecutor& motion;
        ProbePointsCallback finalize_callback;

        std::vector<ProbePoint> probe_points;
        float default_horizontal_move_z;
        float horizontal_move_z;
        float speed;
        float lift_speed;
        ProbeOffsets probe_offsets;
        bool use_offsets;
};

#endif
