/*
      This file is part of Smoothie (http://smoothieware.org/). The motion control part is heavily based on Grbl (https://github.com/simen/grbl).
      Smoothie is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
      Smoothie is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.
      You should have received a copy of the GNU General Public License along with Smoothie. If not, see <http://www.gnu.org/licenses/>.
*/


#include "ProbePointsHelper.h"
#include "ProbeSession.h"
#include "modules/communication/utils/Command.h"
#include "modules/robot/MotionExecutor.h"
#include "libs/utils.h"

#include <cmath>

ProbeError parse_probe_points(const std::string& text, std::vector<ProbePoint>& points)
{
    std::vector<ProbePoint> parsed;
    for (auto& p : split(text.c_str(), ';')) {
        std::string s(p);
        ltrim(s);
        rtrim(s);
        if(s.empty()) continue;

        std::vector<std::string> xy = split(s.c_str(), ',');
        ProbePoint pt;
        if(xy.size() != 2 || !parse_float(xy[0], pt.x) || !parse_float(xy[1], pt.y)) {
            return ProbeError(ProbeError::INVALID_CONFIGURATION, "Unable to parse probe point '" + s + "', expected x,y");
        }
        parsed.push_back(pt);
    }
    points.swap(parsed);
    return ProbeError::ok();
}

ProbePointsHelper::ProbePointsHelper(const std::string& name, MultiAxisProbe& probe, MotionExecutor& motion, ProbePointsCallback finalize_callback)
    : name(name), probe(probe), motion(motion), finalize_callback(finalize_callback)
{
    default_horizontal_move_z = 5;
    horizontal_move_z = 5;
    speed = 50;
    lift_speed = speed;
    probe_offsets.x = probe_offsets.y = probe_offsets.z = 0;
    use_offsets = false;
}

ProbeError ProbePointsHelper::minimum_points(size_t n) const
{
    if(probe_points.size() < n) {
        return ProbeError(ProbeError::INVALID_CONFIGURATION, "Need at least " + std::to_string(n) + " probe points for " + name);
    }
    return ProbeError::ok();
}

ProbeError ProbePointsHelper::update_probe_points(const std::vector<ProbePoint>& points, size_t min_points)
{
    probe_points = points;
    return minimum_points(min_points);
}

void ProbePointsHelper::raise_tool(bool is_first)
{
    // use full speed to the first probe position
    float s = is_first ? speed : lift_speed;
    motion.move_to(motion.get_position().with_axis(Z_AXIS, horizontal_move_z), s);
}

// move to the next XY probe point
void ProbePointsHelper::move_next(size_t probe_num)
{
    float x = probe_points[probe_num].x;
    float y = probe_points[probe_num].y;
    if(use_offsets) {
        x -= probe_offsets.x;
        y -= probe_offsets.y;
    }
    Position current = motion.get_position();
    motion.move_to(Position(x, y, current.z()), speed);
}

bool ProbePointsHelper::invoke_callback(const std::vector<Position>& results)
{
    // make sure everything queued is done
    motion.get_last_move_time();
    return finalize_callback(probe_offsets, results) != POINTS_RETRY;
}

ProbeError ProbePointsHelper::start_probe(const Command& command)
{
    float z = default_horizontal_move_z;
    if(command.has_param("HORIZONTAL_MOVE_Z") && !command.get_number("HORIZONTAL_MOVE_Z", z)) {
        return ProbeError(ProbeError::INVALID_CONFIGURATION, "Unable to parse '" + command.get_string("HORIZONTAL_MOVE_Z") + "' as a float for HORIZONTAL_MOVE_Z");
    }

    ProbeParameterOverrides overrides;
    ProbeError e = parse_probe_overrides(command, overrides);
    if(!e.is_ok()) return e;

    return start_probe(z, overrides);
}

// on failure the session is left open, the command error that follows ends it
ProbeError ProbePointsHelper::start_probe(float move_z, const ProbeParameterOverrides& overrides)
{
    ProbeError e = minimum_points(1);
    if(!e.is_ok()) return e;

    if(!std::isfinite(move_z)) {
        return ProbeError(ProbeError::INVALID_CONFIGURATION, "horizontal_move_z must be a number");
    }
    this->horizontal_move_z = move_z;

    ProbeParameters params;
    e = probe.get_probe_params(overrides, params);
    if(!e.is_ok()) return e;
    this->lift_speed = params.lift_speed;

    this->probe_offsets = probe.get_offsets();
    if(horizontal_move_z < probe_offsets.z) {
        return ProbeError(ProbeError::INVALID_CONFIGURATION, "horizontal_move_z can't be less than probe's z_offset");
    }

    ProbeSession *session;
    e = probe.start_probe_session("z-", session);
    if(!e.is_ok()) return e;

    size_t probe_num = 0;
    while(true) {
        raise_tool(probe_num == 0);
        if(probe_num >= probe_points.size()) {
            std::vector<Position> results = session->pull_probed_results();
            if(invoke_callback(results)) break;

            // caller wants a retry, restart probing
            probe_num = 0;
        }
        move_next(probe_num);
        e = session->run_probe("z-", params);
        if(!e.is_ok()) return e;
        probe_num++;
    }

    return session->end("z-");
}
