/*
      This file is part of Smoothie (http://smoothieware.org/). The motion control part is heavily based on Grbl (https://github.com/simen/grbl).
      Smoothie is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
      Smoothie is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.
      You should have received a copy of the GNU General Public License along with Smoothie. If not, see <http://www.gnu.org/licenses/>.
*/


#include "ProbePoints.h"
#include "libs/Kernel.h"
#include "libs/Config.h"
#include "libs/ConfigValue.h"
#include "libs/checksumm.h"
#include "libs/StreamOutput.h"
#include "libs/StreamOutputPool.h"
#include "modules/communication/utils/Command.h"

#include <cmath>

#define enable_checksum            CHECKSUM("enable")
#define points_checksum            CHECKSUM("points")
#define min_points_checksum        CHECKSUM("min_points")
#define horizontal_move_z_checksum CHECKSUM("horizontal_move_z")
#define speed_checksum             CHECKSUM("speed")
#define use_offsets_checksum       CHECKSUM("use_offsets")

ProbePoints::ProbePoints(MultiAxisProbe& probe, MotionExecutor& motion)
    : probe(probe), motion(motion), helper(nullptr), reply_stream(&StreamOutput::NullStream)
{
}

ProbePoints::~ProbePoints()
{
    delete helper;
}

void ProbePoints::on_module_loaded()
{
    if(!kernel->config->value( probe_points_checksum, enable_checksum )->by_default(false)->as_bool()) {
        return;
    }

    ProbeError e = config_load();
    if(!e.is_ok()) {
        kernel->streams->printf("error:probe_points disabled: %s\n", e.get_message().c_str());
        delete helper;
        helper = nullptr;
        return;
    }

    register_for_event(ON_COMMAND_RECEIVED);
}

ProbeError ProbePoints::config_load()
{
    Config *config = kernel->config;

    helper = new ProbePointsHelper("probe_points", probe, motion,
        [this](const ProbeOffsets& offsets, const std::vector<Position>& results) { return this->finalize(offsets, results); });

    std::vector<ProbePoint> points;
    ProbeError e = parse_probe_points(config->value(probe_points_checksum, points_checksum)->by_default(std::string(""))->as_string(), points);
    if(!e.is_ok()) return e;

    float min_points = config->value(probe_points_checksum, min_points_checksum)->by_default(1)->as_number();
    if(!std::isfinite(min_points) || min_points < 1) {
        return ProbeError(ProbeError::INVALID_CONFIGURATION, "probe_points.min_points must be at least 1");
    }
    e = helper->update_probe_points(points, (size_t)min_points);
    if(!e.is_ok()) return e;

    float move_z = config->value(probe_points_checksum, horizontal_move_z_checksum)->by_default(5.0F)->as_number();
    float speed = config->value(probe_points_checksum, speed_checksum)->by_default(50.0F)->as_number(); // mm/sec
    if(!std::isfinite(move_z)) {
        return ProbeError(ProbeError::INVALID_CONFIGURATION, "probe_points.horizontal_move_z must be a number");
    }
    if(!std::isfinite(speed) || speed <= 0) {
        return ProbeError(ProbeError::INVALID_CONFIGURATION, "probe_points.speed must be a number above 0");
    }
    helper->set_default_horizontal_move_z(move_z);
    helper->set_speed(speed);
    helper->use_xy_offsets(config->value(probe_points_checksum, use_offsets_checksum)->by_default(false)->as_bool());
    return ProbeError::ok();
}

ProbePointsResult ProbePoints::finalize(const ProbeOffsets& offsets, const std::vector<Position>& results)
{
    last_results = results;
    for (size_t i = 0; i < results.size(); ++i) {
        reply_stream->printf("probe at %1.3f,%1.3f is z=%1.6f\n", results[i].x(), results[i].y(), results[i].z());
    }
    return POINTS_DONE;
}

void ProbePoints::on_command_received(void *argument)
{
    Command *command = static_cast<Command *>(argument);
    if(!command->is("PROBE_POINTS")) return;

    command->is_handled = true;
    reply_stream = command->stream;
    ProbeError e = helper->start_probe(*command);
    reply_stream = &StreamOutput::NullStream;

    if(!e.is_ok()) {
        command->stream->printf("error:%s\n", e.get_message().c_str());
        command->is_error = true;
    }
}
