/*
      This file is part of Smoothie (http://smoothieware.org/). The motion control part is heavily based on Grbl (https://github.com/simen/grbl).
      Smoothie is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
      Smoothie is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.
      You should have received a copy of the GNU General Public License along with Smoothie. If not, see <http://www.gnu.org/licenses/>.
*/


#include "SimulatedMachine.h"
#include "libs/Kernel.h"
#include "libs/Config.h"
#include "libs/ConfigValue.h"
#include "libs/checksumm.h"
#include "libs/StreamOutput.h"
#include "libs/StreamOutputPool.h"
#include "libs/utils.h"
#include "modules/communication/utils/Command.h"

#include <cmath>

#define x_min_checksum           CHECKSUM("x_min")
#define x_max_checksum           CHECKSUM("x_max")
#define y_min_checksum           CHECKSUM("y_min")
#define y_max_checksum           CHECKSUM("y_max")
#define z_min_checksum           CHECKSUM("z_min")
#define z_max_checksum           CHECKSUM("z_max")
#define home_x_checksum          CHECKSUM("home_x")
#define home_y_checksum          CHECKSUM("home_y")
#define home_z_checksum          CHECKSUM("home_z")
#define surface_x_pos_checksum   CHECKSUM("surface_x_pos")
#define surface_x_neg_checksum   CHECKSUM("surface_x_neg")
#define surface_y_pos_checksum   CHECKSUM("surface_y_pos")
#define surface_y_neg_checksum   CHECKSUM("surface_y_neg")
#define surface_z_pos_checksum   CHECKSUM("surface_z_pos")
#define surface_z_neg_checksum   CHECKSUM("surface_z_neg")
#define trigger_latency_checksum CHECKSUM("trigger_latency")
#define travel_speed_checksum    CHECKSUM("travel_speed")
#define start_homed_checksum     CHECKSUM("start_homed")

static const char axis_letters[] = "xyz";

SimulatedMachine::SimulatedMachine() : clock(0)
{
    for (int i = 0; i < 3; ++i) {
        probes[i] = new SimulatedProbe(this, i);
        minimum[i] = 0;
        maximum[i] = 200;
        home_position[i] = 0;
        surface[i][0] = NAN;
        surface[i][1] = NAN;
        homed[i] = false;
    }
    trigger_latency = 0;
    travel_speed = 50;
}

SimulatedMachine::~SimulatedMachine()
{
    for (int i = 0; i < 3; ++i) {
        delete probes[i];
    }
}

void SimulatedMachine::on_module_loaded()
{
    this->config_load();
    this->register_for_event(ON_COMMAND_RECEIVED);
}

void SimulatedMachine::config_load()
{
    Config *config = kernel->config;
    this->minimum[X_AXIS] = config->value(simulator_checksum, x_min_checksum)->by_default(0.0F)->as_number();
    this->maximum[X_AXIS] = config->value(simulator_checksum, x_max_checksum)->by_default(300.0F)->as_number();
    this->minimum[Y_AXIS] = config->value(simulator_checksum, y_min_checksum)->by_default(0.0F)->as_number();
    this->maximum[Y_AXIS] = config->value(simulator_checksum, y_max_checksum)->by_default(200.0F)->as_number();
    this->minimum[Z_AXIS] = config->value(simulator_checksum, z_min_checksum)->by_default(-10.0F)->as_number();
    this->maximum[Z_AXIS] = config->value(simulator_checksum, z_max_checksum)->by_default(100.0F)->as_number();

    // home at the minimum of X and Y and the top of Z unless told otherwise
    this->home_position[X_AXIS] = config->value(simulator_checksum, home_x_checksum)->by_default(minimum[X_AXIS])->as_number();
    this->home_position[Y_AXIS] = config->value(simulator_checksum, home_y_checksum)->by_default(minimum[Y_AXIS])->as_number();
    this->home_position[Z_AXIS] = config->value(simulator_checksum, home_z_checksum)->by_default(maximum[Z_AXIS])->as_number();

    this->surface[X_AXIS][0] = config->value(simulator_checksum, surface_x_pos_checksum)->by_default(NAN)->as_number();
    this->surface[X_AXIS][1] = config->value(simulator_checksum, surface_x_neg_checksum)->by_default(NAN)->as_number();
    this->surface[Y_AXIS][0] = config->value(simulator_checksum, surface_y_pos_checksum)->by_default(NAN)->as_number();
    this->surface[Y_AXIS][1] = config->value(simulator_checksum, surface_y_neg_checksum)->by_default(NAN)->as_number();
    this->surface[Z_AXIS][0] = config->value(simulator_checksum, surface_z_pos_checksum)->by_default(NAN)->as_number();
    this->surface[Z_AXIS][1] = config->value(simulator_checksum, surface_z_neg_checksum)->by_default(0.0F)->as_number();

    this->trigger_latency = config->value(simulator_checksum, trigger_latency_checksum)->by_default(0.001F)->as_number();
    this->travel_speed = config->value(simulator_checksum, travel_speed_checksum)->by_default(50.0F)->as_number();

    for (int i = 0; i < 3; ++i) {
        if(std::isnan(minimum[i]) || std::isnan(maximum[i]) || minimum[i] >= maximum[i]) {
            kernel->streams->printf("error:simulator %c axis limits are invalid, using 0 to 200\n", axis_letters[i]);
            minimum[i] = 0;
            maximum[i] = 200;
        }
        if(std::isnan(home_position[i])) home_position[i] = minimum[i];
        home_position[i] = confine(home_position[i], minimum[i], maximum[i]);
    }
    if(std::isnan(trigger_latency) || trigger_latency < 0) trigger_latency = 0;
    if(std::isnan(travel_speed) || travel_speed <= 0) travel_speed = 50;

    if(config->value(simulator_checksum, start_homed_checksum)->by_default(false)->as_bool()) {
        home();
    }
}

void SimulatedMachine::home()
{
    Position target(home_position[X_AXIS], home_position[Y_AXIS], home_position[Z_AXIS]);
    advance_clock(position, target, travel_speed);
    position = target;
    for (int i = 0; i < 3; ++i) {
        homed[i] = true;
    }
}

std::string SimulatedMachine::homed_axes() const
{
    std::string axes;
    for (int i = 0; i < 3; ++i) {
        if(homed[i]) axes.append(1, axis_letters[i]);
    }
    return axes;
}

void SimulatedMachine::set_surface(int axis, int sign, float coordinate)
{
    surface[axis][sign > 0 ? 0 : 1] = coordinate;
}

bool SimulatedMachine::is_probe_in_use(int axis) const
{
    return probes[axis]->is_in_use();
}

void SimulatedMachine::advance_clock(const Position& from, const Position& to, float speed)
{
    float dx = to[X_AXIS] - from[X_AXIS];
    float dy = to[Y_AXIS] - from[Y_AXIS];
    float dz = to[Z_AXIS] - from[Z_AXIS];
    float distance = sqrtf(dx * dx + dy * dy + dz * dz);
    if(speed > 0) clock += distance / speed;
}

// soft endstops, moves stop at the machine limits
void SimulatedMachine::move_to(const Position& target, float speed)
{
    Position clamped(confine(target[X_AXIS], minimum[X_AXIS], maximum[X_AXIS]),
                     confine(target[Y_AXIS], minimum[Y_AXIS], maximum[Y_AXIS]),
                     confine(target[Z_AXIS], minimum[Z_AXIS], maximum[Z_AXIS]));
    advance_clock(position, clamped, speed);
    position = clamped;
}

// the probe is triggered when it is on or past any surface
bool SimulatedMachine::is_triggered(const Position& p) const
{
    for (int i = 0; i < 3; ++i) {
        if(!std::isnan(surface[i][0]) && p[i] >= surface[i][0]) return true;
        if(!std::isnan(surface[i][1]) && p[i] <= surface[i][1]) return true;
    }
    return false;
}

bool SimulatedMachine::probing_move(const Position& target, float speed, Position& contact)
{
    Position start = position;

    // the fraction of the move done when the probe stops, 1 if it never triggers
    float stop_fraction = 1;
    bool triggered = false;
    for (int i = 0; i < 3; ++i) {
        float d = target[i] - start[i];
        if(d == 0) continue;

        int sign = d > 0 ? 1 : -1;
        float s = surface[i][sign > 0 ? 0 : 1];
        if(std::isnan(s)) continue;

        float to_surface = sign * (s - start[i]);
        if(to_surface < 0) {
            // already past it, it triggers right away
            contact = start;
            return true;
        }
        if(to_surface > fabsf(d)) continue;

        float stop = s + sign * speed * trigger_latency;
        if(sign * (stop - target[i]) > 0) stop = target[i];
        float f = (stop - start[i]) / d;
        if(!triggered || f < stop_fraction) {
            stop_fraction = f;
            triggered = true;
        }
    }

    Position end(start[X_AXIS] + (target[X_AXIS] - start[X_AXIS]) * stop_fraction,
                 start[Y_AXIS] + (target[Y_AXIS] - start[Y_AXIS]) * stop_fraction,
                 start[Z_AXIS] + (target[Z_AXIS] - start[Z_AXIS]) * stop_fraction);
    move_to(end, speed);
    contact = position;
    return triggered;
}

void SimulatedMachine::on_command_received(void *argument)
{
    Command *command = static_cast<Command *>(argument);

    if(command->is("HOME")) {
        command->is_handled = true;
        home();
        command->stream->printf("homed %s\n", homed_axes().c_str());

    } else if(command->is("MOVE")) {
        command->is_handled = true;
        handle_move(command);

    } else if(command->is("GET_POSITION")) {
        command->is_handled = true;
        command->stream->printf("X:%1.4f Y:%1.4f Z:%1.4f homed:%s\n", position[X_AXIS], position[Y_AXIS], position[Z_AXIS], homed_axes().c_str());
    }
}

// MOVE X=10 Y=20 Z=5 F=50, absolute, missing axes stay where they are
void SimulatedMachine::handle_move(Command *command)
{
    static const char *keys[] = { "X", "Y", "Z" };
    Position target = position;
    for (int i = 0; i < 3; ++i) {
        if(!command->has_param(keys[i])) continue;
        float v;
        if(!command->get_number(keys[i], v)) {
            command->stream->printf("error:Unable to parse '%s' as a number\n", command->get_string(keys[i]).c_str());
            command->is_error = true;
            return;
        }
        if(v < minimum[i] || v > maximum[i]) {
            command->stream->printf("error:Move out of range, %c must be between %1.3f and %1.3f\n", axis_letters[i], minimum[i], maximum[i]);
            command->is_error = true;
            return;
        }
        target = target.with_axis(i, v);
    }

    float speed = travel_speed;
    if(command->has_param("F")) {
        if(!command->get_number("F", speed) || speed <= 0) {
            command->stream->printf("error:F must be a number above 0\n");
            command->is_error = true;
            return;
        }
    }

    move_to(target, speed);
}
