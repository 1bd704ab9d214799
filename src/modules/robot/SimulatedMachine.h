/*
      This file is part of Smoothie (http://smoothieware.org/). The motion control part is heavily based on Grbl (https://github.com/simen/grbl).
      Smoothie is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
      Smoothie is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.
      You should have received a copy of the GNU General Public License along with Smoothie. If not, see <http://www.gnu.org/licenses/>.
*/


#ifndef SIMULATEDMACHINE_H
#define SIMULATEDMACHINE_H

#include "libs/Module.h"
#include "MotionExecutor.h"
#include "Kinematics.h"
#include "ContactDetector.h"

#include <string>

#define simulator_checksum CHECKSUM("simulator")

class Command;
class StreamOutput;

// A cartesian machine with a probe that touches flat surfaces
//
// Each direction can have a surface, configured as simulator.surface_<axis>_<pos|neg>.
// A probing move stops trigger_latency seconds after it reaches the surface, so faster moves overshoot more.
// Time is simulated, moves advance the clock by their duration.
class SimulatedMachine : public Module, public MotionExecutor, public Kinematics {
    public:
        SimulatedMachine();
        ~SimulatedMachine();

        void on_module_loaded();
        void on_command_received(void *argument);

        // MotionExecutor
        Position get_position() const { return position; }
        void move_to(const Position& target, float speed);
        double get_last_move_time() const { return clock; }

        // Kinematics
        float axis_minimum(int axis) const { return minimum[axis]; }
        float axis_maximum(int axis) const { return maximum[axis]; }
        std::string homed_axes() const;

        ContactDetector *get_probe(int axis) { return probes[axis]; }

        void home();
        bool is_triggered(const Position& p) const;
        bool is_probe_in_use(int axis) const;
        void set_surface(int axis, int sign, float coordinate);

    private:
        class SimulatedProbe : public ContactDetector {
            public:
                SimulatedProbe(SimulatedMachine *machine, int axis) : machine(machine), axis(axis), in_use(false) {}
                void multi_probe_begin() { in_use = true; }
                void multi_probe_end() { in_use = false; }
                bool probing_move(const Position& target, float speed, Position& contact) { return machine->probing_move(target, speed, contact); }
                bool query_endstop(double time) { return machine->is_triggered(machine->position); }
                bool is_in_use() const { return in_use; }

            private:
                SimulatedMachine *machine;
                int axis;
                bool in_use;
        };

        void config_load();
        bool probing_move(const Position& target, float speed, Position& contact);
        void advance_clock(const Position& from, const Position& to, float speed);
        void handle_move(Command *command);

        Position position;
        SimulatedProbe *probes[3];
        float minimum[3];
        float maximum[3];
        float home_position[3];
        // [axis][0] is the surface met moving positive, [axis][1] moving negative, NAN when there is none
        float surface[3][2];
        float trigger_latency;
        float travel_speed;
        double clock;
        bool homed[3];
};

#endif
