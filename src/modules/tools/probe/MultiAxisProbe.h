/*
      This file is part of Smoothie (http://smoothieware.org/). The motion control part is heavily based on Grbl (https://github.com/simen/grbl).
      Smoothie is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
      Smoothie is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.
      You should have received a copy of the GNU General Public License along with Smoothie. If not, see <http://www.gnu.org/licenses/>.
*/


#ifndef MULTIAXISPROBE_H
#define MULTIAXISPROBE_H

#include "libs/Module.h"
#include "ProbeError.h"
#include "ProbeParameters.h"
#include "ProbeSession.h"

#include <string>

// defined here as they are used in multiple files
#define probe_checksum CHECKSUM("probe")

class Command;
class MotionExecutor;
class Kinematics;
class ContactDetector;
class BouncingProbe;

struct ProbeOffsets {
    float x;
    float y;
    float z;
};

struct ProbeStatus {
    std::string name;
    bool last_query;
    float last_z_result;
};

// A touch probe that can probe along any of the three axes, in either direction.
// Provides PROBE, PROBE_ACCURACY and QUERY_PROBE, and probe sessions for other modules.
class MultiAxisProbe : public Module {
    public:
        MultiAxisProbe(MotionExecutor& motion, Kinematics& kinematics, ContactDetector *x, ContactDetector *y, ContactDetector *z);
        ~MultiAxisProbe();

        void on_module_loaded();
        void on_command_received(void *argument);
        void on_command_error(void *argument);

        bool is_enabled() const { return enabled; }

        ProbeError get_probe_params(const ProbeParameterOverrides& overrides, ProbeParameters& params) const;
        const ProbeParameters& get_default_params() const { return defaults; }
        ProbeOffsets get_offsets() const { return offsets; }
        ProbeStatus get_status() const;

        ProbeError start_probe_session(const std::string& direction, ProbeSession*& session);
        // nullptr until the module is loaded
        ProbeSession *get_session() { return session; }

        // open, measure one point, close
        ProbeError run_single_probe(const std::string& direction, const ProbeParameters& params, Position& result);

    private:
        ProbeError config_load();
        ProbeError probe_command(Command *command);
        ProbeError probe_accuracy_command(Command *command);
        ProbeError query_probe_command(Command *command);

        MotionExecutor& motion;
        Kinematics& kinematics;
        ContactDetector *detectors[3];
        BouncingProbe *bouncing_probe;
        ProbeSession *session;

        ProbeParameters defaults;
        ProbeOffsets offsets;
        std::string name;
        float last_z_result;
        struct {
            bool enabled:1;
            bool last_state:1;
        };
};

#endif
