/*
      This file is part of Smoothie (http://smoothieware.org/). The motion control part is heavily based on Grbl (https://github.com/simen/grbl).
      Smoothie is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
      Smoothie is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.
      You should have received a copy of the GNU General Public License along with Smoothie. If not, see <http://www.gnu.org/licenses/>.
*/

#include "libs/Kernel.h"
#include "libs/Config.h"
#include "libs/StreamOutput.h"
#include "libs/StreamOutputPool.h"

#include "modules/communication/CommandDispatch.h"
#include "modules/communication/SerialConsole.h"
#include "modules/robot/SimulatedMachine.h"
#include "modules/tools/probe/MultiAxisProbe.h"
#include "modules/tools/probe/ProbePoints.h"

#include <fstream>
#include <iostream>
#include <string>

// multiprobe [config file] [command file]
// commands are read from stdin when no command file is given
int main(int argc, char *argv[])
{
    std::string config_file = argc > 1 ? argv[1] : "config";

    Config config;
    StreamOutputPool streams;
    Kernel kernel(&config, &streams);

    if(!config.load_file(config_file)) {
        std::cerr << "error:Unable to open config file " << config_file << "\n";
        return 1;
    }

    std::ifstream command_file;
    bool from_file = argc > 2;
    if(from_file) {
        command_file.open(argv[2]);
        if(!command_file.is_open()) {
            std::cerr << "error:Unable to open command file " << argv[2] << "\n";
            return 1;
        }
    }

    // the console first so load messages are seen
    SerialConsole console(from_file ? static_cast<std::istream&>(command_file) : std::cin, std::cout, from_file);
    kernel.add_module(&console);

    CommandDispatch dispatch;
    kernel.add_module(&dispatch);

    SimulatedMachine machine;
    kernel.add_module(&machine);

    MultiAxisProbe probe(machine, machine, machine.get_probe(X_AXIS), machine.get_probe(Y_AXIS), machine.get_probe(Z_AXIS));
    kernel.add_module(&probe);

    ProbePoints probe_points(probe, machine);
    kernel.add_module(&probe_points);

    kernel.streams->printf("multiprobe running, config %s, %u settings\n", config_file.c_str(), (unsigned)config.size());
    if(!probe.is_enabled()) kernel.streams->printf("WARNING probe is disabled\n");

    while(!kernel.get_stop_request()) {
        kernel.call_event(ON_MAIN_LOOP);
    }

    return 0;
}
