/*
      This file is part of Smoothie (http://smoothieware.org/). The motion control part is heavily based on Grbl (https://github.com/simen/grbl).
      Smoothie is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
      Smoothie is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.
      You should have received a copy of the GNU General Public License along with Smoothie. If not, see <http://www.gnu.org/licenses/>.
*/


#ifndef COMMANDDISPATCH_H
#define COMMANDDISPATCH_H

#include "libs/Module.h"

#include <string>
using std::string;

class StreamOutput;

// Turns console lines into Command objects and hands them to the modules with ON_COMMAND_RECEIVED
class CommandDispatch : public Module {
    public:
        CommandDispatch() {}

        void on_module_loaded();
        void on_console_line_received(void *argument);

        // run one line as if it came from the console, replies go to stream
        // returns false if the command was unknown or failed
        bool dispatch(const string& line, StreamOutput *stream, unsigned int line_number= 0);
};

#endif
