/*
      This file is part of Smoothie (http://smoothieware.org/). The motion control part is heavily based on Grbl (https://github.com/simen/grbl).
      Smoothie is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
      Smoothie is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.
      You should have received a copy of the GNU General Public License along with Smoothie. If not, see <http://www.gnu.org/licenses/>.
*/


#include "CommandDispatch.h"
#include "utils/Command.h"
#include "libs/Kernel.h"
#include "libs/SerialMessage.h"
#include "libs/StreamOutput.h"
#include "libs/utils.h"

void CommandDispatch::on_module_loaded()
{
    this->register_for_event(ON_CONSOLE_LINE_RECEIVED);
}

// When a new line is received, check if it is a command, and if it is, pass it to the modules
void CommandDispatch::on_console_line_received(void *argument)
{
    SerialMessage new_message = *static_cast<SerialMessage *>(argument);
    dispatch(new_message.message, new_message.stream, new_message.line);
}

bool CommandDispatch::dispatch(const string& line, StreamOutput *stream, unsigned int line_number)
{
    string possible_command(line);

    // strip comments, ; or # to the end of the line
    size_t comment = possible_command.find_first_of(";#");
    if( comment != string::npos ) {
        possible_command = possible_command.substr(0, comment);
    }
    ltrim(possible_command);
    rtrim(possible_command);

    // empty lines are just acknowledged
    if( possible_command.empty() ) {
        stream->printf("ok\n");
        return true;
    }

    Command command(possible_command, stream, line_number);
    kernel->call_event(ON_COMMAND_RECEIVED, &command);

    if( !command.is_handled ) {
        stream->printf("error:Unknown command: %s\n", command.get_command().c_str());
        return false;
    }

    if( command.is_error ) {
        // let anything holding resources for the command clean up
        kernel->call_event(ON_COMMAND_ERROR, &command);
        return false;
    }

    stream->printf("ok\n");
    return true;
}
