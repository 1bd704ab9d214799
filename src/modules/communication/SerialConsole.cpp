/*
      This file is part of Smoothie (http://smoothieware.org/). The motion control part is heavily based on Grbl (https://github.com/simen/grbl).
      Smoothie is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
      Smoothie is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.
      You should have received a copy of the GNU General Public License along with Smoothie. If not, see <http://www.gnu.org/licenses/>.
*/


#include "SerialConsole.h"
#include "libs/Kernel.h"
#include "libs/SerialMessage.h"
#include "libs/StreamOutputPool.h"

#include <string>
using std::string;

SerialConsole::SerialConsole(std::istream& in, std::ostream& out, bool echo)
    : in(in), out(out), line_count(0), echo(echo)
{
}

SerialConsole::~SerialConsole()
{
    if( kernel != nullptr ) kernel->streams->remove_stream(this);
}

// Called when the module has just been loaded
void SerialConsole::on_module_loaded()
{
    // We only call the command dispatcher in the main loop, nowhere else
    this->register_for_event(ON_MAIN_LOOP);

    // Add to the pack of streams kernel can call to, for example for broadcasting
    kernel->streams->append_stream(this);
}

// Read a line and send it to the command dispatcher, at the end of input ask the kernel to stop
void SerialConsole::on_main_loop(void *argument)
{
    string received;
    if( !std::getline(in, received) ) {
        kernel->set_stop_request(true);
        return;
    }

    // strip a trailing CR so files written on windows work too
    if( !received.empty() && received[received.size() - 1] == '\r' ) {
        received.erase(received.size() - 1);
    }

    line_count++;
    if( echo ) {
        out << "> " << received << "\n";
    }

    SerialMessage message(this, received, line_count);
    kernel->call_event(ON_CONSOLE_LINE_RECEIVED, &message);
}

int SerialConsole::puts(const char *str)
{
    string s(str);
    out << s;
    out.flush();
    return s.size();
}

int SerialConsole::_putc(int c)
{
    out.put((char)c);
    return 1;
}
