/*
      This file is part of Smoothie (http://smoothieware.org/). The motion control part is heavily based on Grbl (https://github.com/simen/grbl).
      Smoothie is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
      Smoothie is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.
      You should have received a copy of the GNU General Public License along with Smoothie. If not, see <http://www.gnu.org/licenses/>.
*/


#ifndef SERIALCONSOLE_H
#define SERIALCONSOLE_H

#include "libs/Module.h"
#include "libs/StreamOutput.h"

#include <istream>
#include <ostream>

// Console module
// Reads one line per main loop iteration and passes it ( via event call ) to the command dispatcher.
// It is also a stream, replies to its lines are written to the output.
class SerialConsole : public Module, public StreamOutput {
    public:
        SerialConsole(std::istream& in, std::ostream& out, bool echo= false);
        ~SerialConsole();

        void on_module_loaded();
        void on_main_loop(void *argument);

        int puts(const char *str);
        int _putc(int c);

        unsigned int get_line_count() const { return line_count; }

    private:
        std::istream& in;
        std::ostream& out;
        unsigned int line_count;
        bool echo;
};

#endif
