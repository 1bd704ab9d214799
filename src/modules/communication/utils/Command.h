/*
      This file is part of Smoothie (http://smoothieware.org/). The motion control part is heavily based on Grbl (https://github.com/simen/grbl).
      Smoothie is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
      Smoothie is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.
      You should have received a copy of the GNU General Public License along with Smoothie. If not, see <http://www.gnu.org/licenses/>.
*/

#ifndef COMMAND_H
#define COMMAND_H

#include <map>
#include <string>
using std::string;

class StreamOutput;

// A parsed command line of the form
//
//   PROBE_ACCURACY DIRECTION=x- SAMPLES=5
//
// The command name and parameter names are case insensitive and stored upper case, values are kept as typed.
// It gets passed around in ON_COMMAND_RECEIVED, a module that takes it sets is_handled, and is_error when it failed.
class Command {
    public:
        Command(const string& command, StreamOutput *stream, unsigned int line= 0);

        const string& get_command() const { return name; }
        bool is(const char *command_name) const { return name == command_name; }

        bool has_param(const char *key) const;
        string get_string(const char *key, const string& default_value= "") const;
        // false if the parameter is missing or is not a number
        bool get_number(const char *key, float& value) const;
        float get_value(const char *key) const;
        int get_int(const char *key) const;
        int get_num_args() const { return params.size(); }

        StreamOutput *stream;
        unsigned int line;
        struct {
            bool is_handled:1;
            bool is_error:1;
        };

    private:
        void prepare_cached_values(const string& command);

        string name;
        std::map<string, string> params;
};

#endif
