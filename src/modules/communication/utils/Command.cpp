/*
      This file is part of Smoothie (http://smoothieware.org/). The motion control part is heavily based on Grbl (https://github.com/simen/grbl).
      Smoothie is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
      Smoothie is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.
      You should have received a copy of the GNU General Public License along with Smoothie. If not, see <http://www.gnu.org/licenses/>.
*/

#include "Command.h"
#include "libs/utils.h"

#include <cmath>
#include <cstdlib>

// This is a command object. It represents one console line and caches the name and parameters for the sake of performance.
Command::Command(const string &command, StreamOutput *stream, unsigned int line)
    : stream(stream), line(line)
{
    this->is_handled = false;
    this->is_error = false;
    prepare_cached_values(command);
}

// Whether or not a Command has a parameter
bool Command::has_param( const char *key ) const
{
    return params.find(uc(key)) != params.end();
}

string Command::get_string( const char *key, const string& default_value ) const
{
    auto i = params.find(uc(key));
    if( i == params.end() ) return default_value;
    return i->second;
}

bool Command::get_number( const char *key, float& value ) const
{
    auto i = params.find(uc(key));
    if( i == params.end() ) return false;

    float f;
    if( !parse_float(i->second, f) ) return false;
    value = f;
    return true;
}

// Retrieve the value for a given parameter, 0 if it is missing or not a number
float Command::get_value( const char *key ) const
{
    float f = 0;
    if( !get_number(key, f) ) return 0;
    return f;
}

int Command::get_int( const char *key ) const
{
    return (int)lroundf(get_value(key));
}

// the first word is the command, every other word is KEY=VALUE, a bare KEY gets an empty value
void Command::prepare_cached_values(const string& command)
{
    string parameters = command;
    this->name = uc(shift_parameter(parameters));

    while( !parameters.empty() ) {
        string p = shift_parameter(parameters);
        if( p.empty() ) break;

        size_t eq = p.find('=');
        if( eq == string::npos ) {
            params[uc(p)] = "";
        } else {
            params[uc(p.substr(0, eq))] = p.substr(eq + 1);
        }
    }
}
