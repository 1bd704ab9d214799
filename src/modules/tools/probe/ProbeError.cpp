/*
      This file is part of Smoothie (http://smoothieware.org/). The motion control part is heavily based on Grbl (https://github.com/simen/grbl).
      Smoothie is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
      Smoothie is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.
      You should have received a copy of the GNU General Public License along with Smoothie. If not, see <http://www.gnu.org/licenses/>.
*/


#include "ProbeError.h"

const char *ProbeError::code_name() const
{
    switch(code) {
        case PROBE_OK:              return "ok";
        case INVALID_DIRECTION:     return "invalid direction";
        case INVALID_CONFIGURATION: return "invalid configuration";
        case SESSION_STATE_ERROR:   return "session state error";
        case NO_CONTACT_TIMEOUT:    return "no contact";
        case TOLERANCE_EXCEEDED:    return "tolerance exceeded";
        case UNHOMED_AXIS:          return "unhomed axis";
    }
    return "unknown";
}

ProbeError& ProbeError::hint(const string& text)
{
    message.append("\n").append(text);
    return *this;
}
