/*
      This file is part of Smoothie (http://smoothieware.org/). The motion control part is heavily based on Grbl (https://github.com/simen/grbl).
      Smoothie is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
      Smoothie is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.
      You should have received a copy of the GNU General Public License along with Smoothie. If not, see <http://www.gnu.org/licenses/>.
*/


#ifndef PROBEDIRECTION_H
#define PROBEDIRECTION_H

#include "ProbeError.h"

#include <string>

// A direction the probe can move in, x+ moves toward increasing X
struct ProbeDirection {
    const char *name;
    int axis;
    int sign;
};

#define NUMBER_OF_PROBE_DIRECTIONS 6
extern const ProbeDirection probe_directions[NUMBER_OF_PROBE_DIRECTIONS];

// look up a direction by name, case is ignored
ProbeError resolve_direction(const std::string& name, ProbeDirection& direction);

#endif
