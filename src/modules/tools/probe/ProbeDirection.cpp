/*
      This file is part of Smoothie (http://smoothieware.org/). The motion control part is heavily based on Grbl (https://github.com/simen/grbl).
      Smoothie is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
      Smoothie is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.
      You should have received a copy of the GNU General Public License along with Smoothie. If not, see <http://www.gnu.org/licenses/>.
*/


#include "ProbeDirection.h"
#include "libs/utils.h"

const ProbeDirection probe_directions[NUMBER_OF_PROBE_DIRECTIONS] = {
    { "x+", 0, +1 },
    { "x-", 0, -1 },
    { "y+", 1, +1 },
    { "y-", 1, -1 },
    { "z+", 2, +1 },
    { "z-", 2, -1 },
};

ProbeError resolve_direction(const std::string& name, ProbeDirection& direction)
{
    std::string n = lc(name);
    for (const auto& d : probe_directions) {
        if(n == d.name) {
            direction = d;
            return ProbeError::ok();
        }
    }
    return ProbeError(ProbeError::INVALID_DIRECTION, "Wrong value for DIRECTION: '" + name + "', must be one of x+ x- y+ y- z+ z-");
}
