/*
      This file is part of Smoothie (http://smoothieware.org/). The motion control part is heavily based on Grbl (https://github.com/simen/grbl).
      Smoothie is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
      Smoothie is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.
      You should have received a copy of the GNU General Public License along with Smoothie. If not, see <http://www.gnu.org/licenses/>.
*/


#ifndef KINEMATICS_H
#define KINEMATICS_H

#include <string>

// Travel envelope of a cartesian machine
class Kinematics {
    public:
        virtual ~Kinematics() {}

        virtual float axis_minimum(int axis) const = 0;
        virtual float axis_maximum(int axis) const = 0;
        // lower case names of the axes that have been homed, eg "xyz"
        virtual std::string homed_axes() const = 0;
};

#endif
