/*
      This file is part of Smoothie (http://smoothieware.org/). The motion control part is heavily based on Grbl (https://github.com/simen/grbl).
      Smoothie is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
      Smoothie is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.
      You should have received a copy of the GNU General Public License along with Smoothie. If not, see <http://www.gnu.org/licenses/>.
*/


#ifndef POSITION_H
#define POSITION_H

#define X_AXIS 0
#define Y_AXIS 1
#define Z_AXIS 2

// A point in machine space, in mm
// Positions are values, a changed coordinate is a new Position
class Position {
    public:
        Position() : c{0, 0, 0} {}
        Position(float x, float y, float z) : c{x, y, z} {}

        float operator[](int axis) const { return c[axis]; }
        float x() const { return c[X_AXIS]; }
        float y() const { return c[Y_AXIS]; }
        float z() const { return c[Z_AXIS]; }

        Position with_axis(int axis, float value) const
        {
            Position p(*this);
            p.c[axis] = value;
            return p;
        }

        bool operator==(const Position& o) const { return c[0] == o.c[0] && c[1] == o.c[1] && c[2] == o.c[2]; }
        bool operator!=(const Position& o) const { return !(*this == o); }

    private:
        float c[3];
};

#endif
