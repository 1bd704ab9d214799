/*
      This file is part of Smoothie (http://smoothieware.org/). The motion control part is heavily based on Grbl (https://github.com/simen/grbl).
      Smoothie is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
      Smoothie is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.
      You should have received a copy of the GNU General Public License along with Smoothie. If not, see <http://www.gnu.org/licenses/>.
*/


#ifndef MOTIONEXECUTOR_H
#define MOTIONEXECUTOR_H

#include "Position.h"

// What the probe needs from the motion system, moves block until they are done
class MotionExecutor {
    public:
        virtual ~MotionExecutor() {}

        virtual Position get_position() const = 0;
        // speed is in mm/sec
        virtual void move_to(const Position& target, float speed) = 0;
        // time in seconds at which the last queued move is done
        virtual double get_last_move_time() const = 0;
};

#endif
