/*
      This file is part of Smoothie (http://smoothieware.org/). The motion control part is heavily based on Grbl (https://github.com/simen/grbl).
      Smoothie is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
      Smoothie is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.
      You should have received a copy of the GNU General Public License along with Smoothie. If not, see <http://www.gnu.org/licenses/>.
*/


#ifndef CONTACTDETECTOR_H
#define CONTACTDETECTOR_H

#include "Position.h"

// The trigger input of a probe for one axis
class ContactDetector {
    public:
        virtual ~ContactDetector() {}

        // exclusive use of the trigger across several probing moves
        virtual void multi_probe_begin() = 0;
        virtual void multi_probe_end() = 0;

        // move toward target until the probe triggers
        // returns false if it got to the target without triggering, contact is where the machine stopped
        virtual bool probing_move(const Position& target, float speed, Position& contact) = 0;

        // state of the trigger at the given time
        virtual bool query_endstop(double time) = 0;
};

#endif
