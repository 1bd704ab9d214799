/*
      This file is part of Smoothie (http://smoothieware.org/). The motion control part is heavily based on Grbl (https://github.com/simen/grbl).
      Smoothie is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
      Smoothie is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.
      You should have received a copy of the GNU General Public License along with Smoothie. If not, see <http://www.gnu.org/licenses/>.
*/

#ifndef KERNEL_H
#define KERNEL_H

#include "Module.h"

#include <array>
#include <vector>

class Config;
class StreamOutputPool;

// The kernel stores modules and dispatches events to them.
// There is no global instance, whoever builds the machine owns the kernel and hands it to the modules.
class Kernel {
    public:
        Kernel(Config *config, StreamOutputPool *streams);

        void add_module(Module *module);
        void remove_module(Module *module);
        void register_for_event(_EVENT_ENUM id_event, Module *module);
        void unregister_for_event(_EVENT_ENUM id_event, Module *module);
        void call_event(_EVENT_ENUM id_event, void *argument= nullptr);

        bool kernel_has_event(_EVENT_ENUM id_event, Module *module) const;

        void set_stop_request(bool f) { stop_request= f; }
        bool get_stop_request() const { return stop_request; }

        // These are available to all modules
        Config*           config;
        StreamOutputPool* streams;

    private:
        // When a module asks to be called for a specific event ( a hook ), this is where that request is remembered
        std::array<std::vector<Module*>, NUMBER_OF_DEFINED_EVENTS> hooks;
        bool stop_request;
};

#endif
