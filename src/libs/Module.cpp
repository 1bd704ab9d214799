/*
      This file is part of Smoothie (http://smoothieware.org/). The motion control part is heavily based on Grbl (https://github.com/simen/grbl).
      Smoothie is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
      Smoothie is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.
      You should have received a copy of the GNU General Public License along with Smoothie. If not, see <http://www.gnu.org/licenses/>.
*/

#include "libs/Module.h"
#include "libs/Kernel.h"

// one entry per _EVENT_ENUM, in the same order
const ModuleCallback kernel_callback_functions[NUMBER_OF_DEFINED_EVENTS] = {
    &Module::on_main_loop,
    &Module::on_console_line_received,
    &Module::on_command_received,
    &Module::on_command_error,
    &Module::on_probe_result,
};

Module::Module() : kernel(nullptr)
{
}

Module::~Module()
{
    if(kernel != nullptr) kernel->remove_module(this);
}

void Module::register_for_event(_EVENT_ENUM event_id)
{
    if(kernel == nullptr) return;
    kernel->register_for_event(event_id, this);
}

void Module::unregister_for_event(_EVENT_ENUM event_id)
{
    if(kernel == nullptr) return;
    kernel->unregister_for_event(event_id, this);
}
