/*
      This file is part of Smoothie (http://smoothieware.org/). The motion control part is heavily based on Grbl (https://github.com/simen/grbl).
      Smoothie is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
      Smoothie is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.
      You should have received a copy of the GNU General Public License along with Smoothie. If not, see <http://www.gnu.org/licenses/>.
*/

#include "libs/Kernel.h"
#include "libs/Module.h"

#include <algorithm>

Kernel::Kernel(Config *config, StreamOutputPool *streams)
    : config(config), streams(streams), stop_request(false)
{
}

// Add a module to Kernel. We don't actually hold a list of modules we just call its on_module_loaded
void Kernel::add_module(Module* module)
{
    module->kernel = this;
    module->on_module_loaded();
}

// Forget a module that is going away, it must not be called again
void Kernel::remove_module(Module* module)
{
    for (auto &h : hooks) {
        h.erase(std::remove(h.begin(), h.end(), module), h.end());
    }
}

// Adds a hook for a given module and event
void Kernel::register_for_event(_EVENT_ENUM id_event, Module *mod)
{
    if(kernel_has_event(id_event, mod)) return;
    this->hooks[id_event].push_back(mod);
}

// Call a specific event with an argument
void Kernel::call_event(_EVENT_ENUM id_event, void * argument)
{
    // take a copy as a handler may unregister itself while we iterate
    std::vector<Module*> modules(hooks[id_event]);
    for (auto m : modules) {
        (m->*kernel_callback_functions[id_event])(argument);
    }
}

// register_for_event uses this so a module is never hooked twice to the same event
bool Kernel::kernel_has_event(_EVENT_ENUM id_event, Module *mod) const
{
    for (auto m : hooks[id_event]) {
        if(m == mod) return true;
    }
    return false;
}

void Kernel::unregister_for_event(_EVENT_ENUM id_event, Module *mod)
{
    for (auto i = hooks[id_event].begin(); i != hooks[id_event].end(); ++i) {
        if(*i == mod) {
            hooks[id_event].erase(i);
            return;
        }
    }
}
