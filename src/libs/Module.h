/*
      This file is part of Smoothie (http://smoothieware.org/). The motion control part is heavily based on Grbl (https://github.com/simen/grbl).
      Smoothie is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
      Smoothie is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.
      You should have received a copy of the GNU General Public License along with Smoothie. If not, see <http://www.gnu.org/licenses/>.
*/

#ifndef MODULE_H
#define MODULE_H

// See : http://smoothieware.org/listofevents
enum _EVENT_ENUM {
    ON_MAIN_LOOP,
    ON_CONSOLE_LINE_RECEIVED,
    ON_COMMAND_RECEIVED,
    ON_COMMAND_ERROR,
    ON_PROBE_RESULT,
    NUMBER_OF_DEFINED_EVENTS
};

class Module;
class Kernel;

typedef void (Module::*ModuleCallback)(void *argument);
extern const ModuleCallback kernel_callback_functions[NUMBER_OF_DEFINED_EVENTS];

// Module base class
// All modules must extend this class, see http://smoothieware.org/moduleexample
class Module
{
public:
    Module();
    virtual ~Module();
    virtual void on_module_loaded() {};
    void register_for_event(_EVENT_ENUM event_id);
    void unregister_for_event(_EVENT_ENUM event_id);

    virtual void on_main_loop(void *) {};
    virtual void on_console_line_received(void *) {};
    virtual void on_command_received(void *) {};
    virtual void on_command_error(void *) {};
    virtual void on_probe_result(void *) {};

protected:
    friend class Kernel;
    // set by Kernel::add_module before on_module_loaded is called
    Kernel *kernel;
};

#endif
