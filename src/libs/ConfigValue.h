/*
      This file is part of Smoothie (http://smoothieware.org/). The motion control part is heavily based on Grbl (https://github.com/simen/grbl).
      Smoothie is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
      Smoothie is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.
      You should have received a copy of the GNU General Public License along with Smoothie. If not, see <http://www.gnu.org/licenses/>.
*/

#ifndef CONFIGVALUE_H
#define CONFIGVALUE_H

#include <stdint.h>
#include <string>
using std::string;

class ConfigValue{
    public:
        ConfigValue();
        ConfigValue(uint16_t *check_sums);
        ConfigValue(const ConfigValue& to_copy);
        ConfigValue& operator= (const ConfigValue& to_copy);
        void clear();
        float as_number();
        int as_int();
        bool as_bool();
        string as_string();

        ConfigValue* by_default(float val);
        ConfigValue* by_default(int val);
        ConfigValue* by_default(string val);

        friend class Config;

        uint16_t check_sums[3];
        string value;

        bool is_found() const { return found; }

    private:
        float default_double;
        int default_int;
        struct {
            bool found:1;
            bool default_set:1;
        };
};

#endif
