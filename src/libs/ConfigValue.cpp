/*
      This file is part of Smoothie (http://smoothieware.org/). The motion control part is heavily based on Grbl (https://github.com/simen/grbl).
      Smoothie is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
      Smoothie is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.
      You should have received a copy of the GNU General Public License along with Smoothie. If not, see <http://www.gnu.org/licenses/>.
*/

#include "ConfigValue.h"
#include "libs/utils.h"

#include <cmath>
#include <cstdlib>
#include <cstring>

ConfigValue::ConfigValue()
{
    clear();
}

ConfigValue::ConfigValue(uint16_t *cs)
{
    clear();
    memcpy(this->check_sums, cs, sizeof(this->check_sums));
}

ConfigValue::ConfigValue(const ConfigValue& to_copy)
{
    *this = to_copy;
}

ConfigValue& ConfigValue::operator= (const ConfigValue& to_copy)
{
    if( this != &to_copy ) {
        this->found = to_copy.found;
        this->default_set = to_copy.default_set;
        memcpy(this->check_sums, to_copy.check_sums, sizeof(this->check_sums));
        this->value.assign(to_copy.value);
        this->default_double = to_copy.default_double;
        this->default_int = to_copy.default_int;
    }
    return *this;
}

void ConfigValue::clear()
{
    this->found = false;
    this->default_set = false;
    this->check_sums[0] = 0x0000;
    this->check_sums[1] = 0x0000;
    this->check_sums[2] = 0x0000;
    this->default_double = 0.0F;
    this->default_int = 0;
    this->value = "";
}

// a value that is present but not a number gives NAN so range checks will reject it
float ConfigValue::as_number()
{
    if( this->found == false && this->default_set == true ) {
        return this->default_double;
    } else if( this->found == false ) {
        return NAN;
    }

    float result;
    if( !parse_float(this->value, result) ) {
        return NAN;
    }
    return result;
}

int ConfigValue::as_int()
{
    if( this->found == false && this->default_set == true ) {
        return this->default_int;
    }
    char *endptr = NULL;
    int result = strtol(this->value.c_str(), &endptr, 10);
    if( endptr <= this->value.c_str() ) {
        return 0;
    }
    return result;
}

string ConfigValue::as_string()
{
    return this->value;
}

bool ConfigValue::as_bool()
{
    if( this->found == false && this->default_set == true ) {
        return this->default_int;
    } else {
        return this->value.find_first_of("ty1") != string::npos;
    }
}

ConfigValue *ConfigValue::by_default(int val)
{
    this->default_set = true;
    this->default_int = val;
    this->default_double = val;
    return this;
}

ConfigValue *ConfigValue::by_default(float val)
{
    this->default_set = true;
    this->default_double = val;
    this->default_int = (int)val;
    return this;
}

ConfigValue *ConfigValue::by_default(string val)
{
    if( this->found ) {
        return this;
    }
    this->default_set = true;
    this->value = val;
    return this;
}
