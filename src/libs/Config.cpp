/*
      This file is part of Smoothie (http://smoothieware.org/). The motion control part is heavily based on Grbl (https://github.com/simen/grbl).
      Smoothie is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
      Smoothie is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.
      You should have received a copy of the GNU General Public License along with Smoothie. If not, see <http://www.gnu.org/licenses/>.
*/

#include "Config.h"
#include "ConfigValue.h"
#include "utils.h"

#include <cstring>
#include <fstream>
#include <sstream>

Config::Config()
{
}

Config::~Config()
{
    for( auto cv : config_cache ) {
        delete cv;
    }
}

bool Config::load_file(const string& filename)
{
    std::ifstream in(filename.c_str());
    if( !in.is_open() ) {
        return false;
    }
    load_stream(in);
    return true;
}

void Config::load_stream(std::istream& in)
{
    string line;
    while( std::getline(in, line) ) {
        process_line(line);
    }
}

void Config::load_string(const string& text)
{
    std::istringstream in(text);
    load_stream(in);
}

// set or override one setting, used by the command line to patch the file
void Config::set_string(const string& setting, const string& value)
{
    process_line(setting + " " + value);
}

// Parse one line "key value # comment", later lines override earlier ones
bool Config::process_line(const string& buffer)
{
    string line(buffer);
    size_t comment = line.find('#');
    if( comment != string::npos ) {
        line = line.substr(0, comment);
    }
    ltrim(line);
    rtrim(line);
    if( line.empty() ) return false;

    size_t end_key = line.find_first_of(" \t");
    if( end_key == string::npos ) {
        // a key with no value
        return false;
    }

    string key = line.substr(0, end_key);
    string value = line.substr(end_key);
    ltrim(value);

    uint16_t check_sums[3];
    get_checksums(check_sums, key);

    for( auto cv : config_cache ) {
        if( memcmp(check_sums, cv->check_sums, sizeof(check_sums)) == 0 ) {
            cv->value = value;
            return true;
        }
    }

    ConfigValue *cv = new ConfigValue(check_sums);
    cv->value = value;
    cv->found = true;
    config_cache.push_back(cv);
    return true;
}

ConfigValue *Config::value(uint16_t check_sum_a, uint16_t check_sum_b, uint16_t check_sum_c)
{
    uint16_t check_sums[3];
    check_sums[0] = check_sum_a;
    check_sums[1] = check_sum_b;
    check_sums[2] = check_sum_c;
    return this->value(check_sums);
}

// Get a value from the configuration as a string
// Because we don't like to waste space in Flash with lengthy config parameter names, we use a checksum instead to identify each config parameter
// The string is converted to a number by the ConfigValue
ConfigValue *Config::value(uint16_t check_sums[3])
{
    for( auto cv : config_cache ) {
        if( memcmp(check_sums, cv->check_sums, sizeof(cv->check_sums)) == 0 ) {
            return cv;
        }
    }

    dummy_value.clear();
    memcpy(dummy_value.check_sums, check_sums, sizeof(dummy_value.check_sums));
    return &dummy_value;
}
