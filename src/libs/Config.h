/*
      This file is part of Smoothie (http://smoothieware.org/). The motion control part is heavily based on Grbl (https://github.com/simen/grbl).
      Smoothie is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
      Smoothie is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.
      You should have received a copy of the GNU General Public License along with Smoothie. If not, see <http://www.gnu.org/licenses/>.
*/

#ifndef CONFIG_H
#define CONFIG_H

#include "ConfigValue.h"

#include <stdint.h>
#include <istream>
#include <string>
#include <vector>
using std::string;
using std::vector;

// Key/value settings read from a config file.
//
// One setting per line, the key is up to three dot separated names:
//
//   probe.speed                 5      # approach speed in mm/sec
//   probe_points.points         10,10;50,50
//
// Everything after a # is a comment. Lookups are done by checksum of each key part so
// modules can use compile time CHECKSUM() constants.
class Config {
    public:
        Config();
        ~Config();
        Config(const Config&) = delete;
        Config& operator= (const Config&) = delete;

        bool load_file(const string& filename);
        void load_stream(std::istream& in);
        void load_string(const string& text);
        void set_string(const string& setting, const string& value);

        ConfigValue* value(uint16_t check_sum_a, uint16_t check_sum_b= 0, uint16_t check_sum_c= 0);
        ConfigValue* value(uint16_t check_sums[3]);

        size_t size() const { return config_cache.size(); }

    private:
        bool process_line(const string& line);

        vector<ConfigValue*> config_cache;
        // returned for lookups that are not in the file, reset on each lookup
        ConfigValue dummy_value;
};

#endif
