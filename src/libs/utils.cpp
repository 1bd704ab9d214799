/*
      This file is part of Smoothie (http://smoothieware.org/). The motion control part is heavily based on Grbl (https://github.com/simen/grbl).
      Smoothie is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
      Smoothie is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.
      You should have received a copy of the GNU General Public License along with Smoothie. If not, see <http://www.gnu.org/licenses/>.
*/

#include "libs/utils.h"

#include <cctype>
#include <cstdlib>
#include <cstring>
#include <algorithm>

using std::string;

uint16_t get_checksum(const string &to_check)
{
    return get_checksum(to_check.c_str());
}

// Fletcher-16, see checksumm.h for the compile time version
uint16_t get_checksum(const char *to_check)
{
    uint16_t sum1 = 0;
    uint16_t sum2 = 0;
    const char *p = to_check;
    char c;
    while((c = *p++) != 0) {
        sum1 = (sum1 + (uint8_t)c) % 255;
        sum2 = (sum2 + sum1) % 255;
    }
    return (sum2 << 8) | sum1;
}

// split a dotted key like probe_points.points into up to three checksums, unused ones are 0
void get_checksums(uint16_t check_sums[], const string &key)
{
    check_sums[0] = 0x0000;
    check_sums[1] = 0x0000;
    check_sums[2] = 0x0000;
    size_t begin_key = 0;
    unsigned int counter = 0;
    while( begin_key < key.size() && counter < 3 ) {
        size_t end_key = key.find_first_of( ".", begin_key );
        string key_node;
        if(end_key == string::npos) {
            key_node = key.substr(begin_key);
        } else {
            key_node = key.substr(begin_key, end_key - begin_key);
        }

        check_sums[counter] = get_checksum(key_node);
        if(end_key == string::npos) break;
        begin_key = end_key + 1;
        counter++;
    }
}

// Convert to lowercase
string lc(const string &str)
{
    string lcstr;
    for (auto c : str) {
        lcstr.append(1, ::tolower((unsigned char)c));
    }
    return lcstr;
}

// Convert to uppercase
string uc(const string &str)
{
    string ucstr;
    for (auto c : str) {
        ucstr.append(1, ::toupper((unsigned char)c));
    }
    return ucstr;
}

// Get the first parameter, and remove it from the original string
string shift_parameter( string &parameters )
{
    ltrim(parameters);
    size_t index = parameters.find_first_of(" \t");
    if( index == string::npos ) {
        string temp = parameters;
        parameters = "";
        return temp;
    }
    string temp = parameters.substr( 0, index );
    parameters = parameters.substr(index);
    ltrim(parameters);
    return temp;
}

// split a string on a delimiter, return a vector of the split tokens
std::vector<string> split(const char *str, char c)
{
    std::vector<string> result;

    do {
        const char *begin = str;

        while(*str != c && *str)
            str++;

        result.push_back(string(begin, str));
    } while (0 != *str++);

    return result;
}

bool parse_float(const string& str, float& f)
{
    string s(str);
    ltrim(s);
    rtrim(s);
    if(s.empty()) return false;

    char *endptr;
    float x = strtof(s.c_str(), &endptr);
    if(endptr == s.c_str() || *endptr != '\0') return false;
    f = x;
    return true;
}

void ltrim(string& s, const char* t)
{
    s.erase(0, s.find_first_not_of(t));
}

void rtrim(string& s, const char* t)
{
    s.erase(s.find_last_not_of(t) + 1);
}
