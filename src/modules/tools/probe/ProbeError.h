/*
      This file is part of Smoothie (http://smoothieware.org/). The motion control part is heavily based on Grbl (https://github.com/simen/grbl).
      Smoothie is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
      Smoothie is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.
      You should have received a copy of the GNU General Public License along with Smoothie. If not, see <http://www.gnu.org/licenses/>.
*/


#ifndef PROBEERROR_H
#define PROBEERROR_H

#include <string>
using std::string;

// Result of a probe operation, PROBE_OK or what went wrong and why
class ProbeError {
    public:
        enum Code {
            PROBE_OK,
            INVALID_DIRECTION,
            INVALID_CONFIGURATION,
            SESSION_STATE_ERROR,
            NO_CONTACT_TIMEOUT,
            TOLERANCE_EXCEEDED,
            UNHOMED_AXIS
        };

        ProbeError() : code(PROBE_OK) {}
        ProbeError(Code code, const string& message) : code(code), message(message) {}

        static ProbeError ok() { return ProbeError(); }

        bool is_ok() const { return code == PROBE_OK; }
        Code get_code() const { return code; }
        const string& get_message() const { return message; }
        const char *code_name() const;

        // add a remediation hint on a new line
        ProbeError& hint(const string& text);

    private:
        Code code;
        string message;
};

#endif
