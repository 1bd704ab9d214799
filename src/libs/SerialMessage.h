#ifndef SERIALMESSAGE_H
#define SERIALMESSAGE_H

#include <string>

class StreamOutput;

// one line of console input, passed with ON_CONSOLE_LINE_RECEIVED
// replies for the line go to stream
struct SerialMessage {
        SerialMessage(StreamOutput* stream, const std::string& message, unsigned int line= 0)
            : stream(stream), message(message), line(line) {}

        StreamOutput* stream;
        std::string message;
        unsigned int line;
};
#endif
