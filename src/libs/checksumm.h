#ifndef _CHECKSUM_MACRO
#define _CHECKSUM_MACRO

#include <stdint.h>

// Fletcher-16 over a nul terminated string, evaluated at compile time.
// Must give the same answer as get_checksum() in utils.cpp as config keys are hashed at runtime.
constexpr uint16_t fletcher16_sum1(uint16_t sum1, char c)
{
    return (uint16_t)((sum1 + (uint8_t)c) % 255);
}

constexpr uint16_t fletcher16_step(const char *s, uint16_t sum1, uint16_t sum2)
{
    return (*s == '\0')
        ? (uint16_t)((sum2 << 8) | sum1)
        : fletcher16_step(s + 1, fletcher16_sum1(sum1, *s), (uint16_t)((sum2 + fletcher16_sum1(sum1, *s)) % 255));
}

constexpr uint16_t checksum_of(const char *s)
{
    return fletcher16_step(s, 0, 0);
}

#define CHECKSUM(X) (checksum_of(X))

#endif
