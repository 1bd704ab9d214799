#pragma once

#include <stdint.h>
#include <string>
#include <vector>

std::string lc(const std::string& str);
std::string uc(const std::string& str);

std::vector<std::string> split(const char *str, char c = ',');

// true if the whole string (ignoring surrounding whitespace) is a number, value is returned in f
bool parse_float(const std::string& str, float& f);

uint16_t get_checksum(const std::string& to_check);
uint16_t get_checksum(const char* to_check);

void get_checksums(uint16_t check_sums[], const std::string& key);

std::string shift_parameter( std::string &parameters );

#define confine(value, min, max) (((value) < (min))?(min):(((value) > (max))?(max):(value)))

void ltrim(std::string& s, const char* t = " \t\n\r\f\v");
void rtrim(std::string& s, const char* t = " \t\n\r\f\v");
