#pragma once
#include <string>
#include <iostream>

namespace Input {
    // trims and upper-cases [line]; true iff what is left is one letter A-Z
    bool parse_letter(const std::string& line, char& out);

    // Prompts on [os] until a valid letter is typed. There is no retry limit,
    // the only way out without a letter is end-of-input, which throws ReadStreamClosed.
    char read_letter(std::istream& is, std::ostream& os);

    // one line with surrounding whitespace removed, false on end-of-input
    bool read_line(std::istream& is, std::string& out);

    void test();
}
