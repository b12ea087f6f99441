#include <sstream>
#include <stdexcept>
#include "word.hpp"

bool Word::is_valid(const std::string& r) {
    if (r.empty()) return false;
    for (char c : r) {
        if (!((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'))) return false;
    }
    return true;
}

Word::Word(const std::string& r) {
    if (!is_valid(r)) {
        throw std::runtime_error("Expected a word made of letters A-Z, not: \"" + r + "\"");
    }
    letters.reserve(r.length());
    for (char c : r) {
        if (c >= 'a' && c <= 'z') {
            letters.push_back(c + 'A' - 'a');
        } else {
            letters.push_back(c);
        }
    }
}

bool Word::operator==(const Word& r) const {
    return letters == r.letters;
}

bool Word::operator!=(const Word& r) const {
    return letters != r.letters;
}

bool Word::operator<(const Word& r) const {
    return letters < r.letters;
}

std::ostream& operator<<(std::ostream& os, const Word& x) {
    return os << x.letters;
}

void Word::test() {
    std::stringstream output;
    std::stringstream expected;

    Word x("apPle");
    Word y("APPLE");
    output << x << " " << x.length() << " " << x[0] << x[4] << " " << (x == y) << (x != y) << std::endl;
    expected << "APPLE 5 AE 10" << std::endl;

    output << Word("z") << " " << Word("CAT").length() << " " << (Word("CAT") < Word("DOG")) << std::endl;
    expected << "Z 3 1" << std::endl;

    output << is_valid("") << is_valid("AB C") << is_valid("ab1") << is_valid("x") << is_valid("Hello") << std::endl;
    expected << "00011" << std::endl;

    int thrown = 0;
    for (const char* bad : { "", "two words", "caf\xc3\xa9", "A\r" }) {
        try {
            Word w(bad);
        } catch (const std::runtime_error&) {
            thrown++;
        }
    }
    output << thrown << std::endl;
    expected << 4 << std::endl;

    std::string output_str = output.str();
    std::string expected_str = expected.str();
    if (output_str != expected_str) {
        throw std::runtime_error("Word::test() failed, got " + output_str + ", but expected " + expected_str);
    }
}
