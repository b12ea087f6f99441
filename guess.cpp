#include <sstream>
#include <cctype>
#include <stdexcept>
#include "guess.hpp"

GuessResult::GuessResult(const Word& answer, char letter_)
    : letter(static_cast<char>(std::toupper(static_cast<unsigned char>(letter_))))
{
    for (int i = 0; i < answer.length(); i++) {
        if (answer[i] == letter) pos.push_back(i);
    }
}

bool GuessResult::operator==(const GuessResult& r) const {
    return letter == r.letter && pos == r.pos;
}

std::ostream& operator<<(std::ostream& os, const GuessResult& x) {
    os << x.get_letter();
    if (!x.matched()) return os << "-";
    os << "@";
    for (size_t i = 0; i < x.positions().size(); i++) {
        if (i) os << ",";
        os << x.positions()[i];
    }
    return os;
}

void GuessResult::test() {
    std::stringstream output;
    std::stringstream expected;

    output << GuessResult(Word("APPLE"), 'A') << " "
           << GuessResult(Word("APPLE"), 'P') << " "
           << GuessResult(Word("APPLE"), 'p') << " "
           << GuessResult(Word("APPLE"), 'Z') << " "
           << GuessResult(Word("BANANA"), 'A') << " "
           << GuessResult(Word("MISSISSIPPI"), 's') << " "
           << GuessResult(Word("x"), 'X') << std::endl;
    expected << "A@0 P@1,2 P@1,2 Z- A@1,3,5 S@2,3,5,6 X@0" << std::endl;

    output << (GuessResult(Word("apple"), 'p') == GuessResult(Word("APPLE"), 'P'))
           << (GuessResult(Word("APPLE"), 'P') == GuessResult(Word("APPLY"), 'P'))
           << (GuessResult(Word("APPLE"), 'Q') == GuessResult(Word("APPLE"), 'Z')) << std::endl;
    expected << "110" << std::endl;

    // every position returned holds the letter, every position not returned does not
    Word w("HANGMAN");
    for (char c = 'A'; c <= 'Z'; c++) {
        GuessResult r(w, c);
        size_t next = 0;
        for (int i = 0; i < w.length(); i++) {
            bool listed = next < r.positions().size() && r.positions()[next] == i;
            if (listed) next++;
            if (listed != (w[i] == c)) {
                throw std::runtime_error(std::string("GuessResult::test() 2 failed for letter ") + c);
            }
        }
        if (r.matched() == r.positions().empty()) {
            throw std::runtime_error(std::string("GuessResult::test() 3 failed for letter ") + c);
        }
    }

    std::string output_str = output.str();
    std::string expected_str = expected.str();
    if (output_str != expected_str) {
        throw std::runtime_error("GuessResult::test() 1 failed, got " + output_str + ", but expected " + expected_str);
    }
}
