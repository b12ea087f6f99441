/* The outcome of testing one letter against the word: either the (non-empty) list
   of zero-based positions holding that letter, or no match at all. */

#pragma once
#include <vector>
#include <iostream>
#include "word.hpp"

class GuessResult {
public:
    // letter may be lower case, it is compared upper-cased
    GuessResult(const Word& answer, char letter);

    bool matched() const { return !pos.empty(); }
    const std::vector<int>& positions() const { return pos; }
    char get_letter() const { return letter; }

    bool operator==(const GuessResult& r) const;

    static void test();
private:
    char letter;
    std::vector<int> pos; // ascending
};

// "A@0,3" for a hit, "Z-" for a miss
std::ostream& operator<<(std::ostream& os, const GuessResult& x);
