/* The target word of a round. Letters are stored upper-cased, the word is never
   empty and never changes once constructed. */

#pragma once
#include <string>
#include <iostream>

class Word {
public:
    // accepts upper or lower case letters, throws on anything else or on ""
    Word(const std::string& r);

    char operator[](int pos) const { return letters[pos]; }
    int length() const { return static_cast<int>(letters.length()); }
    const std::string& str() const { return letters; }

    bool operator==(const Word& r) const;
    bool operator!=(const Word& r) const;
    bool operator<(const Word& r) const;
    friend std::ostream& operator<<(std::ostream& os, const Word& x);

    // true iff Word(r) would not throw
    static bool is_valid(const std::string& r);

    static void test();
private:
    std::string letters;
};

std::ostream& operator<<(std::ostream& os, const Word& x);
