#include <sstream>
#include <stdexcept>
#include "reveal.hpp"

const char RevealMask::placeholder = '_';

RevealMask::RevealMask(const Word& w) : cells(w.length(), placeholder) {}

RevealMask RevealMask::initial(const Word& w, Rng& rng) {
    int count = w.length() / 2 - 1;
    std::vector<int> positions;
    if (count > 0) {
        std::uniform_int_distribution<int> dist(0, w.length() - 1);
        for (int i = 0; i < count; i++) {
            positions.push_back(dist(rng));
        }
    }
    return RevealMask(w).applied(w, positions);
}

RevealMask RevealMask::applied(const Word& w, const std::vector<int>& positions) const {
    if (w.length() != length()) {
        throw std::runtime_error("RevealMask of length " + std::to_string(length())
                                 + " applied to word " + w.str());
    }
    RevealMask rv(*this);
    for (int p : positions) {
        if (p >= 0 && p < w.length()) rv.cells[p] = w[p];
    }
    return rv;
}

bool RevealMask::is_complete(const Word& w) const {
    return cells == w.str();
}

int RevealMask::count_hidden() const {
    int n = 0;
    for (char c : cells) {
        if (c == placeholder) n++;
    }
    return n;
}

bool RevealMask::operator==(const RevealMask& m) const {
    return cells == m.cells;
}

std::ostream& operator<<(std::ostream& os, const RevealMask& m) {
    return os << m.str();
}

static void test1() {
    std::stringstream output;
    std::stringstream expected;

    Word w("BANANA");
    RevealMask m(w);
    output << m << " " << m.count_hidden() << " " << m.is_complete(w) << std::endl;
    expected << "______ 6 0" << std::endl;

    RevealMask m2 = m.applied(w, {1, 3, 5});
    output << m << " " << m2 << " " << m2.count_hidden() << std::endl;
    expected << "______ _A_A_A 3" << std::endl;

    // out of range positions are ignored, duplicates are harmless
    RevealMask m3 = m2.applied(w, {-1, 6, 100, 0, 0});
    output << m3 << std::endl;
    expected << "BA_A_A" << std::endl;

    RevealMask m4 = m3.applied(w, {2, 4});
    output << m4 << " " << m4.is_complete(w) << " " << m4.is_revealed(2) << std::endl;
    expected << "BANANA 1 1" << std::endl;

    // revealing never hides anything again
    output << (m4.applied(w, {}) == m4) << std::endl;
    expected << 1 << std::endl;

    std::string output_str = output.str();
    std::string expected_str = expected.str();
    if (output_str != expected_str) {
        throw std::runtime_error("RevealMask::test1() failed, got\n" + output_str + ", but expected\n" + expected_str);
    }

    bool threw = false;
    try {
        m.applied(Word("CAT"), {0});
    } catch (const std::runtime_error&) {
        threw = true;
    }
    if (!threw) throw std::runtime_error("RevealMask::test1() length mismatch not detected");
}

static void test2() {
    Rng rng(12345);
    const char* words[] = { "A", "AB", "ABC", "ABCD", "APPLE", "ABCDEFGHIJ", "MISSISSIPPI" };
    for (const char* s : words) {
        Word w(s);
        int requested = w.length() / 2 - 1;
        if (requested < 0) requested = 0;
        for (int round = 0; round < 200; round++) {
            RevealMask m = RevealMask::initial(w, rng);
            int shown = w.length() - m.count_hidden();
            if (m.length() != w.length()) {
                throw std::runtime_error(std::string("RevealMask::test2() wrong length for ") + s);
            }
            // repeated draws may land on the same index, so this is an upper bound
            if (shown > requested) {
                throw std::runtime_error(std::string("RevealMask::test2() revealed too much of ") + s);
            }
            if (requested > 0 && shown == 0) {
                throw std::runtime_error(std::string("RevealMask::test2() revealed nothing of ") + s);
            }
            for (int i = 0; i < w.length(); i++) {
                if (m.is_revealed(i) && m.str()[i] != w[i]) {
                    throw std::runtime_error(std::string("RevealMask::test2() wrong letter in ") + s);
                }
            }
        }
    }
}

void RevealMask::test() {
    test1();
    test2();
}
