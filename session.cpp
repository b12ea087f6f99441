#include <sstream>
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <boost/lexical_cast.hpp>
#include "session.hpp"

const int Session::default_attempts = 10;

Session::Session(const Word& word_, const RevealMask& mask_, int attempts, bool penalize_repeats_) :
    word(word_),
    mask(mask_),
    attempts_left(attempts),
    wrong_count(0),
    penalize_repeats(penalize_repeats_),
    state(State::awaiting_guess)
{
    if (attempts < 1) {
        throw std::runtime_error("Session needs at least one attempt, got " + boost::lexical_cast<std::string>(attempts));
    }
    if (mask.length() != word.length()) {
        throw std::runtime_error("Session mask " + mask.str() + " does not fit word " + word.str());
    }
    update_state();
}

bool Session::was_tried(char letter) const {
    return std::find(used_true.begin(), used_true.end(), letter) != used_true.end()
        || std::find(used_false.begin(), used_false.end(), letter) != used_false.end();
}

void Session::update_state() {
    if (mask.is_complete(word)) {
        state = State::won;
    } else if (attempts_left <= 0) {
        state = State::lost;
    }
}

Session::Outcome Session::guess(char letter) {
    if (state != State::awaiting_guess) {
        throw std::runtime_error("Session is over, no more guesses");
    }
    letter = static_cast<char>(std::toupper(static_cast<unsigned char>(letter)));
    if (letter < 'A' || letter > 'Z') {
        throw std::runtime_error(std::string("Not a letter: ") + letter);
    }

    if (!penalize_repeats && was_tried(letter)) {
        return Outcome::already_tried;
    }

    GuessResult r(word, letter);
    Outcome rv;
    if (r.matched()) {
        mask = mask.applied(word, r.positions());
        used_true.push_back(letter);
        rv = Outcome::hit;
    } else {
        attempts_left--;
        wrong_count++;
        used_false.push_back(letter);
        rv = Outcome::miss;
    }

    // win is checked before loss
    update_state();
    return rv;
}

std::ostream& operator<<(std::ostream& os, Session::State s) {
    switch (s) {
    case Session::State::awaiting_guess: return os << "awaiting_guess";
    case Session::State::won:            return os << "won";
    case Session::State::lost:           return os << "lost";
    }
    return os << "?";
}

std::ostream& operator<<(std::ostream& os, Session::Outcome o) {
    switch (o) {
    case Session::Outcome::hit:           return os << "hit";
    case Session::Outcome::miss:          return os << "miss";
    case Session::Outcome::already_tried: return os << "already_tried";
    }
    return os << "?";
}

std::string letters_to_string(const std::vector<char>& letters) {
    std::string s;
    for (char c : letters) {
        s += c;
        s += ' ';
    }
    return s;
}

static std::string describe(const Session& s) {
    std::stringstream ss;
    ss << s.get_mask() << " " << s.get_attempts_left() << " " << s.get_wrong_count() << " " << s.get_state()
       << " [" << letters_to_string(s.get_used_true()) << "|" << letters_to_string(s.get_used_false()) << "]";
    return ss.str();
}

// the APPLE walk-through: a miss in the middle, a win at the end
static void test1() {
    std::stringstream output;
    std::stringstream expected;

    Word w("APPLE");
    Session s(w, RevealMask(w), Session::default_attempts, false);
    output << describe(s) << std::endl;
    expected << "_____ 10 0 awaiting_guess [|]" << std::endl;

    for (char c : std::string("APZLE")) {
        Session::Outcome o = s.guess(c);
        output << c << " " << o << " " << describe(s) << std::endl;
    }
    expected << "A hit A____ 10 0 awaiting_guess [A |]" << std::endl
             << "P hit APP__ 10 0 awaiting_guess [A P |]" << std::endl
             << "Z miss APP__ 9 1 awaiting_guess [A P |Z ]" << std::endl
             << "L hit APPL_ 9 1 awaiting_guess [A P L |Z ]" << std::endl
             << "E hit APPLE 9 1 won [A P L E |Z ]" << std::endl;

    bool threw = false;
    try {
        s.guess('Q');
    } catch (const std::runtime_error&) {
        threw = true;
    }
    output << threw << std::endl;
    expected << 1 << std::endl;

    std::string output_str = output.str();
    std::string expected_str = expected.str();
    if (output_str != expected_str) {
        throw std::runtime_error("Session::test1() failed, got\n" + output_str + ", but expected\n" + expected_str);
    }
}

// losing, repeats under both policies, and a win on the very last attempt
static void test2() {
    std::stringstream output;
    std::stringstream expected;

    Word cat("CAT");
    Session s1(cat, RevealMask(cat), 1, false);
    output << s1.guess('z');
    output << " " << describe(s1) << " " << s1.get_word() << std::endl;
    expected << "miss ___ 0 1 lost [|Z ] CAT" << std::endl;

    Session s2(cat, RevealMask(cat), 3, false);
    for (char c : std::string("XXcC")) output << s2.guess(c);
    output << " " << describe(s2) << std::endl;
    expected << "missalready_triedhitalready_tried C__ 2 1 awaiting_guess [C |X ]" << std::endl;

    Session s3(cat, RevealMask(cat), 3, true);
    for (char c : std::string("XXCC")) output << s3.guess(c);
    output << " " << describe(s3) << std::endl;
    expected << "missmisshithit C__ 1 2 awaiting_guess [C C |X X ]" << std::endl;
    output << s3.guess('X');
    output << " " << describe(s3) << std::endl;
    expected << "miss C__ 0 3 lost [C C |X X X ]" << std::endl;

    // the final reveal wins even with no attempts to spare
    Word ox("OX");
    Session s4(ox, RevealMask(ox).applied(ox, {0}), 1, false);
    output << s4.guess('X');
    output << " " << describe(s4) << std::endl;
    expected << "hit OX 1 0 won [X |]" << std::endl;

    std::string output_str = output.str();
    std::string expected_str = expected.str();
    if (output_str != expected_str) {
        throw std::runtime_error("Session::test2() failed, got\n" + output_str + ", but expected\n" + expected_str);
    }

    int thrown = 0;
    try { Session bad(cat, RevealMask(cat), 0, false); } catch (const std::runtime_error&) { thrown++; }
    try { Session bad(cat, RevealMask(Word("HORSE")), 5, false); } catch (const std::runtime_error&) { thrown++; }
    try { Session s(cat, RevealMask(cat), 5, false); s.guess('3'); } catch (const std::runtime_error&) { thrown++; }
    if (thrown != 3) throw std::runtime_error("Session::test2() bad arguments not rejected");
}

// a session is won exactly when the mask equals the word
static void test3() {
    Rng rng(99);
    Word w("HANGMAN");
    for (int round = 0; round < 50; round++) {
        Session s(w, RevealMask::initial(w, rng), Session::default_attempts, false);
        std::uniform_int_distribution<int> dist('A', 'Z');
        while (s.get_state() == Session::State::awaiting_guess) {
            s.guess(static_cast<char>(dist(rng)));
            bool complete = s.get_mask().is_complete(w);
            if (complete != (s.get_state() == Session::State::won)) {
                throw std::runtime_error("Session::test3() won/complete mismatch: " + describe(s));
            }
            if (s.get_state() == Session::State::lost && s.get_attempts_left() != 0) {
                throw std::runtime_error("Session::test3() lost with attempts left: " + describe(s));
            }
            if (s.get_attempts_left() + s.get_wrong_count() != Session::default_attempts) {
                throw std::runtime_error("Session::test3() attempts out of step: " + describe(s));
            }
        }
    }
}

void Session::test() {
    test1();
    test2();
    test3();
}
