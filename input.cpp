#include <sstream>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>
#include "input.hpp"
#include "errors.hpp"

using std::string;

namespace Input {
    bool parse_letter(const string& line, char& out) {
        string s = boost::algorithm::to_upper_copy(boost::algorithm::trim_copy(line));
        if (s.length() == 1 && s[0] >= 'A' && s[0] <= 'Z') {
            out = s[0];
            return true;
        }
        return false;
    }

    bool read_line(std::istream& is, string& out) {
        if (!std::getline(is, out)) return false;
        boost::algorithm::trim(out);
        return true;
    }

    char read_letter(std::istream& is, std::ostream& os) {
        for (;;) {
            os << "Enter a single letter: " << std::flush;
            string line;
            if (!std::getline(is, line)) {
                throw ReadStreamClosed("Input closed while waiting for a letter");
            }
            char letter;
            if (parse_letter(line, letter)) return letter;
            os << "Invalid input. Please enter a single letter." << std::endl;
        }
    }

    void test() {
        std::stringstream output;
        std::stringstream expected;

        const char* lines[] = { "a", " q \r", "Z", "", "ab", "1", "?", "  ", "e x" };
        for (const char* l : lines) {
            char c = '.';
            bool ok = parse_letter(l, c);
            output << ok << c << " ";
        }
        output << std::endl;
        expected << "1A 1Q 1Z 0. 0. 0. 0. 0. 0. " << std::endl;

        // bad lines are re-prompted for as long as it takes
        std::stringstream in("12\n\nhello\n  k  \nm\n");
        std::stringstream prompts;
        char first = read_letter(in, prompts);
        char second = read_letter(in, prompts);
        output << first << second << std::endl;
        expected << "KM" << std::endl;

        string p = prompts.str();
        size_t invalid = 0;
        for (size_t at = p.find("Invalid input"); at != string::npos; at = p.find("Invalid input", at + 1)) invalid++;
        output << invalid << std::endl;
        expected << 3 << std::endl;

        bool closed = false;
        try {
            read_letter(in, prompts);
        } catch (const ReadStreamClosed&) {
            closed = true;
        }
        output << closed << std::endl;
        expected << 1 << std::endl;

        std::stringstream menu("  99 \n\n");
        string line;
        for (int i = 0; i < 3; i++) {
            bool ok = read_line(menu, line);
            output << ok;
            if (ok) output << "[" << line << "]";
        }
        output << std::endl;
        expected << "1[99]1[]0" << std::endl;

        string output_str = output.str();
        string expected_str = expected.str();
        if (output_str != expected_str) {
            throw std::runtime_error("Input::test() failed, got " + output_str + ", but expected " + expected_str);
        }
    }
}
