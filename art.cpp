#include <fstream>
#include <sstream>
#include <cstdio>
#include <algorithm>
#include <boost/lexical_cast.hpp>
#include "art.hpp"
#include "errors.hpp"
#include "tmp_file.hpp"

using std::string;

namespace Art {
    Lines load_from_file(const string& filename) {
        std::ifstream ifs(filename);
        if (!ifs.is_open()) {
            throw ResourceUnavailable("Error opening art file: " + filename);
        }
        Lines lines;
        string line;
        while (std::getline(ifs, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            lines.push_back(line);
        }
        if (ifs.bad()) {
            throw ResourceUnavailable("Error reading art file: " + filename);
        }
        return lines;
    }

    Lines frame(const Lines& lines, int wrong_count) {
        long total = static_cast<long>(lines.size());
        long start = static_cast<long>(wrong_count) * frame_height;
        long end = start + frame_height;
        start = std::min(std::max(start, 0L), total);
        end = std::min(std::max(end, 0L), total);
        if (end <= start) return Lines();
        return Lines(lines.begin() + start, lines.begin() + end);
    }

    Lines banner(const Lines& lines, const string& source_name) {
        if (lines.size() < static_cast<size_t>(banner_height)) {
            throw ResourceTooShort("Banner " + source_name + " has "
                                   + boost::lexical_cast<string>(lines.size()) + " lines, needs "
                                   + boost::lexical_cast<string>(banner_height));
        }
        return Lines(lines.begin(), lines.begin() + banner_height);
    }

    void print(std::ostream& os, const Lines& lines, const string& esc) {
        for (const string& line : lines) {
            if (esc.empty()) {
                os << line << "\n";
            } else {
                os << esc << line << "\033[0m" << "\n";
            }
        }
        os.flush();
    }

    static Lines numbered(int n) {
        Lines lines;
        for (int i = 0; i < n; i++) lines.push_back(boost::lexical_cast<string>(i));
        return lines;
    }

    static string joined(const Lines& lines) {
        std::stringstream ss;
        ss << "[";
        for (size_t i = 0; i < lines.size(); i++) {
            if (i) ss << " ";
            ss << lines[i];
        }
        ss << "]";
        return ss.str();
    }

    static void test1() {
        std::stringstream output;
        std::stringstream expected;

        Lines gallows = numbered(17);
        output << joined(frame(gallows, 0)) << std::endl
               << joined(frame(gallows, 1)) << std::endl
               << joined(frame(gallows, 2)) << std::endl
               << joined(frame(gallows, 3)) << std::endl
               << joined(frame(gallows, 50)) << std::endl
               << joined(frame(gallows, -1)) << std::endl
               << joined(frame(numbered(4), 0)) << std::endl
               << joined(frame(Lines(), 0)) << std::endl;
        expected << "[0 1 2 3 4 5 6]" << std::endl
                 << "[7 8 9 10 11 12 13]" << std::endl
                 << "[14 15 16]" << std::endl
                 << "[]" << std::endl
                 << "[]" << std::endl
                 << "[]" << std::endl
                 << "[0 1 2 3]" << std::endl
                 << "[]" << std::endl;

        output << banner(numbered(20), "twenty").size() << " " << banner(numbered(16), "sixteen").back() << std::endl;
        expected << "16 15" << std::endl;

        std::stringstream printed;
        print(printed, frame(gallows, 2), "");
        print(printed, Lines{ "x" }, "\033[34m");
        output << printed.str();
        expected << "14\n15\n16\n" << "\033[34mx\033[0m\n";

        string output_str = output.str();
        string expected_str = expected.str();
        if (output_str != expected_str) {
            throw std::runtime_error("Art::test1() failed, got\n" + output_str + ", but expected\n" + expected_str);
        }

        bool too_short = false;
        try {
            banner(numbered(15), "fifteen");
        } catch (const ResourceTooShort&) {
            too_short = true;
        }
        if (!too_short) throw std::runtime_error("Art::test1() short banner not reported");
    }

    static void test2() {
        string tmpfile = unique_tmp_path("art");

        bool unavailable = false;
        try {
            load_from_file(tmpfile);
        } catch (const ResourceUnavailable&) {
            unavailable = true;
        }
        if (!unavailable) throw std::runtime_error("Art::test2() missing file not reported");

        {
            std::ofstream ofs(tmpfile);
            ofs << "  +---+\r\n" << "\n" << "  |   |\n";
        }
        Lines lines = load_from_file(tmpfile);
        remove(tmpfile.c_str());
        if (lines.size() != 3 || lines[0] != "  +---+" || !lines[1].empty() || lines[2] != "  |   |") {
            throw std::runtime_error("Art::test2() failed, got " + joined(lines));
        }
    }

    void test() {
        test1();
        test2();
    }
}
