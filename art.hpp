/* ASCII art. The gallows file is a stack of 7-line frames, frame N is shown after
   N wrong guesses. Banner files (start/win/lose screens) are shown 16 lines at a time. */

#pragma once
#include <string>
#include <vector>
#include <iostream>

namespace Art {
    typedef std::vector<std::string> Lines;

    const int frame_height = 7;
    const int banner_height = 16;

    // throws ResourceUnavailable if the file can't be opened or read
    Lines load_from_file(const std::string& filename);

    // lines [wrong_count * 7, wrong_count * 7 + 7) clamped to the file, so asking
    // for a frame past the end returns a partial or empty slice
    Lines frame(const Lines& lines, int wrong_count);

    // the first 16 lines, throws ResourceTooShort if there are fewer
    Lines banner(const Lines& lines, const std::string& source_name);

    // each line wrapped in [esc] ... reset, or printed bare when esc is empty
    void print(std::ostream& os, const Lines& lines, const std::string& esc);

    void test();
}
