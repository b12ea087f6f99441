#pragma once
#include <string>
#include <boost/filesystem.hpp>

// A fresh name under the system temp directory, so self-tests running side by
// side never share files.
inline std::string unique_tmp_path(const std::string& stem) {
    boost::filesystem::path p = boost::filesystem::temp_directory_path()
        / boost::filesystem::unique_path("hangman-" + stem + "-%%%%-%%%%-%%%%");
    return p.string();
}
