#ifndef TEST_OPTIONS_HPP
#define TEST_OPTIONS_HPP
#include <string>

#ifndef LAMINAR_TESTFILE_DIR
#define LAMINAR_TESTFILE_DIR "src/test/inputs/"
#endif

/// Directory path, passed in from the build, for the path to the test inputs dir.
constexpr auto* testfile_dir {LAMINAR_TESTFILE_DIR};

inline std::string testfile(std::string filename) {
    std::string result;
    result.append(testfile_dir);
    result.append(filename);
    return result;
}

#endif // TEST_OPTIONS_HPP
