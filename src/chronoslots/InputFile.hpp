#ifndef SRC_CHRONOSLOTS_INPUT_FILE_HPP_
#define SRC_CHRONOSLOTS_INPUT_FILE_HPP_

#include <string>
#include <string_view>

namespace chronoslots {

// Reads a whole schedule file into memory.
class InputFile {
public:
    InputFile() = delete;
    InputFile(std::string path);
    ~InputFile() = default;

    bool read();

    const std::string& path() const { return m_path; }
    std::string_view contents() const { return std::string_view(m_contents); }

private:
    std::string m_path;
    std::string m_contents;
};

} // namespace chronoslots

#endif // SRC_CHRONOSLOTS_INPUT_FILE_HPP_
