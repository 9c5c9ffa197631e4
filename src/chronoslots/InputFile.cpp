#include "chronoslots/InputFile.hpp"

#include "spdlog/spdlog.h"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace chronoslots {

InputFile::InputFile(std::string path): m_path(path) { }

bool InputFile::read() {
    fs::path filePath(m_path);
    if (!fs::exists(filePath)) {
        SPDLOG_ERROR("File: '{}' not found", m_path);
        return false;
    }

    std::ifstream inFile(filePath, std::ifstream::binary);
    if (!inFile) {
        SPDLOG_ERROR("File: '{}' open error", m_path);
        return false;
    }
    m_contents.resize(fs::file_size(filePath));
    inFile.read(m_contents.data(), m_contents.size());
    if (!inFile) {
        SPDLOG_ERROR("File: '{}' read error", m_path);
        return false;
    }

    SPDLOG_DEBUG("Read {} bytes from '{}'", m_contents.size(), m_path);
    return true;
}

} // namespace chronoslots
