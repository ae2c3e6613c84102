#include "loom/SourceFile.hpp"

#include "loom/ErrorReporter.hpp"
#include "loom/internal/FileSystem.hpp"

#include "spdlog/spdlog.h"

#include <fstream>

namespace loom {

SourceFile::SourceFile(std::string path, std::shared_ptr<ErrorReporter> errorReporter):
    m_path(std::move(path)), m_errorReporter(std::move(errorReporter)) {}

bool SourceFile::read() {
    fs::path filePath(m_path);
    std::error_code ec;
    if (!fs::exists(filePath, ec)) {
        m_errorReporter->addFileNotFoundError(m_path);
        return false;
    }

    auto fileSize = fs::file_size(filePath, ec);
    if (ec) {
        m_errorReporter->addFileReadError(m_path);
        return false;
    }

    std::ifstream inFile(filePath, std::ifstream::binary);
    if (!inFile) {
        m_errorReporter->addFileReadError(m_path);
        return false;
    }
    m_contents.resize(fileSize);
    inFile.read(m_contents.data(), static_cast<std::streamsize>(fileSize));
    if (!inFile) {
        m_errorReporter->addFileReadError(m_path);
        return false;
    }

    SPDLOG_DEBUG("Read {} bytes from '{}'", fileSize, m_path);
    return true;
}

} // namespace loom
