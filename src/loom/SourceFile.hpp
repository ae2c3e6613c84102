#ifndef SRC_LOOM_SOURCE_FILE_HPP_
#define SRC_LOOM_SOURCE_FILE_HPP_

#include <memory>
#include <string>
#include <string_view>

namespace loom {

class ErrorReporter;

// A JSON input file, either a class manifest or a payload to instantiate. The contents stay valid for the lifetime of
// this object.
class SourceFile {
public:
    SourceFile() = delete;
    SourceFile(std::string path, std::shared_ptr<ErrorReporter> errorReporter);
    ~SourceFile() = default;

    bool read();

    const std::string& path() const { return m_path; }
    std::string_view contents() const { return m_contents; }

private:
    std::string m_path;
    std::shared_ptr<ErrorReporter> m_errorReporter;
    std::string m_contents;
};

} // namespace loom

#endif // SRC_LOOM_SOURCE_FILE_HPP_
