#pragma once
#include <string>

namespace codebox::util {

// Host temporary directory, removed with its contents on destruction
class TempDir {
public:
    // Throws std::runtime_error if the directory cannot be created
    explicit TempDir(const std::string& prefix = "codebox-");
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::string& path() const { return path_; }

    // Write `content` to `name` inside the directory, returning the full path
    std::string write_file(const std::string& name, const std::string& content) const;

private:
    std::string path_;
};

} // namespace codebox::util
