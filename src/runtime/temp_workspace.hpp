#pragma once
#include <filesystem>
#include <memory>
#include <string>

namespace runbox::runtime {

// Private per-call directory (0700), removed with everything in it on destruction
class TempWorkspace {
public:
    static std::unique_ptr<TempWorkspace> create(const std::string& prefix, std::string* error_msg);

    ~TempWorkspace();

    TempWorkspace(const TempWorkspace&) = delete;
    TempWorkspace& operator=(const TempWorkspace&) = delete;

    const std::filesystem::path& path() const { return path_; }

    // Writes name inside the workspace (0600). Returns the full path or empty on failure.
    std::filesystem::path write_file(const std::string& name, const std::string& content,
                                     std::string* error_msg);

    // Let a different uid (container user) read the tree: dirs 0755, files 0644
    bool share_read_only(std::string* error_msg);

private:
    explicit TempWorkspace(std::filesystem::path path) : path_(std::move(path)) {}

    std::filesystem::path path_;
};

} // namespace runbox::runtime
