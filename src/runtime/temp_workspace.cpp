#include "runtime/temp_workspace.hpp"
#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

namespace runbox::runtime {

std::unique_ptr<TempWorkspace> TempWorkspace::create(const std::string& prefix, std::string* error_msg) {
    std::error_code ec;
    fs::path base = fs::temp_directory_path(ec);
    if (ec) {
        base = "/tmp";
    }

    std::string tmpl = (base / (prefix + "-XXXXXX")).string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    // mkdtemp creates the directory with mode 0700
    if (mkdtemp(buf.data()) == nullptr) {
        if (error_msg) *error_msg = std::string("mkdtemp failed: ") + strerror(errno);
        return nullptr;
    }

    return std::unique_ptr<TempWorkspace>(new TempWorkspace(fs::path(buf.data())));
}

TempWorkspace::~TempWorkspace() {
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        spdlog::warn("Failed to remove workspace {}: {}", path_.string(), ec.message());
    }
}

fs::path TempWorkspace::write_file(const std::string& name, const std::string& content,
                                   std::string* error_msg) {
    fs::path file = path_ / name;

    int fd = open(file.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
    if (fd < 0) {
        if (error_msg) *error_msg = "cannot create " + file.string() + ": " + strerror(errno);
        return {};
    }

    size_t written = 0;
    while (written < content.size()) {
        ssize_t n = write(fd, content.data() + written, content.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (error_msg) *error_msg = "cannot write " + file.string() + ": " + strerror(errno);
            close(fd);
            return {};
        }
        written += static_cast<size_t>(n);
    }

    if (close(fd) < 0) {
        if (error_msg) *error_msg = "cannot close " + file.string() + ": " + strerror(errno);
        return {};
    }
    return file;
}

bool TempWorkspace::share_read_only(std::string* error_msg) {
    std::error_code ec;
    fs::permissions(path_, fs::perms(0755), fs::perm_options::replace, ec);
    if (ec) {
        if (error_msg) *error_msg = "chmod " + path_.string() + ": " + ec.message();
        return false;
    }

    for (auto it = fs::recursive_directory_iterator(path_, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        fs::perms mode = it->is_directory(ec) ? fs::perms(0755) : fs::perms(0644);
        fs::permissions(it->path(), mode, fs::perm_options::replace, ec);
    }
    if (ec) {
        if (error_msg) *error_msg = "chmod inside " + path_.string() + ": " + ec.message();
        return false;
    }
    return true;
}

} // namespace runbox::runtime
