#include <pvfworker/core/utils.hpp>
#include <algorithm>
#include <numeric>
#include <cstring>
#include <sstream>
#include <iomanip>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <dirent.h>
#include <fcntl.h>
#include <errno.h>
#include <openssl/sha.h>

namespace pvfworker {

// ============ String utilities ============

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\n\r");
    return s.substr(start, end - start + 1);
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() &&
           std::equal(prefix.begin(), prefix.end(), s.begin());
}

std::vector<std::string> split(const std::string& s, char delimiter) {
    std::vector<std::string> parts;
    std::istringstream iss(s);
    std::string part;
    while (std::getline(iss, part, delimiter)) {
        parts.push_back(part);
    }
    return parts;
}

std::vector<std::string> split_whitespace(const std::string& s) {
    std::vector<std::string> parts;
    size_t pos = 0;
    while (pos < s.size()) {
        size_t start = s.find_first_not_of(" \t\r\n", pos);
        if (start == std::string::npos) break;
        size_t end = s.find_first_of(" \t\r\n", start);
        if (end == std::string::npos) end = s.size();
        parts.push_back(s.substr(start, end - start));
        pos = end;
    }
    return parts;
}

std::string join(const std::vector<std::string>& parts, const std::string& delimiter) {
    if (parts.empty()) return "";
    return std::accumulate(
        std::next(parts.begin()), parts.end(), parts[0],
        [&](const std::string& a, const std::string& b) {
            return a + delimiter + b;
        });
}

std::string errno_string(int err) {
    char buf[256];
    // GNU strerror_r may return a static string instead of filling buf
    const char* msg = strerror_r(err, buf, sizeof(buf));
    return std::string(msg ? msg : "unknown error");
}

// ============ Path utilities ============

std::string join_path(const std::string& a, const std::string& b) {
    if (a.empty()) return b;
    if (b.empty()) return a;

    bool a_ends_slash = a.back() == '/';
    bool b_starts_slash = b[0] == '/';

    if (a_ends_slash && b_starts_slash) {
        return a + b.substr(1);
    }
    if (!a_ends_slash && !b_starts_slash) {
        return a + "/" + b;
    }
    return a + b;
}

bool write_file(const std::string& path, const std::vector<uint8_t>& data, std::string& error) {
    int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        error = "cannot open " + path + ": " + errno_string(errno);
        return false;
    }

    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            error = "cannot write " + path + ": " + errno_string(errno);
            close(fd);
            return false;
        }
        written += static_cast<size_t>(n);
    }

    if (close(fd) != 0) {
        error = "cannot close " + path + ": " + errno_string(errno);
        return false;
    }
    return true;
}

bool remove_tree(const std::string& path) {
    struct stat st;
    if (lstat(path.c_str(), &st) != 0) {
        return errno == ENOENT;
    }
    if (S_ISDIR(st.st_mode)) {
        DIR* dir = opendir(path.c_str());
        if (!dir) return false;
        bool ok = true;
        struct dirent* entry;
        while ((entry = readdir(dir)) != nullptr) {
            if (strcmp(entry->d_name, ".") == 0 || strcmp(entry->d_name, "..") == 0) {
                continue;
            }
            ok = remove_tree(join_path(path, entry->d_name)) && ok;
        }
        closedir(dir);
        return rmdir(path.c_str()) == 0 && ok;
    }
    return unlink(path.c_str()) == 0;
}

// ============ Hashing utilities ============

std::string sha256_hex(const std::vector<uint8_t>& data) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    SHA256(data.data(), data.size(), digest);

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
        oss << std::setw(2) << static_cast<int>(digest[i]);
    }
    return oss.str();
}

} // namespace pvfworker
