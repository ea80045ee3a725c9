#include "json_io.h"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <thread>

#include <fcntl.h>
#include <unistd.h>

#include <glog/logging.h>

#include "errors.h"
#include "scoped_fd.h"

namespace Shardrun {

namespace fs = std::filesystem;

void WriteFileAtomically(const fs::path& path, const std::string& content) {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            throw PersistenceError("Failed to create directory " + path.parent_path().string() +
                                   ": " + ec.message());
        }
    }

    // Unique per writer: sibling rollouts may replace the same record concurrently.
    fs::path tmp_path = path;
    tmp_path += ".tmp." + std::to_string(::getpid()) + "." +
                std::to_string(std::hash<std::thread::id>{}(std::this_thread::get_id()));

    {
        ScopedFd fd = ScopedFd::Open(tmp_path.string(), O_WRONLY | O_CREAT | O_TRUNC);
        if (!fd.valid()) {
            throw PersistenceError("Failed to open " + tmp_path.string() + ": " + strerror(errno));
        }
        size_t written = 0;
        while (written < content.size()) {
            ssize_t n = ::write(fd.get(), content.data() + written, content.size() - written);
            if (n < 0) {
                if (errno == EINTR) continue;
                throw PersistenceError("Failed to write " + tmp_path.string() + ": " + strerror(errno));
            }
            written += static_cast<size_t>(n);
        }
        if (::fsync(fd.get()) != 0) {
            throw PersistenceError("Failed to fsync " + tmp_path.string() + ": " + strerror(errno));
        }
    }

    fs::rename(tmp_path, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp_path, ignored);
        throw PersistenceError("Failed to rename " + tmp_path.string() + " to " + path.string() +
                               ": " + ec.message());
    }
    VLOG(3) << "Wrote " << content.size() << " bytes to " << path;
}

std::string ToJsonString(const Json::Value& value, const std::string& indent) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = indent;
    // Non-ASCII is \u-escaped and invalid UTF-8 becomes U+FFFD, so output is always ASCII
    return Json::writeString(builder, value);
}

bool ParseJson(const std::string& text, Json::Value& out, std::string* error) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    std::string errs;
    bool ok = reader->parse(text.data(), text.data() + text.size(), &out, &errs);
    if (!ok && error != nullptr) {
        *error = errs;
    }
    return ok;
}

Json::Value ReadJsonFile(const fs::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot open " + path.string() + ": " + strerror(errno));
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    Json::Value root;
    std::string error;
    if (!ParseJson(buffer.str(), root, &error)) {
        throw std::runtime_error("Malformed JSON in " + path.string() + ": " + error);
    }
    return root;
}

} // namespace Shardrun
