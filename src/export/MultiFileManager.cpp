/**
 * @file MultiFileManager.cpp
 * @brief File-per-artifact output manager
 */

#include "MultiFileManager.hpp"
#include "../core/XdiErrors.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

namespace xdi {

namespace {

// Atomically create an empty file, failing if one is already there
void create_exclusive(const std::filesystem::path& path) {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0644);
    if (fd < 0) {
        int err = errno;
        throw OutputError("cannot create " + path.string() + ": " + std::strerror(err));
    }
    ::close(fd);
}

} // namespace

MultiFileManager::MultiFileManager(const std::filesystem::path& directory)
    : directory_(directory), logger_("MultiFileManager") {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        throw OutputError("cannot create output directory " + directory_.string() + ": " + ec.message());
    }
}

MultiFileManager::~MultiFileManager() {
    try {
        close();
    } catch (const OutputError& e) {
        logger_.error(e.what());
    }
}

std::ostream& MultiFileManager::open(const std::string& label, const std::string& name, OpenMode mode) {
    std::filesystem::path relative(name);
    if (name.empty() || relative.is_absolute()) {
        throw OutputError("resource name must be a non-empty relative path: '" + name + "'");
    }

    std::filesystem::path path = directory_ / relative;
    std::string id = path.string();
    if (open_files_.count(id) != 0) {
        throw OutputError(id + " is already open");
    }

    if (mode == OpenMode::EXCLUSIVE_CREATE) {
        create_exclusive(path);
    }

    std::ios::openmode flags = std::ios::out | std::ios::binary;
    flags |= (mode == OpenMode::APPEND) ? std::ios::app : std::ios::trunc;

    auto stream = std::make_unique<std::ofstream>(path, flags);
    if (!stream->is_open()) {
        throw OutputError("cannot open " + id + " for writing");
    }

    std::ofstream& handle = *stream;
    open_files_[id] = std::move(stream);

    auto& group = artifacts_[label];
    if (std::find(group.begin(), group.end(), id) == group.end()) {
        group.push_back(id);
    }

    logger_.detailed("Opened " + id + " under label '" + label + "'");
    return handle;
}

void MultiFileManager::close() {
    std::string failures;
    for (auto& [path, stream] : replacements_) {
        stream->close();
        std::error_code ec;
        std::filesystem::remove(replacement_path(path), ec);
    }
    replacements_.clear();

    for (auto& [path, stream] : open_files_) {
        try {
            close_stream(*stream, path);
        } catch (const OutputError& e) {
            failures += (failures.empty() ? "" : "; ") + e.detail();
        }
    }
    open_files_.clear();

    if (!failures.empty()) {
        throw OutputError(failures);
    }
}

std::string MultiFileManager::read_artifact(const std::string& id) {
    auto open_it = open_files_.find(id);
    if (open_it != open_files_.end()) {
        open_it->second->flush();
    }

    std::ifstream file(id, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        throw OutputError("cannot read " + id);
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    return contents.str();
}

std::ostream& MultiFileManager::open_replacement(const std::string& id) {
    if (!is_artifact(id)) {
        throw OutputError("not an artifact of this manager: " + id);
    }

    std::filesystem::path temp = replacement_path(id);
    logger_.debug("Creating " + temp.string());

    auto stream = std::make_unique<std::ofstream>(temp, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!stream->is_open()) {
        throw OutputError("cannot create " + temp.string());
    }

    std::ofstream& handle = *stream;
    replacements_[id] = std::move(stream);
    return handle;
}

void MultiFileManager::commit_replacement(const std::string& id) {
    auto replacement = replacements_.find(id);
    if (replacement == replacements_.end()) {
        throw OutputError("no replacement open for " + id);
    }

    std::filesystem::path temp = replacement_path(id);
    std::unique_ptr<std::ofstream> stream = std::move(replacement->second);
    replacements_.erase(replacement);
    close_stream(*stream, temp.string());

    auto original = open_files_.find(id);
    if (original != open_files_.end()) {
        std::unique_ptr<std::ofstream> handle = std::move(original->second);
        open_files_.erase(original);
        close_stream(*handle, id);
    }

    std::error_code ec;
    std::filesystem::rename(temp, id, ec);
    if (ec) {
        throw OutputError("cannot replace " + id + " with " + temp.string() + ": " + ec.message());
    }
    logger_.detailed("Finished " + id);
}

std::filesystem::path MultiFileManager::replacement_path(const std::string& id) {
    std::filesystem::path temp(id);
    temp.replace_extension(".updating");
    return temp;
}

bool MultiFileManager::is_artifact(const std::string& id) const {
    for (const auto& [label, ids] : artifacts_) {
        if (std::find(ids.begin(), ids.end(), id) != ids.end()) {
            return true;
        }
    }
    return false;
}

void MultiFileManager::close_stream(std::ofstream& stream, const std::string& path) {
    stream.flush();
    bool failed = stream.fail();
    stream.close();
    if (failed || stream.fail()) {
        throw OutputError("write to " + path + " failed");
    }
}

} // namespace xdi
