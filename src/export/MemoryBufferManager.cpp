/**
 * @file MemoryBufferManager.cpp
 * @brief In-memory output manager
 */

#include "MemoryBufferManager.hpp"
#include "../core/XdiErrors.hpp"

#include <algorithm>

namespace xdi {

std::ostream& MemoryBufferManager::open(const std::string& label, const std::string& name, OpenMode mode) {
    if (name.empty()) {
        throw OutputError("buffer name must not be empty");
    }

    auto existing = buffers_.find(name);
    if (existing != buffers_.end() && mode == OpenMode::EXCLUSIVE_CREATE) {
        throw OutputError("buffer '" + name + "' already exists");
    }

    std::string previous;
    if (existing != buffers_.end() && mode == OpenMode::APPEND) {
        previous = existing->second->str();
    }

    auto buffer = std::make_unique<std::ostringstream>(previous, std::ios::out | std::ios::app);
    std::ostringstream& handle = *buffer;
    buffers_[name] = std::move(buffer);

    auto& group = artifacts_[label];
    if (std::find(group.begin(), group.end(), name) == group.end()) {
        group.push_back(name);
    }
    closed_ = false;
    return handle;
}

void MemoryBufferManager::close() {
    replacements_.clear();
    closed_ = true;
}

std::ostream& MemoryBufferManager::open_replacement(const std::string& id) {
    if (buffers_.count(id) == 0) {
        throw OutputError("no buffer named '" + id + "'");
    }
    auto replacement = std::make_unique<std::ostringstream>();
    std::ostringstream& handle = *replacement;
    replacements_[id] = std::move(replacement);
    return handle;
}

void MemoryBufferManager::commit_replacement(const std::string& id) {
    auto replacement = replacements_.find(id);
    if (replacement == replacements_.end()) {
        throw OutputError("no replacement open for '" + id + "'");
    }
    buffers_[id] = std::move(replacement->second);
    replacements_.erase(replacement);
}

std::string MemoryBufferManager::contents(const std::string& id) const {
    auto it = buffers_.find(id);
    if (it == buffers_.end()) {
        throw OutputError("no buffer named '" + id + "'");
    }
    return it->second->str();
}

} // namespace xdi
