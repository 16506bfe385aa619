#include "../../include/file_set.hpp"

namespace texharvest {

void FileSet::insert_or_assign(std::string path, Bytes content) {
    if (const auto it = index_.find(path); it != index_.end()) {
        entries_[it->second].second = std::move(content);
        return;
    }
    index_.emplace(path, entries_.size());
    entries_.emplace_back(std::move(path), std::move(content));
}

const Bytes* FileSet::find(const std::string_view path) const {
    const auto it = index_.find(std::string(path));
    if (it == index_.end()) return nullptr;
    return &entries_[it->second].second;
}

size_t FileSet::total_bytes() const noexcept {
    size_t total = 0;
    for (const auto& [path, content] : entries_) {
        total += content.size();
    }
    return total;
}

} // namespace texharvest
