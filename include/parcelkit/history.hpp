#pragma once

#include <filesystem>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_set>

namespace parcelkit {

    // Lowercase hex SHA-256 of the raw file content.
    std::string fingerprint(std::string_view bytes);

    // Set of content fingerprints already converted, optionally persisted one per line.
    // Safe to share between worker threads.
    class ProcessingHistory {
      public:
        // An empty path keeps the history in memory only. A missing file is not an error.
        explicit ProcessingHistory(std::filesystem::path file = {});

        // Records fp and returns true when it was not seen before. An empty fingerprint is never recorded.
        // Throws HistoryError when the history file cannot be appended.
        bool check_and_record(const std::string &fp);

        bool contains(const std::string &fp) const;
        std::size_t size() const;
        const std::filesystem::path &file() const noexcept { return file_; }

      private:
        void load();

        std::filesystem::path file_;
        std::unordered_set<std::string> seen_;
        mutable std::shared_mutex mutex_;
    };

} // namespace parcelkit
