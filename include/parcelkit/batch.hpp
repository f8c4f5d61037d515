#pragma once

#include "parcelkit/history.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace parcelkit {

    // Unlimited directory recursion for collect_files.
    inline constexpr int UNLIMITED_DEPTH = -1;

    // Files named by inputs. Directories are walked up to max_depth levels below the directory itself
    // (0 = its own files only, UNLIMITED_DEPTH = no limit). Only files whose extension matches one of
    // extensions (case-insensitive, leading dot optional) are kept; an empty list keeps everything.
    // Missing paths are skipped. The result is absolute, free of duplicates and sorted case-insensitively.
    std::vector<std::filesystem::path> collect_files(const std::vector<std::string> &inputs, int max_depth,
                                                     const std::vector<std::string> &extensions = {".txt"});

    struct SourceFile {
        std::filesystem::path path;
        std::string content;
        std::string fingerprint;
    };

    struct BatchPlan {
        std::vector<SourceFile> files;
        std::size_t skipped_history = 0;
        std::size_t skipped_duplicate = 0;
        std::size_t failed = 0;
    };

    // Reads every file and keeps those still to be converted. A file whose content repeats an earlier file of
    // the same batch is always skipped. Otherwise its fingerprint is recorded in history, and a file already
    // there is skipped unless force is set. Unreadable files are logged and counted as failed.
    BatchPlan plan_batch(const std::vector<std::filesystem::path> &files, ProcessingHistory &history, bool force);

} // namespace parcelkit
