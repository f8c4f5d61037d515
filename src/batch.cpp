#include "parcelkit/batch.hpp"

#include "parcelkit/logging.hpp"
#include "parcelkit/parcelkit.hpp"
#include "parcelkit/text.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <set>
#include <unordered_set>
#include <utility>

namespace parcelkit {

    namespace fs = std::filesystem;

    namespace {
        std::string lower(std::string s) {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        }

        std::unordered_set<std::string> normalize_extensions(const std::vector<std::string> &extensions) {
            std::unordered_set<std::string> out;
            for (auto ext : extensions) {
                ext = std::string(trim(ext));
                if (ext.empty())
                    continue;
                if (ext.front() != '.')
                    ext.insert(ext.begin(), '.');
                out.insert(lower(ext));
            }
            return out;
        }

        bool accepted(const fs::path &file, const std::unordered_set<std::string> &allowed) {
            return allowed.empty() || allowed.count(lower(file.extension().string())) > 0;
        }

        void walk(const fs::path &dir, int depth, int max_depth, const std::unordered_set<std::string> &allowed,
                  std::set<fs::path> &found) {
            for (const auto &entry : fs::directory_iterator(dir)) {
                if (entry.is_directory()) {
                    if (max_depth < 0 || depth < max_depth)
                        walk(entry.path(), depth + 1, max_depth, allowed, found);
                    continue;
                }
                if (entry.is_regular_file() && accepted(entry.path(), allowed))
                    found.insert(entry.path());
            }
        }
    } // namespace

    std::vector<fs::path> collect_files(const std::vector<std::string> &inputs, int max_depth,
                                        const std::vector<std::string> &extensions) {
        auto allowed = normalize_extensions(extensions);
        std::set<fs::path> found;

        for (const auto &input : inputs) {
            auto trimmed = trim(input);
            if (trimmed.empty())
                continue;
            auto path = fs::weakly_canonical(fs::absolute(fs::path(std::string(trimmed))));
            if (!fs::exists(path)) {
                logger()->debug("input {} does not exist, skipped", path.string());
                continue;
            }
            if (fs::is_directory(path)) {
                walk(path, 0, max_depth, allowed, found);
            } else if (accepted(path, allowed)) {
                found.insert(path);
            }
        }

        std::vector<fs::path> files(found.begin(), found.end());
        std::stable_sort(files.begin(), files.end(), [](const fs::path &a, const fs::path &b) {
            return lower(a.string()) < lower(b.string());
        });
        return files;
    }

    BatchPlan plan_batch(const std::vector<fs::path> &files, ProcessingHistory &history, bool force) {
        BatchPlan plan;
        std::unordered_set<std::string> batch;

        for (const auto &file : files) {
            SourceFile source;
            source.path = file;
            try {
                source.content = read_bytes(file);
            } catch (const std::exception &e) {
                logger()->error("{}: {}", file.string(), e.what());
                ++plan.failed;
                continue;
            }
            source.fingerprint = fingerprint(source.content);

            if (!batch.insert(source.fingerprint).second) {
                logger()->info("skipping {}: same content as an earlier input", file.string());
                ++plan.skipped_duplicate;
                continue;
            }
            bool is_new = history.check_and_record(source.fingerprint);
            if (!is_new && !force) {
                logger()->info("skipping {}: already converted", file.string());
                ++plan.skipped_history;
                continue;
            }
            plan.files.push_back(std::move(source));
        }
        return plan;
    }

} // namespace parcelkit
