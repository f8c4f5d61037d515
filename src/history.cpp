#include "parcelkit/history.hpp"

#include "parcelkit/errors.hpp"
#include "parcelkit/logging.hpp"
#include "parcelkit/text.hpp"

#include <openssl/evp.h>

#include <fstream>
#include <memory>
#include <mutex>
#include <utility>

namespace parcelkit {

    namespace {
        struct DigestContextDeleter {
            void operator()(EVP_MD_CTX *ctx) const {
                if (ctx)
                    EVP_MD_CTX_free(ctx);
            }
        };
        using DigestContext = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;
    } // namespace

    std::string fingerprint(std::string_view bytes) {
        DigestContext ctx(EVP_MD_CTX_new());
        if (!ctx)
            throw Error("fingerprint: cannot allocate digest context");

        unsigned char digest[EVP_MAX_MD_SIZE];
        unsigned int length = 0;
        if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
            EVP_DigestUpdate(ctx.get(), bytes.data(), bytes.size()) != 1 ||
            EVP_DigestFinal_ex(ctx.get(), digest, &length) != 1) {
            throw Error("fingerprint: SHA-256 digest failed");
        }

        static constexpr char hex[] = "0123456789abcdef";
        std::string out;
        out.reserve(length * 2);
        for (unsigned int i = 0; i < length; ++i) {
            out += hex[digest[i] >> 4];
            out += hex[digest[i] & 0x0F];
        }
        return out;
    }

    ProcessingHistory::ProcessingHistory(std::filesystem::path file) : file_(std::move(file)) {
        if (!file_.empty())
            load();
    }

    void ProcessingHistory::load() {
        std::ifstream ifs(file_);
        if (!ifs) {
            if (std::filesystem::exists(file_))
                throw HistoryError("cannot open history file \"" + file_.string() + '"');
            return;
        }

        std::unique_lock lock(mutex_);
        std::string line;
        while (std::getline(ifs, line)) {
            auto fp = trim(line);
            if (!fp.empty())
                seen_.emplace(fp);
        }
        logger()->debug("loaded {} fingerprints from {}", seen_.size(), file_.string());
    }

    bool ProcessingHistory::check_and_record(const std::string &fp) {
        if (fp.empty())
            return false;

        {
            std::shared_lock lock(mutex_);
            if (seen_.count(fp) > 0)
                return false;
        }

        std::unique_lock lock(mutex_);
        // another writer may have recorded fp between the two locks
        if (seen_.count(fp) > 0)
            return false;

        if (!file_.empty()) {
            std::ofstream ofs(file_, std::ios::app);
            if (!ofs)
                throw HistoryError("cannot open history file \"" + file_.string() + "\" for writing");
            ofs << fp << "\n";
            if (!ofs)
                throw HistoryError("cannot write history file \"" + file_.string() + '"');
        }

        seen_.insert(fp);
        logger()->debug("recorded fingerprint {}", fp);
        return true;
    }

    bool ProcessingHistory::contains(const std::string &fp) const {
        std::shared_lock lock(mutex_);
        return seen_.count(fp) > 0;
    }

    std::size_t ProcessingHistory::size() const {
        std::shared_lock lock(mutex_);
        return seen_.size();
    }

} // namespace parcelkit
