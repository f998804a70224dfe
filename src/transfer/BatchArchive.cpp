#include "transfer/BatchArchive.hpp"
#include "crypto/base64.hpp"
#include "crypto/hash.hpp"
#include "util/errors.hpp"
#include "util/files.hpp"
#include "logging/LogRegistry.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <sys/stat.h>

#include <filesystem>
#include <fmt/format.h>
#include <memory>
#include <unordered_set>

namespace fs = std::filesystem;
using namespace sm::util;
using namespace sm::logging;

namespace sm::transfer {

namespace {

struct WriterDeleter { void operator()(archive* a) const { archive_write_free(a); } };
struct ReaderDeleter { void operator()(archive* a) const { archive_read_free(a); } };
struct EntryDeleter { void operator()(archive_entry* e) const { archive_entry_free(e); } };

using Writer = std::unique_ptr<archive, WriterDeleter>;
using Reader = std::unique_ptr<archive, ReaderDeleter>;
using Entry = std::unique_ptr<archive_entry, EntryDeleter>;

la_ssize_t appendToString(archive*, void* client, const void* buff, const size_t n) {
    static_cast<std::string*>(client)->append(static_cast<const char*>(buff), n);
    return static_cast<la_ssize_t>(n);
}

std::string errorText(archive* a) {
    const char* err = archive_error_string(a);
    return err ? err : "unknown error";
}

[[noreturn]] void archiveFailure(archive* a, const std::string& what) {
    throw MigrationError(ErrorCode::Internal, fmt::format("{}: {}", what, errorText(a)));
}

}

types::ArchiveBatch BatchArchive::build(const std::vector<std::string>& paths) const {
    std::string out;
    const Writer w(archive_write_new());
    if (!w) throw MigrationError(ErrorCode::Internal, "Failed to allocate archive writer");

    if (archive_write_set_format_zip(w.get()) != ARCHIVE_OK) archiveFailure(w.get(), "Failed to select zip format");
    if (archive_write_open(w.get(), &out, nullptr, appendToString, nullptr) != ARCHIVE_OK)
        archiveFailure(w.get(), "Failed to open archive");

    unsigned int count = 0;
    for (const auto& rel : paths) {
        const auto abs = guard_.resolve(rel);

        std::error_code ec;
        if (!fs::is_regular_file(fs::symlink_status(abs, ec))) {
            LogRegistry::files()->warn("[BatchArchive::build] Skipping {}: not a regular file", rel);
            continue;
        }

        const auto contents = readFileToString(abs);

        const Entry entry(archive_entry_new());
        archive_entry_set_pathname(entry.get(), rel.c_str());
        archive_entry_set_size(entry.get(), static_cast<la_int64_t>(contents.size()));
        archive_entry_set_filetype(entry.get(), AE_IFREG);
        archive_entry_set_perm(entry.get(), 0644);

        struct stat st{};
        if (::stat(abs.c_str(), &st) == 0) archive_entry_set_mtime(entry.get(), st.st_mtime, 0);

        if (archive_write_header(w.get(), entry.get()) < ARCHIVE_WARN) archiveFailure(w.get(), "Failed to add " + rel);
        if (!contents.empty() && archive_write_data(w.get(), contents.data(), contents.size()) < 0)
            archiveFailure(w.get(), "Failed to write " + rel);
        ++count;
    }

    if (archive_write_close(w.get()) != ARCHIVE_OK) archiveFailure(w.get(), "Failed to finish archive");

    types::ArchiveBatch batch;
    batch.md5Checksum = crypto::hash::md5(out);
    batch.size = out.size();
    batch.fileCount = count;
    batch.dataBase64 = crypto::base64::encode(out);

    LogRegistry::files()->debug("[BatchArchive::build] {} of {} files, {} bytes", count, paths.size(), batch.size);
    return batch;
}

ExtractResult BatchArchive::extract(const std::string_view archiveBytes, const std::string_view md5) const {
    if (!crypto::hash::constantTimeEquals(crypto::hash::md5(archiveBytes), md5))
        throw MigrationError(ErrorCode::ChecksumMismatch, "Archive checksum mismatch");

    const Reader r(archive_read_new());
    if (!r) throw MigrationError(ErrorCode::Internal, "Failed to allocate archive reader");
    archive_read_support_format_zip(r.get());

    if (archive_read_open_memory(r.get(), archiveBytes.data(), archiveBytes.size()) != ARCHIVE_OK)
        throw MigrationError(ErrorCode::InvalidRequest, "Unreadable archive", errorText(r.get()));

    ExtractResult result;
    std::unordered_set<std::string> seen;

    archive_entry* entry = nullptr;
    while (true) {
        const int rc = archive_read_next_header(r.get(), &entry);
        if (rc == ARCHIVE_EOF) break;
        if (rc < ARCHIVE_WARN)
            throw MigrationError(ErrorCode::InvalidRequest, "Corrupt archive", errorText(r.get()));

        const char* name = archive_entry_pathname(entry);
        const std::string rel = name ? name : "";

        const auto skip = [&](std::string reason) {
            LogRegistry::files()->warn("[BatchArchive::extract] Skipping '{}': {}", rel, reason);
            result.skipped.push_back({rel, std::move(reason)});
            archive_read_data_skip(r.get());
        };

        if (archive_entry_filetype(entry) != AE_IFREG) { skip("not a regular file"); continue; }
        if (!guard_.allows(rel)) { skip("unsafe path"); continue; }
        if (!seen.insert(rel).second) { skip("duplicate entry"); continue; }

        std::string contents;
        char buf[64 * 1024];
        la_ssize_t n;
        while ((n = archive_read_data(r.get(), buf, sizeof(buf))) > 0)
            contents.append(buf, static_cast<size_t>(n));
        if (n < 0) { skip(fmt::format("read failed: {}", errorText(r.get()))); continue; }

        const auto abs = guard_.resolve(rel);
        try {
            writeFileAtomic(abs, contents);
            fs::permissions(abs, fs::perms::owner_read | fs::perms::owner_write |
                                 fs::perms::group_read | fs::perms::others_read);
        } catch (const std::exception& e) {
            result.skipped.push_back({rel, fmt::format("write failed: {}", e.what())});
            LogRegistry::files()->error("[BatchArchive::extract] Failed to write '{}': {}", rel, e.what());
            continue;
        }

        ++result.extracted;
        result.bytesWritten += contents.size();
        result.extractedPaths.push_back(rel);
    }

    LogRegistry::files()->debug("[BatchArchive::extract] {} extracted, {} skipped, {} bytes",
                                result.extracted, result.skipped.size(), result.bytesWritten);
    return result;
}

}
