/*
 * rangefetch/src/acquisition/archive_extractor.cpp
 *
 * libarchive extraction of verified dataset archives.
 * - Any format/filter libarchive can read (COCO ships zip)
 * - Entry paths are re-rooted under destDir; absolute paths and ".." are refused
 * - The archive is deleted only after every entry was written
 */

#include <rangefetch/acquisition/archive_extractor.h>
#include <rangefetch/acquisition/resource_spec.h>

#include <archive.h>
#include <archive_entry.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace rangefetch::acquisition {

namespace fs = std::filesystem;

namespace {

struct ReadDeleter {
    void operator()(struct archive* a) const noexcept { archive_read_free(a); }
};
struct WriteDeleter {
    void operator()(struct archive* a) const noexcept { archive_write_free(a); }
};

Error archiveError(struct archive* a, std::string_view what) {
    const char* msg = a ? archive_error_string(a) : nullptr;
    return Error{ErrorCode::ExtractionFailed,
                 fmt::format("{}: {}", what, msg ? msg : "unknown libarchive error")};
}

Result<void> copyData(struct archive* in, struct archive* out) {
    const void* buff;
    size_t size;
    la_int64_t offset;
    for (;;) {
        int r = archive_read_data_block(in, &buff, &size, &offset);
        if (r == ARCHIVE_EOF)
            return {};
        if (r < ARCHIVE_WARN)
            return archiveError(in, "read failed");
        if (archive_write_data_block(out, buff, size, offset) < ARCHIVE_WARN)
            return archiveError(out, "write failed");
    }
}

} // namespace

Result<std::size_t> LibArchiveExtractor::extract(const fs::path& archivePath,
                                                 const fs::path& destDir) {
    std::unique_ptr<struct archive, ReadDeleter> a{archive_read_new()};
    std::unique_ptr<struct archive, WriteDeleter> ext{archive_write_disk_new()};
    if (!a || !ext) {
        return Error{ErrorCode::InternalError, "libarchive allocation failed"};
    }

    archive_read_support_format_all(a.get());
    archive_read_support_filter_all(a.get());

    archive_write_disk_set_options(ext.get(), ARCHIVE_EXTRACT_TIME | ARCHIVE_EXTRACT_PERM |
                                                  ARCHIVE_EXTRACT_SECURE_NODOTDOT |
                                                  ARCHIVE_EXTRACT_SECURE_SYMLINKS);
    archive_write_disk_set_standard_lookup(ext.get());

    if (archive_read_open_filename(a.get(), archivePath.string().c_str(), 1 << 20) !=
        ARCHIVE_OK) {
        return archiveError(a.get(), "failed to open archive " + archivePath.string());
    }

    std::error_code ec;
    fs::create_directories(destDir, ec);
    if (ec) {
        return Error{ErrorCode::IoError,
                     "failed to create " + destDir.string() + ": " + ec.message()};
    }

    std::size_t entries = 0;
    struct archive_entry* entry = nullptr;
    for (;;) {
        int r = archive_read_next_header(a.get(), &entry);
        if (r == ARCHIVE_EOF)
            break;
        if (r < ARCHIVE_WARN) {
            return archiveError(a.get(), "corrupt archive " + archivePath.filename().string());
        }

        const char* rawName = archive_entry_pathname(entry);
        if (rawName == nullptr || *rawName == '\0') {
            return Error{ErrorCode::ExtractionFailed,
                         "entry without a path in " + archivePath.filename().string()};
        }
        const fs::path entryName = rawName;
        if (!isContainedRelativePath(entryName)) {
            return Error{ErrorCode::ExtractionFailed,
                         fmt::format("refusing unsafe entry '{}' in {}", entryName.string(),
                                     archivePath.filename().string())};
        }
        // The rewritten name is absolute whenever destDir is; containment was checked above.
        const fs::path target = destDir / entryName;
        archive_entry_set_pathname(entry, target.string().c_str());

        r = archive_write_header(ext.get(), entry);
        if (r < ARCHIVE_WARN) {
            return archiveError(ext.get(), "failed to create " + target.string());
        }
        if (r == ARCHIVE_WARN) {
            spdlog::warn("extract {}: {}", entryName.string(), archive_error_string(ext.get()));
        }
        // Streamed zip entries may not carry their size in the local header.
        if (archive_entry_filetype(entry) == AE_IFREG &&
            (!archive_entry_size_is_set(entry) || archive_entry_size(entry) > 0)) {
            if (auto cr = copyData(a.get(), ext.get()); !cr) {
                return cr.error();
            }
        }
        if (archive_write_finish_entry(ext.get()) < ARCHIVE_WARN) {
            return archiveError(ext.get(), "failed to finish " + target.string());
        }
        ++entries;
    }

    if (archive_write_close(ext.get()) < ARCHIVE_WARN) {
        return archiveError(ext.get(), "failed to finalize extraction");
    }

    a.reset();
    fs::remove(archivePath, ec);
    if (ec) {
        spdlog::warn("extracted {} but could not delete it: {}", archivePath.string(),
                     ec.message());
    }
    spdlog::info("extracted {} entries from {} into {}", entries,
                 archivePath.filename().string(), destDir.string());
    return entries;
}

std::shared_ptr<IArchiveExtractor> makeLibArchiveExtractor() {
    return std::make_shared<LibArchiveExtractor>();
}

} // namespace rangefetch::acquisition
