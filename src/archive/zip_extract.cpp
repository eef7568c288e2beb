#include "relfetch/archive.hpp"
#include "relfetch/platform.hpp"

#include <memory>

#include <archive.h>
#include <archive_entry.h>

namespace relfetch {

namespace {

// ============================================================================
// libarchive handles
// ============================================================================

struct ArchiveReadDeleter {
    void operator()(struct archive* a) const {
        if (a) {
            archive_read_close(a);
            archive_read_free(a);
        }
    }
};

struct ArchiveWriteDeleter {
    void operator()(struct archive* a) const {
        if (a) {
            archive_write_close(a);
            archive_write_free(a);
        }
    }
};

using ArchiveReadHandle = std::unique_ptr<struct archive, ArchiveReadDeleter>;
using ArchiveWriteHandle = std::unique_ptr<struct archive, ArchiveWriteDeleter>;

std::string archive_message(struct archive* a) {
    const char* message = archive_error_string(a);
    return message ? message : "unknown error";
}

UnpackResult zip_error(ErrorKind kind, const std::string& message) {
    UnpackResult result;
    result.kind = kind;
    result.error = message;
    return result;
}

// Streams the current entry to disk. Read warnings (a CRC mismatch is
// reported as one) are fatal.
UnpackResult copy_entry_data(struct archive* reader, struct archive* writer,
                             const std::string& name) {
    const void* buff;
    size_t size;
    la_int64_t offset;

    for (;;) {
        int r = archive_read_data_block(reader, &buff, &size, &offset);
        if (r == ARCHIVE_EOF) break;
        if (r != ARCHIVE_OK) {
            return zip_error(ErrorKind::Archive,
                             "failed to read zip entry " + name + ": " + archive_message(reader));
        }
        if (archive_write_data_block(writer, buff, size, offset) < ARCHIVE_OK) {
            return zip_error(ErrorKind::Filesystem,
                             "failed to write entry " + name + ": " + archive_message(writer));
        }
    }

    UnpackResult ok;
    ok.ok = true;
    return ok;
}

} // namespace

UnpackResult extract_zip(const std::string& archive_path, const std::string& dest_dir) {
    UnpackResult result;

    if (!is_regular_file(archive_path)) {
        return zip_error(ErrorKind::Filesystem, "failed to open archive: " + archive_path);
    }

    if (!create_directories(dest_dir)) {
        return zip_error(ErrorKind::Filesystem, "failed to create directory: " + dest_dir);
    }

    ArchiveReadHandle reader(archive_read_new());
    ArchiveWriteHandle writer(archive_write_disk_new());
    if (!reader || !writer) {
        return zip_error(ErrorKind::Archive, "failed to initialize libarchive");
    }

    archive_read_support_format_zip(reader.get());

    // Entries never write through symlinks or climb out with ".."
    archive_write_disk_set_options(writer.get(),
                                   ARCHIVE_EXTRACT_PERM |
                                   ARCHIVE_EXTRACT_SECURE_SYMLINKS |
                                   ARCHIVE_EXTRACT_SECURE_NODOTDOT);
    archive_write_disk_set_standard_lookup(writer.get());

    if (archive_read_open_filename(reader.get(), archive_path.c_str(), 10240) != ARCHIVE_OK) {
        return zip_error(ErrorKind::Archive,
                         "failed to read zip archive: " + archive_message(reader.get()));
    }

    struct archive_entry* entry;
    for (;;) {
        int r = archive_read_next_header(reader.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r < ARCHIVE_WARN) {
            return zip_error(ErrorKind::Archive,
                             "failed to read zip archive: " + archive_message(reader.get()));
        }

        const char* pathname = archive_entry_pathname(entry);
        std::string name = pathname ? pathname : "";

        auto validation = validate_extraction_path(name, dest_dir);
        if (!validation.safe) {
            return zip_error(ErrorKind::Archive, validation.error);
        }
        std::string full_path = join_path(dest_dir, validation.normalized_path);
        archive_entry_set_pathname(entry, full_path.c_str());

        if (archive_write_header(writer.get(), entry) < ARCHIVE_OK) {
            return zip_error(ErrorKind::Filesystem,
                             "failed to create " + full_path + ": " + archive_message(writer.get()));
        }

        auto copied = copy_entry_data(reader.get(), writer.get(), name);
        if (!copied.ok) {
            return copied;
        }

        if (archive_write_finish_entry(writer.get()) < ARCHIVE_OK) {
            return zip_error(ErrorKind::Filesystem,
                             "failed to finish " + full_path + ": " + archive_message(writer.get()));
        }

        result.entries.push_back(validation.normalized_path);
    }

    result.ok = true;
    return result;
}

} // namespace relfetch
