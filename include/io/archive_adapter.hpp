#pragma once

#include "io/io.hpp"

#include <archive.h>

#include <string>

namespace coldstash {

struct ArchiveReadDeleter {
    void operator()(archive* a) const {
        if (a) archive_read_free(a);
    }
};

struct ArchiveWriteDeleter {
    void operator()(archive* a) const {
        if (a) archive_write_free(a);
    }
};

// Feeds `reader` into a libarchive read handle. The reader must outlive the
// handle. Reads fail with EINTR once cancellation has been requested.
int OpenArchiveFromReader(struct archive* ar, IReader& reader);
std::string ArchiveErr(struct archive* ar);

} // namespace coldstash
