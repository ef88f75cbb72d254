#include "coldstash/transfer_backend.hpp"

#include <optional>

namespace coldstash {

namespace {

// Value of key="..." inside a header; nullopt when the key is absent.
std::optional<std::string> QuotedValue(std::string_view header, std::string_view key) {
    const std::string needle = std::string(key) + "=\"";
    const auto pos = header.find(needle);
    if (pos == std::string_view::npos) return std::nullopt;
    const auto start = pos + needle.size();
    const auto end = header.find('"', start);
    if (end == std::string_view::npos) return std::nullopt;
    return std::string(header.substr(start, end - start));
}

} // namespace

std::string BackendDescriptor::Container() const {
    return kind == LocationKind::RemoteArchive ? remote_archive.path : cold_storage.bucket;
}

std::string RemoteLocator::ToString() const {
    if (container.empty()) return object;
    if (container.back() == '/') return container + object;
    return container + "/" + object;
}

RemoteLocator LocatorFromManifest(const Manifest& m) {
    return RemoteLocator{.container = m.archive_path, .object = m.filename};
}

RestoreStatus ParseRestoreHeader(std::string_view header) {
    RestoreStatus st;
    const auto ongoing = QuotedValue(header, "ongoing-request");
    if (!ongoing) return st;

    if (*ongoing == "true") {
        st.progress = RestoreProgress::Ongoing;
    } else {
        st.progress = RestoreProgress::Completed;
        st.expiry = QuotedValue(header, "expiry-date").value_or(std::string());
    }
    return st;
}

} // namespace coldstash
