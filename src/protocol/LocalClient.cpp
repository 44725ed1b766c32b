#include "protocol/LocalClient.hpp"
#include "log/Registry.hpp"
#include "util/time.hpp"

#include <fstream>
#include <system_error>

using namespace mg::protocol;
using namespace mg::types;
using namespace mg::concurrency;
namespace fs = std::filesystem;

namespace {

Error fromErrorCode(const std::error_code& ec, const std::string& what) {
    if (ec == std::errc::no_such_file_or_directory) return {ErrorKind::NotFound, what + ": not found", ec.message()};
    if (ec == std::errc::file_exists || ec == std::errc::directory_not_empty)
        return {ErrorKind::AlreadyExists, what + ": already exists", ec.message()};
    return {ErrorKind::Transport, what + " failed", ec.message()};
}

FileInfo infoFor(const ResourcePath& path, const fs::directory_entry& e) {
    std::error_code ec;
    FileInfo info;
    info.path = path.toString();
    info.name = path.filename();
    info.isDirectory = e.is_directory(ec);
    info.size = info.isDirectory ? 0 : e.file_size(ec);
    info.modified = mg::util::toEpochMs(mg::util::toSystemTime(e.last_write_time(ec)));
    return info;
}

}

LocalClient::LocalClient(const size_t bufferSize) : bufferSize_(bufferSize ? bufferSize : config::DEFAULT_BUFFER_SIZE) {}

Result<std::vector<FileInfo>> LocalClient::listFiles(const ResourcePath& dir, const CancelToken& cancel) {
    std::error_code ec;
    if (!fs::is_directory(dir.path, ec)) {
        if (!fs::exists(dir.path, ec)) return Error(ErrorKind::NotFound, "Directory not found: " + dir.path);
        return Error(ErrorKind::InvalidArgument, "Not a directory: " + dir.path);
    }

    std::vector<FileInfo> out;
    for (const auto& e : fs::directory_iterator(dir.path, ec)) {
        if (cancel.isCancelled()) return Cancelled{};
        const auto name = e.path().filename().string();
        if (name.ends_with(kPartialSuffix)) continue;
        out.push_back(infoFor(dir.join(name), e));
    }
    if (ec) return fromErrorCode(ec, "List " + dir.path);

    return out;
}

Result<FileInfo> LocalClient::getMetadata(const ResourcePath& path) {
    std::error_code ec;
    const fs::directory_entry e(path.path, ec);
    if (ec || !e.exists(ec)) return Error(ErrorKind::NotFound, "File not found: " + path.path);
    return infoFor(path, e);
}

Result<uint64_t> LocalClient::download(const ResourcePath& path, std::ostream& out,
                                       const ProgressFn& progress, const CancelToken& cancel) {
    std::error_code ec;
    if (!fs::is_regular_file(path.path, ec)) return Error(ErrorKind::NotFound, "File not found: " + path.path);

    const auto total = static_cast<int64_t>(fs::file_size(path.path, ec));
    std::ifstream in(path.path, std::ios::binary);
    if (!in) return Error(ErrorKind::Transport, "Cannot open " + path.path);

    std::vector<char> buf(bufferSize_);
    uint64_t done = 0;
    while (in) {
        if (cancel.isCancelled()) return Cancelled{};
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        const auto n = in.gcount();
        if (n <= 0) break;
        out.write(buf.data(), n);
        if (!out) return Error(ErrorKind::Transport, "Write failed while reading " + path.path);
        done += static_cast<uint64_t>(n);
        if (progress) progress(done, total);
    }
    if (in.bad()) return Error(ErrorKind::Transport, "Read failed: " + path.path);

    return done;
}

Result<uint64_t> LocalClient::upload(std::istream& in, const int64_t size, const ResourcePath& path, const bool overwrite,
                                     const ProgressFn& progress, const CancelToken& cancel) {
    std::error_code ec;
    if (fs::exists(path.path, ec) && !overwrite) return Error(ErrorKind::AlreadyExists, "Destination exists: " + path.path);

    const fs::path partial = path.path + kPartialSuffix;
    const auto discard = [&] {
        std::error_code rmEc;
        fs::remove(partial, rmEc);
    };

    uint64_t done = 0;
    {
        std::ofstream out(partial, std::ios::binary | std::ios::trunc);
        if (!out) return Error(ErrorKind::Transport, "Cannot create " + partial.string());

        std::vector<char> buf(bufferSize_);
        while (in) {
            if (cancel.isCancelled()) {
                out.close();
                discard();
                return Cancelled{};
            }
            in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
            const auto n = in.gcount();
            if (n <= 0) break;
            out.write(buf.data(), n);
            done += static_cast<uint64_t>(n);
            if (progress) progress(done, size);
        }
        out.close();
        if (!out || in.bad()) {
            discard();
            return Error(ErrorKind::Transport, "Write failed: " + path.path);
        }
    }

    if (size >= 0 && done != static_cast<uint64_t>(size)) {
        discard();
        return Error(ErrorKind::Transport, "Short upload to " + path.path + ": " + std::to_string(done) +
                     " of " + std::to_string(size) + " bytes");
    }

    fs::rename(partial, path.path, ec);
    if (ec) {
        discard();
        return fromErrorCode(ec, "Commit " + path.path);
    }

    return done;
}

VoidResult LocalClient::createFolder(const ResourcePath& path) {
    std::error_code ec;
    if (fs::is_directory(path.path, ec)) return success();
    fs::create_directories(path.path, ec);
    if (ec) return fromErrorCode(ec, "Create folder " + path.path);
    return success();
}

VoidResult LocalClient::remove(const ResourcePath& path) {
    std::error_code ec;
    if (!fs::exists(fs::symlink_status(path.path, ec))) return Error(ErrorKind::NotFound, "Not found: " + path.path);
    fs::remove_all(path.path, ec);
    if (ec) return fromErrorCode(ec, "Delete " + path.path);
    return success();
}

Result<ResourcePath> LocalClient::rename(const ResourcePath& path, const std::string& newName) {
    if (newName.empty() || newName.find('/') != std::string::npos)
        return Error(ErrorKind::InvalidArgument, "Invalid file name: " + newName);

    const auto target = path.withFilename(newName);
    std::error_code ec;
    if (!fs::exists(path.path, ec)) return Error(ErrorKind::NotFound, "Not found: " + path.path);
    if (fs::exists(target.path, ec)) return Error(ErrorKind::AlreadyExists, "Destination exists: " + target.path);

    fs::rename(path.path, target.path, ec);
    if (ec) return fromErrorCode(ec, "Rename " + path.path);
    return target;
}

VoidResult LocalClient::move(const ResourcePath& from, const ResourcePath& to, const bool overwrite) {
    std::error_code ec;
    if (!fs::exists(from.path, ec)) return Error(ErrorKind::NotFound, "Not found: " + from.path);
    if (fs::exists(to.path, ec)) {
        if (!overwrite) return Error(ErrorKind::AlreadyExists, "Destination exists: " + to.path);
        fs::remove_all(to.path, ec);
    }

    fs::rename(from.path, to.path, ec);
    if (ec == std::errc::cross_device_link)
        return Error(ErrorKind::UnsupportedCombination, "Move " + from.path + " crosses filesystems", ec.message());
    if (ec) return fromErrorCode(ec, "Move " + from.path);
    return success();
}

VoidResult LocalClient::copy(const ResourcePath& from, const ResourcePath& to, const bool overwrite) {
    std::error_code ec;
    if (!fs::exists(from.path, ec)) return Error(ErrorKind::NotFound, "Not found: " + from.path);
    if (fs::exists(to.path, ec)) {
        if (!overwrite) return Error(ErrorKind::AlreadyExists, "Destination exists: " + to.path);
        fs::remove_all(to.path, ec);
    }

    if (!fs::is_directory(from.path, ec)) {
        std::ifstream in(from.path, std::ios::binary);
        if (!in) return Error(ErrorKind::Transport, "Cannot open " + from.path);
        const auto size = static_cast<int64_t>(fs::file_size(from.path, ec));
        // staged under .mgpart and renamed, like any upload
        auto written = upload(in, ec ? kUnknownSize : size, to, overwrite, {}, CancelToken::none());
        return written ? success() : written.propagate<Unit>();
    }

    if (auto made = createFolder(to); !made) return made;
    for (const auto& e : fs::directory_iterator(from.path, ec)) {
        const auto name = e.path().filename().string();
        if (name.ends_with(kPartialSuffix)) continue;
        if (auto r = copy(from.join(name), to.join(name), overwrite); !r) return r;
    }
    if (ec) return fromErrorCode(ec, "Copy " + from.path);
    return success();
}

Result<bool> LocalClient::exists(const ResourcePath& path) {
    std::error_code ec;
    const bool found = fs::exists(path.path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) return fromErrorCode(ec, "Stat " + path.path);
    return found;
}
