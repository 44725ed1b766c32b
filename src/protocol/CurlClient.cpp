#include "protocol/CurlClient.hpp"
#include "util/curlWrappers.hpp"
#include "log/Registry.hpp"
#include "util/time.hpp"

#include <array>
#include <cctype>
#include <ctime>
#include <sstream>
#include <fmt/format.h>

using namespace mg::protocol;
using namespace mg::types;
using namespace mg::concurrency;
using namespace mg::util;

namespace {

struct TransferCtx {
    std::ostream* out = nullptr;
    std::istream* in = nullptr;
    const ProgressFn* progress = nullptr;
    const CancelToken* cancel = nullptr;
    int64_t total = kUnknownSize;
    uint64_t done = 0;
    bool streamFailed = false;
};

size_t writeToStream(char* ptr, const size_t size, const size_t nmemb, void* ud) {
    auto* ctx = static_cast<TransferCtx*>(ud);
    const auto n = size * nmemb;
    if (ctx->cancel->isCancelled()) return 0;
    ctx->out->write(ptr, static_cast<std::streamsize>(n));
    if (!*ctx->out) {
        ctx->streamFailed = true;
        return 0;
    }
    ctx->done += n;
    if (*ctx->progress) (*ctx->progress)(ctx->done, ctx->total);
    return n;
}

size_t readFromStream(char* buffer, const size_t size, const size_t nitems, void* ud) {
    auto* ctx = static_cast<TransferCtx*>(ud);
    if (ctx->cancel->isCancelled()) return CURL_READFUNC_ABORT;
    ctx->in->read(buffer, static_cast<std::streamsize>(size * nitems));
    if (ctx->in->bad()) {
        ctx->streamFailed = true;
        return CURL_READFUNC_ABORT;
    }
    const auto n = static_cast<size_t>(ctx->in->gcount());
    ctx->done += n;
    if (*ctx->progress) (*ctx->progress)(ctx->done, ctx->total);
    return n;
}

int abortOnCancel(void* ud, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    return static_cast<const CancelToken*>(ud)->isCancelled() ? 1 : 0;
}

Error fromCurl(const CURLcode rc, const std::string& what, const std::string& serverResponse = {}) {
    const std::string detail = curl_easy_strerror(rc);
    switch (rc) {
        case CURLE_LOGIN_DENIED:
            return {ErrorKind::NotAuthenticated, what + ": login denied", detail};
        case CURLE_REMOTE_FILE_NOT_FOUND:
            return {ErrorKind::NotFound, what + ": not found", detail};
        case CURLE_OPERATION_TIMEDOUT:
            return {ErrorKind::Transport, what + ": operation timed out", detail};
        case CURLE_QUOTE_ERROR:
            return {ErrorKind::Transport, what + ": server rejected command", serverResponse.empty() ? detail : serverResponse};
        default:
            return {ErrorKind::Transport, what + " failed", serverResponse.empty() ? detail : detail + ": " + serverResponse};
    }
}

std::string lastResponseLine(const std::string& hdr) {
    std::istringstream in(hdr);
    std::string line, last;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!line.empty()) last = line;
    }
    return last;
}

void applyCommon(CURL* h, const std::string& url, const mg::credentials::NetworkCredentials& creds,
                 const Protocol protocol, const std::chrono::seconds lowSpeedTimeout) {
    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_USERNAME, creds.username.c_str());
    curl_easy_setopt(h, CURLOPT_PASSWORD, creds.password.c_str());
    curl_easy_setopt(h, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(h, CURLOPT_LOW_SPEED_TIME, static_cast<long>(lowSpeedTimeout.count()));

    if (protocol == Protocol::SFTP) {
        long authTypes = CURLSSH_AUTH_PASSWORD | CURLSSH_AUTH_KEYBOARD;
        if (!creds.privateKey.empty()) {
            curl_easy_setopt(h, CURLOPT_SSH_PRIVATE_KEYFILE, creds.privateKey.c_str());
            curl_easy_setopt(h, CURLOPT_KEYPASSWD, creds.password.c_str());
            authTypes |= CURLSSH_AUTH_PUBLICKEY;
        }
        curl_easy_setopt(h, CURLOPT_SSH_AUTH_TYPES, authTypes);
    } else {
        curl_easy_setopt(h, CURLOPT_FTP_USE_EPSV, 1L);
    }
}

// FTP paths are relative to the login directory, SFTP paths are absolute on the server.
std::string serverPath(const Protocol protocol, const std::string& inner) {
    if (protocol == Protocol::FTP) return inner == "/" ? "." : inner.substr(1);
    return inner;
}

std::string quoteArg(const std::string& s) {
    std::string out = "\"";
    for (const char c : s) {
        if (c == '"' || c == '\\') out.push_back('\\');
        out.push_back(c);
    }
    return out + "\"";
}

int monthIndex(const std::string& m) {
    static constexpr std::array<const char*, 12> names{"jan", "feb", "mar", "apr", "may", "jun",
                                                       "jul", "aug", "sep", "oct", "nov", "dec"};
    std::string lower = m;
    for (auto& c : lower) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    for (size_t i = 0; i < names.size(); ++i)
        if (lower == names[i]) return static_cast<int>(i);
    return -1;
}

}

CurlClient::CurlClient(const Protocol protocol, std::shared_ptr<const credentials::Resolver> resolver,
                       const size_t bufferSize, const std::chrono::seconds lowSpeedTimeout)
    : protocol_(protocol), resolver_(std::move(resolver)),
      bufferSize_(bufferSize ? bufferSize : config::DEFAULT_BUFFER_SIZE), lowSpeedTimeout_(lowSpeedTimeout) {
    if (protocol_ != Protocol::FTP && protocol_ != Protocol::SFTP)
        throw std::invalid_argument("CurlClient supports FTP and SFTP only, got " + to_string(protocol_));
    if (!resolver_) throw std::invalid_argument("CurlClient requires a credential resolver");
}

std::string CurlClient::urlFor(const ResourcePath& path, const bool asDirectory) const {
    auto url = fmt::format("{}://{}:{}{}", path.scheme(), path.host, path.port, urlEncode(path.path, true));
    if (asDirectory && !url.ends_with('/')) url += '/';
    return url;
}

std::string CurlClient::removeCommand(const std::string& path, const bool directory) const {
    const auto p = serverPath(protocol_, path);
    if (protocol_ == Protocol::FTP) return (directory ? "RMD " : "DELE ") + p;
    return (directory ? "rmdir " : "rm ") + quoteArg(p);
}

std::vector<std::string> CurlClient::renameCommands(const std::string& from, const std::string& to) const {
    const auto f = serverPath(protocol_, from), t = serverPath(protocol_, to);
    if (protocol_ == Protocol::FTP) return {"RNFR " + f, "RNTO " + t};
    return {"rename " + quoteArg(f) + " " + quoteArg(t)};
}

std::string CurlClient::mkdirCommand(const std::string& path) const {
    const auto p = serverPath(protocol_, path);
    if (protocol_ == Protocol::FTP) return "MKD " + p;
    return "mkdir " + quoteArg(p);
}

std::optional<FileInfo> CurlClient::parseListLine(const std::string& rawLine, const ResourcePath& dir,
                                                  const int64_t nowMs) {
    std::string line = rawLine;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.size() < 10 || line.starts_with("total ")) return std::nullopt;

    const char kind = line.front();
    if (kind != '-' && kind != 'd' && kind != 'l') return std::nullopt;

    // perms links owner group size month day time|year name...
    std::vector<std::string> fields;
    size_t pos = 0;
    while (fields.size() < 8) {
        while (pos < line.size() && std::isspace(static_cast<unsigned char>(line[pos]))) ++pos;
        if (pos >= line.size()) return std::nullopt;
        const auto start = pos;
        while (pos < line.size() && !std::isspace(static_cast<unsigned char>(line[pos]))) ++pos;
        fields.push_back(line.substr(start, pos - start));
    }
    while (pos < line.size() && std::isspace(static_cast<unsigned char>(line[pos]))) ++pos;
    std::string name = line.substr(pos);
    if (kind == 'l') {
        if (const auto arrow = name.find(" -> "); arrow != std::string::npos) name = name.substr(0, arrow);
    }
    if (name.empty() || name == "." || name == "..") return std::nullopt;

    FileInfo info;
    info.name = name;
    info.path = dir.join(name).toString();
    info.isDirectory = kind == 'd';
    try {
        info.size = info.isDirectory ? 0 : std::stoull(fields[4]);
    } catch (const std::exception&) {
        return std::nullopt;
    }

    const int month = monthIndex(fields[5]);
    if (month >= 0) {
        const std::time_t nowSec = nowMs / 1000;
        std::tm nowTm{};
        gmtime_r(&nowSec, &nowTm);

        std::tm tm{};
        tm.tm_mon = month;
        tm.tm_mday = std::atoi(fields[6].c_str());
        if (const auto colon = fields[7].find(':'); colon != std::string::npos) {
            tm.tm_year = nowTm.tm_year;
            tm.tm_hour = std::atoi(fields[7].substr(0, colon).c_str());
            tm.tm_min = std::atoi(fields[7].substr(colon + 1).c_str());
            // "Mon DD HH:MM" means within the last six months
            if (timegm(&tm) > nowSec + 86400) --tm.tm_year;
        } else {
            tm.tm_year = std::atoi(fields[7].c_str()) - 1900;
        }
        info.modified = static_cast<int64_t>(timegm(&tm)) * 1000;
    }

    return info;
}

Result<std::vector<FileInfo>> CurlClient::listFiles(const ResourcePath& dir, const CancelToken& cancel) {
    auto creds = resolver_->resolve(dir);
    if (!creds) return creds.propagate<std::vector<FileInfo>>();

    const auto& c = creds.value();
    const auto url = urlFor(dir, true);
    const auto res = performCurl([&](CURL* h) {
        applyCommon(h, url, c, protocol_, lowSpeedTimeout_);
        curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, abortOnCancel);
        curl_easy_setopt(h, CURLOPT_XFERINFODATA, &cancel);
    });

    if (cancel.isCancelled()) return Cancelled{};
    if (res.curl != CURLE_OK) {
        auto err = fromCurl(res.curl, "List " + dir.toString(), lastResponseLine(res.hdr));
        log::Registry::protocol()->warn("[CurlClient] {}", err.describe());
        return err;
    }

    std::vector<FileInfo> out;
    std::istringstream in(res.body);
    std::string line;
    const auto now = nowMs();
    while (std::getline(in, line))
        if (auto info = parseListLine(line, dir, now); info && !info->name.ends_with(kPartialSuffix))
            out.push_back(std::move(*info));

    return out;
}

Result<FileInfo> CurlClient::getMetadata(const ResourcePath& path) {
    if (path.isRoot()) {
        FileInfo root;
        root.path = path.toString();
        root.isDirectory = true;
        return root;
    }

    auto siblings = listFiles(path.parent(), CancelToken::none());
    if (!siblings) return siblings.propagate<FileInfo>();

    const auto name = path.filename();
    for (auto& f : siblings.value())
        if (f.name == name) return f;

    return Error(ErrorKind::NotFound, "Not found: " + path.toString());
}

Result<uint64_t> CurlClient::download(const ResourcePath& path, std::ostream& out, const ProgressFn& progress,
                                      const CancelToken& cancel) {
    auto creds = resolver_->resolve(path);
    if (!creds) return creds.propagate<uint64_t>();

    auto meta = getMetadata(path);
    if (!meta) return meta.propagate<uint64_t>();
    if (meta.value().isDirectory) return Error(ErrorKind::InvalidArgument, "Cannot download a directory: " + path.toString());

    TransferCtx ctx{.out = &out, .progress = &progress, .cancel = &cancel,
                    .total = static_cast<int64_t>(meta.value().size)};

    CurlEasy h;
    std::string hdr;
    applyCommon(h, urlFor(path), creds.value(), protocol_, lowSpeedTimeout_);
    curl_easy_setopt(h, CURLOPT_BUFFERSIZE, static_cast<long>(bufferSize_));
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, writeToStream);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, writeToString);
    curl_easy_setopt(h, CURLOPT_HEADERDATA, &hdr);
    curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, abortOnCancel);
    curl_easy_setopt(h, CURLOPT_XFERINFODATA, &cancel);

    const auto rc = curl_easy_perform(h);
    if (cancel.isCancelled()) return Cancelled{};
    if (ctx.streamFailed) return Error(ErrorKind::Transport, "Local write failed while downloading " + path.toString());
    if (rc != CURLE_OK) return fromCurl(rc, "Download " + path.toString(), lastResponseLine(hdr));

    return ctx.done;
}

Result<uint64_t> CurlClient::upload(std::istream& in, const int64_t size, const ResourcePath& path, const bool overwrite,
                                    const ProgressFn& progress, const CancelToken& cancel) {
    auto creds = resolver_->resolve(path);
    if (!creds) return creds.propagate<uint64_t>();

    auto present = exists(path);
    if (!present) return present.propagate<uint64_t>();
    if (present.value() && !overwrite) return Error(ErrorKind::AlreadyExists, "Destination exists: " + path.toString());

    const auto partial = path.withFilename(path.filename() + kPartialSuffix);
    TransferCtx ctx{.in = &in, .progress = &progress, .cancel = &cancel, .total = size};

    CURLcode rc;
    std::string hdr;
    {
        CurlEasy h;
        applyCommon(h, urlFor(partial), creds.value(), protocol_, lowSpeedTimeout_);
        curl_easy_setopt(h, CURLOPT_UPLOAD, 1L);
        curl_easy_setopt(h, CURLOPT_UPLOAD_BUFFERSIZE, static_cast<long>(bufferSize_));
        curl_easy_setopt(h, CURLOPT_READFUNCTION, readFromStream);
        curl_easy_setopt(h, CURLOPT_READDATA, &ctx);
        if (size >= 0) curl_easy_setopt(h, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(size));
        curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, writeToString);
        curl_easy_setopt(h, CURLOPT_HEADERDATA, &hdr);
        curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, abortOnCancel);
        curl_easy_setopt(h, CURLOPT_XFERINFODATA, &cancel);
        rc = curl_easy_perform(h);
    }

    const auto discardPartial = [&] {
        if (auto r = runQuote(partial.parent(), {removeCommand(partial.path, false)}); !r)
            log::Registry::protocol()->warn("[CurlClient] Could not remove partial upload {}: {}",
                                            partial.toString(), r.describe());
    };

    if (cancel.isCancelled()) {
        discardPartial();
        return Cancelled{};
    }
    if (rc != CURLE_OK || ctx.streamFailed) {
        discardPartial();
        if (ctx.streamFailed) return Error(ErrorKind::Transport, "Local read failed while uploading " + path.toString());
        return fromCurl(rc, "Upload " + path.toString(), lastResponseLine(hdr));
    }

    std::vector<std::string> commit;
    if (present.value()) commit.push_back(removeCommand(path.path, false));
    for (auto& cmd : renameCommands(partial.path, path.path)) commit.push_back(std::move(cmd));

    if (auto r = runQuote(path.parent(), commit); !r) {
        discardPartial();
        return r.propagate<uint64_t>();
    }

    return ctx.done;
}

VoidResult CurlClient::runQuote(const ResourcePath& at, const std::vector<std::string>& commands) {
    auto creds = resolver_->resolve(at);
    if (!creds) return creds.propagate<Unit>();

    SList quote;
    for (const auto& cmd : commands) quote.add(cmd);

    const auto url = urlFor(at.withPath("/"), true);
    const auto res = performCurl([&](CURL* h) {
        applyCommon(h, url, creds.value(), protocol_, lowSpeedTimeout_);
        curl_easy_setopt(h, CURLOPT_NOBODY, 1L);
        curl_easy_setopt(h, CURLOPT_QUOTE, quote.get());
        if (protocol_ == Protocol::FTP) curl_easy_setopt(h, CURLOPT_FTP_FILEMETHOD, static_cast<long>(CURLFTPMETHOD_NOCWD));
    });

    if (res.curl != CURLE_OK) {
        auto err = fromCurl(res.curl, fmt::format("{} on {}", commands.front(), at.resourceKey()), lastResponseLine(res.hdr));
        log::Registry::protocol()->warn("[CurlClient] {}", err.describe());
        return err;
    }
    return success();
}

VoidResult CurlClient::createFolder(const ResourcePath& path) {
    auto present = getMetadata(path);
    if (present) {
        if (present.value().isDirectory) return success();
        return Error(ErrorKind::AlreadyExists, "A file exists at " + path.toString());
    }
    if (!present.is(ErrorKind::NotFound)) return present.propagate<Unit>();

    if (!path.parent().isRoot()) {
        if (auto r = createFolder(path.parent()); !r) return r;
    }
    return runQuote(path, {mkdirCommand(path.path)});
}

VoidResult CurlClient::removeTree(const ResourcePath& path, const bool isDirectory) {
    if (isDirectory) {
        auto children = listFiles(path, CancelToken::none());
        if (!children) return children.propagate<Unit>();
        for (const auto& child : children.value()) {
            if (auto r = removeTree(path.join(child.name), child.isDirectory); !r) return r;
        }
    }
    return runQuote(path.parent(), {removeCommand(path.path, isDirectory)});
}

VoidResult CurlClient::remove(const ResourcePath& path) {
    if (path.isRoot()) return Error(ErrorKind::InvalidArgument, "Refusing to delete server root");
    auto meta = getMetadata(path);
    if (!meta) return meta.propagate<Unit>();
    return removeTree(path, meta.value().isDirectory);
}

Result<ResourcePath> CurlClient::rename(const ResourcePath& path, const std::string& newName) {
    if (newName.empty() || newName.find('/') != std::string::npos)
        return Error(ErrorKind::InvalidArgument, "Invalid file name: " + newName);

    const auto target = path.withFilename(newName);
    auto r = move(path, target, false);
    if (!r) return r.propagate<ResourcePath>();
    return target;
}

VoidResult CurlClient::move(const ResourcePath& from, const ResourcePath& to, const bool overwrite) {
    if (from.resourceKey() != to.resourceKey())
        return Error(ErrorKind::UnsupportedCombination, "Server-side move across endpoints: " +
                     from.resourceKey() + " -> " + to.resourceKey());

    auto src = getMetadata(from);
    if (!src) return src.propagate<Unit>();

    auto dst = getMetadata(to);
    if (dst) {
        if (!overwrite) return Error(ErrorKind::AlreadyExists, "Destination exists: " + to.toString());
        if (auto r = removeTree(to, dst.value().isDirectory); !r) return r;
    } else if (!dst.is(ErrorKind::NotFound)) {
        return dst.propagate<Unit>();
    }

    return runQuote(from.parent(), renameCommands(from.path, to.path));
}

VoidResult CurlClient::copy(const ResourcePath& from, const ResourcePath&, bool) {
    return Error(ErrorKind::UnsupportedCombination, "Server-side copy is not available over " + from.scheme());
}

Result<bool> CurlClient::exists(const ResourcePath& path) {
    auto meta = getMetadata(path);
    if (meta) return true;
    if (meta.is(ErrorKind::NotFound)) return false;
    return meta.propagate<bool>();
}
