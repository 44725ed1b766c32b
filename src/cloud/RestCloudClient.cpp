#include "cloud/RestCloudClient.hpp"
#include "log/Registry.hpp"
#include "util/curlWrappers.hpp"
#include "util/time.hpp"

#include <nlohmann/json.hpp>

using namespace mg::cloud;
using namespace mg::types;
using namespace mg::concurrency;
using namespace mg::util;
using json = nlohmann::json;

namespace {

struct StreamCtx {
    CURL* h = nullptr;
    const HttpRequest* req = nullptr;
    std::string errorBody;
    uint64_t done = 0;
    bool streamFailed = false;
};

size_t onBody(char* ptr, const size_t size, const size_t nmemb, void* ud) {
    auto* ctx = static_cast<StreamCtx*>(ud);
    const auto n = size * nmemb;
    if (ctx->req->cancel && ctx->req->cancel->isCancelled()) return 0;

    long code = 0;
    curl_easy_getinfo(ctx->h, CURLINFO_RESPONSE_CODE, &code);
    if (code / 100 != 2) {
        ctx->errorBody.append(ptr, n);
        return n;
    }

    ctx->req->download->write(ptr, static_cast<std::streamsize>(n));
    if (!*ctx->req->download) {
        ctx->streamFailed = true;
        return 0;
    }
    ctx->done += n;
    if (ctx->req->progress) {
        curl_off_t total = -1;
        curl_easy_getinfo(ctx->h, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &total);
        ctx->req->progress(ctx->done, total >= 0 ? static_cast<int64_t>(total) : mg::protocol::kUnknownSize);
    }
    return n;
}

size_t onUploadRead(char* buffer, const size_t size, const size_t nitems, void* ud) {
    auto* ctx = static_cast<StreamCtx*>(ud);
    if (ctx->req->cancel && ctx->req->cancel->isCancelled()) return CURL_READFUNC_ABORT;
    ctx->req->upload->read(buffer, static_cast<std::streamsize>(size * nitems));
    if (ctx->req->upload->bad()) {
        ctx->streamFailed = true;
        return CURL_READFUNC_ABORT;
    }
    const auto n = static_cast<size_t>(ctx->req->upload->gcount());
    ctx->done += n;
    if (ctx->req->progress) ctx->req->progress(ctx->done, ctx->req->uploadSize);
    return n;
}

int onXferInfo(void* ud, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* ctx = static_cast<StreamCtx*>(ud);
    return ctx->req->cancel && ctx->req->cancel->isCancelled() ? 1 : 0;
}

std::string apiPath(const ResourcePath& p) {
    return p.isRoot() ? std::string{} : p.path;
}

Error fromHttp(const HttpResult& res, const std::string& what) {
    if (!res.transportOk) {
        const bool timedOut = res.transportError.find("imeout") != std::string::npos ||
                              res.transportError.find("timed out") != std::string::npos;
        return {ErrorKind::Transport, what + (timedOut ? ": request timed out" : ": transport failure"), res.transportError};
    }

    std::string summary;
    try {
        summary = json::parse(res.body).value("error_summary", std::string{});
    } catch (const json::exception&) {
        summary = res.body;
    }

    switch (res.status) {
        case 401: return {ErrorKind::AuthExpired, what + ": unauthorized (401)", summary};
        case 404: return {ErrorKind::NotFound, what + ": not found", summary};
        case 409:
            if (summary.find("not_found") != std::string::npos) return {ErrorKind::NotFound, what + ": not found", summary};
            if (summary.find("conflict") != std::string::npos) return {ErrorKind::AlreadyExists, what + ": already exists", summary};
            return {ErrorKind::Transport, what + ": rejected by server", summary};
        default:
            return {ErrorKind::Transport, what + ": HTTP " + std::to_string(res.status), summary};
    }
}

}

RestCloudClient::RestCloudClient(config::CloudProviderConfig cfg, std::shared_ptr<OAuthSession> session,
                                 HttpTransport transport)
    : cfg_(std::move(cfg)), session_(std::move(session)), transport_(std::move(transport)) {
    if (!session_) throw std::invalid_argument("RestCloudClient requires an OAuth session");
    if (!transport_) transport_ = performHttp;
}

HttpResult RestCloudClient::performHttp(const HttpRequest& req) {
    CurlEasy h;
    SList headers;
    for (const auto& hdr : req.headers) headers.add(hdr);

    StreamCtx ctx{.h = h, .req = &req};
    std::string body;

    curl_easy_setopt(h, CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(h, CURLOPT_POST, 1L);
    curl_easy_setopt(h, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(h, CURLOPT_LOW_SPEED_TIME, 60L);
    curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, onXferInfo);
    curl_easy_setopt(h, CURLOPT_XFERINFODATA, &ctx);

    if (req.upload) {
        curl_easy_setopt(h, CURLOPT_READFUNCTION, onUploadRead);
        curl_easy_setopt(h, CURLOPT_READDATA, &ctx);
        if (req.uploadSize >= 0) curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(req.uploadSize));
        else headers.add("Transfer-Encoding: chunked");
    } else {
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, req.body.c_str());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, static_cast<long>(req.body.size()));
    }

    if (req.download) {
        curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, onBody);
        curl_easy_setopt(h, CURLOPT_WRITEDATA, &ctx);
    } else {
        curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, writeToString);
        curl_easy_setopt(h, CURLOPT_WRITEDATA, &body);
    }
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());

    const auto rc = curl_easy_perform(h);

    HttpResult res;
    res.cancelled = req.cancel && req.cancel->isCancelled();
    res.streamFailed = ctx.streamFailed;
    res.transportOk = rc == CURLE_OK;
    if (!res.transportOk) res.transportError = curl_easy_strerror(rc);
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &res.status);
    res.body = req.download ? std::move(ctx.errorBody) : std::move(body);
    res.transferred = ctx.done;
    return res;
}

Result<HttpResult> RestCloudClient::authorizedRequest(HttpRequest req) {
    if (!session_->hasValidAccessToken()) {
        if (!session_->canRefresh())
            return Error(ErrorKind::NotAuthenticated, "Not authenticated with " + cfg_.name);
        if (auto r = session_->refresh(); !r) {
            if (r.isCancelled()) return Cancelled{};
            auto err = r.error();
            return err.markReauthAttempted();
        }
    }

    const auto uploadStart = req.upload ? req.upload->tellg() : std::istream::pos_type(-1);
    const auto send = [&] {
        auto withAuth = req;
        withAuth.headers.push_back("Authorization: Bearer " + session_->accessToken());
        return transport_(withAuth);
    };

    auto res = send();
    if (res.cancelled) return Cancelled{};
    if (res.status != 401) return res;

    log::Registry::cloud()->info("[RestCloudClient] {} returned 401, refreshing token once", cfg_.name);
    if (auto r = session_->refresh(); !r) {
        if (r.isCancelled()) return Cancelled{};
        return Error(ErrorKind::AuthExpired, "Session for " + cfg_.name + " expired and refresh failed", r.describe())
            .markReauthAttempted();
    }

    if (req.upload) {
        if (uploadStart == std::istream::pos_type(-1))
            return Error(ErrorKind::AuthExpired, "Session for " + cfg_.name + " expired mid-upload on a non-seekable stream")
                .markReauthAttempted();
        req.upload->clear();
        req.upload->seekg(uploadStart);
    }

    res = send();
    if (res.cancelled) return Cancelled{};
    if (res.status == 401) return fromHttp(res, cfg_.name + " request after refresh").markReauthAttempted();
    return res;
}

Result<json> RestCloudClient::rpc(const std::string& endpoint, const json& arg, const std::string& what) {
    HttpRequest req;
    req.url = cfg_.api_base + endpoint;
    req.headers = {"Content-Type: application/json"};
    req.body = arg.dump();

    auto res = authorizedRequest(std::move(req));
    if (!res) return res.propagate<json>();

    const auto& http = res.value();
    if (!http.transportOk || http.status / 100 != 2) return fromHttp(http, what);

    try {
        return http.body.empty() ? json::object() : json::parse(http.body);
    } catch (const json::exception& e) {
        return Error(ErrorKind::Transport, what + ": malformed response", e.what());
    }
}

ResourcePath RestCloudClient::pathFor(const std::string& inner) const {
    ResourcePath p;
    p.protocol = Protocol::Cloud;
    p.provider = cfg_.name;
    return p.withPath(inner);
}

FileInfo RestCloudClient::toFileInfo(const json& entry) const {
    FileInfo info;
    const auto display = entry.value("path_display", "/" + entry.value("name", std::string{}));
    info.path = pathFor(display).toString();
    info.name = entry.value("name", std::string{});
    info.isDirectory = entry.value(".tag", std::string{}) == "folder";
    info.size = entry.value("size", uint64_t{0});
    info.modified = parseIso8601Ms(entry.value("server_modified", std::string{}));
    return info;
}

VoidResult RestCloudClient::authenticate() {
    if (session_->canRefresh()) return session_->refresh();
    if (session_->hasValidAccessToken()) return success();
    return Error(ErrorKind::NotAuthenticated, "No stored session for " + cfg_.name + ", interactive sign-in required");
}

bool RestCloudClient::isAuthenticated() const {
    return session_->hasValidAccessToken();
}

void RestCloudClient::signOut() {
    session_->signOut();
}

bool RestCloudClient::tryRestoreSession() {
    if (!session_->restore()) return false;
    if (session_->hasValidAccessToken()) return true;
    return session_->canRefresh() && session_->refresh().ok();
}

Result<std::vector<FileInfo>> RestCloudClient::listFiles(const ResourcePath& dir, const CancelToken& cancel) {
    const auto what = "List " + dir.toString();
    auto page = rpc("/files/list_folder", {{"path", apiPath(dir)}, {"recursive", false}}, what);

    std::vector<FileInfo> out;
    while (true) {
        if (!page) return page.propagate<std::vector<FileInfo>>();
        if (cancel.isCancelled()) return Cancelled{};

        const auto& body = page.value();
        for (const auto& entry : body.value("entries", json::array()))
            if (entry.value(".tag", std::string{}) != "deleted") out.push_back(toFileInfo(entry));

        if (!body.value("has_more", false)) break;
        page = rpc("/files/list_folder/continue", {{"cursor", body.at("cursor")}}, what);
    }

    return out;
}

Result<FileInfo> RestCloudClient::getMetadata(const ResourcePath& path) {
    if (path.isRoot()) {
        FileInfo root;
        root.path = path.toString();
        root.isDirectory = true;
        return root;
    }

    auto meta = rpc("/files/get_metadata", {{"path", apiPath(path)}}, "Metadata " + path.toString());
    if (!meta) return meta.propagate<FileInfo>();
    return toFileInfo(meta.value());
}

Result<uint64_t> RestCloudClient::download(const ResourcePath& path, std::ostream& out,
                                           const protocol::ProgressFn& progress, const CancelToken& cancel) {
    HttpRequest req;
    req.url = cfg_.content_base + "/files/download";
    req.headers = {"Dropbox-API-Arg: " + json{{"path", apiPath(path)}}.dump()};
    req.download = &out;
    req.progress = progress;
    req.cancel = &cancel;

    auto res = authorizedRequest(std::move(req));
    if (!res) return res.propagate<uint64_t>();

    const auto& http = res.value();
    if (http.streamFailed) return Error(ErrorKind::Transport, "Local write failed while downloading " + path.toString());
    if (!http.transportOk || http.status / 100 != 2) return fromHttp(http, "Download " + path.toString());
    return http.transferred;
}

Result<uint64_t> RestCloudClient::upload(std::istream& in, const int64_t size, const ResourcePath& path,
                                         const bool overwrite, const protocol::ProgressFn& progress,
                                         const CancelToken& cancel) {
    const json arg = {
        {"path", apiPath(path)},
        {"mode", overwrite ? "overwrite" : "add"},
        {"autorename", false},
        {"mute", true}
    };

    HttpRequest req;
    req.url = cfg_.content_base + "/files/upload";
    req.headers = {"Dropbox-API-Arg: " + arg.dump(), "Content-Type: application/octet-stream"};
    req.upload = &in;
    req.uploadSize = size;
    req.progress = progress;
    req.cancel = &cancel;

    // an aborted upload session is discarded server-side, nothing partial becomes visible
    auto res = authorizedRequest(std::move(req));
    if (!res) return res.propagate<uint64_t>();

    const auto& http = res.value();
    if (http.streamFailed) return Error(ErrorKind::Transport, "Local read failed while uploading " + path.toString());
    if (!http.transportOk || http.status / 100 != 2) return fromHttp(http, "Upload " + path.toString());
    return http.transferred;
}

VoidResult RestCloudClient::createFolder(const ResourcePath& path) {
    if (path.isRoot()) return success();
    auto res = rpc("/files/create_folder_v2", {{"path", apiPath(path)}, {"autorename", false}},
                   "Create folder " + path.toString());
    if (res) return success();

    if (res.is(ErrorKind::AlreadyExists)) {
        auto meta = getMetadata(path);
        if (meta && meta.value().isDirectory) return success();
    }
    return res.propagate<Unit>();
}

VoidResult RestCloudClient::remove(const ResourcePath& path) {
    if (path.isRoot()) return Error(ErrorKind::InvalidArgument, "Refusing to delete the account root");
    auto res = rpc("/files/delete_v2", {{"path", apiPath(path)}}, "Delete " + path.toString());
    if (!res) return res.propagate<Unit>();
    return success();
}

Result<ResourcePath> RestCloudClient::rename(const ResourcePath& path, const std::string& newName) {
    if (newName.empty() || newName.find('/') != std::string::npos)
        return Error(ErrorKind::InvalidArgument, "Invalid file name: " + newName);

    const auto target = path.withFilename(newName);
    auto r = move(path, target, false);
    if (!r) return r.propagate<ResourcePath>();
    return target;
}

VoidResult RestCloudClient::move(const ResourcePath& from, const ResourcePath& to, const bool overwrite) {
    if (from.provider != to.provider)
        return Error(ErrorKind::UnsupportedCombination, "Server-side move across cloud accounts");

    if (overwrite) {
        auto present = exists(to);
        if (!present) return present.propagate<Unit>();
        if (present.value()) {
            if (auto r = remove(to); !r) return r;
        }
    }

    auto res = rpc("/files/move_v2", {{"from_path", apiPath(from)}, {"to_path", apiPath(to)}, {"autorename", false}},
                   "Move " + from.toString());
    if (!res) return res.propagate<Unit>();
    return success();
}

VoidResult RestCloudClient::copy(const ResourcePath& from, const ResourcePath& to, const bool overwrite) {
    if (from.provider != to.provider)
        return Error(ErrorKind::UnsupportedCombination, "Server-side copy across cloud accounts");

    if (overwrite) {
        auto present = exists(to);
        if (!present) return present.propagate<Unit>();
        if (present.value()) {
            if (auto r = remove(to); !r) return r;
        }
    }

    auto res = rpc("/files/copy_v2", {{"from_path", apiPath(from)}, {"to_path", apiPath(to)}, {"autorename", false}},
                   "Copy " + from.toString());
    if (!res) return res.propagate<Unit>();
    return success();
}

Result<bool> RestCloudClient::exists(const ResourcePath& path) {
    auto meta = getMetadata(path);
    if (meta) return true;
    if (meta.is(ErrorKind::NotFound)) return false;
    return meta.propagate<bool>();
}
