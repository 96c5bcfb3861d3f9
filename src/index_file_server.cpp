#include "index_file_server.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <system_error>
#include "errors.hpp"
#include "logger.hpp"

namespace mirror {

IndexFileServer::IndexFileServer(const RepositoryMirror& mirror, bool listing)
    : mirror_(mirror), listing_(listing) {}

static int hex_value(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

std::vector<std::string> IndexFileServer::normalize_path(const std::string& target) {
    std::string raw = target.substr(0, target.find_first_of("?#"));
    std::string decoded;
    decoded.reserve(raw.size());
    for (size_t i = 0; i < raw.size(); ++i) {
        char c = raw[i];
        if (c == '%') {
            int hi = i + 2 < raw.size() ? hex_value(raw[i + 1]) : -1;
            int lo = i + 2 < raw.size() ? hex_value(raw[i + 2]) : -1;
            if (hi < 0 || lo < 0)
                throw RequestPathError("malformed percent escape");
            c = static_cast<char>(hi * 16 + lo);
            i += 2;
        }
        if (c == '\0' || c == '\\')
            throw RequestPathError("forbidden character in path");
        decoded += c;
    }

    std::vector<std::string> segments;
    size_t pos = 0;
    while (pos <= decoded.size()) {
        size_t slash = decoded.find('/', pos);
        if (slash == std::string::npos)
            slash = decoded.size();
        std::string seg = decoded.substr(pos, slash - pos);
        pos = slash + 1;
        if (seg.empty() || seg == ".")
            continue;
        if (seg == "..")
            throw RequestPathError("path traversal");
        segments.push_back(std::move(seg));
    }
    return segments;
}

std::string IndexFileServer::content_type_for(const std::filesystem::path& file) {
    std::string ext = file.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    static const std::map<std::string, std::string> types{
        {".json", "application/json"},
        {".html", "text/html; charset=utf-8"},
        {".htm", "text/html; charset=utf-8"},
        {".txt", "text/plain; charset=utf-8"},
        {".md", "text/markdown; charset=utf-8"},
        {".toml", "application/toml"},
        {".xml", "application/xml"},
        {".css", "text/css"},
        {".js", "application/javascript"},
        {".gz", "application/gzip"}};
    auto it = types.find(ext);
    return it != types.end() ? it->second : "application/octet-stream";
}

// Errors that mean the path is absent, as opposed to present but unreadable.
static bool is_missing(const std::error_code& ec) {
    return ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory;
}

static IndexResponse status_response(int status, const std::string& reason) {
    IndexResponse res;
    res.status = status;
    res.body = std::to_string(status) + " " + reason + "\n";
    res.headers["Content-Type"] = "text/plain; charset=utf-8";
    res.headers["Content-Length"] = std::to_string(res.body.size());
    return res;
}

static bool etag_matches(const std::string& header, const std::string& etag) {
    size_t pos = 0;
    while (pos < header.size()) {
        size_t comma = header.find(',', pos);
        if (comma == std::string::npos)
            comma = header.size();
        std::string tag = header.substr(pos, comma - pos);
        pos = comma + 1;
        const auto first = tag.find_first_not_of(" \t");
        if (first == std::string::npos)
            continue;
        tag = tag.substr(first, tag.find_last_not_of(" \t") - first + 1);
        if (tag.rfind("W/", 0) == 0)
            tag = tag.substr(2);
        if (tag == "*" || tag == etag)
            return true;
    }
    return false;
}

static std::string html_escape(const std::string& in) {
    std::string out;
    for (char c : in) {
        switch (c) {
        case '&':
            out += "&amp;";
            break;
        case '<':
            out += "&lt;";
            break;
        case '>':
            out += "&gt;";
            break;
        case '"':
            out += "&quot;";
            break;
        default:
            out += c;
        }
    }
    return out;
}

static std::string encode_segment(const std::string& seg) {
    static const char* digits = "0123456789ABCDEF";
    std::string out;
    for (unsigned char c : seg) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += digits[c >> 4];
            out += digits[c & 0xF];
        }
    }
    return out;
}

// Listing in the style of a plain static file server: one link per entry,
// directories first, each group sorted by name.
static std::string render_listing(const std::filesystem::path& dir,
                                  const std::vector<std::string>& segments) {
    std::string display = "/";
    std::string href_base = "/";
    for (const auto& seg : segments) {
        display += seg + "/";
        href_base += encode_segment(seg) + "/";
    }
    std::vector<std::string> dirs;
    std::vector<std::string> files;
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
        std::error_code type_ec;
        if (entry.is_directory(type_ec))
            dirs.push_back(entry.path().filename().string());
        else
            files.push_back(entry.path().filename().string());
    }
    if (ec)
        throw ReadError("cannot list " + dir.string() + ": " + ec.message());
    std::sort(dirs.begin(), dirs.end());
    std::sort(files.begin(), files.end());

    const std::string title = "Index of " + html_escape(display);
    std::string html = "<html><head><meta charset=\"utf-8\"><title>" + title +
                       "</title></head><body><h1>" + title + "</h1><ul>";
    if (!segments.empty())
        html += "<li><a href=\"../\">../</a></li>";
    for (const auto& d : dirs)
        html += "<li><a href=\"" + href_base + encode_segment(d) + "/\">" + html_escape(d) +
                "/</a></li>";
    for (const auto& f : files)
        html += "<li><a href=\"" + href_base + encode_segment(f) + "\">" + html_escape(f) +
                "</a></li>";
    html += "</ul></body></html>\n";
    return html;
}

IndexResponse IndexFileServer::serve(const IndexRequest& request) const {
    namespace fs = std::filesystem;
    const std::vector<std::string> segments = normalize_path(request.path);

    const auto state = mirror_.current();
    if (!state || !state->snapshot)
        return status_response(503, "Service Unavailable");
    const Snapshot& snap = *state->snapshot;

    fs::path target = snap.root;
    std::string display;
    for (const auto& seg : segments) {
        target /= seg;
        display += "/" + seg;
    }
    if (display.empty())
        display = "/";

    std::error_code ec;
    const fs::path canon_root = fs::canonical(snap.root, ec);
    if (ec)
        throw ReadError("snapshot root unavailable: " + ec.message());
    const fs::path canon_target = fs::canonical(target, ec);
    if (ec) {
        if (is_missing(ec))
            throw NotFoundError(display);
        throw ReadError("cannot resolve " + target.string() + ": " + ec.message());
    }
    const fs::path inside = canon_target.lexically_relative(canon_root);
    if (inside.empty() || *inside.begin() == "..")
        throw RequestPathError("path escapes the mirror root: " + display);

    const std::string etag = "\"" + snap.revision + "\"";
    IndexResponse res;
    res.headers["ETag"] = etag;
    res.headers["X-Mirror-Revision"] = snap.revision;

    const fs::file_status st = fs::status(canon_target, ec);
    if (ec) {
        if (is_missing(ec))
            throw NotFoundError(display);
        throw ReadError("cannot stat " + canon_target.string() + ": " + ec.message());
    }
    const bool is_dir = fs::is_directory(st);
    if (is_dir && !listing_)
        throw NotFoundError(display);
    if (!is_dir && !fs::is_regular_file(st))
        throw NotFoundError(display);

    if (request.if_none_match && etag_matches(*request.if_none_match, etag)) {
        res.status = 304;
        return res;
    }

    if (is_dir) {
        res.body = render_listing(canon_target, segments);
        res.headers["Content-Type"] = "text/html; charset=utf-8";
    } else {
        std::ifstream in(canon_target, std::ios::binary);
        if (!in)
            throw ReadError("cannot open " + canon_target.string());
        const auto size = fs::file_size(canon_target, ec);
        if (ec)
            throw ReadError("cannot stat " + canon_target.string() + ": " + ec.message());
        res.body.resize(static_cast<size_t>(size));
        in.read(&res.body[0], static_cast<std::streamsize>(size));
        if (static_cast<std::uintmax_t>(in.gcount()) != size)
            throw ReadError("short read on " + canon_target.string());
        res.headers["Content-Type"] = content_type_for(canon_target);
    }
    res.status = 200;
    res.headers["Content-Length"] = std::to_string(res.body.size());
    return res;
}

IndexResponse IndexFileServer::handle(const IndexRequest& request) const {
    try {
        return serve(request);
    } catch (const RequestPathError& e) {
        log_debug("Rejected request path", {{"path", request.path}, {"reason", e.what()}});
        return status_response(400, "Bad Request");
    } catch (const NotFoundError&) {
        return status_response(404, "Not Found");
    } catch (const ReadError& e) {
        log_error("Cannot serve file", {{"path", request.path}, {"error", e.what()}});
        return status_response(500, "Internal Server Error");
    }
}

} // namespace mirror
