#ifndef INDEX_FILE_SERVER_HPP
#define INDEX_FILE_SERVER_HPP

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "repository_mirror.hpp"

namespace mirror {

struct IndexRequest {
    std::string path;                         ///< Raw request target, e.g. `/config.json?x=1`
    std::optional<std::string> if_none_match; ///< Value of the `If-None-Match` header
};

struct IndexResponse {
    int status = 200;
    std::string body;
    std::map<std::string, std::string> headers;
};

/**
 * @brief Serves files from the mirror's current snapshot.
 *
 * Each call to handle() captures the mirror state once, so every byte of a
 * response comes from a single snapshot even if a refresh publishes a new
 * one meanwhile. The server only reads from the mirror.
 */
class IndexFileServer {
  public:
    explicit IndexFileServer(const RepositoryMirror& mirror, bool listing = true);

    /**
     * @brief Produce the response for one request.
     *
     * Never throws for request-level failures: bad paths map to 400,
     * missing files to 404, read failures to 500 and an uninitialized
     * mirror to 503.
     */
    IndexResponse handle(const IndexRequest& request) const;

    /**
     * @brief Split a request target into validated path segments.
     *
     * Strips the query and fragment, percent-decodes, and drops empty and
     * `.` segments.
     *
     * @throws RequestPathError on malformed escapes, NUL bytes, backslashes
     *         or any `..` segment.
     */
    static std::vector<std::string> normalize_path(const std::string& target);

    /** @return MIME type chosen from the extension of @p file. */
    static std::string content_type_for(const std::filesystem::path& file);

  private:
    IndexResponse serve(const IndexRequest& request) const;

    const RepositoryMirror& mirror_;
    bool listing_;
};

} // namespace mirror

#endif // INDEX_FILE_SERVER_HPP
