#pragma once

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace gigastream::utils {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

struct Url {
    std::string scheme = "http";
    std::string host;
    int port = 80;
    std::string path = "/";

    // scheme://host[:port], the port only when it is not the scheme default.
    std::string origin() const;
    std::string str() const;
};

// Throws std::invalid_argument on a missing host or a bad port.
Url parse_url(const std::string& text);

// Location may be absolute, host-relative or path-relative.
Url resolve_redirect(const Url& from, const std::string& location);

bool same_origin(const Url& lhs, const Url& rhs);

// GETs url into path, following up to five redirects. Credentials are sent
// only while the request stays on the origin of url. The body lands in
// "<path>.part" first and is renamed into place once complete. Throws
// std::runtime_error on transport or HTTP failures and std::invalid_argument
// on a malformed URL or redirect.
void download_file(const std::string& url,
                   const std::filesystem::path& path,
                   const HeaderList& credentials = {});

}
