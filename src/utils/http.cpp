#include "gigastream/utils/http.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <httplib.h>
#include <stdexcept>
#include <system_error>

#include "gigastream/logging.hpp"

namespace gigastream::utils {

namespace {

constexpr int kMaxRedirects = 5;

int default_port(const std::string& scheme) {
    return scheme == "https" ? 443 : 80;
}

bool is_redirect(int status) {
    return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

void write_atomically(const std::filesystem::path& path, const std::string& body) {
    if (!path.parent_path().empty()) {
        std::filesystem::create_directories(path.parent_path());
    }
    auto partial = path;
    partial += ".part";
    {
        std::ofstream out(partial, std::ios::binary | std::ios::trunc);
        out.write(body.data(), static_cast<std::streamsize>(body.size()));
        out.close();
        if (!out) {
            std::error_code ignored;
            std::filesystem::remove(partial, ignored);
            throw std::runtime_error("could not write " + partial.string());
        }
    }
    std::filesystem::rename(partial, path);
}

}

std::string Url::origin() const {
    std::string out = scheme + "://" + host;
    if (port != default_port(scheme)) {
        out += ':' + std::to_string(port);
    }
    return out;
}

std::string Url::str() const {
    return origin() + path;
}

Url parse_url(const std::string& text) {
    Url url;
    std::string rest = text;
    const auto scheme_end = rest.find("://");
    if (scheme_end != std::string::npos) {
        url.scheme = rest.substr(0, scheme_end);
        std::transform(url.scheme.begin(), url.scheme.end(), url.scheme.begin(),
                       [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
        rest.erase(0, scheme_end + 3);
    }
    if (url.scheme != "http" && url.scheme != "https") {
        throw std::invalid_argument("unsupported URL scheme: " + url.scheme);
    }

    const auto slash = rest.find('/');
    if (slash != std::string::npos) {
        url.path = rest.substr(slash);
        rest.erase(slash);
    }

    url.port = default_port(url.scheme);
    const auto colon = rest.find(':');
    url.host = rest.substr(0, colon);
    if (colon != std::string::npos) {
        const auto digits = rest.substr(colon + 1);
        if (digits.empty() || digits.size() > 5 ||
            !std::all_of(digits.begin(), digits.end(),
                         [](unsigned char ch) { return std::isdigit(ch) != 0; })) {
            throw std::invalid_argument("bad port in URL: " + text);
        }
        url.port = std::stoi(digits);
        if (url.port <= 0 || url.port > 65535) {
            throw std::invalid_argument("bad port in URL: " + text);
        }
    }
    if (url.host.empty()) {
        throw std::invalid_argument("URL has no host: " + text);
    }
    return url;
}

Url resolve_redirect(const Url& from, const std::string& location) {
    if (location.empty()) {
        throw std::invalid_argument("empty redirect location");
    }
    if (location.find("://") != std::string::npos) {
        return parse_url(location);
    }
    if (location.rfind("//", 0) == 0) {
        return parse_url(from.scheme + ":" + location);
    }
    Url next = from;
    if (location.front() == '/') {
        next.path = location;
    } else {
        next.path = from.path.substr(0, from.path.find_last_of('/') + 1) + location;
    }
    return next;
}

bool same_origin(const Url& lhs, const Url& rhs) {
    return lhs.scheme == rhs.scheme && lhs.host == rhs.host && lhs.port == rhs.port;
}

void download_file(const std::string& url,
                   const std::filesystem::path& path,
                   const HeaderList& credentials) {
    const Url first = parse_url(url);
    Url current = first;
    for (int hop = 0; hop <= kMaxRedirects; ++hop) {
#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
        if (current.scheme == "https") {
            throw std::runtime_error("HTTPS download requires OpenSSL support: " + current.str());
        }
#endif
        httplib::Client client(current.origin());
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
        client.enable_server_certificate_verification(true);
#endif
        client.set_url_encode(false);
        client.set_connection_timeout(10);
        client.set_read_timeout(120);

        httplib::Headers headers = {{"User-Agent", "gigastream/1.0"}, {"Accept", "*/*"}};
        if (same_origin(current, first)) {
            headers.insert(credentials.begin(), credentials.end());
        }

        const auto response = client.Get(current.path, headers);
        if (!response) {
            throw std::runtime_error("request to " + current.str() + " failed: " +
                                     httplib::to_string(response.error()));
        }
        if (response->status >= 200 && response->status < 300) {
            write_atomically(path, response->body);
            logging::info(
                "HTTP download complete",
                {kv("url", current.str()),
                 kv("bytes", response->body.size())});
            return;
        }
        if (!is_redirect(response->status)) {
            throw std::runtime_error("GET " + current.str() + " returned " +
                                     std::to_string(response->status));
        }
        const auto location = response->get_header_value("Location");
        const Url next = resolve_redirect(current, location);
        logging::debug(
            "HTTP download redirect",
            {kv("status", response->status),
             kv("to", next.str()),
             kv("credentials", same_origin(next, first))});
        current = next;
    }
    throw std::runtime_error("too many redirects downloading " + url);
}

}
