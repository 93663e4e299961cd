#include "utilities/http.hpp"
#include "utilities/errors.h"
#include "utilities/logger.h"

#include <algorithm>
#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <cctype>
#include <functional>
#include <sstream>
#include <stdexcept>

namespace gutex {

std::string trim(const std::string &str) {
  const std::string whitespace = " \t\n\r";
  size_t start = str.find_first_not_of(whitespace);
  size_t end = str.find_last_not_of(whitespace);

  if (start == std::string::npos) // No non-whitespace characters found
    return "";

  return str.substr(start, end - start + 1);
}

namespace HTTP {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

static std::string toLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

static std::string defaultPort(const std::string &scheme) {
  return scheme == "https" ? "443" : "80";
}

// Converts a method string to HttpMethod enum
HttpMethod StringToHttpMethod(const std::string &methodStr) {
  if (methodStr == "GET")
    return HttpMethod::GET;
  else if (methodStr == "HEAD")
    return HttpMethod::HEAD;
  else
    return HttpMethod::INVALID;
}

// Converts HttpMethod enum to a method string
std::string HttpMethodToString(HttpMethod method) {
  switch (method) {
  case HttpMethod::GET:
    return "GET";
  case HttpMethod::HEAD:
    return "HEAD";
  default:
    return "INVALID";
  }
}

std::string Url::toString() const {
  std::string out = scheme + "://" + host;
  if (port != defaultPort(scheme))
    out += ":" + port;
  return out + target;
}

Url ParseUrl(const std::string &url) {
  Url out;
  auto schemeEnd = url.find("://");
  if (schemeEnd == std::string::npos)
    throw std::invalid_argument("URL has no scheme: " + url);
  out.scheme = toLower(url.substr(0, schemeEnd));
  if (out.scheme != "http" && out.scheme != "https")
    throw std::invalid_argument("Unsupported URL scheme: " + url);

  auto authorityStart = schemeEnd + 3;
  auto authorityEnd = url.find_first_of("/?#", authorityStart);
  std::string authority = url.substr(authorityStart, authorityEnd == std::string::npos
                                                         ? std::string::npos
                                                         : authorityEnd - authorityStart);
  if (authorityEnd == std::string::npos) {
    out.target = "/";
  } else {
    out.target = url.substr(authorityEnd);
    auto fragment = out.target.find('#');
    if (fragment != std::string::npos)
      out.target.erase(fragment);
    if (out.target.empty() || out.target[0] != '/')
      out.target = "/" + out.target;
  }

  // "[v6]:port" or "host:port"
  if (!authority.empty() && authority[0] == '[') {
    auto close = authority.find(']');
    if (close == std::string::npos)
      throw std::invalid_argument("Malformed IPv6 host in URL: " + url);
    out.host = authority.substr(1, close - 1);
    if (close + 1 < authority.size() && authority[close + 1] == ':')
      out.port = authority.substr(close + 2);
  } else {
    auto colon = authority.rfind(':');
    if (colon != std::string::npos) {
      out.host = authority.substr(0, colon);
      out.port = authority.substr(colon + 1);
    } else {
      out.host = authority;
    }
  }
  if (out.host.empty())
    throw std::invalid_argument("URL has no host: " + url);
  if (out.port.empty())
    out.port = defaultPort(out.scheme);
  return out;
}

std::string ResolveLocation(const std::string &baseUrl,
                            const std::string &location) {
  if (location.find("://") != std::string::npos)
    return location;
  Url base = ParseUrl(baseUrl);
  if (location.rfind("//", 0) == 0)
    return base.scheme + ":" + location;

  Url resolved = base;
  if (!location.empty() && location[0] == '/') {
    resolved.target = location;
  } else {
    std::string path = base.target.substr(0, base.target.find('?'));
    resolved.target = path.substr(0, path.rfind('/') + 1) + location;
  }
  return resolved.toString();
}

std::optional<std::string> FindHeader(const HeaderMap &headers,
                                      const std::string &name) {
  const std::string wanted = toLower(name);
  for (const auto &header : headers) {
    if (toLower(header.first) == wanted)
      return header.second;
  }
  return std::nullopt;
}

std::string FormatRangeHeader(std::int64_t start, std::int64_t end) {
  return "bytes=" + std::to_string(start) + "-" + std::to_string(end);
}

std::string GenerateHttpRequestString(const HTTPREQUEST &request) {
  std::ostringstream requestStream;

  // Start with the request line
  requestStream << HttpMethodToString(request.method) << " " << request.uri
                << " " << request.protocol << "\r\n";

  for (const auto &header : request.headers) {
    requestStream << header.first << ": " << header.second << "\r\n";
  }

  // End headers section
  requestStream << "\r\n";
  requestStream << request.body;

  return requestStream.str();
}

// Reassembles a Transfer-Encoding: chunked body. Trailers are ignored.
static std::string decodeChunkedBody(const std::string &raw) {
  std::string body;
  size_t pos = 0;
  while (pos < raw.size()) {
    size_t lineEnd = raw.find("\r\n", pos);
    if (lineEnd == std::string::npos)
      throw GutexError("Truncated chunked response body");
    std::string sizeField = raw.substr(pos, lineEnd - pos);
    auto extension = sizeField.find(';');
    if (extension != std::string::npos)
      sizeField.erase(extension);
    size_t chunkSize = 0;
    try {
      chunkSize = std::stoul(trim(sizeField), nullptr, 16);
    } catch (const std::exception &) {
      throw GutexError("Malformed chunk size in response body");
    }
    pos = lineEnd + 2;
    if (chunkSize == 0)
      break;
    if (pos + chunkSize > raw.size())
      throw GutexError("Truncated chunked response body");
    body.append(raw, pos, chunkSize);
    pos += chunkSize + 2;
  }
  return body;
}

HTTPRESPONSE ParseHttpResponse(const std::string &responseStr) {
  HTTPRESPONSE response;
  auto headerEnd = responseStr.find("\r\n\r\n");
  if (headerEnd == std::string::npos)
    throw GutexError("Malformed HTTP response: no header terminator");

  std::istringstream headStream(responseStr.substr(0, headerEnd));
  std::string statusLine;
  std::getline(headStream, statusLine);
  if (!statusLine.empty() && statusLine.back() == '\r')
    statusLine.pop_back();

  std::istringstream statusLineStream(statusLine);
  statusLineStream >> response.protocol >> response.statusCodeNumber;
  if (response.protocol.rfind("HTTP/", 0) != 0 || response.statusCodeNumber == 0)
    throw GutexError("Malformed HTTP status line: " + statusLine);
  std::getline(statusLineStream, response.reasonPhrase);
  response.reasonPhrase = trim(response.reasonPhrase);

  std::string line;
  while (std::getline(headStream, line)) {
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    if (line.empty())
      break;

    size_t delimiterPos = line.find(':');
    if (delimiterPos != std::string::npos) {
      std::string headerName = trim(line.substr(0, delimiterPos));
      std::string headerValue = trim(line.substr(delimiterPos + 1));
      if (toLower(headerName) == "content-type")
        response.contentType = headerValue;
      response.headers[headerName] = headerValue;
    }
  }

  std::string rawBody = responseStr.substr(headerEnd + 4);
  auto transferEncoding = FindHeader(response.headers, "Transfer-Encoding");
  if (transferEncoding &&
      toLower(*transferEncoding).find("chunked") != std::string::npos) {
    response.body = decodeChunkedBody(rawBody);
  } else {
    response.body = std::move(rawBody);
    auto contentLength = FindHeader(response.headers, "Content-Length");
    if (contentLength) {
      try {
        auto declared = std::stoull(*contentLength);
        if (declared < response.body.size())
          response.body.resize(declared);
      } catch (const std::exception &) {
        throw GutexError("Malformed Content-Length: " + *contentLength);
      }
    }
  }
  return response;
}

namespace {

using Completion = std::function<void(const boost::system::error_code &)>;

// Write the request then read until the peer closes the connection.
template <typename Stream>
void exchange(Stream &stream, const std::string &wire, std::string &raw,
              const Completion &done) {
  asio::async_write(stream, asio::buffer(wire),
                    [&stream, &raw, done](const boost::system::error_code &ec,
                                          std::size_t) {
                      if (ec)
                        return done(ec);
                      asio::async_read(stream, asio::dynamic_buffer(raw),
                                       [done](const boost::system::error_code &rec,
                                              std::size_t) { done(rec); });
                    });
}

bool isCleanEnd(const boost::system::error_code &ec) {
  return !ec || ec == asio::error::eof ||
         ec == asio::ssl::error::stream_truncated;
}

} // namespace

HTTPRESPONSE Client::Send(HTTPREQUEST request, const Url &url,
                          std::chrono::milliseconds timeout) {
  request.uri = url.target;
  request.headers["Host"] =
      url.port == defaultPort(url.scheme) ? url.host : url.host + ":" + url.port;
  request.headers["Connection"] = "close";
  if (!FindHeader(request.headers, "User-Agent"))
    request.headers["User-Agent"] = "gutex/1.0";
  const std::string wire = GenerateHttpRequestString(request);
  const std::string target = url.toString();

  asio::io_context ioc;
  tcp::resolver resolver(ioc);
  std::string raw;
  boost::system::error_code failure;
  bool finished = false;
  Completion done = [&](const boost::system::error_code &ec) {
    failure = ec;
    finished = true;
  };

  auto runWithDeadline = [&](tcp::socket &socket) {
    ioc.run_for(timeout);
    if (!finished) {
      boost::system::error_code ignored;
      resolver.cancel();
      socket.close(ignored);
      ioc.stop();
      throw TimeoutError("Request to " + target + " timed out after " +
                         std::to_string(timeout.count()) + "ms");
    }
  };

  if (url.scheme == "https") {
    asio::ssl::context ctx(asio::ssl::context::tls_client);
    ctx.set_default_verify_paths();
    ctx.set_verify_mode(asio::ssl::verify_peer);
    asio::ssl::stream<tcp::socket> stream(ioc, ctx);
    if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str()))
      throw GutexError("Failed to set TLS SNI host for " + target);
    stream.set_verify_callback(asio::ssl::host_name_verification(url.host));

    resolver.async_resolve(
        url.host, url.port,
        [&](const boost::system::error_code &ec,
            const tcp::resolver::results_type &results) {
          if (ec)
            return done(ec);
          asio::async_connect(
              stream.lowest_layer(), results,
              [&](const boost::system::error_code &cec, const tcp::endpoint &) {
                if (cec)
                  return done(cec);
                stream.async_handshake(
                    asio::ssl::stream_base::client,
                    [&](const boost::system::error_code &hec) {
                      if (hec)
                        return done(hec);
                      exchange(stream, wire, raw, done);
                    });
              });
        });
    runWithDeadline(stream.next_layer());
  } else {
    tcp::socket socket(ioc);
    resolver.async_resolve(
        url.host, url.port,
        [&](const boost::system::error_code &ec,
            const tcp::resolver::results_type &results) {
          if (ec)
            return done(ec);
          asio::async_connect(
              socket, results,
              [&](const boost::system::error_code &cec, const tcp::endpoint &) {
                if (cec)
                  return done(cec);
                exchange(socket, wire, raw, done);
              });
        });
    runWithDeadline(socket);
  }

  if (!isCleanEnd(failure))
    throw GutexError("Request to " + target + " failed: " + failure.message());

  Logger::getInstance().log(LogLevel::TRACE,
                            HttpMethodToString(request.method) + " " + target +
                                " -> " + std::to_string(raw.size()) + " bytes");
  HTTPRESPONSE response = ParseHttpResponse(raw);
  response.url = target;
  return response;
}

} // namespace HTTP
} // namespace gutex
