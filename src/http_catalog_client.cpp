#include "http_catalog_client.hpp"

#include <asio.hpp>
#include <asio/ssl.hpp>

#include <cctype>
#include <sstream>
#include <system_error>

#include "errors.hpp"

namespace {

using asio::ip::tcp;

bool is_eof(const std::error_code& ec) {
  return ec == asio::error::eof || ec == asio::ssl::error::stream_truncated;
}

template<typename Stream>
std::string exchange(Stream& stream, const std::string& request) {
  asio::write(stream, asio::buffer(request));

  std::string response;
  char buf[4096];
  for(;;) {
    std::error_code ec;
    std::size_t n = stream.read_some(asio::buffer(buf), ec);
    response.append(buf, n);
    if(is_eof(ec)) break;
    if(ec) throw std::system_error(ec);
  }
  return response;
}

bool is_success(int status) {
  return status >= 200 && status < 300;
}

} // namespace

HttpCatalogClient::Endpoint HttpCatalogClient::Endpoint::parse(const std::string& url) {
  Endpoint out;
  std::string rest;
  if(url.rfind("https://", 0) == 0) {
    out.tls = true;
    rest = url.substr(8);
  } else if(url.rfind("http://", 0) == 0) {
    rest = url.substr(7);
  } else {
    throw ConfigError("Catalog URL must start with http:// or https:// (got '" + url + "')");
  }

  auto slash = rest.find('/');
  std::string authority = rest.substr(0, slash);
  out.base_path = (slash == std::string::npos) ? "" : rest.substr(slash);
  while(!out.base_path.empty() && out.base_path.back() == '/') out.base_path.pop_back();

  auto colon = authority.rfind(':');
  if(colon != std::string::npos) {
    out.host = authority.substr(0, colon);
    out.port = authority.substr(colon + 1);
  } else {
    out.host = authority;
    out.port = out.tls ? "443" : "80";
  }
  if(out.host.empty() || out.port.empty()) {
    throw ConfigError("Catalog URL has no host: '" + url + "'");
  }
  return out;
}

HttpCatalogClient::HttpCatalogClient(Options options, std::shared_ptr<Logger> logger)
  : options_(std::move(options)),
    endpoint_(Endpoint::parse(options_.base_url)),
    logger_(std::move(logger)) {}

std::string HttpCatalogClient::url_encode(const std::string& value) {
  static const char* kHex = "0123456789ABCDEF";
  std::string out;
  out.reserve(value.size());
  for(unsigned char c : value) {
    if(std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || c == '/') {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(kHex[c >> 4]);
      out.push_back(kHex[c & 0x0F]);
    }
  }
  return out;
}

HttpCatalogClient::Response HttpCatalogClient::parse_response(const std::string& raw) {
  Response out;
  auto line_end = raw.find("\r\n");
  std::istringstream status_line(raw.substr(0, line_end));
  std::string version;
  status_line >> version >> out.status;
  if(version.rfind("HTTP/", 0) != 0 || !status_line) {
    throw CatalogError("Malformed catalog response: '" + raw.substr(0, line_end) + "'");
  }
  auto header_end = raw.find("\r\n\r\n");
  if(header_end != std::string::npos) {
    out.body = raw.substr(header_end + 4);
  }
  return out;
}

std::string HttpCatalogClient::build_request(const std::string& path,
                                             const std::string& content_type,
                                             const std::string& body) const {
  std::ostringstream req;
  req << "POST " << endpoint_.base_path << path << " HTTP/1.0\r\n"
      << "Host: " << endpoint_.host << "\r\n"
      << "User-Agent: " << options_.user_agent << "\r\n"
      << "Accept: application/json\r\n"
      << "Content-Type: " << content_type << "\r\n"
      << "Content-Length: " << body.size() << "\r\n"
      << "Connection: close\r\n\r\n"
      << body;
  return req.str();
}

HttpCatalogClient::Response HttpCatalogClient::post(const std::string& path,
                                                    const std::string& content_type,
                                                    const std::string& body) {
  const auto request = build_request(path, content_type, body);
  asio::io_context io;
  tcp::resolver resolver(io);
  auto endpoints = resolver.resolve(endpoint_.host, endpoint_.port);

  std::string raw;
  if(endpoint_.tls) {
    asio::ssl::context ctx(asio::ssl::context::tls_client);
    ctx.set_default_verify_paths();
    if(!options_.cert_file.empty()) {
      ctx.use_certificate_chain_file(options_.cert_file);
      ctx.use_private_key_file(options_.cert_file, asio::ssl::context::pem);
    }
    asio::ssl::stream<tcp::socket> stream(io, ctx);
    stream.set_verify_mode(asio::ssl::verify_peer);
    SSL_set_tlsext_host_name(stream.native_handle(), endpoint_.host.c_str());
    asio::connect(stream.lowest_layer(), endpoints);
    stream.handshake(asio::ssl::stream_base::client);
    raw = exchange(stream, request);
  } else {
    tcp::socket socket(io);
    asio::connect(socket, endpoints);
    raw = exchange(socket, request);
  }

  auto response = parse_response(raw);
  log_debug(logger_.get(), "POST {}{} -> {}", endpoint_.base_path, path, response.status);
  return response;
}

DeclareResult HttpCatalogClient::declare_file(const nlohmann::json& metadata) {
  auto response = post("/files", "application/json", metadata.dump());
  if(is_success(response.status)) return {DeclareStatus::ok, response.body};
  if(response.status == 409) return {DeclareStatus::already_exists, response.body};
  if(response.status == 400 || response.status == 422) {
    return {DeclareStatus::invalid_metadata, response.body};
  }
  throw CatalogError("declare failed with HTTP " + std::to_string(response.status) +
                     ": " + response.body, response.status);
}

DeclareResult HttpCatalogClient::validate_metadata(const nlohmann::json& metadata) {
  auto response = post("/files/validate_metadata", "application/json", metadata.dump());
  if(is_success(response.status)) return {DeclareStatus::ok, response.body};
  if(response.status == 400 || response.status == 422) {
    return {DeclareStatus::invalid_metadata, response.body};
  }
  throw CatalogError("validate failed with HTTP " + std::to_string(response.status) +
                     ": " + response.body, response.status);
}

void HttpCatalogClient::add_file_location(const std::string& public_name,
                                          const std::filesystem::path& location) {
  auto response = post("/files/name/" + url_encode(public_name) + "/locations",
                       "application/x-www-form-urlencoded",
                       "add=" + url_encode(location.generic_string()));
  if(!is_success(response.status)) {
    throw CatalogError("add location for " + public_name + " failed with HTTP " +
                       std::to_string(response.status) + ": " + response.body,
                       response.status);
  }
}
