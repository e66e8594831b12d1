#pragma once

#include <memory>
#include <string>

#include "catalog_client.hpp"
#include "log.hpp"

// SAMWeb-style REST catalog over HTTP(S). One short-lived connection per
// request, so a single instance can be shared by every declare worker.
class HttpCatalogClient : public CatalogClient {
public:
  struct Options {
    std::string base_url;   // e.g. https://samweb.fnal.gov:8483/sam/sbnd/api
    std::string cert_file;  // PEM with certificate and key, https only
    std::string user_agent = "keepup/1.0";
  };

  struct Endpoint {
    bool tls = false;
    std::string host;
    std::string port;
    std::string base_path;

    static Endpoint parse(const std::string& url);
  };

  struct Response {
    int status = 0;
    std::string body;
  };

  HttpCatalogClient(Options options, std::shared_ptr<Logger> logger = nullptr);

  DeclareResult declare_file(const nlohmann::json& metadata) override;
  DeclareResult validate_metadata(const nlohmann::json& metadata) override;
  void add_file_location(const std::string& public_name,
                         const std::filesystem::path& location) override;

  const Endpoint& endpoint() const { return endpoint_; }

  static std::string url_encode(const std::string& value);
  static Response parse_response(const std::string& raw);

private:
  Response post(const std::string& path,
                const std::string& content_type,
                const std::string& body);
  std::string build_request(const std::string& path,
                            const std::string& content_type,
                            const std::string& body) const;

  Options options_;
  Endpoint endpoint_;
  std::shared_ptr<Logger> logger_;
};
