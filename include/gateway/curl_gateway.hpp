#pragma once

#include <optional>
#include <string>

#include "core/config.hpp"
#include "gateway/model_gateway.hpp"

namespace grok_mcp::gateway {

class CurlModelGateway : public ModelGateway {
 public:
  // Throws std::runtime_error when libcurl cannot be initialized.
  explicit CurlModelGateway(core::GatewayConfig config);
  ~CurlModelGateway() override;

  CurlModelGateway(const CurlModelGateway&) = delete;
  CurlModelGateway& operator=(const CurlModelGateway&) = delete;

  std::optional<std::string> complete(const CompletionRequest& request, std::string* err) override;

 private:
  [[nodiscard]] std::string endpoint_url() const;

  core::GatewayConfig config_;
};

}  // namespace grok_mcp::gateway
