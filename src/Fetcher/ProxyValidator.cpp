#include "ProxyValidator.hpp"

#include <regex>

#include "Errors.hpp"

namespace fetcher {

namespace {
const std::regex& proxyPattern() {
  static const std::regex pattern(
      "^https?://"          // http:// 或 https://
      "[a-zA-Z0-9\\-\\.]+"  // hostname
      "(:[0-9]{1,5})?$");   // :port（可选）
  return pattern;
}
}  // namespace

bool validateProxy(const std::string& proxy) {
  if (proxy.empty()) return true;
  return std::regex_match(proxy, proxyPattern());
}

void requireValidProxy(const std::string& proxy) {
  if (!validateProxy(proxy)) {
    throw ValidationError("Invalid HTTP proxy '" + proxy +
                          "', expected http://host:port");
  }
}

}  // namespace fetcher
