#ifndef FETCHER_PROXY_VALIDATOR_HPP_
#define FETCHER_PROXY_VALIDATOR_HPP_

#include <string>

namespace fetcher {

// 校验 HTTP 代理格式：http(s)://host[:port]，port 为 1-5 位数字。
// 空串表示直连，视为合法。只检查字面格式，不检查端口范围。
bool validateProxy(const std::string& proxy);

// 同上，不合法时抛出 ValidationError
void requireValidProxy(const std::string& proxy);

}  // namespace fetcher

#endif  // FETCHER_PROXY_VALIDATOR_HPP_
