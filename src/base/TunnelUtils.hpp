#ifndef __STA_TUNNEL_UTILS__
#define __STA_TUNNEL_UTILS__

#include "Headers.hpp"

namespace sta {

enum class ForwardType { LOCAL, DYNAMIC, REMOTE };

/**
 * @brief One ssh port forward.
 *
 * Field use depends on the type:
 * - LOCAL:   localPort -> host:remotePort (ssh -L)
 * - DYNAMIC: SOCKS proxy on localPort (ssh -D)
 * - REMOTE:  remotePort -> host:localPort (ssh -R)
 *
 * For LOCAL `host` is the remote destination, for REMOTE it is the local
 * destination. Unused fields are zero/empty.
 */
struct ForwardSpec {
  ForwardType type = ForwardType::LOCAL;
  uint16_t localPort = 0;
  string host;
  uint16_t remotePort = 0;

  static ForwardSpec local(uint16_t localPort, const string& remoteHost,
                           uint16_t remotePort);
  static ForwardSpec dynamic(uint16_t localPort);
  static ForwardSpec remote(uint16_t remotePort, const string& localHost,
                            uint16_t localPort);

  bool operator==(const ForwardSpec& other) const {
    return type == other.type && localPort == other.localPort &&
           host == other.host && remotePort == other.remotePort;
  }
  bool operator!=(const ForwardSpec& other) const { return !(*this == other); }
};

/**
 * @brief Either a parsed spec or the reason the token was rejected.
 */
struct ForwardParseResult {
  optional<ForwardSpec> spec;
  string error;

  bool ok() const { return spec.has_value(); }
};

/**
 * @brief All specs of one tunnel group, in token order, plus one error per
 * rejected token.
 */
struct ParsedGroup {
  vector<ForwardSpec> specs;
  vector<string> errors;
};

/**
 * @brief Parses one `TYPE:field[:field:field]` token.
 *
 * Accepted forms are `L:localPort:remoteHost:remotePort`, `D:localPort` and
 * `R:remotePort:localHost:localPort`. Never throws; errors name the group,
 * the token and the violated rule.
 */
ForwardParseResult parseForwardSpec(const string& token,
                                    const string& groupName);

/**
 * @brief Splits a group's raw text on whitespace and parses every token
 * independently. A bad token does not stop the remaining ones.
 */
ParsedGroup parseGroupSpecs(const string& groupName, const string& rawSpecText);

/** @brief "Local", "SOCKS" or "Remote". */
string forwardTypeName(ForwardType type);

/**
 * @brief Human readable one-liner, e.g. "Local  localhost:8080 -> web:80".
 */
string describeForwardSpec(const ForwardSpec& spec);

ostream& operator<<(ostream& os, const ForwardSpec& spec);

/**
 * @brief Thrown when an invalid forward spec token is encountered.
 */
class TunnelParseException : public std::exception {
 public:
  explicit TunnelParseException(const string& msg) : message(msg) {}
  const char* what() const noexcept override { return message.c_str(); }

 private:
  std::string message = " ";
};

}  // namespace sta
#endif  // __STA_TUNNEL_UTILS__
